#include "source_context.hpp"

#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdint>
#include <spdlog/spdlog.h>

std::vector<std::string> SplitLines(const std::string& content) {
	std::vector<std::string> lines;
	size_t start = 0;
	while (true) {
		auto end = content.find('\n', start);
		if (end == std::string::npos) {
			lines.push_back(content.substr(start));
			break;
		}

		auto length = end - start;
		if (length > 0 && content[end - 1] == '\r') {
			length--;
		}
		lines.push_back(content.substr(start, length));
		start = end + 1;
	}
	return lines;
}

bool ReadLines(const std::filesystem::path& path, std::vector<std::string>& lines) {
	std::ifstream file(path, std::ios::binary);
	if (!file) {
		return false;
	}

	std::stringstream content;
	content << file.rdbuf();
	if (file.bad()) {
		return false;
	}

	lines = SplitLines(content.str());
	return true;
}

std::vector<SourceLine> GetSourceContext(const std::string& file, int line, int radius) {
	std::vector<std::string> lines;
	if (file.empty() || !ReadLines(file, lines)) {
		spdlog::warn("SourceContext: unable to read {}", file);
		return { { line, SOURCE_UNAVAILABLE, true } };
	}

	// Widened so lines and radii near INT_MAX cannot overflow
	auto start = std::max<int64_t>(0, int64_t{ line } - radius - 1);
	auto end = std::min<int64_t>(static_cast<int64_t>(lines.size()), int64_t{ line } + radius);

	std::vector<SourceLine> context;
	for (auto i = start; i < end; i++) {
		context.push_back({ static_cast<int>(i + 1), lines[i], i + 1 == line });
	}
	return context;
}
