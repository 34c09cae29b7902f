#include "fix.hpp"

#include <format>
#include <fstream>
#include <spdlog/spdlog.h>

#include "../capture/source_context.hpp"

constexpr const char WHITESPACE[] = " \t\r\n\v\f";

std::string Trim(const std::string& text) {
	auto start = text.find_first_not_of(WHITESPACE);
	if (start == std::string::npos) {
		return {};
	}
	auto end = text.find_last_not_of(WHITESPACE);
	return text.substr(start, end - start + 1);
}

FixResult ApplyFix(const std::string& file, int line, const std::string& original, const std::string& replacement) {
	std::vector<std::string> lines;
	if (!ReadLines(file, lines)) {
		throw FixError(std::format("Failed to read {}", file));
	}

	if (line < 1 || line > static_cast<int>(lines.size())) {
		throw FixError(std::format("Line {} is out of range (file has {} lines)", line, lines.size()));
	}

	auto& actual = lines[line - 1];
	if (Trim(actual) != Trim(original)) {
		throw FixError(std::format("Line mismatch at {}.\nExpected: \"{}\"\nFound: \"{}\"", line, Trim(original), Trim(actual)));
	}

	auto indent_end = actual.find_first_not_of(" \t");
	std::string indent = indent_end == std::string::npos ? actual : actual.substr(0, indent_end);

	FixResult result{ Trim(actual), Trim(replacement) };
	actual = indent + result.new_line;

	std::ofstream out(file, std::ios::binary | std::ios::trunc);
	if (!out) {
		throw FixError(std::format("Failed to write {}", file));
	}
	for (size_t i = 0; i < lines.size(); i++) {
		if (i > 0) out << '\n';
		out << lines[i];
	}
	out.flush();
	if (!out) {
		throw FixError(std::format("Failed to write {}", file));
	}

	spdlog::info("Fix: {}:{} rewritten", file, line);
	return result;
}
