#include "codec.hpp"

#include <format>
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

#include "base64.hpp"

std::string EncodeCommand(const DbgpCommand& command, int transaction_id) {
	std::string line = command.name;
	if (!command.args.empty()) {
		line += ' ';
		line += command.args;
	}

	// Engines stop parsing arguments at "--", the id has to come first
	line += std::format(" -i {}", transaction_id);

	if (!command.data.empty()) {
		line += " -- ";
		line += Base64Encode(command.data);
	}

	line += '\0';
	return line;
}

std::string PathToFileUri(std::string path) {
	std::replace(path.begin(), path.end(), '\\', '/');
	if (path.starts_with("file://")) {
		return path;
	}
	if (path.starts_with("/")) {
		return "file://" + path;
	}
	return "file:///" + path;
}

static int HexValue(char c) {
	if (c >= '0' && c <= '9') return c - '0';
	if (c >= 'a' && c <= 'f') return c - 'a' + 10;
	if (c >= 'A' && c <= 'F') return c - 'A' + 10;
	return -1;
}

std::string DecodePercent(std::string_view text) {
	std::string decoded;
	decoded.reserve(text.size());
	for (size_t i = 0; i < text.size(); i++) {
		if (text[i] == '%' && i + 2 < text.size()) {
			int high = HexValue(text[i + 1]);
			int low = HexValue(text[i + 2]);
			if (high >= 0 && low >= 0) {
				decoded += static_cast<char>(high * 16 + low);
				i += 2;
				continue;
			}
		}
		decoded += text[i];
	}
	return decoded;
}

std::string FileUriToPath(std::string_view uri) {
	if (!uri.starts_with("file://")) {
		return std::string(uri);
	}

	// Engines escape everything outside [A-Za-z0-9-_.!~*()/], the drive colon included
	auto path = DecodePercent(uri.substr(7));
	// file:///C:/dir -> C:/dir, file:///usr/dir -> /usr/dir
	if (path.size() >= 3 && path[0] == '/' && std::isalpha(static_cast<unsigned char>(path[1])) && path[2] == ':') {
		path.erase(0, 1);
	}
	return path;
}

std::string QuoteArgument(std::string_view value) {
	if (value.find(' ') == std::string_view::npos && value.find('"') == std::string_view::npos) {
		return std::string(value);
	}

	std::string quoted = "\"";
	for (char c : value) {
		if (c == '"' || c == '\\') {
			quoted += '\\';
		}
		quoted += c;
	}
	quoted += '"';
	return quoted;
}

std::vector<Frame> FrameDecoder::Feed(std::string_view data) {
	buffer.append(data);

	std::vector<Frame> frames;
	while (true) {
		auto null_index = buffer.find('\0');
		if (null_index == std::string::npos) {
			break;
		}

		std::string message = buffer.substr(0, null_index);
		buffer.erase(0, null_index + 1);

		// Length header, framing is driven by the terminators alone
		if (!message.empty() && std::all_of(message.begin(), message.end(), [](char c) { return c >= '0' && c <= '9'; })) {
			continue;
		}

		if (message.empty()) {
			continue;
		}

		if (message.find(INIT_MARKER) != std::string::npos) {
			spdlog::trace("Codec: init frame ({} bytes)", message.size());
			frames.push_back({ FrameType::INIT, std::move(message) });
		} else {
			spdlog::trace("Codec: message frame ({} bytes)", message.size());
			frames.push_back({ FrameType::MESSAGE, std::move(message) });
		}
	}

	return frames;
}
