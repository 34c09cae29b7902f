#include "base64.hpp"

#include <array>
#include <cstdint>

constexpr const char BASE64_ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static constexpr std::array<int8_t, 256> BuildDecodeTable() {
	std::array<int8_t, 256> table{};
	for (auto& entry : table) {
		entry = -1;
	}
	for (int i = 0; i < 64; i++) {
		table[static_cast<uint8_t>(BASE64_ALPHABET[i])] = i;
	}
	return table;
}

constexpr auto DECODE_TABLE = BuildDecodeTable();

std::string Base64Encode(std::string_view data) {
	std::string out;
	out.reserve((data.size() + 2) / 3 * 4);

	size_t i = 0;
	for (; i + 2 < data.size(); i += 3) {
		uint32_t chunk = (static_cast<uint8_t>(data[i]) << 16) | (static_cast<uint8_t>(data[i + 1]) << 8) | static_cast<uint8_t>(data[i + 2]);
		out += BASE64_ALPHABET[(chunk >> 18) & 0x3F];
		out += BASE64_ALPHABET[(chunk >> 12) & 0x3F];
		out += BASE64_ALPHABET[(chunk >> 6) & 0x3F];
		out += BASE64_ALPHABET[chunk & 0x3F];
	}

	size_t remaining = data.size() - i;
	if (remaining == 1) {
		uint32_t chunk = static_cast<uint8_t>(data[i]) << 16;
		out += BASE64_ALPHABET[(chunk >> 18) & 0x3F];
		out += BASE64_ALPHABET[(chunk >> 12) & 0x3F];
		out += "==";
	} else if (remaining == 2) {
		uint32_t chunk = (static_cast<uint8_t>(data[i]) << 16) | (static_cast<uint8_t>(data[i + 1]) << 8);
		out += BASE64_ALPHABET[(chunk >> 18) & 0x3F];
		out += BASE64_ALPHABET[(chunk >> 12) & 0x3F];
		out += BASE64_ALPHABET[(chunk >> 6) & 0x3F];
		out += '=';
	}

	return out;
}

std::optional<std::string> Base64Decode(std::string_view text) {
	std::string clean;
	clean.reserve(text.size());
	for (char c : text) {
		if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
		clean += c;
	}

	if (clean.empty() || clean.size() % 4 != 0) {
		return std::nullopt;
	}

	size_t padding = 0;
	if (clean.back() == '=') padding++;
	if (clean[clean.size() - 2] == '=') padding++;

	std::string out;
	out.reserve(clean.size() / 4 * 3);
	for (size_t i = 0; i < clean.size(); i += 4) {
		bool last = i + 4 == clean.size();
		uint32_t chunk = 0;
		for (size_t j = 0; j < 4; j++) {
			char c = clean[i + j];
			if (c == '=') {
				// only allowed as trailing padding of the last quad
				if (!last || j < 4 - padding) return std::nullopt;
				chunk <<= 6;
				continue;
			}
			int8_t value = DECODE_TABLE[static_cast<uint8_t>(c)];
			if (value < 0) return std::nullopt;
			chunk = (chunk << 6) | value;
		}

		out += static_cast<char>((chunk >> 16) & 0xFF);
		if (!last || padding < 2) out += static_cast<char>((chunk >> 8) & 0xFF);
		if (!last || padding < 1) out += static_cast<char>(chunk & 0xFF);
	}

	return out;
}
