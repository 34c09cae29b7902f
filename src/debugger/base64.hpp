#pragma once

#include <string>
#include <string_view>
#include <optional>

std::string Base64Encode(std::string_view data);

// Strict decode, returns nullopt on anything that is not well formed base64
std::optional<std::string> Base64Decode(std::string_view text);
