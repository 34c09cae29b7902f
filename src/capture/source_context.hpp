#pragma once

#include <string>
#include <vector>
#include <filesystem>

#include "../debugger/types.hpp"

constexpr auto DEFAULT_CONTEXT_RADIUS = 5;
constexpr const char SOURCE_UNAVAILABLE[] = "(source unavailable)";

// Splits on "\n" and "\r\n", a trailing newline yields a final empty line
std::vector<std::string> SplitLines(const std::string& content);
bool ReadLines(const std::filesystem::path& path, std::vector<std::string>& lines);

std::vector<SourceLine> GetSourceContext(const std::string& file, int line, int radius = DEFAULT_CONTEXT_RADIUS);
