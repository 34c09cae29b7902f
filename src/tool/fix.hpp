#pragma once

#include <string>
#include <stdexcept>

class FixError : public std::runtime_error {
public:
	explicit FixError(const std::string& message) : std::runtime_error(message) {}
};

struct FixResult {
	std::string old_line;
	std::string new_line;
};

std::string Trim(const std::string& text);

// Replaces a 1-based line after checking it still holds the expected text.
// The file is left untouched when anything does not match.
FixResult ApplyFix(const std::string& file, int line, const std::string& original, const std::string& replacement);
