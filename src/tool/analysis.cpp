#include "analysis.hpp"

#include <format>

std::string FormatErrorAnalysis(const ErrorEvent& error) {
	std::string source;
	for (auto& line : error.source_context) {
		if (!source.empty()) source += '\n';
		source += std::format("{}: {}{}", line.line, line.is_error_line ? ">>> " : "    ", line.text);
	}

	std::string stack;
	for (auto& frame : error.stack_trace) {
		if (!stack.empty()) stack += '\n';
		stack += std::format("  {}: {} at {}:{}", frame.level, frame.where.empty() ? "anonymous" : frame.where, frame.filename, frame.lineno);
	}

	std::string locals;
	for (auto& variable : error.local_variables) {
		if (!locals.empty()) locals += '\n';
		locals += std::format("  {}: {} = {}", variable.name, variable.type, variable.value);
	}

	return std::format(
		"## Script Error Analysis\n"
		"\n"
		"**Error Type**: {}\n"
		"**Message**: {}\n"
		"**Location**: {}:{}\n"
		"\n"
		"### Source Context\n"
		"```\n"
		"{}\n"
		"```\n"
		"\n"
		"### Stack Trace\n"
		"{}\n"
		"\n"
		"### Local Variables\n"
		"{}\n"
		"\n"
		"### Task\n"
		"Analyze this error and provide:\n"
		"1. Root cause explanation\n"
		"2. A fix for the error line\n"
		"3. Any additional context or best practices",
		error.error_type, error.message, error.file, error.line,
		source,
		stack.empty() ? "  (no stack trace available)" : stack,
		locals.empty() ? "  (no local variables)" : locals);
}
