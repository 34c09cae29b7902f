#include "json.hpp"

void to_json(nlohmann::json& j, const Breakpoint& breakpoint) {
	j = nlohmann::json{
		{ "id", breakpoint.id },
		{ "file", breakpoint.file },
		{ "line", breakpoint.line },
		{ "state", breakpoint.state },
	};
	if (!breakpoint.condition.empty()) {
		j["condition"] = breakpoint.condition;
	}
}

void to_json(nlohmann::json& j, const Variable& variable) {
	j = nlohmann::json{
		{ "name", variable.name },
		{ "fullname", variable.fullname },
		{ "type", variable.type },
		{ "value", variable.value },
	};
}

void to_json(nlohmann::json& j, const StackFrame& frame) {
	j = nlohmann::json{
		{ "level", frame.level },
		{ "type", frame.type },
		{ "filename", frame.filename },
		{ "lineno", frame.lineno },
		{ "where", frame.where },
	};
}

void to_json(nlohmann::json& j, const SourceLine& line) {
	j = nlohmann::json{
		{ "line", line.line },
		{ "text", line.text },
		{ "is_error_line", line.is_error_line },
	};
}

void to_json(nlohmann::json& j, const ErrorEvent& error) {
	j = nlohmann::json{
		{ "error_type", error.error_type },
		{ "message", error.message },
		{ "file", error.file },
		{ "line", error.line },
		{ "source_context", error.source_context },
		{ "stack_trace", error.stack_trace },
		{ "local_variables", error.local_variables },
		{ "global_variables", error.global_variables },
		{ "timestamp", error.timestamp },
	};
}

void from_json(const nlohmann::json& j, Variable& variable) {
	variable.name = j.value("name", "");
	variable.fullname = j.value("fullname", "");
	variable.type = j.value("type", "");
	variable.value = j.value("value", "");
}

void from_json(const nlohmann::json& j, StackFrame& frame) {
	frame.level = j.value("level", 0);
	frame.type = j.value("type", "");
	frame.filename = j.value("filename", "");
	frame.lineno = j.value("lineno", 0);
	frame.where = j.value("where", "");
}

void from_json(const nlohmann::json& j, SourceLine& line) {
	line.line = j.value("line", 0);
	line.text = j.value("text", "");
	line.is_error_line = j.value("is_error_line", false);
}

void from_json(const nlohmann::json& j, ErrorEvent& error) {
	error.error_type = j.value("error_type", "");
	error.message = j.value("message", "");
	error.file = j.value("file", "");
	error.line = j.value("line", 0);
	error.source_context = j.value("source_context", std::vector<SourceLine>{});
	error.stack_trace = j.value("stack_trace", std::vector<StackFrame>{});
	error.local_variables = j.value("local_variables", std::vector<Variable>{});
	error.global_variables = j.value("global_variables", std::vector<Variable>{});
	error.timestamp = j.value("timestamp", int64_t{ 0 });
}
