#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>
#include <unordered_map>

enum class ConnectionState {
	DISCONNECTED,
	LISTENING,
	CONNECTED,
};

struct EngineErrorInfo {
	int code = 0;
	std::string message;
};

struct Response {
	std::unordered_map<std::string, std::string> attributes;
	std::string raw;
	std::optional<EngineErrorInfo> error;

	std::string Get(const std::string& key) const {
		auto it = attributes.find(key);
		if (it == attributes.end()) return {};
		return it->second;
	}
	bool Has(const std::string& key) const { return attributes.contains(key); }
};

struct Breakpoint {
	std::string id;
	std::string file;
	int line = 0;
	std::string condition;
	std::string state;
};

struct Variable {
	std::string name;
	std::string fullname;
	std::string type;
	std::string value;
};

struct StackFrame {
	int level = 0;
	std::string type;
	std::string filename;
	int lineno = 0;
	std::string where;
};

struct SourceLine {
	int line = 0;
	std::string text;
	bool is_error_line = false;
};

struct ErrorEvent {
	std::string error_type;
	std::string message;
	std::string file;
	int line = 0;
	std::vector<SourceLine> source_context;
	std::vector<StackFrame> stack_trace;
	std::vector<Variable> local_variables;
	std::vector<Variable> global_variables;
	int64_t timestamp = 0;
};

// A runtime fault reported by the engine, before enrichment
struct Fault {
	std::string error_type;
	std::string message;
	std::string file;
	int line = 0;
};
