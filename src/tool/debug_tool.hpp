#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "../session.hpp"

struct ToolResult {
	std::string text;
	bool is_error = false;
};

// Dispatches debugger requests of the form {"action": "...", ...}
class DebugTool {
public:
	explicit DebugTool(Session& session) : session(session) {}

	ToolResult Execute(const nlohmann::json& request);
private:
	ToolResult HandleAction(const std::string& action, const nlohmann::json& request);

	ToolResult StartListener(int port);
	ToolResult StopListener();
	ToolResult GetStatus();
	ToolResult Continue(const std::string& action);
	ToolResult CaptureError(int timeout);
	ToolResult AnalyzeError(const nlohmann::json& error);
	ToolResult ApplyFix(const std::string& file, int line, const std::string& original, const std::string& replacement);
	ToolResult ListErrors();
	ToolResult ClearErrors();
	ToolResult GetSource(const std::string& file, int line, int radius);
	ToolResult SetBreakpoint(const std::string& file, int line, const std::string& condition);
	ToolResult RemoveBreakpoint(const std::string& id);
	ToolResult ListBreakpoints();
	ToolResult GetVariables(int context);
	ToolResult Evaluate(const std::string& expression);
	ToolResult GetStackTrace();

	Session& session;
};
