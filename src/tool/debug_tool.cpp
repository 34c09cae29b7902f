#include "debug_tool.hpp"

#include <format>
#include <stdexcept>
#include <spdlog/spdlog.h>

#include "json.hpp"
#include "fix.hpp"
#include "analysis.hpp"

constexpr auto MAX_CONTEXT_RADIUS = 1000;

template <typename T>
static T Require(const nlohmann::json& request, const char* key) {
	if (!request.contains(key) || request[key].is_null()) {
		throw std::invalid_argument(std::format("Missing required argument: {}", key));
	}
	return request[key].get<T>();
}

static ToolResult Text(std::string text) {
	return { std::move(text), false };
}

static ToolResult Json(const nlohmann::json& body) {
	return { body.dump(2), false };
}

static ToolResult Error(const std::string& message) {
	return { "Error: " + message, true };
}

ToolResult DebugTool::Execute(const nlohmann::json& request) {
	if (!request.is_object() || !request.contains("action") || !request["action"].is_string()) {
		return Error("Request must be an object with an action");
	}

	auto action = request["action"].get<std::string>();
	try {
		return HandleAction(action, request);
	} catch (const std::exception& e) {
		spdlog::error("Tool: {} failed: {}", action, e.what());
		return Error(e.what());
	}
}

ToolResult DebugTool::HandleAction(const std::string& action, const nlohmann::json& request) {
	if (action == "start") {
		return StartListener(request.value("port", session.GetConfig().port));
	} else if (action == "stop") {
		return StopListener();
	} else if (action == "status") {
		return GetStatus();
	} else if (action == "run" || action == "step_into" || action == "step_over" || action == "step_out") {
		return Continue(action);
	} else if (action == "capture_error") {
		return CaptureError(request.value("timeout", static_cast<int>(DEFAULT_WAIT_TIMEOUT.count())));
	} else if (action == "analyze_error") {
		return AnalyzeError(Require<nlohmann::json>(request, "error"));
	} else if (action == "apply_fix") {
		return ApplyFix(Require<std::string>(request, "file"), Require<int>(request, "line"),
			Require<std::string>(request, "original"), Require<std::string>(request, "replacement"));
	} else if (action == "list_errors") {
		return ListErrors();
	} else if (action == "clear_errors") {
		return ClearErrors();
	} else if (action == "get_source") {
		return GetSource(Require<std::string>(request, "file"), Require<int>(request, "line"), request.value("radius", session.GetConfig().context_radius));
	} else if (action == "breakpoint_set") {
		return SetBreakpoint(Require<std::string>(request, "file"), Require<int>(request, "line"), request.value("condition", ""));
	} else if (action == "breakpoint_remove") {
		return RemoveBreakpoint(Require<std::string>(request, "breakpoint_id"));
	} else if (action == "breakpoint_list") {
		return ListBreakpoints();
	} else if (action == "variables_get") {
		return GetVariables(request.value("context", LOCAL_CONTEXT));
	} else if (action == "evaluate") {
		return Evaluate(Require<std::string>(request, "expression"));
	} else if (action == "stack_trace") {
		return GetStackTrace();
	}

	spdlog::warn("Tool: unknown action {}", action);
	return Error("Unknown action: " + action);
}

ToolResult DebugTool::StartListener(int port) {
	auto& client = session.Get();
	if (client.IsConnected()) {
		return Text("Already connected to debugger engine");
	}

	int bound_port = client.Listen(port);
	return Text(std::format("DBGp listener started on port {}.\nRun your script with the debugger enabled, e.g.: AutoHotkey64.exe /Debug=127.0.0.1:{} your_script.ahk", bound_port, bound_port));
}

ToolResult DebugTool::StopListener() {
	session.Reset();
	return Text("DBGp listener stopped");
}

ToolResult DebugTool::GetStatus() {
	auto& client = session.Get();
	nlohmann::json status{
		{ "connected", client.IsConnected() },
		{ "listening", client.IsListening() },
		{ "port", client.GetPort() },
		{ "errors_queued", client.GetErrorCapture().GetQueueSize() },
	};
	if (auto init = client.GetInitInfo()) {
		status["engine"] = *init;
	}
	return Json(status);
}

ToolResult DebugTool::Continue(const std::string& action) {
	auto& commands = session.Get().GetCommands();
	if (action == "run") {
		auto status = commands.Run();
		return Text(std::format("Execution continued. Status: {}", status.empty() ? "running" : status));
	}

	std::string status;
	std::string label;
	if (action == "step_into") {
		status = commands.StepInto();
		label = "Step into";
	} else if (action == "step_over") {
		status = commands.StepOver();
		label = "Step over";
	} else {
		status = commands.StepOut();
		label = "Step out";
	}
	return Text(std::format("{}. Status: {}", label, status.empty() ? "break" : status));
}

ToolResult DebugTool::CaptureError(int timeout) {
	auto error = session.Get().GetErrorCapture().WaitForError(std::chrono::milliseconds(timeout));
	if (!error) {
		return Text(nlohmann::json{ { "captured", false }, { "reason", "timeout" } }.dump());
	}
	return Json({ { "captured", true }, { "error", *error } });
}

ToolResult DebugTool::AnalyzeError(const nlohmann::json& error) {
	if (!error.is_object()) {
		return Error("No error provided for analysis");
	}
	return Text(FormatErrorAnalysis(error.get<ErrorEvent>()));
}

ToolResult DebugTool::ApplyFix(const std::string& file, int line, const std::string& original, const std::string& replacement) {
	auto result = ::ApplyFix(file, line, original, replacement);
	return Text(std::format("Fix applied at {}:{}\n- Old: {}\n+ New: {}", file, line, result.old_line, result.new_line));
}

ToolResult DebugTool::ListErrors() {
	auto errors = session.Get().GetErrorCapture().GetQueuedErrors();

	auto summaries = nlohmann::json::array();
	for (auto& error : errors) {
		summaries.push_back({
			{ "error_type", error.error_type },
			{ "message", error.message },
			{ "file", error.file },
			{ "line", error.line },
			{ "timestamp", error.timestamp },
		});
	}
	return Json({ { "count", errors.size() }, { "errors", summaries } });
}

ToolResult DebugTool::ClearErrors() {
	auto count = session.Get().GetErrorCapture().ClearErrorQueue();
	return Text(std::format("Cleared {} errors from queue", count));
}

ToolResult DebugTool::GetSource(const std::string& file, int line, int radius) {
	if (line < 1) {
		throw std::invalid_argument(std::format("Invalid line: {}", line));
	}
	if (radius < 0 || radius > MAX_CONTEXT_RADIUS) {
		throw std::invalid_argument(std::format("Invalid radius: {} (expected 0..{})", radius, MAX_CONTEXT_RADIUS));
	}
	return Json({ { "file", file }, { "line", line }, { "context", GetSourceContext(file, line, radius) } });
}

ToolResult DebugTool::SetBreakpoint(const std::string& file, int line, const std::string& condition) {
	auto breakpoint = session.Get().GetCommands().SetBreakpoint(file, line, condition);
	std::string text = std::format("Breakpoint set: {} at {}:{}", breakpoint.id, file, line);
	if (!condition.empty()) {
		text += std::format(" (condition: {})", condition);
	}
	return Text(text);
}

ToolResult DebugTool::RemoveBreakpoint(const std::string& id) {
	session.Get().GetCommands().RemoveBreakpoint(id);
	return Text(std::format("Breakpoint {} removed", id));
}

ToolResult DebugTool::ListBreakpoints() {
	auto breakpoints = session.Get().GetCommands().ListBreakpoints();
	return Json({ { "count", breakpoints.size() }, { "breakpoints", breakpoints } });
}

ToolResult DebugTool::GetVariables(int context) {
	auto variables = session.Get().GetCommands().GetVariables(context);
	return Json({ { "context", context == LOCAL_CONTEXT ? "local" : "global" }, { "count", variables.size() }, { "variables", variables } });
}

ToolResult DebugTool::Evaluate(const std::string& expression) {
	auto result = session.Get().GetCommands().EvaluateExpression(expression);
	return Json({ { "expression", expression }, { "result", result } });
}

ToolResult DebugTool::GetStackTrace() {
	auto frames = session.Get().GetCommands().GetStackTrace();
	return Json({ { "count", frames.size() }, { "frames", frames } });
}
