#include "commands.hpp"

#include <format>
#include <spdlog/spdlog.h>

#include "errors.hpp"
#include "parser.hpp"

Response Commands::Execute(const DbgpCommand& command) {
	auto response = router.Send(command);
	if (response.error) {
		throw EngineError(command.name, response.error->code, response.error->message);
	}
	return response;
}

std::optional<Fault> GetContinuationFault(const Response& response) {
	auto command = response.Get("command");
	if (command != "run" && !command.starts_with("step_")) {
		return std::nullopt;
	}

	auto reason = response.Get("reason");
	if (response.Get("status") != "break" || (reason != "error" && reason != "exception")) {
		return std::nullopt;
	}
	return Fault{ reason, std::format("Execution stopped by {} after {}", reason, command), "", 0 };
}

std::string Commands::Continue(const std::string& name) {
	auto response = Execute({ name });
	if (!response.Has("command")) {
		response.attributes["command"] = name;
	}

	if (auto fault = GetContinuationFault(response)) {
		spdlog::info("Commands: {} stopped on {}", name, fault->error_type);
		if (fault_handler) {
			fault_handler(*fault);
		}
	}
	return response.Get("status");
}

std::string Commands::Run() {
	return Continue("run");
}

std::string Commands::StepInto() {
	return Continue("step_into");
}

std::string Commands::StepOver() {
	return Continue("step_over");
}

std::string Commands::StepOut() {
	return Continue("step_out");
}

std::string Commands::Stop() {
	return Execute({ "stop" }).Get("status");
}

std::string Commands::GetStatus() {
	return Execute({ "status" }).Get("status");
}

Breakpoint Commands::SetBreakpoint(const std::string& file, int line, const std::string& condition) {
	DbgpCommand command{ "breakpoint_set" };
	command.args = std::format("-t line -f {} -n {}", QuoteArgument(PathToFileUri(file)), line);
	command.data = condition;

	auto response = Execute(command);

	Breakpoint breakpoint{};
	breakpoint.id = response.Get("id");
	breakpoint.file = file;
	breakpoint.line = line;
	breakpoint.condition = condition;
	breakpoint.state = response.Get("state");
	spdlog::debug("Commands: breakpoint {} set at {}:{}", breakpoint.id, file, line);
	return breakpoint;
}

void Commands::RemoveBreakpoint(const std::string& id) {
	Execute({ "breakpoint_remove", "-d " + id });
}

std::vector<Breakpoint> Commands::ListBreakpoints() {
	return ParseBreakpoints(Execute({ "breakpoint_list" }).raw);
}

std::vector<Variable> Commands::GetVariables(int context_id) {
	return ParseProperties(Execute({ "context_get", std::format("-c {}", context_id) }).raw);
}

std::string Commands::EvaluateExpression(const std::string& expression) {
	auto variables = ParseProperties(Execute({ "eval", "", expression }).raw);
	if (variables.empty()) {
		return {};
	}
	return variables[0].value;
}

std::vector<StackFrame> Commands::GetStackTrace() {
	return ParseStack(Execute({ "stack_get" }).raw);
}
