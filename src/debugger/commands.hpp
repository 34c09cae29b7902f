#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>

#include "router.hpp"
#include "types.hpp"

constexpr auto LOCAL_CONTEXT = 0;
constexpr auto GLOBAL_CONTEXT = 1;

typedef std::function<void(const Fault& fault)> FaultHandler;

// run and step_* answered with status="break" and reason error or exception
std::optional<Fault> GetContinuationFault(const Response& response);

class Commands {
public:
	explicit Commands(TransactionRouter& router) : router(router) {}

	std::string Run();
	std::string StepInto();
	std::string StepOver();
	std::string StepOut();
	std::string Stop();
	std::string GetStatus();

	Breakpoint SetBreakpoint(const std::string& file, int line, const std::string& condition = {});
	void RemoveBreakpoint(const std::string& id);
	std::vector<Breakpoint> ListBreakpoints();

	std::vector<Variable> GetVariables(int context_id = LOCAL_CONTEXT);
	std::string EvaluateExpression(const std::string& expression);
	std::vector<StackFrame> GetStackTrace();

	// Called when a continuation stops on an error or exception
	void SetFaultHandler(FaultHandler handler) { fault_handler = std::move(handler); }
private:
	Response Execute(const DbgpCommand& command);
	std::string Continue(const std::string& name);

	TransactionRouter& router;
	FaultHandler fault_handler;
};
