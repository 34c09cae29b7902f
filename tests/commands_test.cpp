#include <doctest/doctest.h>

#include <algorithm>

#include "debugger/errors.hpp"
#include "debugger/commands.hpp"
#include "test_util.hpp"

struct CommandsFixture {
	CommandsFixture() : engine(transport), router(transport), commands(router) {
		engine.Attach(router);
	}

	LoopbackTransport transport;
	ScriptedEngine engine;
	TransactionRouter router;
	Commands commands;
};

TEST_CASE_FIXTURE(CommandsFixture, "Execution control returns the engine status") {
	CHECK(commands.Run() == "break");
	CHECK(commands.StepInto() == "break");
	CHECK(commands.StepOver() == "break");
	CHECK(commands.StepOut() == "break");
	CHECK(commands.GetStatus() == "break");
	CHECK(commands.Stop() == "stopped");

	REQUIRE(engine.received.size() == 6);
	CHECK(engine.received[0].name == "run");
	CHECK(engine.received[1].name == "step_into");
	CHECK(engine.received[2].name == "step_over");
	CHECK(engine.received[3].name == "step_out");
	CHECK(engine.received[4].name == "status");
	CHECK(engine.received[5].name == "stop");
	CHECK(engine.received[5].transaction_id == 6);
	CHECK(engine.received[0].args.empty());
}

TEST_CASE_FIXTURE(CommandsFixture, "Breakpoints") {
	SUBCASE("set then list") {
		auto breakpoint = commands.SetBreakpoint("C:\\scripts\\a.ahk", 10);
		CHECK(breakpoint.id == "1");
		CHECK(breakpoint.file == "C:\\scripts\\a.ahk");
		CHECK(breakpoint.line == 10);
		CHECK(breakpoint.state == "enabled");
		CHECK(engine.received[0].args == "-t line -f file:///C:/scripts/a.ahk -n 10");
		CHECK(engine.received[0].data.empty());

		auto breakpoints = commands.ListBreakpoints();
		REQUIRE(breakpoints.size() == 1);
		auto file = breakpoints[0].file;
		std::replace(file.begin(), file.end(), '/', '\\');
		CHECK(file == "C:\\scripts\\a.ahk");
		CHECK(breakpoints[0].line == 10);
		CHECK(breakpoints[0].id == breakpoint.id);
	}

	SUBCASE("condition travels as base64 data") {
		auto breakpoint = commands.SetBreakpoint("C:\\scripts\\a.ahk", 4, "x > 1");
		CHECK(breakpoint.condition == "x > 1");
		CHECK(engine.received[0].data == "x > 1");
		CHECK(transport.written[0].find("-i 1 -- eCA+IDE=") != std::string::npos);
	}

	SUBCASE("remove") {
		auto first = commands.SetBreakpoint("C:\\a.ahk", 1);
		commands.SetBreakpoint("C:\\a.ahk", 2);
		commands.RemoveBreakpoint(first.id);
		CHECK(engine.received[2].args == "-d 1");

		auto breakpoints = commands.ListBreakpoints();
		REQUIRE(breakpoints.size() == 1);
		CHECK(breakpoints[0].line == 2);
	}

	SUBCASE("empty list") {
		CHECK(commands.ListBreakpoints().empty());
	}
}

TEST_CASE_FIXTURE(CommandsFixture, "Variables") {
	engine.locals = { { "name", "string", "world" }, { "count", "integer", "3" } };
	engine.globals = { { "A_Index", "integer", "1" } };

	auto locals = commands.GetVariables(LOCAL_CONTEXT);
	REQUIRE(locals.size() == 2);
	CHECK(locals[0].name == "name");
	CHECK(locals[0].type == "string");
	CHECK(locals[0].value == "world");
	CHECK(engine.received[0].args == "-c 0");

	auto globals = commands.GetVariables(GLOBAL_CONTEXT);
	REQUIRE(globals.size() == 1);
	CHECK(globals[0].fullname == "A_Index");
	CHECK(engine.received[1].args == "-c 1");
}

TEST_CASE_FIXTURE(CommandsFixture, "Evaluate") {
	engine.eval_result = "42";
	CHECK(commands.EvaluateExpression("6 * 7") == "42");
	CHECK(engine.received[0].name == "eval");
	CHECK(engine.received[0].data == "6 * 7");

	engine.eval_result.clear();
	CHECK(commands.EvaluateExpression("nothing") == "");
}

TEST_CASE_FIXTURE(CommandsFixture, "Stack trace is innermost first") {
	engine.stack_files = { "C:/scripts/lib.ahk", "C:\\my scripts\\main.ahk" };

	auto frames = commands.GetStackTrace();
	REQUIRE(frames.size() == 2);
	CHECK(frames[0].level == 0);
	CHECK(frames[0].filename == "C:/scripts/lib.ahk");
	CHECK(frames[0].lineno == 2);
	CHECK(frames[1].level == 1);
	CHECK(frames[1].where == "Frame1");
	CHECK(frames[1].filename == "C:/my scripts/main.ahk");
}

TEST_CASE_FIXTURE(CommandsFixture, "Engine errors surface as EngineError") {
	engine.failing_commands = { "eval" };
	CHECK_THROWS_AS(commands.EvaluateExpression("bad("), EngineError);
	CHECK(router.GetPendingCount() == 0);
}

TEST_CASE_FIXTURE(CommandsFixture, "Commands fail fast when disconnected") {
	transport.connected = false;
	CHECK_THROWS_AS(commands.Run(), NotConnectedError);
	CHECK_THROWS_AS(commands.GetStackTrace(), NotConnectedError);
	CHECK_THROWS_AS(commands.SetBreakpoint("C:\\a.ahk", 1), NotConnectedError);
	CHECK(engine.received.empty());
}

TEST_CASE_FIXTURE(CommandsFixture, "Continuation stopping on an error reports a fault") {
	std::vector<Fault> faults;
	commands.SetFaultHandler([&faults](const Fault& fault) { faults.push_back(fault); });

	CHECK(commands.Run() == "break");
	CHECK(faults.empty());

	engine.continuation_reason = "error";
	CHECK(commands.StepOver() == "break");
	REQUIRE(faults.size() == 1);
	CHECK(faults[0].error_type == "error");
	CHECK(faults[0].file.empty());
}
