#include <doctest/doctest.h>

#include "debugger/parser.hpp"

TEST_CASE("ParseResponse") {
	auto response = ParseResponse("<?xml version=\"1.0\"?><response xmlns=\"urn:debugger_protocol_v1\" command=\"breakpoint_set\" transaction_id=\"5\" state=\"enabled\" id=\"3\"/>");
	CHECK(response.Get("command") == "breakpoint_set");
	CHECK(response.Get("transaction_id") == "5");
	CHECK(response.Get("id") == "3");
	CHECK(response.Get("missing") == "");
	CHECK_FALSE(response.error.has_value());
	CHECK(response.raw.find("breakpoint_set") != std::string::npos);

	SUBCASE("engine error") {
		auto failed = ParseResponse("<response command=\"eval\" transaction_id=\"9\"><error code=\"206\"><message>Expression error</message></error></response>");
		REQUIRE(failed.error.has_value());
		CHECK(failed.error->code == 206);
		CHECK(failed.error->message == "Expression error");
	}

	SUBCASE("no response element") {
		auto empty = ParseResponse("");
		CHECK(empty.attributes.empty());
	}
}

TEST_CASE("UnescapeXml") {
	CHECK(UnescapeXml("a &lt; b &amp;&amp; c &gt; &quot;d&quot; &apos;e&apos;") == "a < b && c > \"d\" 'e'");
	CHECK(UnescapeXml("AT&T") == "AT&T");
}

TEST_CASE("ParseProperties") {
	SUBCASE("base64 text is decoded") {
		auto variables = ParseProperties(
			"<response command=\"context_get\" context=\"0\" transaction_id=\"4\">"
			"<property name=\"greeting\" fullname=\"greeting\" type=\"string\" facet=\"\" children=\"0\" encoding=\"base64\" size=\"5\">aGVsbG8=</property>"
			"<property name=\"count\" fullname=\"count\" type=\"integer\" children=\"0\" encoding=\"base64\" size=\"2\">NDI=</property>"
			"</response>");
		REQUIRE(variables.size() == 2);
		CHECK(variables[0].name == "greeting");
		CHECK(variables[0].fullname == "greeting");
		CHECK(variables[0].type == "string");
		CHECK(variables[0].value == "hello");
		CHECK(variables[1].value == "42");
	}

	SUBCASE("text that is not base64 is kept") {
		auto variables = ParseProperties("<property name=\"x\" type=\"string\">not base64!</property>");
		REQUIRE(variables.size() == 1);
		CHECK(variables[0].value == "not base64!");
	}

	SUBCASE("explicit non-base64 encoding") {
		auto variables = ParseProperties("<property name=\"x\" type=\"string\" encoding=\"none\">abcd</property>");
		REQUIRE(variables.size() == 1);
		CHECK(variables[0].value == "abcd");
	}

	SUBCASE("self-closing property has no value") {
		auto variables = ParseProperties("<property name=\"unset\" fullname=\"unset\" type=\"undefined\" size=\"0\" children=\"0\"/>");
		REQUIRE(variables.size() == 1);
		CHECK(variables[0].name == "unset");
		CHECK(variables[0].value == "");
	}

	SUBCASE("empty body") {
		CHECK(ParseProperties("<response command=\"context_get\" transaction_id=\"1\"/>").empty());
	}
}

TEST_CASE("ParseStack") {
	auto frames = ParseStack(
		"<response command=\"stack_get\" transaction_id=\"6\">"
		"<stack level=\"0\" type=\"file\" filename=\"file:///C:/scripts/a.ahk\" lineno=\"12\" where=\"Helper()\"/>"
		"<stack level=\"1\" type=\"file\" filename=\"file:///C%3A/my%20scripts/main.ahk\" lineno=\"3\" where=\"Auto-execute\"/>"
		"</response>");
	REQUIRE(frames.size() == 2);
	CHECK(frames[0].level == 0);
	CHECK(frames[0].lineno == 12);
	CHECK(frames[0].type == "file");
	CHECK(frames[0].filename == "C:/scripts/a.ahk");
	CHECK(frames[0].where == "Helper()");
	CHECK(frames[1].level == 1);
	CHECK(frames[1].lineno == 3);
	CHECK(frames[1].filename == "C:/my scripts/main.ahk");

	CHECK(ParseStack("").empty());
}

TEST_CASE("ParseBreakpoints") {
	auto breakpoints = ParseBreakpoints(
		"<response command=\"breakpoint_list\" transaction_id=\"8\">"
		"<breakpoint id=\"1\" type=\"line\" state=\"enabled\" filename=\"file:///C:/scripts/a.ahk\" lineno=\"10\"/>"
		"<breakpoint id=\"2\" type=\"exception\" state=\"enabled\" exception=\"Any\"/>"
		"<breakpoint id=\"3\" type=\"line\" state=\"disabled\" filename=\"file:///C%3A/scripts/a.ahk\" lineno=\"10\"/>"
		"</response>");
	REQUIRE(breakpoints.size() == 2);
	CHECK(breakpoints[0].id == "1");
	CHECK(breakpoints[0].file == "C:/scripts/a.ahk");
	CHECK(breakpoints[0].line == 10);
	CHECK(breakpoints[0].state == "enabled");
	CHECK(breakpoints[1].id == "3");
	CHECK(breakpoints[1].file == "C:/scripts/a.ahk");
	CHECK(breakpoints[1].line == 10);

	CHECK(ParseBreakpoints("<response command=\"breakpoint_list\" transaction_id=\"8\"></response>").empty());
}

TEST_CASE("ParseErrorNotification") {
	auto fault = ParseErrorNotification(
		"<notify xmlns=\"urn:debugger_protocol_v1\" xmlns:xdebug=\"https://xdebug.org/dbgp/xdebug\" name=\"error\">"
		"<xdebug:message filename=\"file:///home/user/a.php\" lineno=\"7\" type=\"Warning\"><![CDATA[Undefined variable $x]]></xdebug:message>"
		"</notify>");
	REQUIRE(fault.has_value());
	CHECK(fault->error_type == "Warning");
	CHECK(fault->file == "/home/user/a.php");
	CHECK(fault->line == 7);
	CHECK(fault->message == "Undefined variable $x");

	CHECK_FALSE(ParseErrorNotification("<notify name=\"breakpoint_resolved\"/>").has_value());
	CHECK_FALSE(ParseErrorNotification("<response command=\"run\" transaction_id=\"1\"/>").has_value());
}

TEST_CASE("FindElement") {
	auto init = FindElement("<init appid=\"AutoHotkey\" language=\"AutoHotkey\" protocol_version=\"1.0\"/>", "init");
	REQUIRE(init.has_value());
	CHECK((*init)["appid"] == "AutoHotkey");
	CHECK((*init)["protocol_version"] == "1.0");

	CHECK_FALSE(FindElement("<response/>", "init").has_value());
}
