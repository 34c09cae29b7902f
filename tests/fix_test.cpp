#include <doctest/doctest.h>

#include "tool/fix.hpp"
#include "test_util.hpp"

TEST_CASE("Trim") {
	CHECK(Trim("  x = 1\t") == "x = 1");
	CHECK(Trim("x") == "x");
	CHECK(Trim(" \t\r\n") == "");
	CHECK(Trim("") == "");
}

TEST_CASE("ApplyFix replaces a matching line") {
	TempFile file("first\n    MsgBox(\"Hi\"\nthird\n");

	auto result = ApplyFix(file.String(), 2, "MsgBox(\"Hi\"", "  MsgBox(\"Hi\")  ");
	CHECK(result.old_line == "MsgBox(\"Hi\"");
	CHECK(result.new_line == "MsgBox(\"Hi\")");
	CHECK(file.Read() == "first\n    MsgBox(\"Hi\")\nthird\n");
}

TEST_CASE("ApplyFix keeps tab indentation") {
	TempFile file("if (x) {\n\t\treturn y\n}");

	ApplyFix(file.String(), 2, "return y", "return x");
	CHECK(file.Read() == "if (x) {\n\t\treturn x\n}");
}

TEST_CASE("ApplyFix normalizes line endings") {
	TempFile file("a\r\nb\r\nc");

	ApplyFix(file.String(), 3, "c", "d");
	CHECK(file.Read() == "a\nb\nd");
}

TEST_CASE("ApplyFix rejects a mismatch") {
	TempFile file("first\nMsgBox(\"Hi\")\n");

	try {
		ApplyFix(file.String(), 2, "MsgBox('Hi')", "MsgBox('Bye')");
		FAIL("expected FixError");
	} catch (const FixError& e) {
		std::string message = e.what();
		CHECK(message.find("Line mismatch at 2") != std::string::npos);
		CHECK(message.find("Expected: \"MsgBox('Hi')\"") != std::string::npos);
		CHECK(message.find("Found: \"MsgBox(\"Hi\")\"") != std::string::npos);
	}
	CHECK(file.Read() == "first\nMsgBox(\"Hi\")\n");
}

TEST_CASE("ApplyFix rejects lines out of range") {
	TempFile file("one\ntwo");

	CHECK_THROWS_WITH_AS(ApplyFix(file.String(), 3, "x", "y"), "Line 3 is out of range (file has 2 lines)", FixError);
	CHECK_THROWS_AS(ApplyFix(file.String(), 0, "x", "y"), FixError);
	CHECK(file.Read() == "one\ntwo");
}

TEST_CASE("ApplyFix on a missing file") {
	CHECK_THROWS_AS(ApplyFix("/nonexistent/dbgpc/missing.ahk", 1, "x", "y"), FixError);
}
