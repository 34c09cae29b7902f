#pragma once

#include <nlohmann/json.hpp>

#include "../debugger/types.hpp"

void to_json(nlohmann::json& j, const Breakpoint& breakpoint);
void to_json(nlohmann::json& j, const Variable& variable);
void to_json(nlohmann::json& j, const StackFrame& frame);
void to_json(nlohmann::json& j, const SourceLine& line);
void to_json(nlohmann::json& j, const ErrorEvent& error);

// Missing fields are left at their defaults
void from_json(const nlohmann::json& j, Variable& variable);
void from_json(const nlohmann::json& j, StackFrame& frame);
void from_json(const nlohmann::json& j, SourceLine& line);
void from_json(const nlohmann::json& j, ErrorEvent& error);
