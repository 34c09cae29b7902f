#pragma once

#include <string>

#include "../debugger/types.hpp"

// Markdown triage report for a captured error
std::string FormatErrorAnalysis(const ErrorEvent& error);
