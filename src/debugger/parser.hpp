#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <unordered_map>

#include "types.hpp"

typedef std::unordered_map<std::string, std::string> AttributeMap;

AttributeMap ParseAttributes(std::string_view attributes);
std::string UnescapeXml(std::string_view text);

// Attributes of the first element with the given tag, nullopt if absent
std::optional<AttributeMap> FindElement(const std::string& xml, const std::string& tag);

Response ParseResponse(const std::string& xml);
std::vector<Variable> ParseProperties(const std::string& xml);
std::vector<StackFrame> ParseStack(const std::string& xml);
std::vector<Breakpoint> ParseBreakpoints(const std::string& xml);
std::optional<Fault> ParseErrorNotification(const std::string& xml);
