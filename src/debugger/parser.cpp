#include "parser.hpp"

#include <regex>
#include <cstdlib>

#include "base64.hpp"
#include "codec.hpp"

static const std::regex ATTRIBUTE_REGEX(R"re(([\w:\-]+)="([^"]*)")re");
static const std::regex RESPONSE_REGEX(R"re(<response([^>]*)>)re");
static const std::regex ERROR_REGEX(R"re(<error([^>]*?)/?>(?:\s*<message>(?:<!\[CDATA\[)?([^<\]]*)(?:\]\]>)?</message>)?)re");
static const std::regex PROPERTY_REGEX(R"re(<property([^>]*?)(?:/>|>([^<]*)</property>))re");
static const std::regex STACK_REGEX(R"re(<stack([^>]*?)/>)re");
static const std::regex BREAKPOINT_REGEX(R"re(<breakpoint([^>]*?)/?>)re");
static const std::regex NOTIFY_REGEX(R"re(<notify([^>]*)>)re");
static const std::regex NOTIFY_MESSAGE_REGEX(R"re(<(?:\w+:)?message([^>]*?)(?:/>|>(?:<!\[CDATA\[)?([\s\S]*?)(?:\]\]>)?</(?:\w+:)?message>))re");

static int ParseInt(const std::string& value) {
	return static_cast<int>(std::strtol(value.c_str(), nullptr, 10));
}

static std::string GetOr(const AttributeMap& attributes, const std::string& key) {
	auto it = attributes.find(key);
	if (it == attributes.end()) return {};
	return it->second;
}

AttributeMap ParseAttributes(std::string_view attributes) {
	AttributeMap result;
	std::string text(attributes);
	for (auto it = std::sregex_iterator(text.begin(), text.end(), ATTRIBUTE_REGEX); it != std::sregex_iterator(); ++it) {
		result[(*it)[1].str()] = UnescapeXml((*it)[2].str());
	}
	return result;
}

std::string UnescapeXml(std::string_view text) {
	std::string out;
	out.reserve(text.size());
	for (size_t i = 0; i < text.size(); i++) {
		if (text[i] != '&') {
			out += text[i];
			continue;
		}

		auto rest = text.substr(i);
		if (rest.starts_with("&lt;")) {
			out += '<';
			i += 3;
		} else if (rest.starts_with("&gt;")) {
			out += '>';
			i += 3;
		} else if (rest.starts_with("&amp;")) {
			out += '&';
			i += 4;
		} else if (rest.starts_with("&quot;")) {
			out += '"';
			i += 5;
		} else if (rest.starts_with("&apos;")) {
			out += '\'';
			i += 5;
		} else {
			out += '&';
		}
	}
	return out;
}

std::optional<AttributeMap> FindElement(const std::string& xml, const std::string& tag) {
	std::regex element_regex("<" + tag + R"re((\s[^>]*?)?/?>)re");
	std::smatch match;
	if (!std::regex_search(xml, match, element_regex)) {
		return std::nullopt;
	}
	return ParseAttributes(match[1].str());
}

Response ParseResponse(const std::string& xml) {
	Response response{};
	response.raw = xml;

	std::smatch match;
	if (std::regex_search(xml, match, RESPONSE_REGEX)) {
		std::string attributes = match[1].str();
		if (attributes.ends_with("/")) {
			attributes.pop_back();
		}
		response.attributes = ParseAttributes(attributes);
	}

	if (std::regex_search(xml, match, ERROR_REGEX)) {
		auto attributes = ParseAttributes(match[1].str());
		response.error = EngineErrorInfo{ ParseInt(GetOr(attributes, "code")), match[2].str() };
	}

	return response;
}

std::vector<Variable> ParseProperties(const std::string& xml) {
	std::vector<Variable> variables;
	for (auto it = std::sregex_iterator(xml.begin(), xml.end(), PROPERTY_REGEX); it != std::sregex_iterator(); ++it) {
		auto attributes = ParseAttributes((*it)[1].str());

		Variable variable{};
		variable.name = GetOr(attributes, "name");
		variable.fullname = GetOr(attributes, "fullname");
		variable.type = GetOr(attributes, "type");

		std::string text = (*it)[2].str();
		if (!text.empty()) {
			auto encoding = GetOr(attributes, "encoding");
			std::optional<std::string> decoded;
			if (encoding.empty() || encoding == "base64") {
				decoded = Base64Decode(text);
			}
			variable.value = decoded ? *decoded : UnescapeXml(text);
		}

		variables.push_back(std::move(variable));
	}
	return variables;
}

std::vector<StackFrame> ParseStack(const std::string& xml) {
	std::vector<StackFrame> frames;
	for (auto it = std::sregex_iterator(xml.begin(), xml.end(), STACK_REGEX); it != std::sregex_iterator(); ++it) {
		auto attributes = ParseAttributes((*it)[1].str());

		StackFrame frame{};
		frame.level = ParseInt(GetOr(attributes, "level"));
		frame.type = GetOr(attributes, "type");
		frame.filename = FileUriToPath(GetOr(attributes, "filename"));
		frame.lineno = ParseInt(GetOr(attributes, "lineno"));
		frame.where = GetOr(attributes, "where");
		frames.push_back(std::move(frame));
	}
	return frames;
}

std::vector<Breakpoint> ParseBreakpoints(const std::string& xml) {
	std::vector<Breakpoint> breakpoints;
	for (auto it = std::sregex_iterator(xml.begin(), xml.end(), BREAKPOINT_REGEX); it != std::sregex_iterator(); ++it) {
		auto attributes = ParseAttributes((*it)[1].str());
		if (!attributes.contains("id") || !attributes.contains("filename")) {
			continue;
		}

		Breakpoint breakpoint{};
		breakpoint.id = attributes["id"];
		breakpoint.file = FileUriToPath(attributes["filename"]);
		breakpoint.line = ParseInt(GetOr(attributes, "lineno"));
		breakpoint.state = GetOr(attributes, "state");
		breakpoints.push_back(std::move(breakpoint));
	}
	return breakpoints;
}

std::optional<Fault> ParseErrorNotification(const std::string& xml) {
	std::smatch match;
	if (!std::regex_search(xml, match, NOTIFY_REGEX)) {
		return std::nullopt;
	}

	auto attributes = ParseAttributes(match[1].str());
	auto name = GetOr(attributes, "name");
	if (name != "error" && name != "exception") {
		return std::nullopt;
	}

	Fault fault{};
	fault.error_type = name;
	if (std::regex_search(xml, match, NOTIFY_MESSAGE_REGEX)) {
		auto message_attributes = ParseAttributes(match[1].str());
		fault.file = FileUriToPath(GetOr(message_attributes, "filename"));
		fault.line = ParseInt(GetOr(message_attributes, "lineno"));
		if (message_attributes.contains("type")) {
			fault.error_type = message_attributes["type"];
		}
		fault.message = UnescapeXml(match[2].str());
	}
	return fault;
}
