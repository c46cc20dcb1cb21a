#include "llm/tool_call_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <regex>

namespace tool_call_parser {

static const std::regex CALL_MARKER_PATTERN(R"(\[TOOL_CALL:([A-Za-z0-9_]+)\(([^)]*)\)\])");
static const std::regex NUMBER_PATTERN(R"(^[+-]?(\d+\.?\d*|\.\d+)([eE][+-]?\d+)?$)");

static std::string trim(const std::string &text) {
    auto is_space = [](unsigned char character) { return std::isspace(character) != 0; };
    auto begin = std::find_if_not(text.begin(), text.end(), is_space);
    auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    if (begin >= end) {
        return "";
    }
    return std::string(begin, end);
}

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

static bool parse_number(const std::string &text, double &value) {
    if (!std::regex_match(text, NUMBER_PATTERN)) {
        return false;
    }
    char *end = nullptr;
    value = std::strtod(text.c_str(), &end);
    // 1e999 and friends have no JSON representation; leave them as strings.
    return end != nullptr && *end == '\0' && std::isfinite(value);
}

// A quote closes its value only when nothing but spaces stands between it and
// the next comma or the end of the list. "C:\tmp\" and "say \"hi\"" both close
// at their last quote.
static bool quote_closes_value(const std::string &argument_list, size_t position) {
    while (position < argument_list.size() && std::isspace(static_cast<unsigned char>(argument_list[position]))) {
        position++;
    }
    return position == argument_list.size() || argument_list[position] == ',';
}

// Inside a quoted value, \", \' and \\ stand for the character after the backslash.
// Any other backslash is literal.
static std::string unescape_quoted(const std::string &text) {
    std::string result;
    for (size_t index = 0; index < text.size(); index++) {
        char character = text[index];
        if (character == '\\' && index + 1 < text.size()) {
            char next = text[index + 1];
            if (next == '"' || next == '\'' || next == '\\') {
                result += next;
                index++;
                continue;
            }
        }
        result += character;
    }
    return result;
}

std::vector<std::string> split_arguments(const std::string &argument_list) {
    std::vector<std::string> segments;
    std::string current;
    char open_quote = '\0';
    bool inside_value = false;  // past the segment's first '='
    bool value_started = false; // a non-space character of the value was seen

    for (size_t index = 0; index < argument_list.size(); index++) {
        char character = argument_list[index];

        if (open_quote != '\0') {
            current += character;
            if (character == open_quote && quote_closes_value(argument_list, index + 1)) {
                open_quote = '\0';
            }
            continue;
        }

        if (character == ',') {
            segments.push_back(current);
            current.clear();
            inside_value = false;
            value_started = false;
            continue;
        }
        current += character;

        if (!inside_value) {
            inside_value = (character == '=');
            continue;
        }
        if (!value_started && !std::isspace(static_cast<unsigned char>(character))) {
            value_started = true;
            // Only a value that begins with a quote is quoted; O'Brien is not.
            if (character == '"' || character == '\'') {
                open_quote = character;
            }
        }
    }
    segments.push_back(current);
    return segments;
}

ordered_json coerce_value(const std::string &raw_value) {
    std::string value = trim(raw_value);

    double number = 0.0;
    if (parse_number(value, number)) {
        return number;
    }

    std::string lowered = to_lower(value);
    if (lowered == "true") {
        return true;
    }
    if (lowered == "false") {
        return false;
    }

    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        return unescape_quoted(value.substr(1, value.size() - 2));
    }
    return value;
}

ordered_json parse_arguments(const std::string &argument_list) {
    ordered_json arguments = ordered_json::object();

    for (const auto &segment : split_arguments(argument_list)) {
        auto equals_position = segment.find('=');
        if (equals_position == std::string::npos) {
            continue;
        }
        std::string name = trim(segment.substr(0, equals_position));
        if (name.empty()) {
            continue;
        }
        arguments[name] = coerce_value(segment.substr(equals_position + 1));
    }
    return arguments;
}

std::optional<ExtractedCall> extract_tool_call(const std::string &text) {
    std::smatch match;
    if (!std::regex_search(text, match, CALL_MARKER_PATTERN)) {
        return std::nullopt;
    }

    ExtractedCall call;
    call.tool_name = match[1].str();
    call.arguments = parse_arguments(match[2].str());
    return call;
}

} // namespace tool_call_parser
