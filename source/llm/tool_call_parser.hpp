#ifndef MCPLINK_TOOL_CALL_PARSER_HPP
#define MCPLINK_TOOL_CALL_PARSER_HPP

// Extraction of tool calls embedded in free-form model replies.
//
// Marker grammar:
//   "[TOOL_CALL:" identifier "(" argument-list ")" "]"
//   argument-list := (name "=" value ("," name "=" value)*)?
//
// The identifier is [A-Za-z0-9_]+. The argument list runs to the first ')',
// so values cannot contain a closing parenthesis and nested calls are not
// recognised. Only the first marker in a reply is returned.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tool_call_parser {

using ordered_json = nlohmann::ordered_json;

struct ExtractedCall {
    std::string tool_name;
    ordered_json arguments; // object, in the order the names first appeared
};

// Split an argument list on commas outside quoted values. A value is quoted
// when its first non-space character after '=' is ' or "; it stays quoted until
// a matching quote followed by a comma or the end of the list. Quotes anywhere
// else are ordinary characters. Segments are returned untrimmed.
std::vector<std::string> split_arguments(const std::string &argument_list);

// Coerce one raw value: number, then boolean (case-insensitive), then string
// with one layer of matching quotes removed. Inside removed quotes \", \' and
// \\ are unescaped; other backslashes are kept.
ordered_json coerce_value(const std::string &raw_value);

// Parse "a=1, b=true, c=\"x, y\"" into an ordered object. Segments without
// '=' or with an empty name are skipped; a repeated name keeps the last value.
ordered_json parse_arguments(const std::string &argument_list);

// Find the first call marker in text. Returns nullopt when there is none.
std::optional<ExtractedCall> extract_tool_call(const std::string &text);

} // namespace tool_call_parser

#endif // MCPLINK_TOOL_CALL_PARSER_HPP
