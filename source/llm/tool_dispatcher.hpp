#ifndef MCPLINK_TOOL_DISPATCHER_HPP
#define MCPLINK_TOOL_DISPATCHER_HPP

// Tool dispatcher: hands an extracted call to the registry and renders the
// outcome for the user. It performs no schema validation of its own; the
// registry is the authority on tool names and argument shapes.

#include <iosfwd>
#include <string>
#include <vector>

#include "llm/tool_call_parser.hpp"
#include "registry/tool_registry_abi.hpp"

namespace tool_dispatcher {

struct DispatchOutcome {
    bool success = false;       // invoked, and the tool did not flag an error
    std::string tool_name;
    std::string rendered_text;  // rendered content items, one per line
    std::string error_detail;   // set when the invocation itself failed
};

// Render content items: text verbatim, anything else as a type tag plus its
// serialized payload. Items are separated by newlines.
std::string render_content(const std::vector<tool_registry::ContentItem> &content);

// Render arguments for display, e.g. "a=42, b=17, message=\"hi\"".
std::string describe_arguments(const nlohmann::ordered_json &arguments);

// Invoke the call and write a report to output. Never throws for registry
// failures: every failure is reported once and returned in the outcome.
DispatchOutcome dispatch(tool_registry::ToolRegistry &registry,
                         const tool_call_parser::ExtractedCall &call,
                         std::ostream &output);

// One-line summary suitable for feeding back into a conversation.
std::string summarize(const DispatchOutcome &outcome);

} // namespace tool_dispatcher

#endif // MCPLINK_TOOL_DISPATCHER_HPP
