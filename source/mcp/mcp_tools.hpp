#ifndef MCPLINK_MCP_TOOLS_HPP
#define MCPLINK_MCP_TOOLS_HPP

// MCP tool registry (server side): registration, listing, and dispatch of tool calls.

#include <nlohmann/json.hpp>
#include <string>
#include <functional>
#include <vector>

namespace mcp_tools {

using json = nlohmann::json;

// A tool handler function: receives the arguments JSON, returns the result JSON
// (content array + isError flag, the MCP CallToolResult shape).
using ToolHandler = std::function<json(const json &arguments)>;

// Description of a registered tool, matching the MCP tool schema.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object
    ToolHandler handler;
};

// Register a tool. A definition with an already registered name replaces it.
void register_tool(const ToolDefinition &definition);

// Remove every registered tool.
void clear_registered_tools();

bool has_tool(const std::string &tool_name);

// Build the response payload for tools/list.
json build_tools_list_response();

// Dispatch a tools/call request. Returns the result payload (content + isError).
// Callers check has_tool() first; an unknown name yields an isError result.
json dispatch_tool_call(const std::string &tool_name, const json &arguments);

// Result payload with a single text content item.
json make_text_result(const std::string &text);

// Result payload with a single text content item and isError set.
json make_error_result(const std::string &text);

// Get all registered tool definitions (for testing or introspection).
const std::vector<ToolDefinition> &get_registered_tools();

} // namespace mcp_tools

#endif // MCPLINK_MCP_TOOLS_HPP
