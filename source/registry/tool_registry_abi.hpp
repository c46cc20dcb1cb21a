#ifndef MCPLINK_TOOL_REGISTRY_ABI_HPP
#define MCPLINK_TOOL_REGISTRY_ABI_HPP

// Tool registry abstraction, as seen by clients.
// The stdio MCP client implements it against a real server process; tests
// substitute in-process fakes. This keeps the dispatcher and the conversation
// loop decoupled from the transport.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tool_registry {

using json = nlohmann::json;

// Metadata for one registry-exposed tool. The schema is absent when the
// registry did not publish one.
struct ToolDescriptor {
    std::string name;
    std::string description;
    std::optional<json> schema;
};

// One unit of a tool's result payload.
struct ContentItem {
    std::string kind; // "text", "image", "audio", "resource", ...
    std::optional<std::string> text;
    std::optional<json> data;
};

enum class CallErrorKind {
    none,
    tool_not_found,
    argument_error,
    transport_error,
};

const char *to_string(CallErrorKind kind);

struct ListToolsResult {
    bool success = false;
    std::vector<ToolDescriptor> tools;
    std::string error_detail;
};

// Result of tools/call. success covers the invocation; is_error is the tool's
// own report that it could not do the work (its content explains why).
struct CallToolResult {
    bool success = false;
    std::vector<ContentItem> content;
    bool is_error = false;
    CallErrorKind error_kind = CallErrorKind::none;
    std::string error_detail;
};

class ToolRegistry {
public:
    virtual ~ToolRegistry() = default;

    virtual ListToolsResult list_tools() = 0;

    virtual CallToolResult call_tool(const std::string &tool_name,
                                     const nlohmann::ordered_json &arguments) = 0;
};

// Convert one MCP content entry ({"type": ..., "text"|"data"|"resource": ...}).
ContentItem parse_content_item(const json &entry);

// Convert one MCP tools/list entry. Returns nullopt if it has no usable name.
std::optional<ToolDescriptor> parse_tool_descriptor(const json &entry);

} // namespace tool_registry

#endif // MCPLINK_TOOL_REGISTRY_ABI_HPP
