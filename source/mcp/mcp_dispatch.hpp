#ifndef MCPLINK_MCP_DISPATCH_HPP
#define MCPLINK_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch for the server.

#include <nlohmann/json.hpp>
#include <string>

namespace mcp_dispatch {

using json = nlohmann::json;

// Protocol version we support.
inline constexpr char PROTOCOL_VERSION[] = "2024-11-05";

// Dispatch a single JSON-RPC message. Returns the response JSON, or a null
// json value for notifications (which require no response).
json dispatch_message(const json &message);

} // namespace mcp_dispatch

#endif // MCPLINK_MCP_DISPATCH_HPP
