#ifndef MCPLINK_MCP_CLIENT_HPP
#define MCPLINK_MCP_CLIENT_HPP

// MCP client over stdio: launches the server as a child process and speaks
// newline-delimited JSON-RPC 2.0 over its stdin/stdout, one request at a time.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "mcp/mcp_stdio.hpp"
#include "registry/tool_registry_abi.hpp"

namespace mcp_client {

using json = nlohmann::json;

struct LaunchOptions {
    std::string server_path;
    std::vector<std::string> server_arguments;
    std::string client_name = "mcplink-client";
    std::string client_version = "0.1.0";
    int request_timeout_milliseconds = 30000;
    // Grace period after closing the server's stdin before it is signalled.
    int shutdown_timeout_milliseconds = 2000;
};

struct ConnectResult {
    bool success = false;
    std::string protocol_version;
    std::string server_name;
    std::string server_version;
    std::string instructions;
    std::string error_detail;
};

// Owns the server process and both pipes. The process is released exactly
// once: by disconnect() or, failing that, by the destructor.
class StdioMcpClient : public tool_registry::ToolRegistry {
public:
    StdioMcpClient() = default;
    ~StdioMcpClient() override;

    StdioMcpClient(const StdioMcpClient &) = delete;
    StdioMcpClient &operator=(const StdioMcpClient &) = delete;

    // Launch the server and perform the initialize handshake.
    ConnectResult connect(const LaunchOptions &options);

    // Close stdin, wait for the server to exit, escalate to signals if it does not.
    void disconnect();

    bool is_connected() const { return connected; }

    tool_registry::ListToolsResult list_tools() override;

    tool_registry::CallToolResult call_tool(const std::string &tool_name,
                                            const nlohmann::ordered_json &arguments) override;

private:
    struct RpcOutcome {
        bool success = false;
        bool rpc_error = false; // the server answered with a JSON-RPC error
        int error_code = 0;
        json result;
        std::string error_detail;
    };

    RpcOutcome send_request(const std::string &method, const json &params);
    bool send_notification(const std::string &method, const json &params, std::string &error_detail);
    bool write_line(const json &message, std::string &error_detail);
    bool next_message(json &message, int timeout_milliseconds, std::string &error_detail);
    void answer_server_request(const json &request);

    LaunchOptions launch_options;
    bool connected = false;
    int process_id = -1;
    int stdin_fd = -1;
    int stdout_fd = -1;
    long long next_request_id = 1;
    mcp_stdio::MessageFramer framer;
};

} // namespace mcp_client

#endif // MCPLINK_MCP_CLIENT_HPP
