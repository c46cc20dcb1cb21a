#include "mcp/mcp_client.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "platform/platform_abi.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <chrono>
#include <csignal>

namespace mcp_client {

static const int MAX_TOOL_LIST_PAGES = 64;

static long long milliseconds_since(std::chrono::steady_clock::time_point start_time) {
    auto elapsed = std::chrono::steady_clock::now() - start_time;
    return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}

StdioMcpClient::~StdioMcpClient() {
    disconnect();
}

ConnectResult StdioMcpClient::connect(const LaunchOptions &options) {
    ConnectResult result;

    if (process_id > 0) {
        result.error_detail = "Already connected to an MCP server.";
        return result;
    }

    if (!platform::is_executable_file(options.server_path)) {
        result.error_detail = "Server executable not found at " + options.server_path +
                              ". Build the server first or set MCPLINK_SERVER_PATH.";
        return result;
    }

    // A server that dies mid-write must surface as a write error, not kill the client.
    std::signal(SIGPIPE, SIG_IGN);

    launch_options = options;
    platform::SpawnResult spawn_result = platform::spawn_process_with_pipes(options.server_path,
                                                                            options.server_arguments);
    if (!spawn_result.success) {
        result.error_detail = "Failed to start server " + options.server_path + ": " + spawn_result.error_message;
        return result;
    }

    process_id = spawn_result.process_id;
    stdin_fd = spawn_result.stdin_fd;
    stdout_fd = spawn_result.stdout_fd;
    framer.reset();
    connected = true;
    debug_log::log("Server started pid=" + std::to_string(process_id) + " path=" + options.server_path);

    json params;
    params["protocolVersion"] = mcp_dispatch::PROTOCOL_VERSION;
    params["capabilities"] = json::object();
    params["clientInfo"] = {{"name", options.client_name}, {"version", options.client_version}};

    RpcOutcome initialize = send_request("initialize", params);
    if (!initialize.success) {
        result.error_detail = "MCP initialize failed: " + initialize.error_detail;
        disconnect();
        return result;
    }

    const json &server_result = initialize.result;
    result.protocol_version = json_rpc::get_string(server_result, "protocolVersion");
    if (server_result.contains("serverInfo")) {
        result.server_name = json_rpc::get_string(server_result["serverInfo"], "name");
        result.server_version = json_rpc::get_string(server_result["serverInfo"], "version");
    }
    result.instructions = json_rpc::get_string(server_result, "instructions");
    if (result.protocol_version != mcp_dispatch::PROTOCOL_VERSION) {
        debug_log::log("Server negotiated protocol version '" + result.protocol_version + "'.");
    }

    std::string notify_error;
    if (!send_notification("notifications/initialized", nullptr, notify_error)) {
        result.error_detail = "MCP initialized notification failed: " + notify_error;
        disconnect();
        return result;
    }

    result.success = true;
    return result;
}

void StdioMcpClient::disconnect() {
    if (process_id <= 0) {
        platform::close_descriptor(stdin_fd);
        platform::close_descriptor(stdout_fd);
        connected = false;
        return;
    }

    debug_log::log("Disconnecting from server pid=" + std::to_string(process_id));

    // EOF on its stdin is the server's cue to shut down.
    platform::close_descriptor(stdin_fd);
    if (!platform::wait_for_exit(process_id, launch_options.shutdown_timeout_milliseconds)) {
        debug_log::info("Server did not exit after stdin closed, sending SIGTERM.");
        platform::kill_process(process_id);
        if (!platform::wait_for_exit(process_id, 1000)) {
            debug_log::info("Server ignored SIGTERM, sending SIGKILL.");
            platform::force_kill_process(process_id);
        }
    }
    platform::close_descriptor(stdout_fd);

    process_id = -1;
    connected = false;
    framer.reset();
}

tool_registry::ListToolsResult StdioMcpClient::list_tools() {
    tool_registry::ListToolsResult result;
    std::string cursor;

    for (int page = 0; page < MAX_TOOL_LIST_PAGES; page++) {
        json params = json::object();
        if (!cursor.empty()) {
            params["cursor"] = cursor;
        }

        RpcOutcome outcome = send_request("tools/list", params);
        if (!outcome.success) {
            result.error_detail = "tools/list failed: " + outcome.error_detail;
            return result;
        }
        if (!outcome.result.contains("tools") || !outcome.result["tools"].is_array()) {
            result.error_detail = "tools/list response has no 'tools' array";
            return result;
        }

        for (const auto &entry : outcome.result["tools"]) {
            auto descriptor = tool_registry::parse_tool_descriptor(entry);
            if (descriptor) {
                result.tools.push_back(std::move(*descriptor));
            } else {
                debug_log::log("Skipping tools/list entry without a name: " + json_rpc::serialize(entry));
            }
        }

        if (outcome.result.contains("nextCursor") && outcome.result["nextCursor"].is_string()) {
            cursor = outcome.result["nextCursor"].get<std::string>();
            if (cursor.empty()) {
                break;
            }
        } else {
            break;
        }
    }

    result.success = true;
    return result;
}

tool_registry::CallToolResult StdioMcpClient::call_tool(const std::string &tool_name,
                                                        const nlohmann::ordered_json &arguments) {
    tool_registry::CallToolResult result;

    json params;
    params["name"] = tool_name;
    // Same JSON text, different object ordering policy.
    params["arguments"] = arguments.is_object()
                              ? json::parse(arguments.dump(-1, ' ', false, json::error_handler_t::replace))
                              : json::object();

    RpcOutcome outcome = send_request("tools/call", params);
    if (!outcome.success) {
        result.error_detail = outcome.error_detail;
        if (!outcome.rpc_error) {
            result.error_kind = tool_registry::CallErrorKind::transport_error;
        } else if (outcome.error_code == json_rpc::INVALID_PARAMS &&
                   outcome.error_detail.rfind("Unknown tool", 0) == 0) {
            result.error_kind = tool_registry::CallErrorKind::tool_not_found;
        } else if (outcome.error_code == json_rpc::INVALID_PARAMS) {
            result.error_kind = tool_registry::CallErrorKind::argument_error;
        } else {
            result.error_kind = tool_registry::CallErrorKind::transport_error;
            result.error_detail = "server error " + std::to_string(outcome.error_code) + ": " + outcome.error_detail;
        }
        return result;
    }

    if (outcome.result.contains("content") && outcome.result["content"].is_array()) {
        for (const auto &entry : outcome.result["content"]) {
            result.content.push_back(tool_registry::parse_content_item(entry));
        }
    }
    if (outcome.result.contains("isError") && outcome.result["isError"].is_boolean()) {
        result.is_error = outcome.result["isError"].get<bool>();
    }

    result.success = true;
    return result;
}

StdioMcpClient::RpcOutcome StdioMcpClient::send_request(const std::string &method, const json &params) {
    RpcOutcome outcome;

    if (!connected) {
        outcome.error_detail = "not connected to the MCP server";
        return outcome;
    }

    json request_id = next_request_id++;
    json request = json_rpc::build_request(request_id, method, params);
    if (!write_line(request, outcome.error_detail)) {
        return outcome;
    }

    auto start_time = std::chrono::steady_clock::now();
    int timeout_milliseconds = launch_options.request_timeout_milliseconds;

    while (true) {
        long long remaining = timeout_milliseconds - milliseconds_since(start_time);
        if (remaining <= 0) {
            outcome.error_detail = "timed out after " + std::to_string(timeout_milliseconds) +
                                   " ms waiting for response to " + method;
            return outcome;
        }

        json message;
        if (!next_message(message, static_cast<int>(remaining), outcome.error_detail)) {
            if (outcome.error_detail.empty()) {
                continue; // poll woke without a complete message
            }
            return outcome;
        }

        if (json_rpc::is_response(message)) {
            if (message["id"] != request_id) {
                // Late answer to a request that already timed out.
                debug_log::log("Dropping response with stale id " + message["id"].dump());
                continue;
            }
            if (message.contains("error")) {
                outcome.rpc_error = true;
                const json &error = message["error"];
                outcome.error_code = json_rpc::get_integer(error, "code");
                outcome.error_detail = json_rpc::get_string(error, "message", "JSON-RPC error");
                return outcome;
            }
            outcome.result = message["result"];
            if (!outcome.result.is_object()) {
                outcome.error_detail = "response result for " + method + " is not an object";
                return outcome;
            }
            outcome.success = true;
            return outcome;
        }

        if (json_rpc::is_notification(message)) {
            debug_log::log("Server notification: " + json_rpc::get_method(message));
            continue;
        }

        answer_server_request(message);
    }
}

bool StdioMcpClient::send_notification(const std::string &method, const json &params, std::string &error_detail) {
    if (!connected) {
        error_detail = "not connected to the MCP server";
        return false;
    }
    return write_line(json_rpc::build_notification(method, params), error_detail);
}

bool StdioMcpClient::write_line(const json &message, std::string &error_detail) {
    std::string error_message;
    if (!platform::write_all(stdin_fd, json_rpc::serialize(message) + "\n", error_message)) {
        error_detail = "failed to write to server: " + error_message;
        connected = false;
        return false;
    }
    return true;
}

// Returns true with a parsed message, or false with error_detail set on a
// transport failure (left empty when the wait simply ended without a message).
bool StdioMcpClient::next_message(json &message, int timeout_milliseconds, std::string &error_detail) {
    while (!framer.has_message()) {
        platform::ReadResult read_result = platform::read_available(stdout_fd, timeout_milliseconds);
        if (!read_result.success) {
            error_detail = "failed to read from server: " + read_result.error_message;
            connected = false;
            return false;
        }
        if (read_result.end_of_file) {
            error_detail = "server closed its output (process exited?)";
            connected = false;
            return false;
        }
        if (read_result.timed_out) {
            return false;
        }
        framer.push(read_result.data.data(), read_result.data.size());
    }

    std::string raw_message = framer.take_message();
    message = json::parse(raw_message, nullptr, false);
    if (message.is_discarded()) {
        debug_log::log("Ignoring unparseable message from server: " + raw_message.substr(0, 200));
        return false;
    }
    return true;
}

// The server may ping us; anything else we do not implement.
void StdioMcpClient::answer_server_request(const json &request) {
    std::string method = json_rpc::get_method(request);
    json response;
    if (method == "ping") {
        response = json_rpc::build_response(json_rpc::get_id(request), json::object());
    } else {
        response = json_rpc::build_error_response(json_rpc::get_id(request), json_rpc::METHOD_NOT_FOUND,
                                                  "Client does not support: " + method);
    }

    std::string error_detail;
    if (!write_line(response, error_detail)) {
        debug_log::log("Could not answer server request " + method + ": " + error_detail);
    }
}

} // namespace mcp_client
