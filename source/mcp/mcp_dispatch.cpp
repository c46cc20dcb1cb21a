#include "mcp/mcp_dispatch.hpp"
#include "protocol/json_rpc.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

// Routes incoming MCP messages to the appropriate handler.

namespace mcp_dispatch {

// Server info.
static const std::string SERVER_NAME = "mcplink-server";
static const std::string SERVER_VERSION = "0.1.0";
static const std::string SERVER_INSTRUCTIONS =
    "Demo tool server. Echo repeats a message, Add sums two numbers, "
    "GetDateTime reports the server's local date and time.";

// Handle the "initialize" request.
static json handle_initialize(const json &request_id, const json &params) {
    if (params.contains("clientInfo")) {
        debug_log::log("initialize from client: " + json_rpc::get_string(params["clientInfo"], "name", "(unnamed)"));
    }

    json capabilities;
    capabilities["tools"] = json::object(); // We expose tools.

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;
    result["instructions"] = SERVER_INSTRUCTIONS;

    return json_rpc::build_response(request_id, result);
}

// Handle the "tools/list" request.
static json handle_tools_list(const json &request_id, const json &params) {
    (void)params; // No pagination: the whole list fits in one page.
    json result = mcp_tools::build_tools_list_response();
    return json_rpc::build_response(request_id, result);
}

// Handle the "tools/call" request.
static json handle_tools_call(const json &request_id, const json &params) {
    std::string tool_name;
    if (params.contains("name") && params["name"].is_string()) {
        tool_name = params["name"].get<std::string>();
    } else {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                               "Missing or invalid 'name' in tools/call");
    }

    if (!mcp_tools::has_tool(tool_name)) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                               "Unknown tool: " + tool_name);
    }

    json arguments = json::object();
    if (params.contains("arguments")) {
        if (params["arguments"].is_object()) {
            arguments = params["arguments"];
        } else if (!params["arguments"].is_null()) {
            return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                                   "'arguments' in tools/call must be an object");
        }
    }

    debug_log::log("tools/call " + tool_name + " arguments=" + arguments.dump());
    json tool_result = mcp_tools::dispatch_tool_call(tool_name, arguments);
    return json_rpc::build_response(request_id, tool_result);
}

json dispatch_message(const json &message) {
    if (!message.is_object()) {
        return json_rpc::build_error_response(nullptr, json_rpc::INVALID_REQUEST,
                                               "Message must be a JSON object");
    }

    std::string method = json_rpc::get_method(message);
    json request_id = json_rpc::get_id(message);
    json params = json_rpc::get_params(message);

    // Handle notifications (no response expected).
    if (json_rpc::is_notification(message)) {
        debug_log::log("notification: " + method);
        return nullptr;
    }

    if (method.empty()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_REQUEST,
                                               "Missing 'method'");
    }

    // Route to the appropriate handler.
    if (method == "initialize") {
        return handle_initialize(request_id, params);
    }
    if (method == "ping") {
        return json_rpc::build_response(request_id, json::object());
    }
    if (method == "tools/list") {
        return handle_tools_list(request_id, params);
    }
    if (method == "tools/call") {
        return handle_tools_call(request_id, params);
    }

    // Unknown method.
    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                           "Unknown method: " + method);
}

} // namespace mcp_dispatch
