// mcplink server: a stdio MCP server exposing the Echo, Add and GetDateTime tools.
//
// Reads JSON-RPC 2.0 messages from stdin, dispatches them, writes responses to stdout.
// Logs go to stderr; stdout carries protocol traffic only.

#include <nlohmann/json.hpp>
#include <csignal>
#include <cstring>
#include <signal.h>
#include <string>

#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "protocol/json_rpc.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

// No SA_RESTART: the signal interrupts the blocking read on stdin, which then
// returns no message and the loop sees the flag.
static void install_signal_handlers() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

int main() {
    install_signal_handlers();

    tool_handlers::register_all_tools();

    mcp_stdio::log_message("mcplink server started. Waiting for MCP messages on stdin.");

    // Main message loop: read from stdin, dispatch, write to stdout.
    while (!shutdown_requested) {
        std::string raw_message = mcp_stdio::read_message();

        if (raw_message.empty()) {
            // EOF on stdin means the client disconnected; an interrupted read means a signal.
            debug_log::log(shutdown_requested ? "Signal received. Shutting down." : "EOF on stdin. Shutting down.");
            break;
        }

        json parsed_message;
        try {
            parsed_message = json::parse(raw_message);
        } catch (const json::parse_error &error) {
            mcp_stdio::log_message("Failed to parse incoming JSON: " + std::string(error.what()));
            // No request id is recoverable from an unparseable message.
            json error_response = json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR, "Parse error");
            mcp_stdio::write_message(json_rpc::serialize(error_response));
            continue;
        }

        json response = mcp_dispatch::dispatch_message(parsed_message);

        // Notifications return null (no response needed).
        if (response.is_null()) {
            continue;
        }

        mcp_stdio::write_message(json_rpc::serialize(response));
    }

    mcp_stdio::log_message("mcplink server shut down.");
    return 0;
}
