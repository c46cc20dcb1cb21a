// Smoke E2E test: launches the real mcplink_server as a child process, performs
// the MCP handshake over its pipes, lists and calls tools, and runs one
// conversation turn against the simulated chat model.
//
// Build separately: cmake --build build --target mcplink_smoke_test
// Run: ./build/mcplink_smoke_test [path/to/mcplink_server]

#include "llm/conversation.hpp"
#include "llm/simulated_chat_model.hpp"
#include "mcp/mcp_client.hpp"
#include "platform/platform_abi.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#ifndef MCPLINK_SERVER_BINARY
#define MCPLINK_SERVER_BINARY "mcplink_server"
#endif

using ordered_json = nlohmann::ordered_json;

static std::string first_text(const tool_registry::CallToolResult &result) {
    if (result.content.empty() || !result.content[0].text) {
        return "";
    }
    return *result.content[0].text;
}

static bool test_missing_server_is_setup_error() {
    mcp_client::LaunchOptions options;
    options.server_path = "/nonexistent/mcplink_server";

    mcp_client::StdioMcpClient client;
    mcp_client::ConnectResult connection = client.connect(options);
    bool success = !connection.success && !client.is_connected() &&
                   connection.error_detail.find("Server executable not found") != std::string::npos;

    if (success) {
        std::cout << "  OK: Missing server executable is reported" << std::endl;
    } else {
        std::cout << "  FAIL: connect to a missing server: " << connection.error_detail << std::endl;
    }
    return success;
}

// A server that answers with wrongly typed fields: the client must report
// an error and still release the process.
static bool test_malformed_server_replies() {
    const std::string script_path = "./mcplink_malformed_server.sh";
    {
        std::ofstream script(script_path);
        script << "#!/bin/sh\n"
               << "read line\n"
               << "printf '%s\\n' '{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":"
                  "{\"protocolVersion\":5,\"serverInfo\":{\"name\":7},\"instructions\":[]}}'\n"
               << "read line\n"
               << "read line\n"
               << "printf '%s\\n' '{\"jsonrpc\":\"2.0\",\"id\":2,\"error\":{\"code\":\"bad\",\"message\":42}}'\n"
               << "read line\n";
    }
    chmod(script_path.c_str(), 0755);

    mcp_client::LaunchOptions options;
    options.server_path = script_path;
    options.request_timeout_milliseconds = 5000;

    bool passed = false;
    {
        mcp_client::StdioMcpClient client;
        mcp_client::ConnectResult connection = client.connect(options);
        tool_registry::ListToolsResult listing;
        if (connection.success) {
            listing = client.list_tools();
        }
        passed = connection.success && connection.protocol_version.empty() && connection.server_name.empty() &&
                 !listing.success && listing.error_detail == "tools/list failed: JSON-RPC error";
        if (passed) {
            std::cout << "  OK: Wrongly typed replies are reported, not thrown" << std::endl;
        } else {
            std::cout << "  FAIL: malformed server: " << connection.error_detail << listing.error_detail
                      << std::endl;
        }
        client.disconnect();
    }
    unlink(script_path.c_str());
    return passed;
}

// SIGTERM must stop an idle server even while its stdin is still open.
static bool test_server_exits_on_sigterm(const std::string &server_path) {
    platform::SpawnResult spawn_result = platform::spawn_process_with_pipes(server_path, {});
    if (!spawn_result.success) {
        std::cout << "  FAIL: could not start server: " << spawn_result.error_message << std::endl;
        return false;
    }

    // A ping answer shows the server is in its read loop with handlers installed.
    std::string error_message;
    std::string received;
    bool answered = platform::write_all(spawn_result.stdin_fd, "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n",
                                        error_message);
    auto start_time = std::chrono::steady_clock::now();
    while (answered && received.find('\n') == std::string::npos &&
           std::chrono::steady_clock::now() - start_time < std::chrono::seconds(5)) {
        platform::ReadResult read_result = platform::read_available(spawn_result.stdout_fd, 500);
        if (!read_result.success || read_result.end_of_file) {
            answered = false;
            break;
        }
        received += read_result.data;
    }
    answered = answered && received.find("\"id\":1") != std::string::npos;

    platform::kill_process(spawn_result.process_id);
    bool exited = platform::wait_for_exit(spawn_result.process_id, 2000);
    if (!exited) {
        platform::force_kill_process(spawn_result.process_id);
    }
    platform::close_descriptor(spawn_result.stdin_fd);
    platform::close_descriptor(spawn_result.stdout_fd);

    bool success = answered && exited;
    if (success) {
        std::cout << "  OK: Idle server exits on SIGTERM with stdin open" << std::endl;
    } else {
        std::cout << "  FAIL: server " << (answered ? "ignored SIGTERM" : "did not answer ping") << std::endl;
    }
    return success;
}

static bool test_full_server_lifecycle(const std::string &server_path) {
    std::cout << "  Starting " << server_path << "..." << std::endl;

    mcp_client::LaunchOptions options;
    options.server_path = server_path;
    options.request_timeout_milliseconds = 10000;

    mcp_client::StdioMcpClient client;
    mcp_client::ConnectResult connection = client.connect(options);
    if (!connection.success) {
        std::cout << "  FAIL: connect failed: " << connection.error_detail << std::endl;
        return false;
    }
    std::cout << "  OK: Connected to " << connection.server_name << " (protocol "
              << connection.protocol_version << ")." << std::endl;

    bool passed = true;

    tool_registry::ListToolsResult listing = client.list_tools();
    if (!listing.success || listing.tools.size() != 3 || !listing.tools[1].schema) {
        std::cout << "  FAIL: list_tools: " << listing.error_detail << std::endl;
        passed = false;
    } else {
        std::cout << "  OK: list_tools returned " << listing.tools.size() << " tools with schemas." << std::endl;
    }

    tool_registry::CallToolResult sum = client.call_tool("Add", ordered_json{{"a", 42.0}, {"b", 17.0}});
    if (!sum.success || sum.is_error || first_text(sum) != "59") {
        std::cout << "  FAIL: Add(42, 17) gave '" << first_text(sum) << "' " << sum.error_detail << std::endl;
        passed = false;
    } else {
        std::cout << "  OK: Add(42, 17) = 59" << std::endl;
    }

    tool_registry::CallToolResult echo = client.call_tool("Echo", ordered_json{{"message", "smoke"}});
    if (!echo.success || first_text(echo) != "hello smoke") {
        std::cout << "  FAIL: Echo gave '" << first_text(echo) << "'" << std::endl;
        passed = false;
    } else {
        std::cout << "  OK: Echo returned 'hello smoke'" << std::endl;
    }

    tool_registry::CallToolResult bad_arguments = client.call_tool("Add", ordered_json{{"a", "x"}});
    if (!bad_arguments.success || !bad_arguments.is_error) {
        std::cout << "  FAIL: Add with bad arguments was not flagged as a tool error" << std::endl;
        passed = false;
    } else {
        std::cout << "  OK: Bad arguments come back with isError" << std::endl;
    }

    tool_registry::CallToolResult unknown = client.call_tool("Multiply", ordered_json::object());
    if (unknown.success || unknown.error_kind != tool_registry::CallErrorKind::tool_not_found) {
        std::cout << "  FAIL: unknown tool kind was " << tool_registry::to_string(unknown.error_kind) << std::endl;
        passed = false;
    } else {
        std::cout << "  OK: Unknown tool maps to tool not found" << std::endl;
    }

    // One conversation turn with the simulated model, through the real server.
    client_config::ChatConfig chat_config;
    chat_config.provider = "simulated";
    simulated_chat::SimulatedChatModel model;
    std::istringstream input("What is 42 plus 17?\nexit\n");
    std::ostringstream output;
    conversation::ConversationLoop loop(chat_config, model, client, listing.tools, input, output);
    loop.run();

    const auto &messages = loop.state().messages();
    if (messages.empty() || messages.back().content != "Tool Add returned: 59") {
        std::cout << "  FAIL: conversation output was: " << output.str() << std::endl;
        passed = false;
    } else {
        std::cout << "  OK: Conversation turn dispatched Add and recorded 59" << std::endl;
    }

    client.disconnect();
    client.disconnect();
    if (client.is_connected()) {
        std::cout << "  FAIL: client still connected after disconnect" << std::endl;
        passed = false;
    } else {
        std::cout << "  OK: Disconnected; server process released." << std::endl;
    }
    return passed;
}

int main(int argc, char **argv) {
    std::cout << "=== mcplink Smoke E2E Test ===" << std::endl;

    std::string server_path = (argc > 1) ? argv[1] : MCPLINK_SERVER_BINARY;

    auto start_time = std::chrono::steady_clock::now();
    bool passed = test_missing_server_is_setup_error();
    passed &= test_malformed_server_replies();
    passed &= test_full_server_lifecycle(server_path);
    passed &= test_server_exits_on_sigterm(server_path);
    auto elapsed = std::chrono::steady_clock::now() - start_time;
    long elapsed_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();

    std::cout << std::endl;
    if (passed) {
        std::cout << "PASSED (" << elapsed_milliseconds << " ms)" << std::endl;
    } else {
        std::cout << "FAILED (" << elapsed_milliseconds << " ms)" << std::endl;
    }

    return passed ? 0 : 1;
}
