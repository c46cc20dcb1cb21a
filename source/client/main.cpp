// mcplink client: interactive menu over the tools of an mcplink server.
//
// Launches the server as a child process, lists its tools, then calls the
// one the user picks until "4" (or end of input).

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <utility>

#include "config/client_config.hpp"
#include "llm/tool_call_parser.hpp"
#include "llm/tool_dispatcher.hpp"
#include "mcp/mcp_client.hpp"

using ordered_json = nlohmann::ordered_json;

static bool prompt_line(const std::string &prompt, std::string &line) {
    std::cout << prompt << std::flush;
    return static_cast<bool>(std::getline(std::cin, line));
}

static double prompt_number(const std::string &prompt) {
    std::string line;
    if (!prompt_line(prompt, line)) {
        return 0.0;
    }
    ordered_json value = tool_call_parser::coerce_value(line);
    if (!value.is_number()) {
        std::cout << "Invalid number. Using 0." << std::endl;
        return 0.0;
    }
    return value.get<double>();
}

static void call_tool(mcp_client::StdioMcpClient &client, const std::string &tool_name, ordered_json arguments) {
    tool_call_parser::ExtractedCall call;
    call.tool_name = tool_name;
    call.arguments = std::move(arguments);
    std::cout << std::endl;
    tool_dispatcher::dispatch(client, call, std::cout);
}

static void print_tools(const tool_registry::ListToolsResult &listing) {
    for (const auto &tool : listing.tools) {
        std::cout << "- " << tool.name << ": " << tool.description << std::endl;
        if (tool.schema) {
            std::cout << "  Parameters (from schema):" << std::endl;
            std::cout << "    " << tool.schema->dump() << std::endl;
        }
    }
}

int main() {
    std::cout << "Starting MCP Client..." << std::endl;

    client_config::RegistryConfigResult config = client_config::load_registry_config();
    if (!config.success) {
        std::cerr << "Error: " << config.error_detail << std::endl;
        return 1;
    }

    std::cout << "Connecting to MCP server at " << config.config.server_path << "..." << std::endl;

    mcp_client::LaunchOptions options;
    options.server_path = config.config.server_path;
    options.client_name = "mcplink-client";
    options.request_timeout_milliseconds = config.config.request_timeout_milliseconds;

    mcp_client::StdioMcpClient client;
    mcp_client::ConnectResult connection = client.connect(options);
    if (!connection.success) {
        std::cerr << "Error: " << connection.error_detail << std::endl;
        return 1;
    }
    std::cout << "Connected to " << connection.server_name << " " << connection.server_version << "." << std::endl;

    std::cout << "\nListing available tools:" << std::endl;
    tool_registry::ListToolsResult listing = client.list_tools();
    if (!listing.success) {
        std::cerr << "Error: " << listing.error_detail << std::endl;
        return 1;
    }
    print_tools(listing);

    std::string choice;
    while (true) {
        std::cout << "\nChoose a tool to call:" << std::endl;
        std::cout << "1. Echo" << std::endl;
        std::cout << "2. Add" << std::endl;
        std::cout << "3. GetDateTime" << std::endl;
        std::cout << "4. Exit" << std::endl;

        if (!prompt_line("\nEnter your choice (1-4): ", choice) || choice == "4") {
            break;
        }

        if (choice == "1") {
            std::string message;
            if (!prompt_line("Enter a message to echo: ", message)) {
                break;
            }
            call_tool(client, "Echo", {{"message", message}});
        } else if (choice == "2") {
            double first = prompt_number("Enter first number: ");
            double second = prompt_number("Enter second number: ");
            call_tool(client, "Add", {{"a", first}, {"b", second}});
        } else if (choice == "3") {
            call_tool(client, "GetDateTime", ordered_json::object());
        } else {
            std::cout << "Invalid choice. Please try again." << std::endl;
        }
    }

    client.disconnect();
    std::cout << "Client disconnected. Exiting..." << std::endl;
    return 0;
}
