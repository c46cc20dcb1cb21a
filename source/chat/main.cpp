// mcplink chat: LLM-driven client. The chat model answers user input and may
// embed one [TOOL_CALL:Name(args)] marker per reply, which is executed against
// the mcplink server's tools.

#include <iostream>
#include <memory>
#include <string>

#include "config/client_config.hpp"
#include "llm/conversation.hpp"
#include "llm/openai_chat_client.hpp"
#include "llm/simulated_chat_model.hpp"
#include "mcp/mcp_client.hpp"
#include "utils/debug_log.hpp"

static std::unique_ptr<chat_model::ChatModel> make_chat_model(const client_config::ChatConfig &config) {
    if (config.provider == "simulated") {
        return std::make_unique<simulated_chat::SimulatedChatModel>();
    }
    return std::make_unique<openai_chat::OpenAiChatClient>(config);
}

int main() {
    std::cout << "Starting MCP LLM Integration Client..." << std::endl;

    // The credential is checked before anything is launched.
    client_config::ChatConfigResult chat_config = client_config::load_chat_config();
    if (!chat_config.success) {
        std::cerr << "Error: " << chat_config.error_detail << std::endl;
        return 1;
    }

    client_config::RegistryConfigResult registry_config = client_config::load_registry_config();
    if (!registry_config.success) {
        std::cerr << "Error: " << registry_config.error_detail << std::endl;
        return 1;
    }

    mcp_client::LaunchOptions options;
    options.server_path = registry_config.config.server_path;
    options.client_name = "mcplink-chat";
    options.request_timeout_milliseconds = registry_config.config.request_timeout_milliseconds;

    std::cout << "Connecting to MCP server at " << options.server_path << "..." << std::endl;
    mcp_client::StdioMcpClient client;
    mcp_client::ConnectResult connection = client.connect(options);
    if (!connection.success) {
        std::cerr << "Error: " << connection.error_detail << std::endl;
        return 1;
    }

    tool_registry::ListToolsResult listing = client.list_tools();
    if (!listing.success) {
        std::cerr << "Error: " << listing.error_detail << std::endl;
        return 1;
    }

    std::cout << "\nAvailable tools:" << std::endl;
    for (const auto &tool : listing.tools) {
        std::cout << "- " << tool.name << ": " << tool.description << std::endl;
    }

    std::unique_ptr<chat_model::ChatModel> model = make_chat_model(chat_config.config);
    debug_log::log("chat provider: " + model->name());

    conversation::ConversationLoop loop(chat_config.config, *model, client, listing.tools, std::cin, std::cout);
    loop.run();

    client.disconnect();
    std::cout << "Client disconnected. Exiting..." << std::endl;
    return 0;
}
