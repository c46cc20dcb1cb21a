#ifndef MCPLINK_CLIENT_CONFIG_HPP
#define MCPLINK_CLIENT_CONFIG_HPP

// Client configuration, read once from the environment at startup and then
// passed explicitly to whatever needs it.
//
//   MCPLINK_SERVER_PATH          registry executable (default: mcplink_server beside this binary)
//   MCPLINK_REQUEST_TIMEOUT_MS   per MCP request (default 30000)
//   MCPLINK_CHAT_PROVIDER        "openai" (default) or "simulated"
//   MCPLINK_CHAT_API_KEY         chat credential, falls back to OPENAI_API_KEY
//   MCPLINK_CHAT_ENDPOINT        chat-completions URL
//   MCPLINK_CHAT_MODEL           model name
//   MCPLINK_CHAT_TIMEOUT_MS      per chat request (default 60000)
//   MCPLINK_HISTORY_LIMIT        conversation cap, at least 3 (default 10)

#include <cstddef>
#include <string>

namespace client_config {

struct RegistryConfig {
    std::string server_path;
    int request_timeout_milliseconds = 30000;
};

struct ChatConfig {
    std::string provider = "openai";
    std::string api_key;
    std::string endpoint = "https://api.openai.com/v1/chat/completions";
    std::string model = "gpt-4o-mini";
    double temperature = 0.2;
    int request_timeout_milliseconds = 60000;
    size_t history_limit = 10;
};

struct RegistryConfigResult {
    bool success = false;
    RegistryConfig config;
    std::string error_detail;
};

struct ChatConfigResult {
    bool success = false;
    ChatConfig config;
    std::string error_detail;
};

RegistryConfigResult load_registry_config();

// Fails when the selected provider needs a credential and none is set.
ChatConfigResult load_chat_config();

} // namespace client_config

#endif // MCPLINK_CLIENT_CONFIG_HPP
