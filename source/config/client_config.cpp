#include "config/client_config.hpp"
#include "platform/platform_abi.hpp"

#include <cstdlib>
#include <string>

namespace client_config {

static std::string read_environment(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr) {
        return "";
    }
    return std::string(value);
}

// Empty variable means "use the default". Anything else must be a whole positive integer.
static bool read_positive_integer(const char *name, long long default_value, long long &output,
                                  std::string &error_detail) {
    std::string text = read_environment(name);
    if (text.empty()) {
        output = default_value;
        return true;
    }

    char *end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || value <= 0 || value > 24LL * 60 * 60 * 1000) {
        error_detail = std::string(name) + " must be a positive integer, got '" + text + "'.";
        return false;
    }
    output = value;
    return true;
}

RegistryConfigResult load_registry_config() {
    RegistryConfigResult result;

    result.config.server_path = read_environment("MCPLINK_SERVER_PATH");
    if (result.config.server_path.empty()) {
        std::string directory = platform::executable_directory();
        result.config.server_path = directory.empty() ? "mcplink_server" : directory + "/mcplink_server";
    }

    long long timeout = 0;
    if (!read_positive_integer("MCPLINK_REQUEST_TIMEOUT_MS", result.config.request_timeout_milliseconds,
                               timeout, result.error_detail)) {
        return result;
    }
    result.config.request_timeout_milliseconds = static_cast<int>(timeout);

    result.success = true;
    return result;
}

ChatConfigResult load_chat_config() {
    ChatConfigResult result;
    ChatConfig &config = result.config;

    std::string provider = read_environment("MCPLINK_CHAT_PROVIDER");
    if (!provider.empty()) {
        config.provider = provider;
    }
    if (config.provider != "openai" && config.provider != "simulated") {
        result.error_detail = "MCPLINK_CHAT_PROVIDER must be 'openai' or 'simulated', got '" + config.provider + "'.";
        return result;
    }

    config.api_key = read_environment("MCPLINK_CHAT_API_KEY");
    if (config.api_key.empty()) {
        config.api_key = read_environment("OPENAI_API_KEY");
    }
    if (config.provider == "openai" && config.api_key.empty()) {
        result.error_detail = "Missing chat model credential: set MCPLINK_CHAT_API_KEY (or OPENAI_API_KEY), "
                              "or set MCPLINK_CHAT_PROVIDER=simulated to run without a model.";
        return result;
    }

    std::string endpoint = read_environment("MCPLINK_CHAT_ENDPOINT");
    if (!endpoint.empty()) {
        config.endpoint = endpoint;
    }
    std::string model = read_environment("MCPLINK_CHAT_MODEL");
    if (!model.empty()) {
        config.model = model;
    }

    long long timeout = 0;
    if (!read_positive_integer("MCPLINK_CHAT_TIMEOUT_MS", config.request_timeout_milliseconds, timeout,
                               result.error_detail)) {
        return result;
    }
    config.request_timeout_milliseconds = static_cast<int>(timeout);

    long long history_limit = 0;
    if (!read_positive_integer("MCPLINK_HISTORY_LIMIT", static_cast<long long>(config.history_limit),
                               history_limit, result.error_detail)) {
        return result;
    }
    if (history_limit < 3) {
        result.error_detail = "MCPLINK_HISTORY_LIMIT must be at least 3.";
        return result;
    }
    config.history_limit = static_cast<size_t>(history_limit);

    result.success = true;
    return result;
}

} // namespace client_config
