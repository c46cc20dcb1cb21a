#ifndef MCPLINK_OPENAI_CHAT_CLIENT_HPP
#define MCPLINK_OPENAI_CHAT_CLIENT_HPP

// Chat model backed by an OpenAI-compatible /v1/chat/completions endpoint.
// One blocking HTTPS POST per reply, carried by libwebsockets' HTTP client.

#include <string>
#include <vector>

#include "config/client_config.hpp"
#include "llm/chat_model_abi.hpp"

namespace openai_chat {

// Parsed form of the configured endpoint URL.
struct EndpointUrl {
    bool valid = false;
    bool use_tls = false;
    std::string host;
    int port = 0;
    std::string path;
};

// Accepts http:// and https:// URLs with optional port and path.
EndpointUrl parse_endpoint_url(const std::string &url);

// Build the JSON body of a chat-completions request.
std::string build_request_body(const std::string &model, double temperature,
                               const std::vector<chat_model::ChatMessage> &messages);

// Interpret a chat-completions HTTP response.
chat_model::ChatReply parse_completion_response(int http_status, const std::string &body);

class OpenAiChatClient : public chat_model::ChatModel {
public:
    explicit OpenAiChatClient(client_config::ChatConfig config);

    std::string name() const override;

    chat_model::ChatReply complete_chat(const std::vector<chat_model::ChatMessage> &messages) override;

private:
    client_config::ChatConfig chat_config;
    EndpointUrl endpoint;
};

} // namespace openai_chat

#endif // MCPLINK_OPENAI_CHAT_CLIENT_HPP
