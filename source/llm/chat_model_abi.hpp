#ifndef MCPLINK_CHAT_MODEL_ABI_HPP
#define MCPLINK_CHAT_MODEL_ABI_HPP

// Chat model abstraction: one request, one text reply, no streaming.

#include <string>
#include <vector>

namespace chat_model {

// Role is one of "system", "user", "assistant".
struct ChatMessage {
    std::string role;
    std::string content;
};

struct ChatReply {
    bool success = false;
    std::string text;
    std::string error_detail;
};

class ChatModel {
public:
    virtual ~ChatModel() = default;

    // Short label for logs and the startup banner.
    virtual std::string name() const = 0;

    virtual ChatReply complete_chat(const std::vector<ChatMessage> &messages) = 0;
};

} // namespace chat_model

#endif // MCPLINK_CHAT_MODEL_ABI_HPP
