#ifndef MCPLINK_SIMULATED_CHAT_MODEL_HPP
#define MCPLINK_SIMULATED_CHAT_MODEL_HPP

// Offline stand-in for a chat model. Picks a tool from keywords in the latest
// user message and answers with a call marker, the way a real model prompted
// with the tool list would.

#include "llm/chat_model_abi.hpp"

namespace simulated_chat {

class SimulatedChatModel : public chat_model::ChatModel {
public:
    std::string name() const override { return "simulated"; }

    chat_model::ChatReply complete_chat(const std::vector<chat_model::ChatMessage> &messages) override;
};

// Reply for a single user message.
std::string reply_for(const std::string &user_text);

} // namespace simulated_chat

#endif // MCPLINK_SIMULATED_CHAT_MODEL_HPP
