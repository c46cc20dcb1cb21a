#ifndef MCPLINK_CONVERSATION_HPP
#define MCPLINK_CONVERSATION_HPP

// Conversation loop: user input -> chat model -> call marker -> tool registry,
// over a bounded message history.

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

#include "config/client_config.hpp"
#include "llm/chat_model_abi.hpp"
#include "registry/tool_registry_abi.hpp"

namespace conversation {

// Ordered role-tagged history with the system message pinned at index 0.
class ConversationState {
public:
    ConversationState(const std::string &system_prompt, size_t max_messages);

    void append(const std::string &role, const std::string &content);

    // Drop the newest message unless it is the system message.
    void drop_last();

    // While over the cap, remove the two oldest non-system messages.
    // Returns how many messages were removed.
    size_t enforce_limit();

    const std::vector<chat_model::ChatMessage> &messages() const { return message_list; }
    size_t size() const { return message_list.size(); }
    size_t max_messages() const { return message_limit; }

private:
    std::vector<chat_model::ChatMessage> message_list;
    size_t message_limit;
};

// System prompt describing the tools and the call marker format.
std::string build_system_prompt(const std::vector<tool_registry::ToolDescriptor> &tools);

// "exit" in any letter case, surrounding whitespace ignored.
bool is_exit_command(const std::string &line);

class ConversationLoop {
public:
    ConversationLoop(const client_config::ChatConfig &config,
                     chat_model::ChatModel &model,
                     tool_registry::ToolRegistry &registry,
                     std::vector<tool_registry::ToolDescriptor> tools,
                     std::istream &input,
                     std::ostream &output);

    // Prompt and process lines until "exit" or end of input.
    void run();

    // Process one line of user input. Returns false when the loop should stop.
    bool handle_line(const std::string &line);

    const ConversationState &state() const { return history; }

private:
    bool handle_command(const std::string &line);
    void run_model_turn(const std::string &user_text);
    void print_tools();

    chat_model::ChatModel &model_client;
    tool_registry::ToolRegistry &registry_client;
    std::vector<tool_registry::ToolDescriptor> tool_list;
    std::istream &input_stream;
    std::ostream &output_stream;
    ConversationState history;
};

} // namespace conversation

#endif // MCPLINK_CONVERSATION_HPP
