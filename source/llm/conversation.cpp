#include "llm/conversation.hpp"
#include "llm/tool_call_parser.hpp"
#include "llm/tool_dispatcher.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <sstream>
#include <utility>

namespace conversation {

static std::string trim(const std::string &text) {
    auto is_space = [](unsigned char character) { return std::isspace(character) != 0; };
    auto begin = std::find_if_not(text.begin(), text.end(), is_space);
    auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    if (begin >= end) {
        return "";
    }
    return std::string(begin, end);
}

static std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

ConversationState::ConversationState(const std::string &system_prompt, size_t max_messages)
    : message_limit(max_messages) {
    message_list.push_back({"system", system_prompt});
}

void ConversationState::append(const std::string &role, const std::string &content) {
    message_list.push_back({role, content});
}

void ConversationState::drop_last() {
    if (message_list.size() > 1) {
        message_list.pop_back();
    }
}

size_t ConversationState::enforce_limit() {
    size_t removed = 0;
    while (message_list.size() > message_limit && message_list.size() > 1) {
        size_t to_remove = std::min<size_t>(2, message_list.size() - 1);
        message_list.erase(message_list.begin() + 1, message_list.begin() + 1 + static_cast<std::ptrdiff_t>(to_remove));
        removed += to_remove;
    }
    return removed;
}

std::string build_system_prompt(const std::vector<tool_registry::ToolDescriptor> &tools) {
    std::ostringstream prompt;
    prompt << "You are a helpful assistant that can use tools.\n";
    prompt << "Available tools:\n";
    for (const auto &tool : tools) {
        prompt << "- " << tool.name << ": " << tool.description << "\n";
        if (tool.schema) {
            prompt << "  Parameters: " << tool.schema->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
                   << "\n";
        }
    }
    prompt << "\nTo use a tool, put exactly one marker in your reply, in this form:\n";
    prompt << "[TOOL_CALL:ToolName(name1=value1, name2=value2)]\n";
    prompt << "Quote string values, for example [TOOL_CALL:Echo(message=\"hi there\")]. "
              "Use at most one tool call per reply. Tool results come back as messages "
              "starting with \"Tool\".";
    return prompt.str();
}

bool is_exit_command(const std::string &line) {
    return to_lower(trim(line)) == "exit";
}

ConversationLoop::ConversationLoop(const client_config::ChatConfig &config,
                                   chat_model::ChatModel &model,
                                   tool_registry::ToolRegistry &registry,
                                   std::vector<tool_registry::ToolDescriptor> tools,
                                   std::istream &input,
                                   std::ostream &output)
    : model_client(model),
      registry_client(registry),
      tool_list(std::move(tools)),
      input_stream(input),
      output_stream(output),
      history(build_system_prompt(tool_list), config.history_limit) {}

void ConversationLoop::run() {
    output_stream << "Type 'exit' to quit, '/help' for direct tool commands." << std::endl;

    std::string line;
    while (true) {
        output_stream << "\n> " << std::flush;
        if (!std::getline(input_stream, line)) {
            output_stream << std::endl;
            break;
        }
        if (!handle_line(line)) {
            break;
        }
    }
}

bool ConversationLoop::handle_line(const std::string &line) {
    if (is_exit_command(line)) {
        return false;
    }

    std::string text = trim(line);
    if (text.empty()) {
        return true;
    }
    if (text[0] == '/') {
        return handle_command(text);
    }

    run_model_turn(text);
    return true;
}

void ConversationLoop::print_tools() {
    output_stream << "Available tools:" << "\n";
    for (const auto &tool : tool_list) {
        output_stream << "- " << tool.name << ": " << tool.description << "\n";
    }
    output_stream.flush();
}

// Direct tool commands, bypassing the model. They leave the history untouched.
bool ConversationLoop::handle_command(const std::string &line) {
    std::istringstream words(line);
    std::string command;
    words >> command;
    command = to_lower(command);

    std::string rest;
    std::getline(words, rest);
    rest = trim(rest);

    tool_call_parser::ExtractedCall call;
    if (command == "/help") {
        output_stream << "Commands:\n"
                      << "  /tools             list the server's tools\n"
                      << "  /echo <message>    call Echo\n"
                      << "  /add <a> <b>       call Add\n"
                      << "  /time              call GetDateTime\n"
                      << "  exit               quit" << std::endl;
        return true;
    }
    if (command == "/tools") {
        print_tools();
        return true;
    }
    if (command == "/echo") {
        call.tool_name = "Echo";
        call.arguments = tool_call_parser::ordered_json::object();
        call.arguments["message"] = rest;
    } else if (command == "/add") {
        std::istringstream operands(rest);
        std::string first;
        std::string second;
        operands >> first >> second;
        auto a = tool_call_parser::coerce_value(first);
        auto b = tool_call_parser::coerce_value(second);
        if (!a.is_number() || !b.is_number()) {
            output_stream << "Error: Please provide two numbers for addition." << std::endl;
            return true;
        }
        call.tool_name = "Add";
        call.arguments = tool_call_parser::ordered_json::object();
        call.arguments["a"] = a;
        call.arguments["b"] = b;
    } else if (command == "/time") {
        call.tool_name = "GetDateTime";
        call.arguments = tool_call_parser::ordered_json::object();
    } else {
        output_stream << "Unknown command " << command << ". Type /help for the list." << std::endl;
        return true;
    }

    tool_dispatcher::dispatch(registry_client, call, output_stream);
    return true;
}

void ConversationLoop::run_model_turn(const std::string &user_text) {
    history.append("user", user_text);

    chat_model::ChatReply reply = model_client.complete_chat(history.messages());
    if (!reply.success) {
        output_stream << "Error: " << reply.error_detail << std::endl;
        // Keep the history alternating: the unanswered question goes.
        history.drop_last();
        return;
    }

    output_stream << "Assistant: " << reply.text << std::endl;
    history.append("assistant", reply.text);

    auto call = tool_call_parser::extract_tool_call(reply.text);
    if (call) {
        debug_log::log("Reply requested tool " + call->tool_name);
        tool_dispatcher::DispatchOutcome outcome = tool_dispatcher::dispatch(registry_client, *call, output_stream);
        history.append("user", tool_dispatcher::summarize(outcome));
    }

    size_t evicted = history.enforce_limit();
    if (evicted > 0) {
        debug_log::log("Evicted " + std::to_string(evicted) + " old messages from the conversation.");
    }
}

} // namespace conversation
