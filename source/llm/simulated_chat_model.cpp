#include "llm/simulated_chat_model.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <initializer_list>
#include <set>
#include <string>
#include <vector>

namespace simulated_chat {

static const std::regex NUMBER_TOKEN(R"([-+]?\d+(?:\.\d+)?)");

static std::set<std::string> lowercase_words(const std::string &text) {
    std::set<std::string> words;
    std::string current;
    for (unsigned char character : text) {
        if (std::isalpha(character)) {
            current += static_cast<char>(std::tolower(character));
        } else if (!current.empty()) {
            words.insert(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        words.insert(current);
    }
    return words;
}

static bool contains_any(const std::set<std::string> &words, std::initializer_list<const char *> candidates) {
    return std::any_of(candidates.begin(), candidates.end(),
                       [&words](const char *candidate) { return words.count(candidate) > 0; });
}

std::string reply_for(const std::string &user_text) {
    std::set<std::string> words = lowercase_words(user_text);

    if (contains_any(words, {"add", "sum", "plus"}) || user_text.find('+') != std::string::npos) {
        std::vector<std::string> numbers;
        for (std::sregex_iterator match(user_text.begin(), user_text.end(), NUMBER_TOKEN), end; match != end; ++match) {
            numbers.push_back(match->str());
        }
        if (numbers.size() < 2) {
            return "I can add numbers for you, but I need two of them. Which numbers should I add?";
        }
        return "Let me add those. [TOOL_CALL:Add(a=" + numbers[0] + ", b=" + numbers[1] + ")]";
    }

    if (contains_any(words, {"time", "date", "now", "today"})) {
        return "Let me check the clock. [TOOL_CALL:GetDateTime()]";
    }

    if (contains_any(words, {"hello", "hi", "hey"})) {
        return "Hello! [TOOL_CALL:Echo(message=\"friendly greeting\")]";
    }

    return "I'm not sure which tool fits that. I can echo a message, add two numbers, or tell you the time.";
}

chat_model::ChatReply SimulatedChatModel::complete_chat(const std::vector<chat_model::ChatMessage> &messages) {
    chat_model::ChatReply reply;

    auto last_user = std::find_if(messages.rbegin(), messages.rend(),
                                  [](const chat_model::ChatMessage &message) { return message.role == "user"; });
    if (last_user == messages.rend()) {
        reply.error_detail = "no user message to answer";
        return reply;
    }

    reply.text = reply_for(last_user->content);
    reply.success = true;
    return reply;
}

} // namespace simulated_chat
