// Tests for conversation history bounds and the conversation loop.

#include "fake_tool_registry.hpp"
#include "llm/conversation.hpp"

#include <iostream>
#include <sstream>
#include <string>

namespace test_conversation {

static client_config::ChatConfig make_config() {
    client_config::ChatConfig config;
    config.provider = "simulated";
    config.history_limit = 10;
    return config;
}

// Test: Exceeding the cap evicts the two oldest non-system messages.
static bool test_eviction_keeps_system_message() {
    conversation::ConversationState state("system prompt", 10);
    for (int index = 1; index <= 10; index++) {
        state.append(index % 2 ? "user" : "assistant", "message " + std::to_string(index));
    }
    // 11 messages now, one over the cap.
    size_t removed = state.enforce_limit();

    const auto &messages = state.messages();
    bool success = removed == 2 && messages.size() == 9 &&
                   messages[0].role == "system" && messages[0].content == "system prompt" &&
                   messages[1].content == "message 3" && messages.back().content == "message 10";

    if (success) {
        std::cout << "  OK: Eviction removes messages 1 and 2, system stays at index 0" << std::endl;
    } else {
        std::cout << "  FAIL: after eviction size=" << messages.size()
                  << " second=" << (messages.size() > 1 ? messages[1].content : "") << std::endl;
    }
    return success;
}

// Test: At or under the cap nothing is evicted.
static bool test_no_eviction_under_cap() {
    conversation::ConversationState state("system prompt", 10);
    for (int index = 1; index <= 9; index++) {
        state.append("user", "message " + std::to_string(index));
    }
    bool success = state.enforce_limit() == 0 && state.size() == 10;

    if (success) {
        std::cout << "  OK: No eviction at the cap" << std::endl;
    } else {
        std::cout << "  FAIL: unexpected eviction, size=" << state.size() << std::endl;
    }
    return success;
}

// Test: drop_last never removes the system message.
static bool test_drop_last_keeps_system() {
    conversation::ConversationState state("system prompt", 10);
    state.append("user", "question");
    state.drop_last();
    state.drop_last();
    bool success = state.size() == 1 && state.messages()[0].role == "system";

    if (success) {
        std::cout << "  OK: drop_last stops at the system message" << std::endl;
    } else {
        std::cout << "  FAIL: size after drop_last=" << state.size() << std::endl;
    }
    return success;
}

// Test: "exit" ends the loop in any letter case.
static bool test_exit_command() {
    bool success = conversation::is_exit_command("exit") && conversation::is_exit_command("EXIT") &&
                   conversation::is_exit_command("  Exit \n") && !conversation::is_exit_command("exit now") &&
                   !conversation::is_exit_command("");

    if (success) {
        std::cout << "  OK: exit is recognised case-insensitively" << std::endl;
    } else {
        std::cout << "  FAIL: exit command detection" << std::endl;
    }
    return success;
}

// Test: The system prompt lists every tool and the marker format.
static bool test_system_prompt() {
    test_support::FakeToolRegistry registry;
    std::string prompt = conversation::build_system_prompt(registry.list_tools().tools);
    bool success = prompt.find("- Echo: Echoes the message back to the client.") != std::string::npos &&
                   prompt.find("- Add: ") != std::string::npos &&
                   prompt.find("- GetDateTime: ") != std::string::npos &&
                   prompt.find("[TOOL_CALL:ToolName(name1=value1, name2=value2)]") != std::string::npos;

    if (success) {
        std::cout << "  OK: System prompt describes tools and marker" << std::endl;
    } else {
        std::cout << "  FAIL: system prompt was: " << prompt << std::endl;
    }
    return success;
}

// Test: "What is 42 plus 17?" ends with Add(a=42, b=17) rendered as 59.
static bool test_end_to_end_addition() {
    test_support::FakeToolRegistry registry;
    test_support::ScriptedChatModel model;
    model.replies.push_back("I'll add those for you. [TOOL_CALL:Add(a=42, b=17)]");

    std::istringstream input("What is 42 plus 17?\nexit\n");
    std::ostringstream output;
    conversation::ConversationLoop loop(make_config(), model, registry, registry.list_tools().tools, input, output);
    loop.run();

    const auto &messages = loop.state().messages();
    bool success = registry.calls.size() == 1 && registry.calls[0].tool_name == "Add" &&
                   registry.calls[0].arguments["a"] == 42.0 && registry.calls[0].arguments["b"] == 17.0 &&
                   output.str().find("  59") != std::string::npos &&
                   messages.size() == 4 && messages[1].content == "What is 42 plus 17?" &&
                   messages[2].role == "assistant" && messages[3].content == "Tool Add returned: 59";

    if (success) {
        std::cout << "  OK: End-to-end addition dispatches Add and renders 59" << std::endl;
    } else {
        std::cout << "  FAIL: end-to-end output was: " << output.str() << std::endl;
    }
    return success;
}

// Test: A failing tool does not end the session.
static bool test_loop_continues_after_tool_failure() {
    test_support::FakeToolRegistry registry;
    registry.behaviour = test_support::FakeBehaviour::transport_error;
    test_support::ScriptedChatModel model;
    model.replies.push_back("[TOOL_CALL:Add(a=1, b=2)]");
    model.replies.push_back("Plain answer, no tools.");

    std::istringstream input("add 1 and 2\nanything else?\n");
    std::ostringstream output;
    conversation::ConversationLoop loop(make_config(), model, registry, registry.list_tools().tools, input, output);
    loop.run();

    bool success = model.requests.size() == 2 && registry.calls.size() == 1 &&
                   output.str().find("Error calling Add tool") != std::string::npos &&
                   output.str().find("Plain answer, no tools.") != std::string::npos &&
                   loop.state().messages()[3].content == "Tool Add failed: server closed the connection";

    if (success) {
        std::cout << "  OK: Loop keeps reading input after a failed tool call" << std::endl;
    } else {
        std::cout << "  FAIL: loop stopped or output was wrong: " << output.str() << std::endl;
    }
    return success;
}

// Test: A failed chat request drops the unanswered user message.
static bool test_chat_failure_drops_question() {
    test_support::FakeToolRegistry registry;
    test_support::ScriptedChatModel model;
    model.replies.push_back("");

    std::istringstream input;
    std::ostringstream output;
    conversation::ConversationLoop loop(make_config(), model, registry, registry.list_tools().tools, input, output);
    bool keep_going = loop.handle_line("hello?");

    bool success = keep_going && loop.state().size() == 1 && registry.calls.empty() &&
                   output.str().find("Error: chat endpoint returned HTTP 503") != std::string::npos;
    if (success) {
        std::cout << "  OK: Chat failure leaves only the system message" << std::endl;
    } else {
        std::cout << "  FAIL: history size after chat failure=" << loop.state().size() << std::endl;
    }
    return success;
}

// Test: History stays within the cap over many turns.
static bool test_history_bounded_over_many_turns() {
    test_support::FakeToolRegistry registry;
    test_support::ScriptedChatModel model;
    std::string script;
    for (int turn = 0; turn < 8; turn++) {
        model.replies.push_back("[TOOL_CALL:Echo(message=\"turn " + std::to_string(turn) + "\")]");
        script += "say something\n";
    }

    std::istringstream input(script);
    std::ostringstream output;
    conversation::ConversationLoop loop(make_config(), model, registry, registry.list_tools().tools, input, output);
    loop.run();

    bool success = registry.calls.size() == 8 && loop.state().size() <= 10 &&
                   loop.state().messages()[0].role == "system";
    // The new question is sent on top of a history that may already be full.
    for (const auto &request : model.requests) {
        success = success && request.size() <= 11 && request[0].role == "system";
    }

    if (success) {
        std::cout << "  OK: History never exceeds ten messages" << std::endl;
    } else {
        std::cout << "  FAIL: history grew to " << loop.state().size() << std::endl;
    }
    return success;
}

// Test: Slash commands call tools directly and leave the history alone.
static bool test_slash_commands() {
    test_support::FakeToolRegistry registry;
    test_support::ScriptedChatModel model;

    std::istringstream input("/add 2 3\n/echo hi there\n/time\n/add two three\n/nope\n");
    std::ostringstream output;
    conversation::ConversationLoop loop(make_config(), model, registry, registry.list_tools().tools, input, output);
    loop.run();

    bool success = model.requests.empty() && loop.state().size() == 1 && registry.calls.size() == 3 &&
                   registry.calls[0].tool_name == "Add" && registry.calls[0].arguments["b"] == 3.0 &&
                   registry.calls[1].arguments["message"] == "hi there" &&
                   registry.calls[2].tool_name == "GetDateTime" &&
                   output.str().find("Please provide two numbers") != std::string::npos &&
                   output.str().find("Unknown command /nope") != std::string::npos;

    if (success) {
        std::cout << "  OK: Slash commands bypass the model" << std::endl;
    } else {
        std::cout << "  FAIL: slash command output was: " << output.str() << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_eviction_keeps_system_message();
    all_passed &= test_no_eviction_under_cap();
    all_passed &= test_drop_last_keeps_system();
    all_passed &= test_exit_command();
    all_passed &= test_system_prompt();
    all_passed &= test_end_to_end_addition();
    all_passed &= test_loop_continues_after_tool_failure();
    all_passed &= test_chat_failure_drops_question();
    all_passed &= test_history_bounded_over_many_turns();
    all_passed &= test_slash_commands();
    return all_passed;
}

} // namespace test_conversation
