// Tests for the chat model implementations: the OpenAI-compatible request and
// response handling (no network), and the simulated model's replies.

#include "llm/openai_chat_client.hpp"
#include "llm/simulated_chat_model.hpp"
#include "llm/tool_call_parser.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace test_chat_models {

// Test: Endpoint URLs split into scheme, host, port and path.
static bool test_parse_endpoint_url() {
    openai_chat::EndpointUrl remote = openai_chat::parse_endpoint_url("https://api.openai.com/v1/chat/completions");
    openai_chat::EndpointUrl local = openai_chat::parse_endpoint_url("http://localhost:11434/v1/chat/completions");
    openai_chat::EndpointUrl bare = openai_chat::parse_endpoint_url("http://example.test");
    openai_chat::EndpointUrl bad_scheme = openai_chat::parse_endpoint_url("ftp://example.test/");
    openai_chat::EndpointUrl bad_port = openai_chat::parse_endpoint_url("http://example.test:http/");

    bool success = remote.valid && remote.use_tls && remote.host == "api.openai.com" && remote.port == 443 &&
                   remote.path == "/v1/chat/completions" &&
                   local.valid && !local.use_tls && local.host == "localhost" && local.port == 11434 &&
                   bare.valid && bare.port == 80 && bare.path == "/" &&
                   !bad_scheme.valid && !bad_port.valid;

    if (success) {
        std::cout << "  OK: Endpoint URLs are parsed" << std::endl;
    } else {
        std::cout << "  FAIL: endpoint URL parsing" << std::endl;
    }
    return success;
}

// Test: Request body carries model, temperature and messages in order.
static bool test_build_request_body() {
    std::vector<chat_model::ChatMessage> messages = {
        {"system", "You are helpful."},
        {"user", "What is 42 plus 17?"},
    };
    json body = json::parse(openai_chat::build_request_body("gpt-4o-mini", 0.2, messages));

    bool success = body["model"] == "gpt-4o-mini" && body["temperature"] == 0.2 && body["stream"] == false &&
                   body["messages"].size() == 2 && body["messages"][0]["role"] == "system" &&
                   body["messages"][1]["content"] == "What is 42 plus 17?";

    if (success) {
        std::cout << "  OK: Chat request body is well formed" << std::endl;
    } else {
        std::cout << "  FAIL: request body was: " << body.dump() << std::endl;
    }
    return success;
}

// Test: The reply text comes from choices[0].message.content.
static bool test_parse_completion_success() {
    std::string body = R"({"id":"x","choices":[{"index":0,"message":{"role":"assistant",)"
                       R"("content":"Sure. [TOOL_CALL:Add(a=42, b=17)]"},"finish_reason":"stop"}]})";
    chat_model::ChatReply reply = openai_chat::parse_completion_response(200, body);

    bool success = reply.success && reply.text == "Sure. [TOOL_CALL:Add(a=42, b=17)]";
    if (success) {
        std::cout << "  OK: Completion content is extracted" << std::endl;
    } else {
        std::cout << "  FAIL: completion parse: " << reply.error_detail << std::endl;
    }
    return success;
}

// Test: HTTP errors, invalid JSON and empty choices are failures with a reason.
static bool test_parse_completion_failures() {
    chat_model::ChatReply unauthorized =
        openai_chat::parse_completion_response(401, R"({"error":{"message":"Incorrect API key provided"}})");
    chat_model::ChatReply garbage = openai_chat::parse_completion_response(200, "<html>oops</html>");
    chat_model::ChatReply no_choices = openai_chat::parse_completion_response(200, R"({"choices":[]})");
    chat_model::ChatReply null_content =
        openai_chat::parse_completion_response(200, R"({"choices":[{"message":{"content":null}}]})");

    bool success = !unauthorized.success &&
                   unauthorized.error_detail == "chat endpoint returned HTTP 401: Incorrect API key provided" &&
                   !garbage.success && !no_choices.success && !null_content.success;

    if (success) {
        std::cout << "  OK: Completion failures are reported" << std::endl;
    } else {
        std::cout << "  FAIL: completion failure handling: " << unauthorized.error_detail << std::endl;
    }
    return success;
}

// Test: An unusable endpoint fails the request instead of connecting.
static bool test_invalid_endpoint_reply() {
    client_config::ChatConfig config;
    config.endpoint = "not a url";
    openai_chat::OpenAiChatClient client(config);
    chat_model::ChatReply reply = client.complete_chat({{"user", "hi"}});

    bool success = !reply.success && reply.error_detail.find("invalid chat endpoint URL") != std::string::npos;
    if (success) {
        std::cout << "  OK: Invalid endpoint URL is reported" << std::endl;
    } else {
        std::cout << "  FAIL: invalid endpoint reply: " << reply.error_detail << std::endl;
    }
    return success;
}

// Test: The simulated model answers addition questions with an Add marker.
static bool test_simulated_addition() {
    auto call = tool_call_parser::extract_tool_call(simulated_chat::reply_for("What is 42 plus 17?"));
    bool success = call.has_value() && call->tool_name == "Add" && call->arguments["a"] == 42.0 &&
                   call->arguments["b"] == 17.0;

    std::string needs_two = simulated_chat::reply_for("add 5");
    success = success && !tool_call_parser::extract_tool_call(needs_two).has_value();

    if (success) {
        std::cout << "  OK: Simulated model calls Add(a=42, b=17)" << std::endl;
    } else {
        std::cout << "  FAIL: simulated addition reply" << std::endl;
    }
    return success;
}

// Test: Time and greeting keywords map to GetDateTime and Echo.
static bool test_simulated_other_tools() {
    auto time_call = tool_call_parser::extract_tool_call(simulated_chat::reply_for("What time is it?"));
    auto greeting_call = tool_call_parser::extract_tool_call(simulated_chat::reply_for("Hello there"));
    auto no_call = tool_call_parser::extract_tool_call(simulated_chat::reply_for("Tell me a story"));

    bool success = time_call && time_call->tool_name == "GetDateTime" && time_call->arguments.empty() &&
                   greeting_call && greeting_call->tool_name == "Echo" &&
                   greeting_call->arguments["message"] == "friendly greeting" && !no_call;

    if (success) {
        std::cout << "  OK: Simulated model picks GetDateTime and Echo" << std::endl;
    } else {
        std::cout << "  FAIL: simulated keyword replies" << std::endl;
    }
    return success;
}

// Test: The simulated model answers the latest user message, ignoring tool feedback order.
static bool test_simulated_uses_last_user_message() {
    simulated_chat::SimulatedChatModel model;
    std::vector<chat_model::ChatMessage> messages = {
        {"system", "tools..."},
        {"user", "what time is it"},
        {"assistant", "[TOOL_CALL:GetDateTime()]"},
        {"user", "now add 2 and 3"},
    };
    chat_model::ChatReply reply = model.complete_chat(messages);
    chat_model::ChatReply empty = model.complete_chat({{"system", "tools..."}});

    bool success = reply.success && reply.text.find("[TOOL_CALL:Add(a=2, b=3)]") != std::string::npos &&
                   !empty.success;
    if (success) {
        std::cout << "  OK: Simulated model answers the latest user message" << std::endl;
    } else {
        std::cout << "  FAIL: simulated reply was: " << reply.text << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_parse_endpoint_url();
    all_passed &= test_build_request_body();
    all_passed &= test_parse_completion_success();
    all_passed &= test_parse_completion_failures();
    all_passed &= test_invalid_endpoint_reply();
    all_passed &= test_simulated_addition();
    all_passed &= test_simulated_other_tools();
    all_passed &= test_simulated_uses_last_user_message();
    return all_passed;
}

} // namespace test_chat_models
