#include "llm/openai_chat_client.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <utility>
#include <vector>

namespace openai_chat {

using json = nlohmann::json;

// State of one POST exchange, shared with the libwebsockets callback through
// the connection's user data.
struct HttpExchange {
    std::string request_body;
    std::string authorization;
    size_t body_sent = 0;
    int http_status = 0;
    std::string response_body;
    bool completed = false;
    bool failed = false;
    std::string error_detail;
};

static const size_t BODY_CHUNK_SIZE = 4096;

static int http_callback(struct lws *connection, enum lws_callback_reasons reason,
                         void *user_data, void *incoming_data, size_t incoming_length) {
    HttpExchange *exchange = static_cast<HttpExchange *>(user_data);

    switch (reason) {
    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR:
        if (exchange != nullptr) {
            exchange->failed = true;
            exchange->error_detail = incoming_data ? static_cast<const char *>(incoming_data) : "connection error";
        }
        break;

    case LWS_CALLBACK_CLIENT_APPEND_HANDSHAKE_HEADER: {
        if (exchange == nullptr) {
            return -1;
        }
        unsigned char **position = static_cast<unsigned char **>(incoming_data);
        unsigned char *end = (*position) + incoming_length;
        static const char content_type[] = "application/json";

        if (lws_add_http_header_by_token(connection, WSI_TOKEN_HTTP_CONTENT_TYPE,
                                         reinterpret_cast<const unsigned char *>(content_type),
                                         static_cast<int>(sizeof(content_type) - 1), position, end)) {
            return -1;
        }
        if (lws_add_http_header_content_length(connection, exchange->request_body.size(), position, end)) {
            return -1;
        }
        if (!exchange->authorization.empty() &&
            lws_add_http_header_by_token(connection, WSI_TOKEN_HTTP_AUTHORIZATION,
                                         reinterpret_cast<const unsigned char *>(exchange->authorization.c_str()),
                                         static_cast<int>(exchange->authorization.size()), position, end)) {
            return -1;
        }

        // The body goes out from the writeable callback.
        lws_client_http_body_pending(connection, 1);
        lws_callback_on_writable(connection);
        break;
    }

    case LWS_CALLBACK_CLIENT_HTTP_WRITEABLE: {
        if (exchange == nullptr) {
            return -1;
        }
        size_t remaining = exchange->request_body.size() - exchange->body_sent;
        size_t chunk_length = std::min(remaining, BODY_CHUNK_SIZE);
        bool final_chunk = (chunk_length == remaining);

        // libwebsockets requires LWS_PRE bytes of padding before the data.
        std::vector<unsigned char> send_buffer(LWS_PRE + chunk_length);
        memcpy(send_buffer.data() + LWS_PRE, exchange->request_body.data() + exchange->body_sent, chunk_length);

        int bytes_written = lws_write(connection, send_buffer.data() + LWS_PRE, chunk_length,
                                      final_chunk ? LWS_WRITE_HTTP_FINAL : LWS_WRITE_HTTP);
        if (bytes_written < 0) {
            exchange->failed = true;
            exchange->error_detail = "failed to send request body";
            return -1;
        }
        exchange->body_sent += chunk_length;

        if (final_chunk) {
            lws_client_http_body_pending(connection, 0);
        } else {
            lws_callback_on_writable(connection);
        }
        break;
    }

    case LWS_CALLBACK_ESTABLISHED_CLIENT_HTTP:
        if (exchange != nullptr) {
            exchange->http_status = static_cast<int>(lws_http_client_http_response(connection));
            debug_log::log("chat endpoint answered HTTP " + std::to_string(exchange->http_status));
        }
        break;

    case LWS_CALLBACK_RECEIVE_CLIENT_HTTP_READ:
        if (exchange != nullptr) {
            exchange->response_body.append(static_cast<const char *>(incoming_data), incoming_length);
        }
        break;

    case LWS_CALLBACK_RECEIVE_CLIENT_HTTP: {
        // Pull the pending body through; data arrives in RECEIVE_CLIENT_HTTP_READ.
        char read_buffer[LWS_PRE + 4096];
        char *read_position = read_buffer + LWS_PRE;
        int read_length = static_cast<int>(sizeof(read_buffer) - LWS_PRE);
        if (lws_http_client_read(connection, &read_position, &read_length) < 0) {
            return -1;
        }
        return 0;
    }

    case LWS_CALLBACK_COMPLETED_CLIENT_HTTP:
        if (exchange != nullptr) {
            exchange->completed = true;
        }
        break;

    case LWS_CALLBACK_CLOSED_CLIENT_HTTP:
        if (exchange != nullptr && !exchange->completed && !exchange->failed) {
            exchange->failed = true;
            exchange->error_detail = "connection closed before the response completed";
        }
        break;

    default:
        break;
    }

    return lws_callback_http_dummy(connection, reason, user_data, incoming_data, incoming_length);
}

static const struct lws_protocols http_protocols[] = {
    {
        "mcplink-chat-http",
        http_callback,
        0, // per-session data size (user data is supplied per connection)
        0  // rx buffer size (default)
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

// Destroys the libwebsockets context on every exit path.
struct ContextGuard {
    struct lws_context *context = nullptr;
    ~ContextGuard() {
        if (context != nullptr) {
            lws_context_destroy(context);
        }
    }
};

EndpointUrl parse_endpoint_url(const std::string &url) {
    EndpointUrl endpoint;

    std::string remainder;
    if (url.rfind("https://", 0) == 0) {
        endpoint.use_tls = true;
        endpoint.port = 443;
        remainder = url.substr(8);
    } else if (url.rfind("http://", 0) == 0) {
        endpoint.port = 80;
        remainder = url.substr(7);
    } else {
        return endpoint;
    }

    // Split host:port from path.
    std::string host_and_port = remainder;
    endpoint.path = "/";
    auto slash_position = remainder.find('/');
    if (slash_position != std::string::npos) {
        host_and_port = remainder.substr(0, slash_position);
        endpoint.path = remainder.substr(slash_position);
    }

    // Split host from port.
    auto colon_position = host_and_port.rfind(':');
    if (colon_position != std::string::npos && host_and_port.find(']') == std::string::npos) {
        std::string port_text = host_and_port.substr(colon_position + 1);
        host_and_port = host_and_port.substr(0, colon_position);
        if (port_text.empty() || !std::all_of(port_text.begin(), port_text.end(),
                                              [](unsigned char character) { return std::isdigit(character) != 0; })) {
            return endpoint;
        }
        endpoint.port = std::stoi(port_text);
        if (endpoint.port <= 0 || endpoint.port > 65535) {
            return endpoint;
        }
    }

    endpoint.host = host_and_port;
    endpoint.valid = !endpoint.host.empty();
    return endpoint;
}

std::string build_request_body(const std::string &model, double temperature,
                               const std::vector<chat_model::ChatMessage> &messages) {
    json request;
    request["model"] = model;
    request["temperature"] = temperature;
    request["stream"] = false;
    request["messages"] = json::array();
    for (const auto &message : messages) {
        request["messages"].push_back({{"role", message.role}, {"content", message.content}});
    }
    return request.dump(-1, ' ', false, json::error_handler_t::replace);
}

chat_model::ChatReply parse_completion_response(int http_status, const std::string &body) {
    chat_model::ChatReply reply;
    json response = json::parse(body, nullptr, false);

    if (http_status < 200 || http_status >= 300) {
        reply.error_detail = "chat endpoint returned HTTP " + std::to_string(http_status);
        if (!response.is_discarded() && response.contains("error") && response["error"].is_object() &&
            response["error"].contains("message") && response["error"]["message"].is_string()) {
            reply.error_detail += ": " + response["error"]["message"].get<std::string>();
        }
        return reply;
    }

    if (response.is_discarded()) {
        reply.error_detail = "chat endpoint returned invalid JSON";
        return reply;
    }
    if (!response.contains("choices") || !response["choices"].is_array() || response["choices"].empty()) {
        reply.error_detail = "chat response has no choices";
        return reply;
    }

    const json &choice = response["choices"][0];
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object() ||
        !choice["message"].contains("content") || !choice["message"]["content"].is_string()) {
        reply.error_detail = "chat response has no text content";
        return reply;
    }

    reply.text = choice["message"]["content"].get<std::string>();
    reply.success = true;
    return reply;
}

OpenAiChatClient::OpenAiChatClient(client_config::ChatConfig config)
    : chat_config(std::move(config)), endpoint(parse_endpoint_url(chat_config.endpoint)) {}

std::string OpenAiChatClient::name() const {
    return chat_config.model + " @ " + chat_config.endpoint;
}

chat_model::ChatReply OpenAiChatClient::complete_chat(const std::vector<chat_model::ChatMessage> &messages) {
    chat_model::ChatReply reply;

    if (!endpoint.valid) {
        reply.error_detail = "invalid chat endpoint URL: " + chat_config.endpoint;
        return reply;
    }

    HttpExchange exchange;
    exchange.request_body = build_request_body(chat_config.model, chat_config.temperature, messages);
    if (!chat_config.api_key.empty()) {
        exchange.authorization = "Bearer " + chat_config.api_key;
    }

    lws_set_log_level(debug_log::is_debug_enabled() ? (LLL_ERR | LLL_WARN | LLL_NOTICE) : LLL_ERR, nullptr);

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN; // Client mode, no listening.
    context_info.protocols = http_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.options = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;

    ContextGuard guard;
    guard.context = lws_create_context(&context_info);
    if (guard.context == nullptr) {
        reply.error_detail = "failed to create libwebsockets context";
        return reply;
    }

    struct lws_client_connect_info connect_info;
    memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = guard.context;
    connect_info.address = endpoint.host.c_str();
    connect_info.port = endpoint.port;
    connect_info.path = endpoint.path.c_str();
    connect_info.host = endpoint.host.c_str();
    connect_info.origin = endpoint.host.c_str();
    connect_info.method = "POST";
    connect_info.alpn = "http/1.1";
    connect_info.protocol = http_protocols[0].name;
    connect_info.ssl_connection = endpoint.use_tls ? LCCSCF_USE_SSL : 0;
    connect_info.userdata = &exchange;

    debug_log::log("POST " + chat_config.endpoint + " (" + std::to_string(messages.size()) + " messages)");
    if (lws_client_connect_via_info(&connect_info) == nullptr) {
        reply.error_detail = "failed to start connection to " + endpoint.host;
        return reply;
    }

    auto start_time = std::chrono::steady_clock::now();
    while (!exchange.completed && !exchange.failed) {
        if (lws_service(guard.context, 50) < 0) {
            exchange.failed = true;
            exchange.error_detail = "libwebsockets service loop failed";
            break;
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >
            chat_config.request_timeout_milliseconds) {
            exchange.failed = true;
            exchange.error_detail = "timed out after " + std::to_string(chat_config.request_timeout_milliseconds) +
                                    " ms waiting for the chat endpoint";
        }
    }

    if (exchange.failed) {
        reply.error_detail = "chat request failed: " + exchange.error_detail;
        return reply;
    }

    return parse_completion_response(exchange.http_status, exchange.response_body);
}

} // namespace openai_chat
