#ifndef MCPLINK_JSON_RPC_HPP
#define MCPLINK_JSON_RPC_HPP

// JSON-RPC 2.0 helpers for MCP protocol communication, shared by the
// server (responses) and the client (requests, notifications, response matching).
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Build a JSON-RPC 2.0 error response with additional data.
json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data);

// Build a JSON-RPC 2.0 request. params is omitted when null.
json build_request(const json &request_id, const std::string &method, const json &params);

// Build a JSON-RPC 2.0 notification (a request without id).
json build_notification(const std::string &method, const json &params);

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Extract method name from a JSON-RPC request/notification. Returns empty if missing.
std::string get_method(const json &message);

// Extract the id from a JSON-RPC message. Returns nullptr json if missing (notification).
json get_id(const json &message);

// Extract params from a JSON-RPC message. Returns empty object if missing.
json get_params(const json &message);

// Read a string member. Returns fallback when the key is missing or not a string.
std::string get_string(const json &object, const std::string &key, const std::string &fallback = "");

// Read an integer member. Returns fallback when the key is missing or not an integer.
int get_integer(const json &object, const std::string &key, int fallback = 0);

// Check if a message is a notification (no id field).
bool is_notification(const json &message);

// Check if a message is a response (has id and either result or error, no method).
bool is_response(const json &message);

// Serialize a message for the wire. Invalid UTF-8 in strings is replaced with U+FFFD
// instead of throwing, since text may come straight from a terminal or a model.
std::string serialize(const json &message);

} // namespace json_rpc

#endif // MCPLINK_JSON_RPC_HPP
