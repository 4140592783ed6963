#ifndef RPCWORKER_JSON_RPC_HPP
#define RPCWORKER_JSON_RPC_HPP

// JSON-RPC 2.0 message codec for the line-delimited worker protocol.
// Uses nlohmann/json for parsing and serialization.
// Every encoded message is a single line of compact JSON (no trailing newline).

#include <nlohmann/json.hpp>
#include <string>
#include <optional>

namespace json_rpc {

using json = nlohmann::json;

// Protocol version written on every outbound message.
constexpr const char *JSONRPC_VERSION = "2.0";

// JSON-RPC error codes the worker sends.
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INTERNAL_ERROR = -32603;

// An inbound request or notification.
// id is empty for notifications; params is null when the sender omitted it.
struct Request {
    std::string jsonrpc; // informational only: whatever the sender wrote, never validated
    std::optional<json> id;
    std::string method;
    json params;

    bool is_notification() const { return !id.has_value(); }
};

// Result of decoding one inbound line.
struct DecodeResult {
    bool success = false;
    Request request;
    std::string error_detail;
};

// An outbound response as read back by the orchestrator side.
struct Response {
    json id;
    std::optional<json> result;
    std::optional<int> error_code;
    std::string error_message;

    bool is_error() const { return error_code.has_value(); }
};

// Result of decoding one response line.
struct ResponseDecodeResult {
    bool success = false;
    Response response;
    std::string error_detail;
};

// Decode one line as a request or notification. Requires a string "method".
// The inbound "jsonrpc" field is copied but never checked. Never throws.
DecodeResult decode_request(const std::string &line);

// Decode one line as a success or error response. Never throws.
ResponseDecodeResult decode_response(const std::string &line);

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Build a JSON-RPC 2.0 notification (never carries an id).
json build_notification(const std::string &method, const json &params);

// Single-line encoders for the shapes above.
std::string encode_response(const json &request_id, const json &result_payload);
std::string encode_error(const json &request_id, int error_code, const std::string &error_message);
std::string encode_notification(const std::string &method, const json &params);

// Encode a "log" notification carrying {"message": text}.
// Invalid UTF-8 in text is replaced with U+FFFD.
std::string encode_log(const std::string &text);

// Extract method name from a JSON-RPC request/notification. Returns empty if missing.
std::string get_method(const json &message);

// Extract the id from a JSON-RPC message. Returns nullptr json if missing (notification).
json get_id(const json &message);

// Extract params from a JSON-RPC message. Returns null if missing.
json get_params(const json &message);

// Check if a message is a notification (no id field, or an explicit null id).
bool is_notification(const json &message);

} // namespace json_rpc

#endif // RPCWORKER_JSON_RPC_HPP
