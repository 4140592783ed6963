#include "protocol/json_rpc.hpp"
#include "utils/utf8_sanitize.hpp"

namespace json_rpc {

DecodeResult decode_request(const std::string &line) {
    DecodeResult decoded;

    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error &error) {
        decoded.error_detail = error.what();
        return decoded;
    }

    if (!message.is_object()) {
        decoded.error_detail = "expected a JSON object, got " + std::string(message.type_name());
        return decoded;
    }

    if (!message.contains("method") || !message["method"].is_string()) {
        decoded.error_detail = "missing string field 'method'";
        return decoded;
    }

    // Version is informational only; any value (or none) is accepted.
    if (message.contains("jsonrpc") && message["jsonrpc"].is_string()) {
        decoded.request.jsonrpc = message["jsonrpc"].get<std::string>();
    }

    decoded.request.method = get_method(message);
    decoded.request.params = get_params(message);
    if (!is_notification(message)) {
        decoded.request.id = get_id(message);
    }

    decoded.success = true;
    return decoded;
}

ResponseDecodeResult decode_response(const std::string &line) {
    ResponseDecodeResult decoded;

    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error &error) {
        decoded.error_detail = error.what();
        return decoded;
    }

    if (!message.is_object() || !message.contains("id")) {
        decoded.error_detail = "response must be an object with an 'id' field";
        return decoded;
    }
    decoded.response.id = message["id"];

    if (message.contains("result")) {
        decoded.response.result = message["result"];
        decoded.success = true;
        return decoded;
    }

    if (message.contains("error") && message["error"].is_object()) {
        const json &error_object = message["error"];
        if (!error_object.contains("code") || !error_object["code"].is_number_integer()) {
            decoded.error_detail = "error object is missing an integer 'code'";
            return decoded;
        }
        decoded.response.error_code = error_object["code"].get<int>();
        if (error_object.contains("message") && error_object["message"].is_string()) {
            decoded.response.error_message = error_object["message"].get<std::string>();
        }
        decoded.success = true;
        return decoded;
    }

    decoded.error_detail = "response carries neither 'result' nor 'error'";
    return decoded;
}

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

json build_notification(const std::string &method, const json &params) {
    json notification;
    notification["jsonrpc"] = JSONRPC_VERSION;
    notification["method"] = method;
    notification["params"] = params;
    return notification;
}

std::string encode_response(const json &request_id, const json &result_payload) {
    return build_response(request_id, result_payload).dump();
}

std::string encode_error(const json &request_id, int error_code, const std::string &error_message) {
    return build_error_response(request_id, error_code, error_message).dump();
}

std::string encode_notification(const std::string &method, const json &params) {
    return build_notification(method, params).dump();
}

std::string encode_log(const std::string &text) {
    json params;
    params["message"] = utf8_sanitize::sanitize(text);
    return encode_notification("log", params);
}

std::string get_method(const json &message) {
    if (message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    if (message.contains("id")) {
        return message["id"];
    }
    return nullptr;
}

json get_params(const json &message) {
    if (message.contains("params")) {
        return message["params"];
    }
    return nullptr;
}

bool is_notification(const json &message) {
    return !message.contains("id") || message["id"].is_null();
}

} // namespace json_rpc
