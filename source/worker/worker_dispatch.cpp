#include "worker/worker_dispatch.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <exception>
#include <string>

namespace worker_dispatch {

using json = nlohmann::json;

static TurnOutcome handle_notification(const json_rpc::Request &notification, const OutputSink &emit) {
    if (notification.method == SHUTDOWN_METHOD) {
        debug_log::log("shutdown notification received");
        emit(json_rpc::encode_log("Shutting down..."));
        return TurnOutcome::Shutdown;
    }

    emit(json_rpc::encode_log("Unknown notification: " + notification.method));
    return TurnOutcome::Continue;
}

static void handle_request(const json_rpc::Request &request,
                           const worker_methods::MethodRegistry &registry,
                           const OutputSink &emit) {
    const json &request_id = *request.id;

    const worker_methods::MethodDefinition *method = worker_methods::find_method(registry, request.method);
    if (method == nullptr) {
        debug_log::log("no method named " + request.method);
        emit(json_rpc::encode_error(request_id, json_rpc::METHOD_NOT_FOUND,
                                    "Method not found: " + request.method));
        return;
    }

    json result;
    try {
        result = method->handler(request.params);
    } catch (const std::exception &error) {
        debug_log::log("method " + request.method + " threw: " + error.what());
        emit(json_rpc::encode_error(request_id, json_rpc::INTERNAL_ERROR, error.what()));
        return;
    }

    emit(json_rpc::encode_response(request_id, result));
    emit(json_rpc::encode_log("Processed " + request.method));
}

TurnOutcome dispatch_message(const json_rpc::Request &request,
                             const worker_methods::MethodRegistry &registry,
                             const OutputSink &emit) {
    if (request.is_notification()) {
        return handle_notification(request, emit);
    }

    handle_request(request, registry, emit);
    return TurnOutcome::Continue;
}

TurnOutcome dispatch_line(const std::string &line,
                          const worker_methods::MethodRegistry &registry,
                          const OutputSink &emit) {
    json_rpc::DecodeResult decoded = json_rpc::decode_request(line);
    if (!decoded.success) {
        debug_log::log("dropping undecodable line: " + decoded.error_detail);
        emit(json_rpc::encode_log("Parse error: " + decoded.error_detail));
        return TurnOutcome::Continue;
    }

    return dispatch_message(decoded.request, registry, emit);
}

} // namespace worker_dispatch
