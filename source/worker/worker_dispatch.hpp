#ifndef RPCWORKER_WORKER_DISPATCH_HPP
#define RPCWORKER_WORKER_DISPATCH_HPP

// JSON-RPC dispatch for one input line (one "turn").
// Classifies the decoded message as request or notification, runs the matching
// method and hands every resulting protocol line to the output sink, in order.

#include "protocol/json_rpc.hpp"
#include "worker/worker_methods.hpp"

#include <functional>
#include <string>

namespace worker_dispatch {

// Receives each encoded outbound line (without trailing newline).
using OutputSink = std::function<void(const std::string &line)>;

// Whether the run loop should read another line.
enum class TurnOutcome {
    Continue,
    Shutdown
};

// Notification method that ends the worker.
constexpr const char *SHUTDOWN_METHOD = "shutdown";

// Handle one raw input line.
// - undecodable line: one "Parse error: ..." log notification
// - notification "shutdown": one "Shutting down..." log, returns Shutdown
// - other notification: one "Unknown notification: {method}" log
// - request for unknown method: one -32601 error response
// - request for known method: success response, then "Processed {method}" log
// - request whose handler throws: one -32603 error response
TurnOutcome dispatch_line(const std::string &line,
                          const worker_methods::MethodRegistry &registry,
                          const OutputSink &emit);

// Same as dispatch_line for an already decoded message.
TurnOutcome dispatch_message(const json_rpc::Request &request,
                             const worker_methods::MethodRegistry &registry,
                             const OutputSink &emit);

} // namespace worker_dispatch

#endif // RPCWORKER_WORKER_DISPATCH_HPP
