// rpcworker – line-delimited JSON-RPC 2.0 worker process.
// Entry point: stdio worker loop.
//
// Reads one JSON-RPC message per line from stdin, dispatches it, writes responses
// and "log" notifications to stdout. Diagnostics go to stderr (RPCWORKER_DEBUG=1).

#include <iostream>

#include "method_handlers/method_handlers.hpp"
#include "worker/worker_stdio.hpp"
#include "utils/debug_log.hpp"

int main() {
    debug_log::log("rpcworker starting");

    const worker_methods::MethodRegistry registry = method_handlers::build_default_registry();

    return worker_stdio::run(std::cin, std::cout, registry);
}
