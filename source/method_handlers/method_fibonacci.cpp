#include "method_handlers/method_handlers.hpp"
#include "worker/worker_methods.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace method_handlers {

// Deliberately exponential: callers use this as a CPU-bound workload.
uint64_t fibonacci(uint64_t n) {
    if (n < 2) {
        return n;
    }
    return fibonacci(n - 1) + fibonacci(n - 2);
}

} // namespace method_handlers

static json handle_fibonacci(const json &params) {
    method_handlers::FibonacciParams decoded = method_handlers::decode_fibonacci_params(params);
    debug_log::log("fibonacci invoked n=" + std::to_string(decoded.n));
    return method_handlers::fibonacci(decoded.n);
}

namespace method_fibonacci {

void register_method(worker_methods::MethodRegistry &registry) {
    worker_methods::register_method(registry, {
        "fibonacci",
        "nth Fibonacci number by naive recursion. Missing or negative n counts as 0.",
        handle_fibonacci
    });
}

} // namespace method_fibonacci
