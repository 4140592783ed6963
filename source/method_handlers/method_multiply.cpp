#include "method_handlers/method_handlers.hpp"
#include "worker/worker_methods.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace method_handlers {

int64_t multiply(const BinaryOperands &operands) {
    return static_cast<int64_t>(static_cast<uint64_t>(operands.a) * static_cast<uint64_t>(operands.b));
}

} // namespace method_handlers

static json handle_multiply(const json &params) {
    return method_handlers::multiply(method_handlers::decode_binary_operands(params));
}

namespace method_multiply {

void register_method(worker_methods::MethodRegistry &registry) {
    worker_methods::register_method(registry, {
        "multiply",
        "Product of integers a and b. Missing or non-integer operands count as 0.",
        handle_multiply
    });
}

} // namespace method_multiply
