#include "method_handlers/method_handlers.hpp"
#include "worker/worker_methods.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace method_handlers {

int64_t sum_array(const SumArrayParams &params) {
    uint64_t total = 0;
    for (int64_t value : params.numbers) {
        total += static_cast<uint64_t>(value);
    }
    return static_cast<int64_t>(total);
}

} // namespace method_handlers

static json handle_sum_array(const json &params) {
    return method_handlers::sum_array(method_handlers::decode_sum_array_params(params));
}

namespace method_sum_array {

void register_method(worker_methods::MethodRegistry &registry) {
    worker_methods::register_method(registry, {
        "sum_array",
        "Sum of the integer elements of numbers; other elements are skipped.",
        handle_sum_array
    });
}

} // namespace method_sum_array
