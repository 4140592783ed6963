#include "method_handlers/method_handlers.hpp"
#include "worker/worker_methods.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static json handle_echo(const json &params) {
    return method_handlers::decode_echo_params(params).message;
}

namespace method_echo {

void register_method(worker_methods::MethodRegistry &registry) {
    worker_methods::register_method(registry, {
        "echo",
        "Returns message unchanged. Missing or non-string message gives \"\".",
        handle_echo
    });
}

} // namespace method_echo
