#include "method_handlers/method_handlers.hpp"
#include "worker/worker_methods.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace method_handlers {

bool is_prime(uint64_t n) {
    if (n < 2) {
        return false;
    }
    if (n == 2) {
        return true;
    }
    if (n % 2 == 0) {
        return false;
    }
    // divisor <= n / divisor is divisor * divisor <= n without overflow.
    for (uint64_t divisor = 3; divisor <= n / divisor; divisor += 2) {
        if (n % divisor == 0) {
            return false;
        }
    }
    return true;
}

} // namespace method_handlers

static json handle_is_prime(const json &params) {
    return method_handlers::is_prime(method_handlers::decode_prime_params(params).n);
}

namespace method_is_prime {

void register_method(worker_methods::MethodRegistry &registry) {
    worker_methods::register_method(registry, {
        "is_prime",
        "Primality of n by odd trial division. Missing or negative n counts as 0.",
        handle_is_prime
    });
}

} // namespace method_is_prime
