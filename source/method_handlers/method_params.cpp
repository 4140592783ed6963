#include "method_handlers/method_handlers.hpp"

#include <limits>

namespace method_handlers {

namespace {

// Integers only: floats, strings and booleans are rejected, as are unsigned
// values that do not fit in int64.
bool read_int64(const json &value, int64_t &out) {
    if (!value.is_number_integer()) {
        return false;
    }
    if (value.is_number_unsigned()) {
        uint64_t unsigned_value = value.get<uint64_t>();
        if (unsigned_value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return false;
        }
        out = static_cast<int64_t>(unsigned_value);
        return true;
    }
    out = value.get<int64_t>();
    return true;
}

// Non-negative integers only. nlohmann keeps values built in code as signed
// and parsed non-negative values as unsigned; both are accepted.
bool read_uint64(const json &value, uint64_t &out) {
    if (value.is_number_unsigned()) {
        out = value.get<uint64_t>();
        return true;
    }
    if (value.is_number_integer() && value.get<int64_t>() >= 0) {
        out = static_cast<uint64_t>(value.get<int64_t>());
        return true;
    }
    return false;
}

const json *field(const json &params, const char *name) {
    if (!params.is_object()) {
        return nullptr;
    }
    auto iterator = params.find(name);
    if (iterator == params.end()) {
        return nullptr;
    }
    return &(*iterator);
}

int64_t int64_field_or(const json &params, const char *name, int64_t fallback) {
    const json *value = field(params, name);
    int64_t decoded = fallback;
    if (value == nullptr || !read_int64(*value, decoded)) {
        return fallback;
    }
    return decoded;
}

uint64_t uint64_field_or(const json &params, const char *name, uint64_t fallback) {
    const json *value = field(params, name);
    uint64_t decoded = fallback;
    if (value == nullptr || !read_uint64(*value, decoded)) {
        return fallback;
    }
    return decoded;
}

} // namespace

BinaryOperands decode_binary_operands(const json &params) {
    BinaryOperands operands;
    operands.a = int64_field_or(params, "a", operands.a);
    operands.b = int64_field_or(params, "b", operands.b);
    return operands;
}

FibonacciParams decode_fibonacci_params(const json &params) {
    FibonacciParams decoded;
    decoded.n = uint64_field_or(params, "n", decoded.n);
    return decoded;
}

PrimeParams decode_prime_params(const json &params) {
    PrimeParams decoded;
    decoded.n = uint64_field_or(params, "n", decoded.n);
    return decoded;
}

SumArrayParams decode_sum_array_params(const json &params) {
    SumArrayParams decoded;
    const json *numbers = field(params, "numbers");
    if (numbers == nullptr || !numbers->is_array()) {
        return decoded;
    }
    decoded.numbers.reserve(numbers->size());
    for (const auto &element : *numbers) {
        int64_t value = 0;
        if (read_int64(element, value)) {
            decoded.numbers.push_back(value);
        }
    }
    return decoded;
}

EchoParams decode_echo_params(const json &params) {
    EchoParams decoded;
    const json *message = field(params, "message");
    if (message != nullptr && message->is_string()) {
        decoded.message = message->get<std::string>();
    }
    return decoded;
}

} // namespace method_handlers
