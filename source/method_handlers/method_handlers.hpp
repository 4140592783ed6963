#ifndef RPCWORKER_METHOD_HANDLERS_HPP
#define RPCWORKER_METHOD_HANDLERS_HPP

// Built-in worker methods: typed parameter decoding, the pure computations,
// and construction of the default registry.
//
// Every decode_* function is total: a field that is missing or has the wrong
// JSON type keeps the default written in the struct below. Params that are not
// an object (null, array, scalar) decode to all defaults.

#include "worker/worker_methods.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace method_handlers {

using json = nlohmann::json;

// add / multiply: {"a": int, "b": int}
struct BinaryOperands {
    int64_t a = 0;
    int64_t b = 0;
};

// fibonacci: {"n": non-negative int}
struct FibonacciParams {
    uint64_t n = 0;
};

// is_prime: {"n": non-negative int}
struct PrimeParams {
    uint64_t n = 0;
};

// sum_array: {"numbers": [int, ...]}; non-integer elements are dropped while decoding.
struct SumArrayParams {
    std::vector<int64_t> numbers;
};

// echo: {"message": string}
struct EchoParams {
    std::string message;
};

BinaryOperands decode_binary_operands(const json &params);
FibonacciParams decode_fibonacci_params(const json &params);
PrimeParams decode_prime_params(const json &params);
SumArrayParams decode_sum_array_params(const json &params);
EchoParams decode_echo_params(const json &params);

// Signed arithmetic wraps on overflow.
int64_t add(const BinaryOperands &operands);
int64_t multiply(const BinaryOperands &operands);

// Naive recursive definition: fibonacci(0) = 0, fibonacci(1) = 1.
uint64_t fibonacci(uint64_t n);

// Trial division by odd divisors up to floor(sqrt(n)).
bool is_prime(uint64_t n);

int64_t sum_array(const SumArrayParams &params);

// Build the registry with every built-in method: add, multiply, fibonacci,
// is_prime, sum_array, echo.
worker_methods::MethodRegistry build_default_registry();

} // namespace method_handlers

#endif // RPCWORKER_METHOD_HANDLERS_HPP
