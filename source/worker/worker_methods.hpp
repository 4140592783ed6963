#ifndef RPCWORKER_WORKER_METHODS_HPP
#define RPCWORKER_WORKER_METHODS_HPP

// Method registry: the table of request methods the worker answers.
// Built once at startup, then only read (passed by const reference to the dispatcher).

#include <nlohmann/json.hpp>
#include <string>
#include <functional>
#include <vector>

namespace worker_methods {

using json = nlohmann::json;

// A method handler: receives the request params (any JSON value, possibly null)
// and returns the result value. Handlers default malformed input instead of failing.
using MethodHandler = std::function<json(const json &params)>;

// One registered method.
struct MethodDefinition {
    std::string name;
    std::string description;
    MethodHandler handler;
};

struct MethodRegistry {
    std::vector<MethodDefinition> methods;
};

// Add a method. A later definition with the same name replaces the earlier one.
void register_method(MethodRegistry &registry, const MethodDefinition &definition);

// Look up a method by exact name. Returns nullptr if not registered.
const MethodDefinition *find_method(const MethodRegistry &registry, const std::string &name);

bool has_method(const MethodRegistry &registry, const std::string &name);

// Registered names in registration order.
std::vector<std::string> method_names(const MethodRegistry &registry);

} // namespace worker_methods

#endif // RPCWORKER_WORKER_METHODS_HPP
