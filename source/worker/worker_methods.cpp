#include "worker/worker_methods.hpp"

namespace worker_methods {

void register_method(MethodRegistry &registry, const MethodDefinition &definition) {
    for (auto &existing : registry.methods) {
        if (existing.name == definition.name) {
            existing = definition;
            return;
        }
    }
    registry.methods.push_back(definition);
}

const MethodDefinition *find_method(const MethodRegistry &registry, const std::string &name) {
    for (const auto &method : registry.methods) {
        if (method.name == name) {
            return &method;
        }
    }
    return nullptr;
}

bool has_method(const MethodRegistry &registry, const std::string &name) {
    return find_method(registry, name) != nullptr;
}

std::vector<std::string> method_names(const MethodRegistry &registry) {
    std::vector<std::string> names;
    names.reserve(registry.methods.size());
    for (const auto &method : registry.methods) {
        names.push_back(method.name);
    }
    return names;
}

} // namespace worker_methods
