#include "method_handlers/method_handlers.hpp"

// Forward declarations of individual method registration functions.
// Each method_*.cpp defines its own namespace with a register_method() function.

namespace method_add { void register_method(worker_methods::MethodRegistry &registry); }
namespace method_multiply { void register_method(worker_methods::MethodRegistry &registry); }
namespace method_fibonacci { void register_method(worker_methods::MethodRegistry &registry); }
namespace method_is_prime { void register_method(worker_methods::MethodRegistry &registry); }
namespace method_sum_array { void register_method(worker_methods::MethodRegistry &registry); }
namespace method_echo { void register_method(worker_methods::MethodRegistry &registry); }

namespace method_handlers {

worker_methods::MethodRegistry build_default_registry() {
    worker_methods::MethodRegistry registry;
    method_add::register_method(registry);
    method_multiply::register_method(registry);
    method_fibonacci::register_method(registry);
    method_is_prime::register_method(registry);
    method_sum_array::register_method(registry);
    method_echo::register_method(registry);
    return registry;
}

} // namespace method_handlers
