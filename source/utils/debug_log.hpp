#ifndef RPCWORKER_DEBUG_LOG_HPP
#define RPCWORKER_DEBUG_LOG_HPP

// Developer diagnostics for the worker. Always written to stderr:
// stdout carries protocol frames only.

#include <string>

namespace debug_log {

// Name of the environment variable that turns diagnostics on.
constexpr const char *DEBUG_ENV_VAR = "RPCWORKER_DEBUG";

// Returns true for "1", "true" or "yes" (case-insensitive).
bool is_truthy(const char *value);

// Returns true if RPCWORKER_DEBUG is set to a truthy value.
bool is_debug_enabled();

// Writes message to stderr with [rpcworker] prefix only when is_debug_enabled().
void log(const std::string &message);

} // namespace debug_log

#endif // RPCWORKER_DEBUG_LOG_HPP
