#ifndef RPCWORKER_WORKER_STDIO_HPP
#define RPCWORKER_WORKER_STDIO_HPP

// Line-delimited stdio transport and the worker's main loop.
// One JSON-RPC message per line in each direction; every written line is flushed.

#include "worker/worker_methods.hpp"

#include <iosfwd>
#include <string>

namespace worker_stdio {

// Text of the log notification written before any input is read.
constexpr const char *STARTUP_MESSAGE = "Worker started";

// Read the next line, without its "\n" (or "\r\n").
// Returns false at end of input or on a stream error.
bool read_line(std::istream &input, std::string &line);

// Write one message followed by "\n" and flush.
void write_message(std::ostream &output, const std::string &json_string);

// Announce startup, then dispatch lines until end of input, a read error,
// or a "shutdown" notification. No line is read after shutdown.
// Returns the process exit status (always 0: every stop condition is orderly).
int run(std::istream &input, std::ostream &output, const worker_methods::MethodRegistry &registry);

} // namespace worker_stdio

#endif // RPCWORKER_WORKER_STDIO_HPP
