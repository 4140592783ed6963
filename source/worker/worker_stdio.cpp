#include "worker/worker_stdio.hpp"
#include "worker/worker_dispatch.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <istream>
#include <ostream>
#include <string>

namespace worker_stdio {

bool read_line(std::istream &input, std::string &line) {
    if (!std::getline(input, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

void write_message(std::ostream &output, const std::string &json_string) {
    output << json_string << "\n";
    output.flush();
}

int run(std::istream &input, std::ostream &output, const worker_methods::MethodRegistry &registry) {
    write_message(output, json_rpc::encode_log(STARTUP_MESSAGE));

    auto emit = [&output](const std::string &line) { write_message(output, line); };

    std::string line;
    while (read_line(input, line)) {
        debug_log::log("received: " + line);

        worker_dispatch::TurnOutcome outcome = worker_dispatch::dispatch_line(line, registry, emit);
        if (outcome == worker_dispatch::TurnOutcome::Shutdown) {
            debug_log::log("shutdown requested, leaving loop");
            return 0;
        }
    }

    if (input.bad()) {
        debug_log::log("read error on input, stopping");
    } else {
        debug_log::log("end of input, stopping");
    }
    return 0;
}

} // namespace worker_stdio
