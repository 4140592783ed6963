// Process E2E test: spawns the real rpcworker binary with stdin/stdout redirected
// to files, then checks the transcript and the exit status.
//
// Build separately: cmake --build build --target rpcworker_e2e_test
// Run: ./build/rpcworker_e2e_test <path-to-rpcworker>
// (CTest passes the path automatically.)

#include <nlohmann/json.hpp>

#include <fcntl.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;

extern char **environ;

struct WorkerRun {
    bool success = false;
    int exit_status = -1;
    std::vector<std::string> lines;
    std::string error_message;
};

// Run the worker with input_text on stdin; stdout is captured to a temp file.
static WorkerRun run_worker_process(const std::string &executable_path, const std::string &input_text) {
    WorkerRun run;

    std::string input_path = "/tmp/rpcworker_e2e_in_" + std::to_string(getpid());
    std::string output_path = "/tmp/rpcworker_e2e_out_" + std::to_string(getpid());
    {
        std::ofstream input_file(input_path, std::ios::binary);
        input_file << input_text;
    }

    posix_spawn_file_actions_t file_actions;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, input_path.c_str(), O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&file_actions, STDOUT_FILENO, output_path.c_str(),
                                     O_WRONLY | O_CREAT | O_TRUNC, 0600);

    std::string argv0 = executable_path;
    char *argv[] = {argv0.data(), nullptr};

    pid_t child_pid = 0;
    int spawn_status = posix_spawn(&child_pid, executable_path.c_str(), &file_actions, nullptr, argv, environ);
    posix_spawn_file_actions_destroy(&file_actions);

    if (spawn_status != 0) {
        run.error_message = "posix_spawn failed: " + std::string(strerror(spawn_status));
        std::remove(input_path.c_str());
        return run;
    }

    int wait_status = 0;
    if (waitpid(child_pid, &wait_status, 0) != child_pid) {
        run.error_message = "waitpid failed: " + std::string(strerror(errno));
    } else if (WIFEXITED(wait_status)) {
        run.exit_status = WEXITSTATUS(wait_status);
        run.success = true;
    } else {
        run.error_message = "worker did not exit normally";
    }

    std::ifstream output_file(output_path);
    std::string line;
    while (std::getline(output_file, line)) {
        run.lines.push_back(line);
    }

    std::remove(input_path.c_str());
    std::remove(output_path.c_str());
    return run;
}

static std::string log_text(const std::string &line) {
    json message = json::parse(line, nullptr, false);
    if (message.is_discarded() || message.value("method", "") != "log") {
        return "";
    }
    return message["params"].value("message", "");
}

// Test: Full session ending in shutdown; input after shutdown is never answered.
static bool test_session_with_shutdown(const std::string &executable_path) {
    WorkerRun run = run_worker_process(executable_path,
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"fibonacci\",\"params\":{\"n\":20}}\n"
        "not json at all\n"
        "{\"jsonrpc\":\"2.0\",\"id\":\"x\",\"method\":\"greet\"}\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"shutdown\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"add\",\"params\":{\"a\":1,\"b\":1}}\n");

    if (!run.success) {
        std::cout << "  FAIL: " << run.error_message << std::endl;
        return false;
    }

    bool success = run.exit_status == 0 && run.lines.size() == 6;
    if (success) {
        json fibonacci_response = json::parse(run.lines[1]);
        json method_error = json::parse(run.lines[4]);
        success = log_text(run.lines[0]) == "Worker started" &&
                  fibonacci_response["id"] == 1 && fibonacci_response["result"] == 6765 &&
                  log_text(run.lines[2]) == "Processed fibonacci" &&
                  log_text(run.lines[3]).rfind("Parse error: ", 0) == 0 &&
                  method_error["id"] == "x" && method_error["error"]["code"] == -32601 &&
                  log_text(run.lines[5]) == "Shutting down...";
    }

    if (success) {
        std::cout << "  OK: Session transcript and exit status are correct" << std::endl;
    } else {
        std::cout << "  FAIL: Unexpected transcript (" << run.lines.size() << " lines, exit "
                  << run.exit_status << ")" << std::endl;
        for (const auto &line : run.lines) {
            std::cout << "    " << line << std::endl;
        }
    }
    return success;
}

// Test: End of input exits with status 0 after the startup log only.
static bool test_exit_on_end_of_input(const std::string &executable_path) {
    WorkerRun run = run_worker_process(executable_path, "");

    bool success = run.success && run.exit_status == 0 && run.lines.size() == 1 &&
                   log_text(run.lines[0]) == "Worker started";

    if (success) {
        std::cout << "  OK: Worker exits cleanly at end of input" << std::endl;
    } else {
        std::cout << "  FAIL: End of input handling: " << run.error_message << std::endl;
    }
    return success;
}

int main(int argc, char **argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <path-to-rpcworker>" << std::endl;
        return 2;
    }
    std::string executable_path = argv[1];

    std::cout << "=== rpcworker process E2E ===" << std::endl;

    bool all_passed = true;
    all_passed &= test_session_with_shutdown(executable_path);
    all_passed &= test_exit_on_end_of_input(executable_path);

    std::cout << (all_passed ? "  PASSED" : "  FAILED") << std::endl;
    return all_passed ? 0 : 1;
}
