#pragma once

#include <string>
#include <vector>

namespace agency {

struct ProcLimits {
    int timeout_ms{30000};
    size_t stdout_max_bytes{1024 * 1024};
    size_t stderr_max_bytes{64 * 1024};

    int rlimit_cpu_sec{0};          // 0 = inherit
    size_t rlimit_as_mb{0};
    int rlimit_nofile{256};

    bool no_new_privs{true};
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool output_truncated{false};
    std::string out;    // child stdout
    std::string err;    // child stderr
    std::string error;  // runner error, not child stderr
};

// Exit code a child reports when execvp fails.
constexpr int kExecFailedExit = 127;

// Run argv[0] with stdin_data on its stdin. stdout and stderr are captured
// separately; the whole process group is killed on timeout.
// Returns false if the process could not be started (res->error says why).
bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const std::string& stdin_data,
                      const ProcLimits& lim,
                      ProcResult* res);

// Split a command string into argv tokens. Handles single/double quotes and
// backslash escapes inside double quotes. Returns empty on unbalanced quotes.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace agency
