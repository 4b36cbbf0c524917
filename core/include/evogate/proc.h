#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace evogate {

struct ProcLimits {
    int timeout_ms{2000};
    size_t output_max_bytes{64 * 1024};    // per stream (stdout, stderr)

    int rlimit_cpu_sec{2};                 // CPU time seconds
    size_t rlimit_as_mb{512};              // virtual memory MB, 0 = not set
    int64_t rlimit_fsize_bytes{10 * 1024 * 1024};  // max file size, -1 = not set
    int rlimit_nofile{64};                 // max open fds
    int rlimit_nproc{32};                  // max processes (best-effort)

    bool no_new_privs{true};

    // seccomp-BPF allowlist (Linux only, requires no_new_privs). When the
    // filter cannot be installed the child exits 126 without running argv.
    bool enable_seccomp{false};
    bool seccomp_allow_network{false};

    // When set, the child gets exactly `env` ("KEY=VALUE") instead of the
    // parent's environment.
    bool clear_env{false};
    std::vector<std::string> env;
};

struct ProcResult {
    int exit_code{127};           // exit status, or 128+signal
    int term_signal{0};           // signal that terminated the child, 0 if exited
    bool timed_out{false};
    bool cancelled{false};        // killed because the cancel flag was raised
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    std::string stdout_text;
    std::string stderr_text;
    std::string error;            // internal runner error, not child stderr

    int64_t wall_ms{0};
    int64_t cpu_ms{0};            // user+sys of the child
    int64_t peak_rss_kb{0};
};

// Raising any of the flags kills the running child. Null entries are ignored.
using CancelFlags = std::vector<const std::atomic<bool>*>;

// Run a process (argv[0] is executable, resolved via PATH), feed stdin_data,
// capture stdout and stderr separately, enforce timeout and rlimits.
// The child runs in its own process group; timeout or cancel kills the group.
// `cancel` flags are polled every few milliseconds. Returns true if the process started.
bool proc_run_capture_sandboxed(const std::vector<std::string>& argv,
                                const std::string& cwd,
                                const std::string& stdin_data,
                                const ProcLimits& lim,
                                ProcResult* res,
                                const CancelFlags& cancel = {});

// Small helper: split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace evogate
