#pragma once

#include "harness.h"
#include "proc.h"
#include "types.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace evogate {

// One interpreter run inside a sandbox instance.
struct RawRunResult {
    bool started{false};            // false: the environment could not run code at all
    bool timed_out{false};
    bool cancelled{false};
    bool resource_exceeded{false};  // SIGXCPU / SIGXFSZ / foreign SIGKILL / MemoryError / exit 137
    int exit_code{-1};
    int term_signal{0};
    HarnessOutcome outcome;
    std::string stdout_text;        // candidate output, marker removed
    std::string stderr_text;
    int64_t wall_ms{0};
    int64_t cpu_ms{0};
    int64_t peak_rss_kb{0};
    std::string error;
};

struct BackendOptions {
    std::vector<std::string> python_argv{"python3"};
    std::string docker_bin{"docker"};
    std::string container_image{"python:3.12-slim"};
    std::filesystem::path work_root;    // empty = <tmp>/evogate
    bool seccomp{false};                // filter on every level; network-denied levels always get it
    int pids_limit{32};
};

// Isolated execution environment factory.
//
// create() returns an instance id that stays valid until destroy(). run() may
// be called concurrently for different instances. destroy() of an unknown or
// already destroyed id is a no-op returning success.
class ISandboxBackend {
public:
    virtual ~ISandboxBackend() = default;

    virtual BackendKind kind() const = 0;
    virtual const char* name() const = 0;

    // True when a killed run leaves the instance usable for the next test.
    virtual bool supports_test_isolation() const = 0;

    // Returns empty string on success.
    virtual std::string create(const SandboxConfig& cfg, std::string* instance_id) = 0;

    // test == nullptr: load the module only.
    // `cancel` flags are polled while the interpreter runs; raising one kills the run.
    virtual RawRunResult run(const std::string& instance_id,
                             const std::string& code,
                             const TestCase* test,
                             int timeout_ms,
                             const CancelFlags& cancel) = 0;

    // Returns empty string on success.
    virtual std::string destroy(const std::string& instance_id) = 0;
};

// Fixed isolation table (memory, cpu share, wall clock, file ops, fs, network).
SandboxConfig sandbox_config_for(IsolationLevel level, BackendKind backend);

// Enum switch; never returns nullptr.
std::unique_ptr<ISandboxBackend> make_backend(BackendKind kind, const BackendOptions& opts);

// Ephemeral handle for one created environment. Owned by the executor that
// created it; the pool watchdog may destroy it concurrently, so the state is
// atomic and only the first transition to DESTROYING reaches the backend.
class SandboxInstance {
public:
    // destroy_retries: extra backend.destroy attempts (with backoff) after a failure.
    SandboxInstance(ISandboxBackend& backend, std::string id, SandboxConfig cfg, int destroy_retries = 0);
    ~SandboxInstance();

    SandboxInstance(const SandboxInstance&) = delete;
    SandboxInstance& operator=(const SandboxInstance&) = delete;

    const std::string& id() const { return id_; }
    const SandboxConfig& config() const { return config_; }
    int64_t created_at_ms() const { return created_at_ms_; }
    SandboxState state() const { return state_.load(); }

    // READY -> RUNNING; false if the instance is already being torn down.
    bool begin_run();
    void end_run();

    RawRunResult run(const std::string& code, const TestCase* test, int timeout_ms,
                     const std::atomic<bool>* external_cancel);

    // Kills any active run and destroys. Safe from any thread.
    void abort();

    // Destroy-once. Returns empty string on success or when another caller
    // already destroyed the instance.
    std::string destroy();

    bool aborted() const { return abort_.load(); }

private:
    ISandboxBackend& backend_;
    std::string id_;
    SandboxConfig config_;
    int64_t created_at_ms_{0};
    int destroy_retries_{0};
    std::atomic<SandboxState> state_{SandboxState::READY};
    std::atomic<bool> abort_{false};
};

} // namespace evogate
