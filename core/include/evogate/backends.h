#pragma once

#include "sandbox_backend.h"

#include <map>
#include <mutex>

namespace evogate {

// Maps a finished interpreter process to a RawRunResult: marker parsing,
// resource-breach detection and "could not start" classification.
// proc_started: the return value of proc_run_capture_sandboxed.
void classify_proc_result(const ProcResult& pr,
                          bool proc_started,
                          const std::string& nonce,
                          RawRunResult* out);

// ceil(wall * share / 1000), minimum 1
int cpu_seconds_for(const ResourceLimits& lim);

// Fresh interpreter process per test in a private temp directory.
class SubprocessBackend : public ISandboxBackend {
public:
    explicit SubprocessBackend(BackendOptions opts);
    ~SubprocessBackend() override;

    BackendKind kind() const override { return BackendKind::SUBPROCESS; }
    const char* name() const override { return "subprocess"; }
    bool supports_test_isolation() const override { return true; }

    std::string create(const SandboxConfig& cfg, std::string* instance_id) override;
    RawRunResult run(const std::string& instance_id,
                     const std::string& code,
                     const TestCase* test,
                     int timeout_ms,
                     const CancelFlags& cancel) override;
    std::string destroy(const std::string& instance_id) override;

    size_t live_instances() const;

protected:
    struct Instance {
        SandboxConfig cfg;
        std::filesystem::path dir;
    };

    // Interpreter argv and process limits for one run.
    virtual std::vector<std::string> interpreter_argv() const;
    virtual ProcLimits limits_for(const SandboxConfig& cfg, int timeout_ms) const;
    virtual bool writable_dir(const SandboxConfig& cfg) const;
    std::filesystem::perms dir_perms(const SandboxConfig& cfg) const;
    virtual const char* log_tag() const { return "[backend.subprocess]"; }

    BackendOptions opts_;

private:
    mutable std::mutex mu_;
    std::map<std::string, Instance> instances_;
};

// Isolated-mode interpreter (-I -S -B), empty environment, no fork, seccomp
// always on without network, read-only empty working directory.
class RestrictedBackend : public SubprocessBackend {
public:
    explicit RestrictedBackend(BackendOptions opts);

    BackendKind kind() const override { return BackendKind::RESTRICTED; }
    const char* name() const override { return "restricted"; }

protected:
    std::vector<std::string> interpreter_argv() const override;
    ProcLimits limits_for(const SandboxConfig& cfg, int timeout_ms) const override;
    bool writable_dir(const SandboxConfig&) const override { return false; }
    const char* log_tag() const override { return "[backend.restricted]"; }
};

// Long-lived docker container per instance; tests run through docker exec.
class ContainerBackend : public ISandboxBackend {
public:
    explicit ContainerBackend(BackendOptions opts);
    ~ContainerBackend() override;

    BackendKind kind() const override { return BackendKind::CONTAINER; }
    const char* name() const override { return "container"; }
    bool supports_test_isolation() const override { return false; }

    std::string create(const SandboxConfig& cfg, std::string* instance_id) override;
    RawRunResult run(const std::string& instance_id,
                     const std::string& code,
                     const TestCase* test,
                     int timeout_ms,
                     const CancelFlags& cancel) override;
    std::string destroy(const std::string& instance_id) override;

    // docker run argv for a config (exposed for tests).
    std::vector<std::string> run_argv(const SandboxConfig& cfg, const std::string& container_name) const;

private:
    BackendOptions opts_;
    mutable std::mutex mu_;
    std::map<std::string, SandboxConfig> instances_;   // container name -> config
};

} // namespace evogate
