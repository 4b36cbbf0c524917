#pragma once

#include "sandbox_backend.h"
#include "sandbox_pool.h"
#include "types.h"

#include <atomic>
#include <cstdint>

namespace evogate {

struct ExecutorOptions {
    int create_retries{2};              // extra create attempts after the first failure
    int64_t create_backoff_base_ms{100};
    int64_t watchdog_grace_ms{2000};
    AcquireMode acquire_mode{AcquireMode::BLOCKING};
    int acquire_timeout_ms{-1};         // BLOCKING only; <0 waits until a slot frees or cancel
};

// SandboxExecutor: drives one sandbox instance through a request's tests.
//
// Guarantees, on every exit path including exceptions thrown by the backend:
// the instance is destroyed exactly once and the pool slot is released.
class SandboxExecutor {
public:
    SandboxExecutor(SandboxPool& pool, ISandboxBackend& backend, ExecutorOptions opts = {});

    // Never throws. A BLOCKED report returns NOT_RUN without touching the pool.
    ExecutionResult execute(const EvolutionRequest& req,
                            const StaticAnalysisReport& report,
                            const SandboxConfig& cfg,
                            const std::atomic<bool>* cancel = nullptr);

    const ExecutorOptions& options() const { return opts_; }
    ISandboxBackend& backend() { return backend_; }

private:
    ExecutionResult execute_impl(const EvolutionRequest& req,
                                 const SandboxConfig& cfg,
                                 const std::atomic<bool>* cancel);

    SandboxPool& pool_;
    ISandboxBackend& backend_;
    ExecutorOptions opts_;
};

// Aggregate precedence: RESOURCE_EXCEEDED > TIMEOUT > FAILED (incl. ERROR) > PASSED.
ExecutionStatus aggregate_test_statuses(const std::vector<PerTestResult>& tests);

} // namespace evogate
