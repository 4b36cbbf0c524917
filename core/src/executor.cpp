#include "evogate/executor.h"

#include "evogate/harness.h"
#include "evogate/util.h"

#include <algorithm>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>

namespace evogate {

namespace {

std::string coded(ErrorCode c, const std::string& detail) {
    return std::string(error_code_name(c)) + ": " + detail;
}

bool raised(const std::atomic<bool>* f) {
    return f && f->load();
}

// Disarms the watchdog before the instance it points at goes away.
struct WatchdogDisarm {
    Lease& lease;
    ~WatchdogDisarm() { lease.disarm_watchdog(); }
};

std::string describe_breach(const RawRunResult& raw) {
    if (raw.term_signal == SIGXCPU) return "cpu limit exceeded (SIGXCPU)";
    if (raw.term_signal == SIGXFSZ) return "file size limit exceeded (SIGXFSZ)";
    if (raw.term_signal == SIGKILL) return "killed (SIGKILL, likely memory)";
    if (raw.outcome.kind == HarnessOutcome::Kind::MEMORY) return "MemoryError";
    if (raw.exit_code == 137) return "killed inside container (exit 137)";
    return "resource limit exceeded";
}

} // namespace

ExecutionStatus aggregate_test_statuses(const std::vector<PerTestResult>& tests) {
    bool resource = false;
    bool timeout = false;
    bool failed = false;
    for (const auto& t : tests) {
        switch (t.status) {
            case TestStatus::RESOURCE_EXCEEDED: resource = true; break;
            case TestStatus::TIMEOUT: timeout = true; break;
            case TestStatus::FAILED:
            case TestStatus::ERROR: failed = true; break;
            case TestStatus::PASSED: break;
        }
    }
    if (resource) return ExecutionStatus::RESOURCE_EXCEEDED;
    if (timeout) return ExecutionStatus::TIMEOUT;
    if (failed) return ExecutionStatus::FAILED;
    return ExecutionStatus::PASSED;
}

SandboxExecutor::SandboxExecutor(SandboxPool& pool, ISandboxBackend& backend, ExecutorOptions opts)
    : pool_(pool), backend_(backend), opts_(opts) {}

ExecutionResult SandboxExecutor::execute(const EvolutionRequest& req,
                                         const StaticAnalysisReport& report,
                                         const SandboxConfig& cfg,
                                         const std::atomic<bool>* cancel) {
    if (report.risk == RiskAssessment::BLOCKED) {
        ExecutionResult res;
        res.status = ExecutionStatus::NOT_RUN;
        res.error = "static analysis blocked";
        return res;
    }
    const int64_t t0 = now_ms();
    try {
        ExecutionResult res = execute_impl(req, cfg, cancel);
        res.duration_ms = now_ms() - t0;
        return res;
    } catch (const std::exception& e) {
        std::cerr << "[executor] " << req.id << ": backend threw: " << e.what() << "\n";
        ExecutionResult res;
        res.status = ExecutionStatus::ENVIRONMENT_ERROR;
        res.error = coded(ErrorCode::INTERNAL_ERROR, e.what());
        res.duration_ms = now_ms() - t0;
        return res;
    }
}

ExecutionResult SandboxExecutor::execute_impl(const EvolutionRequest& req,
                                              const SandboxConfig& cfg,
                                              const std::atomic<bool>* cancel) {
    ExecutionResult res;
    res.status = ExecutionStatus::ENVIRONMENT_ERROR;

    if (req.test_cases.size() != req.expected_outcomes.size()) {
        res.error = "invalid request: " + std::to_string(req.test_cases.size()) + " tests, " +
                    std::to_string(req.expected_outcomes.size()) + " expected outcomes";
        return res;
    }

    // 1. pool slot (scoped)
    Lease lease;
    AcquireStatus st = AcquireStatus::POOL_EXHAUSTED;
    if (opts_.acquire_mode == AcquireMode::FAIL_FAST) {
        st = pool_.acquire(&lease, AcquireMode::FAIL_FAST);
    } else {
        const int64_t give_up = opts_.acquire_timeout_ms >= 0 ? now_ms() + opts_.acquire_timeout_ms : -1;
        for (;;) {
            if (raised(cancel)) {
                res.cancelled = true;
                res.error = "cancelled while waiting for a sandbox slot";
                return res;
            }
            int wait = 50;
            if (give_up >= 0) wait = (int)std::max<int64_t>(0, std::min<int64_t>(wait, give_up - now_ms()));
            st = pool_.acquire(&lease, AcquireMode::BLOCKING, wait);
            if (st == AcquireStatus::OK || pool_.is_shut_down()) break;
            if (give_up >= 0 && now_ms() >= give_up) break;
        }
    }
    if (st != AcquireStatus::OK) {
        res.error = coded(ErrorCode::POOL_EXHAUSTED, "no sandbox slot available");
        return res;
    }

    // 2. create with bounded retry
    std::string instance_id;
    std::string create_err;
    const int attempts = 1 + std::max(0, opts_.create_retries);
    for (int attempt = 1; attempt <= attempts; attempt++) {
        create_err = backend_.create(cfg, &instance_id);
        if (create_err.empty()) break;
        std::cerr << "[executor] " << req.id << ": create attempt " << attempt << "/" << attempts
                  << " on " << backend_.name() << " failed: " << create_err << "\n";
        if (attempt == attempts || raised(cancel)) break;
        sleep_ms(backoff_delay_ms(attempt + 1, opts_.create_backoff_base_ms, 2, 2000, 0));
    }
    if (!create_err.empty()) {
        res.error = coded(ErrorCode::ENVIRONMENT_CREATION_FAILED, create_err);
        return res;
    }

    auto inst = std::make_unique<SandboxInstance>(backend_, instance_id, cfg, opts_.create_retries);
    const int wall = cfg.limits.wall_clock_ms;
    const size_t n_runs = std::max<size_t>(1, req.test_cases.size());
    lease.arm_watchdog(now_ms() + (int64_t)wall * (int64_t)n_runs + opts_.watchdog_grace_ms,
                       [raw = inst.get()] { raw->abort(); });
    WatchdogDisarm disarm{lease};

    // 3. tests
    std::string env_error;
    bool watchdog_fired = false;
    const bool load_only = req.test_cases.empty();
    for (size_t i = 0; i < n_runs; i++) {
        if (raised(cancel)) {
            res.cancelled = true;
            break;
        }
        if (inst->aborted()) {
            watchdog_fired = true;
            break;
        }

        const TestCase* tc = load_only ? nullptr : &req.test_cases[i];
        RawRunResult raw = inst->run(req.source_code, tc, wall, cancel);

        PerTestResult pt;
        pt.name = load_only ? "load" : (tc->name.empty() ? "test_" + std::to_string(i) : tc->name);
        pt.expected = load_only ? "loaded" : render_expected(req.expected_outcomes[i]);
        pt.stdout_text = raw.stdout_text;
        pt.stderr_text = raw.stderr_text;
        pt.exit_code = raw.exit_code;
        pt.duration_ms = raw.wall_ms;

        res.usage.cpu_ms += raw.cpu_ms;
        res.usage.wall_ms += raw.wall_ms;
        res.usage.peak_rss_kb = std::max(res.usage.peak_rss_kb, raw.peak_rss_kb);
        if (!raw.stdout_text.empty()) res.stdout_text += raw.stdout_text;
        if (!raw.stderr_text.empty()) res.stderr_text += raw.stderr_text;

        if (raw.cancelled) {
            pt.status = TestStatus::ERROR;
            pt.actual = "killed";
            res.per_test.push_back(std::move(pt));
            if (raised(cancel)) res.cancelled = true;
            else watchdog_fired = true;
            break;
        }
        if (!raw.started) {
            pt.status = TestStatus::ERROR;
            pt.actual = "not started";
            env_error = raw.error;
            res.per_test.push_back(std::move(pt));
            break;
        }
        if (raw.timed_out) {
            pt.status = TestStatus::TIMEOUT;
            pt.actual = "timed out after " + std::to_string(wall) + " ms";
            res.per_test.push_back(std::move(pt));
            if (!backend_.supports_test_isolation()) {
                std::cerr << "[executor] " << req.id << ": timeout on " << backend_.name()
                          << " without test isolation, aborting batch\n";
                break;
            }
            continue;
        }
        if (raw.resource_exceeded) {
            pt.status = TestStatus::RESOURCE_EXCEEDED;
            pt.actual = describe_breach(raw);
            res.per_test.push_back(std::move(pt));
            continue;
        }

        if (load_only) {
            bool ok = raw.outcome.kind == HarnessOutcome::Kind::LOADED;
            pt.status = ok ? TestStatus::PASSED : TestStatus::FAILED;
            pt.actual = ok ? "loaded" : "load error: " + raw.outcome.value;
        } else if (outcome_matches(raw.outcome, req.expected_outcomes[i], &pt.actual)) {
            pt.status = TestStatus::PASSED;
        } else {
            pt.status = raw.outcome.kind == HarnessOutcome::Kind::NONE ? TestStatus::ERROR : TestStatus::FAILED;
        }
        res.per_test.push_back(std::move(pt));
    }

    // 4. teardown, then the slot goes back when `lease` leaves scope
    lease.disarm_watchdog();
    std::string destroy_err = inst->destroy();
    if (lease.reclaimed()) watchdog_fired = true;

    if (res.cancelled) {
        res.status = ExecutionStatus::ENVIRONMENT_ERROR;
        res.error = "cancelled";
    } else if (watchdog_fired) {
        res.status = ExecutionStatus::TIMEOUT;
        res.error = coded(ErrorCode::EXECUTION_TIMEOUT, "watchdog deadline exceeded");
    } else if (!env_error.empty()) {
        res.status = ExecutionStatus::ENVIRONMENT_ERROR;
        res.error = coded(ErrorCode::ENVIRONMENT_CREATION_FAILED, env_error);
    } else {
        res.status = aggregate_test_statuses(res.per_test);
    }
    if (!destroy_err.empty()) {
        std::cerr << "[executor] " << req.id << ": teardown of " << instance_id << " failed: " << destroy_err << "\n";
        res.status = ExecutionStatus::ENVIRONMENT_ERROR;
        if (!res.error.empty()) res.error += "; ";
        res.error += "teardown failed: " + destroy_err;
    }
    return res;
}

} // namespace evogate
