#include "test_common.h"
#include "scripted_backend.h"

#include "evogate/executor.h"
#include "evogate/static_analyzer.h"

#include <atomic>
#include <thread>
#include <vector>

using namespace evogate;

static EvolutionRequest make_request(const std::vector<std::pair<std::string, std::string>>& tests) {
    EvolutionRequest r;
    r.id = "evo-test";
    r.source_code = "def fib(n):\n    return n if n < 2 else fib(n - 1) + fib(n - 2)\n";
    int i = 0;
    for (const auto& t : tests) {
        r.test_cases.push_back(TestCase{"t" + std::to_string(i++), t.first});
        ExpectedOutcome eo;
        if (t.second.rfind("raises ", 0) == 0) {
            eo.kind = OutcomeKind::RAISES;
            eo.value = t.second.substr(7);
        } else {
            eo.value = t.second;
        }
        r.expected_outcomes.push_back(eo);
    }
    return r;
}

static SandboxConfig fast_config(int wall_ms = 200) {
    SandboxConfig cfg = sandbox_config_for(IsolationLevel::HIGH, BackendKind::SUBPROCESS);
    cfg.limits.wall_clock_ms = wall_ms;
    return cfg;
}

static ExecutorOptions fast_options() {
    ExecutorOptions o;
    o.create_backoff_base_ms = 1;
    o.watchdog_grace_ms = 2000;
    return o;
}

static void expect_balanced(const ScriptedBackend& b, SandboxPool& pool, const std::string& what) {
    expect_eq_ll(b.creates.load(), b.destroys.load(), what + ": creates == destroys");
    expect_eq_ll(b.live(), 0, what + ": no live instance");
    expect_eq_ll((long long)pool.in_use(), 0, what + ": slot released");
}

int main() {
    StaticAnalyzer analyzer;
    const auto report = analyzer.analyze(make_request({}).source_code);
    expect_true(report.risk == RiskAssessment::SAFE, "fixture source is safe");

    // All tests pass.
    {
        SandboxPool pool(1);
        ScriptedBackend b;
        b.answers = {{"fib(10)", "55"}, {"fib(1)", "1"}};
        SandboxExecutor ex(pool, b, fast_options());
        auto res = ex.execute(make_request({{"fib(10)", "55"}, {"fib(1)", "1"}}), report, fast_config());
        expect_true(res.status == ExecutionStatus::PASSED, std::string("passed: ") + execstatus_to_str(res.status));
        expect_eq_ll((long long)res.per_test.size(), 2, "two per-test results");
        expect_eq_str(res.per_test[0].actual, "55", "actual value");
        expect_eq_ll(b.creates.load(), 1, "one instance for the whole request");
        expect_balanced(b, pool, "pass");
    }

    // Mismatch and unexpected exception.
    {
        SandboxPool pool(1);
        ScriptedBackend b;
        b.answers = {{"fib(10)", "54"}, {"fib(-1)", "raises RecursionError"}};
        SandboxExecutor ex(pool, b, fast_options());
        auto res = ex.execute(make_request({{"fib(10)", "55"}, {"fib(-1)", "raises RecursionError"}}), report,
                              fast_config());
        expect_true(res.status == ExecutionStatus::FAILED, "mismatch fails");
        expect_true(res.per_test[0].status == TestStatus::FAILED, "first test failed");
        expect_eq_str(res.per_test[0].expected, "55", "expected rendered");
        expect_true(res.per_test[1].status == TestStatus::PASSED, "expected exception passes");
        expect_balanced(b, pool, "mismatch");
    }

    // Blocked code never touches the backend.
    {
        SandboxPool pool(1);
        ScriptedBackend b;
        SandboxExecutor ex(pool, b, fast_options());
        auto res = ex.execute(make_request({{"x", "1"}}), analyzer.analyze("def f(:\n"), fast_config());
        expect_true(res.status == ExecutionStatus::NOT_RUN, "blocked is not run");
        expect_eq_ll(b.create_calls.load(), 0, "no create for blocked code");
        expect_eq_ll((long long)pool.total_acquired(), 0, "no slot for blocked code");
    }

    // No tests: the module is only loaded.
    {
        SandboxPool pool(1);
        ScriptedBackend b;
        SandboxExecutor ex(pool, b, fast_options());
        auto res = ex.execute(make_request({}), report, fast_config());
        expect_true(res.status == ExecutionStatus::PASSED, "load-only passes");
        expect_eq_ll((long long)res.per_test.size(), 1, "one load run");
        expect_eq_str(res.per_test[0].name, "load", "load run name");
        expect_balanced(b, pool, "load-only");
    }

    // Creation failures are retried a bounded number of times.
    {
        SandboxPool pool(1);
        ScriptedBackend b;
        b.fail_creates = 100;
        ExecutorOptions o = fast_options();
        o.create_retries = 2;
        SandboxExecutor ex(pool, b, o);
        auto res = ex.execute(make_request({{"fib(10)", "55"}}), report, fast_config());
        expect_true(res.status == ExecutionStatus::ENVIRONMENT_ERROR, "creation failure is an environment error");
        expect_true(contains(res.error, "EnvironmentCreationFailed"), "error code named: " + res.error);
        expect_eq_ll(b.create_calls.load(), 3, "1 + create_retries attempts");
        expect_balanced(b, pool, "create failure");

        ScriptedBackend flaky;
        flaky.fail_creates = 1;
        flaky.answers = {{"fib(10)", "55"}};
        SandboxExecutor ex2(pool, flaky, o);
        res = ex2.execute(make_request({{"fib(10)", "55"}}), report, fast_config());
        expect_true(res.status == ExecutionStatus::PASSED, "second create attempt succeeds");
        expect_eq_ll(flaky.create_calls.load(), 2, "two attempts");
        expect_balanced(flaky, pool, "flaky create");
    }

    // Wall-clock timeout.
    {
        SandboxPool pool(1);
        ScriptedBackend b;
        b.answers = {{"fib(1)", "1"}};
        SandboxExecutor ex(pool, b, fast_options());
        auto res = ex.execute(make_request({{"sleep()", "None"}, {"fib(1)", "1"}}), report, fast_config(50));
        expect_true(res.status == ExecutionStatus::TIMEOUT, "timeout status");
        expect_true(res.per_test[0].status == TestStatus::TIMEOUT, "first test timed out");
        expect_eq_ll((long long)res.per_test.size(), 2, "isolating backend keeps running the batch");
        expect_balanced(b, pool, "timeout");

        ScriptedBackend shared;
        shared.isolation = false;
        SandboxExecutor ex2(pool, shared, fast_options());
        res = ex2.execute(make_request({{"sleep()", "None"}, {"fib(1)", "1"}}), report, fast_config(50));
        expect_true(res.status == ExecutionStatus::TIMEOUT, "timeout status without isolation");
        expect_eq_ll((long long)res.per_test.size(), 1, "batch aborted without test isolation");
        expect_balanced(shared, pool, "timeout without isolation");
    }

    // Resource breach outranks a timeout.
    {
        SandboxPool pool(1);
        ScriptedBackend b;
        SandboxExecutor ex(pool, b, fast_options());
        auto res = ex.execute(make_request({{"sleep()", "None"}, {"oom()", "None"}}), report, fast_config(30));
        expect_true(res.status == ExecutionStatus::RESOURCE_EXCEEDED, "resource breach wins");
        expect_true(contains(res.per_test[1].actual, "SIGKILL"), "breach described: " + res.per_test[1].actual);
        expect_balanced(b, pool, "resource");
    }

    // Interpreter that never starts.
    {
        SandboxPool pool(1);
        ScriptedBackend b;
        SandboxExecutor ex(pool, b, fast_options());
        auto res = ex.execute(make_request({{"nostart()", "1"}}), report, fast_config());
        expect_true(res.status == ExecutionStatus::ENVIRONMENT_ERROR, "not started is an environment error");
        expect_true(contains(res.error, "interpreter not found"), "detail kept: " + res.error);
        expect_balanced(b, pool, "not started");
    }

    // A throwing backend still gets its instance destroyed.
    {
        SandboxPool pool(1);
        ScriptedBackend b;
        SandboxExecutor ex(pool, b, fast_options());
        auto res = ex.execute(make_request({{"boom()", "1"}}), report, fast_config());
        expect_true(res.status == ExecutionStatus::ENVIRONMENT_ERROR, "throw becomes an environment error");
        expect_true(contains(res.error, "InternalError"), "internal error named: " + res.error);
        expect_balanced(b, pool, "throw");
    }

    // Cancel during a run kills it and tears down.
    {
        SandboxPool pool(1);
        ScriptedBackend b;
        SandboxExecutor ex(pool, b, fast_options());
        std::atomic<bool> cancel{false};
        ExecutionResult res;
        std::thread t([&] { res = ex.execute(make_request({{"hang()", "None"}}), report, fast_config(10000), &cancel); });
        const int64_t give_up = now_ms() + 5000;
        while (!b.in_run.load() && now_ms() < give_up) sleep_ms(2);
        expect_true(b.in_run.load(), "run started");
        cancel.store(true);
        t.join();
        expect_true(res.cancelled, "cancelled flag");
        expect_true(res.status == ExecutionStatus::ENVIRONMENT_ERROR, "cancel maps to environment error");
        expect_eq_str(res.error, "cancelled", "cancel error text");
        expect_balanced(b, pool, "cancel");
    }

    // Cancel while waiting for a slot.
    {
        SandboxPool pool(1);
        Lease held;
        expect_true(pool.acquire(&held) == AcquireStatus::OK, "hold the slot");
        ScriptedBackend b;
        SandboxExecutor ex(pool, b, fast_options());
        std::atomic<bool> cancel{true};
        auto res = ex.execute(make_request({{"fib(1)", "1"}}), report, fast_config(), &cancel);
        expect_true(res.cancelled, "cancelled while queued for a slot");
        expect_eq_ll(b.create_calls.load(), 0, "no create after cancel");
    }

    // Fail-fast acquisition.
    {
        SandboxPool pool(1);
        Lease held;
        expect_true(pool.acquire(&held) == AcquireStatus::OK, "hold the slot");
        ScriptedBackend b;
        ExecutorOptions o = fast_options();
        o.acquire_mode = AcquireMode::FAIL_FAST;
        SandboxExecutor ex(pool, b, o);
        auto res = ex.execute(make_request({{"fib(1)", "1"}}), report, fast_config());
        expect_true(res.status == ExecutionStatus::ENVIRONMENT_ERROR, "exhausted pool");
        expect_true(contains(res.error, "PoolExhausted"), "pool exhausted named: " + res.error);
    }

    // Watchdog reclaims a hung backend.
    {
        SandboxPool pool(1, 5);
        pool.start_watchdog();
        ScriptedBackend b;
        ExecutorOptions o = fast_options();
        o.watchdog_grace_ms = 20;
        SandboxExecutor ex(pool, b, o);
        // The backend ignores its own timeout for hang(); only the watchdog ends it.
        auto res = ex.execute(make_request({{"hang()", "None"}}), report, fast_config(30));
        expect_true(res.status == ExecutionStatus::TIMEOUT, std::string("watchdog timeout: ") + execstatus_to_str(res.status));
        expect_true(contains(res.error, "watchdog"), "watchdog named: " + res.error);
        expect_eq_ll((long long)pool.watchdog_reclaims(), 1, "one reclaim");
        expect_balanced(b, pool, "watchdog");
        pool.stop_watchdog();
    }

    // Teardown failures: retried, and surfaced when they persist.
    {
        SandboxPool pool(1);
        ScriptedBackend b;
        b.answers = {{"fib(1)", "1"}};
        b.fail_destroys = 1;
        ExecutorOptions o = fast_options();
        o.create_retries = 1;
        SandboxExecutor ex(pool, b, o);
        auto res = ex.execute(make_request({{"fib(1)", "1"}}), report, fast_config());
        expect_true(res.status == ExecutionStatus::PASSED, "one failed destroy is retried");
        expect_eq_ll(b.destroy_calls.load(), 2, "destroy retried");
        expect_balanced(b, pool, "destroy retry");

        ScriptedBackend stuck;
        stuck.answers = {{"fib(1)", "1"}};
        stuck.fail_destroys = 100;
        o.create_retries = 0;
        SandboxExecutor ex2(pool, stuck, o);
        res = ex2.execute(make_request({{"fib(1)", "1"}}), report, fast_config());
        expect_true(res.status == ExecutionStatus::ENVIRONMENT_ERROR, "failed teardown forces an environment error");
        expect_true(contains(res.error, "teardown failed"), "teardown named: " + res.error);
        expect_eq_ll(stuck.destroy_calls.load(), 1, "destroy attempted once, never again");
    }

    // Concurrent requests never hold more instances than slots.
    {
        SandboxPool pool(2);
        ScriptedBackend b;
        b.answers = {{"fib(1)", "1"}};
        b.run_delay_ms = 15;
        SandboxExecutor ex(pool, b, fast_options());
        std::vector<std::thread> ts;
        std::atomic<int> passed{0};
        for (int i = 0; i < 8; i++) {
            ts.emplace_back([&] {
                auto res = ex.execute(make_request({{"fib(1)", "1"}}), report, fast_config());
                if (res.status == ExecutionStatus::PASSED) passed++;
            });
        }
        for (auto& t : ts) t.join();
        expect_eq_ll(passed.load(), 8, "all concurrent requests pass");
        expect_true(b.peak_live.load() <= 2, "live instances never exceed capacity");
        expect_balanced(b, pool, "concurrent");
    }

    // Mismatched fixtures.
    {
        SandboxPool pool(1);
        ScriptedBackend b;
        SandboxExecutor ex(pool, b, fast_options());
        auto req = make_request({{"fib(1)", "1"}});
        req.expected_outcomes.clear();
        auto res = ex.execute(req, report, fast_config());
        expect_true(res.status == ExecutionStatus::ENVIRONMENT_ERROR, "mismatched fixtures rejected");
        expect_eq_ll(b.create_calls.load(), 0, "no create for invalid request");
    }

    std::vector<PerTestResult> mix(3);
    mix[0].status = TestStatus::PASSED;
    mix[1].status = TestStatus::ERROR;
    mix[2].status = TestStatus::TIMEOUT;
    expect_true(aggregate_test_statuses(mix) == ExecutionStatus::TIMEOUT, "timeout beats error");
    mix[2].status = TestStatus::PASSED;
    expect_true(aggregate_test_statuses(mix) == ExecutionStatus::FAILED, "error counts as failed");

    std::cerr << "test_executor: ALL PASSED" << std::endl;
    return 0;
}
