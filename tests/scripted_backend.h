#pragma once

// In-process ISandboxBackend for deterministic pipeline tests. Counts every
// create and destroy, and answers runs from a table keyed by the test
// expression. A few expressions have fixed behavior:
//   "hang()"   blocks until a cancel flag is raised (then reports cancelled)
//   "sleep()"  reports a wall-clock timeout after timeout_ms
//   "oom()"    reports a resource breach (SIGKILL)
//   "boom()"   throws std::runtime_error
//   "nostart()" reports an interpreter that never started

#include "evogate/sandbox_backend.h"
#include "evogate/util.h"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>

class ScriptedBackend : public evogate::ISandboxBackend {
public:
    evogate::BackendKind kind() const override { return evogate::BackendKind::SUBPROCESS; }
    const char* name() const override { return "scripted"; }
    bool supports_test_isolation() const override { return isolation; }

    std::string create(const evogate::SandboxConfig& cfg, std::string* instance_id) override {
        std::lock_guard<std::mutex> lk(mu_);
        create_calls++;
        last_config = cfg;
        if (fail_creates > 0) {
            fail_creates--;
            return "scripted create failure";
        }
        *instance_id = "scripted-" + std::to_string(++next_id_);
        live_.insert(*instance_id);
        creates++;
        peak_live = std::max<int>(peak_live.load(), (int)live_.size());
        return "";
    }

    evogate::RawRunResult run(const std::string& instance_id,
                              const std::string& code,
                              const evogate::TestCase* test,
                              int timeout_ms,
                              const evogate::CancelFlags& cancel) override {
        (void)code;
        using evogate::HarnessOutcome;
        evogate::RawRunResult r;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (!live_.count(instance_id)) {
                r.error = "unknown instance " + instance_id;
                return r;
            }
        }
        runs++;
        in_run.store(true);
        struct Clear {
            std::atomic<bool>& f;
            ~Clear() { f.store(false); }
        } clear{in_run};

        if (run_delay_ms > 0) evogate::sleep_ms(run_delay_ms);

        r.started = true;
        r.exit_code = 0;
        r.wall_ms = 1;
        if (!test) {
            r.outcome.kind = HarnessOutcome::Kind::LOADED;
            return r;
        }
        const std::string& e = test->expression;
        if (e == "hang()") {
            const int64_t give_up = evogate::now_ms() + 30000;
            while (!raised(cancel) && evogate::now_ms() < give_up) evogate::sleep_ms(5);
            r.cancelled = raised(cancel);
            r.timed_out = !r.cancelled;
            r.exit_code = -1;
            r.term_signal = SIGKILL;
            return r;
        }
        if (e == "sleep()") {
            const int64_t until = evogate::now_ms() + timeout_ms;
            while (!raised(cancel) && evogate::now_ms() < until) evogate::sleep_ms(5);
            r.cancelled = raised(cancel);
            r.timed_out = !r.cancelled;
            r.exit_code = -1;
            r.term_signal = SIGKILL;
            return r;
        }
        if (e == "oom()") {
            r.resource_exceeded = true;
            r.exit_code = -1;
            r.term_signal = SIGKILL;
            return r;
        }
        if (e == "boom()") throw std::runtime_error("scripted backend exploded");
        if (e == "nostart()") {
            r.started = false;
            r.exit_code = 127;
            r.error = "interpreter not found";
            return r;
        }
        auto it = answers.find(e);
        if (it == answers.end()) {
            r.outcome.kind = HarnessOutcome::Kind::RAISES;
            r.outcome.value = "NameError";
            return r;
        }
        if (it->second.rfind("raises ", 0) == 0) {
            r.outcome.kind = HarnessOutcome::Kind::RAISES;
            r.outcome.value = it->second.substr(7);
        } else {
            r.outcome.kind = HarnessOutcome::Kind::VALUE;
            r.outcome.value = it->second;
        }
        return r;
    }

    std::string destroy(const std::string& instance_id) override {
        std::lock_guard<std::mutex> lk(mu_);
        destroy_calls++;
        if (fail_destroys > 0) {
            fail_destroys--;
            return "scripted destroy failure";
        }
        if (live_.erase(instance_id)) destroys++;
        return "";
    }

    int live() const {
        std::lock_guard<std::mutex> lk(mu_);
        return (int)live_.size();
    }

    // expression -> repr of the result, or "raises <ExceptionName>"
    std::map<std::string, std::string> answers;
    bool isolation{true};
    int fail_creates{0};
    int fail_destroys{0};
    int run_delay_ms{0};

    std::atomic<int> create_calls{0};
    std::atomic<int> creates{0};
    std::atomic<int> destroy_calls{0};
    std::atomic<int> destroys{0};
    std::atomic<int> runs{0};
    std::atomic<int> peak_live{0};
    std::atomic<bool> in_run{false};
    evogate::SandboxConfig last_config;

private:
    static bool raised(const evogate::CancelFlags& flags) {
        return std::any_of(flags.begin(), flags.end(), [](const std::atomic<bool>* f) { return f && f->load(); });
    }

    mutable std::mutex mu_;
    std::set<std::string> live_;
    int next_id_{0};
};
