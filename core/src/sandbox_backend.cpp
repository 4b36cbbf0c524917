#include "evogate/sandbox_backend.h"

#include "evogate/backends.h"
#include "evogate/util.h"

#include <iostream>

namespace evogate {

SandboxConfig sandbox_config_for(IsolationLevel level, BackendKind backend) {
    SandboxConfig c;
    c.backend = backend;
    c.isolation = level;
    switch (level) {
        case IsolationLevel::LOW:
            c.limits = ResourceLimits{0.8, 512, 30000, 256};
            c.filesystem = FilesystemAccess::READ_WRITE;
            c.network_allowed = true;
            break;
        case IsolationLevel::MEDIUM:
            c.limits = ResourceLimits{0.5, 256, 10000, 128};
            c.filesystem = FilesystemAccess::READ_ONLY;
            c.network_allowed = true;
            break;
        case IsolationLevel::HIGH:
            c.limits = ResourceLimits{0.3, 128, 5000, 64};
            c.filesystem = FilesystemAccess::READ_ONLY;
            c.network_allowed = false;
            break;
        case IsolationLevel::MAXIMUM:
            c.limits = ResourceLimits{0.1, 64, 2000, 32};
            c.filesystem = FilesystemAccess::NONE;
            c.network_allowed = false;
            break;
    }
    return c;
}

std::unique_ptr<ISandboxBackend> make_backend(BackendKind kind, const BackendOptions& opts) {
    switch (kind) {
        case BackendKind::SUBPROCESS: return std::make_unique<SubprocessBackend>(opts);
        case BackendKind::CONTAINER: return std::make_unique<ContainerBackend>(opts);
        case BackendKind::RESTRICTED: return std::make_unique<RestrictedBackend>(opts);
    }
    return std::make_unique<SubprocessBackend>(opts);
}

// ---------- SandboxInstance ----------

SandboxInstance::SandboxInstance(ISandboxBackend& backend, std::string id, SandboxConfig cfg,
                                 int destroy_retries)
    : backend_(backend),
      id_(std::move(id)),
      config_(std::move(cfg)),
      created_at_ms_(now_ms()),
      destroy_retries_(destroy_retries < 0 ? 0 : destroy_retries) {}

SandboxInstance::~SandboxInstance() {
    std::string err = destroy();
    if (!err.empty()) {
        std::cerr << "[executor] teardown of " << id_ << " failed: " << err << "\n";
    }
}

bool SandboxInstance::begin_run() {
    SandboxState expected = SandboxState::READY;
    return state_.compare_exchange_strong(expected, SandboxState::RUNNING);
}

void SandboxInstance::end_run() {
    SandboxState expected = SandboxState::RUNNING;
    state_.compare_exchange_strong(expected, SandboxState::READY);
}

RawRunResult SandboxInstance::run(const std::string& code, const TestCase* test, int timeout_ms,
                                  const std::atomic<bool>* external_cancel) {
    if (!begin_run()) {
        RawRunResult r;
        r.cancelled = true;
        r.error = "instance " + id_ + " is " + sandbox_state_to_str(state());
        return r;
    }
    RawRunResult r = backend_.run(id_, code, test, timeout_ms, CancelFlags{&abort_, external_cancel});
    end_run();
    return r;
}

void SandboxInstance::abort() {
    abort_.store(true);
    std::string err = destroy();
    if (!err.empty()) {
        std::cerr << "[pool] abort of " << id_ << ": destroy failed: " << err << "\n";
    }
}

std::string SandboxInstance::destroy() {
    SandboxState cur = state_.load();
    for (;;) {
        if (cur == SandboxState::DESTROYING || cur == SandboxState::DESTROYED) return "";
        if (state_.compare_exchange_weak(cur, SandboxState::DESTROYING)) break;
    }
    // A run in progress sees the abort flag and is killed by its runner.
    abort_.store(true);
    std::string err = backend_.destroy(id_);
    for (int attempt = 2; !err.empty() && attempt <= destroy_retries_ + 1; attempt++) {
        std::cerr << "[executor] destroy " << id_ << " failed: " << err << " (retrying)\n";
        sleep_ms(backoff_delay_ms(attempt, 100, 2, 2000, 0));
        err = backend_.destroy(id_);
    }
    state_.store(SandboxState::DESTROYED);
    return err;
}

} // namespace evogate
