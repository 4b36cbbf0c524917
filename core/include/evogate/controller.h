#pragma once

#include "audit.h"
#include "cpq.h"
#include "executor.h"
#include "observer.h"
#include "policy.h"
#include "static_analyzer.h"
#include "types.h"
#include "wal.h"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace evogate {

struct ControllerOptions {
    int workers{4};
    bool execute_dangerous{false};      // run DANGEROUS candidates in the sandbox anyway
    int max_attempts{3};                // interrupted runs are retried up to this many attempts
    int audit_max_attempts{4};
    int64_t audit_backoff_base_ms{50};
    int64_t audit_backoff_max_ms{2000};
    int64_t audit_jitter_ms{25};
    int wall_clock_override_ms{0};      // >0 replaces the isolation table's wall clock
    std::filesystem::path intake_journal;   // empty = no crash recovery
    bool journal_fsync{false};
    ExecutorOptions executor;
};

// EvolutionController: owns the request queue, the worker threads and the
// status table; drives each request through
//   SUBMITTED -> STATIC_ANALYZING -> {BLOCKED | SANDBOX_TESTING -> DECIDING}
//   -> {AUTO_APPROVED | PENDING_HUMAN_REVIEW -> {APPROVED|REJECTED} | REJECTED}
// with NEEDS_REAUDIT between DECIDING and the outcome when the audit write
// keeps failing.
//
// A request leaves the in-memory table when it reaches a terminal state;
// from then on get_status() answers from the audit log.
//
// Collaborators are borrowed and must outlive the controller. The public API
// never throws for expected failures.
class EvolutionController {
public:
    EvolutionController(const StaticAnalyzer& analyzer,
                        SandboxPool& pool,
                        ISandboxBackend& backend,
                        const PolicyEngine& policy,
                        AuditStore& audit,
                        ControllerOptions opts = {});
    ~EvolutionController();

    EvolutionController(const EvolutionController&) = delete;
    EvolutionController& operator=(const EvolutionController&) = delete;

    // Non-owning; call before start().
    void subscribe(ITransitionObserver* obs);

    // Replays the intake journal, starts the pool watchdog and the workers.
    // Returns empty string on success.
    std::string start();

    // Stops taking work; in-flight requests finish, queued ones stay in the
    // intake journal for the next start().
    void stop();

    // Enqueues; never blocks on sandbox availability. Empty id gets "evo-<hex>".
    // A known id returns that id without enqueuing again.
    std::string submit(EvolutionRequest req);

    // false = not found
    bool get_status(const std::string& request_id, EvolutionResult* out) const;

    bool cancel(const std::string& request_id);

    // Only from PENDING_HUMAN_REVIEW. The resolution is appended to the audit log.
    bool resolve_review(const std::string& request_id,
                        bool approved,
                        const std::string& reviewer = "",
                        const std::string& note = "");

    std::vector<EvolutionResult> list_pending_reviews() const;

    // Blocks until the request is terminal, pending review or needs re-audit.
    // timeout_ms < 0 waits forever. nullopt on timeout or unknown id.
    std::optional<EvolutionResult> wait_for(const std::string& request_id, int timeout_ms = -1) const;

    // Re-attempts audit writes of NEEDS_REAUDIT requests. Returns how many
    // were written.
    int retry_pending_audits();

    // Rebuilds state from the intake journal (called by start()).
    std::string recover();

    // Counts over the audit log merged with the requests still in flight.
    EvolutionStats stats() const;

    // Audited decisions, newest first, at most `limit` of them.
    std::vector<EvolutionResult> history(size_t limit) const;

    size_t queued() const { return queue_.size(); }

    // Requests held in memory. Terminal ones are dropped once audited.
    size_t tracked() const;

private:
    struct Entry {
        EvolutionRequest request;
        EvolutionResult result;
        std::shared_ptr<std::atomic<bool>> cancel{std::make_shared<std::atomic<bool>>(false)};
        AuditTimestamps ts;
        AuditRecord pending_audit;                  // valid in NEEDS_REAUDIT
        RequestState audit_target{RequestState::REJECTED};
        bool resolving{false};
    };

    void worker_loop();
    void process(const std::string& id);

    // Builds the record, writes it with retry and moves to `target` (or NEEDS_REAUDIT).
    void finish(const std::string& id,
                const StaticAnalysisReport& report,
                const ExecutionResult& exec,
                const PolicyDecision& decision,
                RequestState target);

    std::string write_audit_with_retry(const AuditRecord& rec);

    // Sets state under the lock, notifies observers outside it.
    void transition(const std::string& id, RequestState to, const std::string& detail = "");
    void notify(const TransitionEvent& ev);

    bool status_from_audit(const std::string& request_id, EvolutionResult* out) const;
    std::string journal_submit(const EvolutionRequest& req, int attempt);
    std::string journal_done(const std::string& id);

    static RequestState target_for(const PolicyDecision& d, const StaticAnalysisReport& report);

    const StaticAnalyzer& analyzer_;
    SandboxPool& pool_;
    ISandboxBackend& backend_;
    const PolicyEngine& policy_;
    AuditStore& audit_;
    ControllerOptions opts_;
    SandboxExecutor executor_;

    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
    std::map<std::string, Entry> entries_;

    ConcurrentPriorityQueue<std::string> queue_;
    std::unique_ptr<Wal> journal_;
    std::vector<std::thread> workers_;
    bool started_{false};
    bool recovered_{false};

    std::mutex obs_mu_;
    std::vector<ITransitionObserver*> observers_;
};

} // namespace evogate
