#include "evogate/controller.h"

#include "evogate/serialization.h"
#include "evogate/util.h"

#include <json-c/json.h>

#include <chrono>
#include <exception>
#include <iostream>

namespace evogate {

namespace {

bool settled(RequestState s) {
    return is_terminal(s) || s == RequestState::PENDING_HUMAN_REVIEW || s == RequestState::NEEDS_REAUDIT;
}

std::string first_reason(const PolicyDecision& d) {
    return d.reasons.empty() ? std::string() : d.reasons.front();
}

} // namespace

EvolutionController::EvolutionController(const StaticAnalyzer& analyzer,
                                         SandboxPool& pool,
                                         ISandboxBackend& backend,
                                         const PolicyEngine& policy,
                                         AuditStore& audit,
                                         ControllerOptions opts)
    : analyzer_(analyzer),
      pool_(pool),
      backend_(backend),
      policy_(policy),
      audit_(audit),
      opts_(std::move(opts)),
      executor_(pool, backend, opts_.executor) {
    if (opts_.workers < 1) opts_.workers = 1;
    if (opts_.max_attempts < 1) opts_.max_attempts = 1;
    if (opts_.audit_max_attempts < 1) opts_.audit_max_attempts = 1;
    if (!opts_.intake_journal.empty()) {
        journal_ = std::make_unique<Wal>(opts_.intake_journal);
        journal_->set_fsync(opts_.journal_fsync);
    }
}

EvolutionController::~EvolutionController() {
    stop();
}

void EvolutionController::subscribe(ITransitionObserver* obs) {
    if (!obs) return;
    std::lock_guard<std::mutex> lk(obs_mu_);
    observers_.push_back(obs);
}

std::string EvolutionController::start() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (started_) return "";
        started_ = true;
    }
    std::string err = recover();
    if (!err.empty()) std::cerr << "[controller] recovery: " << err << "\n";

    pool_.start_watchdog();
    for (int i = 0; i < opts_.workers; i++) {
        workers_.emplace_back([this] { worker_loop(); });
    }
    std::cerr << "[controller] started: workers=" << opts_.workers << " sandboxes=" << pool_.capacity()
              << " backend=" << backend_.name() << "\n";
    return err;
}

void EvolutionController::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_) return;
        started_ = false;
    }
    queue_.shutdown();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
    auto left = queue_.drain();
    if (!left.empty()) {
        std::cerr << "[controller] stop: " << left.size() << " queued request(s) left for recovery\n";
    }
    pool_.stop_watchdog();
}

// ---------- journal ----------

std::string EvolutionController::journal_submit(const EvolutionRequest& req, int attempt) {
    if (!journal_) return "";
    json_object* o = json_object_new_object();
    json_object_object_add(o, "op", json_object_new_string("submit"));
    json_object_object_add(o, "attempt", json_object_new_int(attempt));
    json_object_object_add(o, "request", request_to_json(req));
    std::string line = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
    json_object_put(o);
    return journal_->append_json_line(line);
}

std::string EvolutionController::journal_done(const std::string& id) {
    if (!journal_) return "";
    json_object* o = json_object_new_object();
    json_object_object_add(o, "op", json_object_new_string("done"));
    json_object_object_add(o, "id", json_object_new_string(id.c_str()));
    std::string line = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
    json_object_put(o);
    std::string err = journal_->append_json_line(line);
    if (!err.empty()) std::cerr << "[controller] intake journal: " << err << "\n";
    return err;
}

// ---------- transitions ----------

void EvolutionController::notify(const TransitionEvent& ev) {
    std::vector<ITransitionObserver*> obs;
    {
        std::lock_guard<std::mutex> lk(obs_mu_);
        obs = observers_;
    }
    for (auto* o : obs) {
        try {
            o->on_transition(ev);
        } catch (const std::exception& e) {
            std::cerr << "[controller] observer failed on " << ev.request_id << ": " << e.what() << "\n";
        }
    }
}

void EvolutionController::transition(const std::string& id, RequestState to, const std::string& detail) {
    TransitionEvent ev;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return;
        ev.from = it->second.result.state;
        it->second.result.state = to;
        if (is_terminal(to)) entries_.erase(it);
    }
    cv_.notify_all();
    ev.request_id = id;
    ev.to = to;
    ev.at_ms = now_ms();
    ev.detail = detail;
    notify(ev);
}

RequestState EvolutionController::target_for(const PolicyDecision& d, const StaticAnalysisReport& report) {
    if (report.risk == RiskAssessment::BLOCKED) return RequestState::BLOCKED;
    switch (d.level) {
        case ApprovalLevel::AUTO_APPROVE: return RequestState::AUTO_APPROVED;
        case ApprovalLevel::REQUIRE_REVIEW: return RequestState::PENDING_HUMAN_REVIEW;
        case ApprovalLevel::REJECT: return RequestState::REJECTED;
    }
    return RequestState::REJECTED;
}

// ---------- submit / query ----------

std::string EvolutionController::submit(EvolutionRequest req) {
    if (req.id.empty()) req.id = gen_hex_id("evo-");
    if (req.submitted_at_ms == 0) req.submitted_at_ms = now_ms();
    const std::string id = req.id;

    {
        std::lock_guard<std::mutex> lk(mu_);
        if (entries_.count(id)) return id;
    }
    if (audit_.has_decision(id)) return id;

    Entry e;
    e.request = req;
    e.result.request_id = id;
    e.result.state = RequestState::SUBMITTED;
    e.result.attempts = 1;
    e.ts.submitted_ms = req.submitted_at_ms;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!entries_.emplace(id, std::move(e)).second) return id;
    }

    std::string jerr = journal_submit(req, 1);
    if (!jerr.empty()) std::cerr << "[controller] " << id << ": intake journal: " << jerr << "\n";

    TransitionEvent ev;
    ev.request_id = id;
    ev.from = RequestState::SUBMITTED;
    ev.to = RequestState::SUBMITTED;
    ev.at_ms = now_ms();
    ev.detail = "submitted";
    notify(ev);

    if (!queue_.push(req.priority, id)) {
        std::cerr << "[controller] " << id << ": queue closed, left in intake journal\n";
    }
    cv_.notify_all();
    return id;
}

bool EvolutionController::status_from_audit(const std::string& request_id, EvolutionResult* out) const {
    AuditRecord rec;
    if (!audit_.get_decision(request_id, &rec)) return false;
    EvolutionResult r;
    r.request_id = request_id;
    r.state = rec.final_state;
    r.report = rec.report;
    r.execution = rec.execution;
    r.decision = rec.decision;
    r.attempts = rec.attempts;
    for (const auto& e : audit_.entries_for(request_id)) {
        if (e.kind != "review") continue;
        ReviewResolution rv = review_from_json_string(e.record_json);
        r.state = rv.approved ? RequestState::APPROVED : RequestState::REJECTED;
    }
    *out = std::move(r);
    return true;
}

bool EvolutionController::get_status(const std::string& request_id, EvolutionResult* out) const {
    if (!out) return false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(request_id);
        if (it != entries_.end()) {
            *out = it->second.result;
            return true;
        }
    }
    return status_from_audit(request_id, out);
}

std::vector<EvolutionResult> EvolutionController::list_pending_reviews() const {
    std::vector<EvolutionResult> out;
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : entries_) {
        if (kv.second.result.state == RequestState::PENDING_HUMAN_REVIEW) out.push_back(kv.second.result);
    }
    return out;
}

std::optional<EvolutionResult> EvolutionController::wait_for(const std::string& request_id, int timeout_ms) const {
    std::unique_lock<std::mutex> lk(mu_);
    if (entries_.find(request_id) != entries_.end()) {
        // Settled, or evicted after reaching a terminal state.
        auto done = [&] {
            auto it = entries_.find(request_id);
            return it == entries_.end() || settled(it->second.result.state);
        };
        if (timeout_ms < 0) {
            cv_.wait(lk, done);
        } else if (!cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), done)) {
            return std::nullopt;
        }
        auto it = entries_.find(request_id);
        if (it != entries_.end()) return it->second.result;
    }
    lk.unlock();
    EvolutionResult r;
    if (status_from_audit(request_id, &r)) return r;
    return std::nullopt;
}

size_t EvolutionController::tracked() const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_.size();
}

EvolutionStats EvolutionController::stats() const {
    EvolutionStats s;
    std::map<std::string, RequestState> states;
    for (const auto& a : audit_.list()) {
        if (a.kind == "decision") {
            AuditRecord rec;
            if (!audit_.get_decision(a.request_id, &rec)) continue;
            states[a.request_id] = rec.final_state;
            s.by_approval[rec.decision.level]++;
        } else if (a.kind == "review") {
            ReviewResolution rv = review_from_json_string(a.record_json);
            states[a.request_id] = rv.approved ? RequestState::APPROVED : RequestState::REJECTED;
        }
    }
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& kv : entries_) states[kv.first] = kv.second.result.state;
    }
    s.total = states.size();
    for (const auto& kv : states) s.by_state[kv.second]++;
    s.queued = queue_.size();
    s.sandboxes_in_use = pool_.in_use();
    s.sandboxes_peak = pool_.peak_in_use();
    s.sandboxes_acquired = pool_.total_acquired();
    s.watchdog_reclaims = pool_.watchdog_reclaims();
    return s;
}

std::vector<EvolutionResult> EvolutionController::history(size_t limit) const {
    std::vector<EvolutionResult> out;
    const std::vector<AuditEntry> all = audit_.list();
    for (auto it = all.rbegin(); it != all.rend() && out.size() < limit; ++it) {
        if (it->kind != "decision") continue;
        EvolutionResult r;
        if (status_from_audit(it->request_id, &r)) out.push_back(std::move(r));
    }
    return out;
}

// ---------- cancel / review ----------

bool EvolutionController::cancel(const std::string& request_id) {
    EvolutionRequest req;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(request_id);
        if (it == entries_.end()) return false;
        Entry& e = it->second;
        switch (e.result.state) {
            case RequestState::STATIC_ANALYZING:
            case RequestState::SANDBOX_TESTING:
                e.cancel->store(true);
                std::cerr << "[controller] " << request_id << ": cancel requested in "
                          << state_to_str(e.result.state) << "\n";
                return true;
            case RequestState::SUBMITTED:
                // Claimed here; a worker that already popped the id skips it.
                e.cancel->store(true);
                e.result.state = RequestState::DECIDING;
                req = e.request;
                queue_.erase(request_id);
                break;
            default:
                return false;
        }
    }
    cv_.notify_all();
    notify(TransitionEvent{request_id, RequestState::SUBMITTED, RequestState::DECIDING, now_ms(),
                           "cancelled while queued"});

    StaticAnalysisReport report = analyzer_.analyze(req.source_code);
    ExecutionResult exec;
    exec.status = ExecutionStatus::NOT_RUN;
    exec.cancelled = true;
    PolicyDecision d = policy_.decide(report, exec, now_ms());
    finish(request_id, report, exec, d, target_for(d, report));
    return true;
}

bool EvolutionController::resolve_review(const std::string& request_id,
                                         bool approved,
                                         const std::string& reviewer,
                                         const std::string& note) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(request_id);
        if (it == entries_.end()) return false;
        if (it->second.result.state != RequestState::PENDING_HUMAN_REVIEW || it->second.resolving) return false;
        it->second.resolving = true;
    }

    ReviewResolution r;
    r.request_id = request_id;
    r.approved = approved;
    r.reviewer = reviewer;
    r.note = note;
    r.resolved_at_ms = now_ms();
    std::string err = audit_.append_review(r);

    {
        std::lock_guard<std::mutex> lk(mu_);
        auto& e = entries_[request_id];
        e.resolving = false;
        if (!err.empty()) e.result.last_error = "review audit failed: " + err;
    }
    if (!err.empty()) {
        std::cerr << "[controller] " << request_id << ": review not recorded: " << err << "\n";
        return false;
    }
    transition(request_id, approved ? RequestState::APPROVED : RequestState::REJECTED,
               reviewer.empty() ? "review" : "review by " + reviewer);
    return true;
}

// ---------- pipeline ----------

void EvolutionController::worker_loop() {
    ConcurrentPriorityQueue<std::string>::Item item;
    while (queue_.pop(item)) {
        const std::string& id = item.value;
        try {
            process(id);
        } catch (const std::exception& e) {
            std::cerr << "[controller] " << id << ": internal error: " << e.what() << "\n";
            StaticAnalysisReport report;
            ExecutionResult exec;
            bool live = false;
            {
                std::lock_guard<std::mutex> lk(mu_);
                auto it = entries_.find(id);
                if (it != entries_.end() && !settled(it->second.result.state)) {
                    live = true;
                    it->second.result.last_error = e.what();
                    if (it->second.result.report) report = *it->second.result.report;
                    if (it->second.result.execution) exec = *it->second.result.execution;
                }
            }
            if (!live) continue;
            PolicyDecision d;
            d.level = ApprovalLevel::REJECT;
            d.reasons = {std::string(error_code_name(ErrorCode::INTERNAL_ERROR)) + ": " + e.what()};
            d.decided_at_ms = now_ms();
            try {
                finish(id, report, exec, d, RequestState::REJECTED);
            } catch (const std::exception& e2) {
                std::cerr << "[controller] " << id << ": could not record internal error: " << e2.what() << "\n";
            }
        }
    }
}

void EvolutionController::process(const std::string& id) {
    EvolutionRequest req;
    std::shared_ptr<std::atomic<bool>> cancel;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(id);
        if (it == entries_.end() || it->second.result.state != RequestState::SUBMITTED) return;
        it->second.result.state = RequestState::STATIC_ANALYZING;
        req = it->second.request;
        cancel = it->second.cancel;
    }
    cv_.notify_all();
    notify(TransitionEvent{id, RequestState::SUBMITTED, RequestState::STATIC_ANALYZING, now_ms(), ""});

    StaticAnalysisReport report = analyzer_.analyze(req.source_code);
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto& e = entries_[id];
        e.ts.analyzed_ms = now_ms();
        e.result.report = report;
    }

    ExecutionResult exec;
    exec.status = ExecutionStatus::NOT_RUN;

    if (req.test_cases.size() != req.expected_outcomes.size()) {
        PolicyDecision d;
        d.level = ApprovalLevel::REJECT;
        d.reasons.push_back("invalid request: " + std::to_string(req.test_cases.size()) + " test cases but " +
                            std::to_string(req.expected_outcomes.size()) + " expected outcomes");
        d.decided_at_ms = now_ms();
        transition(id, RequestState::DECIDING);
        finish(id, report, exec, d, RequestState::REJECTED);
        return;
    }

    if (report.risk == RiskAssessment::BLOCKED) {
        PolicyDecision d = policy_.decide(report, exec, now_ms());
        finish(id, report, exec, d, RequestState::BLOCKED);
        return;
    }

    if (cancel->load()) {
        exec.cancelled = true;
    } else if (report.risk == RiskAssessment::DANGEROUS && !opts_.execute_dangerous) {
        exec.error = "dangerous code not executed";
    } else {
        transition(id, RequestState::SANDBOX_TESTING);
        SandboxConfig cfg = sandbox_config_for(req.isolation, backend_.kind());
        if (opts_.wall_clock_override_ms > 0) cfg.limits.wall_clock_ms = opts_.wall_clock_override_ms;
        exec = executor_.execute(req, report, cfg, cancel.get());
        std::lock_guard<std::mutex> lk(mu_);
        auto& e = entries_[id];
        e.ts.executed_ms = now_ms();
        e.result.execution = exec;
    }

    transition(id, RequestState::DECIDING);
    PolicyDecision d = policy_.decide(report, exec, now_ms());
    if (cancel->load() && d.level != ApprovalLevel::REJECT) {
        // Cancelled after the sandbox finished on its own.
        d.level = ApprovalLevel::REJECT;
        d.reasons = {"cancelled"};
    }
    finish(id, report, exec, d, target_for(d, report));
}

std::string EvolutionController::write_audit_with_retry(const AuditRecord& rec) {
    std::string err;
    for (int attempt = 1; attempt <= opts_.audit_max_attempts; attempt++) {
        err = audit_.append_decision(rec);
        if (err.empty()) return "";
        if (err == AuditStore::kDuplicate) {
            std::cerr << "[controller] " << rec.request.id << ": decision already audited\n";
            return "";
        }
        std::cerr << "[controller] " << rec.request.id << ": audit write attempt " << attempt << "/"
                  << opts_.audit_max_attempts << " failed: " << err << "\n";
        if (attempt < opts_.audit_max_attempts) {
            sleep_ms(backoff_delay_ms(attempt + 1, opts_.audit_backoff_base_ms, 2,
                                      opts_.audit_backoff_max_ms, opts_.audit_jitter_ms));
        }
    }
    return err;
}

void EvolutionController::finish(const std::string& id,
                                 const StaticAnalysisReport& report,
                                 const ExecutionResult& exec,
                                 const PolicyDecision& decision,
                                 RequestState target) {
    AuditRecord rec;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto& e = entries_[id];
        e.ts.decided_ms = decision.decided_at_ms;
        e.result.report = report;
        e.result.execution = exec;
        e.result.decision = decision;
        rec.request = e.request;
        rec.timestamps = e.ts;
        rec.attempts = e.result.attempts;
    }
    rec.report = report;
    rec.execution = exec;
    rec.decision = decision;
    rec.final_state = target;

    std::string err = write_audit_with_retry(rec);
    if (err.empty()) {
        journal_done(id);
        transition(id, target, first_reason(decision));
        return;
    }

    std::cerr << "[controller] " << id << ": " << error_code_name(ErrorCode::INTERNAL_ERROR)
              << ": audit exhausted retries, holding for re-audit\n";
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto& e = entries_[id];
        e.pending_audit = rec;
        e.audit_target = target;
        e.result.last_error = "audit write failed: " + err;
    }
    transition(id, RequestState::NEEDS_REAUDIT, err);
}

int EvolutionController::retry_pending_audits() {
    std::vector<std::pair<std::string, AuditRecord>> todo;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& kv : entries_) {
            if (kv.second.result.state == RequestState::NEEDS_REAUDIT) todo.emplace_back(kv.first, kv.second.pending_audit);
        }
    }
    int written = 0;
    for (const auto& t : todo) {
        std::string err = audit_.append_decision(t.second);
        if (!err.empty() && err != AuditStore::kDuplicate) {
            std::cerr << "[controller] " << t.first << ": re-audit failed: " << err << "\n";
            continue;
        }
        RequestState target = RequestState::REJECTED;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto& e = entries_[t.first];
            target = e.audit_target;
            e.result.last_error.clear();
        }
        journal_done(t.first);
        transition(t.first, target, "re-audited");
        written++;
    }
    return written;
}

// ---------- recovery ----------

std::string EvolutionController::recover() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (recovered_) return "";
        recovered_ = true;
    }

    // Decisions awaiting a human survive restarts through the audit log.
    for (const auto& a : audit_.list()) {
        if (a.kind != "decision") continue;
        EvolutionResult r;
        if (!status_from_audit(a.request_id, &r) || r.state != RequestState::PENDING_HUMAN_REVIEW) continue;
        AuditRecord rec;
        if (!audit_.get_decision(a.request_id, &rec)) continue;
        Entry e;
        e.request = rec.request;
        e.result = r;
        e.ts = rec.timestamps;
        std::lock_guard<std::mutex> lk(mu_);
        entries_.emplace(a.request_id, std::move(e));
    }

    if (!journal_) return "";

    std::vector<std::string> lines;
    bool torn = false;
    uintmax_t good_bytes = 0;
    std::string err = Wal::read_lines(journal_->path(), &lines, &torn, &good_bytes);
    if (!err.empty()) return err;

    struct Pending {
        EvolutionRequest req;
        int attempt{1};
        bool done{false};
    };
    std::map<std::string, Pending> seen;
    std::vector<std::string> order;
    int bad = 0;

    for (const auto& line : lines) {
        json_object* o = json_tokener_parse(line.c_str());
        if (!o) {
            bad++;
            continue;
        }
        std::string op;
        json_get_string(o, "op", &op);
        if (op == "submit") {
            json_object* ro = nullptr;
            EvolutionRequest req;
            std::string perr;
            if (json_object_object_get_ex(o, "request", &ro) && request_from_json(ro, &req, &perr) && !req.id.empty()) {
                int64_t attempt = 1;
                json_get_int64(o, "attempt", &attempt);
                auto it = seen.find(req.id);
                if (it == seen.end()) {
                    order.push_back(req.id);
                    seen[req.id] = Pending{req, (int)attempt, false};
                } else {
                    it->second.attempt = (int)attempt;
                }
            } else {
                bad++;
            }
        } else if (op == "done") {
            std::string id;
            if (json_get_string(o, "id", &id)) seen[id].done = true;
        } else {
            bad++;
        }
        json_object_put(o);
    }
    if (bad > 0) std::cerr << "[controller] intake journal: skipped " << bad << " malformed line(s)\n";
    if (torn) {
        std::cerr << "[controller] intake journal: dropping torn final line\n";
        std::error_code ec;
        std::filesystem::resize_file(journal_->path(), good_bytes, ec);
        if (ec) return "truncate torn journal tail: " + ec.message();
    }

    for (const auto& id : order) {
        const Pending& p = seen[id];
        if (p.done) continue;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (entries_.count(id)) continue;
        }
        if (audit_.has_decision(id)) {
            // Crashed between the audit write and the done mark; get_status
            // already answers from the audit log.
            journal_done(id);
            continue;
        }

        const int attempt = p.attempt + 1;
        Entry e;
        e.request = p.req;
        e.result.request_id = id;
        e.result.state = RequestState::SUBMITTED;
        e.result.attempts = attempt;
        e.result.last_error = "interrupted; retrying";
        e.ts.submitted_ms = p.req.submitted_at_ms;
        {
            std::lock_guard<std::mutex> lk(mu_);
            entries_.emplace(id, std::move(e));
        }

        if (attempt > opts_.max_attempts) {
            std::cerr << "[controller] " << id << ": interrupted " << p.attempt << " time(s), giving up\n";
            transition(id, RequestState::DECIDING, "retry limit reached");
            StaticAnalysisReport report = analyzer_.analyze(p.req.source_code);
            ExecutionResult exec;
            exec.status = ExecutionStatus::ENVIRONMENT_ERROR;
            exec.error = "interrupted; retry limit reached";
            PolicyDecision d;
            d.level = ApprovalLevel::REJECT;
            d.reasons = {"EnvironmentError", "interrupted " + std::to_string(p.attempt) + " time(s)"};
            d.decided_at_ms = now_ms();
            finish(id, report, exec, d, RequestState::REJECTED);
            continue;
        }

        std::string jerr = journal_submit(p.req, attempt);
        if (!jerr.empty()) std::cerr << "[controller] " << id << ": intake journal: " << jerr << "\n";
        std::cerr << "[controller] recovered " << id << " (attempt " << attempt << ")\n";
        queue_.push(p.req.priority, id);
    }
    return "";
}

} // namespace evogate
