#include "test_common.h"

#include "evogate/audit.h"
#include "evogate/util.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

using namespace evogate;

static AuditRecord make_record(const std::string& id, RequestState final_state) {
    AuditRecord rec;
    rec.request.id = id;
    rec.request.source_code = "def f():\n    return \"a/b\"\n";
    rec.request.test_cases.push_back(TestCase{"t0", "f()"});
    rec.request.expected_outcomes.push_back(ExpectedOutcome{OutcomeKind::VALUE, "'a/b'"});
    rec.request.submitted_at_ms = 1700000000000;
    rec.report.syntax_valid = true;
    rec.report.security_score = 0.93;
    rec.report.complexity_score = 0.1;
    rec.report.risk = RiskAssessment::SAFE;
    rec.report.line_count = 2;
    rec.execution.status = ExecutionStatus::PASSED;
    PerTestResult t;
    t.name = "t0";
    t.status = TestStatus::PASSED;
    t.expected = "'a/b'";
    t.actual = "'a/b'";
    t.exit_code = 0;
    rec.execution.per_test.push_back(t);
    rec.decision.level = final_state == RequestState::AUTO_APPROVED ? ApprovalLevel::AUTO_APPROVE
                                                                     : ApprovalLevel::REQUIRE_REVIEW;
    rec.decision.reasons = {"static analysis safe and all tests passed"};
    rec.decision.decided_at_ms = 1700000000500;
    rec.final_state = final_state;
    rec.timestamps.submitted_ms = 1700000000000;
    rec.timestamps.decided_ms = 1700000000500;
    return rec;
}

static std::vector<std::string> read_all_lines(const std::filesystem::path& p) {
    std::vector<std::string> lines;
    std::ifstream f(p);
    std::string line;
    while (std::getline(f, line)) lines.push_back(line);
    return lines;
}

static void write_all_lines(const std::filesystem::path& p, const std::vector<std::string>& lines) {
    std::ofstream f(p, std::ios::trunc);
    for (const auto& l : lines) f << l << "\n";
}

int main() {
    namespace fs = std::filesystem;
    fs::path dir = fresh_test_dir("audit");
    fs::path path = dir / "audit.jsonl";

    {
        AuditStore store(path);
        std::string err = store.open();
        expect_true(err.empty(), "open empty store: " + err);
        expect_eq_ll((long long)store.next_seq(), 1, "sequence starts at 1");

        uint64_t seq = 0;
        err = store.append_decision(make_record("evo-a", RequestState::AUTO_APPROVED), &seq);
        expect_true(err.empty(), "append decision a: " + err);
        expect_eq_ll((long long)seq, 1, "first seq");

        err = store.append_decision(make_record("evo-b", RequestState::PENDING_HUMAN_REVIEW), &seq);
        expect_true(err.empty(), "append decision b: " + err);
        expect_eq_ll((long long)seq, 2, "second seq");

        err = store.append_decision(make_record("evo-a", RequestState::REJECTED));
        expect_eq_str(err, AuditStore::kDuplicate, "second decision for a key is refused");

        ReviewResolution orphan;
        orphan.request_id = "evo-nope";
        expect_true(!store.append_review(orphan).empty(), "review without a decision is refused");

        ReviewResolution rv;
        rv.request_id = "evo-b";
        rv.approved = true;
        rv.reviewer = "alice";
        rv.note = "checked by hand";
        rv.resolved_at_ms = 1700000001000;
        err = store.append_review(rv, &seq);
        expect_true(err.empty(), "append review: " + err);
        expect_eq_ll((long long)seq, 3, "review seq");

        auto b_entries = store.entries_for("evo-b");
        expect_eq_ll((long long)b_entries.size(), 2, "decision + review for b");
        expect_eq_str(b_entries[1].kind, "review", "review kind");
        ReviewResolution back = review_from_json_string(b_entries[1].record_json);
        expect_true(back.approved && back.reviewer == "alice", "review fields survive");
        expect_eq_str(b_entries[1].chain_prev, store.list()[1].chain_hash, "review chains from the previous entry");
    }

    // Reopen replays index, sequence and chain head.
    {
        AuditStore store(path);
        std::string err = store.open();
        expect_true(err.empty(), "reopen: " + err);
        expect_eq_ll((long long)store.next_seq(), 4, "sequence continues");
        expect_true(store.has_decision("evo-a") && store.has_decision("evo-b"), "index rebuilt");
        expect_eq_str(store.append_decision(make_record("evo-b", RequestState::REJECTED)), AuditStore::kDuplicate,
                      "duplicate refused after reopen");

        AuditRecord got;
        expect_true(store.get_decision("evo-a", &got), "decision readable");
        AuditRecord want = make_record("evo-a", RequestState::AUTO_APPROVED);
        expect_eq_str(got.request.source_code, want.request.source_code, "source survives");
        expect_true(got.report == want.report, "report survives");
        expect_true(got.final_state == RequestState::AUTO_APPROVED, "final state survives");
        expect_eq_ll(got.decision.decided_at_ms, want.decision.decided_at_ms, "decision time survives");
        expect_eq_str(got.execution.per_test[0].actual, "'a/b'", "per-test result survives");

        err = store.append_decision(make_record("evo-c", RequestState::AUTO_APPROVED));
        expect_true(err.empty(), "append after reopen: " + err);
    }

    AuditVerifyResult v = AuditStore::verify_file(path);
    expect_true(v.ok, "chain verifies: " + v.error);
    expect_eq_ll((long long)v.entries, 4, "four entries");

    auto pristine = read_all_lines(path);
    expect_eq_ll((long long)pristine.size(), 4, "four lines on disk");
    expect_true(contains(pristine[0], "\"chain_prev\":\"" + std::string(64, '0') + "\""), "genesis chain_prev");

    // Tampering with a record breaks its hash.
    {
        auto lines = pristine;
        const std::string from = "static analysis safe";
        size_t pos = lines[1].find(from);
        expect_true(pos != std::string::npos, "reason present in line 2");
        lines[1].replace(pos, from.size(), "static analysis SAFE");
        write_all_lines(path, lines);
        v = AuditStore::verify_file(path);
        expect_true(!v.ok, "tampered record detected");
        expect_eq_ll((long long)v.first_bad_seq, 2, "first bad seq is the tampered one");
        expect_true(contains(v.error, "chain_hash"), "hash mismatch reported: " + v.error);
    }

    // Dropping an entry leaves a gap.
    {
        auto lines = pristine;
        lines.erase(lines.begin() + 1);
        write_all_lines(path, lines);
        v = AuditStore::verify_file(path);
        expect_true(!v.ok, "deleted entry detected");
        expect_eq_ll((long long)v.first_bad_seq, 3, "gap reported at the next entry");
    }

    // A torn final line fails verification; open() cuts it and appends continue.
    {
        write_all_lines(path, pristine);
        {
            std::ofstream f(path, std::ios::app);
            f << "{\"chain_hash\":\"ab";
        }
        v = AuditStore::verify_file(path);
        expect_true(!v.ok && contains(v.error, "torn"), "torn tail reported");

        AuditStore store(path);
        std::string err = store.open();
        expect_true(err.empty(), "open truncates the torn tail: " + err);
        err = store.append_decision(make_record("evo-d", RequestState::AUTO_APPROVED));
        expect_true(err.empty(), "append after truncation: " + err);
        v = AuditStore::verify_file(path);
        expect_true(v.ok, "chain intact after truncation: " + v.error);
        expect_eq_ll((long long)v.entries, 5, "five entries");
    }

    AuditEntry e;
    expect_true(parse_audit_line(pristine[0], &e), "line parses");
    expect_eq_str(e.request_id, "evo-a", "parsed request id");
    expect_true(!parse_audit_line("{\"seq\":0}", &e), "malformed line rejected");

    std::error_code ec;
    fs::remove_all(dir, ec);
    std::cerr << "test_audit: ALL PASSED" << std::endl;
    return 0;
}
