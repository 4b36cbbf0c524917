#include "test_common.h"

#include "evogate/policy.h"
#include "evogate/static_analyzer.h"

#include <algorithm>

using namespace evogate;

static bool has_reason(const PolicyDecision& d, const std::string& needle) {
    return std::any_of(d.reasons.begin(), d.reasons.end(), [&](const std::string& r) { return contains(r, needle); });
}

static ExecutionResult exec_with(ExecutionStatus st) {
    ExecutionResult e;
    e.status = st;
    return e;
}

int main() {
    StaticAnalyzer analyzer;
    PolicyEngine policy;

    const auto safe = analyzer.analyze("def add(a, b):\n    return a + b\n");
    const auto dangerous = analyzer.analyze("import subprocess\nsubprocess.run(['sh'])\n");
    const auto blocked = analyzer.analyze("def f(:\n");

    // Safe and passed.
    {
        auto d = policy.decide(safe, exec_with(ExecutionStatus::PASSED), 1234);
        expect_true(d.level == ApprovalLevel::AUTO_APPROVE, "safe+passed auto-approves");
        expect_eq_ll(d.decided_at_ms, 1234, "decision time is the caller's");
        expect_true(!d.reasons.empty(), "auto-approve has a reason");
    }

    // Blocked always rejects, whatever the execution says.
    {
        auto d = policy.decide(blocked, exec_with(ExecutionStatus::PASSED), 0);
        expect_true(d.level == ApprovalLevel::REJECT, "blocked rejects");
        expect_eq_str(d.reasons.front(), "static analysis blocked", "first reason");
        expect_true(has_reason(d, "syntax error"), "syntax error is evidence");
    }

    // Failing executions reject, with the failing test as evidence.
    for (auto st : {ExecutionStatus::FAILED, ExecutionStatus::TIMEOUT, ExecutionStatus::RESOURCE_EXCEEDED,
                    ExecutionStatus::ENVIRONMENT_ERROR}) {
        ExecutionResult e = exec_with(st);
        PerTestResult t;
        t.name = "t1";
        t.status = TestStatus::FAILED;
        t.expected = "55";
        t.actual = "54";
        e.per_test.push_back(t);
        auto d = policy.decide(safe, e, 0);
        expect_true(d.level == ApprovalLevel::REJECT, std::string("reject on ") + execstatus_to_str(st));
        expect_true(has_reason(d, std::string("execution ") + execstatus_to_str(st)), "status reason");
        expect_true(has_reason(d, "test t1"), "failing test named");
    }

    // Execution failure beats dangerous: reject, not review.
    {
        auto d = policy.decide(dangerous, exec_with(ExecutionStatus::TIMEOUT), 0);
        expect_true(d.level == ApprovalLevel::REJECT, "dangerous+timeout rejects");
        expect_true(has_reason(d, "dangerous call: subprocess.run"), "static evidence attached");
    }

    // Cancelled rejects with "cancelled".
    {
        ExecutionResult e = exec_with(ExecutionStatus::ENVIRONMENT_ERROR);
        e.cancelled = true;
        auto d = policy.decide(safe, e, 0);
        expect_true(d.level == ApprovalLevel::REJECT, "cancelled rejects");
        expect_eq_str(d.reasons.front(), "cancelled", "cancel reason");
    }

    // Dangerous never auto-approves.
    for (auto st : {ExecutionStatus::PASSED, ExecutionStatus::NOT_RUN}) {
        auto d = policy.decide(dangerous, exec_with(st), 0);
        expect_true(d.level == ApprovalLevel::REQUIRE_REVIEW, "dangerous needs review");
        expect_true(has_reason(d, "forbidden import: subprocess"), "import evidence");
        expect_true(has_reason(d, "dangerous call: subprocess.run"), "call evidence");
        expect_true(has_reason(d, "dynamic testing skipped") == (st == ExecutionStatus::NOT_RUN),
                    "skipped testing reported only when not run");
    }

    // Caution and low scores need review.
    {
        StaticAnalysisReport r = safe;
        r.risk = RiskAssessment::CAUTION;
        r.security_score = 0.6;
        auto d = policy.decide(r, exec_with(ExecutionStatus::PASSED), 0);
        expect_true(d.level == ApprovalLevel::REQUIRE_REVIEW, "caution needs review");
        expect_true(has_reason(d, "below 0.85"), "score evidence");

        StaticAnalysisReport low = safe;
        low.security_score = 0.8;
        d = policy.decide(low, exec_with(ExecutionStatus::PASSED), 0);
        expect_true(d.level == ApprovalLevel::REQUIRE_REVIEW, "score under threshold needs review");

        PolicyEngine lenient(PolicyRules{0.5});
        d = lenient.decide(low, exec_with(ExecutionStatus::PASSED), 0);
        expect_true(d.level == ApprovalLevel::AUTO_APPROVE, "threshold is configurable");
    }

    // Safe code that never ran has no dynamic evidence.
    {
        auto d = policy.decide(safe, exec_with(ExecutionStatus::NOT_RUN), 0);
        expect_true(d.level == ApprovalLevel::REQUIRE_REVIEW, "safe+not run needs review");
        expect_true(has_reason(d, "dynamic testing skipped"), "skip reason");
    }

    std::cerr << "test_policy: ALL PASSED" << std::endl;
    return 0;
}
