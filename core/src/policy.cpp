#include "evogate/policy.h"

#include <cstdio>

namespace evogate {

namespace {

std::string fmt_score(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", v);
    return buf;
}

void add_static_evidence(const StaticAnalysisReport& report, std::vector<std::string>* reasons) {
    for (const auto& m : report.forbidden_imports) reasons->push_back("forbidden import: " + m);
    for (const auto& c : report.dangerous_calls) reasons->push_back("dangerous call: " + c);
}

void add_score_evidence(const StaticAnalysisReport& report, double review_score, std::vector<std::string>* reasons) {
    if (report.security_score < review_score) {
        reasons->push_back("security score " + fmt_score(report.security_score) + " below " + fmt_score(review_score));
    }
}

} // namespace

PolicyDecision PolicyEngine::decide(const StaticAnalysisReport& report,
                                    const ExecutionResult& exec,
                                    int64_t decided_at_ms) const {
    PolicyDecision d;
    d.decided_at_ms = decided_at_ms;

    // 1
    if (report.risk == RiskAssessment::BLOCKED) {
        d.level = ApprovalLevel::REJECT;
        d.reasons.push_back("static analysis blocked");
        if (!report.syntax_valid && !report.syntax_error.empty()) {
            d.reasons.push_back("syntax error: " + report.syntax_error);
        }
        return d;
    }

    // 2
    if (exec.cancelled) {
        d.level = ApprovalLevel::REJECT;
        d.reasons.push_back("cancelled");
        return d;
    }
    switch (exec.status) {
        case ExecutionStatus::FAILED:
        case ExecutionStatus::TIMEOUT:
        case ExecutionStatus::RESOURCE_EXCEEDED:
        case ExecutionStatus::ENVIRONMENT_ERROR:
            d.level = ApprovalLevel::REJECT;
            d.reasons.push_back(std::string("execution ") + execstatus_to_str(exec.status));
            for (const auto& t : exec.per_test) {
                if (t.status != TestStatus::PASSED) {
                    d.reasons.push_back("test " + t.name + ": " + teststatus_to_str(t.status) +
                                        " (expected " + t.expected + ", got " + t.actual + ")");
                }
            }
            if (!exec.error.empty()) d.reasons.push_back(exec.error);
            add_static_evidence(report, &d.reasons);
            return d;
        case ExecutionStatus::PASSED:
        case ExecutionStatus::NOT_RUN:
            break;
    }

    // 3
    if (report.risk == RiskAssessment::DANGEROUS) {
        d.level = ApprovalLevel::REQUIRE_REVIEW;
        d.reasons.push_back("dangerous code requires review");
        add_static_evidence(report, &d.reasons);
        if (exec.status == ExecutionStatus::NOT_RUN) d.reasons.push_back("dynamic testing skipped");
        add_score_evidence(report, rules_.review_score, &d.reasons);
        return d;
    }

    // 4
    if (report.risk == RiskAssessment::CAUTION || report.security_score < rules_.review_score) {
        d.level = ApprovalLevel::REQUIRE_REVIEW;
        d.reasons.push_back(report.risk == RiskAssessment::CAUTION ? "caution risk requires review"
                                                                    : "security score requires review");
        add_score_evidence(report, rules_.review_score, &d.reasons);
        if (exec.status == ExecutionStatus::NOT_RUN) d.reasons.push_back("dynamic testing skipped");
        return d;
    }

    // 5
    if (exec.status == ExecutionStatus::NOT_RUN) {
        // Safe code that never ran has no dynamic evidence.
        d.level = ApprovalLevel::REQUIRE_REVIEW;
        d.reasons.push_back("dynamic testing skipped");
        return d;
    }
    d.level = ApprovalLevel::AUTO_APPROVE;
    d.reasons.push_back("static analysis safe and all tests passed");
    return d;
}

} // namespace evogate
