#include "evogate/types.h"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace evogate {

static std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return out;
}

bool is_terminal(RequestState s) {
    switch (s) {
        case RequestState::BLOCKED:
        case RequestState::AUTO_APPROVED:
        case RequestState::APPROVED:
        case RequestState::REJECTED:
            return true;
        default:
            return false;
    }
}

const char* isolation_to_str(IsolationLevel v) {
    switch (v) {
        case IsolationLevel::LOW:     return "low";
        case IsolationLevel::MEDIUM:  return "medium";
        case IsolationLevel::HIGH:    return "high";
        case IsolationLevel::MAXIMUM: return "maximum";
    }
    return "high";
}

bool isolation_from_str(const std::string& s, IsolationLevel* out) {
    const std::string v = lower(s);
    if (v == "low") *out = IsolationLevel::LOW;
    else if (v == "medium") *out = IsolationLevel::MEDIUM;
    else if (v == "high") *out = IsolationLevel::HIGH;
    else if (v == "maximum" || v == "max") *out = IsolationLevel::MAXIMUM;
    else return false;
    return true;
}

const char* backend_to_str(BackendKind v) {
    switch (v) {
        case BackendKind::SUBPROCESS: return "subprocess";
        case BackendKind::CONTAINER:  return "container";
        case BackendKind::RESTRICTED: return "restricted";
    }
    return "subprocess";
}

bool backend_from_str(const std::string& s, BackendKind* out) {
    const std::string v = lower(s);
    if (v == "subprocess") *out = BackendKind::SUBPROCESS;
    else if (v == "container" || v == "docker") *out = BackendKind::CONTAINER;
    else if (v == "restricted") *out = BackendKind::RESTRICTED;
    else return false;
    return true;
}

const char* risk_to_str(RiskAssessment v) {
    switch (v) {
        case RiskAssessment::SAFE:      return "safe";
        case RiskAssessment::CAUTION:   return "caution";
        case RiskAssessment::DANGEROUS: return "dangerous";
        case RiskAssessment::BLOCKED:   return "blocked";
    }
    return "blocked";
}

bool risk_from_str(const std::string& s, RiskAssessment* out) {
    const std::string v = lower(s);
    if (v == "safe") *out = RiskAssessment::SAFE;
    else if (v == "caution") *out = RiskAssessment::CAUTION;
    else if (v == "dangerous") *out = RiskAssessment::DANGEROUS;
    else if (v == "blocked") *out = RiskAssessment::BLOCKED;
    else return false;
    return true;
}

const char* execstatus_to_str(ExecutionStatus v) {
    switch (v) {
        case ExecutionStatus::PASSED:            return "passed";
        case ExecutionStatus::FAILED:            return "failed";
        case ExecutionStatus::TIMEOUT:           return "timeout";
        case ExecutionStatus::RESOURCE_EXCEEDED: return "resource_exceeded";
        case ExecutionStatus::ENVIRONMENT_ERROR: return "environment_error";
        case ExecutionStatus::NOT_RUN:           return "not_run";
    }
    return "not_run";
}

bool execstatus_from_str(const std::string& s, ExecutionStatus* out) {
    const std::string v = lower(s);
    if (v == "passed") *out = ExecutionStatus::PASSED;
    else if (v == "failed") *out = ExecutionStatus::FAILED;
    else if (v == "timeout") *out = ExecutionStatus::TIMEOUT;
    else if (v == "resource_exceeded") *out = ExecutionStatus::RESOURCE_EXCEEDED;
    else if (v == "environment_error") *out = ExecutionStatus::ENVIRONMENT_ERROR;
    else if (v == "not_run") *out = ExecutionStatus::NOT_RUN;
    else return false;
    return true;
}

const char* teststatus_to_str(TestStatus v) {
    switch (v) {
        case TestStatus::PASSED:            return "passed";
        case TestStatus::FAILED:            return "failed";
        case TestStatus::TIMEOUT:           return "timeout";
        case TestStatus::RESOURCE_EXCEEDED: return "resource_exceeded";
        case TestStatus::ERROR:             return "error";
    }
    return "error";
}

bool teststatus_from_str(const std::string& s, TestStatus* out) {
    const std::string v = lower(s);
    if (v == "passed") *out = TestStatus::PASSED;
    else if (v == "failed") *out = TestStatus::FAILED;
    else if (v == "timeout") *out = TestStatus::TIMEOUT;
    else if (v == "resource_exceeded") *out = TestStatus::RESOURCE_EXCEEDED;
    else if (v == "error") *out = TestStatus::ERROR;
    else return false;
    return true;
}

const char* approval_to_str(ApprovalLevel v) {
    switch (v) {
        case ApprovalLevel::AUTO_APPROVE:   return "auto_approve";
        case ApprovalLevel::REQUIRE_REVIEW: return "require_review";
        case ApprovalLevel::REJECT:         return "reject";
    }
    return "reject";
}

bool approval_from_str(const std::string& s, ApprovalLevel* out) {
    const std::string v = lower(s);
    if (v == "auto_approve") *out = ApprovalLevel::AUTO_APPROVE;
    else if (v == "require_review") *out = ApprovalLevel::REQUIRE_REVIEW;
    else if (v == "reject") *out = ApprovalLevel::REJECT;
    else return false;
    return true;
}

const char* state_to_str(RequestState v) {
    switch (v) {
        case RequestState::SUBMITTED:            return "submitted";
        case RequestState::STATIC_ANALYZING:     return "static_analyzing";
        case RequestState::BLOCKED:              return "blocked";
        case RequestState::SANDBOX_TESTING:      return "sandbox_testing";
        case RequestState::DECIDING:             return "deciding";
        case RequestState::AUTO_APPROVED:        return "auto_approved";
        case RequestState::PENDING_HUMAN_REVIEW: return "pending_human_review";
        case RequestState::APPROVED:             return "approved";
        case RequestState::REJECTED:             return "rejected";
        case RequestState::NEEDS_REAUDIT:        return "needs_reaudit";
    }
    return "submitted";
}

bool state_from_str(const std::string& s, RequestState* out) {
    static const RequestState all[] = {
        RequestState::SUBMITTED, RequestState::STATIC_ANALYZING, RequestState::BLOCKED,
        RequestState::SANDBOX_TESTING, RequestState::DECIDING, RequestState::AUTO_APPROVED,
        RequestState::PENDING_HUMAN_REVIEW, RequestState::APPROVED, RequestState::REJECTED,
        RequestState::NEEDS_REAUDIT,
    };
    const std::string v = lower(s);
    for (RequestState st : all) {
        if (v == state_to_str(st)) { *out = st; return true; }
    }
    return false;
}

const char* sandbox_state_to_str(SandboxState v) {
    switch (v) {
        case SandboxState::CREATING:   return "creating";
        case SandboxState::READY:      return "ready";
        case SandboxState::RUNNING:    return "running";
        case SandboxState::DESTROYING: return "destroying";
        case SandboxState::DESTROYED:  return "destroyed";
    }
    return "destroyed";
}

const char* error_code_name(ErrorCode c) {
    switch (c) {
        case ErrorCode::NONE:                        return "None";
        case ErrorCode::SYNTAX_INVALID:              return "SyntaxInvalid";
        case ErrorCode::FORBIDDEN_IMPORT:            return "ForbiddenImport";
        case ErrorCode::DANGEROUS_CALL:              return "DangerousCall";
        case ErrorCode::POOL_EXHAUSTED:              return "PoolExhausted";
        case ErrorCode::ENVIRONMENT_CREATION_FAILED: return "EnvironmentCreationFailed";
        case ErrorCode::EXECUTION_TIMEOUT:           return "ExecutionTimeout";
        case ErrorCode::RESOURCE_LIMIT_EXCEEDED:     return "ResourceLimitExceeded";
        case ErrorCode::TEST_MISMATCH:               return "TestMismatch";
        case ErrorCode::INTERNAL_ERROR:              return "InternalError";
    }
    return "InternalError";
}

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace evogate
