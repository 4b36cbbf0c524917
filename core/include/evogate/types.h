#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace evogate {

// Isolation tiers; each maps to a fixed row of sandbox limits (see sandbox_config_for).
enum class IsolationLevel {
    LOW,
    MEDIUM,
    HIGH,
    MAXIMUM
};

enum class BackendKind {
    SUBPROCESS,
    CONTAINER,
    RESTRICTED
};

// Static-analysis verdict, independent of dynamic execution
enum class RiskAssessment {
    SAFE,
    CAUTION,
    DANGEROUS,
    BLOCKED
};

enum class ExecutionStatus {
    PASSED,
    FAILED,
    TIMEOUT,
    RESOURCE_EXCEEDED,
    ENVIRONMENT_ERROR,
    NOT_RUN,            // sandbox stage skipped
};

enum class TestStatus {
    PASSED,
    FAILED,
    TIMEOUT,
    RESOURCE_EXCEEDED,
    ERROR,
};

enum class ApprovalLevel {
    AUTO_APPROVE,
    REQUIRE_REVIEW,
    REJECT
};

// Controller state machine. BLOCKED, AUTO_APPROVED, APPROVED and REJECTED are terminal.
enum class RequestState {
    SUBMITTED,
    STATIC_ANALYZING,
    BLOCKED,
    SANDBOX_TESTING,
    DECIDING,
    AUTO_APPROVED,
    PENDING_HUMAN_REVIEW,
    APPROVED,
    REJECTED,
    NEEDS_REAUDIT,      // decided, audit write exhausted its retries
};

enum class SandboxState {
    CREATING,
    READY,
    RUNNING,
    DESTROYING,
    DESTROYED
};

enum class FilesystemAccess {
    READ_WRITE,
    READ_ONLY,
    NONE
};

enum class ErrorCode {
    NONE,
    SYNTAX_INVALID,
    FORBIDDEN_IMPORT,
    DANGEROUS_CALL,
    POOL_EXHAUSTED,
    ENVIRONMENT_CREATION_FAILED,
    EXECUTION_TIMEOUT,
    RESOURCE_LIMIT_EXCEEDED,
    TEST_MISMATCH,
    INTERNAL_ERROR,
};

// A Python expression evaluated against the loaded candidate module, e.g. "fib(10)".
struct TestCase {
    std::string name;
    std::string expression;
};

enum class OutcomeKind {
    VALUE,   // repr() of the result must equal value
    RAISES   // expression must raise an exception whose class name is value
};

struct ExpectedOutcome {
    OutcomeKind kind{OutcomeKind::VALUE};
    std::string value;
};

struct EvolutionRequest {
    std::string id;
    std::string source_code;
    std::vector<TestCase> test_cases;
    std::vector<ExpectedOutcome> expected_outcomes;
    IsolationLevel isolation{IsolationLevel::HIGH};
    int priority{0};            // larger = more urgent
    int64_t submitted_at_ms{0};
};

struct StaticAnalysisReport {
    bool syntax_valid{false};
    std::string syntax_error;
    std::vector<std::string> forbidden_imports;
    std::vector<std::string> dangerous_calls;
    std::vector<std::string> unlisted_imports;
    std::vector<std::string> warnings;
    double complexity_score{0.0};
    double security_score{0.0};
    RiskAssessment risk{RiskAssessment::BLOCKED};
    int line_count{0};

    bool operator==(const StaticAnalysisReport&) const = default;
};

struct ResourceLimits {
    double cpu_share{0.3};      // fraction of one core; also scales the CPU-seconds rlimit
    size_t memory_mb{128};
    int wall_clock_ms{5000};    // per test run
    int max_file_ops{64};       // open descriptors
};

struct SandboxConfig {
    BackendKind backend{BackendKind::SUBPROCESS};
    IsolationLevel isolation{IsolationLevel::HIGH};
    ResourceLimits limits;
    bool network_allowed{false};
    FilesystemAccess filesystem{FilesystemAccess::READ_ONLY};

    bool filesystem_allowed() const { return filesystem != FilesystemAccess::NONE; }
};

struct ResourceUsage {
    int64_t cpu_ms{0};
    int64_t peak_rss_kb{0};
    int64_t wall_ms{0};
};

struct PerTestResult {
    std::string name;
    TestStatus status{TestStatus::ERROR};
    std::string expected;
    std::string actual;
    std::string stdout_text;
    std::string stderr_text;
    int exit_code{-1};
    int64_t duration_ms{0};
};

struct ExecutionResult {
    ExecutionStatus status{ExecutionStatus::NOT_RUN};
    std::vector<PerTestResult> per_test;
    std::string stdout_text;
    std::string stderr_text;
    ResourceUsage usage;
    int64_t duration_ms{0};
    bool cancelled{false};
    std::string error;          // environment/internal error detail
};

struct PolicyDecision {
    ApprovalLevel level{ApprovalLevel::REJECT};
    std::vector<std::string> reasons;
    int64_t decided_at_ms{0};
};

struct AuditTimestamps {
    int64_t submitted_ms{0};
    int64_t analyzed_ms{0};
    int64_t executed_ms{0};
    int64_t decided_ms{0};
};

struct AuditRecord {
    EvolutionRequest request;
    StaticAnalysisReport report;
    ExecutionResult execution;
    PolicyDecision decision;
    RequestState final_state{RequestState::REJECTED};
    AuditTimestamps timestamps;
    int attempts{1};
};

// Snapshot returned by EvolutionController::get_status
struct EvolutionResult {
    std::string request_id;
    RequestState state{RequestState::SUBMITTED};
    std::optional<StaticAnalysisReport> report;
    std::optional<ExecutionResult> execution;
    std::optional<PolicyDecision> decision;
    int attempts{1};
    std::string last_error;
};

// Counts over every request the controller or its audit log knows about.
struct EvolutionStats {
    uint64_t total{0};
    std::map<RequestState, uint64_t> by_state;
    std::map<ApprovalLevel, uint64_t> by_approval;     // audited decisions only
    uint64_t queued{0};
    uint64_t sandboxes_in_use{0};
    uint64_t sandboxes_peak{0};
    uint64_t sandboxes_acquired{0};
    uint64_t watchdog_reclaims{0};
};

bool is_terminal(RequestState s);

const char* isolation_to_str(IsolationLevel v);
bool isolation_from_str(const std::string& s, IsolationLevel* out);
const char* backend_to_str(BackendKind v);
bool backend_from_str(const std::string& s, BackendKind* out);
const char* risk_to_str(RiskAssessment v);
bool risk_from_str(const std::string& s, RiskAssessment* out);
const char* execstatus_to_str(ExecutionStatus v);
bool execstatus_from_str(const std::string& s, ExecutionStatus* out);
const char* teststatus_to_str(TestStatus v);
bool teststatus_from_str(const std::string& s, TestStatus* out);
const char* approval_to_str(ApprovalLevel v);
bool approval_from_str(const std::string& s, ApprovalLevel* out);
const char* state_to_str(RequestState v);
bool state_from_str(const std::string& s, RequestState* out);
const char* sandbox_state_to_str(SandboxState v);
const char* error_code_name(ErrorCode c);

int64_t now_ms();

} // namespace evogate
