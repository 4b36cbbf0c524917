#pragma once

#include "types.h"

#include <cstdint>

namespace evogate {

struct PolicyRules {
    double review_score{0.85};   // security score below this needs a human
};

// PolicyEngine: (report, execution) -> decision. Pure; the caller supplies
// the decision time. Rules, first match wins:
//   1. BLOCKED                                   -> REJECT
//   2. execution failed/timeout/resource/env     -> REJECT
//   3. DANGEROUS                                 -> REQUIRE_REVIEW
//   4. CAUTION or score < review_score           -> REQUIRE_REVIEW
//   5. otherwise                                 -> AUTO_APPROVE
// reasons[0] names the rule; evidence follows.
class PolicyEngine {
public:
    explicit PolicyEngine(PolicyRules rules = {}) : rules_(rules) {}

    PolicyDecision decide(const StaticAnalysisReport& report,
                          const ExecutionResult& exec,
                          int64_t decided_at_ms) const;

    const PolicyRules& rules() const { return rules_; }

private:
    PolicyRules rules_;
};

} // namespace evogate
