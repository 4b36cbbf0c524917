#pragma once

#include "types.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace evogate {

// Lists and thresholds the analyzer is built with.
// Module lists match a dotted module or any of its parent packages.
// A dangerous-call entry ending in '*' matches by prefix ("subprocess.*", "os.exec*").
struct AnalyzerRules {
    std::vector<std::string> allowed_imports;
    std::vector<std::string> forbidden_imports;
    std::vector<std::string> dangerous_calls;
    double caution_score{0.7};
    size_t max_source_bytes{1024 * 1024};
    int max_nesting{200};

    static AnalyzerRules defaults();
};

// StaticAnalyzer: source text -> StaticAnalysisReport.
//
// Total and side-effect free: unparsable input yields syntax_valid=false and
// risk BLOCKED, never an exception. Immutable after construction, so one
// instance is shared by all controller workers.
class StaticAnalyzer {
public:
    explicit StaticAnalyzer(AnalyzerRules rules = AnalyzerRules::defaults());

    StaticAnalysisReport analyze(const std::string& source) const;

    const AnalyzerRules& rules() const { return rules_; }

private:
    enum class ImportClass { ALLOWED, FORBIDDEN, UNLISTED };

    ImportClass classify_import(const std::string& module) const;
    bool call_is_dangerous(const std::string& qualified) const;

    AnalyzerRules rules_;
};

// "sp.run" + {sp -> subprocess} => "subprocess.run"
std::string resolve_call_name(const std::string& dotted,
                              const std::map<std::string, std::string>& bindings);

} // namespace evogate
