#pragma once

#include "types.h"

#include <string>

namespace evogate {

// Result reported by the in-sandbox harness through its marker line.
struct HarnessOutcome {
    enum class Kind {
        NONE,        // no marker: interpreter died before reporting
        VALUE,       // value = repr() of the expression result
        RAISES,      // value = exception class name
        LOAD_ERROR,  // candidate module failed to load; value = "Type: message"
        LOADED,      // load-only run succeeded
        MEMORY       // MemoryError during load or evaluation
    };
    Kind kind{Kind::NONE};
    std::string value;
    std::string candidate_stdout;   // stdout with the marker line removed
};

const char* harness_kind_name(HarnessOutcome::Kind k);

// Python 3 script fed to the interpreter on stdin. It executes `source` as a
// module named "candidate", evaluates `expression` (nullptr = load only) in
// that namespace and prints
//     \n__EVOGATE_<nonce>__ {"kind": ..., "value": ...}\n
// as its last stdout line.
std::string build_harness_script(const std::string& source,
                                 const std::string* expression,
                                 const std::string& nonce);

std::string make_harness_nonce();

// Finds the last marker for `nonce`. Returns false when there is none or its
// payload does not parse; out->candidate_stdout is filled either way.
bool parse_harness_output(const std::string& stdout_text,
                          const std::string& nonce,
                          HarnessOutcome* out);

// Compares against the expectation. *actual receives the rendered outcome
// ("55", "raises ValueError", ...).
bool outcome_matches(const HarnessOutcome& got,
                     const ExpectedOutcome& want,
                     std::string* actual);

std::string render_expected(const ExpectedOutcome& want);

} // namespace evogate
