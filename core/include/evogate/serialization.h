#pragma once

#include "types.h"

#include <json-c/json.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace evogate {

// --- JSON helpers (json-c wrappers) ---

// JSON string literal; '/' is not escaped, so the result is also a valid
// Python string literal for BMP text.
std::string json_quote(const std::string& s);

bool json_get_string(json_object* o, const char* k, std::string* out);
bool json_get_bool(json_object* o, const char* k, bool* out);
bool json_get_int64(json_object* o, const char* k, int64_t* out);
bool json_get_double(json_object* o, const char* k, double* out);
std::vector<std::string> json_get_string_array(json_object* o, const char* k);
json_object* json_string_array(const std::vector<std::string>& items);

// Sorted keys, no whitespace. Deterministic for hash chains.
std::string canonical_json(json_object* o);

// Parse + canonical re-serialize. Returns input unchanged if it does not parse.
std::string canonicalize_json(const std::string& raw);

// --- data model ---
// *_to_json returns a new reference owned by the caller.
// *_from_json returns false on shape errors (missing required fields, bad enums).

json_object* request_to_json(const EvolutionRequest& r);
bool request_from_json(json_object* o, EvolutionRequest* out, std::string* err);

json_object* report_to_json(const StaticAnalysisReport& r);
bool report_from_json(json_object* o, StaticAnalysisReport* out);

json_object* execution_to_json(const ExecutionResult& r);
bool execution_from_json(json_object* o, ExecutionResult* out);

json_object* decision_to_json(const PolicyDecision& d);
bool decision_from_json(json_object* o, PolicyDecision* out);

json_object* audit_record_to_json(const AuditRecord& a);
bool audit_record_from_json(json_object* o, AuditRecord* out);

json_object* evolution_result_to_json(const EvolutionResult& r);
json_object* evolution_stats_to_json(const EvolutionStats& s);

// Operator request file:
//   {"id":..., "source":"..." | "source_file":"path",
//    "tests":[{"name":..., "expr":..., "expect":"55"} | {..., "raises":"ValueError"}],
//    "isolation":"high", "priority":0}
// source_file is resolved against base_dir.
bool parse_request_file(const std::string& json,
                        const std::filesystem::path& base_dir,
                        EvolutionRequest* out,
                        std::string* err);

} // namespace evogate
