#include "evogate/serialization.h"

#include "evogate/util.h"

#include <algorithm>
#include <sstream>

namespace evogate {

// --- JSON helpers ---

std::string json_quote(const std::string& s) {
    json_object* o = json_object_new_string_len(s.c_str(), (int)s.size());
    if (!o) return "\"\"";
    std::string out = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
    json_object_put(o);
    return out;
}

bool json_get_string(json_object* o, const char* k, std::string* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_string)) return false;
    *out = std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
    return true;
}

bool json_get_bool(json_object* o, const char* k, bool* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v) return false;
    if (json_object_is_type(v, json_type_boolean)) { *out = (json_object_get_boolean(v) != 0); return true; }
    return false;
}

bool json_get_int64(json_object* o, const char* k, int64_t* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v) return false;
    if (json_object_is_type(v, json_type_int) || json_object_is_type(v, json_type_double)) {
        *out = json_object_get_int64(v);
        return true;
    }
    return false;
}

bool json_get_double(json_object* o, const char* k, double* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v) return false;
    if (json_object_is_type(v, json_type_int) || json_object_is_type(v, json_type_double)) {
        *out = json_object_get_double(v);
        return true;
    }
    return false;
}

std::vector<std::string> json_get_string_array(json_object* o, const char* k) {
    std::vector<std::string> out;
    json_object* v = nullptr;
    if (!o || !json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_array)) return out;
    const size_t n = (size_t)json_object_array_length(v);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* it = json_object_array_get_idx(v, i);
        if (it && json_object_is_type(it, json_type_string)) out.push_back(json_object_get_string(it));
    }
    return out;
}

json_object* json_string_array(const std::vector<std::string>& items) {
    json_object* a = json_object_new_array();
    for (const auto& s : items) {
        json_object_array_add(a, json_object_new_string_len(s.c_str(), (int)s.size()));
    }
    return a;
}

static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            out << json_quote(keys[i]) << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = (size_t)json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
        break;
    }
}

std::string canonical_json(json_object* o) {
    std::ostringstream out;
    canonical_serialize(o, out);
    return out.str();
}

std::string canonicalize_json(const std::string& raw) {
    json_object* obj = json_tokener_parse(raw.c_str());
    if (!obj) return raw;
    std::string out = canonical_json(obj);
    json_object_put(obj);
    return out;
}

static void add_str(json_object* o, const char* k, const std::string& v) {
    json_object_object_add(o, k, json_object_new_string_len(v.c_str(), (int)v.size()));
}

static json_object* get_obj(json_object* o, const char* k) {
    json_object* v = nullptr;
    if (!o || !json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_object)) return nullptr;
    return v;
}

static json_object* get_arr(json_object* o, const char* k) {
    json_object* v = nullptr;
    if (!o || !json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_array)) return nullptr;
    return v;
}

// --- request ---

json_object* request_to_json(const EvolutionRequest& r) {
    json_object* o = json_object_new_object();
    add_str(o, "id", r.id);
    add_str(o, "source", r.source_code);
    json_object* tests = json_object_new_array();
    for (const auto& t : r.test_cases) {
        json_object* to = json_object_new_object();
        add_str(to, "name", t.name);
        add_str(to, "expr", t.expression);
        json_object_array_add(tests, to);
    }
    json_object_object_add(o, "tests", tests);
    json_object* expected = json_object_new_array();
    for (const auto& e : r.expected_outcomes) {
        json_object* eo = json_object_new_object();
        add_str(eo, "kind", e.kind == OutcomeKind::RAISES ? "raises" : "value");
        add_str(eo, "value", e.value);
        json_object_array_add(expected, eo);
    }
    json_object_object_add(o, "expected", expected);
    add_str(o, "isolation", isolation_to_str(r.isolation));
    json_object_object_add(o, "priority", json_object_new_int(r.priority));
    json_object_object_add(o, "submitted_at_ms", json_object_new_int64(r.submitted_at_ms));
    return o;
}

bool request_from_json(json_object* o, EvolutionRequest* out, std::string* err) {
    auto fail = [&](const std::string& m) {
        if (err) *err = m;
        return false;
    };
    if (!o || !json_object_is_type(o, json_type_object) || !out) return fail("request: not an object");
    EvolutionRequest r;
    json_get_string(o, "id", &r.id);
    if (!json_get_string(o, "source", &r.source_code)) return fail("request: missing source");

    if (json_object* tests = get_arr(o, "tests")) {
        const size_t n = (size_t)json_object_array_length(tests);
        for (size_t i = 0; i < n; i++) {
            json_object* t = json_object_array_get_idx(tests, i);
            TestCase tc;
            if (!json_get_string(t, "expr", &tc.expression)) return fail("request: test without expr");
            json_get_string(t, "name", &tc.name);
            r.test_cases.push_back(std::move(tc));
        }
    }
    if (json_object* expected = get_arr(o, "expected")) {
        const size_t n = (size_t)json_object_array_length(expected);
        for (size_t i = 0; i < n; i++) {
            json_object* e = json_object_array_get_idx(expected, i);
            ExpectedOutcome eo;
            std::string kind;
            json_get_string(e, "kind", &kind);
            if (kind == "raises") eo.kind = OutcomeKind::RAISES;
            else if (kind == "value" || kind.empty()) eo.kind = OutcomeKind::VALUE;
            else return fail("request: bad outcome kind '" + kind + "'");
            json_get_string(e, "value", &eo.value);
            r.expected_outcomes.push_back(std::move(eo));
        }
    }
    std::string iso;
    if (json_get_string(o, "isolation", &iso) && !isolation_from_str(iso, &r.isolation)) {
        return fail("request: bad isolation '" + iso + "'");
    }
    int64_t v = 0;
    if (json_get_int64(o, "priority", &v)) r.priority = (int)v;
    if (json_get_int64(o, "submitted_at_ms", &v)) r.submitted_at_ms = v;
    *out = std::move(r);
    return true;
}

// --- report ---

json_object* report_to_json(const StaticAnalysisReport& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "syntax_valid", json_object_new_boolean(r.syntax_valid ? 1 : 0));
    add_str(o, "syntax_error", r.syntax_error);
    json_object_object_add(o, "forbidden_imports", json_string_array(r.forbidden_imports));
    json_object_object_add(o, "dangerous_calls", json_string_array(r.dangerous_calls));
    json_object_object_add(o, "unlisted_imports", json_string_array(r.unlisted_imports));
    json_object_object_add(o, "warnings", json_string_array(r.warnings));
    json_object_object_add(o, "complexity_score", json_object_new_double(r.complexity_score));
    json_object_object_add(o, "security_score", json_object_new_double(r.security_score));
    add_str(o, "risk", risk_to_str(r.risk));
    json_object_object_add(o, "line_count", json_object_new_int(r.line_count));
    return o;
}

bool report_from_json(json_object* o, StaticAnalysisReport* out) {
    if (!o || !json_object_is_type(o, json_type_object) || !out) return false;
    StaticAnalysisReport r;
    json_get_bool(o, "syntax_valid", &r.syntax_valid);
    json_get_string(o, "syntax_error", &r.syntax_error);
    r.forbidden_imports = json_get_string_array(o, "forbidden_imports");
    r.dangerous_calls = json_get_string_array(o, "dangerous_calls");
    r.unlisted_imports = json_get_string_array(o, "unlisted_imports");
    r.warnings = json_get_string_array(o, "warnings");
    json_get_double(o, "complexity_score", &r.complexity_score);
    json_get_double(o, "security_score", &r.security_score);
    std::string risk;
    if (!json_get_string(o, "risk", &risk) || !risk_from_str(risk, &r.risk)) return false;
    int64_t lc = 0;
    if (json_get_int64(o, "line_count", &lc)) r.line_count = (int)lc;
    *out = std::move(r);
    return true;
}

// --- execution ---

json_object* execution_to_json(const ExecutionResult& r) {
    json_object* o = json_object_new_object();
    add_str(o, "status", execstatus_to_str(r.status));
    json_object* tests = json_object_new_array();
    for (const auto& t : r.per_test) {
        json_object* to = json_object_new_object();
        add_str(to, "name", t.name);
        add_str(to, "status", teststatus_to_str(t.status));
        add_str(to, "expected", t.expected);
        add_str(to, "actual", t.actual);
        add_str(to, "stdout", t.stdout_text);
        add_str(to, "stderr", t.stderr_text);
        json_object_object_add(to, "exit_code", json_object_new_int(t.exit_code));
        json_object_object_add(to, "duration_ms", json_object_new_int64(t.duration_ms));
        json_object_array_add(tests, to);
    }
    json_object_object_add(o, "per_test", tests);
    add_str(o, "stdout", r.stdout_text);
    add_str(o, "stderr", r.stderr_text);
    json_object* usage = json_object_new_object();
    json_object_object_add(usage, "cpu_ms", json_object_new_int64(r.usage.cpu_ms));
    json_object_object_add(usage, "peak_rss_kb", json_object_new_int64(r.usage.peak_rss_kb));
    json_object_object_add(usage, "wall_ms", json_object_new_int64(r.usage.wall_ms));
    json_object_object_add(o, "usage", usage);
    json_object_object_add(o, "duration_ms", json_object_new_int64(r.duration_ms));
    json_object_object_add(o, "cancelled", json_object_new_boolean(r.cancelled ? 1 : 0));
    add_str(o, "error", r.error);
    return o;
}

bool execution_from_json(json_object* o, ExecutionResult* out) {
    if (!o || !json_object_is_type(o, json_type_object) || !out) return false;
    ExecutionResult r;
    std::string st;
    if (!json_get_string(o, "status", &st) || !execstatus_from_str(st, &r.status)) return false;
    if (json_object* tests = get_arr(o, "per_test")) {
        const size_t n = (size_t)json_object_array_length(tests);
        for (size_t i = 0; i < n; i++) {
            json_object* t = json_object_array_get_idx(tests, i);
            PerTestResult pt;
            json_get_string(t, "name", &pt.name);
            std::string ts;
            if (!json_get_string(t, "status", &ts) || !teststatus_from_str(ts, &pt.status)) return false;
            json_get_string(t, "expected", &pt.expected);
            json_get_string(t, "actual", &pt.actual);
            json_get_string(t, "stdout", &pt.stdout_text);
            json_get_string(t, "stderr", &pt.stderr_text);
            int64_t v = 0;
            if (json_get_int64(t, "exit_code", &v)) pt.exit_code = (int)v;
            json_get_int64(t, "duration_ms", &pt.duration_ms);
            r.per_test.push_back(std::move(pt));
        }
    }
    json_get_string(o, "stdout", &r.stdout_text);
    json_get_string(o, "stderr", &r.stderr_text);
    if (json_object* usage = get_obj(o, "usage")) {
        json_get_int64(usage, "cpu_ms", &r.usage.cpu_ms);
        json_get_int64(usage, "peak_rss_kb", &r.usage.peak_rss_kb);
        json_get_int64(usage, "wall_ms", &r.usage.wall_ms);
    }
    json_get_int64(o, "duration_ms", &r.duration_ms);
    json_get_bool(o, "cancelled", &r.cancelled);
    json_get_string(o, "error", &r.error);
    *out = std::move(r);
    return true;
}

// --- decision ---

json_object* decision_to_json(const PolicyDecision& d) {
    json_object* o = json_object_new_object();
    add_str(o, "level", approval_to_str(d.level));
    json_object_object_add(o, "reasons", json_string_array(d.reasons));
    json_object_object_add(o, "decided_at_ms", json_object_new_int64(d.decided_at_ms));
    return o;
}

bool decision_from_json(json_object* o, PolicyDecision* out) {
    if (!o || !json_object_is_type(o, json_type_object) || !out) return false;
    PolicyDecision d;
    std::string lvl;
    if (!json_get_string(o, "level", &lvl) || !approval_from_str(lvl, &d.level)) return false;
    d.reasons = json_get_string_array(o, "reasons");
    json_get_int64(o, "decided_at_ms", &d.decided_at_ms);
    *out = std::move(d);
    return true;
}

// --- audit record ---

json_object* audit_record_to_json(const AuditRecord& a) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "request", request_to_json(a.request));
    json_object_object_add(o, "report", report_to_json(a.report));
    json_object_object_add(o, "execution", execution_to_json(a.execution));
    json_object_object_add(o, "decision", decision_to_json(a.decision));
    add_str(o, "final_state", state_to_str(a.final_state));
    json_object* ts = json_object_new_object();
    json_object_object_add(ts, "submitted_ms", json_object_new_int64(a.timestamps.submitted_ms));
    json_object_object_add(ts, "analyzed_ms", json_object_new_int64(a.timestamps.analyzed_ms));
    json_object_object_add(ts, "executed_ms", json_object_new_int64(a.timestamps.executed_ms));
    json_object_object_add(ts, "decided_ms", json_object_new_int64(a.timestamps.decided_ms));
    json_object_object_add(o, "timestamps", ts);
    json_object_object_add(o, "attempts", json_object_new_int(a.attempts));
    return o;
}

bool audit_record_from_json(json_object* o, AuditRecord* out) {
    if (!o || !json_object_is_type(o, json_type_object) || !out) return false;
    AuditRecord a;
    std::string err;
    if (!request_from_json(get_obj(o, "request"), &a.request, &err)) return false;
    if (!report_from_json(get_obj(o, "report"), &a.report)) return false;
    if (!execution_from_json(get_obj(o, "execution"), &a.execution)) return false;
    if (!decision_from_json(get_obj(o, "decision"), &a.decision)) return false;
    std::string st;
    if (!json_get_string(o, "final_state", &st) || !state_from_str(st, &a.final_state)) return false;
    if (json_object* ts = get_obj(o, "timestamps")) {
        json_get_int64(ts, "submitted_ms", &a.timestamps.submitted_ms);
        json_get_int64(ts, "analyzed_ms", &a.timestamps.analyzed_ms);
        json_get_int64(ts, "executed_ms", &a.timestamps.executed_ms);
        json_get_int64(ts, "decided_ms", &a.timestamps.decided_ms);
    }
    int64_t attempts = 1;
    if (json_get_int64(o, "attempts", &attempts) && attempts >= 1) a.attempts = (int)attempts;
    *out = std::move(a);
    return true;
}

json_object* evolution_result_to_json(const EvolutionResult& r) {
    json_object* o = json_object_new_object();
    add_str(o, "request_id", r.request_id);
    add_str(o, "state", state_to_str(r.state));
    if (r.report) json_object_object_add(o, "report", report_to_json(*r.report));
    if (r.execution) json_object_object_add(o, "execution", execution_to_json(*r.execution));
    if (r.decision) json_object_object_add(o, "decision", decision_to_json(*r.decision));
    json_object_object_add(o, "attempts", json_object_new_int(r.attempts));
    if (!r.last_error.empty()) add_str(o, "last_error", r.last_error);
    return o;
}

json_object* evolution_stats_to_json(const EvolutionStats& s) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "total", json_object_new_int64((int64_t)s.total));
    json_object* states = json_object_new_object();
    for (const auto& kv : s.by_state) {
        json_object_object_add(states, state_to_str(kv.first), json_object_new_int64((int64_t)kv.second));
    }
    json_object_object_add(o, "by_state", states);
    json_object* levels = json_object_new_object();
    for (const auto& kv : s.by_approval) {
        json_object_object_add(levels, approval_to_str(kv.first), json_object_new_int64((int64_t)kv.second));
    }
    json_object_object_add(o, "by_approval", levels);
    json_object_object_add(o, "queued", json_object_new_int64((int64_t)s.queued));
    json_object* pool = json_object_new_object();
    json_object_object_add(pool, "in_use", json_object_new_int64((int64_t)s.sandboxes_in_use));
    json_object_object_add(pool, "peak_in_use", json_object_new_int64((int64_t)s.sandboxes_peak));
    json_object_object_add(pool, "total_acquired", json_object_new_int64((int64_t)s.sandboxes_acquired));
    json_object_object_add(pool, "watchdog_reclaims", json_object_new_int64((int64_t)s.watchdog_reclaims));
    json_object_object_add(o, "sandbox_pool", pool);
    return o;
}

// --- operator request file ---

bool parse_request_file(const std::string& json,
                        const std::filesystem::path& base_dir,
                        EvolutionRequest* out,
                        std::string* err) {
    auto fail = [&](const std::string& m) {
        if (err) *err = m;
        return false;
    };
    if (!out) return fail("null output");
    json_object* root = json_tokener_parse(json.c_str());
    if (!root) return fail("request file: invalid JSON");
    if (!json_object_is_type(root, json_type_object)) {
        json_object_put(root);
        return fail("request file: top level must be an object");
    }

    EvolutionRequest r;
    std::string msg;
    json_get_string(root, "id", &r.id);
    std::string source_file;
    if (!json_get_string(root, "source", &r.source_code)) {
        if (!json_get_string(root, "source_file", &source_file)) {
            msg = "request file: need \"source\" or \"source_file\"";
        } else {
            std::filesystem::path p = source_file;
            if (p.is_relative()) p = base_dir / p;
            std::error_code ec;
            if (!std::filesystem::is_regular_file(p, ec)) {
                msg = "request file: cannot read source_file " + p.string();
            } else {
                r.source_code = slurp_file(p);
            }
        }
    }

    if (msg.empty()) {
        if (json_object* tests = get_arr(root, "tests")) {
            const size_t n = (size_t)json_object_array_length(tests);
            for (size_t i = 0; i < n && msg.empty(); i++) {
                json_object* t = json_object_array_get_idx(tests, i);
                TestCase tc;
                ExpectedOutcome eo;
                if (!json_get_string(t, "expr", &tc.expression)) {
                    msg = "request file: tests[" + std::to_string(i) + "] has no expr";
                    break;
                }
                if (!json_get_string(t, "name", &tc.name)) tc.name = "test_" + std::to_string(i);
                if (json_get_string(t, "raises", &eo.value)) {
                    eo.kind = OutcomeKind::RAISES;
                } else if (!json_get_string(t, "expect", &eo.value)) {
                    msg = "request file: tests[" + std::to_string(i) + "] needs \"expect\" or \"raises\"";
                    break;
                }
                r.test_cases.push_back(std::move(tc));
                r.expected_outcomes.push_back(std::move(eo));
            }
        }
    }

    std::string iso;
    if (msg.empty() && json_get_string(root, "isolation", &iso) && !isolation_from_str(iso, &r.isolation)) {
        msg = "request file: bad isolation '" + iso + "'";
    }
    int64_t prio = 0;
    if (json_get_int64(root, "priority", &prio)) r.priority = (int)prio;
    json_object_put(root);

    if (!msg.empty()) return fail(msg);
    *out = std::move(r);
    return true;
}

} // namespace evogate
