#include "evogate/harness.h"

#include "evogate/serialization.h"
#include "evogate/util.h"

#include <json-c/json.h>

#include <sstream>

namespace evogate {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::string marker_for(const std::string& nonce) {
    return "__EVOGATE_" + nonce + "__";
}

} // namespace

const char* harness_kind_name(HarnessOutcome::Kind k) {
    switch (k) {
        case HarnessOutcome::Kind::NONE: return "none";
        case HarnessOutcome::Kind::VALUE: return "value";
        case HarnessOutcome::Kind::RAISES: return "raises";
        case HarnessOutcome::Kind::LOAD_ERROR: return "load_error";
        case HarnessOutcome::Kind::LOADED: return "loaded";
        case HarnessOutcome::Kind::MEMORY: return "memory";
    }
    return "none";
}

std::string make_harness_nonce() {
    return gen_hex_id("");
}

std::string build_harness_script(const std::string& source,
                                 const std::string* expression,
                                 const std::string& nonce) {
    // The harness binds everything it needs before the candidate runs, so a
    // candidate rebinding sys.stdout or json does not redirect the marker.
    std::ostringstream py;
    py << "import sys as _evg_sys, json as _evg_json\n"
       << "_evg_w = _evg_sys.__stdout__\n"
       << "_evg_dumps = _evg_json.dumps\n"
       << "_evg_M = " << json_quote(marker_for(nonce)) << "\n"
       << "def _evg_emit(kind, value):\n"
       << "    try:\n"
       << "        _evg_sys.stdout.flush()\n"
       << "    except Exception:\n"
       << "        pass\n"
       << "    _evg_w.write('\\n' + _evg_M + ' ' + _evg_dumps({'kind': kind, 'value': value}) + '\\n')\n"
       << "    _evg_w.flush()\n"
       << "def _evg_desc(e):\n"
       << "    try:\n"
       << "        return type(e).__name__ + ': ' + str(e)[:500]\n"
       << "    except Exception:\n"
       << "        return type(e).__name__\n"
       << "_evg_src = " << json_quote(source) << "\n"
       << "_evg_expr = " << (expression ? json_quote(*expression) : std::string("None")) << "\n"
       << "_evg_ns = {'__name__': 'candidate', '__builtins__': __builtins__}\n"
       << "try:\n"
       << "    exec(compile(_evg_src, 'candidate.py', 'exec'), _evg_ns)\n"
       << "except MemoryError:\n"
       << "    _evg_emit('memory', 'MemoryError')\n"
       << "    raise SystemExit(3)\n"
       << "except BaseException as _evg_e:\n"
       << "    _evg_emit('load_error', _evg_desc(_evg_e))\n"
       << "    raise SystemExit(2)\n"
       << "if _evg_expr is None:\n"
       << "    _evg_emit('loaded', '')\n"
       << "else:\n"
       << "    try:\n"
       << "        _evg_r = repr(eval(compile(_evg_expr, 'test', 'eval'), _evg_ns))\n"
       << "    except MemoryError:\n"
       << "        _evg_emit('memory', 'MemoryError')\n"
       << "        raise SystemExit(3)\n"
       << "    except BaseException as _evg_e:\n"
       << "        _evg_emit('raises', type(_evg_e).__name__)\n"
       << "    else:\n"
       << "        _evg_emit('value', _evg_r)\n";
    return py.str();
}

bool parse_harness_output(const std::string& stdout_text,
                          const std::string& nonce,
                          HarnessOutcome* out) {
    if (!out) return false;
    *out = HarnessOutcome{};
    out->candidate_stdout = stdout_text;

    const std::string needle = "\n" + marker_for(nonce) + " ";
    size_t pos = stdout_text.rfind(needle);
    if (pos == std::string::npos) return false;

    out->candidate_stdout = stdout_text.substr(0, pos);
    size_t start = pos + needle.size();
    size_t end = stdout_text.find('\n', start);
    std::string payload = stdout_text.substr(start, end == std::string::npos ? std::string::npos : end - start);

    json_object* o = json_tokener_parse(payload.c_str());
    if (!o) return false;
    std::string kind;
    std::string value;
    bool ok = json_get_string(o, "kind", &kind) && json_get_string(o, "value", &value);
    json_object_put(o);
    if (!ok) return false;

    if (kind == "value") out->kind = HarnessOutcome::Kind::VALUE;
    else if (kind == "raises") out->kind = HarnessOutcome::Kind::RAISES;
    else if (kind == "load_error") out->kind = HarnessOutcome::Kind::LOAD_ERROR;
    else if (kind == "loaded") out->kind = HarnessOutcome::Kind::LOADED;
    else if (kind == "memory") out->kind = HarnessOutcome::Kind::MEMORY;
    else return false;
    out->value = value;
    return true;
}

std::string render_expected(const ExpectedOutcome& want) {
    if (want.kind == OutcomeKind::RAISES) return "raises " + trim(want.value);
    return trim(want.value);
}

bool outcome_matches(const HarnessOutcome& got,
                     const ExpectedOutcome& want,
                     std::string* actual) {
    std::string rendered;
    switch (got.kind) {
        case HarnessOutcome::Kind::VALUE: rendered = trim(got.value); break;
        case HarnessOutcome::Kind::RAISES: rendered = "raises " + got.value; break;
        case HarnessOutcome::Kind::LOAD_ERROR: rendered = "load error: " + got.value; break;
        case HarnessOutcome::Kind::LOADED: rendered = "loaded"; break;
        case HarnessOutcome::Kind::MEMORY: rendered = "MemoryError"; break;
        case HarnessOutcome::Kind::NONE: rendered = "no result"; break;
    }
    if (actual) *actual = rendered;

    if (want.kind == OutcomeKind::VALUE) {
        return got.kind == HarnessOutcome::Kind::VALUE && trim(got.value) == trim(want.value);
    }
    return got.kind == HarnessOutcome::Kind::RAISES && got.value == trim(want.value);
}

} // namespace evogate
