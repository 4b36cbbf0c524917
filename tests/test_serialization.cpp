#include "test_common.h"

#include "evogate/serialization.h"

#include <filesystem>
#include <fstream>

using namespace evogate;

int main() {
    namespace fs = std::filesystem;
    fs::path dir = fresh_test_dir("serialization");

    // Inline source, explicit names, raises.
    {
        const std::string text =
            "{\"id\":\"req-1\",\"source\":\"def f(x):\\n    return int(x)\\n\","
            "\"tests\":[{\"name\":\"ok\",\"expr\":\"f('3')\",\"expect\":\"3\"},"
            "{\"expr\":\"f('x')\",\"raises\":\"ValueError\"}],"
            "\"isolation\":\"maximum\",\"priority\":9}";
        EvolutionRequest r;
        std::string err;
        expect_true(parse_request_file(text, dir, &r, &err), "parse inline request: " + err);
        expect_eq_str(r.id, "req-1", "id");
        expect_true(contains(r.source_code, "return int(x)"), "source");
        expect_eq_ll((long long)r.test_cases.size(), 2, "two tests");
        expect_eq_str(r.test_cases[0].name, "ok", "explicit test name");
        expect_eq_str(r.test_cases[1].name, "test_1", "generated test name");
        expect_true(r.expected_outcomes[0].kind == OutcomeKind::VALUE && r.expected_outcomes[0].value == "3",
                    "value expectation");
        expect_true(r.expected_outcomes[1].kind == OutcomeKind::RAISES && r.expected_outcomes[1].value == "ValueError",
                    "raises expectation");
        expect_true(r.isolation == IsolationLevel::MAXIMUM, "isolation");
        expect_eq_ll(r.priority, 9, "priority");
    }

    // source_file resolves against the request's directory; defaults apply.
    {
        { std::ofstream f(dir / "cand.py"); f << "def g():\n    return 2\n"; }
        EvolutionRequest r;
        std::string err;
        expect_true(parse_request_file("{\"source_file\":\"cand.py\",\"tests\":[{\"expr\":\"g()\",\"expect\":\"2\"}]}",
                                       dir, &r, &err),
                    "parse source_file request: " + err);
        expect_eq_str(r.source_code, "def g():\n    return 2\n", "source read from file");
        expect_true(r.id.empty(), "no id assigned by the parser");
        expect_true(r.isolation == IsolationLevel::HIGH, "default isolation");
        expect_eq_ll(r.priority, 0, "default priority");
    }

    // Shape errors.
    {
        EvolutionRequest r;
        std::string err;
        expect_true(!parse_request_file("[1,2]", dir, &r, &err), "array rejected");
        expect_true(!parse_request_file("{nope", dir, &r, &err), "invalid JSON rejected");
        expect_true(!parse_request_file("{\"tests\":[]}", dir, &r, &err), "missing source rejected");
        expect_true(contains(err, "source"), "missing source message: " + err);
        expect_true(!parse_request_file("{\"source_file\":\"absent.py\"}", dir, &r, &err), "missing file rejected");
        expect_true(!parse_request_file("{\"source\":\"x=1\",\"tests\":[{\"expect\":\"1\"}]}", dir, &r, &err),
                    "test without expr rejected");
        expect_true(contains(err, "tests[0]"), "points at the test: " + err);
        expect_true(!parse_request_file("{\"source\":\"x=1\",\"tests\":[{\"expr\":\"x\"}]}", dir, &r, &err),
                    "test without expectation rejected");
        expect_true(!parse_request_file("{\"source\":\"x=1\",\"isolation\":\"extreme\"}", dir, &r, &err),
                    "bad isolation rejected");
    }

    // Canonical form sorts keys at every level and keeps '/' unescaped.
    {
        expect_eq_str(canonicalize_json("{ \"b\": 1, \"a\": {\"z\": [1, 2], \"y\": \"p/q\"} }"),
                      "{\"a\":{\"y\":\"p/q\",\"z\":[1,2]},\"b\":1}", "canonical form");
        expect_eq_str(canonicalize_json("not json"), "not json", "unparseable input unchanged");
        expect_eq_str(json_quote("it's \"x\"\n"), "\"it's \\\"x\\\"\\n\"", "quoting");
    }

    // Records survive the JSON round trip that the audit trail relies on.
    {
        EvolutionRequest req;
        req.id = "evo-1";
        req.source_code = "def f():\n    return 1\n";
        req.test_cases.push_back(TestCase{"t0", "f()"});
        req.expected_outcomes.push_back(ExpectedOutcome{OutcomeKind::RAISES, "KeyError"});
        req.isolation = IsolationLevel::LOW;
        req.priority = -2;
        json_object* o = request_to_json(req);
        EvolutionRequest back;
        std::string err;
        expect_true(request_from_json(o, &back, &err), "request_from_json: " + err);
        json_object_put(o);
        expect_true(back.expected_outcomes[0].kind == OutcomeKind::RAISES, "outcome kind");
        expect_true(back.isolation == IsolationLevel::LOW && back.priority == -2, "isolation and priority");

        StaticAnalysisReport bad;
        json_object* junk = json_tokener_parse("{\"risk\":\"apocalyptic\"}");
        expect_true(!report_from_json(junk, &bad), "unknown risk rejected");
        json_object_put(junk);
    }

    // Records written before attempts were tracked read back as a first attempt.
    {
        AuditRecord rec;
        rec.request.id = "evo-2";
        rec.final_state = RequestState::REJECTED;
        rec.attempts = 3;
        json_object* o = audit_record_to_json(rec);
        AuditRecord back;
        expect_true(audit_record_from_json(o, &back), "audit record parses");
        expect_eq_ll(back.attempts, 3, "attempts kept");
        json_object_object_del(o, "attempts");
        expect_true(audit_record_from_json(o, &back), "record without attempts parses");
        expect_eq_ll(back.attempts, 1, "missing attempts defaults to one");
        json_object_put(o);
    }

    // Stats print states and approval levels by name.
    {
        EvolutionStats s;
        s.total = 2;
        s.by_state[RequestState::BLOCKED] = 2;
        s.by_approval[ApprovalLevel::REJECT] = 2;
        s.sandboxes_peak = 1;
        json_object* o = evolution_stats_to_json(s);
        const std::string text = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
        json_object_put(o);
        expect_true(contains(text, std::string("\"by_state\":{\"") + state_to_str(RequestState::BLOCKED) + "\":2}"),
                    "state keys: " + text);
        expect_true(contains(text, std::string("\"") + approval_to_str(ApprovalLevel::REJECT) + "\":2"),
                    "approval keys: " + text);
        expect_true(contains(text, "\"peak_in_use\":1"), "pool peak: " + text);
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
    std::cerr << "test_serialization: ALL PASSED" << std::endl;
    return 0;
}
