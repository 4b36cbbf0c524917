#include "test_common.h"

#include "evogate/static_analyzer.h"

#include <algorithm>
#include <string>
#include <vector>

using namespace evogate;

static bool has(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

int main() {
    StaticAnalyzer a;

    // Scenario A shape: plain recursion, no imports.
    {
        auto r = a.analyze("def fib(n):\n    if n < 2:\n        return n\n    return fib(n - 1) + fib(n - 2)\n");
        expect_true(r.syntax_valid, "fib is valid");
        expect_true(r.risk == RiskAssessment::SAFE, std::string("fib risk: ") + risk_to_str(r.risk));
        expect_true(r.security_score >= 0.85, "fib score high enough to auto-approve");
        expect_true(r.forbidden_imports.empty() && r.dangerous_calls.empty(), "fib has no findings");
        expect_eq_ll(r.line_count, 4, "line count");
    }

    // Scenario B shape: shell spawn.
    {
        auto r = a.analyze("import subprocess\n\ndef run():\n    return subprocess.run(['sh', '-c', 'id'])\n");
        expect_true(r.risk == RiskAssessment::DANGEROUS, "subprocess is dangerous");
        expect_true(has(r.forbidden_imports, "subprocess"), "forbidden import listed");
        expect_true(has(r.dangerous_calls, "subprocess.run"), "dangerous call listed");
        expect_true(r.security_score < 0.85, "score below the review threshold");
    }

    // Scenario C: unparsable.
    {
        auto r = a.analyze("def f(:\n");
        expect_true(!r.syntax_valid, "def f(: invalid");
        expect_true(r.risk == RiskAssessment::BLOCKED, "invalid syntax is blocked");
        expect_true(!r.syntax_error.empty(), "syntax error text present");
        expect_true(r.security_score == 0.0, "blocked score is zero");
    }

    // Aliases resolve to the qualified name.
    {
        auto r = a.analyze("import subprocess as sp\nsp.Popen(['ls'])\n");
        expect_true(has(r.dangerous_calls, "subprocess.Popen"), "import alias resolved");
        bool written = false;
        for (const auto& w : r.warnings) written = written || contains(w, "(written 'sp.Popen')");
        expect_true(written, "warning keeps the written form");
    }
    {
        auto r = a.analyze("from os import system as run_it\nrun_it('id')\n");
        expect_true(has(r.forbidden_imports, "os"), "from-import of os is forbidden");
        expect_true(has(r.dangerous_calls, "os.system"), "from-import alias resolved");
    }
    {
        auto r = a.analyze("import os.path\nos.path.join('a', 'b')\nos.execv('/bin/sh', [])\n");
        expect_true(has(r.forbidden_imports, "os.path"), "submodule of a forbidden package");
        expect_true(has(r.dangerous_calls, "os.execv"), "prefix entry os.exec* matches");
        expect_true(!has(r.dangerous_calls, "os.path.join"), "os.path.join is not a dangerous call");
    }

    // Builtins need no import.
    {
        auto r = a.analyze("x = eval('1 + 1')\nf = open('/etc/passwd')\n");
        expect_true(r.risk == RiskAssessment::DANGEROUS, "eval/open are dangerous");
        expect_true(has(r.dangerous_calls, "eval") && has(r.dangerous_calls, "open"), "builtin calls listed");
        expect_true(r.forbidden_imports.empty(), "no imports");
    }

    // Calls hidden in nested scopes are still found.
    {
        auto r = a.analyze(
            "class K:\n"
            "    def m(self):\n"
            "        return [exec(s) for s in self.items if s]\n");
        expect_true(has(r.dangerous_calls, "exec"), "exec inside a comprehension inside a method");
    }

    // Allowed and unlisted imports.
    {
        auto r = a.analyze("import math\nimport numpy as np\nfrom .sibling import x\n");
        expect_true(r.risk == RiskAssessment::SAFE, "unlisted imports alone do not raise the risk");
        expect_true(has(r.unlisted_imports, "numpy"), "numpy unlisted");
        expect_true(has(r.unlisted_imports, ".sibling"), "relative import unlisted");
        expect_true(!has(r.unlisted_imports, "math"), "math allowed");
    }

    // Branch-heavy code only lowers the complexity part of the score.
    {
        std::string src = "def f(x):\n";
        for (int i = 0; i < 12; i++) src += "    if x == " + std::to_string(i) + ":\n        return " + std::to_string(i) + "\n";
        src += "    return -1\n";
        auto r = a.analyze(src);
        expect_true(r.complexity_score == 1.0, "complexity capped at 1.0");
        expect_true(r.risk == RiskAssessment::SAFE, "complexity alone stays above the caution score");
    }

    // Calls inside f-string replacement fields are analyzed like any other call.
    {
        auto r = a.analyze("x = f'{eval(\"1+1\")}'\n");
        expect_true(r.syntax_valid, "f-string with a call parses");
        expect_true(r.risk == RiskAssessment::DANGEROUS, std::string("eval in f-string: ") + risk_to_str(r.risk));
        expect_true(has(r.dangerous_calls, "eval"), "eval listed");
    }
    {
        auto r = a.analyze("def f():\n    return f\"{__import__('os').system('id')}\"\n");
        expect_true(r.risk == RiskAssessment::DANGEROUS, "__import__ in f-string is dangerous");
        expect_true(has(r.dangerous_calls, "__import__"), "__import__ listed");
        bool line2 = false;
        for (const auto& w : r.warnings) line2 = line2 || contains(w, "'__import__' at line 2");
        expect_true(line2, "warning points at the f-string line");
    }
    {
        auto r = a.analyze("name = 'x'\nmsg = f'{name!r:>{width}} {{literal}}' rf'{exec(name)}'\n");
        expect_true(has(r.dangerous_calls, "exec"), "call in a concatenated raw f-string");
    }
    {
        auto r = a.analyze("w = 8\ns = f'{w:{len(\"abc\")}}' f\"{w=}\" f'{w!=3}'\n");
        expect_true(r.risk == RiskAssessment::SAFE, "format specs, debug and != fields are safe");
        auto nested = a.analyze("s = f'{1:{eval(\"3\")}}'\n");
        expect_true(has(nested.dangerous_calls, "eval"), "call in a nested format-spec field");
        auto plain = a.analyze("s = '{eval(1)}' + b'{x}'\n");
        expect_true(plain.dangerous_calls.empty(), "non-f strings are opaque");
    }
    for (const char* bad : {"x = f'{'\n", "x = f'{1 +}'\n", "x = f'}'\n", "x = f'{}'\n",
                            "x = f'{a!x}'\n", "x = f'{a)}'\n"}) {
        auto r = a.analyze(bad);
        expect_true(!r.syntax_valid && r.risk == RiskAssessment::BLOCKED, std::string("malformed f-string blocked: ") + bad);
    }

    // Sources CPython refuses to compile are blocked statically.
    for (const std::string bad : {std::string("def f(*): pass\n"), std::string("lambda *: 0\n"),
                                  std::string("def f(*, **k): pass\n"), std::string("x = 08\n"),
                                  std::string("x = 0x\n"), std::string("x = 1__0\n"),
                                  std::string("\xff\xfe = 1\n"), std::string("x = 'a\0b'\n", 10)}) {
        auto r = a.analyze(bad);
        expect_true(r.risk == RiskAssessment::BLOCKED, "rejected source blocked: " + r.syntax_error);
    }
    for (const char* ok : {"def f(*, a): pass\n", "x = 0\ny = 00\nz = 0_0\n", "x = 08.5 + 0e1 + 1_000\n",
                           "s = 'caf\xc3\xa9'\n", "\xef\xbb\xbfx = 1\n"}) {
        auto r = a.analyze(ok);
        expect_true(r.syntax_valid, std::string("accepted: ") + ok + " " + r.syntax_error);
    }

    // Deterministic: same input, same report.
    {
        const std::string src = "import subprocess as sp\nimport json\nsp.call('x')\neval('1')\n";
        expect_true(a.analyze(src) == a.analyze(src), "analyze is deterministic");
    }

    // Custom rules.
    {
        AnalyzerRules rules = AnalyzerRules::defaults();
        rules.dangerous_calls.push_back("math.*");
        rules.max_source_bytes = 64;
        StaticAnalyzer strict(rules);
        expect_true(has(strict.analyze("import math\nmath.sqrt(2)\n").dangerous_calls, "math.sqrt"), "custom prefix rule");
        auto big = strict.analyze(std::string(100, '#') + "\n");
        expect_true(big.risk == RiskAssessment::BLOCKED, "oversized source is blocked");
    }

    expect_eq_str(resolve_call_name("sp.run", {{"sp", "subprocess"}}), "subprocess.run", "resolve alias");
    expect_eq_str(resolve_call_name("print", {{"sp", "subprocess"}}), "print", "unbound name unchanged");

    std::cerr << "test_static_analyzer: ALL PASSED" << std::endl;
    return 0;
}
