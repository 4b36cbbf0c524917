#include "test_common.h"

#include "evogate/pyparse.h"

#include <memory>
#include <string>
#include <vector>

namespace py = evogate::py;

static std::vector<std::string> call_names(const py::Node& root) {
    std::vector<std::string> out;
    py::walk(root, [&](const py::Node& n) {
        if (n.kind == py::NodeKind::CALL) out.push_back(py::dotted_name(*n.children.front()));
    });
    return out;
}

static bool has(const std::vector<std::string>& v, const std::string& s) {
    for (const auto& x : v) {
        if (x == s) return true;
    }
    return false;
}

int main() {
    // Imports, definitions and calls nested in expressions are all reachable.
    {
        const std::string src =
            "import os.path as p, json\n"
            "from collections import OrderedDict as OD, deque\n"
            "\n"
            "@decorate(1)\n"
            "class Cache(Base, metaclass=Meta):\n"
            "    def get(self, key: str, *args, default=None, **kw) -> int:\n"
            "        if key in self.data:\n"
            "            return self.data[key]\n"
            "        elif key is None:\n"
            "            raise KeyError(key)\n"
            "        else:\n"
            "            return [helper(x) for x in args if x]\n"
            "\n"
            "async def fetch(u):\n"
            "    async with session.get(u) as r:\n"
            "        return await r.text()\n"
            "\n"
            "total = sum(v for v in {k: len(k) for k in ('a', 'bc')}.values())\n"
            "f = lambda x=1: p.join('a', x)\n"
            "print(f\"{total!r:>10}\", end='')\n";
        std::unique_ptr<py::Node> tree;
        py::SyntaxError err;
        expect_true(py::parse_module(src, &tree, &err), "module should parse: " + err.to_string());

        int imports = 0, from_imports = 0, classes = 0, funcs = 0;
        std::string first_alias;
        py::walk(*tree, [&](const py::Node& n) {
            if (n.kind == py::NodeKind::IMPORT) {
                imports++;
                if (first_alias.empty()) first_alias = n.name + " as " + n.alias;
            }
            if (n.kind == py::NodeKind::IMPORT_FROM) from_imports++;
            if (n.kind == py::NodeKind::CLASS_DEF) classes++;
            if (n.kind == py::NodeKind::FUNCTION_DEF) funcs++;
        });
        expect_eq_ll(imports, 2, "import nodes");
        expect_eq_str(first_alias, "os.path as p", "import alias");
        expect_eq_ll(from_imports, 1, "from-import nodes");
        expect_eq_ll(classes, 1, "class defs");
        expect_eq_ll(funcs, 2, "function defs");

        auto calls = call_names(*tree);
        for (const char* want : {"decorate", "KeyError", "helper", "session.get", "r.text", "sum", "len",
                                 "p.join", "print"}) {
            expect_true(has(calls, want), std::string("call not found: ") + want);
        }
    }

    // Calls on call results have no dotted name.
    {
        std::unique_ptr<py::Node> tree;
        py::SyntaxError err;
        expect_true(py::parse_module("a.b()(1).c()\n", &tree, &err), "chained call parses");
        auto calls = call_names(*tree);
        expect_true(has(calls, "a.b"), "inner call a.b");
        expect_true(has(calls, ""), "outer calls have no dotted name");
    }

    // Syntax errors carry a position.
    {
        std::unique_ptr<py::Node> tree;
        py::SyntaxError err;
        expect_true(!py::parse_module("def f(:\n    pass\n", &tree, &err), "def f(: must fail");
        expect_eq_ll(err.line, 1, "error line");
        expect_true(contains(err.to_string(), "line 1:"), "rendered position: " + err.to_string());
    }
    {
        std::unique_ptr<py::Node> tree;
        py::SyntaxError err;
        expect_true(!py::parse_module("if x:\n    a = 1\n  b = 2\n", &tree, &err), "bad dedent must fail");
        expect_true(contains(err.message, "unindent"), "dedent message: " + err.message);
    }
    {
        std::unique_ptr<py::Node> tree;
        py::SyntaxError err;
        expect_true(!py::parse_module("x = (1, 2\n", &tree, &err), "unclosed paren must fail");
        expect_true(!py::parse_module("s = 'abc\n", &tree, &err), "unterminated string must fail");
        expect_true(!py::parse_module("f() = 3\n", &tree, &err), "assignment to call must fail");
        expect_true(!py::parse_module("x = 1 +\n", &tree, &err), "dangling operator must fail");
    }

    // Nesting limit.
    {
        std::string deep(300, '(');
        deep += "1";
        deep += std::string(300, ')');
        deep += "\n";
        std::unique_ptr<py::Node> tree;
        py::SyntaxError err;
        expect_true(!py::parse_module(deep, &tree, &err, 200), "over-deep nesting must fail");
    }

    // Tokens
    {
        std::vector<py::Token> toks;
        py::SyntaxError err;
        expect_true(py::tokenize("if a:\n    b\n", &toks, &err), "tokenize");
        int indents = 0, dedents = 0;
        for (const auto& t : toks) {
            if (t.kind == py::TokKind::INDENT) indents++;
            if (t.kind == py::TokKind::DEDENT) dedents++;
        }
        expect_eq_ll(indents, 1, "one INDENT");
        expect_eq_ll(dedents, 1, "one DEDENT");
        expect_true(toks.back().kind == py::TokKind::END, "END last");
    }

    std::cerr << "test_pyparse: ALL PASSED" << std::endl;
    return 0;
}
