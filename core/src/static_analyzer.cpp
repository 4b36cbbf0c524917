#include "evogate/static_analyzer.h"

#include "evogate/pyparse.h"

#include <algorithm>
#include <memory>

namespace evogate {

namespace {

constexpr double kForbiddenImportPenalty = 0.3;
constexpr double kDangerousCallPenalty = 0.2;
constexpr double kComplexityPenalty = 0.1;
constexpr double kComplexityDivisor = 10.0;

void push_unique(std::vector<std::string>* v, const std::string& s) {
    if (std::find(v->begin(), v->end(), s) == v->end()) v->push_back(s);
}

bool list_has_prefix_of(const std::vector<std::string>& list, const std::string& module) {
    // "a.b.c" checks "a.b.c", "a.b", "a"
    std::string cur = module;
    for (;;) {
        if (std::find(list.begin(), list.end(), cur) != list.end()) return true;
        const size_t dot = cur.rfind('.');
        if (dot == std::string::npos || dot == 0) return false;
        cur.resize(dot);
    }
}

int count_lines(const std::string& s) {
    if (s.empty()) return 0;
    int n = (int)std::count(s.begin(), s.end(), '\n');
    if (s.back() != '\n') n++;
    return n;
}

StaticAnalysisReport blocked_report(const std::string& error, int lines) {
    StaticAnalysisReport r;
    r.syntax_valid = false;
    r.syntax_error = error;
    r.complexity_score = 0.0;
    r.security_score = 0.0;
    r.risk = RiskAssessment::BLOCKED;
    r.line_count = lines;
    r.warnings.push_back("syntax error: " + error);
    return r;
}

} // namespace

AnalyzerRules AnalyzerRules::defaults() {
    AnalyzerRules r;
    r.allowed_imports = {
        "typing", "datetime", "json", "math", "random", "uuid", "asyncio", "logging",
        "dataclasses", "enum", "collections", "itertools", "functools", "operator",
        "copy", "time", "re", "string", "decimal", "fractions", "statistics", "heapq",
        "bisect",
    };
    r.forbidden_imports = {
        "os", "sys", "subprocess", "shutil", "socket", "urllib", "requests", "pickle",
        "marshal", "ctypes", "multiprocessing", "importlib", "pty", "signal", "http",
        "ftplib", "telnetlib", "builtins",
    };
    r.dangerous_calls = {
        "eval", "exec", "compile", "__import__", "open", "input", "breakpoint",
        "globals", "locals", "vars", "getattr", "setattr", "delattr",
        "os.system", "os.popen", "os.exec*", "os.spawn*", "os.fork", "os.kill",
        "os.remove", "os.unlink", "os.rmdir", "shutil.rmtree", "subprocess.*",
        "pty.spawn", "importlib.import_module", "ctypes.*",
    };
    return r;
}

StaticAnalyzer::StaticAnalyzer(AnalyzerRules rules) : rules_(std::move(rules)) {}

StaticAnalyzer::ImportClass StaticAnalyzer::classify_import(const std::string& module) const {
    if (module.empty() || module[0] == '.') return ImportClass::UNLISTED;
    if (list_has_prefix_of(rules_.forbidden_imports, module)) return ImportClass::FORBIDDEN;
    if (list_has_prefix_of(rules_.allowed_imports, module)) return ImportClass::ALLOWED;
    return ImportClass::UNLISTED;
}

bool StaticAnalyzer::call_is_dangerous(const std::string& qualified) const {
    for (const auto& entry : rules_.dangerous_calls) {
        if (entry.empty()) continue;
        if (entry.back() == '*') {
            const std::string prefix = entry.substr(0, entry.size() - 1);
            if (qualified.size() > prefix.size() && qualified.compare(0, prefix.size(), prefix) == 0) {
                return true;
            }
        } else if (qualified == entry) {
            return true;
        }
    }
    return false;
}

std::string resolve_call_name(const std::string& dotted,
                              const std::map<std::string, std::string>& bindings) {
    const size_t dot = dotted.find('.');
    const std::string head = dotted.substr(0, dot);
    auto it = bindings.find(head);
    if (it == bindings.end()) return dotted;
    if (dot == std::string::npos) return it->second;
    return it->second + dotted.substr(dot);
}

StaticAnalysisReport StaticAnalyzer::analyze(const std::string& source) const {
    const int lines = count_lines(source);
    if (source.size() > rules_.max_source_bytes) {
        return blocked_report("source too large (" + std::to_string(source.size()) + " bytes)", lines);
    }

    std::unique_ptr<py::Node> tree;
    py::SyntaxError err;
    if (!py::parse_module(source, &tree, &err, rules_.max_nesting)) {
        return blocked_report(err.to_string(), lines);
    }

    StaticAnalysisReport r;
    r.syntax_valid = true;
    r.line_count = lines;

    // Pass 1: imports and the names they bind.
    std::map<std::string, std::string> bindings;
    auto note_module = [&](const std::string& module, int line) {
        switch (classify_import(module)) {
            case ImportClass::FORBIDDEN:
                push_unique(&r.forbidden_imports, module);
                r.warnings.push_back("forbidden import '" + module + "' at line " + std::to_string(line));
                break;
            case ImportClass::UNLISTED:
                push_unique(&r.unlisted_imports, module);
                break;
            case ImportClass::ALLOWED:
                break;
        }
    };
    py::walk(*tree, [&](const py::Node& n) {
        if (n.kind == py::NodeKind::IMPORT) {
            note_module(n.name, n.line);
            if (!n.alias.empty()) {
                bindings[n.alias] = n.name;
            } else {
                const std::string top = n.name.substr(0, n.name.find('.'));
                bindings[top] = top;
            }
        } else if (n.kind == py::NodeKind::IMPORT_FROM) {
            note_module(n.name, n.line);
            if (n.name[0] == '.') return;
            for (const auto& a : n.children) {
                if (a->name == "*") continue;
                bindings[a->alias.empty() ? a->name : a->alias] = n.name + "." + a->name;
            }
        }
    });

    // Pass 2: calls and control-flow constructs.
    int branches = 0;
    py::walk(*tree, [&](const py::Node& n) {
        switch (n.kind) {
            case py::NodeKind::IF:
            case py::NodeKind::FOR:
            case py::NodeKind::WHILE:
            case py::NodeKind::TRY:
                branches++;
                return;
            case py::NodeKind::CALL:
                break;
            default:
                return;
        }
        const std::string dotted = py::dotted_name(*n.children.front());
        if (dotted.empty()) return;
        const std::string qualified = resolve_call_name(dotted, bindings);
        if (!call_is_dangerous(qualified)) return;
        push_unique(&r.dangerous_calls, qualified);
        std::string w = "dangerous call '" + qualified + "' at line " + std::to_string(n.line);
        if (qualified != dotted) w += " (written '" + dotted + "')";
        r.warnings.push_back(w);
    });

    r.complexity_score = std::min((double)branches / kComplexityDivisor, 1.0);
    const double score = 1.0
        - kForbiddenImportPenalty * (double)r.forbidden_imports.size()
        - kDangerousCallPenalty * (double)r.dangerous_calls.size()
        - kComplexityPenalty * r.complexity_score;
    r.security_score = std::clamp(score, 0.0, 1.0);

    if (!r.forbidden_imports.empty() || !r.dangerous_calls.empty()) {
        r.risk = RiskAssessment::DANGEROUS;
    } else if (r.security_score < rules_.caution_score) {
        r.risk = RiskAssessment::CAUTION;
    } else {
        r.risk = RiskAssessment::SAFE;
    }
    return r;
}

} // namespace evogate
