#pragma once

// Python 3 tokenizer + recursive-descent parser for candidate source units.
//
// The tree keeps only what safety analysis needs: imports, calls, names,
// attribute chains, control-flow statements and definitions. Every other
// expression or statement becomes an OTHER node that still owns its children,
// so a pre-order walk reaches every call in the module. Replacement fields
// of f-strings are parsed too and hang off their CONSTANT node.
//
// Not supported: `match` statements (reported as syntax errors).

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace evogate::py {

enum class TokKind {
    NAME,
    NUMBER,
    STRING,
    OP,
    NEWLINE,
    INDENT,
    DEDENT,
    END
};

struct Token {
    TokKind kind{TokKind::END};
    std::string text;
    int line{0};
    int col{0};
};

struct SyntaxError {
    std::string message;
    int line{0};
    int col{0};

    std::string to_string() const;
};

enum class NodeKind {
    MODULE,
    IMPORT,         // name = dotted module, alias = asname
    IMPORT_FROM,    // name = module (leading dots kept), children = ALIAS
    ALIAS,          // name = imported symbol, alias = asname
    CALL,           // children[0] = callee, rest = arguments
    NAME,           // name = identifier
    ATTRIBUTE,      // name = attribute, children[0] = value
    SUBSCRIPT,
    STARRED,
    TUPLE,
    LIST,
    CONSTANT,       // children = f-string replacement fields
    LAMBDA,
    COMPREHENSION,
    IF,             // each elif is an IF child of the leading if
    FOR,
    WHILE,
    TRY,
    WITH,
    FUNCTION_DEF,   // name = function name
    CLASS_DEF,      // name = class name
    OTHER
};

struct Node {
    NodeKind kind{NodeKind::OTHER};
    std::string name;
    std::string alias;
    int line{0};
    std::vector<std::unique_ptr<Node>> children;

    Node* add(std::unique_ptr<Node> child) {
        children.push_back(std::move(child));
        return children.back().get();
    }
};

// Splits source into tokens including NEWLINE/INDENT/DEDENT.
// Returns false and fills err on lexical errors.
bool tokenize(const std::string& src, std::vector<Token>* out, SyntaxError* err);

// Parses a whole module. Never throws; returns false and fills err on any
// syntax error (including nesting deeper than max_depth).
bool parse_module(const std::string& src, std::unique_ptr<Node>* out, SyntaxError* err,
                  int max_depth = 200);

// Pre-order traversal.
void walk(const Node& root, const std::function<void(const Node&)>& fn);

// "a.b.c" for NAME/ATTRIBUTE chains, empty for anything else (calls, subscripts...).
std::string dotted_name(const Node& n);

} // namespace evogate::py
