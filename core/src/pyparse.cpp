#include "evogate/pyparse.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <initializer_list>

namespace evogate::py {

std::string SyntaxError::to_string() const {
    if (line <= 0) return message;
    return "line " + std::to_string(line) + ":" + std::to_string(col) + ": " + message;
}

namespace {

// ---------- Lexer ----------

const char* const kOps3[] = {"**=", "//=", ">>=", "<<=", "..."};
const char* const kOps2[] = {"**", "//", "<<", ">>", "<=", ">=", "==", "!=", "->",
                             "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@=", ":="};
const char kOps1[] = "+-*/%@&|^~<>()[]{},:;.=";

bool is_ident_start(unsigned char c) { return std::isalpha(c) || c == '_' || c >= 0x80; }
bool is_ident_char(unsigned char c) { return std::isalnum(c) || c == '_' || c >= 0x80; }

bool is_string_prefix(const std::string& w) {
    if (w.empty() || w.size() > 2) return false;
    std::string l;
    for (char c : w) l.push_back((char)std::tolower((unsigned char)c));
    return l == "r" || l == "u" || l == "b" || l == "f" ||
           l == "br" || l == "rb" || l == "fr" || l == "rf";
}

struct Lexer {
    const std::string& s;
    std::vector<Token>* out;
    size_t i{0};
    int line{1};
    size_t line_start{0};
    std::vector<int> indents{0};
    std::vector<Token> brackets;
    bool at_bol{true};
    SyntaxError err;

    Lexer(const std::string& src, std::vector<Token>* o) : s(src), out(o) {}

    int col() const { return (int)(i - line_start) + 1; }

    bool fail(const std::string& m, int l, int c) {
        err.message = m;
        err.line = l;
        err.col = c;
        return false;
    }

    void emit(TokKind k, std::string text, int l, int c) {
        out->push_back(Token{k, std::move(text), l, c});
    }

    // pos is the index of a '\n'
    void newline_at(size_t pos) {
        line++;
        line_start = pos + 1;
    }

    bool indentation();
    bool string_literal(int l, int c, const std::string& prefix);
    bool number(int l, int c);
    bool run();
};

// Rejects integer literal shapes the Python grammar does not allow.
std::string number_error(const std::string& t) {
    if (t.size() >= 2 && t[0] == '0' && std::isalpha((unsigned char)t[1])) {
        const char radix = (char)std::tolower((unsigned char)t[1]);
        const char* digits = radix == 'x' ? "0123456789abcdefABCDEF_"
                           : radix == 'o' ? "01234567_"
                           : radix == 'b' ? "01_" : nullptr;
        if (digits == nullptr) return {};
        const std::string rest = t.substr(2);
        if (rest.empty() || rest.find_first_not_of(digits) != std::string::npos || rest.back() == '_') {
            const char* kind = radix == 'x' ? "hexadecimal" : radix == 'o' ? "octal" : "binary";
            return std::string("invalid ") + kind + " literal";
        }
        return {};
    }
    if (t.find_first_not_of("0123456789_") != std::string::npos) return {};
    if (t.back() == '_' || t.find("__") != std::string::npos) return "invalid decimal literal";
    if (t[0] == '0' && t.find_first_not_of("0_") != std::string::npos) {
        return "leading zeros in decimal integer literals are not permitted; use an 0o prefix for octal integers";
    }
    return {};
}

bool Lexer::indentation() {
    for (;;) {
        int width = 0;
        size_t j = i;
        while (j < s.size()) {
            const char ch = s[j];
            if (ch == ' ') width++;
            else if (ch == '\t') width = (width / 8 + 1) * 8;
            else if (ch == '\f') width = 0;
            else break;
            j++;
        }
        if (j >= s.size()) { i = j; return true; }
        const char ch = s[j];
        if (ch == '#' || ch == '\n' || ch == '\r') {
            // blank or comment-only line: no tokens
            while (j < s.size() && s[j] != '\n') j++;
            if (j >= s.size()) { i = j; return true; }
            newline_at(j);
            i = j + 1;
            continue;
        }
        i = j;
        const int c = col();
        if (width > indents.back()) {
            indents.push_back(width);
            emit(TokKind::INDENT, "", line, c);
            return true;
        }
        while (width < indents.back()) {
            indents.pop_back();
            emit(TokKind::DEDENT, "", line, c);
        }
        if (width != indents.back())
            return fail("unindent does not match any outer indentation level", line, c);
        return true;
    }
}

bool Lexer::string_literal(int l, int c, const std::string& prefix) {
    const size_t start = i - prefix.size();
    const char q = s[i];
    const bool triple = i + 2 < s.size() && s[i + 1] == q && s[i + 2] == q;
    i += triple ? 3 : 1;
    for (;;) {
        if (i >= s.size()) {
            return fail(triple ? "unterminated triple-quoted string literal"
                               : "unterminated string literal", l, c);
        }
        const char ch = s[i];
        if (ch == '\\') {
            if (i + 1 < s.size() && s[i + 1] == '\n') newline_at(i + 1);
            i += 2;
            continue;
        }
        if (ch == '\n') {
            if (!triple) return fail("unterminated string literal", l, c);
            newline_at(i);
            i++;
            continue;
        }
        if (ch == q) {
            if (!triple) { i++; break; }
            if (i + 2 < s.size() && s[i + 1] == q && s[i + 2] == q) { i += 3; break; }
        }
        i++;
    }
    emit(TokKind::STRING, s.substr(start, i - start), l, c);
    return true;
}

bool Lexer::number(int l, int c) {
    const size_t start = i;
    const bool hex = s[i] == '0' && i + 1 < s.size() && (s[i + 1] == 'x' || s[i + 1] == 'X');
    while (i < s.size()) {
        const unsigned char d = (unsigned char)s[i];
        if (std::isalnum(d) || d == '_' || d == '.') { i++; continue; }
        if ((d == '+' || d == '-') && !hex && i > start && (s[i - 1] == 'e' || s[i - 1] == 'E')) {
            i++;
            continue;
        }
        break;
    }
    std::string text = s.substr(start, i - start);
    std::string why = number_error(text);
    if (!why.empty()) return fail(why, l, c);
    emit(TokKind::NUMBER, std::move(text), l, c);
    return true;
}

// Returns the byte offset of the first invalid UTF-8 sequence, or npos.
size_t invalid_utf8_at(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        const unsigned char c = (unsigned char)s[i];
        size_t n = 0;
        unsigned int cp = 0;
        if (c < 0x80) { i++; continue; }
        if ((c & 0xE0) == 0xC0) { n = 1; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { n = 2; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { n = 3; cp = c & 0x07; }
        else return i;
        if (i + n >= s.size()) return i;
        for (size_t k = 1; k <= n; k++) {
            const unsigned char cc = (unsigned char)s[i + k];
            if ((cc & 0xC0) != 0x80) return i;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates, beyond U+10FFFF
        if ((n == 1 && cp < 0x80) || (n == 2 && cp < 0x800) || (n == 3 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return i;
        }
        i += n + 1;
    }
    return std::string::npos;
}

bool Lexer::run() {
    out->clear();
    const size_t nul = s.find('\0');
    if (nul != std::string::npos) {
        const int l = 1 + (int)std::count(s.begin(), s.begin() + (long)nul, '\n');
        return fail("source code cannot contain null bytes", l, 1);
    }
    const size_t bad = invalid_utf8_at(s);
    if (bad != std::string::npos) {
        char hex[8];
        std::snprintf(hex, sizeof(hex), "0x%02x", (unsigned)(unsigned char)s[bad]);
        const int l = 1 + (int)std::count(s.begin(), s.begin() + (long)bad, '\n');
        return fail(std::string("(unicode error) 'utf-8' codec can't decode byte ") + hex, l, 1);
    }
    if (s.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        i = 3;
        line_start = 3;
    }
    for (;;) {
        if (at_bol && brackets.empty()) {
            if (!indentation()) return false;
            at_bol = false;
        }
        if (i >= s.size()) break;

        const unsigned char ch = (unsigned char)s[i];
        const int l = line;
        const int c = col();

        if (ch == 0) return fail("source code cannot contain null bytes", l, c);
        if (ch == ' ' || ch == '\t' || ch == '\f' || ch == '\r') { i++; continue; }
        if (ch == '#') {
            while (i < s.size() && s[i] != '\n') i++;
            continue;
        }
        if (ch == '\\') {
            size_t j = i + 1;
            if (j < s.size() && s[j] == '\r') j++;
            if (j < s.size() && s[j] == '\n') {
                newline_at(j);
                i = j + 1;
                continue;
            }
            if (j >= s.size()) return fail("unexpected EOF after line continuation character", l, c);
            return fail("unexpected character after line continuation character", l, c);
        }
        if (ch == '\n') {
            if (brackets.empty()) {
                emit(TokKind::NEWLINE, "", l, c);
                at_bol = true;
            }
            newline_at(i);
            i++;
            continue;
        }
        if (is_ident_start(ch)) {
            size_t j = i;
            while (j < s.size() && is_ident_char((unsigned char)s[j])) j++;
            std::string word = s.substr(i, j - i);
            if (j < s.size() && (s[j] == '\'' || s[j] == '"') && is_string_prefix(word)) {
                i = j;
                if (!string_literal(l, c, word)) return false;
                continue;
            }
            i = j;
            emit(TokKind::NAME, std::move(word), l, c);
            continue;
        }
        if (ch == '\'' || ch == '"') {
            if (!string_literal(l, c, "")) return false;
            continue;
        }
        if (std::isdigit(ch) || (ch == '.' && i + 1 < s.size() && std::isdigit((unsigned char)s[i + 1]))) {
            if (!number(l, c)) return false;
            continue;
        }

        std::string op;
        for (const char* o : kOps3) {
            if (s.compare(i, 3, o) == 0) { op = o; break; }
        }
        if (op.empty()) {
            for (const char* o : kOps2) {
                if (s.compare(i, 2, o) == 0) { op = o; break; }
            }
        }
        if (op.empty() && std::strchr(kOps1, (int)ch) != nullptr) op.assign(1, (char)ch);
        if (op.empty()) {
            return fail(std::string("invalid character '") + (char)ch + "'", l, c);
        }

        if (op == "(" || op == "[" || op == "{") {
            brackets.push_back(Token{TokKind::OP, op, l, c});
        } else if (op == ")" || op == "]" || op == "}") {
            if (brackets.empty()) return fail("unmatched '" + op + "'", l, c);
            const char open = brackets.back().text[0];
            const bool ok = (open == '(' && op == ")") || (open == '[' && op == "]") ||
                            (open == '{' && op == "}");
            if (!ok) {
                return fail("closing parenthesis '" + op + "' does not match opening parenthesis '" +
                            brackets.back().text + "'", l, c);
            }
            brackets.pop_back();
        }
        i += op.size();
        emit(TokKind::OP, std::move(op), l, c);
    }

    if (!brackets.empty()) {
        const Token& b = brackets.back();
        return fail("'" + b.text + "' was never closed", b.line, b.col);
    }
    if (!out->empty() && out->back().kind != TokKind::NEWLINE) {
        emit(TokKind::NEWLINE, "", line, col());
    }
    while (indents.size() > 1) {
        indents.pop_back();
        emit(TokKind::DEDENT, "", line, col());
    }
    emit(TokKind::END, "", line, col());
    return true;
}

// ---------- f-string replacement fields ----------

struct FStringField {
    std::string expr;
    int line_offset{0};  // newlines in the literal body before the field
};

// Walks an f-string body ('{{' and '}}' are literal braces) and collects the
// expression of every replacement field, including fields nested inside
// format specs. Returns an error message, empty on success.
class FStringSplitter {
public:
    FStringSplitter(const std::string& body, bool raw, std::vector<FStringField>* out)
        : b_(body), raw_(raw), out_(out) {}

    std::string run() { return literal(false); }

private:
    const std::string& b_;
    bool raw_;
    std::vector<FStringField>* out_;
    size_t i_{0};
    int line_{0};

    char at(size_t k) const { return k < b_.size() ? b_[k] : '\0'; }

    // in_spec: stop at the '}' that closes the enclosing field.
    std::string literal(bool in_spec) {
        while (i_ < b_.size()) {
            const char c = b_[i_];
            if (c == '\\' && !raw_) {
                if (at(i_ + 1) == 'N' && at(i_ + 2) == '{') {
                    const size_t close = b_.find('}', i_ + 3);
                    if (close == std::string::npos) return "f-string: malformed \\N character escape";
                    i_ = close + 1;
                    continue;
                }
                // "\{" is not an escape: the brace still opens a field
                if (at(i_ + 1) == '{' || at(i_ + 1) == '}') {
                    i_++;
                    continue;
                }
                if (at(i_ + 1) == '\n') line_++;
                i_ += 2;
                continue;
            }
            if (c == '\n') line_++;
            if (c == '{') {
                if (!in_spec && at(i_ + 1) == '{') {
                    i_ += 2;
                    continue;
                }
                std::string err = field();
                if (!err.empty()) return err;
                continue;
            }
            if (c == '}') {
                if (in_spec) return "";
                if (at(i_ + 1) != '}') return "f-string: single '}' is not allowed";
                i_ += 2;
                continue;
            }
            i_++;
        }
        return in_spec ? "f-string: expecting '}'" : "";
    }

    std::string skip_string() {
        const char q = b_[i_];
        const bool triple = at(i_ + 1) == q && at(i_ + 2) == q;
        i_ += triple ? 3 : 1;
        while (i_ < b_.size()) {
            const char c = b_[i_];
            if (c == '\\') {
                i_ += 2;
                continue;
            }
            if (c == '\n') {
                if (!triple) return "f-string: unterminated string";
                line_++;
            }
            if (c == q && (!triple || (at(i_ + 1) == q && at(i_ + 2) == q))) {
                i_ += triple ? 3 : 1;
                return "";
            }
            i_++;
        }
        return "f-string: unterminated string";
    }

    // i_ is on the opening '{'; leaves i_ past the closing '}'.
    std::string field() {
        i_++;
        const size_t start = i_;
        const int start_line = line_;
        int depth = 0;
        for (;;) {
            if (i_ >= b_.size()) return "f-string: expecting '}'";
            const char c = b_[i_];
            if (c == '\'' || c == '"') {
                std::string err = skip_string();
                if (!err.empty()) return err;
                continue;
            }
            if (c == '#') return "f-string expression part cannot include '#'";
            if (c == '(' || c == '[' || c == '{') {
                depth++;
            } else if (c == ')' || c == ']' || c == '}') {
                if (depth == 0) {
                    if (c != '}') return std::string("f-string: unmatched '") + c + "'";
                    break;
                }
                depth--;
            } else if (depth == 0 && ((c == '!' && at(i_ + 1) != '=') || c == ':')) {
                break;
            } else if (c == '\n') {
                line_++;
            }
            i_++;
        }

        std::string expr = b_.substr(start, i_ - start);
        size_t end = expr.find_last_not_of(" \t\r\n\f");
        if (end == std::string::npos) {
            return std::string("f-string: valid expression required before '") + b_[i_] + "'";
        }
        // self-documenting "{expr=}"
        if (expr[end] == '=' && (end == 0 || std::strchr("=!<>", expr[end - 1]) == nullptr)) {
            expr.erase(end);
            if (expr.find_first_not_of(" \t\r\n\f") == std::string::npos) {
                return "f-string: valid expression required before '='";
            }
        }
        out_->push_back(FStringField{std::move(expr), start_line});

        if (b_[i_] == '!') {
            i_++;
            const char conv = at(i_);
            if (conv != 'r' && conv != 's' && conv != 'a') return "f-string: invalid conversion character";
            i_++;
            if (at(i_) != ':' && at(i_) != '}') return "f-string: expecting '}'";
        }
        if (at(i_) == ':') {
            i_++;
            std::string err = literal(true);
            if (!err.empty()) return err;
        }
        if (at(i_) != '}') return "f-string: expecting '}'";
        i_++;
        return "";
    }
};

// ---------- Parser ----------

using NodePtr = std::unique_ptr<Node>;

struct ParseFail {
    SyntaxError err;
};

const char* const kKeywords[] = {
    "False", "None", "True", "and", "as", "assert", "async", "await", "break",
    "class", "continue", "def", "del", "elif", "else", "except", "finally", "for",
    "from", "global", "if", "import", "in", "is", "lambda", "nonlocal", "not",
    "or", "pass", "raise", "return", "try", "while", "with", "yield",
};

bool is_keyword(const std::string& w) {
    for (const char* k : kKeywords) {
        if (w == k) return true;
    }
    return false;
}

bool is_augassign(const std::string& op) {
    static const char* const ops[] = {"+=", "-=", "*=", "/=", "//=", "%=", "@=", "&=",
                                      "|=", "^=", ">>=", "<<=", "**="};
    for (const char* o : ops) {
        if (op == o) return true;
    }
    return false;
}

NodePtr mk(NodeKind k, int line, std::string name = {}) {
    auto n = std::make_unique<Node>();
    n->kind = k;
    n->line = line;
    n->name = std::move(name);
    return n;
}

enum class TargetMode { ASSIGN, AUG, ANNOTATED, FOR, DEL };

class Parser {
public:
    Parser(const std::vector<Token>& toks, int max_depth) : t_(toks), max_depth_(max_depth) {}

    NodePtr module();
    // A replacement field, tokenized as "(" expr ")".
    NodePtr embedded_expression();

private:
    struct DepthGuard {
        Parser& ps;
        explicit DepthGuard(Parser& p) : ps(p) {
            if (++ps.depth_ > ps.max_depth_) ps.fail_here("maximum nesting depth exceeded");
        }
        ~DepthGuard() { --ps.depth_; }
    };

    const std::vector<Token>& t_;
    size_t p_{0};
    int depth_{0};
    int max_depth_;

    const Token& peek(size_t k = 0) const { return t_[std::min(p_ + k, t_.size() - 1)]; }
    const Token& next() {
        const Token& tk = t_[p_];
        if (p_ + 1 < t_.size()) p_++;
        return tk;
    }
    bool at_op(const char* s) const { return peek().kind == TokKind::OP && peek().text == s; }
    bool at_any_op(std::initializer_list<const char*> ops) const {
        if (peek().kind != TokKind::OP) return false;
        for (const char* o : ops) {
            if (peek().text == o) return true;
        }
        return false;
    }
    bool at_kw(const char* s) const { return peek().kind == TokKind::NAME && peek().text == s; }
    bool accept_op(const char* s) {
        if (!at_op(s)) return false;
        next();
        return true;
    }
    bool accept_kw(const char* s) {
        if (!at_kw(s)) return false;
        next();
        return true;
    }
    void expect_op(const char* s) {
        if (!accept_op(s)) fail_here(std::string("expected '") + s + "'");
    }
    [[noreturn]] void fail(const std::string& msg, const Token& tk) const {
        throw ParseFail{SyntaxError{msg, tk.line, tk.col}};
    }
    [[noreturn]] void fail_here(const std::string& msg) const {
        const Token& tk = peek();
        if (tk.kind == TokKind::INDENT) fail("unexpected indent", tk);
        fail(msg, tk);
    }
    std::string expect_name() {
        if (peek().kind != TokKind::NAME || is_keyword(peek().text)) fail_here("invalid syntax");
        return next().text;
    }
    bool at_end_of_simple() const {
        return peek().kind == TokKind::NEWLINE || at_op(";");
    }
    bool starts_expression() const;

    // statements
    void statement(Node* parent);
    void simple_stmts(Node* parent);
    void simple_stmt(Node* parent);
    void expr_stmt(Node* parent);
    void import_stmt(Node* parent);
    void from_stmt(Node* parent);
    std::string dotted_module();
    void block(Node* owner);
    void if_stmt(Node* parent);
    void while_stmt(Node* parent);
    void for_stmt(Node* parent);
    void try_stmt(Node* parent);
    void with_stmt(Node* parent);
    NodePtr with_item();
    void decorated(Node* parent);
    void funcdef(Node* parent, std::vector<NodePtr> decorators);
    void classdef(Node* parent, std::vector<NodePtr> decorators);
    void type_params(Node* owner);
    void parameters(Node* owner, const char* close, bool annotations);
    void check_target(const Node& n, TargetMode mode, const Token& at) const;

    // expressions
    NodePtr star_expressions();
    NodePtr star_expression();
    NodePtr named_expression();
    NodePtr expression();
    NodePtr lambdef();
    NodePtr disjunction();
    NodePtr conjunction();
    NodePtr inversion();
    NodePtr comparison();
    NodePtr binary(NodePtr (Parser::*sub)(), std::initializer_list<const char*> ops);
    NodePtr bitwise_or();
    NodePtr bitwise_xor();
    NodePtr bitwise_and();
    NodePtr shift_expr();
    NodePtr sum();
    NodePtr term();
    NodePtr factor();
    NodePtr power();
    NodePtr await_primary();
    NodePtr primary();
    NodePtr atom();
    NodePtr paren_atom();
    NodePtr list_atom();
    NodePtr dict_atom();
    NodePtr comprehension(NodePtr element, int line);
    NodePtr target_list();
    NodePtr target_atom();
    NodePtr yield_expr();
    void fstring_fields(const Token& tk, Node* owner);
    NodePtr slices();
    NodePtr slice();
    void arguments(Node* call);
};

bool Parser::starts_expression() const {
    const Token& tk = peek();
    switch (tk.kind) {
        case TokKind::NAME:
            if (!is_keyword(tk.text)) return true;
            return tk.text == "True" || tk.text == "False" || tk.text == "None" ||
                   tk.text == "not" || tk.text == "lambda" || tk.text == "await";
        case TokKind::NUMBER:
        case TokKind::STRING:
            return true;
        case TokKind::OP:
            return tk.text == "(" || tk.text == "[" || tk.text == "{" || tk.text == "-" ||
                   tk.text == "+" || tk.text == "~" || tk.text == "*" || tk.text == "...";
        default:
            return false;
    }
}

NodePtr Parser::module() {
    auto mod = mk(NodeKind::MODULE, 1);
    while (peek().kind != TokKind::END) {
        if (peek().kind == TokKind::NEWLINE) {
            next();
            continue;
        }
        statement(mod.get());
    }
    return mod;
}

void Parser::statement(Node* parent) {
    const Token& tk = peek();
    if (tk.kind == TokKind::INDENT) fail("unexpected indent", tk);
    if (tk.kind == TokKind::DEDENT) fail("unindent does not match any outer indentation level", tk);
    if (tk.kind == TokKind::OP && tk.text == "@") {
        decorated(parent);
        return;
    }
    if (tk.kind == TokKind::NAME) {
        const std::string& w = tk.text;
        if (w == "if") { if_stmt(parent); return; }
        if (w == "while") { while_stmt(parent); return; }
        if (w == "for") { for_stmt(parent); return; }
        if (w == "try") { try_stmt(parent); return; }
        if (w == "with") { with_stmt(parent); return; }
        if (w == "def") { funcdef(parent, {}); return; }
        if (w == "class") { classdef(parent, {}); return; }
        if (w == "async") {
            next();
            if (at_kw("def")) { funcdef(parent, {}); return; }
            if (at_kw("for")) { for_stmt(parent); return; }
            if (at_kw("with")) { with_stmt(parent); return; }
            fail_here("invalid syntax");
        }
    }
    simple_stmts(parent);
}

void Parser::simple_stmts(Node* parent) {
    simple_stmt(parent);
    while (accept_op(";")) {
        if (peek().kind == TokKind::NEWLINE) break;
        simple_stmt(parent);
    }
    if (peek().kind != TokKind::NEWLINE) fail_here("invalid syntax");
    next();
}

void Parser::simple_stmt(Node* parent) {
    const Token& tk = peek();
    const int line = tk.line;
    if (tk.kind == TokKind::NAME) {
        const std::string w = tk.text;
        if (w == "import") { import_stmt(parent); return; }
        if (w == "from") { from_stmt(parent); return; }
        if (w == "pass" || w == "break" || w == "continue") {
            next();
            parent->add(mk(NodeKind::OTHER, line, w));
            return;
        }
        if (w == "return") {
            next();
            auto n = mk(NodeKind::OTHER, line, w);
            if (!at_end_of_simple()) n->add(star_expressions());
            parent->add(std::move(n));
            return;
        }
        if (w == "raise") {
            next();
            auto n = mk(NodeKind::OTHER, line, w);
            if (!at_end_of_simple()) {
                n->add(expression());
                if (accept_kw("from")) n->add(expression());
            }
            parent->add(std::move(n));
            return;
        }
        if (w == "global" || w == "nonlocal") {
            next();
            auto n = mk(NodeKind::OTHER, line, w);
            do {
                n->add(mk(NodeKind::NAME, peek().line, expect_name()));
            } while (accept_op(","));
            parent->add(std::move(n));
            return;
        }
        if (w == "del") {
            next();
            const Token start = peek();
            auto n = mk(NodeKind::OTHER, line, w);
            auto targets = star_expressions();
            check_target(*targets, TargetMode::DEL, start);
            n->add(std::move(targets));
            parent->add(std::move(n));
            return;
        }
        if (w == "assert") {
            next();
            auto n = mk(NodeKind::OTHER, line, w);
            n->add(expression());
            if (accept_op(",")) n->add(expression());
            parent->add(std::move(n));
            return;
        }
    }
    expr_stmt(parent);
}

void Parser::expr_stmt(Node* parent) {
    const Token start = peek();
    const int line = start.line;
    NodePtr first = at_kw("yield") ? yield_expr() : star_expressions();

    if (at_op("=")) {
        std::vector<NodePtr> parts;
        parts.push_back(std::move(first));
        while (accept_op("=")) {
            parts.push_back(at_kw("yield") ? yield_expr() : star_expressions());
        }
        for (size_t k = 0; k + 1 < parts.size(); k++) {
            check_target(*parts[k], TargetMode::ASSIGN, start);
        }
        auto n = mk(NodeKind::OTHER, line, "assign");
        for (auto& part : parts) n->add(std::move(part));
        parent->add(std::move(n));
        return;
    }
    if (peek().kind == TokKind::OP && is_augassign(peek().text)) {
        next();
        check_target(*first, TargetMode::AUG, start);
        auto n = mk(NodeKind::OTHER, line, "augassign");
        n->add(std::move(first));
        n->add(at_kw("yield") ? yield_expr() : star_expressions());
        parent->add(std::move(n));
        return;
    }
    if (accept_op(":")) {
        check_target(*first, TargetMode::ANNOTATED, start);
        auto n = mk(NodeKind::OTHER, line, "annassign");
        n->add(std::move(first));
        n->add(expression());
        if (accept_op("=")) n->add(at_kw("yield") ? yield_expr() : star_expressions());
        parent->add(std::move(n));
        return;
    }
    parent->add(std::move(first));
}

void Parser::check_target(const Node& n, TargetMode mode, const Token& at) const {
    const std::string verb = mode == TargetMode::DEL ? "cannot delete " : "cannot assign to ";
    switch (n.kind) {
        case NodeKind::NAME:
        case NodeKind::ATTRIBUTE:
        case NodeKind::SUBSCRIPT:
            return;
        case NodeKind::TUPLE:
        case NodeKind::LIST:
            if (mode == TargetMode::AUG || mode == TargetMode::ANNOTATED) {
                fail("illegal target for annotation or augmented assignment", at);
            }
            for (const auto& c : n.children) check_target(*c, mode, at);
            return;
        case NodeKind::STARRED:
            if (mode != TargetMode::ASSIGN && mode != TargetMode::FOR) {
                fail("cannot use starred expression here", at);
            }
            check_target(*n.children.front(), mode, at);
            return;
        case NodeKind::CALL:
            fail(verb + "function call", at);
        case NodeKind::CONSTANT:
            fail(verb + "literal", at);
        default:
            fail(verb + "expression", at);
    }
}

std::string Parser::dotted_module() {
    std::string name = expect_name();
    while (accept_op(".")) name += "." + expect_name();
    return name;
}

void Parser::import_stmt(Node* parent) {
    next();
    do {
        const int line = peek().line;
        auto n = mk(NodeKind::IMPORT, line, dotted_module());
        if (accept_kw("as")) n->alias = expect_name();
        parent->add(std::move(n));
    } while (accept_op(","));
}

void Parser::from_stmt(Node* parent) {
    const int line = next().line;
    std::string mod;
    while (at_op(".") || at_op("...")) mod += next().text;
    if (mod.empty() || !at_kw("import")) mod += dotted_module();
    if (!accept_kw("import")) fail_here("invalid syntax");

    auto n = mk(NodeKind::IMPORT_FROM, line, mod);
    if (at_op("*")) {
        n->add(mk(NodeKind::ALIAS, next().line, "*"));
    } else {
        const bool paren = accept_op("(");
        do {
            if (paren && at_op(")")) break;
            auto a = mk(NodeKind::ALIAS, peek().line, expect_name());
            if (accept_kw("as")) a->alias = expect_name();
            n->add(std::move(a));
        } while (accept_op(","));
        if (paren) expect_op(")");
        if (n->children.empty()) fail_here("invalid syntax");
    }
    parent->add(std::move(n));
}

void Parser::block(Node* owner) {
    DepthGuard g(*this);
    expect_op(":");
    if (peek().kind != TokKind::NEWLINE) {
        simple_stmts(owner);
        return;
    }
    next();
    if (peek().kind != TokKind::INDENT) fail_here("expected an indented block");
    next();
    while (peek().kind != TokKind::DEDENT && peek().kind != TokKind::END) statement(owner);
    if (peek().kind == TokKind::DEDENT) next();
}

void Parser::if_stmt(Node* parent) {
    auto n = mk(NodeKind::IF, next().line);
    n->add(named_expression());
    block(n.get());
    while (at_kw("elif")) {
        auto e = mk(NodeKind::IF, next().line);
        e->add(named_expression());
        block(e.get());
        n->add(std::move(e));
    }
    if (at_kw("else")) {
        next();
        block(n.get());
    }
    parent->add(std::move(n));
}

void Parser::while_stmt(Node* parent) {
    auto n = mk(NodeKind::WHILE, next().line);
    n->add(named_expression());
    block(n.get());
    if (accept_kw("else")) block(n.get());
    parent->add(std::move(n));
}

void Parser::for_stmt(Node* parent) {
    auto n = mk(NodeKind::FOR, next().line);
    const Token start = peek();
    auto target = target_list();
    check_target(*target, TargetMode::FOR, start);
    n->add(std::move(target));
    if (!accept_kw("in")) fail_here("invalid syntax");
    n->add(star_expressions());
    block(n.get());
    if (accept_kw("else")) block(n.get());
    parent->add(std::move(n));
}

void Parser::try_stmt(Node* parent) {
    auto n = mk(NodeKind::TRY, next().line);
    block(n.get());
    bool handlers = false;
    bool final_block = false;
    while (at_kw("except")) {
        auto h = mk(NodeKind::OTHER, next().line, "except");
        accept_op("*");
        if (!at_op(":")) {
            h->add(expression());
            if (accept_kw("as")) h->alias = expect_name();
        }
        block(h.get());
        n->add(std::move(h));
        handlers = true;
    }
    if (handlers && accept_kw("else")) block(n.get());
    if (accept_kw("finally")) {
        block(n.get());
        final_block = true;
    }
    if (!handlers && !final_block) fail_here("expected 'except' or 'finally' block");
    parent->add(std::move(n));
}

NodePtr Parser::with_item() {
    const int line = peek().line;
    auto e = expression();
    if (!at_kw("as")) return e;
    next();
    const Token start = peek();
    auto target = target_atom();
    check_target(*target, TargetMode::ASSIGN, start);
    auto item = mk(NodeKind::OTHER, line, "with_item");
    item->add(std::move(e));
    item->add(std::move(target));
    return item;
}

void Parser::with_stmt(Node* parent) {
    auto n = mk(NodeKind::WITH, next().line);
    bool done = false;
    if (at_op("(")) {
        // Parenthesized item list, or a parenthesized expression: try the former.
        const size_t save = p_;
        const int save_depth = depth_;
        try {
            next();
            std::vector<NodePtr> items;
            do {
                if (at_op(")")) break;
                items.push_back(with_item());
            } while (accept_op(","));
            expect_op(")");
            if (!at_op(":")) fail_here("invalid syntax");
            for (auto& it : items) n->add(std::move(it));
            done = true;
        } catch (const ParseFail&) {
            p_ = save;
            depth_ = save_depth;
        }
    }
    if (!done) {
        do {
            n->add(with_item());
        } while (accept_op(","));
    }
    block(n.get());
    parent->add(std::move(n));
}

void Parser::decorated(Node* parent) {
    std::vector<NodePtr> decorators;
    while (at_op("@")) {
        next();
        decorators.push_back(named_expression());
        if (peek().kind != TokKind::NEWLINE) fail_here("invalid syntax");
        next();
    }
    if (accept_kw("async")) {
        if (!at_kw("def")) fail_here("invalid syntax");
        funcdef(parent, std::move(decorators));
    } else if (at_kw("def")) {
        funcdef(parent, std::move(decorators));
    } else if (at_kw("class")) {
        classdef(parent, std::move(decorators));
    } else {
        fail_here("invalid syntax");
    }
}

void Parser::type_params(Node* owner) {
    if (!accept_op("[")) return;
    do {
        if (at_op("]")) break;
        if (!accept_op("**")) accept_op("*");
        expect_name();
        if (accept_op(":")) owner->add(expression());
        if (accept_op("=")) owner->add(expression());
    } while (accept_op(","));
    expect_op("]");
}

void Parser::parameters(Node* owner, const char* close, bool annotations) {
    // a bare '*' needs at least one named parameter after it
    const Token* bare_star = nullptr;
    while (!at_op(close)) {
        if (accept_op("/")) {
        } else if (at_op("**")) {
            if (bare_star) fail("named arguments must follow bare *", *bare_star);
            next();
            expect_name();
            if (annotations && accept_op(":")) owner->add(expression());
        } else if (at_op("*")) {
            const Token& star = next();
            if (peek().kind == TokKind::NAME && !is_keyword(peek().text)) {
                next();
                if (annotations && accept_op(":")) owner->add(star_expression());
            } else {
                bare_star = &star;
            }
        } else {
            expect_name();
            bare_star = nullptr;
            if (annotations && accept_op(":")) owner->add(expression());
            if (accept_op("=")) owner->add(expression());
        }
        if (!accept_op(",")) break;
    }
    if (bare_star) fail("named arguments must follow bare *", *bare_star);
}

void Parser::funcdef(Node* parent, std::vector<NodePtr> decorators) {
    const int line = next().line;
    auto n = mk(NodeKind::FUNCTION_DEF, line, expect_name());
    for (auto& d : decorators) n->add(std::move(d));
    type_params(n.get());
    expect_op("(");
    parameters(n.get(), ")", true);
    expect_op(")");
    if (accept_op("->")) n->add(expression());
    block(n.get());
    parent->add(std::move(n));
}

void Parser::classdef(Node* parent, std::vector<NodePtr> decorators) {
    const int line = next().line;
    auto n = mk(NodeKind::CLASS_DEF, line, expect_name());
    for (auto& d : decorators) n->add(std::move(d));
    type_params(n.get());
    if (accept_op("(")) {
        arguments(n.get());
        expect_op(")");
    }
    block(n.get());
    parent->add(std::move(n));
}

// ---------- expressions ----------

NodePtr Parser::star_expressions() {
    const int line = peek().line;
    auto first = star_expression();
    if (!at_op(",")) return first;
    auto tup = mk(NodeKind::TUPLE, line);
    tup->add(std::move(first));
    while (accept_op(",")) {
        if (!starts_expression()) break;
        tup->add(star_expression());
    }
    return tup;
}

NodePtr Parser::star_expression() {
    if (at_op("*")) {
        auto s = mk(NodeKind::STARRED, next().line);
        s->add(bitwise_or());
        return s;
    }
    return named_expression();
}

NodePtr Parser::named_expression() {
    if (peek().kind == TokKind::NAME && peek(1).kind == TokKind::OP && peek(1).text == ":=") {
        const int line = peek().line;
        auto target = mk(NodeKind::NAME, line, expect_name());
        next();
        auto n = mk(NodeKind::OTHER, line, ":=");
        n->add(std::move(target));
        n->add(expression());
        return n;
    }
    return expression();
}

NodePtr Parser::expression() {
    DepthGuard g(*this);
    if (at_kw("lambda")) return lambdef();
    const int line = peek().line;
    auto body = disjunction();
    if (!at_kw("if")) return body;
    next();
    auto n = mk(NodeKind::OTHER, line, "ifexp");
    n->add(std::move(body));
    n->add(disjunction());
    if (!accept_kw("else")) fail_here("expected 'else' after 'if' expression");
    n->add(expression());
    return n;
}

NodePtr Parser::lambdef() {
    auto n = mk(NodeKind::LAMBDA, next().line);
    parameters(n.get(), ":", false);
    expect_op(":");
    n->add(expression());
    return n;
}

NodePtr Parser::disjunction() {
    const int line = peek().line;
    auto left = conjunction();
    if (!at_kw("or")) return left;
    auto n = mk(NodeKind::OTHER, line, "or");
    n->add(std::move(left));
    while (accept_kw("or")) n->add(conjunction());
    return n;
}

NodePtr Parser::conjunction() {
    const int line = peek().line;
    auto left = inversion();
    if (!at_kw("and")) return left;
    auto n = mk(NodeKind::OTHER, line, "and");
    n->add(std::move(left));
    while (accept_kw("and")) n->add(inversion());
    return n;
}

NodePtr Parser::inversion() {
    if (!at_kw("not")) return comparison();
    DepthGuard g(*this);
    auto n = mk(NodeKind::OTHER, next().line, "not");
    n->add(inversion());
    return n;
}

NodePtr Parser::comparison() {
    const int line = peek().line;
    auto left = bitwise_or();
    NodePtr cmp;
    for (;;) {
        if (at_any_op({"<", ">", "==", ">=", "<=", "!="}) || at_kw("in")) {
            next();
        } else if (at_kw("not") && peek(1).kind == TokKind::NAME && peek(1).text == "in") {
            next();
            next();
        } else if (at_kw("is")) {
            next();
            accept_kw("not");
        } else {
            break;
        }
        if (!cmp) {
            cmp = mk(NodeKind::OTHER, line, "compare");
            cmp->add(std::move(left));
        }
        cmp->add(bitwise_or());
    }
    if (cmp) return cmp;
    return left;
}

// Operands of one precedence level are flattened into a single node so long
// chains do not deepen the tree.
NodePtr Parser::binary(NodePtr (Parser::*sub)(), std::initializer_list<const char*> ops) {
    const int line = peek().line;
    NodePtr left = (this->*sub)();
    if (!at_any_op(ops)) return left;
    auto n = mk(NodeKind::OTHER, line, "binop");
    n->add(std::move(left));
    while (at_any_op(ops)) {
        next();
        n->add((this->*sub)());
    }
    return n;
}

NodePtr Parser::bitwise_or() { return binary(&Parser::bitwise_xor, {"|"}); }
NodePtr Parser::bitwise_xor() { return binary(&Parser::bitwise_and, {"^"}); }
NodePtr Parser::bitwise_and() { return binary(&Parser::shift_expr, {"&"}); }
NodePtr Parser::shift_expr() { return binary(&Parser::sum, {"<<", ">>"}); }
NodePtr Parser::sum() { return binary(&Parser::term, {"+", "-"}); }
NodePtr Parser::term() { return binary(&Parser::factor, {"*", "/", "//", "%", "@"}); }

NodePtr Parser::factor() {
    DepthGuard g(*this);
    if (at_any_op({"+", "-", "~"})) {
        auto n = mk(NodeKind::OTHER, next().line, "unary");
        n->add(factor());
        return n;
    }
    return power();
}

NodePtr Parser::power() {
    const int line = peek().line;
    auto base = await_primary();
    if (!accept_op("**")) return base;
    auto n = mk(NodeKind::OTHER, line, "**");
    n->add(std::move(base));
    n->add(factor());
    return n;
}

NodePtr Parser::await_primary() {
    if (!at_kw("await")) return primary();
    auto n = mk(NodeKind::OTHER, next().line, "await");
    n->add(primary());
    return n;
}

NodePtr Parser::primary() {
    auto node = atom();
    int chain = 0;
    for (;;) {
        const Token& tk = peek();
        if (tk.kind != TokKind::OP) break;
        if (tk.text == ".") {
            next();
            auto a = mk(NodeKind::ATTRIBUTE, tk.line, expect_name());
            a->add(std::move(node));
            node = std::move(a);
        } else if (tk.text == "(") {
            next();
            auto c = mk(NodeKind::CALL, tk.line);
            c->add(std::move(node));
            arguments(c.get());
            expect_op(")");
            node = std::move(c);
        } else if (tk.text == "[") {
            next();
            auto s = mk(NodeKind::SUBSCRIPT, tk.line);
            s->add(std::move(node));
            s->add(slices());
            expect_op("]");
            node = std::move(s);
        } else {
            break;
        }
        if (++chain > max_depth_) fail("expression too deeply nested", tk);
    }
    return node;
}

void Parser::arguments(Node* call) {
    if (at_op(")")) return;
    for (;;) {
        const int line = peek().line;
        if (accept_op("*")) {
            auto s = mk(NodeKind::STARRED, line);
            s->add(expression());
            call->add(std::move(s));
        } else if (accept_op("**")) {
            auto s = mk(NodeKind::OTHER, line, "**");
            s->add(expression());
            call->add(std::move(s));
        } else if (peek().kind == TokKind::NAME && peek(1).kind == TokKind::OP && peek(1).text == "=") {
            auto k = mk(NodeKind::OTHER, line, "keyword");
            k->alias = expect_name();
            next();
            k->add(expression());
            call->add(std::move(k));
        } else {
            auto e = named_expression();
            if (at_kw("for") || at_kw("async")) e = comprehension(std::move(e), line);
            call->add(std::move(e));
        }
        if (!accept_op(",")) break;
        if (at_op(")")) break;
    }
}

NodePtr Parser::slices() {
    const int line = peek().line;
    auto first = slice();
    if (!at_op(",")) return first;
    auto tup = mk(NodeKind::TUPLE, line);
    tup->add(std::move(first));
    while (accept_op(",")) {
        if (at_op("]")) break;
        tup->add(slice());
    }
    return tup;
}

NodePtr Parser::slice() {
    const int line = peek().line;
    if (at_op("*")) return star_expression();
    NodePtr lower;
    if (!at_op(":")) {
        lower = named_expression();
        if (!at_op(":")) return lower;
    }
    auto s = mk(NodeKind::OTHER, line, "slice");
    if (lower) s->add(std::move(lower));
    next();
    if (!at_any_op({":", "]", ","})) s->add(expression());
    if (accept_op(":")) {
        if (!at_any_op({"]", ","})) s->add(expression());
    }
    return s;
}

NodePtr Parser::atom() {
    const Token& tk = peek();
    switch (tk.kind) {
        case TokKind::NAME:
            if (tk.text == "True" || tk.text == "False" || tk.text == "None") {
                next();
                return mk(NodeKind::CONSTANT, tk.line, tk.text);
            }
            if (is_keyword(tk.text)) fail("invalid syntax", tk);
            next();
            return mk(NodeKind::NAME, tk.line, tk.text);
        case TokKind::NUMBER:
            next();
            return mk(NodeKind::CONSTANT, tk.line, tk.text);
        case TokKind::STRING: {
            auto n = mk(NodeKind::CONSTANT, tk.line, tk.text);
            while (peek().kind == TokKind::STRING) fstring_fields(next(), n.get());
            return n;
        }
        case TokKind::OP:
            if (tk.text == "(") return paren_atom();
            if (tk.text == "[") return list_atom();
            if (tk.text == "{") return dict_atom();
            if (tk.text == "...") {
                next();
                return mk(NodeKind::CONSTANT, tk.line, tk.text);
            }
            break;
        default:
            break;
    }
    fail_here("invalid syntax");
}

NodePtr Parser::paren_atom() {
    const int line = next().line;
    if (accept_op(")")) return mk(NodeKind::TUPLE, line);
    if (at_kw("yield")) {
        auto y = yield_expr();
        expect_op(")");
        return y;
    }
    auto first = star_expression();
    if (at_kw("for") || at_kw("async")) {
        auto c = comprehension(std::move(first), line);
        expect_op(")");
        return c;
    }
    if (!at_op(",")) {
        expect_op(")");
        return first;
    }
    auto tup = mk(NodeKind::TUPLE, line);
    tup->add(std::move(first));
    while (accept_op(",")) {
        if (at_op(")")) break;
        tup->add(star_expression());
    }
    expect_op(")");
    return tup;
}

NodePtr Parser::list_atom() {
    const int line = next().line;
    auto n = mk(NodeKind::LIST, line);
    if (accept_op("]")) return n;
    auto first = star_expression();
    if (at_kw("for") || at_kw("async")) {
        auto c = comprehension(std::move(first), line);
        expect_op("]");
        return c;
    }
    n->add(std::move(first));
    while (accept_op(",")) {
        if (at_op("]")) break;
        n->add(star_expression());
    }
    expect_op("]");
    return n;
}

NodePtr Parser::dict_atom() {
    const int line = next().line;
    auto n = mk(NodeKind::OTHER, line, "dict_or_set");
    if (accept_op("}")) return n;
    bool first = true;
    for (;;) {
        if (accept_op("**")) {
            n->add(bitwise_or());
        } else {
            auto k = star_expression();
            if (accept_op(":")) {
                auto pair = mk(NodeKind::OTHER, k->line, "pair");
                pair->add(std::move(k));
                pair->add(expression());
                k = std::move(pair);
            }
            if (first && (at_kw("for") || at_kw("async"))) {
                auto c = comprehension(std::move(k), line);
                expect_op("}");
                return c;
            }
            n->add(std::move(k));
        }
        first = false;
        if (!accept_op(",")) break;
        if (at_op("}")) break;
    }
    expect_op("}");
    return n;
}

NodePtr Parser::comprehension(NodePtr element, int line) {
    auto c = mk(NodeKind::COMPREHENSION, line);
    c->add(std::move(element));
    while (at_kw("for") || at_kw("async")) {
        accept_kw("async");
        if (!accept_kw("for")) fail_here("invalid syntax");
        const Token start = peek();
        auto target = target_list();
        check_target(*target, TargetMode::FOR, start);
        c->add(std::move(target));
        if (!accept_kw("in")) fail_here("invalid syntax");
        c->add(disjunction());
        while (accept_kw("if")) c->add(disjunction());
    }
    return c;
}

NodePtr Parser::target_atom() {
    if (at_op("*")) {
        auto s = mk(NodeKind::STARRED, next().line);
        s->add(bitwise_or());
        return s;
    }
    return bitwise_or();
}

NodePtr Parser::target_list() {
    const int line = peek().line;
    auto first = target_atom();
    if (!at_op(",")) return first;
    auto tup = mk(NodeKind::TUPLE, line);
    tup->add(std::move(first));
    while (accept_op(",")) {
        if (at_kw("in") || at_op("=")) break;
        tup->add(target_atom());
    }
    return tup;
}

void shift_lines(Node* n, int by) {
    n->line += by;
    for (auto& c : n->children) shift_lines(c.get(), by);
}

NodePtr Parser::embedded_expression() {
    auto e = star_expressions();
    if (peek().kind != TokKind::NEWLINE) fail_here("f-string: invalid syntax");
    return e;
}

// Parses the replacement fields of an f-string token into children of owner,
// so calls made inside them are visible to the tree walk.
void Parser::fstring_fields(const Token& tk, Node* owner) {
    const size_t q = tk.text.find_first_of("'\"");
    if (q == std::string::npos) return;
    const std::string prefix = tk.text.substr(0, q);
    if (prefix.find_first_of("fF") == std::string::npos) return;
    const bool raw = prefix.find_first_of("rR") != std::string::npos;
    const char quote = tk.text[q];
    const size_t qlen = tk.text.size() >= q + 6 && tk.text.compare(q, 3, std::string(3, quote)) == 0 ? 3 : 1;
    const std::string body = tk.text.substr(q + qlen, tk.text.size() - q - 2 * qlen);

    std::vector<FStringField> fields;
    std::string err = FStringSplitter(body, raw, &fields).run();
    if (!err.empty()) fail(err, tk);

    const int budget = max_depth_ - depth_;
    if (budget <= 0) fail("maximum nesting depth exceeded", tk);
    for (const auto& f : fields) {
        const std::string wrapped = "(" + f.expr + ")";
        std::vector<Token> toks;
        Lexer lx(wrapped, &toks);
        SyntaxError sub;
        try {
            if (!lx.run()) throw ParseFail{lx.err};
            Parser ps(toks, budget);
            shift_lines(owner->add(ps.embedded_expression()), tk.line + f.line_offset - 1);
            continue;
        } catch (const ParseFail& pf) {
            sub = pf.err;
        }
        const int line = tk.line + f.line_offset + std::max(sub.line, 1) - 1;
        throw ParseFail{SyntaxError{sub.message, line, sub.line <= 1 ? tk.col : sub.col}};
    }
}

NodePtr Parser::yield_expr() {
    auto n = mk(NodeKind::OTHER, next().line, "yield");
    if (accept_kw("from")) {
        n->add(expression());
        return n;
    }
    if (starts_expression()) n->add(star_expressions());
    return n;
}

} // namespace

bool tokenize(const std::string& src, std::vector<Token>* out, SyntaxError* err) {
    Lexer lx(src, out);
    if (lx.run()) return true;
    if (err) *err = lx.err;
    return false;
}

bool parse_module(const std::string& src, std::unique_ptr<Node>* out, SyntaxError* err, int max_depth) {
    std::vector<Token> toks;
    if (!tokenize(src, &toks, err)) return false;
    try {
        Parser ps(toks, max_depth);
        *out = ps.module();
        return true;
    } catch (const ParseFail& f) {
        if (err) *err = f.err;
        return false;
    }
}

void walk(const Node& root, const std::function<void(const Node&)>& fn) {
    fn(root);
    for (const auto& c : root.children) walk(*c, fn);
}

std::string dotted_name(const Node& n) {
    if (n.kind == NodeKind::NAME) return n.name;
    if (n.kind == NodeKind::ATTRIBUTE && !n.children.empty()) {
        const std::string base = dotted_name(*n.children.front());
        if (base.empty()) return {};
        return base + "." + n.name;
    }
    return {};
}

} // namespace evogate::py
