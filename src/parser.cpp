//
// Copyright (c) 2026-present The qsplit authors
//
// This file is part of qsplit.
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to
// deal in the Software without restriction, including without limitation the
// rights to use, copy, modify, merge, publish, distribute, sublicense, and/or
// sell copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
// FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS
// IN THE SOFTWARE.
//
#include <qsplit/parser.h>

#include <qsplit/error.h>

#include <potassco/error.h>

#include <istream>
#include <sstream>
#include <utility>

namespace QSplit {
namespace {
constexpr bool isSpace(char c) { return c == ' ' || c == '\t'; }
constexpr bool isDigit(char c) { return c >= '0' && c <= '9'; }

// Cursor over a single input line. Columns are 1-based.
struct LineScanner {
    LineScanner(std::string_view t, unsigned ln) : text(t), line(ln) {}

    [[nodiscard]] unsigned column() const { return static_cast<unsigned>(pos) + 1; }
    [[nodiscard]] char     peek() const { return pos < text.size() ? text[pos] : '\0'; }
    [[nodiscard]] bool     atEnd() const { return pos >= text.size(); }
    [[nodiscard]] bool     atSep() const { return atEnd() || isSpace(peek()); }
    char                   get() { return pos < text.size() ? text[pos++] : '\0'; }
    void                   skipWs() {
        while (isSpace(peek())) { ++pos; }
    }
    bool match(std::string_view word) {
        if (text.substr(pos).starts_with(word)) {
            pos += word.size();
            return true;
        }
        return false;
    }
    // Matches an optionally signed decimal integer.
    bool matchInt(int64_t& out) {
        auto start = pos;
        bool neg   = peek() == '-';
        pos       += neg;
        if (not isDigit(peek())) {
            pos = start;
            return false;
        }
        int64_t n = 0;
        for (; isDigit(peek()); ++pos) {
            if (n > (INT64_MAX - 9) / 10) {
                failAt(ErrorKind::malformed_line, line, static_cast<unsigned>(start) + 1, "integer out of range");
            }
            n = n * 10 + (peek() - '0');
        }
        out = neg ? -n : n;
        return true;
    }
    // Matches an unsigned integer followed by a separator.
    uint32_t matchUint(const char* what) {
        auto    col = column();
        int64_t n   = -1;
        if (not matchInt(n) || n < 0 || n > static_cast<int64_t>(var_max) || not atSep()) {
            failAt(ErrorKind::malformed_line, line, col, "%s", what);
        }
        return static_cast<uint32_t>(n);
    }
    void requireEnd(const char* what) {
        skipWs();
        if (not atEnd()) {
            failAt(ErrorKind::malformed_line, line, column(), "%s", what);
        }
    }

    std::string_view text;
    unsigned         line;
    std::size_t      pos{0};
};

bool isBlank(std::string_view text) {
    return text.find_first_not_of(" \t") == std::string_view::npos;
}
// Returns the first non-blank character of text.
char lead(std::string_view text) {
    auto p = text.find_first_not_of(" \t");
    return p != std::string_view::npos ? text[p] : '\0';
}
bool isComment(std::string_view text) {
    return text.starts_with("c") && (text.size() == 1 || isSpace(text[1]));
}
bool isAssumption(std::string_view text) { return text.starts_with("cs int") || text.starts_with("s int "); }
} // namespace

QdimacsReader::QdimacsReader(Formula& out) : formula_(&out) {}

std::string QdimacsReader::readLine() {
    std::string text;
    for (char c; (c = get()) != '\n' && c;) { text += c; }
    if (not text.empty() && text.back() == '\r') {
        text.pop_back();
    }
    return text;
}

// Parses everything up to and including the problem line.
bool QdimacsReader::doAttach(bool& inc) {
    inc = false;
    *formula_ = Formula{};
    operands_.clear();
    inMatrix_ = false;
    for (;;) {
        auto ln = line();
        if (peek() == 0) {
            failAt(ErrorKind::structural_mismatch, ln, 1, "missing problem line");
        }
        auto text = readLine();
        if (isAssumption(text)) {
            parseAssumption(text, ln);
        }
        else if (isComment(text)) {
            continue;
        }
        else if (text.starts_with("p")) {
            parseProblem(text, ln);
            break;
        }
        else if (isBlank(text)) {
            failAt(ErrorKind::malformed_line, ln, 1, "unexpected blank line before problem line");
        }
        else {
            failAt(ErrorKind::malformed_line, ln, 1, "missing problem line");
        }
    }
    auto numVars = formula_->header.numVars;
    for (const auto& op : operands_) {
        if (op.var > numVars) {
            failAt(ErrorKind::undeclared_variable, op.line, op.col, "assumption: variable %u exceeds declared bound %u",
                   op.var, numVars);
        }
    }
    operands_.clear();
    quantified_.clear();
    return true;
}

bool QdimacsReader::doParse() {
    for (bool blank = false; peek() != 0;) {
        auto ln   = line();
        auto text = readLine();
        if (isBlank(text)) {
            blank = true;
            continue;
        }
        if (blank) {
            failAt(ErrorKind::malformed_line, ln, 1, "unexpected input after blank line");
        }
        if (isAssumption(text)) {
            failAt(ErrorKind::malformed_line, ln, 1, "assumption directive after problem line");
        }
        if (isComment(text)) {
            continue;
        }
        switch (char c = lead(text)) {
            case 'e':
            case 'a':
                if (inMatrix_) {
                    failAt(ErrorKind::malformed_line, ln, 1, "quantifier block after clauses");
                }
                parseQuantBlock(text, ln);
                break;
            case 'p': failAt(ErrorKind::malformed_line, ln, 1, "duplicate problem line");
            default:
                if (not isDigit(c) && c != '-') {
                    failAt(ErrorKind::malformed_line, ln, static_cast<unsigned>(text.find(c)) + 1,
                           "unexpected character '%c'", c);
                }
                inMatrix_ = true;
                parseClause(text, ln);
                break;
        }
    }
    quantified_.clear();
    return true;
}

// <assume> ::= ("cs int" | "s int ") <int_cons> { ";" <int_cons> }
void QdimacsReader::parseAssumption(std::string_view text, unsigned line) {
    LineScanner    s(text, line);
    AssumptionLine out;
    out.comment = s.match("cs int");
    if (not out.comment) {
        s.match("s int ");
    }
    do {
        Assumption a;
        s.skipWs();
        if (s.match("[")) {
            for (;;) {
                s.skipWs();
                if (s.match("]")) {
                    break;
                }
                if (s.atEnd()) {
                    failAt(ErrorKind::structural_mismatch, line, s.column(), "assumption: ']' expected");
                }
                auto    col = s.column();
                int64_t v   = 0;
                if (not s.matchInt(v) || v <= 0 || v > static_cast<int64_t>(var_max)) {
                    failAt(ErrorKind::malformed_line, line, col, "assumption: positive variable expected");
                }
                a.operands.push_back(static_cast<Var_t>(v));
                operands_.push_back(Operand{static_cast<Var_t>(v), line, col});
            }
            s.skipWs();
        }
        auto col = s.column();
        switch (s.get()) {
            case '<': a.op = CmpOp::less; break;
            case '>': a.op = CmpOp::greater; break;
            case '=': a.op = CmpOp::equal; break;
            default : failAt(ErrorKind::malformed_line, line, col, "assumption: comparison operator expected");
        }
        s.skipWs();
        col = s.column();
        if (s.match("{")) {
            std::string bits;
            for (char c; (c = s.peek()) == '0' || c == '1'; s.get()) { bits += c; }
            if (not s.match("}")) {
                failAt(ErrorKind::malformed_line, line, s.column(), "assumption: bit pattern must only contain 0 and 1");
            }
            if (bits.empty()) {
                failAt(ErrorKind::malformed_line, line, col, "assumption: empty bit pattern");
            }
            a.rhs = AssumeValue::pattern(std::move(bits));
        }
        else if (int64_t n = 0; s.matchInt(n)) {
            a.rhs = AssumeValue::number(n);
        }
        else {
            failAt(ErrorKind::malformed_line, line, col, "assumption: integer or bit pattern expected");
        }
        out.chain.push_back(std::move(a));
        s.skipWs();
    } while (s.match(";"));
    s.requireEnd("assumption: ';' or end of line expected");
    formula_->assumptions.push_back(std::move(out));
}

// <problem> ::= "p cnf " <num_vars> " " <num_clauses>
void QdimacsReader::parseProblem(std::string_view text, unsigned line) {
    LineScanner s(text, line);
    s.match("p");
    if (not s.atSep()) {
        failAt(ErrorKind::malformed_line, line, s.column(), "invalid problem line: expected ' ' after 'p'");
    }
    s.skipWs();
    if (not s.match("cnf") || not s.atSep()) {
        failAt(ErrorKind::malformed_line, line, s.column(), "unrecognized format, cnf expected");
    }
    s.skipWs();
    formula_->header.numVars = s.matchUint("#vars expected");
    s.skipWs();
    formula_->header.numClauses = s.matchUint("#clauses expected");
    s.requireEnd("invalid extra characters in problem line");
}

// <quant> ::= ("e" | "a") <var> { <var> } "0"
void QdimacsReader::parseQuantBlock(std::string_view text, unsigned line) {
    LineScanner s(text, line);
    s.skipWs();
    QuantBlock b;
    b.type = s.get() == 'e' ? Quantifier::exists : Quantifier::forall;
    if (not s.atSep()) {
        failAt(ErrorKind::malformed_line, line, s.column(), "quantifier must be followed by ' '");
    }
    for (;;) {
        s.skipWs();
        if (s.atEnd()) {
            failAt(ErrorKind::structural_mismatch, line, s.column(), "quantifier block not terminated by '0'");
        }
        auto    col = s.column();
        int64_t v   = -1;
        if (not s.matchInt(v) || v < 0 || not s.atSep()) {
            failAt(ErrorKind::malformed_line, line, col, "positive variable expected in quantifier block");
        }
        if (v == 0) {
            break;
        }
        if (v > static_cast<int64_t>(formula_->header.numVars)) {
            failAt(ErrorKind::undeclared_variable, line, col, "variable %lld exceeds declared bound %u",
                   static_cast<long long>(v), formula_->header.numVars);
        }
        if (static_cast<std::size_t>(v) >= quantified_.size()) {
            quantified_.resize(static_cast<std::size_t>(v) + 1, 0);
        }
        if (std::exchange(quantified_[static_cast<std::size_t>(v)], 1) != 0) {
            failAt(ErrorKind::duplicate_quantification, line, col, "variable %lld is already quantified",
                   static_cast<long long>(v));
        }
        b.vars.push_back(static_cast<Var_t>(v));
    }
    if (b.vars.empty()) {
        failAt(ErrorKind::malformed_line, line, 1, "empty quantifier block");
    }
    s.requireEnd("unexpected characters after terminating '0'");
    formula_->prefix.push_back(std::move(b));
}

// <clause> ::= { <lit> } "0"
void QdimacsReader::parseClause(std::string_view text, unsigned line) {
    LineScanner s(text, line);
    Clause      c;
    const auto  maxVar = static_cast<int64_t>(formula_->header.numVars);
    for (;;) {
        s.skipWs();
        if (s.atEnd()) {
            failAt(ErrorKind::structural_mismatch, line, s.column(), "clause not terminated by '0'");
        }
        auto    col = s.column();
        int64_t lit = 0;
        if (not s.matchInt(lit) || not s.atSep()) {
            failAt(ErrorKind::malformed_line, line, col, "invalid character in clause - literal expected");
        }
        if (lit == 0) {
            break;
        }
        if (lit < -maxVar || lit > maxVar) {
            failAt(ErrorKind::undeclared_variable, line, col, "variable %lld exceeds declared bound %u",
                   static_cast<long long>(lit < 0 ? -lit : lit), formula_->header.numVars);
        }
        c.push_back(static_cast<Lit_t>(lit));
    }
    s.requireEnd("unexpected characters after terminating '0'");
    formula_->clauses.push_back(std::move(c));
}

Formula parseQdimacs(std::istream& in) {
    Formula       f;
    QdimacsReader reader(f);
    POTASSCO_CHECK(reader.accept(in), std::errc::not_supported, "unrecognized input format");
    POTASSCO_CHECK(reader.parse(), std::errc::not_supported, "unrecognized input format");
    return f;
}

Formula parseQdimacs(std::string_view text) {
    std::stringstream str;
    str << text;
    return parseQdimacs(str);
}

} // namespace QSplit
