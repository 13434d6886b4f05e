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
#include <qsplit/error.h>
#include <qsplit/parser.h>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

namespace QSplit::Test {
namespace {
// Parses text and returns the error raised, which must be of type Error.
Error parseError(const char* text) {
    try {
        static_cast<void>(parseQdimacs(text));
    }
    catch (const Error& e) {
        return e;
    }
    FAIL("expected parse error");
    return Error(ErrorKind::malformed_line, "");
}
} // namespace

TEST_CASE("Qdimacs parser", "[parser]") {
    SECTION("parses header, prefix and clauses") {
        auto f = parseQdimacs("c a comment\n"
                              "p cnf 4 3\n"
                              "a 1 2 0\n"
                              "e 3 4 0\n"
                              "1 -3 0\n"
                              "-2 4 3 0\n"
                              "0\n");
        REQUIRE(f.header == ProblemHeader{4, 3});
        REQUIRE(f.prefix.size() == 2);
        REQUIRE(f.prefix[0] == QuantBlock{Quantifier::forall, {1, 2}});
        REQUIRE(f.prefix[1] == QuantBlock{Quantifier::exists, {3, 4}});
        REQUIRE(f.clauses == ClauseVec{{1, -3}, {-2, 4, 3}, {}});
        REQUIRE(f.numPrefixVars() == 4);
        REQUIRE(f.hasEmptyClause());
        REQUIRE(f.assumptions.empty());
        REQUIRE(f.comments.empty());
    }
    SECTION("accepts formula without prefix and clauses") {
        auto f = parseQdimacs("p cnf 0 0\n");
        REQUIRE(f.prefix.empty());
        REQUIRE(f.clauses.empty());
        REQUIRE(f.maxVar() == 0);
    }
    SECTION("keeps free variables") {
        auto f = parseQdimacs("p cnf 3 1\ne 1 0\n1 2 3 0\n");
        REQUIRE(f.isQuantified(1));
        REQUIRE_FALSE(f.isQuantified(2));
        REQUIRE(f.maxVar() == 3);
    }
    SECTION("declared counts are only bounds") {
        auto f = parseQdimacs("p cnf 2147483647 1\ne 3 5 0\n3 -5 0\n");
        REQUIRE(f.header.numVars == 2147483647u);
        REQUIRE(f.prefix[0].vars == VarVec{3, 5});
        REQUIRE(f.maxVar() == 5);
        auto e = parseError("p cnf 2147483647 0\ne 7 7 0\n");
        REQUIRE(e.kind() == ErrorKind::duplicate_quantification);
        REQUIRE(e.column() == 5);
    }
    SECTION("clause count is advisory") {
        auto f = parseQdimacs("p cnf 2 5\n1 2 0\n");
        REQUIRE(f.header.numClauses == 5);
        REQUIRE(f.clauses.size() == 1);
    }
    SECTION("accepts comments everywhere and trailing blank lines") {
        auto f = parseQdimacs("p cnf 2 2\nc x\ne 1 2 0\nc\n1 0\nc y\n2 0\n\n\n");
        REQUIRE(f.clauses == ClauseVec{{1}, {2}});
    }
    SECTION("accepts windows line endings and extra whitespace") {
        auto f = parseQdimacs("p  cnf 2\t1\r\ne  1 2 0 \r\n 1  -2 0\r\n");
        REQUIRE(f.header == ProblemHeader{2, 1});
        REQUIRE(f.prefix[0].vars == VarVec{1, 2});
        REQUIRE(f.clauses == ClauseVec{{1, -2}});
    }
    SECTION("reads from stream") {
        std::stringstream str("p cnf 1 1\ne 1 0\n-1 0\n");
        auto              f = parseQdimacs(str);
        REQUIRE(f.clauses == ClauseVec{{-1}});
    }
}

TEST_CASE("Qdimacs parser reads assumption directives", "[parser]") {
    auto f = parseQdimacs("cs int [1 2] < 5 ; = {0101}\n"
                          "s int [3] > -2\n"
                          "c plain comment\n"
                          "p cnf 3 0\n");
    REQUIRE(f.assumptions.size() == 2);
    const auto& first = f.assumptions[0];
    REQUIRE(first.comment);
    REQUIRE(first.chain.size() == 2);
    REQUIRE(first.chain[0].operands == VarVec{1, 2});
    REQUIRE(first.chain[0].op == CmpOp::less);
    REQUIRE(first.chain[0].rhs == AssumeValue::number(5));
    REQUIRE(first.chain[1].operands.empty());
    REQUIRE(first.chain[1].op == CmpOp::equal);
    REQUIRE(first.chain[1].rhs.isPattern());
    REQUIRE(first.chain[1].rhs.bits == "0101");
    const auto& second = f.assumptions[1];
    REQUIRE_FALSE(second.comment);
    REQUIRE(second.chain.size() == 1);
    REQUIRE(second.chain[0].op == CmpOp::greater);
    REQUIRE(second.chain[0].rhs.value == -2);
    REQUIRE(f.maxVar() == 3);
}

TEST_CASE("Qdimacs parser reports errors", "[parser]") {
    SECTION("message contains location") {
        auto e = parseError("p cnf 3 1\ne 1 2 4 0\n1 0\n");
        REQUIRE(std::string(e.what()).starts_with("parse error in line 2:7: "));
    }
    SECTION("undeclared variable in prefix") {
        auto e = parseError("p cnf 3 1\ne 1 2 4 0\n1 0\n");
        REQUIRE(e.kind() == ErrorKind::undeclared_variable);
        REQUIRE(e.line() == 2);
        REQUIRE(e.column() == 7);
    }
    SECTION("undeclared variable in clause") {
        auto e = parseError("p cnf 3 1\ne 1 0\n1 -4 0\n");
        REQUIRE(e.kind() == ErrorKind::undeclared_variable);
        REQUIRE(e.line() == 3);
        REQUIRE(e.column() == 3);
    }
    SECTION("undeclared variable in assumption") {
        auto e = parseError("s int [3] = 1\np cnf 2 0\n");
        REQUIRE(e.kind() == ErrorKind::undeclared_variable);
        REQUIRE(e.line() == 1);
        REQUIRE(e.column() == 8);
    }
    SECTION("zero in assumption") {
        auto e = parseError("s int [0] = 1\np cnf 2 0\n");
        REQUIRE(e.kind() == ErrorKind::malformed_line);
        REQUIRE(e.column() == 8);
    }
    SECTION("duplicate quantification") {
        auto e = parseError("p cnf 3 1\ne 1 2 0\na 3 2 0\n1 0\n");
        REQUIRE(e.kind() == ErrorKind::duplicate_quantification);
        REQUIRE(e.line() == 3);
        REQUIRE(e.column() == 5);
    }
    SECTION("duplicate within block") {
        auto e = parseError("p cnf 3 0\ne 1 1 0\n");
        REQUIRE(e.kind() == ErrorKind::duplicate_quantification);
        REQUIRE(e.column() == 5);
    }
    SECTION("invalid literal") {
        auto e = parseError("p cnf 3 1\n1 x 0\n");
        REQUIRE(e.kind() == ErrorKind::malformed_line);
        REQUIRE(e.line() == 2);
        REQUIRE(e.column() == 3);
    }
    SECTION("negative variable in prefix") {
        auto e = parseError("p cnf 3 1\ne -1 0\n");
        REQUIRE(e.kind() == ErrorKind::malformed_line);
        REQUIRE(e.column() == 3);
    }
    SECTION("unterminated clause") {
        auto e = parseError("p cnf 3 1\n1 2\n");
        REQUIRE(e.kind() == ErrorKind::structural_mismatch);
        REQUIRE(e.line() == 2);
        REQUIRE(e.column() == 4);
    }
    SECTION("unterminated block") {
        auto e = parseError("p cnf 3 1\na 1 2\n1 0\n");
        REQUIRE(e.kind() == ErrorKind::structural_mismatch);
        REQUIRE(e.line() == 2);
    }
    SECTION("text after terminating zero") {
        auto e = parseError("p cnf 3 1\n1 0 2\n");
        REQUIRE(e.kind() == ErrorKind::malformed_line);
        REQUIRE(e.column() == 5);
    }
    SECTION("empty block") {
        auto e = parseError("p cnf 3 1\ne 0\n1 0\n");
        REQUIRE(e.kind() == ErrorKind::malformed_line);
        REQUIRE(e.line() == 2);
    }
    SECTION("missing problem line") {
        REQUIRE(parseError("").kind() == ErrorKind::structural_mismatch);
        REQUIRE(parseError("c only a comment\n").kind() == ErrorKind::structural_mismatch);
        auto e = parseError("e 1 0\n");
        REQUIRE(e.kind() == ErrorKind::malformed_line);
        REQUIRE(e.line() == 1);
    }
    SECTION("invalid problem line") {
        REQUIRE(parseError("p dnf 1 1\n").kind() == ErrorKind::malformed_line);
        REQUIRE(parseError("p cnf x 1\n").kind() == ErrorKind::malformed_line);
        REQUIRE(parseError("p cnf 1 1 1\n").kind() == ErrorKind::malformed_line);
        REQUIRE(parseError("p cnf 1 1\np cnf 1 1\n").line() == 2);
    }
    SECTION("quantifier block after clause") {
        auto e = parseError("p cnf 2 1\n1 0\ne 1 0\n");
        REQUIRE(e.kind() == ErrorKind::malformed_line);
        REQUIRE(e.line() == 3);
    }
    SECTION("blank line before end") {
        auto e = parseError("p cnf 2 2\n1 0\n\n2 0\n");
        REQUIRE(e.kind() == ErrorKind::malformed_line);
        REQUIRE(e.line() == 4);
    }
    SECTION("assumption after problem line") {
        auto e = parseError("p cnf 2 0\ns int [1] = 1\n");
        REQUIRE(e.kind() == ErrorKind::malformed_line);
        REQUIRE(e.line() == 2);
    }
    SECTION("invalid assumptions") {
        REQUIRE(parseError("s int [1] ! 1\np cnf 1 0\n").column() == 11);
        REQUIRE(parseError("s int [1] = {0121}\np cnf 1 0\n").kind() == ErrorKind::malformed_line);
        REQUIRE(parseError("s int [1] = {}\np cnf 1 0\n").kind() == ErrorKind::malformed_line);
        REQUIRE(parseError("s int [1] = x\np cnf 1 0\n").kind() == ErrorKind::malformed_line);
        REQUIRE(parseError("s int [1 = 1\np cnf 1 0\n").kind() == ErrorKind::malformed_line);
        REQUIRE(parseError("s int [1 2\np cnf 2 0\n").kind() == ErrorKind::structural_mismatch);
        REQUIRE(parseError("s int [1] = 1 2\np cnf 1 0\n").kind() == ErrorKind::malformed_line);
    }
}

} // namespace QSplit::Test
