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
#include <qsplit/merge.h>
#include <qsplit/parser.h>
#include <qsplit/writer.h>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

namespace QSplit::Test {

TEST_CASE("Merge formula", "[merge]") {
    auto f = parseQdimacs("p cnf 3 2\n"
                          "e 1 2 3 0\n"
                          "1 2 0\n"
                          "-1 3 0\n");
    auto r = split(f, 1);

    SECTION("selects among branches") {
        MergeBuilder builder;
        for (const auto& b : r) { builder.add(b); }
        REQUIRE(builder.numBranches() == 2);
        auto m = builder.build();
        REQUIRE(m.prefix == Prefix{{Quantifier::exists, {1, 2, 3, 4, 5, 6}}});
        REQUIRE(m.clauses == ClauseVec{{-1, 3}, {-2, 6}, {1, 2}});
        REQUIRE(m.header == ProblemHeader{6, 3});

        REQUIRE(builder.index(0) == 0);
        REQUIRE(builder.selector(0) == 1);
        REQUIRE(builder.fixed(0) == LitVec{-1});
        REQUIRE(builder.varMap(0) == MergeBuilder::VarMap{{2, 3}, {3, 4}});
        REQUIRE(builder.index(1) == 1);
        REQUIRE(builder.selector(1) == 2);
        REQUIRE(builder.fixed(1) == LitVec{1});
        REQUIRE(builder.varMap(1) == MergeBuilder::VarMap{{2, 5}, {3, 6}});
    }
    SECTION("order of branches does not matter") {
        MergeBuilder builder;
        builder.add(r[1]);
        builder.add(r[0]);
        REQUIRE(toQdimacs(builder.build()) == toQdimacs(buildMerge(r)));
    }
    SECTION("duplicate branch is rejected") {
        MergeBuilder builder;
        builder.add(r[0]);
        REQUIRE_THROWS_AS(builder.add(r[0]), std::logic_error);
    }
    SECTION("empty merge is rejected") {
        MergeBuilder builder;
        REQUIRE_THROWS_AS(builder.build(), std::logic_error);
    }
}

TEST_CASE("Merge variables", "[merge]") {
    Var_t last = 0;
    REQUIRE(nextVar(last) == 1);
    REQUIRE(last == 1);
    last = var_max - 1;
    REQUIRE(nextVar(last) == var_max);
    REQUIRE(posLit(last) > 0);
    REQUIRE_THROWS(nextVar(last));
    REQUIRE(last == var_max);
}

TEST_CASE("Merge keeps structure of branches", "[merge]") {
    SECTION("inner prefix and free variables") {
        auto f = parseQdimacs("p cnf 4 2\n"
                              "e 1 0\n"
                              "a 2 0\n"
                              "e 3 0\n"
                              "1 2 3 4 0\n"
                              "-1 -2 0\n");
        auto m = buildMerge(split(f, 1));
        // selectors 1 2, branch 0 maps 2 3 4 to 3 4 5, branch 1 maps 2 3 to 6 7
        REQUIRE(m.prefix == Prefix{{Quantifier::exists, {1, 2}},
                                   {Quantifier::forall, {3}},
                                   {Quantifier::exists, {4}},
                                   {Quantifier::forall, {6}},
                                   {Quantifier::exists, {7}}});
        REQUIRE(m.clauses == ClauseVec{{-1, 3, 4, 5}, {-2, -6}, {1, 2}});
        REQUIRE_FALSE(m.isQuantified(5));
        REQUIRE(parseQdimacs(toQdimacs(m)).clauses == m.clauses);
    }
    SECTION("empty clause of a branch disables its selector") {
        auto f = parseQdimacs("p cnf 2 1\ne 1 2 0\n1 0\n");
        auto m = buildMerge(split(f, 1));
        REQUIRE(m.clauses == ClauseVec{{-1}, {1, 2}});
        REQUIRE(m.prefix == Prefix{{Quantifier::exists, {1, 2, 3, 4}}});
    }
    SECTION("universal branches are rejected") {
        auto         f = parseQdimacs("p cnf 2 1\na 1 0\ne 2 0\n1 2 0\n");
        auto         r = split(f, 1);
        MergeBuilder builder;
        REQUIRE_THROWS_AS(builder.add(r[0]), std::invalid_argument);
        REQUIRE(builder.numBranches() == 0);
    }
}

} // namespace QSplit::Test
