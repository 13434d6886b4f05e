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
#include <qsplit/formula.h>

#include <potassco/error.h>

#include <algorithm>
#include <cerrno>

namespace QSplit {

Var_t nextVar(Var_t& last) {
    POTASSCO_CHECK(last < var_max, EOVERFLOW, "Number of variables out of range");
    return ++last;
}

uint32_t Formula::numPrefixVars() const {
    uint32_t n = 0;
    for (const auto& b : prefix) { n += static_cast<uint32_t>(b.vars.size()); }
    return n;
}

PrefixVarVec Formula::prefixVars() const {
    PrefixVarVec out;
    out.reserve(numPrefixVars());
    for (const auto& b : prefix) {
        for (auto v : b.vars) { out.push_back(PrefixVar{v, b.type}); }
    }
    return out;
}

Var_t Formula::maxVar() const {
    Var_t m = 0;
    for (const auto& b : prefix) {
        for (auto v : b.vars) { m = std::max(m, v); }
    }
    for (const auto& c : clauses) {
        for (auto lit : c) { m = std::max(m, var(lit)); }
    }
    for (const auto& line : assumptions) {
        for (const auto& a : line.chain) {
            for (auto v : a.operands) { m = std::max(m, v); }
        }
    }
    return m;
}

bool Formula::hasEmptyClause() const {
    return std::ranges::any_of(clauses, [](const Clause& c) { return c.empty(); });
}

bool Formula::isQuantified(Var_t v) const {
    return std::ranges::any_of(prefix, [v](const QuantBlock& b) { return std::ranges::find(b.vars, v) != b.vars.end(); });
}

bool sameStructure(const Formula& lhs, const Formula& rhs) {
    return lhs.prefix == rhs.prefix && lhs.clauses == rhs.clauses && lhs.assumptions == rhs.assumptions;
}

} // namespace QSplit
