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
#include <qsplit/simplify.h>

#include <potassco/error.h>

#include <algorithm>
#include <iterator>

namespace QSplit {
/////////////////////////////////////////////////////////////////////////////////////////
// Assignment
/////////////////////////////////////////////////////////////////////////////////////////
void Assignment::assign(Var_t v, bool value, Quantifier q) {
    POTASSCO_CHECK_PRE(v > 0 && v <= var_max, "invalid variable");
    if (v >= vals_.size()) {
        vals_.resize(static_cast<std::size_t>(v) + 1, value_free);
    }
    POTASSCO_CHECK_PRE(vals_[v] == value_free, "variable already assigned");
    vals_[v] = value ? value_true : value_false;
    lits_.push_back(toLit(v, value));
    types_.push_back(q);
}

bool Assignment::hasUniversal() const {
    return std::ranges::find(types_, Quantifier::forall) != types_.end();
}
/////////////////////////////////////////////////////////////////////////////////////////
// Simplification
/////////////////////////////////////////////////////////////////////////////////////////
ClauseVec simplifyClauses(const ClauseVec& clauses, const Assignment& a) {
    ClauseVec out;
    out.reserve(clauses.size());
    for (const auto& c : clauses) {
        if (std::ranges::any_of(c, [&a](Lit_t lit) { return a.isTrue(lit); })) {
            continue;
        }
        auto& reduced = out.emplace_back();
        reduced.reserve(c.size());
        std::ranges::copy_if(c, std::back_inserter(reduced), [&a](Lit_t lit) { return not a.isFalse(lit); });
    }
    return out;
}

Prefix rewritePrefix(const Prefix& prefix, const Assignment& a) {
    Prefix out;
    out.reserve(prefix.size());
    for (const auto& b : prefix) {
        QuantBlock rest{b.type, {}};
        std::ranges::copy_if(b.vars, std::back_inserter(rest.vars), [&a](Var_t v) { return not a.assigned(v); });
        if (not rest.vars.empty()) {
            out.push_back(std::move(rest));
        }
    }
    return out;
}

Prefix existentialPrefix(const Prefix& prefix, const Assignment& a) {
    Prefix out;
    for (const auto& b : prefix) {
        for (auto v : b.vars) {
            auto q = a.assigned(v) ? Quantifier::exists : b.type;
            if (out.empty() || out.back().type != q) {
                out.push_back(QuantBlock{q, {}});
            }
            out.back().vars.push_back(v);
        }
    }
    return out;
}

} // namespace QSplit
