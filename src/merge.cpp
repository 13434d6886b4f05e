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

#include <potassco/error.h>

namespace QSplit {
namespace {
// Maps variables of one branch to fresh merge variables.
class Renaming {
public:
    explicit Renaming(Var_t& next) : next_(&next) {}
    Var_t operator()(Var_t v) {
        if (v >= ids_.size()) {
            ids_.resize(static_cast<std::size_t>(v) + 1, 0);
        }
        if (ids_[v] == 0) {
            ids_[v] = nextVar(*next_);
            map_.emplace_back(v, ids_[v]);
        }
        return ids_[v];
    }
    Lit_t operator()(Lit_t lit) {
        auto v = (*this)(var(lit));
        return sign(lit) ? negLit(v) : posLit(v);
    }
    MergeBuilder::VarMap release() { return std::move(map_); }

private:
    Var_t*               next_;
    VarVec               ids_;
    MergeBuilder::VarMap map_;
};

void append(Prefix& out, Quantifier q, const VarVec& vars) {
    if (out.empty() || out.back().type != q) {
        out.push_back(QuantBlock{q, {}});
    }
    out.back().vars.insert(out.back().vars.end(), vars.begin(), vars.end());
}
} // namespace

MergeBuilder::MergeBuilder() = default;

void MergeBuilder::add(const SplitResult& r) {
    POTASSCO_CHECK_PRE(not branches_.contains(r.index), "merge: branch %u already added", r.index);
    POTASSCO_CHECK(not r.assignment.hasUniversal(), std::errc::invalid_argument,
                   "merge: branch %u fixes a universally quantified variable", r.index);
    branches_.emplace(r.index, Branch{r.assignment.literals(), r.formula.prefix, r.formula.clauses});
}

Formula MergeBuilder::build() {
    POTASSCO_CHECK_PRE(not branches_.empty(), "merge: no branches");
    Formula out;
    Var_t   next = 0;
    Clause  select;
    maps_.clear();
    for (const auto& [index, b] : branches_) {
        maps_.push_back(BranchMap{index, nextVar(next), b.fixed, {}});
        select.push_back(posLit(next));
    }
    append(out.prefix, Quantifier::exists, VarVec(select.begin(), select.end()));
    auto map = maps_.begin();
    for (const auto& [index, b] : branches_) {
        Renaming rename(next);
        for (const auto& block : b.prefix) {
            VarVec vars;
            vars.reserve(block.vars.size());
            for (auto v : block.vars) { vars.push_back(rename(v)); }
            append(out.prefix, block.type, vars);
        }
        for (const auto& c : b.clauses) {
            auto& cc = out.clauses.emplace_back();
            cc.reserve(c.size() + 1);
            cc.push_back(negLit(map->selector));
            for (auto lit : c) { cc.push_back(rename(lit)); }
        }
        map->vars = rename.release();
        ++map;
    }
    out.clauses.push_back(std::move(select));
    out.header.numVars    = next;
    out.header.numClauses = static_cast<uint32_t>(out.clauses.size());
    return out;
}

Formula buildMerge(std::span<const SplitResult> results) {
    MergeBuilder builder;
    for (const auto& r : results) { builder.add(r); }
    return builder.build();
}

} // namespace QSplit
