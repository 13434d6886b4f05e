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
#pragma once

#include <qsplit/splitter.h>

#include <map>
#include <span>
#include <utility>
#include <vector>

/*!
 * \file
 * \brief Construction of a formula selecting among the branches of a split.
 */
namespace QSplit {
/*!
 * \addtogroup split
 */
//@{

//! Builds a single formula from the branches of an existential split.
/*!
 * The merge formula has one selector variable s_i per branch followed by a
 * private copy of the variables of each branch. For each clause C of branch
 * i, it contains the clause (-s_i v C'), where C' is C over the copied
 * variables, and finally the clause (s_1 v ... v s_n). The prefix starts with
 * an existential block over all selectors followed by the renamed prefixes of
 * the branches in index order. Variables that are free in a branch stay free.
 *
 * Branches are numbered by their index, independent of the order in which they
 * are added.
 */
class MergeBuilder {
public:
    //! Pairs of (branch variable, merge variable).
    using VarMap = std::vector<std::pair<Var_t, Var_t>>;

    MergeBuilder();

    //! Adds the given branch.
    /*!
     * \pre No branch with the same index was added.
     * \throws std::invalid_argument if r fixes a universally quantified variable,
     *         since such branches combine by conjunction and need no selector.
     */
    void add(const SplitResult& r);

    [[nodiscard]] uint32_t numBranches() const { return static_cast<uint32_t>(branches_.size()); }

    //! Builds the merge formula from all branches added so far.
    /*!
     * \pre numBranches() > 0
     */
    [[nodiscard]] Formula build();

    //! Returns the split index of the i-th branch in the last built formula.
    [[nodiscard]] uint32_t index(uint32_t i) const { return maps_.at(i).index; }
    //! Returns the selector of the i-th branch in the last built formula.
    [[nodiscard]] Var_t selector(uint32_t i) const { return maps_.at(i).selector; }
    //! Returns the variable map of the i-th branch in the last built formula.
    [[nodiscard]] const VarMap& varMap(uint32_t i) const { return maps_.at(i).vars; }
    //! Returns the assignment of the i-th branch.
    [[nodiscard]] const LitVec& fixed(uint32_t i) const { return maps_.at(i).fixed; }

private:
    struct Branch {
        LitVec    fixed;
        Prefix    prefix;
        ClauseVec clauses;
    };
    struct BranchMap {
        uint32_t index;
        Var_t    selector;
        LitVec   fixed;
        VarMap   vars;
    };
    std::map<uint32_t, Branch> branches_;
    std::vector<BranchMap>     maps_;
};

//! Builds the merge formula of the given branches.
[[nodiscard]] Formula buildMerge(std::span<const SplitResult> results);

//@}
} // namespace QSplit
