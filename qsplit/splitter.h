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

#include <qsplit/formula.h>
#include <qsplit/simplify.h>

#include <string>
#include <vector>

/*!
 * \file
 * \brief Case splitting over a prefix of the quantifier order.
 */
namespace QSplit {
/*!
 * \addtogroup split
 */
//@{

//! One branch of a split.
struct SplitResult {
    //! Position of the branch in [0, 2^d); the first split variable is the most significant bit.
    uint32_t   index{0};
    Assignment assignment;
    Formula    formula;
};
using SplitResultVec = std::vector<SplitResult>;

//! Receives the branches produced by Splitter::run().
class SplitSink {
public:
    virtual ~SplitSink();
    //! Called once for each branch.
    /*!
     * Calls are serialized but, if more than one thread is used, not
     * necessarily ordered by index. The result is released once the
     * function returns.
     */
    virtual void onSplit(const SplitResult& r) = 0;
};

//! Enumerates all assignments to the first d variables of a formula's quantifier prefix.
/*!
 * Branch k fixes the i-th prefix variable to bit (d - 1 - i) of k, i.e. variables
 * are fixed in prefix order with false before true. Each branch owns its
 * formula, so branches can be computed and consumed independently.
 *
 * \note The splitter does not copy the formula; it must outlive the splitter.
 */
class Splitter {
public:
    //! Maximal supported split depth.
    static constexpr uint32_t max_depth = 31;

    /*!
     * \throws Error of kind depth_out_of_range if depth exceeds the number of
     *         prefix variables of f or max_depth.
     */
    Splitter(const Formula& f, uint32_t depth, SplitMode mode = SplitMode::simplify);

    [[nodiscard]] uint32_t            depth() const { return depth_; }
    [[nodiscard]] SplitMode           mode() const { return mode_; }
    [[nodiscard]] uint32_t            numSplits() const { return 1u << depth_; }
    [[nodiscard]] const PrefixVarVec& splitVars() const { return vars_; }

    //! Returns the assignment of the branch with the given index.
    [[nodiscard]] Assignment assignment(uint32_t index) const;
    //! Computes the branch with the given index.
    [[nodiscard]] SplitResult split(uint32_t index) const;
    //! Computes all branches on up to numThreads threads and passes them to out.
    /*!
     * If an exception is raised while computing a branch or by out, no further
     * branches are started and the first exception is rethrown once all
     * threads have stopped.
     */
    void run(SplitSink& out, uint32_t numThreads = 1) const;

private:
    void runParallel(SplitSink& out, uint32_t numThreads) const;

    const Formula* formula_;
    PrefixVarVec   vars_;
    uint32_t       depth_;
    SplitMode      mode_;
};

//! Splits f at the given depth and returns all branches ordered by index.
[[nodiscard]] SplitResultVec split(const Formula& f, uint32_t depth, SplitMode mode = SplitMode::simplify,
                                   uint32_t numThreads = 1);

//! Returns the assignment as a string with one character per variable: 'f' for false, 't' for true.
[[nodiscard]] std::string toPattern(const Assignment& a);

//@}
} // namespace QSplit
