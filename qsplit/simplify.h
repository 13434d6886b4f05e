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

/*!
 * \file
 * \brief Partial assignments and the functions that apply them to a formula.
 */
namespace QSplit {
/*!
 * \addtogroup split
 */
//@{

//! Type for storing the value of a variable under an assignment.
using Val_t = uint8_t;

constexpr Val_t value_free  = 0; //!< Variable is not assigned.
constexpr Val_t value_true  = 1; //!< Variable is assigned true.
constexpr Val_t value_false = 2; //!< Variable is assigned false.

//! A partial assignment over a prefix of the quantifier order.
/*!
 * Variables are stored in the order in which they were assigned, which is
 * the order of the quantifier prefix.
 */
class Assignment {
public:
    Assignment() = default;

    //! Assigns value to v, which was bound by quantifier q.
    /*!
     * \pre v > 0 and v is not yet assigned.
     */
    void assign(Var_t v, bool value, Quantifier q = Quantifier::exists);

    //! Returns the value of v or value_free if v is not assigned.
    [[nodiscard]] Val_t value(Var_t v) const { return v < vals_.size() ? vals_[v] : value_free; }
    [[nodiscard]] bool  isTrue(Lit_t lit) const { return value(var(lit)) == (sign(lit) ? value_false : value_true); }
    [[nodiscard]] bool  isFalse(Lit_t lit) const { return value(var(lit)) == (sign(lit) ? value_true : value_false); }
    [[nodiscard]] bool  assigned(Var_t v) const { return value(v) != value_free; }

    //! Returns the number of assigned variables.
    [[nodiscard]] uint32_t size() const { return static_cast<uint32_t>(lits_.size()); }
    [[nodiscard]] bool     empty() const { return lits_.empty(); }
    //! Returns the literals made true by this assignment in assignment order.
    [[nodiscard]] const LitVec& literals() const { return lits_; }
    //! Returns the quantifier of the i-th assigned variable.
    [[nodiscard]] Quantifier quantifier(uint32_t i) const { return types_[i]; }
    //! Returns whether some assigned variable is universally quantified.
    [[nodiscard]] bool hasUniversal() const;

private:
    LitVec                  lits_;
    std::vector<Quantifier> types_;
    std::vector<Val_t>      vals_;
};

//! Applies a to the given clauses.
/*!
 * Clauses containing a literal true under a are removed, literals false
 * under a are removed from the remaining clauses. A clause all of whose
 * literals are false is kept as the empty clause. The order of clauses and of
 * literals within a clause is preserved.
 */
[[nodiscard]] ClauseVec simplifyClauses(const ClauseVec& clauses, const Assignment& a);

//! Removes all variables assigned by a from the given prefix.
/*!
 * Blocks that become empty are dropped. The order of the remaining blocks and
 * variables is preserved and no quantifier is changed.
 */
[[nodiscard]] Prefix rewritePrefix(const Prefix& prefix, const Assignment& a);

//! Rebinds all variables assigned by a existentially while keeping their position.
/*!
 * A block is split where the quantifier of its variables changes and adjacent
 * blocks with the same quantifier are joined.
 */
[[nodiscard]] Prefix existentialPrefix(const Prefix& prefix, const Assignment& a);

//@}
} // namespace QSplit
