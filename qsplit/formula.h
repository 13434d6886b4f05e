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

#include <qsplit/qsplitfwd.h>

#include <cstdint>
#include <string>
#include <vector>

/*!
 * \file
 * \brief Structural model of a quantified formula in (extended) qdimacs format.
 */
namespace QSplit {
/*!
 * \addtogroup formula
 */
//@{

//! A variable is a positive integer in the range [1;var_max].
using Var_t = uint32_t;
//! A literal is a non-zero signed variable id; negative literals denote negated variables.
using Lit_t = int32_t;

constexpr auto var_max = static_cast<Var_t>(INT32_MAX);

using VarVec    = std::vector<Var_t>;
using LitVec    = std::vector<Lit_t>;
//! A clause is a disjunction of literals; an empty clause is unsatisfiable.
using Clause    = LitVec;
using ClauseVec = std::vector<Clause>;

constexpr Var_t  var(Lit_t lit) { return static_cast<Var_t>(lit < 0 ? -lit : lit); }
constexpr bool   sign(Lit_t lit) { return lit < 0; }
constexpr Lit_t  posLit(Var_t v) { return static_cast<Lit_t>(v); }
constexpr Lit_t  negLit(Var_t v) { return -static_cast<Lit_t>(v); }
constexpr Lit_t  toLit(Var_t v, bool value) { return value ? posLit(v) : negLit(v); }

//! Advances last to the next variable and returns it.
/*!
 * \throws std::overflow_error if last is already var_max.
 */
Var_t nextVar(Var_t& last);

//! Quantifier of a block.
enum class Quantifier : uint8_t { exists = 0, forall = 1 };

//! Returns the character used for q in qdimacs, i.e. 'e' or 'a'.
constexpr char toChar(Quantifier q) { return q == Quantifier::exists ? 'e' : 'a'; }

//! A quantifier block: one quantifier followed by an ordered list of variables.
struct QuantBlock {
    Quantifier type{Quantifier::exists};
    VarVec     vars;

    friend bool operator==(const QuantBlock&, const QuantBlock&) = default;
};
using Prefix = std::vector<QuantBlock>;

//! A variable of the quantifier prefix together with its quantifier.
struct PrefixVar {
    Var_t      var;
    Quantifier type;
};
using PrefixVarVec = std::vector<PrefixVar>;

//! The problem line: p cnf <numVars> <numClauses>
struct ProblemHeader {
    uint32_t numVars{0};
    uint32_t numClauses{0};

    friend bool operator==(const ProblemHeader&, const ProblemHeader&) = default;
};

//! Comparison operator of an integer assumption.
enum class CmpOp : uint8_t { less = '<', greater = '>', equal = '=' };

//! Right-hand side of an integer assumption: either an integer or an explicit bit pattern.
/*!
 * A bit pattern is stored as a string of '0' and '1' characters, most significant bit first.
 */
struct AssumeValue {
    static AssumeValue number(int64_t n) { return {n, {}, false}; }
    static AssumeValue pattern(std::string bits) { return {0, std::move(bits), true}; }

    [[nodiscard]] bool isPattern() const { return bitPattern; }

    int64_t     value{0};
    std::string bits;
    bool        bitPattern{false};

    friend bool operator==(const AssumeValue&, const AssumeValue&) = default;
};

//! An integer assumption: [<operands>] <op> <rhs>
struct Assumption {
    VarVec      operands;
    CmpOp       op{CmpOp::equal};
    AssumeValue rhs;

    friend bool operator==(const Assumption&, const Assumption&) = default;
};

//! One assumption directive line, i.e. one or more assumptions chained with ';'.
/*!
 * Directives are kept as opaque metadata: they are stored and emitted but
 * never interpreted.
 */
struct AssumptionLine {
    //! Whether the line was introduced by "cs int" instead of "s int".
    bool                    comment{false};
    std::vector<Assumption> chain;

    friend bool operator==(const AssumptionLine&, const AssumptionLine&) = default;
};
using AssumptionVec = std::vector<AssumptionLine>;

//! A quantified formula in prenex conjunctive normal form.
struct Formula {
    //! Returns the number of variables in the quantifier prefix.
    [[nodiscard]] uint32_t numPrefixVars() const;
    //! Returns the quantifier prefix as a flat list of variables in prefix order.
    [[nodiscard]] PrefixVarVec prefixVars() const;
    //! Returns the largest variable id referenced in the prefix, clauses, or assumptions.
    [[nodiscard]] Var_t maxVar() const;
    //! Returns whether the formula contains an empty clause.
    [[nodiscard]] bool hasEmptyClause() const;
    //! Returns whether v is bound by some quantifier block.
    [[nodiscard]] bool isQuantified(Var_t v) const;

    ProblemHeader header;
    Prefix        prefix;
    ClauseVec     clauses;
    AssumptionVec assumptions;
    //! Optional provenance comments; ignored on read and on comparison.
    std::vector<std::string> comments;
};

//! Returns true if lhs and rhs have the same prefix, clauses, and assumptions.
/*!
 * Header and comments are not compared, since the writer recomputes the header
 * and the parser drops comments.
 */
[[nodiscard]] bool sameStructure(const Formula& lhs, const Formula& rhs);

//@}
} // namespace QSplit
