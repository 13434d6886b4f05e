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

#include <potassco/match_basic_types.h>

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

/*!
 * \file
 * \brief Defines the parser for the extended qdimacs format.
 */
namespace QSplit {
/*!
 * \addtogroup formula
 */
//@{

//! Parser for (extended) qdimacs.
/*!
 * \code
 * <input>    ::= { <comment> | <assume> } <problem> { <quant> } { <clause> } [ <blank> ]
 * <comment>  ::= "c " <text> <EOL>
 * <assume>   ::= ("cs int" | "s int ") <int_cons> { ";" <int_cons> } <EOL>
 * <int_cons> ::= [ "[" { <var> } "]" ] ("<" | ">" | "=") (<int> | "{" { "0" | "1" } "}")
 * <problem>  ::= "p cnf " <num_vars> " " <num_clauses> <EOL>
 * <quant>    ::= ("e" | "a") <var> { <var> } " 0" <EOL>
 * <clause>   ::= { <lit> } "0" <EOL>
 * \endcode
 * Every line is parsed as a whole so that errors can be reported with line and column.
 * \throws Error on malformed input.
 */
class QdimacsReader final : public Potassco::ProgramReader {
public:
    explicit QdimacsReader(Formula& out);

private:
    struct Operand {
        Var_t    var;
        unsigned line;
        unsigned col;
    };
    bool        doAttach(bool& inc) override;
    bool        doParse() override;
    std::string readLine();
    void        parseAssumption(std::string_view text, unsigned line);
    void        parseProblem(std::string_view text, unsigned line);
    void        parseQuantBlock(std::string_view text, unsigned line);
    void        parseClause(std::string_view text, unsigned line);

    Formula*             formula_{nullptr};
    std::vector<Operand> operands_;   // assumption operands, checked once the bound is known
    std::vector<uint8_t> quantified_; // quantified_[v] != 0 iff v is bound by a block
    bool                 inMatrix_{false};
};

//! Reads a formula from the given stream.
/*!
 * \throws Error if the input is not a well-formed formula.
 */
Formula parseQdimacs(std::istream& in);
//! Reads a formula from the given text.
Formula parseQdimacs(std::string_view text);

//@}
} // namespace QSplit
