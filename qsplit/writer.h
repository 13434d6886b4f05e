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

#include <iosfwd>
#include <string>
#include <string_view>

/*!
 * \file
 * \brief Defines the writer for the extended qdimacs format.
 */
namespace QSplit {

//! Writes formulas in (extended) qdimacs format.
/*!
 * The problem line is recomputed from the written content: the number of
 * variables is the largest variable id referenced, the number of clauses is
 * the number of written clauses.
 */
class QdimacsWriter {
public:
    explicit QdimacsWriter(std::ostream& os);

    //! Writes f as a complete qdimacs document.
    void write(const Formula& f);

    void writeComment(std::string_view text);
    void writeHeader(uint32_t numVars, uint32_t numClauses);
    void write(const AssumptionLine& line);
    void write(const QuantBlock& block);
    void write(const Clause& clause);

private:
    std::ostream* os_;
};

//! Writes f to os.
void writeQdimacs(std::ostream& os, const Formula& f);
//! Returns f in qdimacs format.
[[nodiscard]] std::string toQdimacs(const Formula& f);

} // namespace QSplit
