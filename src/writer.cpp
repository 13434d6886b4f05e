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
#include <qsplit/writer.h>

#include <ostream>
#include <sstream>

namespace QSplit {

QdimacsWriter::QdimacsWriter(std::ostream& os) : os_(&os) {}

void QdimacsWriter::write(const Formula& f) {
    for (const auto& c : f.comments) { writeComment(c); }
    for (const auto& a : f.assumptions) { write(a); }
    writeHeader(f.maxVar(), static_cast<uint32_t>(f.clauses.size()));
    for (const auto& b : f.prefix) { write(b); }
    for (const auto& c : f.clauses) { write(c); }
}

void QdimacsWriter::writeComment(std::string_view text) {
    // Embedded line breaks would end the comment early.
    for (std::size_t start = 0;;) {
        auto end = text.find('\n', start);
        *os_ << "c " << text.substr(start, end - start) << '\n';
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }
}

void QdimacsWriter::writeHeader(uint32_t numVars, uint32_t numClauses) {
    *os_ << "p cnf " << numVars << ' ' << numClauses << '\n';
}

void QdimacsWriter::write(const AssumptionLine& line) {
    *os_ << (line.comment ? "cs int " : "s int ");
    const char* sep = "";
    for (const auto& a : line.chain) {
        *os_ << sep;
        if (not a.operands.empty()) {
            char c = '[';
            for (auto v : a.operands) {
                *os_ << c << v;
                c = ' ';
            }
            *os_ << "] ";
        }
        *os_ << static_cast<char>(a.op) << ' ';
        if (a.rhs.isPattern()) {
            *os_ << '{' << a.rhs.bits << '}';
        }
        else {
            *os_ << a.rhs.value;
        }
        sep = " ; ";
    }
    *os_ << '\n';
}

void QdimacsWriter::write(const QuantBlock& block) {
    *os_ << toChar(block.type);
    for (auto v : block.vars) { *os_ << ' ' << v; }
    *os_ << " 0\n";
}

void QdimacsWriter::write(const Clause& clause) {
    for (auto lit : clause) { *os_ << lit << ' '; }
    *os_ << "0\n";
}

void writeQdimacs(std::ostream& os, const Formula& f) { QdimacsWriter(os).write(f); }

std::string toQdimacs(const Formula& f) {
    std::stringstream str;
    writeQdimacs(str, f);
    return str.str();
}

} // namespace QSplit
