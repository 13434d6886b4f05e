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

#include <potassco/error.h>

#include <cstdint>
#include <stdexcept>
#include <string>

/*!
 * \file
 * \brief Error type raised by the parser and the splitter.
 */
namespace QSplit {

//! Kinds of failures reported by libqsplit.
enum class ErrorKind : uint8_t {
    malformed_line           = 1, //!< Line does not match the form expected at its position.
    undeclared_variable      = 2, //!< Variable id is 0 or exceeds the declared bound.
    duplicate_quantification = 3, //!< Variable is quantified more than once.
    depth_out_of_range       = 4, //!< Split depth exceeds the quantifier prefix.
    structural_mismatch      = 5  //!< Missing terminating 0 or premature end of input.
};

//! Exception type for all input and usage errors of libqsplit.
/*!
 * Errors detected while reading a formula carry the (1-based) line and column
 * of the offending token. Other errors have line and column 0.
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& msg, unsigned line = 0, unsigned col = 0);
    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] unsigned  line() const noexcept { return line_; }
    [[nodiscard]] unsigned  column() const noexcept { return col_; }

private:
    ErrorKind kind_;
    unsigned  line_;
    unsigned  col_;
};

//! Throws an Error of the given kind located at line:col.
[[noreturn]] void failAt(ErrorKind kind, unsigned line, unsigned col, const char* fmt, ...)
    POTASSCO_ATTRIBUTE_FORMAT(4, 5);
//! Throws an Error of the given kind without location.
[[noreturn]] void fail(ErrorKind kind, const char* fmt, ...) POTASSCO_ATTRIBUTE_FORMAT(2, 3);

} // namespace QSplit
