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
#include <qsplit/error.h>

#include <cstdarg>
#include <cstdio>
#include <iterator>

namespace QSplit {
namespace {
std::string vformat(const char* fmt, va_list args) {
    char msg[1024];
    std::vsnprintf(msg, std::size(msg), fmt, args);
    return msg;
}
} // namespace

Error::Error(ErrorKind kind, const std::string& msg, unsigned line, unsigned col)
    : std::runtime_error(msg)
    , kind_(kind)
    , line_(line)
    , col_(col) {}

POTASSCO_ATTRIBUTE_FORMAT(4, 5)
void failAt(ErrorKind kind, unsigned line, unsigned col, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    auto what = vformat(fmt, args);
    va_end(args);
    char pre[64];
    std::snprintf(pre, std::size(pre), "parse error in line %u:%u: ", line, col);
    throw Error(kind, pre + what, line, col);
}

POTASSCO_ATTRIBUTE_FORMAT(2, 3)
void fail(ErrorKind kind, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    auto what = vformat(fmt, args);
    va_end(args);
    throw Error(kind, what);
}

} // namespace QSplit
