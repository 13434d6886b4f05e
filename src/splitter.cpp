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
#include <qsplit/splitter.h>

#include <qsplit/error.h>
#include <qsplit/mt/thread.h>

#include <potassco/error.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace QSplit {
SplitSink::~SplitSink() = default;

Splitter::Splitter(const Formula& f, uint32_t depth, SplitMode mode)
    : formula_(&f)
    , depth_(depth)
    , mode_(mode) {
    auto numVars = f.numPrefixVars();
    if (depth > numVars || depth > max_depth) {
        fail(ErrorKind::depth_out_of_range, "split depth %u exceeds %u", depth, std::min(numVars, max_depth));
    }
    vars_ = f.prefixVars();
    vars_.resize(depth);
}

Assignment Splitter::assignment(uint32_t index) const {
    POTASSCO_CHECK_PRE(index < numSplits(), "invalid split index");
    Assignment a;
    for (uint32_t i = 0; i != depth_; ++i) {
        bool value = ((index >> (depth_ - 1 - i)) & 1u) != 0;
        a.assign(vars_[i].var, value, vars_[i].type);
    }
    return a;
}

SplitResult Splitter::split(uint32_t index) const {
    SplitResult r;
    r.index      = index;
    r.assignment = assignment(index);

    const Formula& in  = *formula_;
    Formula&       out = r.formula;
    if (mode_ == SplitMode::simplify) {
        out.prefix  = rewritePrefix(in.prefix, r.assignment);
        out.clauses = simplifyClauses(in.clauses, r.assignment);
    }
    else {
        out.prefix  = existentialPrefix(in.prefix, r.assignment);
        out.clauses = in.clauses;
        for (auto lit : r.assignment.literals()) { out.clauses.push_back(Clause{lit}); }
    }
    out.assumptions       = in.assumptions;
    out.header.numVars    = in.header.numVars;
    out.header.numClauses = static_cast<uint32_t>(out.clauses.size());
    return r;
}

void Splitter::run(SplitSink& out, uint32_t numThreads) const {
    if (auto n = numSplits(); mt::concurrency(numThreads, n) > 1) {
        runParallel(out, mt::concurrency(numThreads, n));
    }
    else {
        for (uint32_t i = 0; i != n; ++i) { out.onSplit(split(i)); }
    }
}

void Splitter::runParallel(SplitSink& out, uint32_t numThreads) const {
    struct Shared {
        mt::atomic<uint32_t> next{0};
        mt::atomic<bool>     stop{false};
        mt::mutex            lock;
        mt::exception_ptr    error;

        void setError(mt::exception_ptr e) {
            mt::lock_guard<mt::mutex> guard(lock);
            if (not error) {
                error = std::move(e);
            }
            stop = true;
        }
    } shared;
    const auto n      = numSplits();
    auto       worker = [&]() {
        try {
            for (uint32_t i = 0; not shared.stop && (i = shared.next++) < n;) {
                auto                      r = split(i);
                mt::lock_guard<mt::mutex> guard(shared.lock);
                if (shared.stop) {
                    break;
                }
                out.onSplit(r);
            }
        }
        catch (...) {
            shared.setError(std::current_exception());
        }
    };
    std::vector<mt::thread> threads;
    threads.reserve(numThreads);
    try {
        while (threads.size() != numThreads) { threads.emplace_back(worker); }
    }
    catch (...) {
        shared.setError(std::current_exception());
    }
    for (auto& t : threads) { t.join(); }
    if (shared.error) {
        std::rethrow_exception(shared.error);
    }
}

SplitResultVec split(const Formula& f, uint32_t depth, SplitMode mode, uint32_t numThreads) {
    struct Collect final : SplitSink {
        explicit Collect(uint32_t n) : results(n) {}
        void           onSplit(const SplitResult& r) override { results[r.index] = r; }
        SplitResultVec results;
    };
    Splitter splitter(f, depth, mode);
    Collect  out(splitter.numSplits());
    splitter.run(out, numThreads);
    return std::move(out.results);
}

std::string toPattern(const Assignment& a) {
    std::string out;
    out.reserve(a.size());
    for (auto lit : a.literals()) { out += sign(lit) ? 'f' : 't'; }
    return out;
}

} // namespace QSplit
