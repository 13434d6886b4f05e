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
#include <qsplit/cli/qsplit_app.h>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace QSplit::Test {
namespace fs = std::filesystem;
namespace {
struct TempDir {
    TempDir() : path(fs::temp_directory_path() / "qsplit_app_test") {
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    [[nodiscard]] std::string file(const std::string& name) const { return (path / name).string(); }
    fs::path                  path;
};

std::string read(const std::string& file) {
    std::ifstream     in(file);
    std::stringstream str;
    str << in.rdbuf();
    return str.str();
}

int runApp(std::vector<std::string> args) {
    args.insert(args.begin(), "qsplit");
    std::vector<char*> argv;
    for (auto& a : args) { argv.push_back(a.data()); }
    argv.push_back(nullptr);
    Cli::QSplitApp app;
    return app.main(static_cast<int>(args.size()), argv.data());
}
} // namespace

TEST_CASE("Application", "[app]") {
    TempDir dir;
    auto    input = dir.file("in.qdimacs");
    {
        std::ofstream out(input);
        out << "c example\np cnf 3 2\ne 1 2 3 0\n1 2 0\n-1 3 0\n";
    }
    SECTION("writes one file per branch") {
        REQUIRE(runApp({input, "--depth=1", "--out-dir=" + dir.path.string(), "--verbose=0"}) == Cli::exit_ok);
        REQUIRE(read(dir.file("f:in.qdimacs")) == "p cnf 3 1\ne 2 3 0\n2 0\n");
        REQUIRE(read(dir.file("t:in.qdimacs")) == "p cnf 3 1\ne 2 3 0\n3 0\n");
        REQUIRE_FALSE(fs::exists(dir.file("merge:in.qdimacs")));
    }
    SECTION("writes merge formula") {
        REQUIRE(runApp({input, "-d", "1", "-o", dir.path.string(), "--merge", "--threads=2", "--verbose=0"}) ==
                Cli::exit_ok);
        REQUIRE(read(dir.file("merge:in.qdimacs")) == "p cnf 6 3\ne 1 2 3 4 5 6 0\n-1 3 0\n-2 6 0\n1 2 0\n");
    }
    SECTION("writes provenance comments") {
        REQUIRE(runApp({"--file=" + input, "--depth=2", "--mode=assume", "--provenance", "--merge",
                        "--out-dir=" + dir.path.string(), "--verbose=0"}) == Cli::exit_ok);
        auto ft = read(dir.file("ft:in.qdimacs"));
        REQUIRE(ft == "c source: in.qdimacs\n"
                      "c split: 1 of 4\n"
                      "c fixed: -1 2\n"
                      "p cnf 3 4\n"
                      "e 1 2 3 0\n"
                      "1 2 0\n"
                      "-1 3 0\n"
                      "-1 0\n"
                      "2 0\n");
        auto merge = read(dir.file("merge:in.qdimacs"));
        REQUIRE(merge.starts_with("c source: in.qdimacs\nc branch 0 selector 1 fixed -1 -2\nc map 1=5 2=6 3=7\n"));
    }
    SECTION("depth error") {
        REQUIRE(runApp({input, "--depth=4", "--out-dir=" + dir.path.string(), "--verbose=0"}) == Cli::exit_error);
        REQUIRE_FALSE(fs::exists(dir.file("f:in.qdimacs")));
    }
    SECTION("parse error") {
        auto bad = dir.file("bad.qdimacs");
        std::ofstream(bad) << "p cnf 1 1\n2 0\n";
        REQUIRE(runApp({bad, "--out-dir=" + dir.path.string(), "--depth=0", "--verbose=0"}) == Cli::exit_error);
    }
    SECTION("invalid options") {
        REQUIRE(runApp({input, "--out-dir=" + dir.file("missing")}) != Cli::exit_ok);
        REQUIRE(runApp({input, "--threads=0"}) != Cli::exit_ok);
        REQUIRE(runApp({input, "--mode=unknown"}) != Cli::exit_ok);
        REQUIRE(runApp({dir.file("missing.qdimacs")}) != Cli::exit_ok);
    }
}

} // namespace QSplit::Test
