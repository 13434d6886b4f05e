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

#include <qsplit/error.h>
#include <qsplit/merge.h>
#include <qsplit/parser.h>
#include <qsplit/writer.h>

#include <potassco/error.h>
#include <potassco/program_opts/string_convert.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string_view>

namespace QSplit {
/////////////////////////////////////////////////////////////////////////////////////////
// Some helpers
/////////////////////////////////////////////////////////////////////////////////////////
#define WRITE_STDERR(TYPE, MSG, ...)                                                                                   \
    do {                                                                                                               \
        char buffer[256];                                                                                              \
        auto len = formatMessage(buffer, Potassco::Application::TYPE, (MSG) POTASSCO_OPTARGS(__VA_ARGS__));            \
        fwrite(buffer, sizeof(char), len, stderr);                                                                     \
        fflush(stderr);                                                                                                \
    } while (0)
static const std::string stdin_str = "stdin";
inline bool              isStdIn(const std::string& in) { return in.empty() || in == "-" || in == stdin_str; }

static std::string toString(const LitVec& lits) {
    std::string out;
    for (auto lit : lits) {
        if (not out.empty()) {
            out += ' ';
        }
        out += std::to_string(lit);
    }
    return out;
}
/////////////////////////////////////////////////////////////////////////////////////////
// QSplitAppOptions
/////////////////////////////////////////////////////////////////////////////////////////
namespace Cli {
void QSplitAppOptions::initOptions(Potassco::ProgramOptions::OptionContext& root) {
    using namespace Potassco::ProgramOptions;
    OptionGroup basic("Basic Options");
    auto        applyOpt = [this](const std::string& name, const std::string& value) { return apply(name, value); };
    basic.addOptions()                                                                                         //
        ("file,f,@2", storeTo(input), "Input file (default: stdin)")                                           //
        ("depth,d", storeTo(depth)->arg("<n>"), "Split on the first %A variables of the prefix (default: 4)") //
        ("mode", parse(applyOpt)->arg("<m>"),                                                                  //
         "Materialize branches by {simplify|assume} (default: simplify)\n"                                     //
         "      simplify: Remove fixed variables and simplify clauses\n"                                       //
         "      assume  : Keep clauses, bind fixed variables existentially and add units")                    //
        ("merge", flag(merge), "Also write the selector formula to merge:<file>")                              //
        ("out-dir,o", storeTo(outDir)->arg("<dir>"), "Write output files to %A (default: .)")                  //
        ("threads,t", storeTo(threads)->arg("<n>"), "Compute branches on %A threads (default: 1)")            //
        ("provenance", flag(provenance), "Write provenance comments to output files")                         //
        ("stdout", flag(toStdout), "Write all formulas to stdout instead of files");                          //
    root.add(basic);
}
bool QSplitAppOptions::apply(const std::string& name, const std::string& value) {
    using Potassco::Parse::eqIgnoreCase;
    if (name == "mode") {
        if (eqIgnoreCase(value.c_str(), "simplify")) {
            mode = SplitMode::simplify;
            return true;
        }
        if (eqIgnoreCase(value.c_str(), "assume")) {
            mode = SplitMode::assume;
            return true;
        }
    }
    return false;
}
/////////////////////////////////////////////////////////////////////////////////////////
// QSplitApp::Output
/////////////////////////////////////////////////////////////////////////////////////////
// Writes each branch as soon as it is computed and collects branches for the merge formula.
class QSplitApp::Output final : public SplitSink {
public:
    explicit Output(QSplitApp& app) : app_(&app) {
        if (app.opts_.merge) {
            merge_ = std::make_unique<MergeBuilder>();
        }
    }
    void onSplit(const SplitResult& r) override {
        auto path = app_->outputPath(toPattern(r.assignment));
        emit(path, [&](QdimacsWriter& out) {
            if (app_->opts_.provenance) {
                out.writeComment("source: " + app_->inputName());
                out.writeComment("split: " + std::to_string(r.index) + " of " + std::to_string(1u << r.assignment.size()));
                out.writeComment("fixed: " + toString(r.assignment.literals()));
            }
            out.write(r.formula);
        });
        if (merge_) {
            merge_->add(r);
        }
        app_->written(path);
        ++numWritten;
    }
    void writeMerge() {
        POTASSCO_ASSERT(merge_.get(), "merge not enabled");
        auto f    = merge_->build();
        auto path = app_->outputPath("merge");
        if (app_->opts_.provenance) {
            f.comments.push_back("source: " + app_->inputName());
            for (uint32_t i = 0; i != merge_->numBranches(); ++i) {
                std::string map;
                for (auto [from, to] : merge_->varMap(i)) {
                    map += ' ' + std::to_string(from) + '=' + std::to_string(to);
                }
                f.comments.push_back("branch " + std::to_string(merge_->index(i)) + " selector " +
                                     std::to_string(merge_->selector(i)) + " fixed " + toString(merge_->fixed(i)));
                f.comments.push_back("map" + map);
            }
        }
        emit(path, [&f](QdimacsWriter& out) { out.write(f); });
        app_->written(path);
    }
    uint32_t numWritten{0};

private:
    template <typename Op>
    void emit(const std::string& path, Op op) const {
        if (app_->opts_.toStdout) {
            QdimacsWriter out(std::cout);
            out.writeComment("qsplit: " + path);
            op(out);
            return;
        }
        std::ofstream file(path);
        POTASSCO_CHECK(file.is_open(), std::errc::no_such_file_or_directory, "Could not open output file '%s'!",
                       path.c_str());
        QdimacsWriter out(file);
        op(out);
        file.flush();
        POTASSCO_CHECK(file.good(), std::errc::io_error, "Could not write output file '%s'!", path.c_str());
    }
    QSplitApp*                    app_;
    std::unique_ptr<MergeBuilder> merge_;
};
/////////////////////////////////////////////////////////////////////////////////////////
// QSplitApp
/////////////////////////////////////////////////////////////////////////////////////////
QSplitApp::QSplitApp()  = default;
QSplitApp::~QSplitApp() = default;

const char* QSplitApp::getPositional(const std::string&) const { return "file"; }

std::string QSplitApp::inputName() const {
    return isStdIn(opts_.input) ? stdin_str : std::filesystem::path(opts_.input).filename().string();
}

std::string QSplitApp::outputPath(const std::string& pattern) const {
    return (std::filesystem::path(opts_.outDir) / (pattern + ':' + inputName())).string();
}

void QSplitApp::initOptions(Potassco::ProgramOptions::OptionContext& root) {
    opts_.initOptions(root);
    root.find("verbose")->get()->value()->defaultsTo("1");
}

void QSplitApp::validateOptions(const Potassco::ProgramOptions::OptionContext&,
                                const Potassco::ProgramOptions::ParsedOptions&,
                                const Potassco::ProgramOptions::ParsedValues&) {
    setExitCode(exit_no_run);
    POTASSCO_CHECK(opts_.threads > 0, std::errc::invalid_argument, "'threads': positive number expected!");
    POTASSCO_CHECK(isStdIn(opts_.input) || std::ifstream(opts_.input.c_str()).is_open(),
                   std::errc::no_such_file_or_directory, "'%s': could not open input file!", opts_.input.c_str());
    POTASSCO_CHECK(opts_.toStdout || std::filesystem::is_directory(opts_.outDir), std::errc::no_such_file_or_directory,
                   "'out-dir': '%s' is not a directory!", opts_.outDir.c_str());
    setExitCode(exit_ok);
}

void QSplitApp::setup() {
    if (opts_.threads > 1 && not QSPLIT_HAS_THREADS) {
        WRITE_STDERR(message_warning, "'threads': built without thread support - using 1 thread\n");
    }
    if (opts_.toStdout && opts_.threads > 1) {
        opts_.threads = 1; // keep stdout deterministic
    }
}

void QSplitApp::run() {
    formula_ = parseQdimacs(getStream());
    Splitter splitter(formula_, opts_.depth, opts_.mode);
    POTASSCO_CHECK(not opts_.merge || std::ranges::none_of(splitter.splitVars(),
                                                           [](const PrefixVar& x) { return x.type == Quantifier::forall; }),
                   std::errc::invalid_argument, "'merge': split variables must be existentially quantified!");
    if (getVerbose() > 0) {
        WRITE_STDERR(message_info, "%s: %u clauses, %u prefix variables, splitting on %u into %u formulas (%s)\n",
                     inputName().c_str(), static_cast<unsigned>(formula_.clauses.size()), formula_.numPrefixVars(),
                     splitter.depth(), splitter.numSplits(),
                     splitter.mode() == SplitMode::assume ? "assume" : "simplify");
    }
    out_ = std::make_unique<Output>(*this);
    splitter.run(*out_, opts_.threads);
    if (opts_.merge) {
        out_->writeMerge();
    }
    if (getVerbose() > 0) {
        WRITE_STDERR(message_info, "%u formulas written%s\n", out_->numWritten, opts_.merge ? " (+ merge)" : "");
    }
    setExitCode(exit_ok);
}

void QSplitApp::written(const std::string& path) {
    if (getVerbose() > 1) {
        WRITE_STDERR(message_info, "wrote '%s'\n", path.c_str());
    }
}

void QSplitApp::flush() {
    std::cout.flush();
    fflush(stdout);
    fflush(stderr);
}

void QSplitApp::onHelp(const std::string& help, Potassco::ProgramOptions::DescriptionLevel level) {
    printf("%s\n", help.c_str());
    if (level == Potassco::ProgramOptions::desc_level_default) {
        printf("\nType '%s --help=2' for more options.\n", getName());
    }
    printf("\nOutput files are named <pattern>:<file>, where <pattern> has one character\n"
           "per split variable: 'f' if the variable is false, 't' if it is true.\n");
}

void QSplitApp::onVersion(const std::string& version) {
    printf("%s\n", version.c_str());
    printf("Configuration: WITH_THREADS=%d\n", QSPLIT_HAS_THREADS);
    printf("License: The MIT License <https://opensource.org/licenses/MIT>\n");
}

bool QSplitApp::onUnhandledException(const char* msg) {
    setExitCode(exit_error);
    fprintf(stderr, "%s\n", msg);
    return false;
}

std::istream& QSplitApp::getStream() const {
    static std::ifstream file;
    if (not isStdIn(opts_.input)) {
        file.close();
        file.clear();
        file.open(opts_.input.c_str());
        POTASSCO_CHECK(file.is_open(), std::errc::no_such_file_or_directory, "Can not read from '%s'!",
                       opts_.input.c_str());
        return file;
    }
    return std::cin;
}

} // namespace Cli
} // namespace QSplit
