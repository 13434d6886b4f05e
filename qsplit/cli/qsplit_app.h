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

#include <qsplit/config.h>
#include <qsplit/formula.h>
#include <qsplit/splitter.h>

#include <potassco/application.h>
#include <potassco/program_opts/typed_value.h>

#include <iosfwd>
#include <memory>
#include <string>

namespace QSplit::Cli {
/////////////////////////////////////////////////////////////////////////////////////////
// qsplit exit codes
/////////////////////////////////////////////////////////////////////////////////////////
enum ExitCode {
    exit_ok     = 0,  /*!< All requested formulas were written.                 */
    exit_error  = 65, /*!< Run was interrupted by an input or internal error.   */
    exit_no_run = 128 /*!< Nothing written because of a command line error.     */
};
/////////////////////////////////////////////////////////////////////////////////////////
// qsplit specific application options
/////////////////////////////////////////////////////////////////////////////////////////
struct QSplitAppOptions {
    bool        apply(const std::string&, const std::string&);
    void        initOptions(Potassco::ProgramOptions::OptionContext& root);
    std::string input;              // input file, empty or "-" for stdin
    std::string outDir     = ".";   // directory for output files
    uint32_t    depth      = 4;     // number of prefix variables to split on
    uint32_t    threads    = 1;     // number of worker threads
    SplitMode   mode       = SplitMode::simplify;
    bool        merge      = false; // also write merge formula
    bool        provenance = false; // write provenance comments
    bool        toStdout   = false; // write formulas to stdout instead of files
};
/////////////////////////////////////////////////////////////////////////////////////////
// qsplit application
/////////////////////////////////////////////////////////////////////////////////////////
// Splits a formula into 2^depth files named <pattern>:<input>.
class QSplitApp : public Potassco::Application {
public:
    QSplitApp();
    ~QSplitApp() override;
    [[nodiscard]] const char* getName() const override { return "qsplit"; }
    [[nodiscard]] const char* getVersion() const override { return QSPLIT_VERSION; }
    [[nodiscard]] const char* getUsage() const override {
        return "[options] [file]\n"
               "Split the quantified formula given in <file> along its quantifier prefix";
    }

    //! Returns the name used for the input in output file names.
    [[nodiscard]] std::string inputName() const;
    //! Returns the path of the file for the branch with the given assignment pattern.
    [[nodiscard]] std::string outputPath(const std::string& pattern) const;

protected:
    [[nodiscard]] const char* getPositional(const std::string& value) const override;

    void initOptions(Potassco::ProgramOptions::OptionContext& root) override;
    void validateOptions(const Potassco::ProgramOptions::OptionContext& root,
                         const Potassco::ProgramOptions::ParsedOptions& parsed,
                         const Potassco::ProgramOptions::ParsedValues&  values) override;
    void setup() override;
    void run() override;
    void flush() override;
    void onHelp(const std::string& help, Potassco::ProgramOptions::DescriptionLevel level) override;
    void onVersion(const std::string& version) override;
    bool onUnhandledException(const char*) override;

    [[nodiscard]] std::istream& getStream() const;

private:
    class Output;
    void written(const std::string& path);
    using OutPtr = std::unique_ptr<Output>;
    QSplitAppOptions opts_;
    Formula          formula_;
    OutPtr           out_;
};
} // namespace QSplit::Cli
