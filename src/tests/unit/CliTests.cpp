//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/CliTests.cpp
// Purpose: Verify command-line parsing for the roadman tool.
// Key invariants: Malformed command lines write one `error:` line and return
//                 CliParseResult::Error.
// Ownership/Lifetime: Argument strings are owned by each test.
// Links: src/tools/roadman/cli.cpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "tools/roadman/cli.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace roadman::tools;
using roadman::interp::TraceConfig;

namespace
{

CliParseResult parseArgs(std::vector<std::string> args, CliOptions &opts, std::string &err)
{
    args.insert(args.begin(), "roadman");
    std::vector<char *> argv;
    for (auto &arg : args)
        argv.push_back(arg.data());

    std::ostringstream errStream;
    auto result = parseCli(static_cast<int>(argv.size()), argv.data(), opts, errStream);
    err = errStream.str();
    return result;
}

} // namespace

TEST(CliTest, NoArgumentsSelectsInteractiveSession)
{
    CliOptions opts;
    std::string err;
    EXPECT_EQ(parseArgs({}, opts, err), CliParseResult::Run);
    EXPECT_TRUE(opts.sourcePath.empty());
    EXPECT_FALSE(opts.transpile);
    EXPECT_EQ(opts.trace, TraceConfig::Off);
    EXPECT_EQ(opts.maxDepth, 1000u);
}

TEST(CliTest, FileWithOptions)
{
    CliOptions opts;
    std::string err;
    EXPECT_EQ(parseArgs({"--trace=call", "prog.rm", "--max-depth", "50", "--all-errors"}, opts, err),
              CliParseResult::Run);
    EXPECT_EQ(opts.sourcePath, "prog.rm");
    EXPECT_EQ(opts.trace, TraceConfig::Call);
    EXPECT_EQ(opts.maxDepth, 50u);
    EXPECT_TRUE(opts.allErrors);
    EXPECT_TRUE(err.empty());
}

TEST(CliTest, BareTraceMeansStatements)
{
    CliOptions opts;
    std::string err;
    EXPECT_EQ(parseArgs({"--trace", "prog.rm"}, opts, err), CliParseResult::Run);
    EXPECT_EQ(opts.trace, TraceConfig::Stmt);
}

TEST(CliTest, OutputImpliesTranspile)
{
    CliOptions opts;
    std::string err;
    EXPECT_EQ(parseArgs({"prog.rm", "-o", "prog.js"}, opts, err), CliParseResult::Run);
    EXPECT_TRUE(opts.transpile);
    EXPECT_EQ(opts.outputPath, "prog.js");
}

TEST(CliTest, HelpAndVersion)
{
    CliOptions opts;
    std::string err;
    EXPECT_EQ(parseArgs({"prog.rm", "--help"}, opts, err), CliParseResult::Help);
    EXPECT_EQ(parseArgs({"-h"}, opts, err), CliParseResult::Help);
    EXPECT_EQ(parseArgs({"--version"}, opts, err), CliParseResult::Version);
}

TEST(CliTest, MalformedCommandLines)
{
    struct Case
    {
        std::vector<std::string> args;
        const char *message;
    };
    const Case cases[] = {
        {{"--bogus"}, "error: unknown option: --bogus\n"},
        {{"a.rm", "b.rm"}, "error: multiple source files not supported\n"},
        {{"a.rm", "-o"}, "error: -o requires an output path\n"},
        {{"a.rm", "--max-depth"}, "error: --max-depth requires a positive integer\n"},
        {{"a.rm", "--max-depth", "0"}, "error: --max-depth requires a positive integer\n"},
        {{"a.rm", "--max-depth", "12x"}, "error: --max-depth requires a positive integer\n"},
        {{"-o", "out.js"}, "error: --output requires a source file\n"},
        {{"a.rm", "--transpile", "--dump-ast"},
         "error: --transpile, --dump-tokens and --dump-ast are mutually exclusive\n"},
    };
    for (const auto &c : cases)
    {
        CliOptions opts;
        std::string err;
        EXPECT_EQ(parseArgs(c.args, opts, err), CliParseResult::Error) << c.message;
        EXPECT_EQ(err, c.message);
    }
}
