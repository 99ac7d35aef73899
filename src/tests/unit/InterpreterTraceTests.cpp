//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/InterpreterTraceTests.cpp
// Purpose: Verify statement and call trace records written by the interpreter.
// Key invariants: Trace output is deterministic and never mixes with program
//                 output.
// Ownership/Lifetime: Streams and source manager outlive the interpreter.
// Links: src/interp/Trace.cpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "frontend/Lexer.hpp"
#include "frontend/Parser.hpp"
#include "interp/Interpreter.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <memory>
#include <sstream>
#include <string>

using namespace roadman;

namespace
{

struct TraceRun
{
    std::string out;
    std::string trace;
};

TraceRun runTraced(const std::string &src, interp::TraceConfig::Mode mode)
{
    support::SourceManager sm;
    uint32_t fileId = sm.addFile("trace.rm");

    std::ostringstream out;
    std::ostringstream trace;
    interp::InterpreterOptions opts;
    opts.out = &out;
    opts.trace.mode = mode;
    opts.trace.sm = &sm;
    opts.traceOut = &trace;

    support::DiagnosticEngine diag;
    std::shared_ptr<const frontend::Program> program =
        frontend::parse(frontend::tokenize(src, fileId, diag), diag);
    EXPECT_TRUE(program);
    if (program)
    {
        interp::Interpreter interp(opts);
        EXPECT_TRUE(interp.interpret(std::move(program), diag));
    }
    return {out.str(), trace.str()};
}

} // namespace

TEST(InterpreterTraceTest, StatementMode)
{
    auto result = runTraced("gimme a = 1;\n"
                            "innit (a) {\n"
                            "  say(a);\n"
                            "}\n",
                            interp::TraceConfig::Stmt);
    EXPECT_EQ(result.out, "1.0\n");
    EXPECT_EQ(result.trace,
              "[trace] trace.rm:1:1 VarDecl\n"
              "[trace] trace.rm:2:1 If\n"
              "[trace] trace.rm:2:11 Block\n"
              "[trace] trace.rm:3:3 ExprStmt\n");
}

TEST(InterpreterTraceTest, CallMode)
{
    auto result = runTraced("fam inner() { returnz 2; }\n"
                            "fam outer() { returnz inner() + 1; }\n"
                            "say(outer());\n",
                            interp::TraceConfig::Call);
    EXPECT_EQ(result.out, "3.0\n");
    EXPECT_EQ(result.trace,
              "[trace] call outer depth=1\n"
              "[trace] call inner depth=2\n"
              "[trace] return inner\n"
              "[trace] return outer\n");
}

TEST(InterpreterTraceTest, OffWritesNothing)
{
    auto result = runTraced("say(1);", interp::TraceConfig::Off);
    EXPECT_EQ(result.out, "1.0\n");
    EXPECT_TRUE(result.trace.empty());
}
