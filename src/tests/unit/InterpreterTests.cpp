//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/InterpreterTests.cpp
// Purpose: Execute complete Roadman programs and compare their output.
// Key invariants: Runtime errors become one R3000 diagnostic and stop only the
//                 current unit; interpreter state persists across units.
// Ownership/Lifetime: Each fixture owns an Interpreter writing to a string
//                     stream.
// Links: src/interp/Interpreter.cpp, src/interp/Interpreter_Expr.cpp,
//        src/interp/Interpreter_Gc.cpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "frontend/Lexer.hpp"
#include "frontend/Parser.hpp"
#include "interp/Interpreter.hpp"
#include "support/diagnostics.hpp"

#include <memory>
#include <sstream>
#include <string>

using namespace roadman;

namespace
{

class InterpreterTest : public ::testing::Test
{
  protected:
    explicit InterpreterTest(size_t maxDepth = 1000) : interp_(makeOptions(maxDepth)) {}

    /// @brief Parse and run @p src; returns false on any diagnostic error.
    bool run(const std::string &src)
    {
        diag_.clear();
        auto tokens = frontend::tokenize(src, 1, diag_);
        if (diag_.errorCount() > 0)
            return false;
        std::shared_ptr<const frontend::Program> program = frontend::parse(std::move(tokens), diag_);
        if (!program)
            return false;
        return interp_.interpret(std::move(program), diag_);
    }

    std::shared_ptr<const frontend::Program> parseUnit(const std::string &src)
    {
        diag_.clear();
        return frontend::parse(frontend::tokenize(src, 1, diag_), diag_);
    }

    std::string output() const
    {
        return out_.str();
    }

    std::string firstError() const
    {
        return diag_.diagnostics().empty() ? std::string() : diag_.diagnostics().front().message;
    }

    std::ostringstream out_;
    support::DiagnosticEngine diag_;
    interp::Interpreter interp_;

  private:
    interp::InterpreterOptions makeOptions(size_t maxDepth)
    {
        interp::InterpreterOptions opts;
        opts.out = &out_;
        opts.maxCallDepth = maxDepth;
        return opts;
    }
};

class ShallowInterpreterTest : public InterpreterTest
{
  protected:
    ShallowInterpreterTest() : InterpreterTest(16) {}
};

} // namespace

TEST_F(InterpreterTest, ArithmeticPrecedence)
{
    ASSERT_TRUE(run("say(10 * (4 - 2) + 5 / 2);"));
    EXPECT_EQ(output(), "22.5\n");
}

TEST_F(InterpreterTest, BlockScopeShadowing)
{
    ASSERT_TRUE(run("gimme a = 10;\n"
                    "{\n"
                    "  gimme a = 20;\n"
                    "  say(a);\n"
                    "}\n"
                    "say(a);\n"));
    EXPECT_EQ(output(), "20.0\n10.0\n");
}

TEST_F(InterpreterTest, RecursiveFactorial)
{
    ASSERT_TRUE(run("fam factorial(n) {\n"
                    "  innit (n < 2) { returnz 1; }\n"
                    "  returnz n * factorial(n - 1);\n"
                    "}\n"
                    "say(factorial(5));\n"));
    EXPECT_EQ(output(), "120.0\n");
}

TEST_F(InterpreterTest, CounterClosuresAreIndependent)
{
    ASSERT_TRUE(run("fam makeCounter() {\n"
                    "  gimme count = 0;\n"
                    "  fam inc() { count = count + 1; returnz count; }\n"
                    "  returnz inc;\n"
                    "}\n"
                    "gimme c1 = makeCounter();\n"
                    "gimme c2 = makeCounter();\n"
                    "say(c1());\n"
                    "say(c1());\n"
                    "say(c2());\n"));
    EXPECT_EQ(output(), "1.0\n2.0\n1.0\n");
}

TEST_F(InterpreterTest, ClosureSeesDeclarationScopeNotCaller)
{
    ASSERT_TRUE(run("gimme x = \"global\";\n"
                    "fam show() { say(x); }\n"
                    "fam caller() { gimme x = \"local\"; show(); }\n"
                    "caller();\n"));
    EXPECT_EQ(output(), "global\n");
}

TEST_F(InterpreterTest, MixedListDisplay)
{
    ASSERT_TRUE(run("say([1, \"two\", true]);"));
    EXPECT_EQ(output(), "[1.0, two, true]\n");
}

TEST_F(InterpreterTest, StringConcatenationAndComparison)
{
    ASSERT_TRUE(run("say(\"road\" + \"man\");\n"
                    "say(\"abc\" < \"abd\");\n"
                    "say(1 == \"1\");\n"
                    "say([1, 2] == [1, 2]);\n"));
    EXPECT_EQ(output(), "roadman\ntrue\nfalse\ntrue\n");
}

TEST_F(InterpreterTest, LogicalOperatorsShortCircuit)
{
    ASSERT_TRUE(run("fam boom() { say(\"evaluated\"); returnz true; }\n"
                    "say(false && boom());\n"
                    "say(1 || boom());\n"
                    "say(0 || \"\");\n"));
    EXPECT_EQ(output(), "false\ntrue\nfalse\n");
}

TEST_F(InterpreterTest, FlooredModulo)
{
    ASSERT_TRUE(run("say(7 % 3); say(-7 % 3); say(7 % -3);"));
    EXPECT_EQ(output(), "1.0\n2.0\n-2.0\n");
}

TEST_F(InterpreterTest, StopitLeavesNearestLoop)
{
    ASSERT_TRUE(run("gimme i = 0;\n"
                    "loopz (true) {\n"
                    "  gimme j = 0;\n"
                    "  loopz (true) { j = j + 1; innit (j == 3) stopit; }\n"
                    "  i = i + j;\n"
                    "  innit (i >= 6) stopit;\n"
                    "}\n"
                    "say(i);\n"));
    EXPECT_EQ(output(), "6.0\n");
}

TEST_F(InterpreterTest, ReturnFromInsideLoop)
{
    ASSERT_TRUE(run("fam find(limit) {\n"
                    "  gimme n = 0;\n"
                    "  loopz (true) { innit (n * n > limit) returnz n; n = n + 1; }\n"
                    "}\n"
                    "say(find(20));\n"));
    EXPECT_EQ(output(), "5.0\n");
}

TEST_F(InterpreterTest, FunctionWithoutReturnYieldsNil)
{
    ASSERT_TRUE(run("fam nothing() {}\nsay(nothing());\ngimme u;\nsay(u);\nsay(nothing);"));
    EXPECT_EQ(output(), "nil\nnil\n<fn nothing>\n");
}

TEST_F(InterpreterTest, BuiltinsLiveInGlobalScope)
{
    const auto &globals = interp_.globals();
    EXPECT_TRUE(globals->containsLocal("say"));
    EXPECT_TRUE(globals->containsLocal("clock"));
    EXPECT_TRUE(globals->containsLocal("len"));

    ASSERT_TRUE(run("say(say); gimme g = 1;"));
    EXPECT_EQ(output(), "<native fn say>\n");
    EXPECT_TRUE(globals->containsLocal("g"));
}

TEST_F(InterpreterTest, BuiltinLen)
{
    ASSERT_TRUE(run("say(len(\"abcd\")); say(len([1, 2, 3])); say(len([]));"));
    EXPECT_EQ(output(), "4.0\n3.0\n0.0\n");

    EXPECT_FALSE(run("len(5);"));
    EXPECT_EQ(firstError(), "len: Operand must be a string or list.");
}

TEST_F(InterpreterTest, BuiltinClockReturnsNumber)
{
    ASSERT_TRUE(run("gimme t = clock(); say(t > 0);"));
    EXPECT_EQ(output(), "true\n");
}

TEST_F(InterpreterTest, DivisionByZeroStopsUnitOnly)
{
    EXPECT_FALSE(run("say(1);\nsay(1 / 0);\nsay(2);"));
    EXPECT_EQ(output(), "1.0\n");
    ASSERT_EQ(diag_.errorCount(), 1u);
    const auto &d = diag_.diagnostics().front();
    EXPECT_EQ(d.message, "Division by zero.");
    EXPECT_EQ(d.code, support::kRuntimeErrorCode);
    EXPECT_EQ(d.loc.line, 2u);

    EXPECT_FALSE(run("say(5 % 0);"));
    EXPECT_EQ(firstError(), "Division by zero.");

    ASSERT_TRUE(run("say(3);"));
    EXPECT_EQ(output(), "1.0\n3.0\n");
}

TEST_F(InterpreterTest, ArityMismatchNamesBothCounts)
{
    EXPECT_FALSE(run("fam add(a, b) { returnz a + b; }\nadd(1);"));
    EXPECT_EQ(firstError(), "Expected 2 arguments but got 1.");

    EXPECT_FALSE(run("say(1, 2);"));
    EXPECT_EQ(firstError(), "Expected 1 arguments but got 2.");
}

TEST_F(InterpreterTest, TypeErrorsNameOperator)
{
    EXPECT_FALSE(run("say(\"a\" - 1);"));
    EXPECT_EQ(firstError(), "-: Operands must be numbers.");

    EXPECT_FALSE(run("say(\"a\" + 1);"));
    EXPECT_EQ(firstError(), "+: Operands must be two numbers or two strings.");

    EXPECT_FALSE(run("say(-\"a\");"));
    EXPECT_EQ(firstError(), "-: Operand must be a number.");

    EXPECT_FALSE(run("say(1 < \"a\");"));
    EXPECT_EQ(firstError(), "<: Operands must be two numbers or two strings.");
}

TEST_F(InterpreterTest, CallingNonCallable)
{
    EXPECT_FALSE(run("gimme x = 3;\nx();"));
    EXPECT_EQ(firstError(), "Can only call functions.");
}

TEST_F(InterpreterTest, UndefinedVariableAndAssignment)
{
    EXPECT_FALSE(run("say(nope);"));
    EXPECT_EQ(firstError(), "Undefined variable 'nope'.");

    EXPECT_FALSE(run("nope = 1;"));
    EXPECT_EQ(firstError(), "Undefined variable 'nope'.");
}

TEST_F(InterpreterTest, ConstantAssignmentFails)
{
    EXPECT_FALSE(run("conste k = 1;\nk = 2;"));
    EXPECT_EQ(firstError(), "Cannot assign to constant 'k'.");
    ASSERT_TRUE(run("say(k);"));
    EXPECT_EQ(output(), "1.0\n");
}

TEST_F(InterpreterTest, StrayControlFlowIsAnError)
{
    EXPECT_FALSE(run("returnz 1;"));
    EXPECT_EQ(firstError(), "Cannot use 'returnz' outside of a function.");

    EXPECT_FALSE(run("stopit;"));
    EXPECT_EQ(firstError(), "Cannot use 'stopit' outside of a loop.");

    EXPECT_FALSE(run("fam f() { stopit; }\nloopz (true) { f(); }"));
    EXPECT_EQ(firstError(), "Cannot use 'stopit' outside of a loop.");
}

TEST_F(InterpreterTest, StatePersistsAcrossUnits)
{
    ASSERT_TRUE(run("gimme total = 1;"));
    ASSERT_TRUE(run("fam bump() { total = total * 2; }"));
    ASSERT_TRUE(run("bump(); bump();"));
    EXPECT_FALSE(run("bump(1);"));
    ASSERT_TRUE(run("say(total);"));
    EXPECT_EQ(output(), "4.0\n");
}

TEST_F(InterpreterTest, ErrorInsideBlockRestoresGlobalScope)
{
    EXPECT_FALSE(run("{ gimme inner = 1; say(1 / 0); }"));
    ASSERT_TRUE(run("gimme outer = 2; say(outer);"));
    EXPECT_FALSE(run("say(inner);"));
    EXPECT_EQ(firstError(), "Undefined variable 'inner'.");
}

TEST_F(ShallowInterpreterTest, CallDepthIsBounded)
{
    EXPECT_FALSE(run("fam forever(n) { returnz forever(n + 1); }\nforever(0);"));
    EXPECT_EQ(firstError(), "Maximum call depth of 16 exceeded.");

    ASSERT_TRUE(run("fam down(n) { innit (n == 0) returnz 0; returnz down(n - 1); }\n"
                    "say(down(15));"));
    EXPECT_EQ(output(), "0.0\n");
}

TEST_F(InterpreterTest, NestedClosureKeepsDeclaringUnitAlive)
{
    auto unit = parseUnit("fam make() { fam inner() { returnz \"inner\"; } returnz inner; }");
    ASSERT_TRUE(unit);
    std::weak_ptr<const frontend::Program> weakUnit = unit;
    ASSERT_TRUE(interp_.interpret(std::move(unit), diag_));

    ASSERT_TRUE(run("gimme f = make();"));
    ASSERT_TRUE(run("make = 0;"));
    EXPECT_FALSE(weakUnit.expired());

    ASSERT_TRUE(run("say(f); say(f());"));
    EXPECT_EQ(output(), "<fn inner>\ninner\n");

    ASSERT_TRUE(run("f = 0;"));
    interp_.collectCycles();
    EXPECT_TRUE(weakUnit.expired());
}

TEST_F(InterpreterTest, ScopesFromFinishedCallsAreReleased)
{
    ASSERT_TRUE(run("fam outer() { fam inner() { returnz 1; } returnz 0; }\n"
                    "gimme i = 0;\n"
                    "loopz (i < 2000) { outer(); i = i + 1; }\n"));
    EXPECT_LT(interp_.liveScopeCount(), 200u);

    interp_.collectCycles();
    EXPECT_EQ(interp_.liveScopeCount(), 1u);
}

TEST_F(InterpreterTest, CollectionKeepsReachableClosures)
{
    ASSERT_TRUE(run("fam makeCounter() {\n"
                    "  gimme count = 0;\n"
                    "  fam inc() { count = count + 1; returnz count; }\n"
                    "  returnz inc;\n"
                    "}\n"
                    "fam outer() { fam inner() { returnz 1; } returnz 0; }\n"
                    "gimme c = makeCounter();\n"
                    "fam spin() {\n"
                    "  gimme k = makeCounter();\n"
                    "  gimme j = 0;\n"
                    "  loopz (j < 300) { outer(); k(); c(); j = j + 1; }\n"
                    "  returnz k();\n"
                    "}\n"
                    "say(spin());\n"));
    EXPECT_EQ(output(), "301.0\n");

    EXPECT_GT(interp_.collectCycles(), 0u);
    ASSERT_TRUE(run("say(c()); gimme held = [makeCounter()]; say(held);"));
    EXPECT_EQ(interp_.collectCycles(), 0u);
    EXPECT_EQ(output(), "301.0\n301.0\n[<fn inc>]\n");
}
