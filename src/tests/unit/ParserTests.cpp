//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/ParserTests.cpp
// Purpose: Verify the precedence ladder, statement forms and syntax errors.
// Key invariants: A Program is returned only when no error was reported;
//                 recovery mode reports every syntax error of the unit.
// Ownership/Lifetime: Tests own the parsed programs.
// Links: src/frontend/Parser_Expr.cpp, src/frontend/Parser_Stmt.cpp
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "frontend/Lexer.hpp"
#include "frontend/Parser.hpp"
#include "support/diagnostics.hpp"

#include <memory>
#include <string>

using namespace roadman::frontend;
using roadman::support::DiagnosticEngine;

namespace
{

std::unique_ptr<Program> parseSource(const std::string &src,
                                     DiagnosticEngine &diag,
                                     ParserOptions options = {})
{
    auto tokens = tokenize(src, 1, diag);
    if (diag.errorCount() > 0)
        return nullptr;
    return parse(std::move(tokens), diag, options);
}

const Expr &onlyExpr(const Program &program)
{
    EXPECT_EQ(program.statements.size(), 1u);
    EXPECT_EQ(program.statements[0]->kind, StmtKind::Expr);
    return *static_cast<const ExprStmt &>(*program.statements[0]).expr;
}

const BinaryExpr &asBinary(const Expr &e)
{
    EXPECT_EQ(e.kind, ExprKind::Binary);
    return static_cast<const BinaryExpr &>(e);
}

} // namespace

TEST(ParserTest, MultiplicationBindsTighterThanAdditionOnRight)
{
    DiagnosticEngine diag;
    auto program = parseSource("1 + 2 * 3;", diag);
    ASSERT_TRUE(program);

    const auto &add = asBinary(onlyExpr(*program));
    EXPECT_EQ(add.op, BinaryOp::Add);
    EXPECT_EQ(add.left->kind, ExprKind::Literal);
    EXPECT_EQ(asBinary(*add.right).op, BinaryOp::Mul);
}

TEST(ParserTest, MultiplicationBindsTighterThanAdditionOnLeft)
{
    DiagnosticEngine diag;
    auto program = parseSource("1 * 2 + 3;", diag);
    ASSERT_TRUE(program);

    const auto &add = asBinary(onlyExpr(*program));
    EXPECT_EQ(add.op, BinaryOp::Add);
    EXPECT_EQ(asBinary(*add.left).op, BinaryOp::Mul);
    EXPECT_EQ(add.right->kind, ExprKind::Literal);
}

TEST(ParserTest, BinaryLevelsAreLeftAssociative)
{
    DiagnosticEngine diag;
    auto program = parseSource("10 - 4 - 3;", diag);
    ASSERT_TRUE(program);

    const auto &outer = asBinary(onlyExpr(*program));
    EXPECT_EQ(outer.op, BinaryOp::Sub);
    const auto &inner = asBinary(*outer.left);
    EXPECT_EQ(inner.op, BinaryOp::Sub);
    EXPECT_EQ(outer.right->kind, ExprKind::Literal);
}

TEST(ParserTest, LogicalOperatorsRankBelowEquality)
{
    DiagnosticEngine diag;
    auto program = parseSource("a == 1 || b < 2 && !c;", diag);
    ASSERT_TRUE(program);

    const auto &orExpr = asBinary(onlyExpr(*program));
    EXPECT_EQ(orExpr.op, BinaryOp::Or);
    EXPECT_EQ(asBinary(*orExpr.left).op, BinaryOp::Eq);

    const auto &andExpr = asBinary(*orExpr.right);
    EXPECT_EQ(andExpr.op, BinaryOp::And);
    EXPECT_EQ(asBinary(*andExpr.left).op, BinaryOp::Lt);
    ASSERT_EQ(andExpr.right->kind, ExprKind::Unary);
    EXPECT_EQ(static_cast<const UnaryExpr &>(*andExpr.right).op, UnaryOp::Not);
}

TEST(ParserTest, AssignmentIsRightAssociative)
{
    DiagnosticEngine diag;
    auto program = parseSource("a = b = 3;", diag);
    ASSERT_TRUE(program);

    const Expr &e = onlyExpr(*program);
    ASSERT_EQ(e.kind, ExprKind::Assign);
    const auto &outer = static_cast<const AssignExpr &>(e);
    EXPECT_EQ(outer.name, "a");
    ASSERT_EQ(outer.value->kind, ExprKind::Assign);
    EXPECT_EQ(static_cast<const AssignExpr &>(*outer.value).name, "b");
}

TEST(ParserTest, CallsChainOnPreviousResult)
{
    DiagnosticEngine diag;
    auto program = parseSource("make()(1, 2);", diag);
    ASSERT_TRUE(program);

    const Expr &e = onlyExpr(*program);
    ASSERT_EQ(e.kind, ExprKind::Call);
    const auto &outer = static_cast<const CallExpr &>(e);
    EXPECT_EQ(outer.args.size(), 2u);
    ASSERT_EQ(outer.callee->kind, ExprKind::Call);
    const auto &inner = static_cast<const CallExpr &>(*outer.callee);
    EXPECT_TRUE(inner.args.empty());
    ASSERT_EQ(inner.callee->kind, ExprKind::Variable);
    EXPECT_EQ(static_cast<const VariableExpr &>(*inner.callee).name, "make");
}

TEST(ParserTest, ListLiteralAndGrouping)
{
    DiagnosticEngine diag;
    auto program = parseSource("[1, \"two\", (3 + 4)];", diag);
    ASSERT_TRUE(program);

    const Expr &e = onlyExpr(*program);
    ASSERT_EQ(e.kind, ExprKind::List);
    const auto &list = static_cast<const ListExpr &>(e);
    ASSERT_EQ(list.elements.size(), 3u);
    EXPECT_EQ(list.elements[0]->kind, ExprKind::Literal);
    const auto &str = static_cast<const LiteralExpr &>(*list.elements[1]);
    EXPECT_EQ(std::get<std::string>(str.value), "two");
    EXPECT_EQ(list.elements[2]->kind, ExprKind::Grouping);
}

TEST(ParserTest, DeclarationsAndControlFlow)
{
    const std::string src = "conste limit = 3;\n"
                            "gimme i;\n"
                            "fam step(a, b) { returnz a + b; }\n"
                            "loopz (i < limit) { innit (i == 2) stopit; elseway i = i + 1; }\n";
    DiagnosticEngine diag;
    auto program = parseSource(src, diag);
    ASSERT_TRUE(program);
    ASSERT_EQ(program->statements.size(), 4u);

    const auto &limit = static_cast<const VarStmt &>(*program->statements[0]);
    EXPECT_EQ(limit.kind, StmtKind::Var);
    EXPECT_TRUE(limit.isConst);
    EXPECT_TRUE(limit.initializer);

    const auto &i = static_cast<const VarStmt &>(*program->statements[1]);
    EXPECT_FALSE(i.isConst);
    EXPECT_FALSE(i.initializer);

    ASSERT_EQ(program->statements[2]->kind, StmtKind::Function);
    const auto &fn = static_cast<const FunctionStmt &>(*program->statements[2]);
    EXPECT_EQ(fn.name, "step");
    ASSERT_EQ(fn.params.size(), 2u);
    EXPECT_EQ(fn.params[1], "b");
    ASSERT_EQ(fn.body->statements.size(), 1u);
    EXPECT_EQ(fn.body->statements[0]->kind, StmtKind::Return);

    ASSERT_EQ(program->statements[3]->kind, StmtKind::While);
    const auto &loop = static_cast<const WhileStmt &>(*program->statements[3]);
    ASSERT_EQ(loop.body->kind, StmtKind::Block);
    const auto &body = static_cast<const BlockStmt &>(*loop.body);
    ASSERT_EQ(body.statements.size(), 1u);
    ASSERT_EQ(body.statements[0]->kind, StmtKind::If);
    const auto &branch = static_cast<const IfStmt &>(*body.statements[0]);
    EXPECT_EQ(branch.thenBranch->kind, StmtKind::Break);
    ASSERT_TRUE(branch.elseBranch);
    EXPECT_EQ(branch.elseBranch->kind, StmtKind::Expr);
}

TEST(ParserTest, BinaryLocationIsOperatorToken)
{
    DiagnosticEngine diag;
    auto program = parseSource("gimme a = 1 + 2;", diag);
    ASSERT_TRUE(program);
    const auto &decl = static_cast<const VarStmt &>(*program->statements[0]);
    EXPECT_EQ(decl.loc.column, 1u);
    EXPECT_EQ(decl.initializer->loc.column, 13u);
}

TEST(ParserTest, MissingExpressionReportsAtOffendingToken)
{
    DiagnosticEngine diag;
    auto program = parseSource("gimme x = ;", diag);
    EXPECT_FALSE(program);
    ASSERT_EQ(diag.errorCount(), 1u);

    const auto &d = diag.diagnostics().front();
    EXPECT_EQ(d.message, "at ';': Expect expression.");
    EXPECT_EQ(d.code, roadman::support::kParseErrorCode);
    EXPECT_EQ(d.loc.line, 1u);
    EXPECT_EQ(d.loc.column, 11u);
}

TEST(ParserTest, ErrorAtEndOfInputUsesDistinctWording)
{
    DiagnosticEngine diag;
    auto program = parseSource("say(1)", diag);
    EXPECT_FALSE(program);
    ASSERT_EQ(diag.errorCount(), 1u);
    EXPECT_EQ(diag.diagnostics().front().message, "at end: Expect ';' after expression.");
}

TEST(ParserTest, InvalidAssignmentTarget)
{
    DiagnosticEngine diag;
    auto program = parseSource("1 + a = 3;", diag);
    EXPECT_FALSE(program);
    ASSERT_EQ(diag.errorCount(), 1u);
    const auto &d = diag.diagnostics().front();
    EXPECT_EQ(d.message, "at '=': Invalid assignment target.");
    EXPECT_EQ(d.loc.column, 7u);
}

TEST(ParserTest, MissingClosingBraceIsAnError)
{
    DiagnosticEngine diag;
    auto program = parseSource("{ say(1);", diag);
    EXPECT_FALSE(program);
    ASSERT_EQ(diag.errorCount(), 1u);
    EXPECT_EQ(diag.diagnostics().front().message, "at end: Expect '}' after block.");
}

TEST(ParserTest, DefaultModeStopsAtFirstError)
{
    DiagnosticEngine diag;
    auto program = parseSource("gimme = 1;\ngimme y = ;\nsay(1);", diag);
    EXPECT_FALSE(program);
    EXPECT_EQ(diag.errorCount(), 1u);
}

TEST(ParserTest, RecoveryModeReportsEveryError)
{
    DiagnosticEngine diag;
    ParserOptions options;
    options.recover = true;
    auto program = parseSource("gimme = 1;\ngimme y = ;\nsay(1);", diag, options);
    EXPECT_FALSE(program);
    ASSERT_EQ(diag.errorCount(), 2u);
    EXPECT_EQ(diag.diagnostics()[0].message, "at '=': Expect variable name.");
    EXPECT_EQ(diag.diagnostics()[0].loc.line, 1u);
    EXPECT_EQ(diag.diagnostics()[1].message, "at ';': Expect expression.");
    EXPECT_EQ(diag.diagnostics()[1].loc.line, 2u);
}

TEST(ParserTest, EmptyProgramParses)
{
    DiagnosticEngine diag;
    auto program = parseSource("// nothing here\n", diag);
    ASSERT_TRUE(program);
    EXPECT_TRUE(program->statements.empty());
}

TEST(ParserTest, ParserInstanceTracksErrorState)
{
    DiagnosticEngine diag;
    Parser good(tokenize("say(1);", 1, diag), diag);
    EXPECT_TRUE(good.parseProgram());
    EXPECT_FALSE(good.hasError());

    Parser bad(tokenize("say(;", 1, diag), diag);
    EXPECT_FALSE(bad.parseProgram());
    EXPECT_TRUE(bad.hasError());
}
