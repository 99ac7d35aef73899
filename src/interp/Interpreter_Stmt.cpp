//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Interpreter_Stmt.cpp
/// @brief Statement execution for the Roadman interpreter.
///
/// @details Each statement returns an ExecResult. Blocks stop at the first
/// non-Normal completion and hand it to their caller unchanged; loops absorb
/// Break and forward Return.
///
//===----------------------------------------------------------------------===//

#include "interp/Interpreter.hpp"

namespace roadman::interp
{

using namespace roadman::frontend;

ExecResult Interpreter::execute(const Stmt &stmt)
{
    trace_.onStmt(stmt);

    switch (stmt.kind)
    {
        case StmtKind::Expr:
            return execExpr(static_cast<const ExprStmt &>(stmt));
        case StmtKind::Block:
            return executeBlock(static_cast<const BlockStmt &>(stmt).statements, newScope(env_));
        case StmtKind::Var:
            return execVar(static_cast<const VarStmt &>(stmt));
        case StmtKind::If:
            return execIf(static_cast<const IfStmt &>(stmt));
        case StmtKind::While:
            return execWhile(static_cast<const WhileStmt &>(stmt));
        case StmtKind::Break:
            return ExecResult::breaking(stmt.loc);
        case StmtKind::Function:
            return execFunction(static_cast<const FunctionStmt &>(stmt));
        case StmtKind::Return:
            return execReturn(static_cast<const ReturnStmt &>(stmt));
    }
    return ExecResult::normal();
}

ExecResult Interpreter::executeBlock(const std::vector<StmtPtr> &statements,
                                     std::shared_ptr<Environment> scope)
{
    ScopeGuard guard(*this, std::move(scope));
    for (const auto &stmt : statements)
    {
        ExecResult result = execute(*stmt);
        if (result.completion != Completion::Normal)
            return result;
    }
    return ExecResult::normal();
}

ExecResult Interpreter::execExpr(const ExprStmt &stmt)
{
    evaluate(*stmt.expr);
    return ExecResult::normal();
}

ExecResult Interpreter::execVar(const VarStmt &stmt)
{
    Value value;
    if (stmt.initializer)
        value = evaluate(*stmt.initializer);
    env_->define(stmt.name, std::move(value), stmt.isConst);
    return ExecResult::normal();
}

ExecResult Interpreter::execIf(const IfStmt &stmt)
{
    if (isTruthy(evaluate(*stmt.condition)))
        return execute(*stmt.thenBranch);
    if (stmt.elseBranch)
        return execute(*stmt.elseBranch);
    return ExecResult::normal();
}

ExecResult Interpreter::execWhile(const WhileStmt &stmt)
{
    while (isTruthy(evaluate(*stmt.condition)))
    {
        ExecResult result = execute(*stmt.body);
        if (result.completion == Completion::Break)
            break;
        if (result.completion == Completion::Return)
            return result;
    }
    return ExecResult::normal();
}

ExecResult Interpreter::execFunction(const FunctionStmt &stmt)
{
    // owner_ is the Program whose code is running, so it contains stmt.
    auto fn = std::make_shared<FunctionValue>(owner_, stmt, env_);
    env_->define(stmt.name, Value::callable(std::move(fn)));
    return ExecResult::normal();
}

ExecResult Interpreter::execReturn(const ReturnStmt &stmt)
{
    Value value;
    if (stmt.value)
        value = evaluate(*stmt.value);
    return ExecResult::returning(std::move(value), stmt.loc);
}

} // namespace roadman::interp
