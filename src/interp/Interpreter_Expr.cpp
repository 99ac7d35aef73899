//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Interpreter_Expr.cpp
/// @brief Expression evaluation for the Roadman interpreter.
///
/// @details Operands are evaluated left to right. `&&` and `||` evaluate the
/// right operand only when the left does not decide the result, and always
/// yield a boolean. Every other operator evaluates both operands first and
/// then checks their kinds.
///
//===----------------------------------------------------------------------===//

#include "interp/Interpreter.hpp"
#include "interp/RuntimeError.hpp"

#include <cmath>

namespace roadman::interp
{

using namespace roadman::frontend;

namespace
{

[[noreturn]] void throwTypeMismatch(BinaryOp op, const char *what, SourceLoc loc)
{
    throw RuntimeError(
        RuntimeErrorKind::TypeMismatch, std::string(binaryOpSpelling(op)) + ": " + what, loc);
}

/// @brief Require two numeric operands for an arithmetic operator.
void checkNumbers(BinaryOp op, const Value &lhs, const Value &rhs, SourceLoc loc)
{
    if (!lhs.isNumber() || !rhs.isNumber())
        throwTypeMismatch(op, "Operands must be numbers.", loc);
}

/// @brief Floored modulo: the result takes the sign of the divisor.
double flooredMod(double a, double b)
{
    double r = std::fmod(a, b);
    if (r != 0.0 && ((r < 0.0) != (b < 0.0)))
        r += b;
    return r;
}

Value compare(BinaryOp op, const Value &lhs, const Value &rhs, SourceLoc loc)
{
    if (lhs.isNumber() && rhs.isNumber())
    {
        double a = lhs.asNumber();
        double b = rhs.asNumber();
        switch (op)
        {
            case BinaryOp::Lt:
                return Value::boolean(a < b);
            case BinaryOp::Le:
                return Value::boolean(a <= b);
            case BinaryOp::Gt:
                return Value::boolean(a > b);
            default:
                return Value::boolean(a >= b);
        }
    }
    if (!lhs.isString() || !rhs.isString())
        throwTypeMismatch(op, "Operands must be two numbers or two strings.", loc);

    int order = lhs.asString().compare(rhs.asString());

    switch (op)
    {
        case BinaryOp::Lt:
            return Value::boolean(order < 0);
        case BinaryOp::Le:
            return Value::boolean(order <= 0);
        case BinaryOp::Gt:
            return Value::boolean(order > 0);
        default:
            return Value::boolean(order >= 0);
    }
}

} // namespace

Value Interpreter::evaluate(const Expr &expr)
{
    switch (expr.kind)
    {
        case ExprKind::Literal:
            return evalLiteral(static_cast<const LiteralExpr &>(expr));
        case ExprKind::Variable:
        {
            const auto &var = static_cast<const VariableExpr &>(expr);
            return env_->get(var.name, var.loc);
        }
        case ExprKind::Unary:
            return evalUnary(static_cast<const UnaryExpr &>(expr));
        case ExprKind::Binary:
            return evalBinary(static_cast<const BinaryExpr &>(expr));
        case ExprKind::Grouping:
            return evaluate(*static_cast<const GroupingExpr &>(expr).inner);
        case ExprKind::Assign:
            return evalAssign(static_cast<const AssignExpr &>(expr));
        case ExprKind::Call:
            return evalCall(static_cast<const CallExpr &>(expr));
        case ExprKind::List:
            return evalList(static_cast<const ListExpr &>(expr));
    }
    return Value();
}

Value Interpreter::evalLiteral(const LiteralExpr &expr)
{
    if (auto *num = std::get_if<double>(&expr.value))
        return Value::number(*num);
    if (auto *str = std::get_if<std::string>(&expr.value))
        return Value::string(*str);
    return Value::boolean(std::get<bool>(expr.value));
}

Value Interpreter::evalUnary(const UnaryExpr &expr)
{
    Value operand = evaluate(*expr.operand);
    switch (expr.op)
    {
        case UnaryOp::Neg:
            if (!operand.isNumber())
            {
                throw RuntimeError(
                    RuntimeErrorKind::TypeMismatch, "-: Operand must be a number.", expr.loc);
            }
            return Value::number(-operand.asNumber());
        case UnaryOp::Not:
            return Value::boolean(!isTruthy(operand));
    }
    return Value();
}

Value Interpreter::evalBinary(const BinaryExpr &expr)
{
    // Short-circuit forms decide before touching the right operand.
    if (expr.op == BinaryOp::And || expr.op == BinaryOp::Or)
    {
        bool left = isTruthy(evaluate(*expr.left));
        if (expr.op == BinaryOp::And ? !left : left)
            return Value::boolean(left);
        return Value::boolean(isTruthy(evaluate(*expr.right)));
    }

    Value lhs = evaluate(*expr.left);
    Value rhs = evaluate(*expr.right);

    switch (expr.op)
    {
        case BinaryOp::Add:
            if (lhs.isNumber() && rhs.isNumber())
                return Value::number(lhs.asNumber() + rhs.asNumber());
            if (lhs.isString() && rhs.isString())
                return Value::string(lhs.asString() + rhs.asString());
            throwTypeMismatch(expr.op, "Operands must be two numbers or two strings.", expr.loc);
        case BinaryOp::Sub:
            checkNumbers(expr.op, lhs, rhs, expr.loc);
            return Value::number(lhs.asNumber() - rhs.asNumber());
        case BinaryOp::Mul:
            checkNumbers(expr.op, lhs, rhs, expr.loc);
            return Value::number(lhs.asNumber() * rhs.asNumber());
        case BinaryOp::Div:
            checkNumbers(expr.op, lhs, rhs, expr.loc);
            if (rhs.asNumber() == 0.0)
                throw RuntimeError(RuntimeErrorKind::DivideByZero, "Division by zero.", expr.loc);
            return Value::number(lhs.asNumber() / rhs.asNumber());
        case BinaryOp::Mod:
            checkNumbers(expr.op, lhs, rhs, expr.loc);
            if (rhs.asNumber() == 0.0)
                throw RuntimeError(RuntimeErrorKind::DivideByZero, "Division by zero.", expr.loc);
            return Value::number(flooredMod(lhs.asNumber(), rhs.asNumber()));
        case BinaryOp::Eq:
            return Value::boolean(valuesEqual(lhs, rhs));
        case BinaryOp::Ne:
            return Value::boolean(!valuesEqual(lhs, rhs));
        case BinaryOp::Lt:
        case BinaryOp::Le:
        case BinaryOp::Gt:
        case BinaryOp::Ge:
            return compare(expr.op, lhs, rhs, expr.loc);
        case BinaryOp::And:
        case BinaryOp::Or:
            break;
    }
    return Value();
}

Value Interpreter::evalAssign(const AssignExpr &expr)
{
    Value value = evaluate(*expr.value);
    env_->assign(expr.name, value, expr.loc);
    return value;
}

Value Interpreter::evalCall(const CallExpr &expr)
{
    Value callee = evaluate(*expr.callee);

    std::vector<Value> args;
    args.reserve(expr.args.size());
    for (const auto &arg : expr.args)
        args.push_back(evaluate(*arg));

    if (callee.kind() != ValueKind::Callable)
        throw RuntimeError(RuntimeErrorKind::NotCallable, "Can only call functions.", expr.loc);

    // Pinned for the duration of the call.
    CallablePtr fn = callee.asCallable();
    if (args.size() != fn->arity())
    {
        throw RuntimeError(RuntimeErrorKind::ArityMismatch,
                           "Expected " + std::to_string(fn->arity()) + " arguments but got " +
                               std::to_string(args.size()) + ".",
                           expr.loc);
    }
    return fn->call(*this, args, expr.loc);
}

Value Interpreter::evalList(const ListExpr &expr)
{
    std::vector<Value> elements;
    elements.reserve(expr.elements.size());
    for (const auto &elem : expr.elements)
        elements.push_back(evaluate(*elem));
    return Value::list(std::move(elements));
}

} // namespace roadman::interp
