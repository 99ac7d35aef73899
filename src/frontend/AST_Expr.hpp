//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Expr.hpp
/// @brief Expression nodes for the Roadman AST.
///
/// @details Expressions evaluate to a single runtime value. The node set is
/// closed: every consumer switches over ExprKind and handles each kind, so a
/// new kind is a compile-time error (-Werror=switch) in every back end until
/// it is handled.
///
/// @invariant Every Expr has a `kind` field matching its concrete type.
/// @invariant Nodes are never mutated after the parser returns them.
///
/// Ownership/Lifetime: Owned by their parent via ExprPtr. Forms a tree.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST_Fwd.hpp"
#include <string>
#include <variant>
#include <vector>

namespace roadman::frontend
{

/// @brief Enumerates all kinds of expression nodes.
enum class ExprKind
{
    Literal,  ///< `1.5`, `"text"`, `true`
    Variable, ///< `name`
    Unary,    ///< `-x`, `!x`
    Binary,   ///< `a + b`, `a && b`
    Grouping, ///< `(expr)`
    Assign,   ///< `name = value`
    Call,     ///< `callee(args...)`
    List,     ///< `[a, b, c]`
};

/// @brief Base class for all expression nodes.
struct Expr
{
    /// @brief Identifies the concrete expression kind for downcasting.
    ExprKind kind;

    /// @brief Location of the token that best identifies this expression.
    SourceLoc loc;

    Expr(ExprKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~Expr() = default;
};

/// @brief Literal payload: number, string or boolean.
using LiteralValue = std::variant<double, std::string, bool>;

/// @brief Constant embedded in the source text.
struct LiteralExpr : Expr
{
    LiteralValue value;

    LiteralExpr(SourceLoc l, LiteralValue v) : Expr(ExprKind::Literal, l), value(std::move(v)) {}
};

/// @brief Reference to a named binding, resolved at run time.
struct VariableExpr : Expr
{
    std::string name;

    VariableExpr(SourceLoc l, std::string n) : Expr(ExprKind::Variable, l), name(std::move(n)) {}
};

/// @brief Unary operators for UnaryExpr.
enum class UnaryOp
{
    Neg, ///< Arithmetic negation: `-a`
    Not, ///< Logical NOT: `!a`
};

/// @brief Prefix operator applied to one operand.
struct UnaryExpr : Expr
{
    UnaryOp op;
    ExprPtr operand;

    UnaryExpr(SourceLoc l, UnaryOp o, ExprPtr e)
        : Expr(ExprKind::Unary, l), op(o), operand(std::move(e))
    {
    }
};

/// @brief Binary operators for BinaryExpr.
/// @details And/Or short-circuit; all others evaluate both operands left to
///          right.
enum class BinaryOp
{
    Add, ///< `+`
    Sub, ///< `-`
    Mul, ///< `*`
    Div, ///< `/`
    Mod, ///< `%`
    Eq,  ///< `==`
    Ne,  ///< `!=`
    Lt,  ///< `<`
    Le,  ///< `<=`
    Gt,  ///< `>`
    Ge,  ///< `>=`
    And, ///< `&&`
    Or,  ///< `||`
};

/// @brief Source spelling of a binary operator.
const char *binaryOpSpelling(BinaryOp op);

/// @brief Source spelling of a unary operator.
const char *unaryOpSpelling(UnaryOp op);

/// @brief Infix operation. The location is that of the operator token.
struct BinaryExpr : Expr
{
    BinaryOp op;
    ExprPtr left;
    ExprPtr right;

    BinaryExpr(SourceLoc l, BinaryOp o, ExprPtr lhs, ExprPtr rhs)
        : Expr(ExprKind::Binary, l), op(o), left(std::move(lhs)), right(std::move(rhs))
    {
    }
};

/// @brief Parenthesized expression, kept so the transpiler can re-emit it.
struct GroupingExpr : Expr
{
    ExprPtr inner;

    GroupingExpr(SourceLoc l, ExprPtr e) : Expr(ExprKind::Grouping, l), inner(std::move(e)) {}
};

/// @brief Assignment to an existing binding. Right-associative.
struct AssignExpr : Expr
{
    std::string name;
    ExprPtr value;

    AssignExpr(SourceLoc l, std::string n, ExprPtr v)
        : Expr(ExprKind::Assign, l), name(std::move(n)), value(std::move(v))
    {
    }
};

/// @brief Call of an arbitrary callee expression.
/// @details The location is the closing parenthesis, matching where the
///          argument count becomes known.
struct CallExpr : Expr
{
    ExprPtr callee;
    std::vector<ExprPtr> args;

    CallExpr(SourceLoc l, ExprPtr c, std::vector<ExprPtr> a)
        : Expr(ExprKind::Call, l), callee(std::move(c)), args(std::move(a))
    {
    }
};

/// @brief List literal `[e1, e2, ...]`.
struct ListExpr : Expr
{
    std::vector<ExprPtr> elements;

    ListExpr(SourceLoc l, std::vector<ExprPtr> e)
        : Expr(ExprKind::List, l), elements(std::move(e))
    {
    }
};

} // namespace roadman::frontend
