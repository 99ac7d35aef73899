//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Stmt.hpp
/// @brief Statement nodes and the Program root for the Roadman AST.
///
/// @details Statements perform actions. Declarations (`gimme`, `conste`,
/// `fam`) are ordinary statements: they may appear anywhere a statement can,
/// including inside blocks and function bodies.
///
/// Ownership/Lifetime: Owned by their parent via StmtPtr; the Program owns the
/// top-level list. FunctionStmt nodes are additionally referenced by runtime
/// closures through an aliasing shared_ptr that keeps the Program alive.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST_Expr.hpp"
#include <string>
#include <vector>

namespace roadman::frontend
{

/// @brief Enumerates all kinds of statement nodes.
enum class StmtKind
{
    Expr,     ///< `expr;`
    Block,    ///< `{ ... }`
    Var,      ///< `gimme x = e;` / `conste x = e;`
    If,       ///< `innit (c) s [elseway s]`
    While,    ///< `loopz (c) s`
    Break,    ///< `stopit;`
    Function, ///< `fam name(params) { ... }`
    Return,   ///< `returnz [e];`
};

/// @brief Human-readable statement kind name used by traces and dumps.
const char *stmtKindName(StmtKind kind);

/// @brief Base class for all statement nodes.
struct Stmt
{
    StmtKind kind;

    /// @brief Location of the first token of the statement.
    SourceLoc loc;

    Stmt(StmtKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~Stmt() = default;
};

struct ExprStmt : Stmt
{
    ExprPtr expr;

    ExprStmt(SourceLoc l, ExprPtr e) : Stmt(StmtKind::Expr, l), expr(std::move(e)) {}
};

/// @brief Brace-delimited statement list; introduces a new scope when executed.
struct BlockStmt : Stmt
{
    std::vector<StmtPtr> statements;

    BlockStmt(SourceLoc l, std::vector<StmtPtr> s)
        : Stmt(StmtKind::Block, l), statements(std::move(s))
    {
    }
};

/// @brief Variable or constant declaration.
struct VarStmt : Stmt
{
    std::string name;

    /// @brief Initializer, or null when the declaration binds absence.
    ExprPtr initializer;

    /// @brief True for `conste` declarations.
    bool isConst = false;

    VarStmt(SourceLoc l, std::string n, ExprPtr init, bool c)
        : Stmt(StmtKind::Var, l), name(std::move(n)), initializer(std::move(init)), isConst(c)
    {
    }
};

struct IfStmt : Stmt
{
    ExprPtr condition;
    StmtPtr thenBranch;

    /// @brief Null when there is no `elseway`.
    StmtPtr elseBranch;

    IfStmt(SourceLoc l, ExprPtr c, StmtPtr t, StmtPtr e)
        : Stmt(StmtKind::If, l), condition(std::move(c)), thenBranch(std::move(t)),
          elseBranch(std::move(e))
    {
    }
};

struct WhileStmt : Stmt
{
    ExprPtr condition;
    StmtPtr body;

    WhileStmt(SourceLoc l, ExprPtr c, StmtPtr b)
        : Stmt(StmtKind::While, l), condition(std::move(c)), body(std::move(b))
    {
    }
};

struct BreakStmt : Stmt
{
    explicit BreakStmt(SourceLoc l) : Stmt(StmtKind::Break, l) {}
};

/// @brief Named function declaration.
struct FunctionStmt : Stmt
{
    std::string name;
    std::vector<std::string> params;
    std::unique_ptr<BlockStmt> body;

    FunctionStmt(SourceLoc l,
                 std::string n,
                 std::vector<std::string> p,
                 std::unique_ptr<BlockStmt> b)
        : Stmt(StmtKind::Function, l), name(std::move(n)), params(std::move(p)),
          body(std::move(b))
    {
    }
};

struct ReturnStmt : Stmt
{
    /// @brief Returned expression, or null for a bare `returnz;`.
    ExprPtr value;

    ReturnStmt(SourceLoc l, ExprPtr v) : Stmt(StmtKind::Return, l), value(std::move(v)) {}
};

/// @brief Root of a parsed unit: the ordered top-level statements.
struct Program
{
    std::vector<StmtPtr> statements;
};

} // namespace roadman::frontend
