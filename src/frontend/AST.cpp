//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST.cpp
/// @brief Spelling tables for AST operator and statement kinds.
///
//===----------------------------------------------------------------------===//

#include "frontend/AST.hpp"

namespace roadman::frontend
{

const char *binaryOpSpelling(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Add:
            return "+";
        case BinaryOp::Sub:
            return "-";
        case BinaryOp::Mul:
            return "*";
        case BinaryOp::Div:
            return "/";
        case BinaryOp::Mod:
            return "%";
        case BinaryOp::Eq:
            return "==";
        case BinaryOp::Ne:
            return "!=";
        case BinaryOp::Lt:
            return "<";
        case BinaryOp::Le:
            return "<=";
        case BinaryOp::Gt:
            return ">";
        case BinaryOp::Ge:
            return ">=";
        case BinaryOp::And:
            return "&&";
        case BinaryOp::Or:
            return "||";
    }
    return "?";
}

const char *unaryOpSpelling(UnaryOp op)
{
    switch (op)
    {
        case UnaryOp::Neg:
            return "-";
        case UnaryOp::Not:
            return "!";
    }
    return "?";
}

const char *stmtKindName(StmtKind kind)
{
    switch (kind)
    {
        case StmtKind::Expr:
            return "ExprStmt";
        case StmtKind::Block:
            return "Block";
        case StmtKind::Var:
            return "VarDecl";
        case StmtKind::If:
            return "If";
        case StmtKind::While:
            return "While";
        case StmtKind::Break:
            return "Break";
        case StmtKind::Function:
            return "FunctionDecl";
        case StmtKind::Return:
            return "Return";
    }
    return "?";
}

} // namespace roadman::frontend
