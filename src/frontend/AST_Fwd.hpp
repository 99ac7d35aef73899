//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Fwd.hpp
/// @brief Forward declarations and smart pointer aliases for the Roadman AST.
///
/// @see AST.hpp - umbrella header that includes all AST node headers.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"
#include <memory>

namespace roadman::frontend
{

struct Expr;
struct Stmt;
struct BlockStmt;
struct FunctionStmt;
struct Program;

/// @brief Unique pointer to an expression node.
using ExprPtr = std::unique_ptr<Expr>;

/// @brief Unique pointer to a statement node.
using StmtPtr = std::unique_ptr<Stmt>;

/// @brief Source location for error messages and tracing.
using SourceLoc = roadman::support::SourceLoc;

} // namespace roadman::frontend
