//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST.hpp
/// @brief Umbrella header for the Roadman abstract syntax tree.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST_Expr.hpp"
#include "frontend/AST_Fwd.hpp"
#include "frontend/AST_Stmt.hpp"
