//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstPrinter.hpp
/// @brief Human-readable dump of a Roadman program.
///
/// @details Produces an indentation-based tree dump: one node per line with
/// its kind, identifying attributes (names, operators, literal values) and
/// source location. Children are indented by two spaces.
///
/// Example output for `gimme a = 1 + 2;`:
/// @code
///   Program
///     VarDecl gimme "a" (1:1)
///       Binary + (1:13)
///         Literal 1.0 (1:11)
///         Literal 2.0 (1:15)
/// @endcode
///
/// @invariant Printing never mutates the AST.
/// @invariant Output is deterministic for golden tests.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST.hpp"
#include <string>

namespace roadman::frontend
{

class AstPrinter
{
  public:
    /// @brief Dump the whole program tree.
    std::string dump(const Program &program);

    /// @brief Dump a single expression subtree, starting at indentation zero.
    std::string dump(const Expr &expr);
};

} // namespace roadman::frontend
