//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Transpiler.hpp
/// @brief Renders a Roadman AST as JavaScript source text.
///
/// @details The transpiler is a pure function of the AST: it performs no
/// semantic validation and never fails on a tree produced by the parser.
///
/// | Roadman                 | JavaScript                |
/// |-------------------------|---------------------------|
/// | `gimme x = e;`          | `let x = e;`              |
/// | `conste x = e;`         | `const x = e;`            |
/// | `fam f(a) { ... }`      | `function f(a) { ... }`   |
/// | `innit (c) s elseway t` | `if (c) s else t`         |
/// | `loopz (c) s`           | `while (c) s`             |
/// | `stopit;` / `returnz e;`| `break;` / `return e;`    |
/// | `say(e)`                | `console.log(e)`          |
///
/// Blocks indent their statements two spaces per nesting level.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST.hpp"
#include <string>

namespace roadman::transpile
{

class Transpiler
{
  public:
    /// @brief Render @p program; statements are newline-separated with no
    ///        trailing newline.
    std::string transpile(const frontend::Program &program);

  private:
    std::string stmt(const frontend::Stmt &s, int depth);
    std::string block(const frontend::BlockStmt &b, int depth);
    std::string expr(const frontend::Expr &e);
};

/// @brief Convenience wrapper around Transpiler::transpile.
std::string transpile(const frontend::Program &program);

/// @brief Render @p text as a double-quoted JavaScript string literal.
std::string quoteString(const std::string &text);

} // namespace roadman::transpile
