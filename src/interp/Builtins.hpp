//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/Builtins.hpp
// Purpose: Native functions available to every Roadman program.
// Key invariants: Natives are plain global bindings and may be shadowed.
// Ownership/Lifetime: Registered callables are owned by the global scope.
// Links: src/interp/Callable.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

namespace roadman::interp
{

class Environment;

/// @brief Bind `say`, `clock` and `len` in @p globals.
void registerBuiltins(Environment &globals);

} // namespace roadman::interp
