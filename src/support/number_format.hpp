//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/number_format.hpp
// Purpose: Canonical text rendering of Roadman numbers.
// Key invariants: Output is the shortest decimal that round-trips to the same double.
// Ownership/Lifetime: Stateless free function.
// Links: src/interp/Value.hpp, src/transpile/Transpiler.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace roadman::support
{

/// @brief Render @p value the way Roadman displays numbers.
///
/// @details Magnitudes in [1e-4, 1e16) (and zero) use fixed notation with a
/// mandatory fractional part (`120.0`, `22.5`); other magnitudes use
/// scientific notation (`1e+16`, `1.5e-07`). Non-finite values render as
/// `inf`, `-inf` and `nan`.
std::string formatNumber(double value);

} // namespace roadman::support
