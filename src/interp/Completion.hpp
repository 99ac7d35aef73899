//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/Completion.hpp
// Purpose: Statement completion record threaded through block and loop execution.
// Key invariants: value is meaningful only for Completion::Return.
// Ownership/Lifetime: Value type.
// Links: src/interp/Interpreter.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/Value.hpp"
#include "support/source_location.hpp"

namespace roadman::interp
{

/// @brief How a statement finished.
enum class Completion
{
    Normal, ///< Fall through to the next statement.
    Return, ///< `returnz` unwinding to the nearest call frame.
    Break,  ///< `stopit` unwinding to the nearest loop.
};

/// @brief Outcome of executing one statement.
struct ExecResult
{
    Completion completion = Completion::Normal;

    /// @brief Returned value for Completion::Return.
    Value value;

    /// @brief Location of the `returnz`/`stopit` that started the unwind.
    roadman::support::SourceLoc origin{};

    static ExecResult normal()
    {
        return {};
    }

    static ExecResult returning(Value v, roadman::support::SourceLoc loc)
    {
        return {Completion::Return, std::move(v), loc};
    }

    static ExecResult breaking(roadman::support::SourceLoc loc)
    {
        return {Completion::Break, Value(), loc};
    }
};

} // namespace roadman::interp
