//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/RuntimeError.hpp
// Purpose: Classification and exception type for Roadman runtime failures.
// Key invariants: Thrown at the failing node; caught only by Interpreter::interpret.
// Ownership/Lifetime: Value type; owns its message.
// Links: src/interp/Interpreter.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace roadman::interp
{

/// @brief Categories of runtime failures.
enum class RuntimeErrorKind : int32_t
{
    UndefinedVariable = 0,  ///< Read or assignment of an unbound name.
    TypeMismatch = 1,       ///< Operand kinds not accepted by an operator.
    DivideByZero = 2,       ///< `/` or `%` with a zero right operand.
    ArityMismatch = 3,      ///< Argument count differs from parameter count.
    NotCallable = 4,        ///< Call of a non-callable value.
    ConstAssignment = 5,    ///< Assignment to a `conste` binding.
    StackOverflow = 6,      ///< Call depth limit exceeded.
    InvalidControlFlow = 7, ///< `stopit` or `returnz` outside its construct.
};

/// @brief Convert a runtime error kind into a stable, human-readable name.
constexpr std::string_view toString(RuntimeErrorKind kind) noexcept
{
    switch (kind)
    {
        case RuntimeErrorKind::UndefinedVariable:
            return "UndefinedVariable";
        case RuntimeErrorKind::TypeMismatch:
            return "TypeMismatch";
        case RuntimeErrorKind::DivideByZero:
            return "DivideByZero";
        case RuntimeErrorKind::ArityMismatch:
            return "ArityMismatch";
        case RuntimeErrorKind::NotCallable:
            return "NotCallable";
        case RuntimeErrorKind::ConstAssignment:
            return "ConstAssignment";
        case RuntimeErrorKind::StackOverflow:
            return "StackOverflow";
        case RuntimeErrorKind::InvalidControlFlow:
            return "InvalidControlFlow";
    }
    return "Unknown";
}

/// @brief Exception raised by evaluation when a program misbehaves.
class RuntimeError : public std::runtime_error
{
  public:
    RuntimeError(RuntimeErrorKind kind, const std::string &message, roadman::support::SourceLoc loc)
        : std::runtime_error(message), kind_(kind), loc_(loc)
    {
    }

    RuntimeErrorKind kind() const noexcept
    {
        return kind_;
    }

    /// @brief Location of the node that failed.
    roadman::support::SourceLoc loc() const noexcept
    {
        return loc_;
    }

  private:
    RuntimeErrorKind kind_;
    roadman::support::SourceLoc loc_;
};

} // namespace roadman::interp
