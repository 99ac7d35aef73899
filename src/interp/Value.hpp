//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/Value.hpp
// Purpose: Runtime value representation for the Roadman interpreter.
// Key invariants: A Value holds exactly one of nil, number, string, boolean,
//                 list or callable. Lists are immutable once built and shared.
// Ownership/Lifetime: Strings are owned; lists and callables are shared.
// Links: src/interp/Callable.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace roadman::interp
{

class Callable;
class Value;

using ListPtr = std::shared_ptr<const std::vector<Value>>;
using CallablePtr = std::shared_ptr<Callable>;

/// @brief Discriminator for Value contents.
enum class ValueKind
{
    Nil,
    Number,
    String,
    Bool,
    List,
    Callable,
};

/// @brief Lowercase name of a value kind ("nil", "number", ...).
const char *valueKindName(ValueKind kind);

/// @brief Tagged runtime value.
///
/// @details Constructed through the named factories so a `const char *`
/// never silently becomes a boolean. A default-constructed Value is nil.
class Value
{
  public:
    Value() = default;

    static Value number(double v);
    static Value string(std::string v);
    static Value boolean(bool v);
    static Value list(std::vector<Value> elements);
    static Value callable(CallablePtr fn);

    ValueKind kind() const;

    bool isNil() const
    {
        return kind() == ValueKind::Nil;
    }

    bool isNumber() const
    {
        return kind() == ValueKind::Number;
    }

    bool isString() const
    {
        return kind() == ValueKind::String;
    }

    /// @name Accessors
    /// @brief Require the matching kind.
    /// @{
    double asNumber() const;
    const std::string &asString() const;
    bool asBool() const;
    const std::vector<Value> &asList() const;
    const CallablePtr &asCallable() const;
    /// @}

    /// @brief Shared list storage; requires kind() == List.
    const ListPtr &listHandle() const;

  private:
    using Storage = std::variant<std::monostate, double, std::string, bool, ListPtr, CallablePtr>;

    explicit Value(Storage data) : data_(std::move(data)) {}

    Storage data_;
};

/// @brief Truthiness: nil and false are false, 0 and "" are false, all else true.
bool isTruthy(const Value &v);

/// @brief Structural equality; values of different kinds are never equal.
bool valuesEqual(const Value &a, const Value &b);

/// @brief Render a value for `say` and the REPL.
std::string toDisplayString(const Value &v);

} // namespace roadman::interp
