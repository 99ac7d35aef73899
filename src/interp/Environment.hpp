//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/Environment.hpp
// Purpose: Chained lexical scope records.
// Key invariants: Names are unique within one scope; lookup walks outward.
// Ownership/Lifetime: Shared by the active scope chain and by every closure
//                     declared inside it; the enclosing scope is kept alive
//                     by its children.
// Links: src/interp/Interpreter.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/Value.hpp"
#include "support/source_location.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>

namespace roadman::interp
{

class Environment
{
  public:
    explicit Environment(std::shared_ptr<Environment> enclosing = nullptr);

    /// @brief Bind @p name in this scope, replacing an existing local binding.
    void define(const std::string &name, Value value, bool isConst = false);

    /// @brief Read @p name from this scope or the nearest enclosing one.
    /// @throws RuntimeError UndefinedVariable when no scope binds the name.
    Value get(const std::string &name, roadman::support::SourceLoc loc) const;

    /// @brief Overwrite the nearest existing binding of @p name.
    /// @throws RuntimeError UndefinedVariable or ConstAssignment.
    void assign(const std::string &name, Value value, roadman::support::SourceLoc loc);

    /// @brief Check whether @p name is bound in this scope only.
    bool containsLocal(const std::string &name) const;

    /// @brief Number of bindings in this scope only.
    size_t size() const
    {
        return values_.size();
    }

    const std::shared_ptr<Environment> &enclosing() const
    {
        return enclosing_;
    }

    /// @brief Call @p fn with every value bound in this scope only.
    template <typename Fn> void forEachValue(Fn &&fn) const
    {
        for (const auto &entry : values_)
            fn(entry.second.value);
    }

    /// @brief Drop every binding and the enclosing link.
    /// @details Used by the interpreter to break closure reference cycles.
    void clear();

  private:
    struct Binding
    {
        Value value;
        bool isConst = false;
    };

    const Binding *find(const std::string &name) const;
    Binding *find(const std::string &name);

    std::unordered_map<std::string, Binding> values_;
    std::shared_ptr<Environment> enclosing_;
};

} // namespace roadman::interp
