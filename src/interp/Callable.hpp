//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/Callable.hpp
// Purpose: Callable runtime values: user closures and native functions.
// Key invariants: arity() is fixed for the lifetime of the callable.
// Ownership/Lifetime: FunctionValue shares the Program that owns its
//                     declaration and its closure Environment.
// Links: src/interp/Interpreter.hpp, src/interp/Environment.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST.hpp"
#include "interp/Value.hpp"
#include "support/source_location.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace roadman::interp
{

class Environment;
class Interpreter;

/// @brief Interface for anything that can appear as the callee of a call.
class Callable
{
  public:
    virtual ~Callable() = default;

    /// @brief Function name used by display strings and traces.
    virtual const std::string &name() const = 0;

    /// @brief Exact number of arguments the callable accepts.
    virtual size_t arity() const = 0;

    /// @brief Invoke with already-evaluated arguments; args.size() == arity().
    virtual Value call(Interpreter &interp,
                       std::vector<Value> &args,
                       roadman::support::SourceLoc callLoc) = 0;

    /// @brief Display string such as `<fn name>`.
    virtual std::string toString() const = 0;
};

/// @brief User-defined function closed over its declaring environment.
class FunctionValue : public Callable
{
  public:
    /// @param owner Program whose tree contains @p decl.
    FunctionValue(std::shared_ptr<const frontend::Program> owner,
                  const frontend::FunctionStmt &decl,
                  std::shared_ptr<Environment> closure);

    const std::string &name() const override;
    size_t arity() const override;
    Value call(Interpreter &interp,
               std::vector<Value> &args,
               roadman::support::SourceLoc callLoc) override;
    std::string toString() const override;

    const frontend::FunctionStmt &declaration() const
    {
        return *decl_;
    }

    /// @brief Program owning the declaration; also owns every nested `fam`.
    const std::shared_ptr<const frontend::Program> &owner() const
    {
        return owner_;
    }

    const std::shared_ptr<Environment> &closure() const
    {
        return closure_;
    }

  private:
    std::shared_ptr<const frontend::Program> owner_;
    const frontend::FunctionStmt *decl_;
    std::shared_ptr<Environment> closure_;
};

/// @brief Host function exposed to Roadman programs.
class NativeFunction : public Callable
{
  public:
    using Fn = std::function<Value(Interpreter &, std::vector<Value> &, roadman::support::SourceLoc)>;

    NativeFunction(std::string name, size_t arity, Fn fn);

    const std::string &name() const override;
    size_t arity() const override;
    Value call(Interpreter &interp,
               std::vector<Value> &args,
               roadman::support::SourceLoc callLoc) override;
    std::string toString() const override;

  private:
    std::string name_;
    size_t arity_;
    Fn fn_;
};

} // namespace roadman::interp
