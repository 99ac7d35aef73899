//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Interpreter.hpp
/// @brief Tree-walking evaluator for Roadman programs.
///
/// @details The interpreter executes a parsed Program statement by statement
/// against a chain of Environments rooted at a persistent global scope.
///
/// ## Scoping
///
/// Every block gets a fresh child of the active scope. Every call gets a fresh
/// scope whose parent is the callee's closure, never the caller's scope.
///
/// ## Control Flow
///
/// `returnz` and `stopit` travel as ExecResult values through execute(); loops
/// consume Break, calls consume Return. A completion that escapes to the top
/// level (or a Break escaping a function body) is a runtime error.
///
/// ## Errors
///
/// Runtime failures throw RuntimeError at the failing node. interpret() is the
/// only place that catches it: the error becomes an R3000 diagnostic, the rest
/// of the unit is skipped and the global scope keeps every binding made before
/// the failure.
///
/// ## Lifetime
///
/// Closures and scopes reference each other through shared_ptr, which forms
/// cycles (a function stored in the scope it closes over). The interpreter
/// registers every scope it creates. Once the registry doubles in size,
/// collectCycles() clears the scopes that only the graph itself references;
/// destruction clears whatever is left.
///
/// A FunctionValue holds the Program that owns its declaration. Calls make
/// that Program the active owner, so a nested `fam` is tied to the unit that
/// contains its syntax rather than to the unit currently running.
///
/// @invariant Not thread-safe; confine an instance to one thread.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST.hpp"
#include "interp/Callable.hpp"
#include "interp/Completion.hpp"
#include "interp/Environment.hpp"
#include "interp/Trace.hpp"
#include "interp/Value.hpp"
#include "support/diagnostics.hpp"
#include <cstddef>
#include <iostream>
#include <memory>
#include <vector>

namespace roadman::interp
{

/// @brief Interpreter configuration.
struct InterpreterOptions
{
    /// @brief Destination of `say` output.
    std::ostream *out = &std::cout;

    /// @brief Execution tracing.
    TraceConfig trace{};

    /// @brief Destination of trace lines; null selects std::cerr.
    std::ostream *traceOut = nullptr;

    /// @brief Maximum nesting of active user function calls.
    size_t maxCallDepth = 1000;
};

class Interpreter
{
  public:
    explicit Interpreter(InterpreterOptions options = {});
    ~Interpreter();

    Interpreter(const Interpreter &) = delete;
    Interpreter &operator=(const Interpreter &) = delete;

    /// @brief Execute every statement of @p program in the global scope.
    /// @param program Parsed unit; kept alive by any function it declares.
    /// @param diag Receives a diagnostic when a runtime error halts the unit.
    /// @return True when the unit ran to completion.
    bool interpret(std::shared_ptr<const frontend::Program> program,
                   roadman::support::DiagnosticEngine &diag);

    /// @brief Invoke a user function; called through FunctionValue::call.
    Value callFunction(const FunctionValue &fn,
                       std::vector<Value> &args,
                       roadman::support::SourceLoc callLoc);

    /// @brief Stream receiving `say` output.
    std::ostream &out()
    {
        return *options_.out;
    }

    /// @brief Release every registered scope reachable only through other
    ///        registered scopes, functions and lists.
    /// @details Trial deletion: a node whose strong count exceeds the references
    ///          held by the graph is referenced from outside (globals, the active
    ///          scope, the C++ stack) and keeps everything it reaches alive.
    /// @return Number of scopes cleared.
    size_t collectCycles();

    /// @brief Number of scopes created by this interpreter and still alive.
    size_t liveScopeCount() const;

    /// @brief The persistent outermost scope holding natives and top-level bindings.
    const std::shared_ptr<Environment> &globals() const
    {
        return globals_;
    }

  private:
    //=========================================================================
    /// @name Statement Execution (Interpreter_Stmt.cpp)
    /// @{
    //=========================================================================

    ExecResult execute(const frontend::Stmt &stmt);
    ExecResult executeBlock(const std::vector<frontend::StmtPtr> &statements,
                            std::shared_ptr<Environment> scope);
    ExecResult execExpr(const frontend::ExprStmt &stmt);
    ExecResult execVar(const frontend::VarStmt &stmt);
    ExecResult execIf(const frontend::IfStmt &stmt);
    ExecResult execWhile(const frontend::WhileStmt &stmt);
    ExecResult execFunction(const frontend::FunctionStmt &stmt);
    ExecResult execReturn(const frontend::ReturnStmt &stmt);

    /// @}
    //=========================================================================
    /// @name Expression Evaluation (Interpreter_Expr.cpp)
    /// @{
    //=========================================================================

    Value evaluate(const frontend::Expr &expr);
    Value evalLiteral(const frontend::LiteralExpr &expr);
    Value evalUnary(const frontend::UnaryExpr &expr);
    Value evalBinary(const frontend::BinaryExpr &expr);
    Value evalAssign(const frontend::AssignExpr &expr);
    Value evalCall(const frontend::CallExpr &expr);
    Value evalList(const frontend::ListExpr &expr);

    /// @}

    /// @brief Create a scope and register it for teardown.
    std::shared_ptr<Environment> newScope(std::shared_ptr<Environment> enclosing);

    /// @brief RAII swap of the active scope.
    class ScopeGuard
    {
      public:
        ScopeGuard(Interpreter &interp, std::shared_ptr<Environment> scope)
            : interp_(interp), saved_(std::move(interp.env_))
        {
            interp_.env_ = std::move(scope);
        }

        ~ScopeGuard()
        {
            interp_.env_ = std::move(saved_);
        }

        ScopeGuard(const ScopeGuard &) = delete;
        ScopeGuard &operator=(const ScopeGuard &) = delete;

      private:
        Interpreter &interp_;
        std::shared_ptr<Environment> saved_;
    };

    InterpreterOptions options_;
    TraceSink trace_;
    std::shared_ptr<Environment> globals_;
    std::shared_ptr<Environment> env_;

    /// @brief Program containing the code currently executing.
    std::shared_ptr<const frontend::Program> owner_;

    size_t callDepth_ = 0;

    /// @brief Every scope created by this interpreter, for cycle collection.
    std::vector<std::weak_ptr<Environment>> scopes_;

    /// @brief Registry size that triggers the next collection.
    size_t collectThreshold_ = 64;
};

} // namespace roadman::interp
