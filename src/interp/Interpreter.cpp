//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Interpreter.cpp
/// @brief Interpreter setup, teardown, the unit entry point and user calls.
///
//===----------------------------------------------------------------------===//

#include "interp/Interpreter.hpp"
#include "interp/Builtins.hpp"
#include "interp/RuntimeError.hpp"

#include <algorithm>
#include <utility>

namespace roadman::interp
{

Interpreter::Interpreter(InterpreterOptions options)
    : options_(options), trace_(options.trace, options.traceOut)
{
    globals_ = newScope(nullptr);
    env_ = globals_;
    registerBuiltins(*globals_);
}

Interpreter::~Interpreter()
{
    env_.reset();
    for (auto &weak : scopes_)
    {
        if (auto scope = weak.lock())
            scope->clear();
    }
}

std::shared_ptr<Environment> Interpreter::newScope(std::shared_ptr<Environment> enclosing)
{
    if (scopes_.size() >= collectThreshold_)
    {
        collectCycles();
        collectThreshold_ = std::max<size_t>(64, scopes_.size() * 2);
    }

    auto scope = std::make_shared<Environment>(std::move(enclosing));
    scopes_.push_back(scope);
    return scope;
}

bool Interpreter::interpret(std::shared_ptr<const frontend::Program> program,
                            roadman::support::DiagnosticEngine &diag)
{
    owner_ = program;
    env_ = globals_;
    callDepth_ = 0;

    try
    {
        for (const auto &stmt : program->statements)
        {
            ExecResult result = execute(*stmt);
            switch (result.completion)
            {
                case Completion::Normal:
                    break;
                case Completion::Return:
                    throw RuntimeError(RuntimeErrorKind::InvalidControlFlow,
                                       "Cannot use 'returnz' outside of a function.",
                                       result.origin);
                case Completion::Break:
                    throw RuntimeError(RuntimeErrorKind::InvalidControlFlow,
                                       "Cannot use 'stopit' outside of a loop.",
                                       result.origin);
            }
        }
    }
    catch (const RuntimeError &err)
    {
        diag.report(roadman::support::Diagnostic{roadman::support::Severity::Error,
                                                  err.what(),
                                                  err.loc(),
                                                  roadman::support::kRuntimeErrorCode});
        env_ = globals_;
        owner_.reset();
        callDepth_ = 0;
        return false;
    }
    owner_.reset();
    return true;
}

Value Interpreter::callFunction(const FunctionValue &fn,
                                std::vector<Value> &args,
                                roadman::support::SourceLoc callLoc)
{
    if (callDepth_ >= options_.maxCallDepth)
    {
        throw RuntimeError(RuntimeErrorKind::StackOverflow,
                           "Maximum call depth of " + std::to_string(options_.maxCallDepth) +
                               " exceeded.",
                           callLoc);
    }

    const frontend::FunctionStmt &decl = fn.declaration();
    auto scope = newScope(fn.closure());
    for (size_t i = 0; i < decl.params.size(); ++i)
        scope->define(decl.params[i], std::move(args[i]));

    struct DepthGuard
    {
        size_t &depth;

        ~DepthGuard()
        {
            --depth;
        }
    } depthGuard{++callDepth_};

    struct OwnerGuard
    {
        std::shared_ptr<const frontend::Program> &slot;
        std::shared_ptr<const frontend::Program> saved;

        ~OwnerGuard()
        {
            slot = std::move(saved);
        }
    } ownerGuard{owner_, std::exchange(owner_, fn.owner())};

    trace_.onCall(decl.name, callDepth_);
    ExecResult result = executeBlock(decl.body->statements, std::move(scope));
    trace_.onReturn(decl.name);

    switch (result.completion)
    {
        case Completion::Normal:
            return Value();
        case Completion::Return:
            return std::move(result.value);
        case Completion::Break:
            throw RuntimeError(RuntimeErrorKind::InvalidControlFlow,
                               "Cannot use 'stopit' outside of a loop.",
                               result.origin);
    }
    return Value();
}

} // namespace roadman::interp
