//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements scope lookup, definition and assignment along the enclosing chain.
//
//===----------------------------------------------------------------------===//

#include "interp/Environment.hpp"
#include "interp/RuntimeError.hpp"

namespace roadman::interp
{

Environment::Environment(std::shared_ptr<Environment> enclosing)
    : enclosing_(std::move(enclosing))
{
}

void Environment::define(const std::string &name, Value value, bool isConst)
{
    values_.insert_or_assign(name, Binding{std::move(value), isConst});
}

const Environment::Binding *Environment::find(const std::string &name) const
{
    for (const Environment *env = this; env; env = env->enclosing_.get())
    {
        auto it = env->values_.find(name);
        if (it != env->values_.end())
            return &it->second;
    }
    return nullptr;
}

Environment::Binding *Environment::find(const std::string &name)
{
    for (Environment *env = this; env; env = env->enclosing_.get())
    {
        auto it = env->values_.find(name);
        if (it != env->values_.end())
            return &it->second;
    }
    return nullptr;
}

Value Environment::get(const std::string &name, roadman::support::SourceLoc loc) const
{
    if (const Binding *b = find(name))
        return b->value;
    throw RuntimeError(
        RuntimeErrorKind::UndefinedVariable, "Undefined variable '" + name + "'.", loc);
}

void Environment::assign(const std::string &name, Value value, roadman::support::SourceLoc loc)
{
    Binding *b = find(name);
    if (!b)
    {
        throw RuntimeError(
            RuntimeErrorKind::UndefinedVariable, "Undefined variable '" + name + "'.", loc);
    }
    if (b->isConst)
    {
        throw RuntimeError(
            RuntimeErrorKind::ConstAssignment, "Cannot assign to constant '" + name + "'.", loc);
    }
    b->value = std::move(value);
}

bool Environment::containsLocal(const std::string &name) const
{
    return values_.count(name) != 0;
}

void Environment::clear()
{
    // Move out first: destroying the bindings can release other scopes that
    // re-enter this object through their own teardown.
    auto values = std::move(values_);
    values_.clear();
    auto enclosing = std::move(enclosing_);
    enclosing_.reset();
}

} // namespace roadman::interp
