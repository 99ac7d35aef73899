//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements user closures and native function wrappers.
//
//===----------------------------------------------------------------------===//

#include "interp/Callable.hpp"
#include "interp/Interpreter.hpp"

namespace roadman::interp
{

FunctionValue::FunctionValue(std::shared_ptr<const frontend::Program> owner,
                             const frontend::FunctionStmt &decl,
                             std::shared_ptr<Environment> closure)
    : owner_(std::move(owner)), decl_(&decl), closure_(std::move(closure))
{
}

const std::string &FunctionValue::name() const
{
    return decl_->name;
}

size_t FunctionValue::arity() const
{
    return decl_->params.size();
}

Value FunctionValue::call(Interpreter &interp,
                          std::vector<Value> &args,
                          roadman::support::SourceLoc callLoc)
{
    return interp.callFunction(*this, args, callLoc);
}

std::string FunctionValue::toString() const
{
    return "<fn " + decl_->name + ">";
}

NativeFunction::NativeFunction(std::string name, size_t arity, Fn fn)
    : name_(std::move(name)), arity_(arity), fn_(std::move(fn))
{
}

const std::string &NativeFunction::name() const
{
    return name_;
}

size_t NativeFunction::arity() const
{
    return arity_;
}

Value NativeFunction::call(Interpreter &interp,
                           std::vector<Value> &args,
                           roadman::support::SourceLoc callLoc)
{
    return fn_(interp, args, callLoc);
}

std::string NativeFunction::toString() const
{
    return "<native fn " + name_ + ">";
}

} // namespace roadman::interp
