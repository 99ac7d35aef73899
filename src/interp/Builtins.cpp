//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the native function table.
//
//===----------------------------------------------------------------------===//

#include "interp/Builtins.hpp"
#include "interp/Callable.hpp"
#include "interp/Environment.hpp"
#include "interp/Interpreter.hpp"
#include "interp/RuntimeError.hpp"

#include <chrono>
#include <ostream>

namespace roadman::interp
{

namespace
{

using roadman::support::SourceLoc;

/// @brief Write the display form of the argument followed by a newline.
Value sayImpl(Interpreter &interp, std::vector<Value> &args, SourceLoc)
{
    interp.out() << toDisplayString(args[0]) << '\n';
    return Value();
}

/// @brief Seconds since the Unix epoch.
Value clockImpl(Interpreter &, std::vector<Value> &, SourceLoc)
{
    using namespace std::chrono;
    auto now = duration_cast<duration<double>>(system_clock::now().time_since_epoch());
    return Value::number(now.count());
}

Value lenImpl(Interpreter &, std::vector<Value> &args, SourceLoc loc)
{
    const Value &v = args[0];
    switch (v.kind())
    {
        case ValueKind::String:
            return Value::number(static_cast<double>(v.asString().size()));
        case ValueKind::List:
            return Value::number(static_cast<double>(v.asList().size()));
        default:
            throw RuntimeError(
                RuntimeErrorKind::TypeMismatch, "len: Operand must be a string or list.", loc);
    }
}

struct NativeEntry
{
    const char *name;
    size_t arity;
    NativeFunction::Fn fn;
};

} // namespace

void registerBuiltins(Environment &globals)
{
    const NativeEntry table[] = {
        {"say", 1, sayImpl},
        {"clock", 0, clockImpl},
        {"len", 1, lenImpl},
    };

    for (const auto &entry : table)
    {
        globals.define(entry.name,
                       Value::callable(
                           std::make_shared<NativeFunction>(entry.name, entry.arity, entry.fn)));
    }
}

} // namespace roadman::interp
