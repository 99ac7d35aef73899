//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements Value construction, truthiness, equality and display rendering.
//
//===----------------------------------------------------------------------===//

#include "interp/Value.hpp"
#include "interp/Callable.hpp"
#include "support/number_format.hpp"

namespace roadman::interp
{

const char *valueKindName(ValueKind kind)
{
    switch (kind)
    {
        case ValueKind::Nil:
            return "nil";
        case ValueKind::Number:
            return "number";
        case ValueKind::String:
            return "string";
        case ValueKind::Bool:
            return "boolean";
        case ValueKind::List:
            return "list";
        case ValueKind::Callable:
            return "function";
    }
    return "unknown";
}

Value Value::number(double v)
{
    return Value(Storage(std::in_place_type<double>, v));
}

Value Value::string(std::string v)
{
    return Value(Storage(std::in_place_type<std::string>, std::move(v)));
}

Value Value::boolean(bool v)
{
    return Value(Storage(std::in_place_type<bool>, v));
}

Value Value::list(std::vector<Value> elements)
{
    return Value(Storage(std::in_place_type<ListPtr>,
                         std::make_shared<const std::vector<Value>>(std::move(elements))));
}

Value Value::callable(CallablePtr fn)
{
    return Value(Storage(std::in_place_type<CallablePtr>, std::move(fn)));
}

ValueKind Value::kind() const
{
    // Storage alternatives are declared in ValueKind order.
    return static_cast<ValueKind>(data_.index());
}

double Value::asNumber() const
{
    return std::get<double>(data_);
}

const std::string &Value::asString() const
{
    return std::get<std::string>(data_);
}

bool Value::asBool() const
{
    return std::get<bool>(data_);
}

const std::vector<Value> &Value::asList() const
{
    return *std::get<ListPtr>(data_);
}

const ListPtr &Value::listHandle() const
{
    return std::get<ListPtr>(data_);
}

const CallablePtr &Value::asCallable() const
{
    return std::get<CallablePtr>(data_);
}

bool isTruthy(const Value &v)
{
    switch (v.kind())
    {
        case ValueKind::Nil:
            return false;
        case ValueKind::Bool:
            return v.asBool();
        case ValueKind::Number:
            return v.asNumber() != 0.0;
        case ValueKind::String:
            return !v.asString().empty();
        case ValueKind::List:
        case ValueKind::Callable:
            return true;
    }
    return true;
}

bool valuesEqual(const Value &a, const Value &b)
{
    if (a.kind() != b.kind())
        return false;

    switch (a.kind())
    {
        case ValueKind::Nil:
            return true;
        case ValueKind::Number:
            return a.asNumber() == b.asNumber();
        case ValueKind::String:
            return a.asString() == b.asString();
        case ValueKind::Bool:
            return a.asBool() == b.asBool();
        case ValueKind::List:
        {
            const auto &lhs = a.asList();
            const auto &rhs = b.asList();
            if (lhs.size() != rhs.size())
                return false;
            for (size_t i = 0; i < lhs.size(); ++i)
            {
                if (!valuesEqual(lhs[i], rhs[i]))
                    return false;
            }
            return true;
        }
        case ValueKind::Callable:
            return a.asCallable() == b.asCallable();
    }
    return false;
}

std::string toDisplayString(const Value &v)
{
    switch (v.kind())
    {
        case ValueKind::Nil:
            return "nil";
        case ValueKind::Number:
            return roadman::support::formatNumber(v.asNumber());
        case ValueKind::String:
            return v.asString();
        case ValueKind::Bool:
            return v.asBool() ? "true" : "false";
        case ValueKind::List:
        {
            std::string out = "[";
            bool first = true;
            for (const auto &elem : v.asList())
            {
                if (!first)
                    out += ", ";
                first = false;
                out += toDisplayString(elem);
            }
            out += "]";
            return out;
        }
        case ValueKind::Callable:
            return v.asCallable()->toString();
    }
    return "";
}

} // namespace roadman::interp
