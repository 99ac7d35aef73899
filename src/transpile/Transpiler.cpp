//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Transpiler.cpp
/// @brief Implements the Roadman to JavaScript renderer.
///
//===----------------------------------------------------------------------===//

#include "transpile/Transpiler.hpp"
#include "support/number_format.hpp"

namespace roadman::transpile
{

using namespace roadman::frontend;

namespace
{

std::string indentStr(int depth)
{
    return std::string(static_cast<size_t>(depth) * 2, ' ');
}

} // namespace

std::string quoteString(const std::string &text)
{
    std::string out = "\"";
    for (char c : text)
    {
        switch (c)
        {
            case '\\':
                out += "\\\\";
                break;
            case '"':
                out += "\\\"";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    out += '"';
    return out;
}

std::string Transpiler::transpile(const Program &program)
{
    std::string out;
    for (size_t i = 0; i < program.statements.size(); ++i)
    {
        if (i)
            out += '\n';
        out += stmt(*program.statements[i], 0);
    }
    return out;
}

std::string Transpiler::block(const BlockStmt &b, int depth)
{
    if (b.statements.empty())
        return "{}";

    std::string out = "{\n";
    for (const auto &child : b.statements)
        out += indentStr(depth + 1) + stmt(*child, depth + 1) + "\n";
    out += indentStr(depth) + "}";
    return out;
}

std::string Transpiler::stmt(const Stmt &s, int depth)
{
    switch (s.kind)
    {
        case StmtKind::Expr:
            return expr(*static_cast<const ExprStmt &>(s).expr) + ";";
        case StmtKind::Block:
            return block(static_cast<const BlockStmt &>(s), depth);
        case StmtKind::Var:
        {
            const auto &v = static_cast<const VarStmt &>(s);
            std::string out = (v.isConst ? "const " : "let ") + v.name;
            if (v.initializer)
                out += " = " + expr(*v.initializer);
            return out + ";";
        }
        case StmtKind::If:
        {
            const auto &i = static_cast<const IfStmt &>(s);
            std::string out = "if (" + expr(*i.condition) + ") " + stmt(*i.thenBranch, depth);
            if (i.elseBranch)
                out += " else " + stmt(*i.elseBranch, depth);
            return out;
        }
        case StmtKind::While:
        {
            const auto &w = static_cast<const WhileStmt &>(s);
            return "while (" + expr(*w.condition) + ") " + stmt(*w.body, depth);
        }
        case StmtKind::Break:
            return "break;";
        case StmtKind::Function:
        {
            const auto &f = static_cast<const FunctionStmt &>(s);
            std::string params;
            for (size_t i = 0; i < f.params.size(); ++i)
            {
                if (i)
                    params += ", ";
                params += f.params[i];
            }
            return "function " + f.name + "(" + params + ") " + block(*f.body, depth);
        }
        case StmtKind::Return:
        {
            const auto &r = static_cast<const ReturnStmt &>(s);
            if (r.value)
                return "return " + expr(*r.value) + ";";
            return "return;";
        }
    }
    return {};
}

std::string Transpiler::expr(const Expr &e)
{
    switch (e.kind)
    {
        case ExprKind::Literal:
        {
            const auto &lit = static_cast<const LiteralExpr &>(e);
            if (auto *num = std::get_if<double>(&lit.value))
                return roadman::support::formatNumber(*num);
            if (auto *str = std::get_if<std::string>(&lit.value))
                return quoteString(*str);
            return std::get<bool>(lit.value) ? "true" : "false";
        }
        case ExprKind::Variable:
            return static_cast<const VariableExpr &>(e).name;
        case ExprKind::Unary:
        {
            const auto &u = static_cast<const UnaryExpr &>(e);
            std::string operand = expr(*u.operand);
            // `- -x` must not collapse into the `--` token.
            if (u.operand->kind == ExprKind::Unary &&
                static_cast<const UnaryExpr &>(*u.operand).op == u.op)
            {
                operand = "(" + operand + ")";
            }
            return unaryOpSpelling(u.op) + operand;
        }
        case ExprKind::Binary:
        {
            const auto &b = static_cast<const BinaryExpr &>(e);
            return expr(*b.left) + " " + binaryOpSpelling(b.op) + " " + expr(*b.right);
        }
        case ExprKind::Grouping:
            return "(" + expr(*static_cast<const GroupingExpr &>(e).inner) + ")";
        case ExprKind::Assign:
        {
            const auto &a = static_cast<const AssignExpr &>(e);
            return a.name + " = " + expr(*a.value);
        }
        case ExprKind::Call:
        {
            const auto &c = static_cast<const CallExpr &>(e);
            std::string callee;
            if (c.callee->kind == ExprKind::Variable &&
                static_cast<const VariableExpr &>(*c.callee).name == "say")
                callee = "console.log";
            else
                callee = expr(*c.callee);

            std::string args;
            for (size_t i = 0; i < c.args.size(); ++i)
            {
                if (i)
                    args += ", ";
                args += expr(*c.args[i]);
            }
            return callee + "(" + args + ")";
        }
        case ExprKind::List:
        {
            const auto &l = static_cast<const ListExpr &>(e);
            std::string out = "[";
            for (size_t i = 0; i < l.elements.size(); ++i)
            {
                if (i)
                    out += ", ";
                out += expr(*l.elements[i]);
            }
            return out + "]";
        }
    }
    return {};
}

std::string transpile(const Program &program)
{
    Transpiler t;
    return t.transpile(program);
}

} // namespace roadman::transpile
