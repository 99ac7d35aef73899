//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstPrinter.cpp
/// @brief Implements the Roadman AST tree-walking printer.
///
//===----------------------------------------------------------------------===//

#include "frontend/AstPrinter.hpp"
#include "support/number_format.hpp"

#include <sstream>

namespace roadman::frontend
{

namespace
{

// ---------------------------------------------------------------------------
// Printer helper -- manages indentation and line output.
// ---------------------------------------------------------------------------

struct Printer
{
    std::ostream &os;
    int indent = 0;

    void line(const std::string &text)
    {
        for (int i = 0; i < indent; ++i)
            os << "  ";
        os << text << '\n';
    }

    void push()
    {
        ++indent;
    }

    void pop()
    {
        --indent;
    }
};

void printStmt(const Stmt &stmt, Printer &p);
void printExpr(const Expr &expr, Printer &p);

/// @brief Format a source location as "(line:col)".
std::string locStr(const SourceLoc &loc)
{
    std::ostringstream s;
    s << "(" << loc.line << ":" << loc.column << ")";
    return s.str();
}

std::string literalStr(const LiteralValue &value)
{
    if (auto *num = std::get_if<double>(&value))
        return roadman::support::formatNumber(*num);
    if (auto *str = std::get_if<std::string>(&value))
        return "\"" + *str + "\"";
    return std::get<bool>(value) ? "true" : "false";
}

/// @brief Print @p label on its own line, then @p stmt one level deeper.
void printLabeled(const char *label, const Stmt &stmt, Printer &p)
{
    p.line(label);
    p.push();
    printStmt(stmt, p);
    p.pop();
}

void printExpr(const Expr &expr, Printer &p)
{
    switch (expr.kind)
    {
        case ExprKind::Literal:
        {
            const auto &e = static_cast<const LiteralExpr &>(expr);
            p.line("Literal " + literalStr(e.value) + " " + locStr(e.loc));
            return;
        }
        case ExprKind::Variable:
        {
            const auto &e = static_cast<const VariableExpr &>(expr);
            p.line("Variable \"" + e.name + "\" " + locStr(e.loc));
            return;
        }
        case ExprKind::Unary:
        {
            const auto &e = static_cast<const UnaryExpr &>(expr);
            p.line(std::string("Unary ") + unaryOpSpelling(e.op) + " " + locStr(e.loc));
            p.push();
            printExpr(*e.operand, p);
            p.pop();
            return;
        }
        case ExprKind::Binary:
        {
            const auto &e = static_cast<const BinaryExpr &>(expr);
            p.line(std::string("Binary ") + binaryOpSpelling(e.op) + " " + locStr(e.loc));
            p.push();
            printExpr(*e.left, p);
            printExpr(*e.right, p);
            p.pop();
            return;
        }
        case ExprKind::Grouping:
        {
            const auto &e = static_cast<const GroupingExpr &>(expr);
            p.line("Grouping " + locStr(e.loc));
            p.push();
            printExpr(*e.inner, p);
            p.pop();
            return;
        }
        case ExprKind::Assign:
        {
            const auto &e = static_cast<const AssignExpr &>(expr);
            p.line("Assign \"" + e.name + "\" " + locStr(e.loc));
            p.push();
            printExpr(*e.value, p);
            p.pop();
            return;
        }
        case ExprKind::Call:
        {
            const auto &e = static_cast<const CallExpr &>(expr);
            p.line("Call " + locStr(e.loc));
            p.push();
            printExpr(*e.callee, p);
            if (!e.args.empty())
            {
                p.line("Args:");
                p.push();
                for (const auto &arg : e.args)
                    printExpr(*arg, p);
                p.pop();
            }
            p.pop();
            return;
        }
        case ExprKind::List:
        {
            const auto &e = static_cast<const ListExpr &>(expr);
            p.line("List [" + std::to_string(e.elements.size()) + "] " + locStr(e.loc));
            p.push();
            for (const auto &elem : e.elements)
                printExpr(*elem, p);
            p.pop();
            return;
        }
    }
}

void printStmt(const Stmt &stmt, Printer &p)
{
    switch (stmt.kind)
    {
        case StmtKind::Expr:
        {
            const auto &s = static_cast<const ExprStmt &>(stmt);
            p.line("ExprStmt " + locStr(s.loc));
            p.push();
            printExpr(*s.expr, p);
            p.pop();
            return;
        }
        case StmtKind::Block:
        {
            const auto &s = static_cast<const BlockStmt &>(stmt);
            p.line("Block " + locStr(s.loc));
            p.push();
            for (const auto &child : s.statements)
                printStmt(*child, p);
            p.pop();
            return;
        }
        case StmtKind::Var:
        {
            const auto &s = static_cast<const VarStmt &>(stmt);
            p.line(std::string("VarDecl ") + (s.isConst ? "conste" : "gimme") + " \"" + s.name +
                   "\" " + locStr(s.loc));
            if (s.initializer)
            {
                p.push();
                printExpr(*s.initializer, p);
                p.pop();
            }
            return;
        }
        case StmtKind::If:
        {
            const auto &s = static_cast<const IfStmt &>(stmt);
            p.line("If " + locStr(s.loc));
            p.push();
            printExpr(*s.condition, p);
            printLabeled("Then:", *s.thenBranch, p);
            if (s.elseBranch)
                printLabeled("Else:", *s.elseBranch, p);
            p.pop();
            return;
        }
        case StmtKind::While:
        {
            const auto &s = static_cast<const WhileStmt &>(stmt);
            p.line("While " + locStr(s.loc));
            p.push();
            printExpr(*s.condition, p);
            printLabeled("Body:", *s.body, p);
            p.pop();
            return;
        }
        case StmtKind::Break:
            p.line("Break " + locStr(stmt.loc));
            return;
        case StmtKind::Function:
        {
            const auto &s = static_cast<const FunctionStmt &>(stmt);
            std::string params;
            for (size_t i = 0; i < s.params.size(); ++i)
            {
                if (i)
                    params += ", ";
                params += s.params[i];
            }
            p.line("FunctionDecl \"" + s.name + "\" (" + params + ") " + locStr(s.loc));
            p.push();
            printStmt(*s.body, p);
            p.pop();
            return;
        }
        case StmtKind::Return:
        {
            const auto &s = static_cast<const ReturnStmt &>(stmt);
            p.line("Return " + locStr(s.loc));
            if (s.value)
            {
                p.push();
                printExpr(*s.value, p);
                p.pop();
            }
            return;
        }
    }
}

} // namespace

std::string AstPrinter::dump(const Program &program)
{
    std::ostringstream os;
    Printer p{os};
    p.line("Program");
    p.push();
    for (const auto &stmt : program.statements)
        printStmt(*stmt, p);
    return os.str();
}

std::string AstPrinter::dump(const Expr &expr)
{
    std::ostringstream os;
    Printer p{os};
    printExpr(expr, p);
    return os.str();
}

} // namespace roadman::frontend
