//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Expr.cpp
/// @brief Expression parsing for the Roadman parser.
///
/// @details One method per precedence level. Binary levels are
/// left-associative: the loop re-wraps the accumulated left operand while the
/// level's operator is present. Assignment is the single right-associative
/// level and is resolved after its left side is parsed as an ordinary
/// expression.
///
//===----------------------------------------------------------------------===//

#include "frontend/Parser.hpp"
#include <optional>

namespace roadman::frontend
{

namespace
{

std::optional<BinaryOp> equalityOp(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::EqualEqual:
            return BinaryOp::Eq;
        case TokenKind::BangEqual:
            return BinaryOp::Ne;
        default:
            return std::nullopt;
    }
}

std::optional<BinaryOp> comparisonOp(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Less:
            return BinaryOp::Lt;
        case TokenKind::LessEqual:
            return BinaryOp::Le;
        case TokenKind::Greater:
            return BinaryOp::Gt;
        case TokenKind::GreaterEqual:
            return BinaryOp::Ge;
        default:
            return std::nullopt;
    }
}

std::optional<BinaryOp> additiveOp(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Plus:
            return BinaryOp::Add;
        case TokenKind::Minus:
            return BinaryOp::Sub;
        default:
            return std::nullopt;
    }
}

std::optional<BinaryOp> multiplicativeOp(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Star:
            return BinaryOp::Mul;
        case TokenKind::Slash:
            return BinaryOp::Div;
        case TokenKind::Percent:
            return BinaryOp::Mod;
        default:
            return std::nullopt;
    }
}

} // namespace

ExprPtr Parser::parseExpression()
{
    return parseAssignment();
}

ExprPtr Parser::parseAssignment()
{
    ExprPtr expr = parseOr();
    if (!expr)
        return nullptr;

    if (check(TokenKind::Equal))
    {
        const Token &equals = advance();
        ExprPtr value = parseAssignment();
        if (!value)
            return nullptr;

        if (expr->kind == ExprKind::Variable)
        {
            auto *target = static_cast<VariableExpr *>(expr.get());
            return std::make_unique<AssignExpr>(
                target->loc, std::move(target->name), std::move(value));
        }

        errorAt(equals, "Invalid assignment target.");
        return nullptr;
    }
    return expr;
}

ExprPtr Parser::parseOr()
{
    ExprPtr expr = parseAnd();
    if (!expr)
        return nullptr;

    while (check(TokenKind::PipePipe))
    {
        SourceLoc loc = advance().loc;
        ExprPtr right = parseAnd();
        if (!right)
            return nullptr;
        expr = std::make_unique<BinaryExpr>(loc, BinaryOp::Or, std::move(expr), std::move(right));
    }
    return expr;
}

ExprPtr Parser::parseAnd()
{
    ExprPtr expr = parseEquality();
    if (!expr)
        return nullptr;

    while (check(TokenKind::AmpAmp))
    {
        SourceLoc loc = advance().loc;
        ExprPtr right = parseEquality();
        if (!right)
            return nullptr;
        expr =
            std::make_unique<BinaryExpr>(loc, BinaryOp::And, std::move(expr), std::move(right));
    }
    return expr;
}

ExprPtr Parser::parseEquality()
{
    ExprPtr expr = parseComparison();
    if (!expr)
        return nullptr;

    while (auto op = equalityOp(peek().kind))
    {
        SourceLoc loc = advance().loc;
        ExprPtr right = parseComparison();
        if (!right)
            return nullptr;
        expr = std::make_unique<BinaryExpr>(loc, *op, std::move(expr), std::move(right));
    }
    return expr;
}

ExprPtr Parser::parseComparison()
{
    ExprPtr expr = parseAdditive();
    if (!expr)
        return nullptr;

    while (auto op = comparisonOp(peek().kind))
    {
        SourceLoc loc = advance().loc;
        ExprPtr right = parseAdditive();
        if (!right)
            return nullptr;
        expr = std::make_unique<BinaryExpr>(loc, *op, std::move(expr), std::move(right));
    }
    return expr;
}

ExprPtr Parser::parseAdditive()
{
    ExprPtr expr = parseMultiplicative();
    if (!expr)
        return nullptr;

    while (auto op = additiveOp(peek().kind))
    {
        SourceLoc loc = advance().loc;
        ExprPtr right = parseMultiplicative();
        if (!right)
            return nullptr;
        expr = std::make_unique<BinaryExpr>(loc, *op, std::move(expr), std::move(right));
    }
    return expr;
}

ExprPtr Parser::parseMultiplicative()
{
    ExprPtr expr = parseUnary();
    if (!expr)
        return nullptr;

    while (auto op = multiplicativeOp(peek().kind))
    {
        SourceLoc loc = advance().loc;
        ExprPtr right = parseUnary();
        if (!right)
            return nullptr;
        expr = std::make_unique<BinaryExpr>(loc, *op, std::move(expr), std::move(right));
    }
    return expr;
}

ExprPtr Parser::parseUnary()
{
    if (check(TokenKind::Bang) || check(TokenKind::Minus))
    {
        const Token &opTok = advance();
        UnaryOp op = opTok.is(TokenKind::Bang) ? UnaryOp::Not : UnaryOp::Neg;
        SourceLoc loc = opTok.loc;
        ExprPtr operand = parseUnary();
        if (!operand)
            return nullptr;
        return std::make_unique<UnaryExpr>(loc, op, std::move(operand));
    }
    return parseCall();
}

ExprPtr Parser::parseCall()
{
    ExprPtr expr = parsePrimary();
    if (!expr)
        return nullptr;

    while (match(TokenKind::LParen))
    {
        expr = finishCall(std::move(expr));
        if (!expr)
            return nullptr;
    }
    return expr;
}

ExprPtr Parser::finishCall(ExprPtr callee)
{
    std::vector<ExprPtr> args;
    if (!parseExprList(TokenKind::RParen, args))
        return nullptr;

    Token paren;
    if (!expect(TokenKind::RParen, "Expect ')' after arguments.", &paren))
        return nullptr;

    return std::make_unique<CallExpr>(paren.loc, std::move(callee), std::move(args));
}

bool Parser::parseExprList(TokenKind close, std::vector<ExprPtr> &out)
{
    if (check(close))
        return true;
    do
    {
        ExprPtr e = parseExpression();
        if (!e)
            return false;
        out.push_back(std::move(e));
    } while (match(TokenKind::Comma));
    return true;
}

ExprPtr Parser::parsePrimary()
{
    const Token &tok = peek();
    switch (tok.kind)
    {
        case TokenKind::KwTrue:
            advance();
            return std::make_unique<LiteralExpr>(tok.loc, LiteralValue(true));
        case TokenKind::KwFalse:
            advance();
            return std::make_unique<LiteralExpr>(tok.loc, LiteralValue(false));
        case TokenKind::NumberLiteral:
            advance();
            return std::make_unique<LiteralExpr>(tok.loc, LiteralValue(tok.numberValue));
        case TokenKind::StringLiteral:
            advance();
            return std::make_unique<LiteralExpr>(tok.loc, LiteralValue(tok.stringValue));
        case TokenKind::Identifier:
            advance();
            return std::make_unique<VariableExpr>(tok.loc, tok.text);
        case TokenKind::LParen:
        {
            advance();
            ExprPtr inner = parseExpression();
            if (!inner)
                return nullptr;
            if (!expect(TokenKind::RParen, "Expect ')' after expression."))
                return nullptr;
            return std::make_unique<GroupingExpr>(tok.loc, std::move(inner));
        }
        case TokenKind::LBracket:
            return parseListLiteral(advance());
        default:
            break;
    }
    error("Expect expression.");
    return nullptr;
}

ExprPtr Parser::parseListLiteral(const Token &lbracket)
{
    std::vector<ExprPtr> elements;
    if (!parseExprList(TokenKind::RBracket, elements))
        return nullptr;
    if (!expect(TokenKind::RBracket, "Expect ']' after list elements."))
        return nullptr;
    return std::make_unique<ListExpr>(lbracket.loc, std::move(elements));
}

} // namespace roadman::frontend
