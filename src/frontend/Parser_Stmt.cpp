//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Stmt.cpp
/// @brief Declaration and statement parsing for the Roadman parser.
///
/// @details Declarations (`conste`, `gimme`, `fam`) are only recognized where a
/// declaration may start: at top level and inside blocks. The branches of
/// `innit`/`loopz` are plain statements, so `innit (c) gimme x = 1;` is a
/// syntax error; wrap the declaration in a block instead.
///
//===----------------------------------------------------------------------===//

#include "frontend/Parser.hpp"

namespace roadman::frontend
{

StmtPtr Parser::parseDeclaration()
{
    if (check(TokenKind::KwConste))
    {
        const Token &kw = advance();
        return parseVarDecl(kw, true);
    }
    if (check(TokenKind::KwGimme))
    {
        const Token &kw = advance();
        return parseVarDecl(kw, false);
    }
    if (check(TokenKind::KwFam))
    {
        const Token &kw = advance();
        return parseFunctionDecl(kw);
    }
    return parseStatement();
}

StmtPtr Parser::parseVarDecl(const Token &keyword, bool isConst)
{
    Token name;
    if (!expect(TokenKind::Identifier, "Expect variable name.", &name))
        return nullptr;

    ExprPtr init;
    if (match(TokenKind::Equal))
    {
        init = parseExpression();
        if (!init)
            return nullptr;
    }

    if (!expect(TokenKind::Semicolon, "Expect ';' after variable declaration."))
        return nullptr;

    return std::make_unique<VarStmt>(keyword.loc, name.text, std::move(init), isConst);
}

StmtPtr Parser::parseFunctionDecl(const Token &keyword)
{
    Token name;
    if (!expect(TokenKind::Identifier, "Expect function name.", &name))
        return nullptr;
    if (!expect(TokenKind::LParen, "Expect '(' after function name."))
        return nullptr;

    std::vector<std::string> params;
    if (!check(TokenKind::RParen))
    {
        do
        {
            Token param;
            if (!expect(TokenKind::Identifier, "Expect parameter name.", &param))
                return nullptr;
            params.push_back(param.text);
        } while (match(TokenKind::Comma));
    }

    if (!expect(TokenKind::RParen, "Expect ')' after parameters."))
        return nullptr;

    Token lbrace;
    if (!expect(TokenKind::LBrace, "Expect '{' before function body.", &lbrace))
        return nullptr;

    auto body = parseBlock(lbrace);
    if (!body)
        return nullptr;

    return std::make_unique<FunctionStmt>(
        keyword.loc, name.text, std::move(params), std::move(body));
}

StmtPtr Parser::parseStatement()
{
    switch (peek().kind)
    {
        case TokenKind::KwInnit:
            return parseIfStmt(advance());
        case TokenKind::KwLoopz:
            return parseWhileStmt(advance());
        case TokenKind::KwReturnz:
            return parseReturnStmt(advance());
        case TokenKind::KwStopit:
            return parseBreakStmt(advance());
        case TokenKind::LBrace:
            return parseBlock(advance());
        default:
            return parseExprStmt();
    }
}

StmtPtr Parser::parseIfStmt(const Token &keyword)
{
    if (!expect(TokenKind::LParen, "Expect '(' after 'innit'."))
        return nullptr;
    ExprPtr cond = parseExpression();
    if (!cond)
        return nullptr;
    if (!expect(TokenKind::RParen, "Expect ')' after if condition."))
        return nullptr;

    StmtPtr thenBranch = parseStatement();
    if (!thenBranch)
        return nullptr;

    StmtPtr elseBranch;
    if (match(TokenKind::KwElseway))
    {
        elseBranch = parseStatement();
        if (!elseBranch)
            return nullptr;
    }

    return std::make_unique<IfStmt>(
        keyword.loc, std::move(cond), std::move(thenBranch), std::move(elseBranch));
}

StmtPtr Parser::parseWhileStmt(const Token &keyword)
{
    if (!expect(TokenKind::LParen, "Expect '(' after 'loopz'."))
        return nullptr;
    ExprPtr cond = parseExpression();
    if (!cond)
        return nullptr;
    if (!expect(TokenKind::RParen, "Expect ')' after loop condition."))
        return nullptr;

    StmtPtr body = parseStatement();
    if (!body)
        return nullptr;

    return std::make_unique<WhileStmt>(keyword.loc, std::move(cond), std::move(body));
}

StmtPtr Parser::parseReturnStmt(const Token &keyword)
{
    ExprPtr value;
    if (!check(TokenKind::Semicolon))
    {
        value = parseExpression();
        if (!value)
            return nullptr;
    }
    if (!expect(TokenKind::Semicolon, "Expect ';' after return value."))
        return nullptr;
    return std::make_unique<ReturnStmt>(keyword.loc, std::move(value));
}

StmtPtr Parser::parseBreakStmt(const Token &keyword)
{
    if (!expect(TokenKind::Semicolon, "Expect ';' after 'stopit'."))
        return nullptr;
    return std::make_unique<BreakStmt>(keyword.loc);
}

std::unique_ptr<BlockStmt> Parser::parseBlock(const Token &lbrace)
{
    std::vector<StmtPtr> statements;
    while (!check(TokenKind::RBrace) && !isAtEnd())
    {
        StmtPtr stmt = parseDeclaration();
        if (!stmt)
            return nullptr;
        statements.push_back(std::move(stmt));
    }
    if (!expect(TokenKind::RBrace, "Expect '}' after block."))
        return nullptr;
    return std::make_unique<BlockStmt>(lbrace.loc, std::move(statements));
}

StmtPtr Parser::parseExprStmt()
{
    SourceLoc loc = peek().loc;
    ExprPtr expr = parseExpression();
    if (!expr)
        return nullptr;
    if (!expect(TokenKind::Semicolon, "Expect ';' after expression."))
        return nullptr;
    return std::make_unique<ExprStmt>(loc, std::move(expr));
}

} // namespace roadman::frontend
