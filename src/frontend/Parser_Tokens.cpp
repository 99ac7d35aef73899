//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Tokens.cpp
/// @brief Token cursor, error reporting and unit-level driver of the parser.
///
//===----------------------------------------------------------------------===//

#include "frontend/Parser.hpp"

namespace roadman::frontend
{

Parser::Parser(std::vector<Token> tokens,
               roadman::support::DiagnosticEngine &diag,
               ParserOptions options)
    : tokens_(std::move(tokens)), diag_(diag), options_(options)
{
    // Guarantee the Eof sentinel so the cursor never runs off the end.
    if (tokens_.empty() || !tokens_.back().is(TokenKind::Eof))
    {
        Token eof;
        eof.kind = TokenKind::Eof;
        if (!tokens_.empty())
            eof.loc = tokens_.back().loc;
        tokens_.push_back(std::move(eof));
    }
}

std::unique_ptr<Program> Parser::parseProgram()
{
    auto program = std::make_unique<Program>();
    while (!isAtEnd())
    {
        StmtPtr stmt = parseDeclaration();
        if (!stmt)
        {
            if (!options_.recover)
                return nullptr;
            synchronize();
            continue;
        }
        program->statements.push_back(std::move(stmt));
    }
    if (hasError_)
        return nullptr;
    return program;
}

//===----------------------------------------------------------------------===//
// Token Handling
//===----------------------------------------------------------------------===//

const Token &Parser::peek() const
{
    return tokens_[pos_];
}

const Token &Parser::previous() const
{
    return tokens_[pos_ == 0 ? 0 : pos_ - 1];
}

bool Parser::isAtEnd() const
{
    return peek().is(TokenKind::Eof);
}

const Token &Parser::advance()
{
    if (!isAtEnd())
        ++pos_;
    return previous();
}

bool Parser::check(TokenKind kind) const
{
    return peek().is(kind);
}

bool Parser::match(TokenKind kind)
{
    if (check(kind))
    {
        advance();
        return true;
    }
    return false;
}

bool Parser::expect(TokenKind kind, const char *message, Token *out)
{
    if (check(kind))
    {
        const Token &tok = advance();
        if (out)
            *out = tok;
        return true;
    }
    error(message);
    return false;
}

void Parser::synchronize()
{
    advance();
    while (!isAtEnd())
    {
        if (previous().is(TokenKind::Semicolon))
            return;

        switch (peek().kind)
        {
            case TokenKind::KwFam:
            case TokenKind::KwInnit:
            case TokenKind::KwLoopz:
            case TokenKind::KwReturnz:
            case TokenKind::KwGimme:
            case TokenKind::KwConste:
                return;
            default:
                break;
        }
        advance();
    }
}

//===----------------------------------------------------------------------===//
// Error Handling
//===----------------------------------------------------------------------===//

void Parser::error(const std::string &message)
{
    errorAt(peek(), message);
}

void Parser::errorAt(const Token &tok, const std::string &message)
{
    hasError_ = true;
    std::string text = tok.is(TokenKind::Eof) ? std::string("at end: ")
                                              : "at '" + tok.text + "': ";
    diag_.report(roadman::support::Diagnostic{roadman::support::Severity::Error,
                                              text + message,
                                              tok.loc,
                                              roadman::support::kParseErrorCode});
}

std::unique_ptr<Program> parse(std::vector<Token> tokens,
                               roadman::support::DiagnosticEngine &diag,
                               ParserOptions options)
{
    Parser parser(std::move(tokens), diag, options);
    return parser.parseProgram();
}

} // namespace roadman::frontend
