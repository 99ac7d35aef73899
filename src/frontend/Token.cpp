//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Token.cpp
/// @brief Token kind names used by diagnostics and the token dump.
///
//===----------------------------------------------------------------------===//

#include "frontend/Token.hpp"

namespace roadman::frontend
{

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Eof:
            return "eof";
        case TokenKind::NumberLiteral:
            return "number";
        case TokenKind::StringLiteral:
            return "string";
        case TokenKind::Identifier:
            return "identifier";

        // Keywords
        case TokenKind::KwInnit:
            return "innit";
        case TokenKind::KwElseway:
            return "elseway";
        case TokenKind::KwLoopz:
            return "loopz";
        case TokenKind::KwStopit:
            return "stopit";
        case TokenKind::KwReturnz:
            return "returnz";
        case TokenKind::KwSwitchup:
            return "switchup";
        case TokenKind::KwCasez:
            return "casez";
        case TokenKind::KwDefend:
            return "defend";
        case TokenKind::KwConste:
            return "conste";
        case TokenKind::KwGimme:
            return "gimme";
        case TokenKind::KwFam:
            return "fam";
        case TokenKind::KwTrue:
            return "true";
        case TokenKind::KwFalse:
            return "false";
        case TokenKind::KwDigit:
            return "digit";
        case TokenKind::KwWord:
            return "word";
        case TokenKind::KwBoola:
            return "boola";
        case TokenKind::KwListz:
            return "listz";
        case TokenKind::KwMapz:
            return "mapz";

        // Operators
        case TokenKind::Plus:
            return "+";
        case TokenKind::Minus:
            return "-";
        case TokenKind::Star:
            return "*";
        case TokenKind::Slash:
            return "/";
        case TokenKind::Percent:
            return "%";
        case TokenKind::Bang:
            return "!";
        case TokenKind::BangEqual:
            return "!=";
        case TokenKind::Equal:
            return "=";
        case TokenKind::EqualEqual:
            return "==";
        case TokenKind::Less:
            return "<";
        case TokenKind::LessEqual:
            return "<=";
        case TokenKind::Greater:
            return ">";
        case TokenKind::GreaterEqual:
            return ">=";
        case TokenKind::AmpAmp:
            return "&&";
        case TokenKind::PipePipe:
            return "||";

        // Punctuation
        case TokenKind::Comma:
            return ",";
        case TokenKind::Dot:
            return ".";
        case TokenKind::Semicolon:
            return ";";
        case TokenKind::Colon:
            return ":";
        case TokenKind::LParen:
            return "(";
        case TokenKind::RParen:
            return ")";
        case TokenKind::LBracket:
            return "[";
        case TokenKind::RBracket:
            return "]";
        case TokenKind::LBrace:
            return "{";
        case TokenKind::RBrace:
            return "}";
    }
    return "?";
}

bool Token::isKeyword() const
{
    return kind >= TokenKind::KwInnit && kind <= TokenKind::KwMapz;
}

} // namespace roadman::frontend
