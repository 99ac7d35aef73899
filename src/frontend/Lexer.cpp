//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.cpp
/// @brief Implementation of the Roadman lexical analyzer.
///
/// @details Keywords are stored in a sorted array (kKeywordTable) for binary
/// search lookup. Two-character operators are matched greedily before their
/// single-character prefix. Numbers are decimal only: digits with an optional
/// fraction that must itself start with a digit, so `1.` lexes as `1` `.`.
///
/// @see Lexer.hpp for the class interface
///
//===----------------------------------------------------------------------===//

#include "frontend/Lexer.hpp"
#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <cstdio>

namespace roadman::frontend
{

//===----------------------------------------------------------------------===//
// Keyword lookup table
//===----------------------------------------------------------------------===//

namespace
{

struct KeywordEntry
{
    std::string_view key;
    TokenKind kind;
};

// Sorted for binary search (18 keywords)
constexpr std::array<KeywordEntry, 18> kKeywordTable = {{
    {"boola", TokenKind::KwBoola},
    {"casez", TokenKind::KwCasez},
    {"conste", TokenKind::KwConste},
    {"defend", TokenKind::KwDefend},
    {"digit", TokenKind::KwDigit},
    {"elseway", TokenKind::KwElseway},
    {"false", TokenKind::KwFalse},
    {"fam", TokenKind::KwFam},
    {"gimme", TokenKind::KwGimme},
    {"innit", TokenKind::KwInnit},
    {"listz", TokenKind::KwListz},
    {"loopz", TokenKind::KwLoopz},
    {"mapz", TokenKind::KwMapz},
    {"returnz", TokenKind::KwReturnz},
    {"stopit", TokenKind::KwStopit},
    {"switchup", TokenKind::KwSwitchup},
    {"true", TokenKind::KwTrue},
    {"word", TokenKind::KwWord},
}};

inline bool isDigit(char c)
{
    return c >= '0' && c <= '9';
}

inline bool isLetter(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

/// @brief Continuation bytes expected after a UTF-8 lead byte; 0 when invalid.
size_t utf8TrailingBytes(unsigned char lead)
{
    if (lead >= 0xC2 && lead <= 0xDF)
        return 1;
    if (lead >= 0xE0 && lead <= 0xEF)
        return 2;
    if (lead >= 0xF0 && lead <= 0xF4)
        return 3;
    return 0;
}

/// @brief Check if character can start an identifier (letter or underscore).
inline bool isIdentifierStart(char c)
{
    return isLetter(c) || c == '_';
}

/// @brief Check if character can continue an identifier.
inline bool isIdentifierContinue(char c)
{
    return isLetter(c) || isDigit(c) || c == '_';
}

} // anonymous namespace

std::optional<TokenKind> Lexer::lookupKeyword(std::string_view name)
{
    auto it = std::lower_bound(kKeywordTable.begin(),
                               kKeywordTable.end(),
                               name,
                               [](const KeywordEntry &entry, std::string_view key)
                               { return entry.key < key; });
    if (it != kKeywordTable.end() && it->key == name)
        return it->kind;
    return std::nullopt;
}

//===----------------------------------------------------------------------===//
// Lexer implementation
//===----------------------------------------------------------------------===//

Lexer::Lexer(std::string source, uint32_t fileId, roadman::support::DiagnosticEngine &diag)
    : source_(std::move(source)), fileId_(fileId), diag_(diag)
{
}

char Lexer::peekChar() const
{
    if (pos_ >= source_.size())
        return '\0';
    return source_[pos_];
}

char Lexer::peekChar(size_t offset) const
{
    if (pos_ + offset >= source_.size())
        return '\0';
    return source_[pos_ + offset];
}

char Lexer::getChar()
{
    if (pos_ >= source_.size())
        return '\0';
    char c = source_[pos_++];
    if (c == '\n')
    {
        ++line_;
        column_ = 1;
    }
    else
    {
        ++column_;
    }
    return c;
}

bool Lexer::eof() const
{
    return pos_ >= source_.size();
}

SourceLoc Lexer::currentLoc() const
{
    return SourceLoc{fileId_, line_, column_};
}

void Lexer::reportError(SourceLoc loc, const std::string &message)
{
    diag_.report(roadman::support::Diagnostic{
        roadman::support::Severity::Error, message, loc, roadman::support::kLexErrorCode});
}

void Lexer::skipLineComment()
{
    // Skip the //
    getChar();
    getChar();
    while (!eof() && peekChar() != '\n')
        getChar();
}

void Lexer::skipBlockComment()
{
    SourceLoc startLoc = currentLoc();

    // Skip /*
    getChar();
    getChar();

    while (!eof())
    {
        if (peekChar() == '*' && peekChar(1) == '/')
        {
            getChar();
            getChar();
            return;
        }
        getChar();
    }
    reportError(startLoc, "Unterminated block comment.");
}

void Lexer::skipWhitespaceAndComments()
{
    while (!eof())
    {
        char c = peekChar();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
        {
            getChar();
        }
        else if (c == '/' && peekChar(1) == '/')
        {
            skipLineComment();
        }
        else if (c == '/' && peekChar(1) == '*')
        {
            skipBlockComment();
        }
        else
        {
            return;
        }
    }
}

Token Lexer::makeToken(TokenKind kind, SourceLoc loc, size_t start) const
{
    Token tok;
    tok.kind = kind;
    tok.loc = loc;
    tok.text = source_.substr(start, pos_ - start);
    return tok;
}

Token Lexer::lexNumber()
{
    SourceLoc loc = currentLoc();
    size_t start = pos_;

    while (isDigit(peekChar()))
        getChar();

    if (peekChar() == '.' && isDigit(peekChar(1)))
    {
        getChar(); // consume '.'
        while (isDigit(peekChar()))
            getChar();
    }

    Token tok = makeToken(TokenKind::NumberLiteral, loc, start);
    // Digit runs always parse; from_chars rounds overly long literals correctly.
    std::from_chars(tok.text.data(), tok.text.data() + tok.text.size(), tok.numberValue);
    return tok;
}

Token Lexer::lexIdentifierOrKeyword()
{
    SourceLoc loc = currentLoc();
    size_t start = pos_;

    while (isIdentifierContinue(peekChar()))
        getChar();

    Token tok = makeToken(TokenKind::Identifier, loc, start);
    if (auto kw = lookupKeyword(tok.text))
        tok.kind = *kw;
    return tok;
}

std::optional<Token> Lexer::lexString()
{
    SourceLoc loc = currentLoc();
    size_t start = pos_;

    getChar(); // opening quote
    while (!eof() && peekChar() != '"')
        getChar();

    if (eof())
    {
        reportError(loc, "Unterminated string.");
        return std::nullopt;
    }

    getChar(); // closing quote
    Token tok = makeToken(TokenKind::StringLiteral, loc, start);
    tok.stringValue = tok.text.substr(1, tok.text.size() - 2);
    return tok;
}

std::optional<Token> Lexer::lexPunctuation()
{
    SourceLoc loc = currentLoc();
    size_t start = pos_;
    char c = getChar();

    auto two = [&](char second, TokenKind pair, TokenKind single) -> TokenKind
    {
        if (peekChar() == second)
        {
            getChar();
            return pair;
        }
        return single;
    };

    TokenKind kind;
    switch (c)
    {
        case '(':
            kind = TokenKind::LParen;
            break;
        case ')':
            kind = TokenKind::RParen;
            break;
        case '{':
            kind = TokenKind::LBrace;
            break;
        case '}':
            kind = TokenKind::RBrace;
            break;
        case '[':
            kind = TokenKind::LBracket;
            break;
        case ']':
            kind = TokenKind::RBracket;
            break;
        case ',':
            kind = TokenKind::Comma;
            break;
        case '.':
            kind = TokenKind::Dot;
            break;
        case ';':
            kind = TokenKind::Semicolon;
            break;
        case ':':
            kind = TokenKind::Colon;
            break;
        case '+':
            kind = TokenKind::Plus;
            break;
        case '-':
            kind = TokenKind::Minus;
            break;
        case '*':
            kind = TokenKind::Star;
            break;
        case '/':
            kind = TokenKind::Slash;
            break;
        case '%':
            kind = TokenKind::Percent;
            break;
        case '!':
            kind = two('=', TokenKind::BangEqual, TokenKind::Bang);
            break;
        case '=':
            kind = two('=', TokenKind::EqualEqual, TokenKind::Equal);
            break;
        case '<':
            kind = two('=', TokenKind::LessEqual, TokenKind::Less);
            break;
        case '>':
            kind = two('=', TokenKind::GreaterEqual, TokenKind::Greater);
            break;
        case '&':
            if (peekChar() != '&')
            {
                reportError(loc, "Unexpected character '&'.");
                return std::nullopt;
            }
            getChar();
            kind = TokenKind::AmpAmp;
            break;
        case '|':
            if (peekChar() != '|')
            {
                reportError(loc, "Unexpected character '|'.");
                return std::nullopt;
            }
            getChar();
            kind = TokenKind::PipePipe;
            break;
        default:
            if (static_cast<unsigned char>(c) >= 0x80)
            {
                reportError(loc, lexNonAscii(static_cast<unsigned char>(c)));
                return std::nullopt;
            }
            reportError(loc, std::string("Unexpected character '") + c + "'.");
            return std::nullopt;
    }
    return makeToken(kind, loc, start);
}

std::string Lexer::lexNonAscii(unsigned char lead)
{
    // Swallow the whole sequence so one stray code point yields one diagnostic.
    const size_t trailing = utf8TrailingBytes(lead);
    uint32_t codePoint = lead & (0x7Fu >> (trailing + 1));
    size_t seen = 0;
    while (!eof() && (static_cast<unsigned char>(peekChar()) & 0xC0) == 0x80 &&
           (trailing == 0 || seen < trailing))
    {
        codePoint = (codePoint << 6) | (static_cast<unsigned char>(getChar()) & 0x3F);
        ++seen;
    }

    char buf[48];
    if (trailing > 0 && seen == trailing)
        std::snprintf(
            buf, sizeof(buf), "Unexpected character U+%04X.", static_cast<unsigned>(codePoint));
    else
        std::snprintf(buf, sizeof(buf), "Unexpected byte 0x%02X.", static_cast<unsigned>(lead));
    return buf;
}

Token Lexer::next()
{
    while (true)
    {
        skipWhitespaceAndComments();

        if (eof())
        {
            Token tok;
            tok.kind = TokenKind::Eof;
            tok.loc = currentLoc();
            return tok;
        }

        char c = peekChar();
        if (isDigit(c))
            return lexNumber();
        if (isIdentifierStart(c))
            return lexIdentifierOrKeyword();
        if (c == '"')
        {
            if (auto tok = lexString())
                return std::move(*tok);
            continue;
        }
        if (auto tok = lexPunctuation())
            return std::move(*tok);
    }
}

std::vector<Token> Lexer::tokenize()
{
    std::vector<Token> tokens;
    while (true)
    {
        tokens.push_back(next());
        if (tokens.back().is(TokenKind::Eof))
            break;
    }
    return tokens;
}

std::vector<Token> tokenize(std::string source,
                            uint32_t fileId,
                            roadman::support::DiagnosticEngine &diag)
{
    Lexer lexer(std::move(source), fileId, diag);
    return lexer.tokenize();
}

} // namespace roadman::frontend
