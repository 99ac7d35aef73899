//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Token.hpp
/// @brief Token kinds and token structure for the Roadman lexer.
///
/// Tokens are organized into logical groups:
///
/// 1. **Special Tokens**: End-of-file marker
/// 2. **Literals**: Numbers, strings, and identifiers
/// 3. **Keywords**: Reserved words organized by purpose:
///    - Control flow (innit, elseway, loopz, stopit, returnz)
///    - Declarations (gimme, conste, fam)
///    - Literal keywords (true, false)
///    - Reserved words with no grammar yet (switchup, casez, defend)
///    - Type names (digit, word, boola, listz, mapz), reserved but never checked
/// 4. **Operators**: Arithmetic, comparison, logical and assignment
/// 5. **Punctuation and brackets**
///
/// Tokens are value types that own their string data. They are produced once
/// by the Lexer and never modified afterwards.
///
/// @invariant Each token has a valid TokenKind and SourceLoc.
/// @invariant NumberLiteral tokens have numberValue populated; StringLiteral
///            tokens have stringValue populated.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"
#include <string>

namespace roadman::frontend
{

using SourceLoc = roadman::support::SourceLoc;

//=============================================================================
/// @brief Enumeration of all token kinds recognized by the Roadman lexer.
///
/// @note Keyword enumerators are contiguous (KwInnit..KwMapz) so
///       Token::isKeyword() can use a range check.
//=============================================================================
enum class TokenKind
{
    /// @name Special Tokens
    /// @{

    /// @brief End of input. Exactly one terminates every token sequence.
    Eof,

    /// @}

    /// @name Literal Tokens
    /// @{

    /// @brief Decimal number: digits with an optional `.digits` fraction.
    NumberLiteral,

    /// @brief Double-quoted string. No escape sequences are processed.
    StringLiteral,

    /// @brief Letter or underscore followed by letters, digits, underscores.
    Identifier,

    /// @}

    /// @name Control Flow Keywords
    /// @{

    /// @brief Conditional: `innit (cond) stmt [elseway stmt]`.
    KwInnit,

    /// @brief Else branch of `innit`.
    KwElseway,

    /// @brief Loop: `loopz (cond) stmt`.
    KwLoopz,

    /// @brief Loop exit: `stopit;`.
    KwStopit,

    /// @brief Function return: `returnz [expr];`.
    KwReturnz,

    /// @brief Reserved for a future switch statement.
    KwSwitchup,

    /// @brief Reserved for a future switch case label.
    KwCasez,

    /// @brief Reserved for a future guard statement.
    KwDefend,

    /// @}

    /// @name Declaration Keywords
    /// @{

    /// @brief Constant declaration: `conste name = expr;`.
    KwConste,

    /// @brief Mutable declaration: `gimme name [= expr];`.
    KwGimme,

    /// @brief Function declaration: `fam name(params) { ... }`.
    KwFam,

    /// @}

    /// @name Literal Keywords
    /// @{
    KwTrue,
    KwFalse,
    /// @}

    /// @name Type-Name Keywords
    /// @brief Reserved spellings; the language performs no type checking.
    /// @{
    KwDigit,
    KwWord,
    KwBoola,
    KwListz,
    KwMapz,
    /// @}

    /// @name Operators
    /// @{
    Plus,         ///< `+`
    Minus,        ///< `-`
    Star,         ///< `*`
    Slash,        ///< `/`
    Percent,      ///< `%`
    Bang,         ///< `!`
    BangEqual,    ///< `!=`
    Equal,        ///< `=`
    EqualEqual,   ///< `==`
    Less,         ///< `<`
    LessEqual,    ///< `<=`
    Greater,      ///< `>`
    GreaterEqual, ///< `>=`
    AmpAmp,       ///< `&&`
    PipePipe,     ///< `||`
    /// @}

    /// @name Punctuation
    /// @{
    Comma,     ///< `,`
    Dot,       ///< `.`
    Semicolon, ///< `;`
    Colon,     ///< `:`
    LParen,    ///< `(`
    RParen,    ///< `)`
    LBracket,  ///< `[`
    RBracket,  ///< `]`
    LBrace,    ///< `{`
    RBrace,    ///< `}`
    /// @}
};

/// @brief Convert a TokenKind to a short human-readable name.
/// @return "eof", "number", "identifier", the keyword spelling, or the
///         operator spelling.
const char *tokenKindToString(TokenKind kind);

//=============================================================================
/// @brief Token structure holding lexical information from the source.
///
/// Only one of the literal value fields is meaningful for any given token:
/// - `numberValue` for NumberLiteral tokens
/// - `stringValue` for StringLiteral tokens
//=============================================================================
struct Token
{
    /// @brief The kind of token this represents.
    TokenKind kind = TokenKind::Eof;

    /// @brief Location of the first character of the token.
    SourceLoc loc{};

    /// @brief Original source text of the token; empty for Eof.
    /// @details String literals keep their surrounding quotes here.
    std::string text;

    /// @brief Parsed value for NumberLiteral tokens.
    double numberValue = 0.0;

    /// @brief String literal content without the surrounding quotes.
    std::string stringValue;

    bool is(TokenKind k) const
    {
        return kind == k;
    }

    template <typename... Kinds> bool isOneOf(Kinds... kinds) const
    {
        return (is(kinds) || ...);
    }

    /// @brief Check if this token is any reserved word.
    bool isKeyword() const;
};

} // namespace roadman::frontend
