//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.hpp
/// @brief Lexical analyzer for Roadman source text.
///
/// The lexer converts source text into tokens on demand. Whitespace, `//` line
/// comments and `/* ... */` block comments are discarded; line and column
/// numbers are tracked through every skipped character, including newlines
/// inside block comments and string literals.
///
/// ## Error Handling
///
/// The lexer never aborts. It reports errors for:
/// - Unexpected characters
/// - Unterminated strings
/// - Unterminated block comments
///
/// Each error is recorded as a structured diagnostic in the DiagnosticEngine
/// supplied by the caller, and scanning resumes with the next character. No
/// token is produced for the offending input.
///
/// ## Usage Example
///
/// ```cpp
/// DiagnosticEngine diag;
/// Lexer lexer(sourceCode, fileId, diag);
/// std::vector<Token> tokens = lexer.tokenize();
/// if (diag.errorCount() > 0)
///     diag.printAll(std::cerr, &sm);
/// ```
///
/// @invariant Case-sensitive keyword matching.
/// @invariant tokenize() output ends with exactly one Eof token.
///
/// @see Token.hpp - Token types and TokenKind enum
/// @see Parser.hpp - Consumes tokens to build the AST
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/Token.hpp"
#include "support/diagnostics.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace roadman::frontend
{

/// @invariant pos_ <= source_.size()
class Lexer
{
  public:
    /// @brief Create a lexer for the given source code.
    /// @param source Source code text to tokenize.
    /// @param fileId File identifier embedded in every token location.
    /// @param diag Diagnostic engine for lexical errors; must outlive the lexer.
    Lexer(std::string source, uint32_t fileId, roadman::support::DiagnosticEngine &diag);

    /// @brief Scan and return the next token; returns Eof repeatedly at end.
    Token next();

    /// @brief Scan the remaining input into a sequence terminated by Eof.
    std::vector<Token> tokenize();

    /// @brief Map an exact spelling to its reserved token kind.
    static std::optional<TokenKind> lookupKeyword(std::string_view name);

  private:
    char peekChar() const;
    char peekChar(size_t offset) const;
    char getChar();
    bool eof() const;
    SourceLoc currentLoc() const;

    void reportError(SourceLoc loc, const std::string &message);

    void skipLineComment();
    void skipBlockComment();
    void skipWhitespaceAndComments();

    Token makeToken(TokenKind kind, SourceLoc loc, size_t start) const;
    Token lexNumber();
    Token lexIdentifierOrKeyword();
    std::optional<Token> lexString();
    std::optional<Token> lexPunctuation();

    /// @brief Consume the rest of a non-ASCII sequence and describe it.
    std::string lexNonAscii(unsigned char lead);

    std::string source_;
    uint32_t fileId_;
    roadman::support::DiagnosticEngine &diag_;
    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t column_ = 1;
};

/// @brief Convenience wrapper: scan @p source completely.
/// @return Token sequence ending in exactly one Eof token.
std::vector<Token> tokenize(std::string source,
                            uint32_t fileId,
                            roadman::support::DiagnosticEngine &diag);

} // namespace roadman::frontend
