//===----------------------------------------------------------------------===//
//
// Part of the Roadman project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser.hpp
/// @brief Recursive descent parser for Roadman source code.
///
/// ## Grammar
///
/// ```
/// program     ::= declaration* EOF
/// declaration ::= "conste" varRest | "gimme" varRest | "fam" function | statement
/// varRest     ::= IDENT ("=" expression)? ";"
/// function    ::= IDENT "(" (IDENT ("," IDENT)*)? ")" block
/// statement   ::= "innit" "(" expression ")" statement ("elseway" statement)?
///               | "loopz" "(" expression ")" statement
///               | "returnz" expression? ";"
///               | "stopit" ";"
///               | block
///               | expression ";"
/// block       ::= "{" declaration* "}"
/// ```
///
/// ## Operator Precedence (lowest to highest)
///
/// 1. Assignment: `=` (right-associative, target must be a bare name)
/// 2. Logical OR: `||`
/// 3. Logical AND: `&&`
/// 4. Equality: `==`, `!=`
/// 5. Comparison: `<`, `<=`, `>`, `>=`
/// 6. Additive: `+`, `-`
/// 7. Multiplicative: `*`, `/`, `%`
/// 8. Unary: `!`, `-`
/// 9. Call chain: `f(...)(...)`
/// 10. Primary: literals, names, `( expr )`, `[ list ]`
///
/// ## Error Handling
///
/// Syntax errors are reported to the DiagnosticEngine with code R2000 and the
/// message `at '<token>': <what>` (or `at end: <what>` at end of input). Parse
/// methods return nullptr after reporting. By default the first error ends
/// the unit; with ParserOptions::recover the parser resynchronizes at the next
/// statement boundary and keeps reporting.
///
/// @see Lexer.hpp - Token source
/// @see AST.hpp - AST node definitions
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/AST.hpp"
#include "frontend/Token.hpp"
#include "support/diagnostics.hpp"
#include <memory>
#include <string>
#include <vector>

namespace roadman::frontend
{

/// @brief Parser configuration.
struct ParserOptions
{
    /// @brief Continue after a syntax error to report every error in the unit.
    bool recover = false;
};

class Parser
{
  public:
    /// @brief Create a parser over a token sequence produced by the Lexer.
    /// @param tokens Token sequence; must end with an Eof token.
    /// @param diag Diagnostic engine for error reporting; must outlive the parser.
    /// @param options Parser configuration.
    Parser(std::vector<Token> tokens,
           roadman::support::DiagnosticEngine &diag,
           ParserOptions options = {});

    /// @brief Parse the complete unit.
    /// @return The Program, or nullptr if any syntax error was reported.
    std::unique_ptr<Program> parseProgram();

    /// @brief Check if any errors occurred during parsing.
    bool hasError() const
    {
        return hasError_;
    }

  private:
    //=========================================================================
    /// @name Token Handling
    /// @{
    //=========================================================================

    const Token &peek() const;
    const Token &previous() const;
    bool isAtEnd() const;

    /// @brief Consume the current token; never moves past Eof.
    const Token &advance();

    bool check(TokenKind kind) const;

    /// @brief Consume the current token if it matches @p kind.
    bool match(TokenKind kind);

    /// @brief Require a token of @p kind, reporting @p message otherwise.
    /// @param out Optional pointer receiving the consumed token.
    /// @return True when the token was found and consumed.
    bool expect(TokenKind kind, const char *message, Token *out = nullptr);

    /// @brief Skip to the next statement boundary after an error.
    ///
    /// @details Always consumes at least one token, then stops right after a
    /// `;` or before `fam`, `innit`, `loopz`, `returnz`, `gimme` or `conste`.
    void synchronize();

    /// @}
    //=========================================================================
    /// @name Error Handling
    /// @{
    //=========================================================================

    /// @brief Report a syntax error at the current token.
    void error(const std::string &message);

    /// @brief Report a syntax error located at @p tok.
    void errorAt(const Token &tok, const std::string &message);

    /// @}
    //=========================================================================
    /// @name Statement Parsing
    /// @{
    //=========================================================================

    StmtPtr parseDeclaration();
    StmtPtr parseVarDecl(const Token &keyword, bool isConst);
    StmtPtr parseFunctionDecl(const Token &keyword);
    StmtPtr parseStatement();
    StmtPtr parseIfStmt(const Token &keyword);
    StmtPtr parseWhileStmt(const Token &keyword);
    StmtPtr parseReturnStmt(const Token &keyword);
    StmtPtr parseBreakStmt(const Token &keyword);
    StmtPtr parseExprStmt();

    /// @brief Parse the statements of a block whose `{` was already consumed.
    std::unique_ptr<BlockStmt> parseBlock(const Token &lbrace);

    /// @}
    //=========================================================================
    /// @name Expression Parsing
    /// @brief One method per precedence level.
    /// @{
    //=========================================================================

    ExprPtr parseExpression();
    ExprPtr parseAssignment();
    ExprPtr parseOr();
    ExprPtr parseAnd();
    ExprPtr parseEquality();
    ExprPtr parseComparison();
    ExprPtr parseAdditive();
    ExprPtr parseMultiplicative();
    ExprPtr parseUnary();
    ExprPtr parseCall();
    ExprPtr finishCall(ExprPtr callee);
    ExprPtr parsePrimary();
    ExprPtr parseListLiteral(const Token &lbracket);

    /// @brief Parse a comma-separated expression list up to (not including) @p close.
    /// @return False when an element failed to parse.
    bool parseExprList(TokenKind close, std::vector<ExprPtr> &out);

    /// @}

    std::vector<Token> tokens_;
    roadman::support::DiagnosticEngine &diag_;
    ParserOptions options_;
    size_t pos_ = 0;
    bool hasError_ = false;
};

/// @brief Convenience wrapper: parse @p tokens into a Program.
/// @return The Program, or nullptr if any syntax error was reported.
std::unique_ptr<Program> parse(std::vector<Token> tokens,
                               roadman::support::DiagnosticEngine &diag,
                               ParserOptions options = {});

} // namespace roadman::frontend
