//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser.hpp
/// @brief Recursive descent parser for the Nikl language.
///
/// @details The parser consumes the complete token stream produced by the
/// Lexer and builds the statement list of a program. Statements are selected
/// by their leading keyword; anything else is parsed as an expression
/// statement.
///
/// ## Expression Precedence (lowest to highest)
///
/// 1. Assignment: `=` (right-associative, identifier targets only)
/// 2. Logical OR: `or`
/// 3. Logical AND: `and`
/// 4. Equality: `==`, `!=`
/// 5. Comparison: `<`, `<=`, `>`, `>=`
/// 6. Additive: `+`, `-`
/// 7. Multiplicative: `*`, `/`
/// 8. Unary: `-`, `not`
/// 9. Postfix: calls `f(x)` and property access `m.name`, chained
///    left-to-right
/// 10. Primary: literals, identifiers, parenthesized expressions and tuples,
///     array and hash-map literals
///
/// ## Error Handling
///
/// The first syntax error wins. Parse functions return nullptr once an error
/// has been recorded and parse() reports that single diagnostic; there is no
/// recovery and no partial tree is returned.
///
/// Diagnostic codes:
/// - N2001: expected/found mismatch
/// - N2002: invalid assignment target
/// - N2003: reserved keyword
/// - N2004: malformed type annotation
/// - N2005: nesting too deep
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/nikl/AST.hpp"
#include "frontends/nikl/Token.hpp"
#include "support/diag_expected.hpp"

#include <optional>
#include <string>
#include <vector>

namespace nikl::frontends
{

/// @brief Maximum nesting of unary/parenthesized expressions.
inline constexpr int kMaxExprDepth = 256;

/// @brief Maximum nesting of brace-delimited blocks.
inline constexpr int kMaxBlockDepth = 256;

/// @brief Maximum nesting of bracketed type annotations.
inline constexpr int kMaxTypeDepth = 256;

class Parser
{
  public:
    /// @brief Create a parser over @p tokens.
    /// @details An Eof token is appended when the stream lacks one.
    explicit Parser(std::vector<Token> tokens);

    /// @brief Parse the whole token stream.
    /// @return Top-level statements, or the first syntax error.
    support::Expected<StmtList> parse();

    bool hasError() const
    {
        return error_.has_value();
    }

  private:
    //=========================================================================
    // Token Handling
    //=========================================================================

    /// @brief Look ahead without consuming; clamps to the trailing Eof.
    const Token &peek(size_t offset = 0) const;

    Token advance();
    bool check(TokenKind kind, size_t offset = 0) const;
    bool match(TokenKind kind, Token *out = nullptr);

    /// @brief Consume a @p kind token or record "Expected <what>, found ...".
    bool expect(TokenKind kind, const char *what, Token *out = nullptr);

    //=========================================================================
    // Error Handling
    //=========================================================================

    void error(const std::string &message, const char *code = "N2001");
    void errorAt(SourceLoc loc, const std::string &message, const char *code = "N2001");

    /// @brief Record "Expected <what>, found <current token>".
    void errorExpected(const std::string &what);

    //=========================================================================
    // Statements
    //=========================================================================

    StmtPtr parseStatement();
    bool parseBlock(StmtList &out);
    StmtPtr parseLetStmt();
    StmtPtr parseFnStmt();
    StmtPtr parseIfStmt();
    StmtPtr parseWhileStmt();
    StmtPtr parseForStmt();
    StmtPtr parseLoopStmt();
    StmtPtr parseReturnStmt();
    StmtPtr parseDelStmt();
    StmtPtr parseImportStmt();
    StmtPtr parseExprStmt();
    bool parseParameters(std::vector<std::string> &out);

    //=========================================================================
    // Expressions
    //=========================================================================

    ExprPtr parseExpression();
    ExprPtr parseAssignment();
    ExprPtr parseLogicalOr();
    ExprPtr parseLogicalAnd();
    ExprPtr parseEquality();
    ExprPtr parseComparison();
    ExprPtr parseAdditive();
    ExprPtr parseMultiplicative();
    ExprPtr parseUnary();
    ExprPtr parsePostfix();
    ExprPtr parsePrimary();
    ExprPtr parseParenOrTuple();
    ExprPtr parseArrayLiteral();
    ExprPtr parseMapLiteral();

    /// @brief Parse `expr (',' expr)* ','?` up to (not including) @p close.
    bool parseExprList(TokenKind close, std::vector<ExprPtr> &out);

    //=========================================================================
    // Type Annotations
    //=========================================================================

    /// @brief Validate and skip one type annotation.
    bool parseTypeAnnotation();
    bool parseTypeShape();
    bool parseTypeList(TokenKind close);

    std::vector<Token> tokens_;
    size_t pos_{0};
    std::optional<support::Diag> error_;
    int exprDepth_{0};
    int blockDepth_{0};
    int typeDepth_{0};
};

/// @brief Convenience wrapper: `Parser(std::move(tokens)).parse()`.
support::Expected<StmtList> parse(std::vector<Token> tokens);

} // namespace nikl::frontends
