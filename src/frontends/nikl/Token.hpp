//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Token.hpp
/// @brief Token kinds and token structure for the Nikl lexer.
///
/// Tokens are organized into logical groups:
///
/// 1. **Special Tokens**: End-of-file marker
/// 2. **Literals**: Integer, float, string and boolean constants, identifiers
/// 3. **Keywords**: Declaration, control-flow and logical keywords. `pub`,
///    `spawn` and `wait` are reserved and rejected by the parser.
/// 4. **Type Names**: `Int`, `Float`, `String`, `Bool`, `Array`, `Tuple`,
///    `HashMap`; only meaningful inside type annotations
/// 5. **Operators**: Arithmetic, comparison and assignment operators
/// 6. **Punctuation**: Brackets, comma, colon, dot
///
/// Tokens are value types that own their string data. The lexer produces the
/// whole stream up front and hands it to the parser.
///
/// @invariant Each token has a valid TokenKind and SourceLoc.
/// @invariant Literal tokens have their corresponding value fields populated.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <string>

namespace nikl::frontends
{

/// @brief Enumeration of all token types in the Nikl language.
enum class TokenKind
{
    Eof,

    //=========================================================================
    // Literals
    //=========================================================================

    IntegerLiteral, ///< `42`
    FloatLiteral,   ///< `3.14`
    StringLiteral,  ///< `"text"`, no escape sequences
    BooleanLiteral, ///< `True` / `False`
    Identifier,

    //=========================================================================
    // Keywords
    //=========================================================================

    KwImport,
    KwPub,
    KwAs,
    KwLet,
    KwConst,
    KwFn,
    KwSpawn,
    KwWait,
    KwReturn,
    KwDel,
    KwIn,
    KwIf,
    KwElif,
    KwElse,
    KwFor,
    KwWhile,
    KwLoop,
    KwBreak,
    KwContinue,
    KwAnd,
    KwOr,
    KwNot,

    //=========================================================================
    // Type names
    //=========================================================================

    TyInt,
    TyFloat,
    TyString,
    TyBool,
    TyArray,
    TyTuple,
    TyHashMap,

    //=========================================================================
    // Operators
    //=========================================================================

    Plus,         ///< `+`
    Minus,        ///< `-`
    Star,         ///< `*`
    Slash,        ///< `/`
    Equal,        ///< `=`
    EqualEqual,   ///< `==`
    NotEqual,     ///< `!=`
    Less,         ///< `<`
    LessEqual,    ///< `<=`
    Greater,      ///< `>`
    GreaterEqual, ///< `>=`
    Arrow,        ///< `->`

    //=========================================================================
    // Punctuation
    //=========================================================================

    LParen,
    RParen,
    LBrace,
    RBrace,
    LBracket,
    RBracket,
    Comma,
    Colon,
    Dot,
};

/// @brief Printable name of a token kind, e.g. "identifier" or "')'".
const char *tokenKindToString(TokenKind kind);

/// @brief A single lexical unit.
struct Token
{
    TokenKind kind = TokenKind::Eof;

    /// @brief Location of the first character of the token.
    support::SourceLoc loc{};

    /// @brief Exact source text of the token, quotes included for strings.
    std::string text;

    /// @brief Parsed value; valid only when kind == IntegerLiteral.
    int64_t intValue = 0;

    /// @brief Parsed value; valid only when kind == FloatLiteral.
    double floatValue = 0.0;

    /// @brief Parsed value; valid only when kind == BooleanLiteral.
    bool boolValue = false;

    /// @brief String contents without quotes; valid only when kind == StringLiteral.
    std::string stringValue;

    bool is(TokenKind k) const
    {
        return kind == k;
    }

    /// @brief Check if this token is one of several kinds.
    template <typename... Kinds> bool isOneOf(Kinds... kinds) const
    {
        return (is(kinds) || ...);
    }

    /// @brief True for keyword tokens, reserved ones included.
    bool isKeyword() const;

    /// @brief True for the type-name tokens usable in annotations.
    bool isTypeName() const;
};

/// @brief Describe @p tok for "found X" parser messages.
std::string describeToken(const Token &tok);

} // namespace nikl::frontends
