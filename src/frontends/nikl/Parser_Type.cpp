//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Type.cpp
/// @brief Type annotation validation for the Nikl parser.
///
/// @details Annotations are hints only. They are checked against the
/// accepted shapes and then discarded:
///
/// - `Int`, `Float`, `String`, `Bool`, `Array`, `Tuple`, `HashMap`
/// - any identifier (`int`, `str`, `Point`)
/// - either of the above followed by `[T, ...]` (`Array[Int]`)
/// - `[T]`
/// - `(T, ...)`, including `()`
///
//===----------------------------------------------------------------------===//

#include "frontends/nikl/Parser.hpp"

namespace nikl::frontends
{

bool Parser::parseTypeAnnotation()
{
    if (++typeDepth_ > kMaxTypeDepth)
    {
        --typeDepth_;
        error("type annotation nesting too deep (limit: " + std::to_string(kMaxTypeDepth) + ")",
              "N2005");
        return false;
    }

    const bool ok = parseTypeShape();
    --typeDepth_;
    return ok;
}

bool Parser::parseTypeShape()
{
    if (peek().isTypeName() || check(TokenKind::Identifier))
    {
        advance();
        if (match(TokenKind::LBracket))
            return parseTypeList(TokenKind::RBracket);
        return true;
    }

    if (match(TokenKind::LBracket))
    {
        if (!parseTypeAnnotation())
            return false;
        return expect(TokenKind::RBracket, "']'");
    }

    if (match(TokenKind::LParen))
        return parseTypeList(TokenKind::RParen);

    const Token &tok = peek();
    error("Expected type annotation, found " + describeToken(tok) + " at line " +
              std::to_string(tok.loc.line) + ", column " + std::to_string(tok.loc.column),
          "N2004");
    return false;
}

/// @brief Parse a comma-separated annotation list and its closing token.
bool Parser::parseTypeList(TokenKind close)
{
    while (!check(close))
    {
        if (!parseTypeAnnotation())
            return false;
        if (!match(TokenKind::Comma))
            break;
    }
    return expect(close, close == TokenKind::RParen ? "')'" : "']'");
}

} // namespace nikl::frontends
