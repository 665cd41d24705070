//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Tokens.cpp
/// @brief Token cursor, error recording and the top-level parse loop.
///
//===----------------------------------------------------------------------===//

#include "frontends/nikl/Parser.hpp"

#include "support/debug_trace.hpp"

namespace nikl::frontends
{

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens))
{
    if (tokens_.empty() || !tokens_.back().is(TokenKind::Eof))
    {
        Token eofTok;
        eofTok.kind = TokenKind::Eof;
        if (!tokens_.empty())
            eofTok.loc = tokens_.back().loc;
        tokens_.push_back(std::move(eofTok));
    }
}

support::Expected<StmtList> Parser::parse()
{
    StmtList program;
    while (!check(TokenKind::Eof))
    {
        StmtPtr stmt = parseStatement();
        if (!stmt)
            break;
        program.push_back(std::move(stmt));
    }

    if (error_)
        return *error_;

    if (support::isDebugTraceEnabled())
        support::debugTrace("parse", std::to_string(program.size()) + " top-level statements");
    return std::move(program);
}

support::Expected<StmtList> parse(std::vector<Token> tokens)
{
    return Parser(std::move(tokens)).parse();
}

//===----------------------------------------------------------------------===//
// Token Handling
//===----------------------------------------------------------------------===//

const Token &Parser::peek(size_t offset) const
{
    size_t index = pos_ + offset;
    if (index >= tokens_.size())
        return tokens_.back();
    return tokens_[index];
}

Token Parser::advance()
{
    Token cur = peek();
    if (pos_ < tokens_.size() - 1)
        ++pos_;
    return cur;
}

bool Parser::check(TokenKind kind, size_t offset) const
{
    return peek(offset).kind == kind;
}

bool Parser::match(TokenKind kind, Token *out)
{
    if (check(kind))
    {
        Token tok = advance();
        if (out)
            *out = std::move(tok);
        return true;
    }
    return false;
}

bool Parser::expect(TokenKind kind, const char *what, Token *out)
{
    if (match(kind, out))
        return true;
    errorExpected(what);
    return false;
}

//===----------------------------------------------------------------------===//
// Error Handling
//===----------------------------------------------------------------------===//

void Parser::error(const std::string &message, const char *code)
{
    errorAt(peek().loc, message, code);
}

void Parser::errorAt(SourceLoc loc, const std::string &message, const char *code)
{
    // First error wins.
    if (error_)
        return;
    error_ = support::makeError(loc, message, code);
}

void Parser::errorExpected(const std::string &what)
{
    const Token &tok = peek();
    error("Expected " + what + ", found " + describeToken(tok) + " at line " +
          std::to_string(tok.loc.line) + ", column " + std::to_string(tok.loc.column));
}

} // namespace nikl::frontends
