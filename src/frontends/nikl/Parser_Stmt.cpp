//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Stmt.cpp
/// @brief Statement parsing for the Nikl parser.
///
/// @details Statements have no terminator; each one ends where its grammar
/// ends. Dispatch happens on the leading keyword:
///
/// | Keyword            | Statement                                   |
/// |--------------------|---------------------------------------------|
/// | `let`, `const`     | binding, optional `: Type`, `= init`        |
/// | `fn`               | function definition                         |
/// | `if`               | `if` / `elif`* / `else`?                    |
/// | `while`            | conditional loop                            |
/// | `for`              | `for a [, b] in expr`                       |
/// | `loop`             | unconditional loop                          |
/// | `return`           | optional value                              |
/// | `break`,`continue` | loop control                                |
/// | `del`              | binding removal                             |
/// | `import`           | `import "path" as alias`                    |
///
//===----------------------------------------------------------------------===//

#include "frontends/nikl/Parser.hpp"

namespace nikl::frontends
{

StmtPtr Parser::parseStatement()
{
    switch (peek().kind)
    {
        case TokenKind::KwLet:
        case TokenKind::KwConst:
            return parseLetStmt();
        case TokenKind::KwFn:
            return parseFnStmt();
        case TokenKind::KwIf:
            return parseIfStmt();
        case TokenKind::KwWhile:
            return parseWhileStmt();
        case TokenKind::KwFor:
            return parseForStmt();
        case TokenKind::KwLoop:
            return parseLoopStmt();
        case TokenKind::KwReturn:
            return parseReturnStmt();
        case TokenKind::KwBreak:
            return std::make_unique<BreakStmt>(advance().loc);
        case TokenKind::KwContinue:
            return std::make_unique<ContinueStmt>(advance().loc);
        case TokenKind::KwDel:
            return parseDelStmt();
        case TokenKind::KwImport:
            return parseImportStmt();
        case TokenKind::KwPub:
        case TokenKind::KwSpawn:
        case TokenKind::KwWait:
            error("'" + peek().text + "' is reserved and not supported", "N2003");
            return nullptr;
        default:
            return parseExprStmt();
    }
}

bool Parser::parseBlock(StmtList &out)
{
    if (!expect(TokenKind::LBrace, "'{'"))
        return false;

    if (++blockDepth_ > kMaxBlockDepth)
    {
        --blockDepth_;
        error("block nesting too deep (limit: " + std::to_string(kMaxBlockDepth) + ")", "N2005");
        return false;
    }

    while (!check(TokenKind::RBrace) && !check(TokenKind::Eof))
    {
        StmtPtr stmt = parseStatement();
        if (!stmt)
        {
            --blockDepth_;
            return false;
        }
        out.push_back(std::move(stmt));
    }

    --blockDepth_;
    return expect(TokenKind::RBrace, "'}'");
}

StmtPtr Parser::parseLetStmt()
{
    Token kw = advance();
    bool isConst = kw.is(TokenKind::KwConst);

    Token nameTok;
    if (!expect(TokenKind::Identifier, "identifier", &nameTok))
        return nullptr;

    if (match(TokenKind::Colon) && !parseTypeAnnotation())
        return nullptr;

    if (!expect(TokenKind::Equal, "'='"))
        return nullptr;

    ExprPtr init = parseExpression();
    if (!init)
        return nullptr;

    return std::make_unique<LetStmt>(kw.loc, nameTok.text, std::move(init), isConst);
}

bool Parser::parseParameters(std::vector<std::string> &out)
{
    if (!expect(TokenKind::LParen, "'('"))
        return false;

    while (!check(TokenKind::RParen))
    {
        Token nameTok;
        if (!expect(TokenKind::Identifier, "parameter name", &nameTok))
            return false;
        out.push_back(nameTok.text);

        if (match(TokenKind::Colon) && !parseTypeAnnotation())
            return false;

        if (!match(TokenKind::Comma))
            break;
    }

    return expect(TokenKind::RParen, "')'");
}

StmtPtr Parser::parseFnStmt()
{
    Token kw = advance();

    Token nameTok;
    if (!expect(TokenKind::Identifier, "function name", &nameTok))
        return nullptr;

    std::vector<std::string> params;
    if (!parseParameters(params))
        return nullptr;

    if (match(TokenKind::Arrow) && !parseTypeAnnotation())
        return nullptr;

    StmtList body;
    if (!parseBlock(body))
        return nullptr;

    return std::make_unique<FnStmt>(kw.loc, nameTok.text, std::move(params), std::move(body));
}

StmtPtr Parser::parseIfStmt()
{
    Token kw = advance();

    CondBranch primary;
    primary.condition = parseExpression();
    if (!primary.condition || !parseBlock(primary.body))
        return nullptr;

    std::vector<CondBranch> elifs;
    while (match(TokenKind::KwElif))
    {
        CondBranch branch;
        branch.condition = parseExpression();
        if (!branch.condition || !parseBlock(branch.body))
            return nullptr;
        elifs.push_back(std::move(branch));
    }

    std::optional<StmtList> elseBody;
    if (match(TokenKind::KwElse))
    {
        StmtList body;
        if (!parseBlock(body))
            return nullptr;
        elseBody = std::move(body);
    }

    return std::make_unique<IfStmt>(kw.loc, std::move(primary), std::move(elifs), std::move(elseBody));
}

StmtPtr Parser::parseWhileStmt()
{
    Token kw = advance();

    ExprPtr cond = parseExpression();
    if (!cond)
        return nullptr;

    StmtList body;
    if (!parseBlock(body))
        return nullptr;

    return std::make_unique<WhileStmt>(kw.loc, std::move(cond), std::move(body));
}

StmtPtr Parser::parseForStmt()
{
    Token kw = advance();

    std::vector<std::string> names;
    Token nameTok;
    if (!expect(TokenKind::Identifier, "loop variable", &nameTok))
        return nullptr;
    names.push_back(nameTok.text);

    if (match(TokenKind::Comma))
    {
        if (!expect(TokenKind::Identifier, "loop variable", &nameTok))
            return nullptr;
        names.push_back(nameTok.text);
    }

    if (!expect(TokenKind::KwIn, "'in'"))
        return nullptr;

    ExprPtr iterable = parseExpression();
    if (!iterable)
        return nullptr;

    StmtList body;
    if (!parseBlock(body))
        return nullptr;

    return std::make_unique<ForStmt>(kw.loc, std::move(names), std::move(iterable), std::move(body));
}

StmtPtr Parser::parseLoopStmt()
{
    Token kw = advance();

    StmtList body;
    if (!parseBlock(body))
        return nullptr;

    return std::make_unique<LoopStmt>(kw.loc, std::move(body));
}

StmtPtr Parser::parseReturnStmt()
{
    Token kw = advance();

    // Bare `return` at the end of a block or program yields None.
    if (check(TokenKind::RBrace) || check(TokenKind::Eof))
        return std::make_unique<ReturnStmt>(kw.loc, nullptr);

    ExprPtr value = parseExpression();
    if (!value)
        return nullptr;

    return std::make_unique<ReturnStmt>(kw.loc, std::move(value));
}

StmtPtr Parser::parseDelStmt()
{
    Token kw = advance();

    Token nameTok;
    if (!expect(TokenKind::Identifier, "identifier", &nameTok))
        return nullptr;

    return std::make_unique<DelStmt>(kw.loc, nameTok.text);
}

StmtPtr Parser::parseImportStmt()
{
    Token kw = advance();

    Token pathTok;
    if (!expect(TokenKind::StringLiteral, "module path string", &pathTok))
        return nullptr;

    if (!expect(TokenKind::KwAs, "'as'"))
        return nullptr;

    Token aliasTok;
    if (!expect(TokenKind::Identifier, "module alias", &aliasTok))
        return nullptr;

    return std::make_unique<ImportStmt>(kw.loc, pathTok.stringValue, aliasTok.text);
}

StmtPtr Parser::parseExprStmt()
{
    SourceLoc loc = peek().loc;
    ExprPtr expr = parseExpression();
    if (!expr)
        return nullptr;
    return std::make_unique<ExprStmt>(loc, std::move(expr));
}

} // namespace nikl::frontends
