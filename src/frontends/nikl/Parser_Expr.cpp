//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Expr.cpp
/// @brief Expression parsing for the Nikl parser.
///
/// @details Each precedence level is a separate function that parses the next
/// higher level and then loops over its own operators, producing
/// left-associative trees. Assignment is the exception: it recurses on its
/// right-hand side and only accepts a bare identifier on the left.
///
//===----------------------------------------------------------------------===//

#include "frontends/nikl/Parser.hpp"

namespace nikl::frontends
{

ExprPtr Parser::parseExpression()
{
    return parseAssignment();
}

ExprPtr Parser::parseAssignment()
{
    ExprPtr expr = parseLogicalOr();
    if (!expr)
        return nullptr;

    Token eqTok;
    if (match(TokenKind::Equal, &eqTok))
    {
        ExprPtr value = parseAssignment();
        if (!value)
            return nullptr;

        if (expr->kind != ExprKind::Ident)
        {
            errorAt(eqTok.loc, "Invalid assignment target", "N2002");
            return nullptr;
        }

        auto *target = static_cast<IdentExpr *>(expr.get());
        return std::make_unique<AssignExpr>(expr->loc, target->name, std::move(value));
    }

    return expr;
}

ExprPtr Parser::parseLogicalOr()
{
    ExprPtr expr = parseLogicalAnd();
    if (!expr)
        return nullptr;

    Token opTok;
    while (match(TokenKind::KwOr, &opTok))
    {
        ExprPtr right = parseLogicalAnd();
        if (!right)
            return nullptr;
        expr = std::make_unique<BinaryExpr>(opTok.loc, BinaryOp::Or, std::move(expr), std::move(right));
    }

    return expr;
}

ExprPtr Parser::parseLogicalAnd()
{
    ExprPtr expr = parseEquality();
    if (!expr)
        return nullptr;

    Token opTok;
    while (match(TokenKind::KwAnd, &opTok))
    {
        ExprPtr right = parseEquality();
        if (!right)
            return nullptr;
        expr = std::make_unique<BinaryExpr>(opTok.loc, BinaryOp::And, std::move(expr), std::move(right));
    }

    return expr;
}

ExprPtr Parser::parseEquality()
{
    ExprPtr expr = parseComparison();
    if (!expr)
        return nullptr;

    while (check(TokenKind::EqualEqual) || check(TokenKind::NotEqual))
    {
        Token opTok = advance();
        BinaryOp op = opTok.is(TokenKind::EqualEqual) ? BinaryOp::Eq : BinaryOp::Ne;

        ExprPtr right = parseComparison();
        if (!right)
            return nullptr;
        expr = std::make_unique<BinaryExpr>(opTok.loc, op, std::move(expr), std::move(right));
    }

    return expr;
}

ExprPtr Parser::parseComparison()
{
    ExprPtr expr = parseAdditive();
    if (!expr)
        return nullptr;

    while (peek().isOneOf(TokenKind::Less, TokenKind::LessEqual, TokenKind::Greater, TokenKind::GreaterEqual))
    {
        Token opTok = advance();
        BinaryOp op;
        switch (opTok.kind)
        {
            case TokenKind::Less:
                op = BinaryOp::Lt;
                break;
            case TokenKind::LessEqual:
                op = BinaryOp::Le;
                break;
            case TokenKind::Greater:
                op = BinaryOp::Gt;
                break;
            default:
                op = BinaryOp::Ge;
                break;
        }

        ExprPtr right = parseAdditive();
        if (!right)
            return nullptr;
        expr = std::make_unique<BinaryExpr>(opTok.loc, op, std::move(expr), std::move(right));
    }

    return expr;
}

ExprPtr Parser::parseAdditive()
{
    ExprPtr expr = parseMultiplicative();
    if (!expr)
        return nullptr;

    while (check(TokenKind::Plus) || check(TokenKind::Minus))
    {
        Token opTok = advance();
        BinaryOp op = opTok.is(TokenKind::Plus) ? BinaryOp::Add : BinaryOp::Sub;

        ExprPtr right = parseMultiplicative();
        if (!right)
            return nullptr;
        expr = std::make_unique<BinaryExpr>(opTok.loc, op, std::move(expr), std::move(right));
    }

    return expr;
}

ExprPtr Parser::parseMultiplicative()
{
    ExprPtr expr = parseUnary();
    if (!expr)
        return nullptr;

    while (check(TokenKind::Star) || check(TokenKind::Slash))
    {
        Token opTok = advance();
        BinaryOp op = opTok.is(TokenKind::Star) ? BinaryOp::Mul : BinaryOp::Div;

        ExprPtr right = parseUnary();
        if (!right)
            return nullptr;
        expr = std::make_unique<BinaryExpr>(opTok.loc, op, std::move(expr), std::move(right));
    }

    return expr;
}

ExprPtr Parser::parseUnary()
{
    if (++exprDepth_ > kMaxExprDepth)
    {
        --exprDepth_;
        error("expression nesting too deep (limit: " + std::to_string(kMaxExprDepth) + ")", "N2005");
        return nullptr;
    }

    ExprPtr result;

    if (check(TokenKind::Minus) || check(TokenKind::KwNot))
    {
        Token opTok = advance();
        UnaryOp op = opTok.is(TokenKind::Minus) ? UnaryOp::Neg : UnaryOp::Not;

        ExprPtr operand = parseUnary();
        if (operand)
            result = std::make_unique<UnaryExpr>(opTok.loc, op, std::move(operand));
    }
    else
    {
        result = parsePostfix();
    }

    --exprDepth_;
    return result;
}

ExprPtr Parser::parsePostfix()
{
    ExprPtr expr = parsePrimary();
    if (!expr)
        return nullptr;

    while (true)
    {
        Token opTok;
        if (match(TokenKind::LParen, &opTok))
        {
            std::vector<ExprPtr> args;
            if (!parseExprList(TokenKind::RParen, args) || !expect(TokenKind::RParen, "')'"))
                return nullptr;
            expr = std::make_unique<CallExpr>(opTok.loc, std::move(expr), std::move(args));
        }
        else if (match(TokenKind::Dot, &opTok))
        {
            Token nameTok;
            if (!expect(TokenKind::Identifier, "property name", &nameTok))
                return nullptr;
            expr = std::make_unique<DotExpr>(opTok.loc, std::move(expr), nameTok.text);
        }
        else
        {
            break;
        }
    }

    return expr;
}

ExprPtr Parser::parsePrimary()
{
    const Token &tok = peek();
    switch (tok.kind)
    {
        case TokenKind::IntegerLiteral:
        {
            Token lit = advance();
            return std::make_unique<IntLiteralExpr>(lit.loc, lit.intValue);
        }
        case TokenKind::FloatLiteral:
        {
            Token lit = advance();
            return std::make_unique<FloatLiteralExpr>(lit.loc, lit.floatValue);
        }
        case TokenKind::StringLiteral:
        {
            Token lit = advance();
            return std::make_unique<StringLiteralExpr>(lit.loc, std::move(lit.stringValue));
        }
        case TokenKind::BooleanLiteral:
        {
            Token lit = advance();
            return std::make_unique<BoolLiteralExpr>(lit.loc, lit.boolValue);
        }
        case TokenKind::Identifier:
        {
            Token id = advance();
            return std::make_unique<IdentExpr>(id.loc, std::move(id.text));
        }
        case TokenKind::LParen:
            return parseParenOrTuple();
        case TokenKind::LBracket:
            return parseArrayLiteral();
        case TokenKind::LBrace:
            return parseMapLiteral();
        default:
            errorExpected("expression");
            return nullptr;
    }
}

bool Parser::parseExprList(TokenKind close, std::vector<ExprPtr> &out)
{
    while (!check(close))
    {
        ExprPtr e = parseExpression();
        if (!e)
            return false;
        out.push_back(std::move(e));
        if (!match(TokenKind::Comma))
            break;
    }
    return true;
}

/// @brief `(e)` is grouping; `()`, `(e,)` and `(e, f, ...)` are tuples.
ExprPtr Parser::parseParenOrTuple()
{
    Token open = advance();

    if (match(TokenKind::RParen))
        return std::make_unique<TupleLiteralExpr>(open.loc, std::vector<ExprPtr>{});

    ExprPtr first = parseExpression();
    if (!first)
        return nullptr;

    if (match(TokenKind::RParen))
        return first;

    if (!expect(TokenKind::Comma, "',' or ')'"))
        return nullptr;

    std::vector<ExprPtr> elements;
    elements.push_back(std::move(first));
    if (!parseExprList(TokenKind::RParen, elements) || !expect(TokenKind::RParen, "')'"))
        return nullptr;

    return std::make_unique<TupleLiteralExpr>(open.loc, std::move(elements));
}

ExprPtr Parser::parseArrayLiteral()
{
    Token open = advance();

    std::vector<ExprPtr> elements;
    if (!parseExprList(TokenKind::RBracket, elements) || !expect(TokenKind::RBracket, "']'"))
        return nullptr;

    return std::make_unique<ArrayLiteralExpr>(open.loc, std::move(elements));
}

ExprPtr Parser::parseMapLiteral()
{
    Token open = advance();

    std::vector<std::pair<ExprPtr, ExprPtr>> entries;
    while (!check(TokenKind::RBrace))
    {
        ExprPtr key = parseExpression();
        if (!key)
            return nullptr;
        if (!expect(TokenKind::Colon, "':'"))
            return nullptr;
        ExprPtr value = parseExpression();
        if (!value)
            return nullptr;
        entries.emplace_back(std::move(key), std::move(value));
        if (!match(TokenKind::Comma))
            break;
    }

    if (!expect(TokenKind::RBrace, "'}'"))
        return nullptr;

    return std::make_unique<MapLiteralExpr>(open.loc, std::move(entries));
}

} // namespace nikl::frontends
