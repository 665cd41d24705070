//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Expr.hpp
/// @brief Expression node definitions for the Nikl AST.
///
/// Every expression derives from Expr and carries an ExprKind tag used by the
/// interpreter to dispatch without RTTI.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/nikl/AST_Fwd.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace nikl::frontends
{

//===----------------------------------------------------------------------===//
/// @name Expression Nodes
/// @{
//===----------------------------------------------------------------------===//

/// @brief Discriminator for expression nodes.
enum class ExprKind
{
    // Literals
    IntLiteral,
    FloatLiteral,
    StringLiteral,
    BoolLiteral,

    // References
    Ident,
    Assign,

    // Operators
    Binary,
    Unary,

    // Postfix
    Call,
    Dot,

    // Composite literals
    ArrayLiteral,
    TupleLiteral,
    MapLiteral,
};

/// @brief Base class for all expression nodes.
struct Expr
{
    ExprKind kind;
    SourceLoc loc;

    Expr(ExprKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~Expr() = default;
};

struct IntLiteralExpr : Expr
{
    int64_t value;

    IntLiteralExpr(SourceLoc l, int64_t v) : Expr(ExprKind::IntLiteral, l), value(v) {}
};

struct FloatLiteralExpr : Expr
{
    double value;

    FloatLiteralExpr(SourceLoc l, double v) : Expr(ExprKind::FloatLiteral, l), value(v) {}
};

struct StringLiteralExpr : Expr
{
    std::string value;

    StringLiteralExpr(SourceLoc l, std::string v)
        : Expr(ExprKind::StringLiteral, l), value(std::move(v))
    {
    }
};

struct BoolLiteralExpr : Expr
{
    bool value;

    BoolLiteralExpr(SourceLoc l, bool v) : Expr(ExprKind::BoolLiteral, l), value(v) {}
};

/// @brief Variable reference: `x`.
struct IdentExpr : Expr
{
    std::string name;

    IdentExpr(SourceLoc l, std::string n) : Expr(ExprKind::Ident, l), name(std::move(n)) {}
};

/// @brief Assignment to an existing binding: `x = value`.
/// @details Only bare identifiers are valid targets, so the target is stored
///          as a name rather than an expression.
struct AssignExpr : Expr
{
    std::string target;
    ExprPtr value;

    AssignExpr(SourceLoc l, std::string t, ExprPtr v)
        : Expr(ExprKind::Assign, l), target(std::move(t)), value(std::move(v))
    {
    }
};

/// @brief Binary operators.
enum class BinaryOp
{
    // Arithmetic
    Add, ///< `a + b`
    Sub, ///< `a - b`
    Mul, ///< `a * b`
    Div, ///< `a / b`

    // Comparison
    Eq, ///< `a == b`
    Ne, ///< `a != b`
    Lt, ///< `a < b`
    Le, ///< `a <= b`
    Gt, ///< `a > b`
    Ge, ///< `a >= b`

    // Logical; both operands are always evaluated
    And, ///< `a and b`
    Or,  ///< `a or b`
};

/// @brief Source spelling of @p op, used in runtime messages.
const char *binaryOpSpelling(BinaryOp op);

struct BinaryExpr : Expr
{
    BinaryOp op;
    ExprPtr left;
    ExprPtr right;

    BinaryExpr(SourceLoc l, BinaryOp o, ExprPtr lhs, ExprPtr rhs)
        : Expr(ExprKind::Binary, l), op(o), left(std::move(lhs)), right(std::move(rhs))
    {
    }
};

/// @brief Unary operators.
enum class UnaryOp
{
    Neg, ///< `-a`
    Not, ///< `not a`
};

const char *unaryOpSpelling(UnaryOp op);

struct UnaryExpr : Expr
{
    UnaryOp op;
    ExprPtr operand;

    UnaryExpr(SourceLoc l, UnaryOp o, ExprPtr e)
        : Expr(ExprKind::Unary, l), op(o), operand(std::move(e))
    {
    }
};

/// @brief Call: `callee(args...)`.
struct CallExpr : Expr
{
    ExprPtr callee;
    std::vector<ExprPtr> args;

    CallExpr(SourceLoc l, ExprPtr c, std::vector<ExprPtr> a)
        : Expr(ExprKind::Call, l), callee(std::move(c)), args(std::move(a))
    {
    }
};

/// @brief Property access on a hash map: `object.property`.
struct DotExpr : Expr
{
    ExprPtr object;
    std::string property;

    DotExpr(SourceLoc l, ExprPtr o, std::string p)
        : Expr(ExprKind::Dot, l), object(std::move(o)), property(std::move(p))
    {
    }
};

/// @brief `[a, b, c]`.
struct ArrayLiteralExpr : Expr
{
    std::vector<ExprPtr> elements;

    ArrayLiteralExpr(SourceLoc l, std::vector<ExprPtr> e)
        : Expr(ExprKind::ArrayLiteral, l), elements(std::move(e))
    {
    }
};

/// @brief `(a, b)`, `(a,)` or `()`.
struct TupleLiteralExpr : Expr
{
    std::vector<ExprPtr> elements;

    TupleLiteralExpr(SourceLoc l, std::vector<ExprPtr> e)
        : Expr(ExprKind::TupleLiteral, l), elements(std::move(e))
    {
    }
};

/// @brief `{key: value, ...}`.
/// @details Entries keep source order; duplicate keys are not rejected.
struct MapLiteralExpr : Expr
{
    std::vector<std::pair<ExprPtr, ExprPtr>> entries;

    MapLiteralExpr(SourceLoc l, std::vector<std::pair<ExprPtr, ExprPtr>> e)
        : Expr(ExprKind::MapLiteral, l), entries(std::move(e))
    {
    }
};

/// @}

} // namespace nikl::frontends
