//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Operators.cpp
/// @brief Operator evaluation by operand-kind pair.
///
//===----------------------------------------------------------------------===//

#include "runtime/nikl/Operators.hpp"

#include <cstdint>
#include <limits>

namespace nikl::runtime
{

using frontends::BinaryOp;
using frontends::UnaryOp;
using support::Result;

namespace
{

std::string describeOperand(const Value &v)
{
    return v.toString() + " (" + valueKindName(v.kind()) + ")";
}

Result<Value> typeError(BinaryOp op, const Value &lhs, const Value &rhs)
{
    return Result<Value>::error(std::string("Type error: unsupported operator '") +
                                frontends::binaryOpSpelling(op) + "' for " + describeOperand(lhs) +
                                " and " + describeOperand(rhs));
}

Result<Value> overflow(BinaryOp op)
{
    return Result<Value>::error(std::string("Integer overflow in '") +
                                frontends::binaryOpSpelling(op) + "'");
}

template <typename T> Result<Value> compare(BinaryOp op, T a, T b)
{
    switch (op)
    {
        case BinaryOp::Eq:
            return Value::boolean(a == b);
        case BinaryOp::Ne:
            return Value::boolean(a != b);
        case BinaryOp::Lt:
            return Value::boolean(a < b);
        case BinaryOp::Le:
            return Value::boolean(a <= b);
        case BinaryOp::Gt:
            return Value::boolean(a > b);
        case BinaryOp::Ge:
            return Value::boolean(a >= b);
        default:
            return Result<Value>::error("not a comparison");
    }
}

bool isComparison(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Eq:
        case BinaryOp::Ne:
        case BinaryOp::Lt:
        case BinaryOp::Le:
        case BinaryOp::Gt:
        case BinaryOp::Ge:
            return true;
        default:
            return false;
    }
}

Result<Value> integerOp(BinaryOp op, const Value &lhs, const Value &rhs)
{
    const int64_t a = lhs.asInteger();
    const int64_t b = rhs.asInteger();
    int64_t out = 0;

    switch (op)
    {
        case BinaryOp::Add:
            if (__builtin_add_overflow(a, b, &out))
                return overflow(op);
            return Value::integer(out);
        case BinaryOp::Sub:
            if (__builtin_sub_overflow(a, b, &out))
                return overflow(op);
            return Value::integer(out);
        case BinaryOp::Mul:
            if (__builtin_mul_overflow(a, b, &out))
                return overflow(op);
            return Value::integer(out);
        case BinaryOp::Div:
            if (b == 0)
                return Result<Value>::error("Division by zero");
            if (a == std::numeric_limits<int64_t>::min() && b == -1)
                return overflow(op);
            return Value::integer(a / b);
        default:
            if (isComparison(op))
                return compare(op, a, b);
            return typeError(op, lhs, rhs);
    }
}

Result<Value> floatOp(BinaryOp op, const Value &lhs, const Value &rhs, double a, double b)
{
    switch (op)
    {
        case BinaryOp::Add:
            return Value::floating(a + b);
        case BinaryOp::Sub:
            return Value::floating(a - b);
        case BinaryOp::Mul:
            return Value::floating(a * b);
        case BinaryOp::Div:
            if (b == 0.0)
                return Result<Value>::error("Division by zero");
            return Value::floating(a / b);
        default:
            if (isComparison(op))
                return compare(op, a, b);
            return typeError(op, lhs, rhs);
    }
}

Result<Value> stringOp(BinaryOp op, const Value &lhs, const Value &rhs)
{
    switch (op)
    {
        case BinaryOp::Add:
            return Value::string(lhs.asString() + rhs.asString());
        case BinaryOp::Eq:
            return Value::boolean(lhs.asString() == rhs.asString());
        case BinaryOp::Ne:
            return Value::boolean(lhs.asString() != rhs.asString());
        default:
            return typeError(op, lhs, rhs);
    }
}

Result<Value> boolOp(BinaryOp op, const Value &lhs, const Value &rhs)
{
    const bool a = lhs.asBool();
    const bool b = rhs.asBool();
    switch (op)
    {
        case BinaryOp::And:
            return Value::boolean(a && b);
        case BinaryOp::Or:
            return Value::boolean(a || b);
        case BinaryOp::Eq:
            return Value::boolean(a == b);
        case BinaryOp::Ne:
            return Value::boolean(a != b);
        default:
            return typeError(op, lhs, rhs);
    }
}

} // namespace

Result<Value> applyBinary(BinaryOp op, const Value &lhs, const Value &rhs)
{
    const ValueKind lk = lhs.kind();
    const ValueKind rk = rhs.kind();

    if (lk == ValueKind::Integer && rk == ValueKind::Integer)
        return integerOp(op, lhs, rhs);
    if (lk == ValueKind::Float && rk == ValueKind::Float)
        return floatOp(op, lhs, rhs, lhs.asFloat(), rhs.asFloat());
    if (lk == ValueKind::Integer && rk == ValueKind::Float)
        return floatOp(op, lhs, rhs, static_cast<double>(lhs.asInteger()), rhs.asFloat());
    if (lk == ValueKind::Float && rk == ValueKind::Integer)
        return floatOp(op, lhs, rhs, lhs.asFloat(), static_cast<double>(rhs.asInteger()));
    if (lk == ValueKind::String && rk == ValueKind::String)
        return stringOp(op, lhs, rhs);
    if (lk == ValueKind::Bool && rk == ValueKind::Bool)
        return boolOp(op, lhs, rhs);
    if (op == BinaryOp::Add && lk == ValueKind::String && rk == ValueKind::Bool)
        return Value::string(lhs.asString() + rhs.toString());
    if (op == BinaryOp::Add && lk == ValueKind::Bool && rk == ValueKind::String)
        return Value::string(lhs.toString() + rhs.asString());

    return typeError(op, lhs, rhs);
}

Result<Value> applyUnary(UnaryOp op, const Value &operand)
{
    if (op == UnaryOp::Neg && operand.is(ValueKind::Integer))
    {
        if (operand.asInteger() == std::numeric_limits<int64_t>::min())
            return Result<Value>::error("Integer overflow in '-'");
        return Value::integer(-operand.asInteger());
    }
    if (op == UnaryOp::Not && operand.is(ValueKind::Bool))
        return Value::boolean(!operand.asBool());

    return Result<Value>::error(std::string("Unsupported unary operator '") +
                                frontends::unaryOpSpelling(op) + "' for " +
                                describeOperand(operand));
}

} // namespace nikl::runtime
