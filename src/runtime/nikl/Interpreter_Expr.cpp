//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Interpreter_Expr.cpp
/// @brief Expression evaluation and function calls.
///
//===----------------------------------------------------------------------===//

#include "runtime/nikl/Interpreter.hpp"

#include "runtime/nikl/Operators.hpp"

#include <utility>

namespace nikl::runtime
{

using namespace nikl::frontends;

Interpreter::EvalResult Interpreter::evalExpr(const Expr &expr)
{
    switch (expr.kind)
    {
        case ExprKind::IntLiteral:
            return Value::integer(static_cast<const IntLiteralExpr &>(expr).value);
        case ExprKind::FloatLiteral:
            return Value::floating(static_cast<const FloatLiteralExpr &>(expr).value);
        case ExprKind::StringLiteral:
            return Value::string(static_cast<const StringLiteralExpr &>(expr).value);
        case ExprKind::BoolLiteral:
            return Value::boolean(static_cast<const BoolLiteralExpr &>(expr).value);
        case ExprKind::Ident:
            return env_.get(static_cast<const IdentExpr &>(expr).name);
        case ExprKind::Assign:
            return evalAssign(static_cast<const AssignExpr &>(expr));
        case ExprKind::Binary:
            return evalBinary(static_cast<const BinaryExpr &>(expr));
        case ExprKind::Unary:
            return evalUnary(static_cast<const UnaryExpr &>(expr));
        case ExprKind::Call:
            return evalCall(static_cast<const CallExpr &>(expr));
        case ExprKind::Dot:
            return evalDot(static_cast<const DotExpr &>(expr));
        case ExprKind::ArrayLiteral:
            return evalElements(static_cast<const ArrayLiteralExpr &>(expr).elements,
                                ValueKind::Array);
        case ExprKind::TupleLiteral:
            return evalElements(static_cast<const TupleLiteralExpr &>(expr).elements,
                                ValueKind::Tuple);
        case ExprKind::MapLiteral:
            return evalMap(static_cast<const MapLiteralExpr &>(expr));
    }
    return EvalResult::error("unknown expression kind");
}

/// @brief Evaluate the right-hand side, then overwrite the nearest binding.
/// @return The assigned value.
Interpreter::EvalResult Interpreter::evalAssign(const AssignExpr &expr)
{
    EvalResult value = evalExpr(*expr.value);
    if (!value.isOk())
        return value;

    auto assigned = env_.assign(expr.target, value.value());
    if (!assigned.isOk())
        return EvalResult::error(assigned.error());
    return value;
}

Interpreter::EvalResult Interpreter::evalBinary(const BinaryExpr &expr)
{
    EvalResult lhs = evalExpr(*expr.left);
    if (!lhs.isOk())
        return lhs;
    EvalResult rhs = evalExpr(*expr.right);
    if (!rhs.isOk())
        return rhs;
    return applyBinary(expr.op, lhs.value(), rhs.value());
}

Interpreter::EvalResult Interpreter::evalUnary(const UnaryExpr &expr)
{
    EvalResult operand = evalExpr(*expr.operand);
    if (!operand.isOk())
        return operand;
    return applyUnary(expr.op, operand.value());
}

/// @brief Callee first, then every argument left to right, then dispatch.
Interpreter::EvalResult Interpreter::evalCall(const CallExpr &expr)
{
    EvalResult callee = evalExpr(*expr.callee);
    if (!callee.isOk())
        return callee;

    ValueList args;
    args.reserve(expr.args.size());
    for (const auto &arg : expr.args)
    {
        EvalResult value = evalExpr(*arg);
        if (!value.isOk())
            return value;
        args.push_back(std::move(value.value()));
    }
    return callValue(callee.value(), args);
}

Interpreter::EvalResult Interpreter::callValue(const Value &callee, const ValueList &args)
{
    if (callee.is(ValueKind::BuiltinFunction))
        return callee.asBuiltin().fn(args);

    if (!callee.is(ValueKind::Function))
        return EvalResult::error("Tried to call non-function " + callee.toString());

    const FunctionValue &fn = callee.asFunction();
    if (args.size() != fn.params.size())
        return EvalResult::error("Function '" + fn.name + "' expects " +
                                 std::to_string(fn.params.size()) + " arguments, but got " +
                                 std::to_string(args.size()));

    Environment callEnv = fn.closure;
    callEnv.pushScope();
    callEnv.declare(fn.name, callee, false);
    callEnv.pushScope();
    for (size_t i = 0; i < args.size(); ++i)
        callEnv.declare(fn.params[i], args[i], true);

    // The body runs against the call chain; the caller's chain is restored
    // afterwards whatever the outcome.
    std::swap(env_, callEnv);
    std::shared_ptr<const void> savedOwner = std::exchange(astOwner_, fn.decl);
    ExecResult result = execBlock(fn.decl->body);
    astOwner_ = std::move(savedOwner);
    std::swap(env_, callEnv);

    if (!result.isOk())
        return EvalResult::error(result.error());

    switch (result.value().kind)
    {
        case ControlFlow::Kind::Return:
            return std::move(result.value().value);
        case ControlFlow::Kind::Break:
            return EvalResult::error("'break' outside of loop");
        case ControlFlow::Kind::Continue:
            return EvalResult::error("'continue' outside of loop");
        case ControlFlow::Kind::Value:
            break;
    }
    return Value();
}

/// @brief Property access on a HashMap record by String key.
Interpreter::EvalResult Interpreter::evalDot(const DotExpr &expr)
{
    EvalResult object = evalExpr(*expr.object);
    if (!object.isOk())
        return object;

    const Value &record = object.value();
    if (!record.is(ValueKind::HashMap))
        return EvalResult::error("Cannot access property '" + expr.property + "' on " +
                                 valueKindName(record.kind()));

    if (const Value *found = record.lookup(expr.property))
        return *found;
    return EvalResult::error("Property '" + expr.property + "' not found");
}

Interpreter::EvalResult Interpreter::evalElements(const std::vector<ExprPtr> &exprs, ValueKind kind)
{
    ValueList items;
    items.reserve(exprs.size());
    for (const auto &element : exprs)
    {
        EvalResult value = evalExpr(*element);
        if (!value.isOk())
            return value;
        items.push_back(std::move(value.value()));
    }
    if (kind == ValueKind::Tuple)
        return Value::tuple(std::move(items));
    return Value::array(std::move(items));
}

/// @brief Keys and values are evaluated in source order; duplicate keys are
///        kept, and lookup returns the first.
Interpreter::EvalResult Interpreter::evalMap(const MapLiteralExpr &expr)
{
    MapEntries entries;
    entries.reserve(expr.entries.size());
    for (const auto &[keyExpr, valueExpr] : expr.entries)
    {
        EvalResult key = evalExpr(*keyExpr);
        if (!key.isOk())
            return key;
        EvalResult value = evalExpr(*valueExpr);
        if (!value.isOk())
            return value;
        entries.push_back(MapEntry{std::move(key.value()), std::move(value.value())});
    }
    return Value::hashMap(std::move(entries));
}

} // namespace nikl::runtime
