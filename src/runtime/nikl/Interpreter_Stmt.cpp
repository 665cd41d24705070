//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Interpreter_Stmt.cpp
/// @brief Statement execution for the Nikl interpreter.
///
/// @details Every exec function returns Result<ControlFlow>. Loops consume
/// Break and Continue; Return passes through loops untouched and is unwrapped
/// by callValue. Errors propagate unchanged.
///
//===----------------------------------------------------------------------===//

#include "runtime/nikl/Interpreter.hpp"

#include "runtime/nikl/Modules.hpp"
#include "support/debug_trace.hpp"

namespace nikl::runtime
{

using namespace nikl::frontends;
using support::Result;

Interpreter::ExecResult Interpreter::execBlock(const StmtList &stmts)
{
    ControlFlow last = ControlFlow::normal();
    for (const auto &stmt : stmts)
    {
        ExecResult result = execStmt(*stmt);
        if (!result.isOk() || !result.value().isNormal())
            return result;
        last = std::move(result.value());
    }
    return last;
}

Interpreter::ExecResult Interpreter::execStmt(const Stmt &stmt)
{
    switch (stmt.kind)
    {
        case StmtKind::Let:
            return execLet(static_cast<const LetStmt &>(stmt));
        case StmtKind::Fn:
            return execFn(static_cast<const FnStmt &>(stmt));
        case StmtKind::If:
            return execIf(static_cast<const IfStmt &>(stmt));
        case StmtKind::While:
            return execWhile(static_cast<const WhileStmt &>(stmt));
        case StmtKind::For:
            return execFor(static_cast<const ForStmt &>(stmt));
        case StmtKind::Loop:
            return execLoop(static_cast<const LoopStmt &>(stmt));
        case StmtKind::Return:
            return execReturn(static_cast<const ReturnStmt &>(stmt));
        case StmtKind::Break:
            return ControlFlow::breaking();
        case StmtKind::Continue:
            return ControlFlow::continuing();
        case StmtKind::Del:
            return execDel(static_cast<const DelStmt &>(stmt));
        case StmtKind::Import:
            return execImport(static_cast<const ImportStmt &>(stmt));
        case StmtKind::Expr:
        {
            EvalResult value = evalExpr(*static_cast<const ExprStmt &>(stmt).expr);
            if (!value.isOk())
                return ExecResult::error(value.error());
            return ControlFlow::normal(std::move(value.value()));
        }
    }
    return ExecResult::error("unknown statement kind");
}

Interpreter::ExecResult Interpreter::execLet(const LetStmt &stmt)
{
    EvalResult init = evalExpr(*stmt.init);
    if (!init.isOk())
        return ExecResult::error(init.error());

    auto defined = env_.define(stmt.name, std::move(init.value()), !stmt.isConst);
    if (!defined.isOk())
        return ExecResult::error(defined.error());
    return ControlFlow::normal();
}

/// @brief Bind a function value capturing a snapshot of the current chain.
/// @details The snapshot is taken before the name itself is bound; callValue
///          supplies the self binding so recursion still resolves.
Interpreter::ExecResult Interpreter::execFn(const FnStmt &stmt)
{
    auto fn = std::make_shared<FunctionValue>();
    fn->name = stmt.name;
    fn->params = stmt.params;
    fn->decl = std::shared_ptr<const FnStmt>(astOwner_, &stmt);
    fn->closure = env_;

    auto defined = env_.define(stmt.name, Value::function(std::move(fn)), false);
    if (!defined.isOk())
        return ExecResult::error(defined.error());
    return ControlFlow::normal();
}

Result<bool> Interpreter::evalCondition(const Expr &expr, const char *construct)
{
    EvalResult cond = evalExpr(expr);
    if (!cond.isOk())
        return Result<bool>::error(cond.error());
    if (!cond.value().is(ValueKind::Bool))
        return Result<bool>::error(std::string("Type error: ") + construct +
                                   " condition must be a Boolean, got " +
                                   valueKindName(cond.value().kind()));
    return cond.value().asBool();
}

/// @brief Branch bodies share the enclosing scope.
Interpreter::ExecResult Interpreter::execIf(const IfStmt &stmt)
{
    auto taken = evalCondition(*stmt.primary.condition, "if");
    if (!taken.isOk())
        return ExecResult::error(taken.error());
    if (taken.value())
        return execBlock(stmt.primary.body);

    for (const auto &branch : stmt.elifs)
    {
        auto elifTaken = evalCondition(*branch.condition, "elif");
        if (!elifTaken.isOk())
            return ExecResult::error(elifTaken.error());
        if (elifTaken.value())
            return execBlock(branch.body);
    }

    if (stmt.elseBody)
        return execBlock(*stmt.elseBody);
    return ControlFlow::normal();
}

Interpreter::ExecResult Interpreter::execIteration(const StmtList &body)
{
    env_.pushScope();
    ExecResult result = execBlock(body);
    env_.popScope();
    return result;
}

Interpreter::ExecResult Interpreter::execWhile(const WhileStmt &stmt)
{
    while (true)
    {
        auto cond = evalCondition(*stmt.condition, "while");
        if (!cond.isOk())
            return ExecResult::error(cond.error());
        if (!cond.value())
            break;

        ExecResult result = execIteration(stmt.body);
        if (!result.isOk())
            return result;
        if (result.value().kind == ControlFlow::Kind::Break)
            break;
        if (result.value().kind == ControlFlow::Kind::Return)
            return result;
    }
    return ControlFlow::normal();
}

Interpreter::ExecResult Interpreter::execLoop(const LoopStmt &stmt)
{
    while (true)
    {
        ExecResult result = execIteration(stmt.body);
        if (!result.isOk())
            return result;
        if (result.value().kind == ControlFlow::Kind::Break)
            break;
        if (result.value().kind == ControlFlow::Kind::Return)
            return result;
    }
    return ControlFlow::normal();
}

namespace
{

/// @brief Split UTF-8 text into one-scalar strings.
ValueList splitScalars(const std::string &text)
{
    ValueList out;
    size_t i = 0;
    while (i < text.size())
    {
        size_t len = 1;
        while (i + len < text.size() &&
               (static_cast<unsigned char>(text[i + len]) & 0xC0) == 0x80)
            ++len;
        out.push_back(Value::string(text.substr(i, len)));
        i += len;
    }
    return out;
}

} // namespace

/// @brief Iterate a String, Array, Tuple (one name) or HashMap (two names).
Interpreter::ExecResult Interpreter::execFor(const ForStmt &stmt)
{
    EvalResult iterable = evalExpr(*stmt.iterable);
    if (!iterable.isOk())
        return ExecResult::error(iterable.error());

    const Value &subject = iterable.value();
    const size_t arity = stmt.names.size();
    const ValueKind kind = subject.kind();
    const char *kindName = valueKindName(kind);

    switch (kind)
    {
        case ValueKind::String:
        case ValueKind::Array:
        case ValueKind::Tuple:
            if (arity != 1)
                return ExecResult::error(std::string("for loop over ") + kindName +
                                         " takes exactly one loop variable");
            break;
        case ValueKind::HashMap:
            if (arity != 2)
                return ExecResult::error(
                    "for loop over HashMap requires two loop variables (key, value)");
            break;
        default:
            return ExecResult::error(std::string("Cannot iterate over ") + kindName);
    }

    // Loop variables live in the enclosing scope and must not replace a
    // constant declared there.
    for (const auto &name : stmt.names)
    {
        const Binding *existing = env_.findLocal(name);
        if (existing && !existing->isMutable)
            return ExecResult::error("Cannot assign to constant '" + name + "'");
    }
    for (const auto &name : stmt.names)
        env_.declare(name, Value(), true);

    // Returns false when the loop should stop; `out` then holds the result.
    auto iterate = [&](ExecResult &out) -> bool
    {
        out = execIteration(stmt.body);
        if (!out.isOk())
            return false;
        switch (out.value().kind)
        {
            case ControlFlow::Kind::Break:
                out = ControlFlow::normal();
                return false;
            case ControlFlow::Kind::Return:
                return false;
            default:
                return true;
        }
    };

    ExecResult outcome = ControlFlow::normal();
    if (kind == ValueKind::HashMap)
    {
        for (const auto &entry : subject.entries())
        {
            env_.declare(stmt.names[0], entry.key, true);
            env_.declare(stmt.names[1], entry.value, true);
            if (!iterate(outcome))
                return outcome;
        }
    }
    else
    {
        const ValueList scalars = kind == ValueKind::String ? splitScalars(subject.asString()) : ValueList{};
        const ValueList &items = kind == ValueKind::String ? scalars : subject.elements();
        for (const auto &item : items)
        {
            env_.declare(stmt.names[0], item, true);
            if (!iterate(outcome))
                return outcome;
        }
    }
    return ControlFlow::normal();
}

Interpreter::ExecResult Interpreter::execReturn(const ReturnStmt &stmt)
{
    if (!stmt.value)
        return ControlFlow::returning(Value());

    EvalResult value = evalExpr(*stmt.value);
    if (!value.isOk())
        return ExecResult::error(value.error());
    return ControlFlow::returning(std::move(value.value()));
}

Interpreter::ExecResult Interpreter::execDel(const DelStmt &stmt)
{
    auto removed = env_.remove(stmt.name);
    if (!removed.isOk())
        return ExecResult::error(removed.error());
    return ControlFlow::normal();
}

Interpreter::ExecResult Interpreter::execImport(const ImportStmt &stmt)
{
    Value module;
    if (auto builtin = lookupBuiltinModule(stmt.path))
    {
        support::debugTrace("import", "builtin module '" + stmt.path + "'");
        module = std::move(*builtin);
    }
    else
    {
        EvalResult loaded = loadFileModule(stmt.path);
        if (!loaded.isOk())
            return ExecResult::error(loaded.error());
        // Already loaded in this run: nothing to bind.
        if (loaded.value().isNull())
            return ControlFlow::normal();
        module = std::move(loaded.value());
    }

    auto defined = env_.define(stmt.alias, std::move(module), false);
    if (!defined.isOk())
        return ExecResult::error(defined.error());
    return ControlFlow::normal();
}

} // namespace nikl::runtime
