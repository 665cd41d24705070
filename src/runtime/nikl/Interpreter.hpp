//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Interpreter.hpp
/// @brief Tree-walking evaluator for Nikl programs.
///
/// @details The interpreter executes a parsed statement list against an owned
/// Environment. Statement execution yields a ControlFlow signal; statement
/// lists stop at the first signal other than Kind::Value and hand it upward,
/// which is how `return`, `break` and `continue` unwind. Runtime errors are
/// Result errors and abort the whole run.
///
/// ## Scoping
///
/// - The root scope holds the prelude builtins; top-level bindings live in a
///   child scope so scripts may shadow builtin names.
/// - `if` bodies run in the current scope: bindings made inside a branch stay
///   visible after the statement.
/// - Each iteration of `loop`, `while` and `for` runs in a fresh child scope.
///   `for` variables are bound in the enclosing scope and hold the last item
///   after the loop.
/// - Calls run in a copy of the callee's captured chain, extended by a scope
///   binding the function's own name and a scope binding the parameters.
///
/// ## Modules
///
/// `import` first consults the builtin module table. Otherwise the path is
/// resolved against basePath, canonicalized and executed by a nested
/// interpreter rooted at the module's directory. The module's top-level
/// bindings become a HashMap bound immutably under the alias. A canonical path
/// already in loadedModules is skipped without error. A path is recorded only
/// once its module has run successfully.
///
/// @invariant The program passed to run() outlives every function value
///            created from it; function values share ownership of it.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/nikl/AST.hpp"
#include "runtime/nikl/ControlFlow.hpp"
#include "runtime/nikl/Environment.hpp"
#include "runtime/nikl/Value.hpp"
#include "support/result.hpp"

#include <filesystem>
#include <memory>
#include <set>
#include <string>

namespace nikl::runtime
{

/// @brief Shared handle on a parsed program.
using ProgramPtr = std::shared_ptr<const frontends::StmtList>;

/// @brief Construction parameters for an Interpreter.
struct InterpreterOptions
{
    /// @brief Directory that relative import paths resolve against.
    std::filesystem::path basePath = ".";

    /// @brief Canonical paths of modules that must not be executed again.
    std::set<std::string> loadedModules;
};

class Interpreter
{
  public:
    explicit Interpreter(InterpreterOptions options = {});

    /// @brief Execute @p program in this interpreter's environment.
    /// @details Bindings persist across calls, so a REPL can feed one chunk at
    ///          a time. A top-level `return`, `break` or `continue` ends the run
    ///          and is returned as the signal.
    support::Result<ControlFlow> run(ProgramPtr program);

    Environment &environment()
    {
        return env_;
    }

    const Environment &environment() const
    {
        return env_;
    }

    const std::filesystem::path &basePath() const
    {
        return basePath_;
    }

    const std::set<std::string> &loadedModules() const
    {
        return loadedModules_;
    }

    /// @brief Top-level bindings as a HashMap record, prelude excluded.
    Value exportBindings() const;

  private:
    using ExecResult = support::Result<ControlFlow>;
    using EvalResult = support::Result<Value>;

    //=========================================================================
    // Statements
    //=========================================================================

    ExecResult execBlock(const frontends::StmtList &stmts);
    ExecResult execStmt(const frontends::Stmt &stmt);
    ExecResult execLet(const frontends::LetStmt &stmt);
    ExecResult execFn(const frontends::FnStmt &stmt);
    ExecResult execIf(const frontends::IfStmt &stmt);
    ExecResult execWhile(const frontends::WhileStmt &stmt);
    ExecResult execFor(const frontends::ForStmt &stmt);
    ExecResult execLoop(const frontends::LoopStmt &stmt);
    ExecResult execReturn(const frontends::ReturnStmt &stmt);
    ExecResult execDel(const frontends::DelStmt &stmt);
    ExecResult execImport(const frontends::ImportStmt &stmt);

    /// @brief Run one loop iteration body in a child scope.
    ExecResult execIteration(const frontends::StmtList &body);

    /// @brief Evaluate an `if`/`while` condition, which must be a Bool.
    support::Result<bool> evalCondition(const frontends::Expr &expr, const char *construct);

    //=========================================================================
    // Expressions
    //=========================================================================

    EvalResult evalExpr(const frontends::Expr &expr);
    EvalResult evalAssign(const frontends::AssignExpr &expr);
    EvalResult evalBinary(const frontends::BinaryExpr &expr);
    EvalResult evalUnary(const frontends::UnaryExpr &expr);
    EvalResult evalCall(const frontends::CallExpr &expr);
    EvalResult evalDot(const frontends::DotExpr &expr);
    EvalResult evalElements(const std::vector<frontends::ExprPtr> &exprs, ValueKind kind);
    EvalResult evalMap(const frontends::MapLiteralExpr &expr);

    /// @brief Invoke a Function or BuiltinFunction value.
    EvalResult callValue(const Value &callee, const ValueList &args);

    //=========================================================================
    // Modules
    //=========================================================================

    /// @brief Load, execute and export the file module at @p path.
    /// @return The exported record, or Null when the module was already loaded.
    EvalResult loadFileModule(const std::string &path);

    Environment env_;
    std::filesystem::path basePath_;
    std::set<std::string> loadedModules_;

    /// @brief Owner of the statements currently executing; captured by
    ///        function values created by `fn` statements.
    std::shared_ptr<const void> astOwner_;
};

} // namespace nikl::runtime
