//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Environment.hpp
/// @brief Lexical scope chain for the Nikl interpreter.
///
/// @details An Environment is the innermost scope of a chain. Each scope owns
/// its bindings and, through a unique_ptr, its parent scope; there are no back
/// references. Copying an Environment copies the whole chain, which is how a
/// function captures the scopes visible at its definition.
///
/// | Operation | Scope searched            | Fails when                   |
/// |-----------|---------------------------|------------------------------|
/// | define    | innermost only            | name already in that scope   |
/// | get       | innermost outward         | name unbound                 |
/// | assign    | innermost outward         | unbound, or binding is const |
/// | remove    | innermost outward         | name unbound                 |
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/nikl/AST_Stmt.hpp"
#include "runtime/nikl/Value.hpp"
#include "support/result.hpp"

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace nikl::runtime
{

/// @brief A named slot in a scope.
struct Binding
{
    Value value;
    bool isMutable = true;
};

class Environment
{
  public:
    Environment() = default;

    /// @brief Deep copy of the whole scope chain.
    Environment(const Environment &other);
    Environment &operator=(const Environment &other);

    Environment(Environment &&) noexcept = default;
    Environment &operator=(Environment &&) noexcept = default;

    /// @brief Bind @p name in the innermost scope.
    /// @return Error "Variable 'x' is already declared in this scope" when the
    ///         innermost scope already holds @p name.
    support::Result<void> define(const std::string &name, Value value, bool isMutable);

    /// @brief Bind or rebind @p name in the innermost scope, ignoring any
    ///        previous binding there.
    void declare(const std::string &name, Value value, bool isMutable);

    /// @brief Resolve @p name through the chain.
    support::Result<Value> get(const std::string &name) const;

    /// @brief Nearest binding for @p name, or nullptr.
    const Binding *find(const std::string &name) const;

    /// @brief Binding for @p name in the innermost scope only, or nullptr.
    const Binding *findLocal(const std::string &name) const;

    /// @brief Overwrite the nearest binding of @p name.
    support::Result<void> assign(const std::string &name, Value value);

    /// @brief Remove the nearest binding of @p name.
    support::Result<void> remove(const std::string &name);

    /// @brief Enter a new innermost scope; the current one becomes its parent.
    void pushScope();

    /// @brief Discard the innermost scope. No-op on the outermost scope.
    void popScope();

    /// @brief Number of scopes in the chain.
    [[nodiscard]] size_t depth() const;

    /// @brief Every visible binding, inner scopes shadowing outer ones,
    ///        sorted by name.
    /// @param skipOutermost Number of outermost scopes to leave out.
    std::vector<std::pair<std::string, Value>> flatten(size_t skipOutermost = 0) const;

  private:
    Binding *findMutable(const std::string &name);

    std::map<std::string, Binding> values_;
    std::unique_ptr<Environment> parent_;
};

/// @brief A user-defined function together with its captured scope chain.
/// @details @c decl aliases the program that owns the FnStmt, keeping the
///          body alive for as long as the function value exists.
struct FunctionValue
{
    std::string name;
    std::vector<std::string> params;
    std::shared_ptr<const frontends::FnStmt> decl;
    Environment closure;
};

} // namespace nikl::runtime
