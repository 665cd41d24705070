//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Stmt.hpp
/// @brief Statement node definitions for the Nikl AST.
///
/// Block-delimited constructs own their bodies as StmtList values. Type
/// annotations on function signatures are validated by the parser and not
/// stored.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/nikl/AST_Expr.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nikl::frontends
{

enum class StmtKind
{
    Let,
    Fn,
    If,
    While,
    For,
    Loop,
    Return,
    Break,
    Continue,
    Del,
    Import,
    Expr,
};

/// @brief Base class for all statement nodes.
struct Stmt
{
    StmtKind kind;
    SourceLoc loc;

    Stmt(StmtKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~Stmt() = default;
};

/// @brief `let name = init` or `const name = init`.
struct LetStmt : Stmt
{
    std::string name;
    ExprPtr init;
    bool isConst;

    LetStmt(SourceLoc l, std::string n, ExprPtr i, bool c)
        : Stmt(StmtKind::Let, l), name(std::move(n)), init(std::move(i)), isConst(c)
    {
    }
};

/// @brief `fn name(params) [-> T] { body }`.
struct FnStmt : Stmt
{
    std::string name;
    std::vector<std::string> params;
    StmtList body;

    FnStmt(SourceLoc l, std::string n, std::vector<std::string> p, StmtList b)
        : Stmt(StmtKind::Fn, l), name(std::move(n)), params(std::move(p)), body(std::move(b))
    {
    }
};

/// @brief One `if` or `elif` arm.
struct CondBranch
{
    ExprPtr condition;
    StmtList body;
};

/// @brief `if c { } elif c { } ... else { }`.
struct IfStmt : Stmt
{
    CondBranch primary;
    std::vector<CondBranch> elifs;
    std::optional<StmtList> elseBody;

    IfStmt(SourceLoc l, CondBranch p, std::vector<CondBranch> e, std::optional<StmtList> eb)
        : Stmt(StmtKind::If, l), primary(std::move(p)), elifs(std::move(e)), elseBody(std::move(eb))
    {
    }
};

struct WhileStmt : Stmt
{
    ExprPtr condition;
    StmtList body;

    WhileStmt(SourceLoc l, ExprPtr c, StmtList b)
        : Stmt(StmtKind::While, l), condition(std::move(c)), body(std::move(b))
    {
    }
};

/// @brief `for a in xs { }` or `for k, v in map { }`.
/// @invariant names holds one or two entries.
struct ForStmt : Stmt
{
    std::vector<std::string> names;
    ExprPtr iterable;
    StmtList body;

    ForStmt(SourceLoc l, std::vector<std::string> n, ExprPtr i, StmtList b)
        : Stmt(StmtKind::For, l), names(std::move(n)), iterable(std::move(i)), body(std::move(b))
    {
    }
};

struct LoopStmt : Stmt
{
    StmtList body;

    LoopStmt(SourceLoc l, StmtList b) : Stmt(StmtKind::Loop, l), body(std::move(b)) {}
};

/// @brief `return expr`; value is null for a bare `return`.
struct ReturnStmt : Stmt
{
    ExprPtr value;

    ReturnStmt(SourceLoc l, ExprPtr v) : Stmt(StmtKind::Return, l), value(std::move(v)) {}
};

struct BreakStmt : Stmt
{
    explicit BreakStmt(SourceLoc l) : Stmt(StmtKind::Break, l) {}
};

struct ContinueStmt : Stmt
{
    explicit ContinueStmt(SourceLoc l) : Stmt(StmtKind::Continue, l) {}
};

/// @brief `del name`.
struct DelStmt : Stmt
{
    std::string name;

    DelStmt(SourceLoc l, std::string n) : Stmt(StmtKind::Del, l), name(std::move(n)) {}
};

/// @brief `import "path" as alias`.
struct ImportStmt : Stmt
{
    std::string path;
    std::string alias;

    ImportStmt(SourceLoc l, std::string p, std::string a)
        : Stmt(StmtKind::Import, l), path(std::move(p)), alias(std::move(a))
    {
    }
};

/// @brief Expression evaluated for its side effects.
struct ExprStmt : Stmt
{
    ExprPtr expr;

    ExprStmt(SourceLoc l, ExprPtr e) : Stmt(StmtKind::Expr, l), expr(std::move(e)) {}
};

} // namespace nikl::frontends
