//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Fwd.hpp
/// @brief Forward declarations and shared aliases for Nikl AST nodes.
///
/// @details Expressions and statements are mutually recursive only through
/// statement bodies, so the two families are declared here and defined in
/// AST_Expr.hpp and AST_Stmt.hpp.
///
/// @invariant All pointer aliases use std::unique_ptr. AST nodes form a tree
///            rooted at the top-level StmtList returned by the parser.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <memory>
#include <vector>

namespace nikl::frontends
{

struct Expr;
struct Stmt;

using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;

/// @brief Ordered statement sequence: a program, a block or a function body.
using StmtList = std::vector<StmtPtr>;

using SourceLoc = support::SourceLoc;

} // namespace nikl::frontends
