//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST.hpp
/// @brief Umbrella header for the Nikl AST.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/nikl/AST_Expr.hpp"
#include "frontends/nikl/AST_Fwd.hpp"
#include "frontends/nikl/AST_Stmt.hpp"
