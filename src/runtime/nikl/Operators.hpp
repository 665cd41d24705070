//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: runtime/nikl/Operators.hpp
// Purpose: Binary and unary operator evaluation over runtime values.
// Key invariants: Operands are fully evaluated before dispatch; every
//                 unsupported kind/operator combination is an error, never a
//                 silent conversion.
// Ownership/Lifetime: Stateless free functions.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/nikl/AST_Expr.hpp"
#include "runtime/nikl/Value.hpp"
#include "support/result.hpp"

namespace nikl::runtime
{

/// @brief Apply @p op to an evaluated operand pair.
/// @details Dispatches on the pair of operand kinds:
///
/// | Pair                         | Operators                              |
/// |------------------------------|----------------------------------------|
/// | Integer, Integer             | + - * / == != < <= > >= (checked)      |
/// | Float/Integer mixes, Float   | + - * / == != < <= > >=                |
/// | String, String               | + == !=                                |
/// | Bool, Bool                   | and or == !=                           |
/// | String, Bool / Bool, String  | + (boolean rendered as True/False)     |
///
/// Integer operands are promoted to Float in mixed pairs. A zero divisor is
/// reported as "Division by zero" before dividing.
support::Result<Value> applyBinary(frontends::BinaryOp op, const Value &lhs, const Value &rhs);

/// @brief `-` on Integer, `not` on Bool.
support::Result<Value> applyUnary(frontends::UnaryOp op, const Value &operand);

} // namespace nikl::runtime
