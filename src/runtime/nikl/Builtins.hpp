//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: runtime/nikl/Builtins.hpp
// Purpose: Prelude builtins bound in every root environment, and argument
//          checking helpers shared with the host modules.
// Key invariants: Builtins validate their own arity and argument kinds and
//                 report failures as Result errors.
// Ownership/Lifetime: Builtin values share immutable callable state.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "runtime/nikl/Environment.hpp"
#include "runtime/nikl/Value.hpp"
#include "support/result.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nikl::runtime
{

/// @brief Names and values of the prelude: print, len, str, int, float,
///        bool, exit, type, input.
std::vector<std::pair<std::string, Value>> preludeBuiltins();

/// @brief Bind every prelude builtin immutably in the innermost scope of @p env.
void installPrelude(Environment &env);

/// @brief "<fn>() takes exactly N argument(s)" unless args.size() == @p count.
support::Result<void> checkArity(std::string_view fn, const ValueList &args, size_t count);

/// @brief Fetch args[@p index] as a string or fail with
///        "<fn> expects a string <what>".
support::Result<std::string> stringArg(std::string_view fn,
                                       const ValueList &args,
                                       size_t index,
                                       std::string_view what);

/// @brief Build a HashMap record from name/builtin pairs.
Value makeRecord(std::vector<std::pair<std::string, BuiltinFn>> members);

} // namespace nikl::runtime
