//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/nikl/repl.hpp
// Purpose: Line-oriented read-eval-print loop over one persistent interpreter.
// Key invariants: A chunk is evaluated only once its braces balance; errors
//                 never end the loop.
// Ownership/Lifetime: Streams are borrowed for the duration of the call.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <iosfwd>
#include <string_view>

namespace nikl::tools
{

/// @brief Net count of '{' over '}' in @p text, ignoring string literals and
///        `//` comments.
[[nodiscard]] int braceBalance(std::string_view text);

/// @brief Run the REPL until `exit()` or end of input.
/// @param in Source of input lines.
/// @param out Receives the banner, prompts and non-None results.
/// @param err Receives diagnostics and runtime errors.
/// @return Process exit status (always 0).
int runRepl(std::istream &in, std::ostream &out, std::ostream &err);

} // namespace nikl::tools
