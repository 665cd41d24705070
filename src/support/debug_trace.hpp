//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/debug_trace.hpp
// Purpose: Opt-in developer tracing controlled by the NIKL_DEBUG variable.
// Key invariants: The environment is consulted once per process.
// Ownership/Lifetime: Stateless aside from the cached flag.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace nikl::support
{

/// @brief Whether NIKL_DEBUG is set to a value other than "0".
[[nodiscard]] bool isDebugTraceEnabled();

/// @brief Emit "[nikl] <phase>: <detail>" on stderr when tracing is enabled.
void debugTrace(std::string_view phase, std::string_view detail);

} // namespace nikl::support
