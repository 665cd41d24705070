//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: runtime/nikl/Modules.hpp
// Purpose: Host-provided modules importable by name (`import "os" as os`).
// Key invariants: Each factory builds a fresh HashMap record of builtins;
//                 builtin module names take precedence over file imports.
// Ownership/Lifetime: Records are immutable values.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "runtime/nikl/Value.hpp"

#include <optional>
#include <string_view>

namespace nikl::runtime
{

/// @brief Filesystem, working-directory and environment-variable access.
Value makeOsModule();

/// @brief ECMAScript regular expressions: match, is_match, find_all, replace.
Value makeRegexModule();

/// @brief Build the builtin module called @p name, if one exists.
std::optional<Value> lookupBuiltinModule(std::string_view name);

} // namespace nikl::runtime
