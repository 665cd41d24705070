//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/nikl/Nikl.hpp
// Purpose: Public entry points for embedding the Nikl interpreter.
// Key invariants: Each call runs in a fresh interpreter; nothing is shared
//                 between calls.
// Ownership/Lifetime: Returned values own their data.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "runtime/nikl/Value.hpp"
#include "support/result.hpp"

#include <filesystem>
#include <string_view>

#define NIKL_VERSION_MAJOR 0
#define NIKL_VERSION_MINOR 3
#define NIKL_VERSION_PATCH 0
#define NIKL_VERSION_STR "0.3.0"

namespace nikl
{

/// @brief Lex, parse and run @p source in a fresh interpreter.
/// @param basePath Directory that relative imports resolve against.
/// @return The value of the last top-level expression statement (None when
///         there is none), or the lex, parse or runtime error message.
support::Result<runtime::Value> runSource(std::string_view source,
                                          const std::filesystem::path &basePath = ".");

/// @brief Read @p path and run it with the file's directory as base path.
support::Result<runtime::Value> runFile(const std::filesystem::path &path);

} // namespace nikl
