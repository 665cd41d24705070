//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/nikl/source_loader.hpp
// Purpose: Validate and load a script file for the `nikl` runner.
// Key invariants: A LoadedScript always holds a non-empty buffer registered
//                 with the SourceManager.
// Ownership/Lifetime: The caller owns the returned LoadedScript.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <cstdint>
#include <string>

namespace nikl::tools
{

/// @brief A script read into memory.
struct LoadedScript
{
    std::string buffer; ///< Full contents of the script.
    uint32_t fileId{0}; ///< Identifier assigned by the SourceManager.
};

/// @brief Load the script at @p path and register it with @p sm.
///
/// The path must name an existing regular file with the `.nk` extension and
/// non-empty contents. Every other case yields a diagnostic whose message is
/// suitable for printing after "error: ".
support::Expected<LoadedScript> loadScript(const std::string &path, support::SourceManager &sm);

} // namespace nikl::tools
