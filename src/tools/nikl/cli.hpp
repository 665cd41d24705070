//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/nikl/cli.hpp
// Purpose: Command-line parsing for the `nikl` runner.
// Key invariants: At most one source file; mode flags require a file.
// Ownership/Lifetime: ToolConfig owns copies of the argument strings.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>

namespace nikl::tools
{

/// @brief Configuration parsed from `nikl` command-line arguments.
struct ToolConfig
{
    std::string sourcePath; ///< Empty selects the REPL
    bool dumpTokens = false;
    bool checkOnly = false;
};

/// @brief Outcome of argument parsing.
/// @details Either a configuration to act on, or an exit status when parsing
///          already handled the request (help, version) or rejected it.
struct ParsedArgs
{
    std::optional<ToolConfig> config;
    int exitCode = 0;
};

/// @brief Parse @p argv, printing usage or an error to stderr as needed.
ParsedArgs parseArgs(int argc, char **argv);

} // namespace nikl::tools
