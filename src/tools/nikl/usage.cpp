//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements usage and version output for the `nikl` tool.

#include "tools/nikl/usage.hpp"

#include "nikl/Nikl.hpp"

#include <iostream>

namespace nikl::tools
{

/// @brief Print the tool name and version to stdout.
void printVersion()
{
    std::cout << "nikl v" << NIKL_VERSION_STR << "\n";
}

/// @brief Print usage information for the `nikl` command to stderr.
void printUsage()
{
    std::cerr << "nikl v" << NIKL_VERSION_STR << " - Nikl interpreter\n"
              << "\n"
              << "Usage: nikl [options] [file.nk]\n"
              << "\n"
              << "Usage Modes:\n"
              << "  nikl                        Start the interactive REPL\n"
              << "  nikl script.nk              Run program\n"
              << "  nikl script.nk --check      Lex and parse only\n"
              << "  nikl script.nk --dump-tokens\n"
              << "                              Print the token stream\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help                  Show this message\n"
              << "  --version                   Show version information\n"
              << "  --check                     Report syntax errors without running\n"
              << "  --dump-tokens               Print LINE:COL KIND [text] per token\n"
              << "\n"
              << "Environment:\n"
              << "  NIKL_DEBUG=1                Trace lex/parse/run/import phases\n";
}

} // namespace nikl::tools
