//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Usage and version printers for the `nikl` tool.

#pragma once

namespace nikl::tools
{

void printVersion();
void printUsage();

} // namespace nikl::tools
