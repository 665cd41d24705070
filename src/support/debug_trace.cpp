//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file debug_trace.cpp
/// @brief Environment-gated trace output for the lexer, parser and interpreter.
///
//===----------------------------------------------------------------------===//

#include "support/debug_trace.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace nikl::support
{

bool isDebugTraceEnabled()
{
    static const bool enabled = []
    {
        const char *flag = std::getenv("NIKL_DEBUG");
        return flag != nullptr && std::strcmp(flag, "0") != 0;
    }();
    return enabled;
}

void debugTrace(std::string_view phase, std::string_view detail)
{
    if (!isDebugTraceEnabled())
        return;
    std::cerr << "[nikl] " << phase;
    if (!detail.empty())
        std::cerr << ": " << detail;
    std::cerr << '\n';
}

} // namespace nikl::support
