//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Argument parsing for the `nikl` runner.

#include "tools/nikl/cli.hpp"

#include "tools/nikl/usage.hpp"

#include <iostream>
#include <string_view>

namespace nikl::tools
{

ParsedArgs parseArgs(int argc, char **argv)
{
    ToolConfig config{};

    auto fail = [](std::string_view message) -> ParsedArgs
    {
        std::cerr << "error: " << message << "\n\n";
        printUsage();
        return ParsedArgs{std::nullopt, 1};
    };

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help")
        {
            printUsage();
            return ParsedArgs{std::nullopt, 0};
        }
        else if (arg == "--version")
        {
            printVersion();
            return ParsedArgs{std::nullopt, 0};
        }
        else if (arg == "--dump-tokens")
        {
            config.dumpTokens = true;
        }
        else if (arg == "--check")
        {
            config.checkOnly = true;
        }
        else if (arg.starts_with("-"))
        {
            return fail("unknown option: " + std::string(arg));
        }
        else
        {
            if (!config.sourcePath.empty())
                return fail("multiple source files not supported");
            config.sourcePath = std::string(arg);
        }
    }

    if ((config.dumpTokens || config.checkOnly) && config.sourcePath.empty())
        return fail("no input file specified");

    return ParsedArgs{std::move(config), 0};
}

} // namespace nikl::tools
