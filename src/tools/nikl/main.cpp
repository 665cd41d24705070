//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the nikl command-line tool (Nikl interpreter).
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the `nikl` CLI tool.
/// @details Without a file argument the tool starts the REPL. With a file it
///          loads the script, then dumps tokens, checks syntax or runs it.

#include "frontends/nikl/Lexer.hpp"
#include "frontends/nikl/Parser.hpp"
#include "runtime/nikl/Interpreter.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"
#include "tools/nikl/cli.hpp"
#include "tools/nikl/repl.hpp"
#include "tools/nikl/source_loader.hpp"

#include <filesystem>
#include <iostream>
#include <memory>

namespace
{

using namespace nikl;

void dumpTokens(const std::vector<frontends::Token> &tokens)
{
    for (const auto &tok : tokens)
    {
        std::cout << tok.loc.line << ':' << tok.loc.column << ' '
                  << frontends::tokenKindToString(tok.kind);
        if (!tok.text.empty())
            std::cout << ' ' << tok.text;
        std::cout << '\n';
    }
}

int runScript(const tools::ToolConfig &config)
{
    support::SourceManager sm;
    auto script = tools::loadScript(config.sourcePath, sm);
    if (!script)
    {
        std::cerr << "error: " << script.error().message << "\n";
        return 1;
    }

    support::DiagnosticEngine diags;

    auto tokens = frontends::tokenize(script.value().buffer, script.value().fileId);
    if (!tokens)
    {
        diags.report(tokens.error());
        diags.printAll(std::cerr, &sm);
        return 1;
    }

    if (config.dumpTokens)
    {
        dumpTokens(tokens.value());
        return 0;
    }

    auto stmts = frontends::parse(std::move(tokens.value()));
    if (!stmts)
    {
        diags.report(stmts.error());
        diags.printAll(std::cerr, &sm);
        return 1;
    }

    if (config.checkOnly)
    {
        std::cout << config.sourcePath << ": syntax OK\n";
        return 0;
    }

    runtime::InterpreterOptions options;
    std::filesystem::path dir = std::filesystem::path(config.sourcePath).parent_path();
    options.basePath = dir.empty() ? std::filesystem::path(".") : dir;
    runtime::Interpreter interp(std::move(options));

    auto program = std::make_shared<const frontends::StmtList>(std::move(stmts.value()));
    auto outcome = interp.run(program);
    if (!outcome.isOk())
    {
        std::cerr << "error: " << outcome.error() << "\n";
        return 1;
    }
    return 0;
}

} // namespace

/// @brief Main entry point for the Nikl interpreter CLI.
/// @param argc Number of command-line arguments in @p argv.
/// @param argv Argument vector passed to the process.
/// @return 0 on success, 1 on any load, syntax or runtime error.
int main(int argc, char **argv)
{
    auto parsed = nikl::tools::parseArgs(argc, argv);
    if (!parsed.config)
        return parsed.exitCode;

    if (parsed.config->sourcePath.empty())
        return nikl::tools::runRepl(std::cin, std::cout, std::cerr);

    return runScript(*parsed.config);
}
