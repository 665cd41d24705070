//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the `nikl` interactive loop.
/// @details Lines are appended to a pending chunk while the chunk has more
///          opening than closing braces. A complete chunk is lexed, parsed and
///          run against the same Interpreter, so bindings and functions carry
///          over from one chunk to the next.

#include "tools/nikl/repl.hpp"

#include "frontends/nikl/Lexer.hpp"
#include "frontends/nikl/Parser.hpp"
#include "nikl/Nikl.hpp"
#include "runtime/nikl/Interpreter.hpp"
#include "support/diag_expected.hpp"

#include <istream>
#include <memory>
#include <ostream>
#include <string>

namespace nikl::tools
{

namespace
{

constexpr std::string_view kPrompt = "> ";
constexpr std::string_view kContinuationPrompt = "... ";

std::string_view trimmed(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

/// @brief Lex, parse and run one complete chunk.
void evalChunk(runtime::Interpreter &interp, const std::string &chunk, std::ostream &out,
               std::ostream &err)
{
    auto tokens = frontends::tokenize(chunk);
    if (!tokens)
    {
        support::printDiag(tokens.error(), err);
        return;
    }

    auto stmts = frontends::parse(std::move(tokens.value()));
    if (!stmts)
    {
        support::printDiag(stmts.error(), err);
        return;
    }

    auto program = std::make_shared<const frontends::StmtList>(std::move(stmts.value()));
    auto outcome = interp.run(program);
    if (!outcome.isOk())
    {
        err << "error: " << outcome.error() << "\n";
        return;
    }

    const runtime::ControlFlow &flow = outcome.value();
    if (flow.isNormal() && !flow.value.isNull())
        out << flow.value.toString() << "\n";
}

} // namespace

int braceBalance(std::string_view text)
{
    int depth = 0;
    bool inString = false;
    for (size_t i = 0; i < text.size(); ++i)
    {
        const char c = text[i];
        if (inString)
        {
            if (c == '"')
                inString = false;
            continue;
        }
        if (c == '"')
            inString = true;
        else if (c == '/' && i + 1 < text.size() && text[i + 1] == '/')
        {
            // Skip to end of line.
            while (i < text.size() && text[i] != '\n')
                ++i;
        }
        else if (c == '{')
            ++depth;
        else if (c == '}')
            --depth;
    }
    return depth;
}

int runRepl(std::istream &in, std::ostream &out, std::ostream &err)
{
    out << "Nikl v" << NIKL_VERSION_STR << " REPL. Type exit() to quit.\n";

    runtime::Interpreter interp;
    std::string chunk;
    std::string line;

    out << kPrompt << std::flush;
    while (std::getline(in, line))
    {
        if (chunk.empty() && trimmed(line) == "exit()")
            break;

        chunk += line;
        chunk += '\n';

        if (braceBalance(chunk) > 0)
        {
            out << kContinuationPrompt << std::flush;
            continue;
        }

        if (!trimmed(chunk).empty())
            evalChunk(interp, chunk, out, err);
        chunk.clear();
        out << kPrompt << std::flush;
    }

    // A chunk cut off by end of input still runs so its errors are reported.
    if (!trimmed(chunk).empty())
        evalChunk(interp, chunk, out, err);
    out << "\n";
    return 0;
}

} // namespace nikl::tools
