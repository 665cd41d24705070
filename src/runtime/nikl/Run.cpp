//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Run.cpp
/// @brief One-shot runSource/runFile entry points declared in nikl/Nikl.hpp.
///
//===----------------------------------------------------------------------===//

#include "nikl/Nikl.hpp"

#include "frontends/nikl/Lexer.hpp"
#include "frontends/nikl/Parser.hpp"
#include "runtime/nikl/Interpreter.hpp"

#include <fstream>
#include <memory>
#include <sstream>

namespace nikl
{

using support::Result;

Result<runtime::Value> runSource(std::string_view source, const std::filesystem::path &basePath)
{
    auto tokens = frontends::tokenize(source);
    if (!tokens)
        return Result<runtime::Value>::error(tokens.error().message);

    auto stmts = frontends::parse(std::move(tokens.value()));
    if (!stmts)
        return Result<runtime::Value>::error(stmts.error().message);

    runtime::InterpreterOptions options;
    options.basePath = basePath;
    runtime::Interpreter interp(std::move(options));

    auto program = std::make_shared<const frontends::StmtList>(std::move(stmts.value()));
    auto outcome = interp.run(program);
    if (!outcome.isOk())
        return Result<runtime::Value>::error(outcome.error());
    return outcome.value().value;
}

Result<runtime::Value> runFile(const std::filesystem::path &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return Result<runtime::Value>::error("unable to open " + path.string());

    std::ostringstream ss;
    ss << in.rdbuf();
    return runSource(ss.str(), path.parent_path().empty() ? std::filesystem::path(".")
                                                          : path.parent_path());
}

} // namespace nikl
