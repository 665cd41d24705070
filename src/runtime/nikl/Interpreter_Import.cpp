//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: runtime/nikl/Interpreter_Import.cpp
// Purpose: Resolve, load and execute file modules for `import`.
// Key invariants: A canonical path is executed at most once per import chain;
//                 the nested interpreter starts from a fresh prelude scope.
// Ownership/Lifetime: The parsed module is shared with any function values it
//                     exports, so it outlives the nested interpreter.
//
//===----------------------------------------------------------------------===//

#include "runtime/nikl/Interpreter.hpp"

#include "frontends/nikl/Lexer.hpp"
#include "frontends/nikl/Parser.hpp"
#include "support/debug_trace.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace nikl::runtime
{

namespace fs = std::filesystem;

namespace
{

/// @brief Join @p path onto @p base and canonicalize, appending ".nk" when
///        the path names no extension.
support::Result<fs::path> resolveModulePath(const fs::path &base, const std::string &path)
{
    fs::path candidate = base / path;
    if (!candidate.has_extension())
        candidate += ".nk";

    std::error_code ec;
    fs::path canonical = fs::canonical(candidate, ec);
    if (ec)
        return support::Result<fs::path>::error("Cannot resolve import '" + path +
                                                "': " + ec.message());
    if (!fs::is_regular_file(canonical, ec))
        return support::Result<fs::path>::error("Cannot resolve import '" + path +
                                                "': not a regular file");
    return canonical;
}

support::Result<std::string> readModuleSource(const fs::path &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return support::Result<std::string>::error("cannot open file");
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

Interpreter::EvalResult Interpreter::loadFileModule(const std::string &path)
{
    auto resolved = resolveModulePath(basePath_, path);
    if (!resolved.isOk())
        return EvalResult::error(resolved.error());

    const fs::path &modulePath = resolved.value();
    const std::string key = modulePath.string();
    if (loadedModules_.count(key) != 0)
    {
        support::debugTrace("import", "skipping already loaded '" + key + "'");
        return Value();
    }
    support::debugTrace("import", "loading '" + key + "'");

    const std::string failure = "Error in module '" + key + "': ";

    auto source = readModuleSource(modulePath);
    if (!source.isOk())
        return EvalResult::error(failure + source.error());

    auto tokens = frontends::tokenize(source.value());
    if (!tokens)
        return EvalResult::error(failure + tokens.error().message);

    auto stmts = frontends::parse(std::move(tokens.value()));
    if (!stmts)
        return EvalResult::error(failure + stmts.error().message);

    InterpreterOptions options;
    options.basePath = modulePath.parent_path();
    options.loadedModules = loadedModules_;
    options.loadedModules.insert(key);
    Interpreter nested(std::move(options));

    auto program = std::make_shared<const frontends::StmtList>(std::move(stmts.value()));
    auto outcome = nested.run(program);
    if (!outcome.isOk())
        return EvalResult::error(failure + outcome.error());

    // Only a module that ran to completion counts as loaded, so a failed
    // import can be retried.
    loadedModules_.insert(key);
    return nested.exportBindings();
}

} // namespace nikl::runtime
