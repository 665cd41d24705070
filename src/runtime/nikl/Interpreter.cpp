//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Interpreter.cpp
/// @brief Interpreter construction, the run entry point and module export.
///
//===----------------------------------------------------------------------===//

#include "runtime/nikl/Interpreter.hpp"

#include "runtime/nikl/Builtins.hpp"
#include "support/debug_trace.hpp"

#include <utility>

namespace nikl::runtime
{

Interpreter::Interpreter(InterpreterOptions options)
    : basePath_(std::move(options.basePath)), loadedModules_(std::move(options.loadedModules))
{
    installPrelude(env_);
    env_.pushScope();
}

support::Result<ControlFlow> Interpreter::run(ProgramPtr program)
{
    if (!program)
        return ControlFlow::normal();

    if (support::isDebugTraceEnabled())
        support::debugTrace("run", std::to_string(program->size()) + " statements in " +
                                       basePath_.string());

    std::shared_ptr<const void> savedOwner = std::exchange(astOwner_, program);
    ExecResult result = execBlock(*program);
    astOwner_ = std::move(savedOwner);
    return result;
}

Value Interpreter::exportBindings() const
{
    // The outermost scope holds the prelude.
    MapEntries entries;
    for (auto &[name, value] : env_.flatten(1))
        entries.push_back(MapEntry{Value::string(name), std::move(value)});
    return Value::hashMap(std::move(entries));
}

} // namespace nikl::runtime
