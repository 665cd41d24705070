//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Modules.cpp
/// @brief Registry of builtin modules.
///
//===----------------------------------------------------------------------===//

#include "runtime/nikl/Modules.hpp"

#include <array>

namespace nikl::runtime
{

namespace
{

struct ModuleEntry
{
    std::string_view name;
    Value (*factory)();
};

constexpr std::array<ModuleEntry, 2> kModuleTable = {{
    {"os", &makeOsModule},
    {"regex", &makeRegexModule},
}};

} // namespace

std::optional<Value> lookupBuiltinModule(std::string_view name)
{
    for (const auto &entry : kModuleTable)
    {
        if (entry.name == name)
            return entry.factory();
    }
    return std::nullopt;
}

} // namespace nikl::runtime
