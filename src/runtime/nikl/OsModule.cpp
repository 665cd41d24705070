//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file OsModule.cpp
/// @brief The `os` builtin module.
///
/// @details Thin wrappers over std::filesystem and the process environment.
/// Every host failure becomes a Result error of the form
/// "os.<function>: <reason>". Mutating operations return None.
///
//===----------------------------------------------------------------------===//

#include "runtime/nikl/Builtins.hpp"
#include "runtime/nikl/Modules.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace nikl::runtime
{

namespace fs = std::filesystem;
using support::Result;

namespace
{

Result<Value> hostError(std::string_view fn, const std::string &reason)
{
    return Result<Value>::error("os." + std::string(fn) + ": " + reason);
}

Result<Value> hostError(std::string_view fn, const std::string &path, const std::error_code &ec)
{
    return hostError(fn, path + ": " + ec.message());
}

/// @brief Check arity and fetch the single path argument shared by most calls.
Result<std::string> pathArg(std::string_view fn, const ValueList &args)
{
    auto arity = checkArity(fn, args, 1);
    if (!arity.isOk())
        return Result<std::string>::error(arity.error());
    return stringArg(fn, args, 0, "path");
}

Result<Value> osGetCwd(const ValueList &args)
{
    auto arity = checkArity("get_cwd", args, 0);
    if (!arity.isOk())
        return Result<Value>::error(arity.error());

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec)
        return hostError("get_cwd", ec.message());
    return Value::string(cwd.string());
}

Result<Value> osSetCwd(const ValueList &args)
{
    auto path = pathArg("set_cwd", args);
    if (!path.isOk())
        return Result<Value>::error(path.error());

    std::error_code ec;
    fs::current_path(path.value(), ec);
    if (ec)
        return hostError("set_cwd", path.value(), ec);
    return Value();
}

Result<Value> osListDir(const ValueList &args)
{
    auto path = pathArg("list_dir", args);
    if (!path.isOk())
        return Result<Value>::error(path.error());

    std::error_code ec;
    fs::directory_iterator it(path.value(), ec);
    if (ec)
        return hostError("list_dir", path.value(), ec);

    std::vector<std::string> names;
    for (fs::directory_iterator end; it != end; it.increment(ec))
    {
        if (ec)
            return hostError("list_dir", path.value(), ec);
        names.push_back(it->path().filename().string());
    }
    if (ec)
        return hostError("list_dir", path.value(), ec);

    std::sort(names.begin(), names.end());
    ValueList items;
    items.reserve(names.size());
    for (auto &name : names)
        items.push_back(Value::string(std::move(name)));
    return Value::array(std::move(items));
}

Result<Value> osMakeDir(const ValueList &args)
{
    auto path = pathArg("make_dir", args);
    if (!path.isOk())
        return Result<Value>::error(path.error());

    std::error_code ec;
    fs::create_directories(path.value(), ec);
    if (ec)
        return hostError("make_dir", path.value(), ec);
    return Value();
}

Result<Value> osRemoveDir(const ValueList &args)
{
    auto path = pathArg("remove_dir", args);
    if (!path.isOk())
        return Result<Value>::error(path.error());

    std::error_code ec;
    if (!fs::is_directory(path.value(), ec))
        return hostError("remove_dir", path.value() + ": not a directory");
    fs::remove_all(path.value(), ec);
    if (ec)
        return hostError("remove_dir", path.value(), ec);
    return Value();
}

Result<Value> osRemoveFile(const ValueList &args)
{
    auto path = pathArg("remove_file", args);
    if (!path.isOk())
        return Result<Value>::error(path.error());

    std::error_code ec;
    if (fs::is_directory(path.value(), ec))
        return hostError("remove_file", path.value() + ": is a directory");
    if (!fs::remove(path.value(), ec))
    {
        if (ec)
            return hostError("remove_file", path.value(), ec);
        return hostError("remove_file", path.value() + ": no such file");
    }
    return Value();
}

Result<Value> osRename(const ValueList &args)
{
    auto arity = checkArity("rename", args, 2);
    if (!arity.isOk())
        return Result<Value>::error(arity.error());
    auto from = stringArg("rename", args, 0, "source path");
    if (!from.isOk())
        return Result<Value>::error(from.error());
    auto to = stringArg("rename", args, 1, "destination path");
    if (!to.isOk())
        return Result<Value>::error(to.error());

    std::error_code ec;
    fs::rename(from.value(), to.value(), ec);
    if (ec)
        return hostError("rename", from.value() + " -> " + to.value() + ": " + ec.message());
    return Value();
}

Result<Value> osExists(const ValueList &args)
{
    auto path = pathArg("exists", args);
    if (!path.isOk())
        return Result<Value>::error(path.error());
    std::error_code ec;
    return Value::boolean(fs::exists(path.value(), ec));
}

Result<Value> osIsFile(const ValueList &args)
{
    auto path = pathArg("is_file", args);
    if (!path.isOk())
        return Result<Value>::error(path.error());
    std::error_code ec;
    return Value::boolean(fs::is_regular_file(path.value(), ec));
}

Result<Value> osIsDir(const ValueList &args)
{
    auto path = pathArg("is_dir", args);
    if (!path.isOk())
        return Result<Value>::error(path.error());
    std::error_code ec;
    return Value::boolean(fs::is_directory(path.value(), ec));
}

Result<Value> osReadFile(const ValueList &args)
{
    auto path = pathArg("read_file", args);
    if (!path.isOk())
        return Result<Value>::error(path.error());

    std::ifstream in(path.value(), std::ios::binary);
    if (!in)
        return hostError("read_file", "unable to open " + path.value());

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
        return hostError("read_file", "error reading " + path.value());
    return Value::string(ss.str());
}

Result<Value> osWriteFile(const ValueList &args)
{
    auto arity = checkArity("write_file", args, 2);
    if (!arity.isOk())
        return Result<Value>::error(arity.error());
    auto path = stringArg("write_file", args, 0, "path");
    if (!path.isOk())
        return Result<Value>::error(path.error());
    auto content = stringArg("write_file", args, 1, "content");
    if (!content.isOk())
        return Result<Value>::error(content.error());

    std::ofstream out(path.value(), std::ios::binary | std::ios::trunc);
    if (!out)
        return hostError("write_file", "unable to open " + path.value());
    out << content.value();
    if (!out.flush())
        return hostError("write_file", "error writing " + path.value());
    return Value();
}

Result<Value> osEnvGet(const ValueList &args)
{
    auto arity = checkArity("env_get", args, 1);
    if (!arity.isOk())
        return Result<Value>::error(arity.error());
    auto name = stringArg("env_get", args, 0, "variable name");
    if (!name.isOk())
        return Result<Value>::error(name.error());

    if (const char *value = std::getenv(name.value().c_str()))
        return Value::string(value);
    return Value();
}

Result<Value> osEnvSet(const ValueList &args)
{
    auto arity = checkArity("env_set", args, 2);
    if (!arity.isOk())
        return Result<Value>::error(arity.error());
    auto name = stringArg("env_set", args, 0, "variable name");
    if (!name.isOk())
        return Result<Value>::error(name.error());
    auto value = stringArg("env_set", args, 1, "value");
    if (!value.isOk())
        return Result<Value>::error(value.error());

    if (name.value().empty() || name.value().find('=') != std::string::npos)
        return hostError("env_set", "invalid variable name '" + name.value() + "'");
    if (::setenv(name.value().c_str(), value.value().c_str(), 1) != 0)
        return hostError("env_set", std::error_code(errno, std::generic_category()).message());
    return Value();
}

} // namespace

Value makeOsModule()
{
    return makeRecord({
        {"get_cwd", osGetCwd},
        {"set_cwd", osSetCwd},
        {"list_dir", osListDir},
        {"make_dir", osMakeDir},
        {"remove_dir", osRemoveDir},
        {"remove_file", osRemoveFile},
        {"rename", osRename},
        {"exists", osExists},
        {"is_file", osIsFile},
        {"is_dir", osIsDir},
        {"read_file", osReadFile},
        {"write_file", osWriteFile},
        {"env_get", osEnvGet},
        {"env_set", osEnvSet},
    });
}

} // namespace nikl::runtime
