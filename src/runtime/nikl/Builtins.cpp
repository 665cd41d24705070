//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Builtins.cpp
/// @brief The prelude functions available to every script.
///
//===----------------------------------------------------------------------===//

#include "runtime/nikl/Builtins.hpp"

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <limits>

namespace nikl::runtime
{

using support::Result;

namespace
{

const char *countWord(size_t n)
{
    switch (n)
    {
        case 0:
            return "zero arguments";
        case 1:
            return "one argument";
        case 2:
            return "two arguments";
        case 3:
            return "three arguments";
        default:
            return "more arguments";
    }
}

/// @brief Number of Unicode scalar values in UTF-8 text.
int64_t utf8Length(const std::string &s)
{
    int64_t n = 0;
    for (char c : s)
    {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
            ++n;
    }
    return n;
}

std::string trim(const std::string &s)
{
    const char *ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos)
        return {};
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

//===----------------------------------------------------------------------===//
// Prelude functions
//===----------------------------------------------------------------------===//

Result<Value> builtinPrint(const ValueList &args)
{
    std::string line;
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (i != 0)
            line += ' ';
        line += args[i].toString();
    }
    std::cout << line << '\n';
    return Value();
}

Result<Value> builtinLen(const ValueList &args)
{
    auto arity = checkArity("len", args, 1);
    if (!arity.isOk())
        return Result<Value>::error(arity.error());

    const Value &v = args[0];
    switch (v.kind())
    {
        case ValueKind::String:
            return Value::integer(utf8Length(v.asString()));
        case ValueKind::Array:
        case ValueKind::Tuple:
            return Value::integer(static_cast<int64_t>(v.elements().size()));
        case ValueKind::HashMap:
            return Value::integer(static_cast<int64_t>(v.entries().size()));
        default:
            return Result<Value>::error(std::string("len() does not support ") +
                                        valueKindName(v.kind()));
    }
}

Result<Value> builtinStr(const ValueList &args)
{
    auto arity = checkArity("str", args, 1);
    if (!arity.isOk())
        return Result<Value>::error(arity.error());
    return Value::string(args[0].toString());
}

Result<Value> builtinInt(const ValueList &args)
{
    auto arity = checkArity("int", args, 1);
    if (!arity.isOk())
        return Result<Value>::error(arity.error());

    const Value &v = args[0];
    switch (v.kind())
    {
        case ValueKind::Integer:
            return v;
        case ValueKind::Bool:
            return Value::integer(v.asBool() ? 1 : 0);
        case ValueKind::Float:
        {
            double f = v.asFloat();
            // Range check before the truncating cast.
            if (!(f >= -9223372036854775808.0 && f < 9223372036854775808.0))
                return Result<Value>::error("int() cannot convert " + formatFloat(f));
            return Value::integer(static_cast<int64_t>(f));
        }
        case ValueKind::String:
        {
            std::string text = trim(v.asString());
            const char *first = text.data();
            const char *last = first + text.size();
            if (first != last && *first == '+')
                ++first;
            int64_t out = 0;
            auto [ptr, ec] = std::from_chars(first, last, out);
            if (text.empty() || ec != std::errc() || ptr != last)
                return Result<Value>::error("Invalid string for int conversion: " + v.asString());
            return Value::integer(out);
        }
        default:
            return Result<Value>::error(std::string("int() does not support ") +
                                        valueKindName(v.kind()));
    }
}

Result<Value> builtinFloat(const ValueList &args)
{
    auto arity = checkArity("float", args, 1);
    if (!arity.isOk())
        return Result<Value>::error(arity.error());

    const Value &v = args[0];
    switch (v.kind())
    {
        case ValueKind::Float:
            return v;
        case ValueKind::Integer:
            return Value::floating(static_cast<double>(v.asInteger()));
        case ValueKind::String:
        {
            std::string text = trim(v.asString());
            const char *first = text.data();
            const char *last = first + text.size();
            if (first != last && *first == '+')
                ++first;
            double out = 0.0;
            auto [ptr, ec] = std::from_chars(first, last, out);
            if (text.empty() || ec != std::errc() || ptr != last)
                return Result<Value>::error("Invalid string for float conversion: " + v.asString());
            return Value::floating(out);
        }
        default:
            return Result<Value>::error(std::string("float() does not support ") +
                                        valueKindName(v.kind()));
    }
}

Result<Value> builtinBool(const ValueList &args)
{
    auto arity = checkArity("bool", args, 1);
    if (!arity.isOk())
        return Result<Value>::error(arity.error());

    const Value &v = args[0];
    switch (v.kind())
    {
        case ValueKind::Bool:
            return v;
        case ValueKind::Integer:
            return Value::boolean(v.asInteger() != 0);
        case ValueKind::Float:
            return Value::boolean(v.asFloat() != 0.0);
        case ValueKind::String:
            return Value::boolean(!v.asString().empty());
        case ValueKind::Array:
        case ValueKind::Tuple:
            return Value::boolean(!v.elements().empty());
        case ValueKind::HashMap:
            return Value::boolean(!v.entries().empty());
        case ValueKind::Null:
            return Value::boolean(false);
        default:
            return Value::boolean(true);
    }
}

Result<Value> builtinExit(const ValueList &args)
{
    auto arity = checkArity("exit", args, 1);
    if (!arity.isOk())
        return Result<Value>::error(arity.error());
    if (!args[0].is(ValueKind::Integer))
        return Result<Value>::error("exit() expects an integer exit code, got " +
                                    std::string(valueKindName(args[0].kind())));

    std::cout.flush();
    std::exit(static_cast<int>(args[0].asInteger()));
}

Result<Value> builtinType(const ValueList &args)
{
    auto arity = checkArity("type", args, 1);
    if (!arity.isOk())
        return Result<Value>::error(arity.error());
    return Value::string(valueKindName(args[0].kind()));
}

Result<Value> builtinInput(const ValueList &args)
{
    std::string prompt = "> ";
    if (args.size() > 1)
        return Result<Value>::error("input() takes at most one argument");
    if (args.size() == 1)
    {
        if (!args[0].is(ValueKind::String))
            return Result<Value>::error("input() argument must be a string");
        prompt = args[0].asString();
    }

    std::cout << prompt << std::flush;

    std::string line;
    if (!std::getline(std::cin, line) && !std::cin.eof())
        return Result<Value>::error("Failed to read input");
    return Value::string(trim(line));
}

} // namespace

//===----------------------------------------------------------------------===//
// Helpers
//===----------------------------------------------------------------------===//

Result<void> checkArity(std::string_view fn, const ValueList &args, size_t count)
{
    if (args.size() == count)
        return Result<void>::success();
    return Result<void>::error(std::string(fn) + "() takes exactly " + countWord(count) +
                               ", but got " + std::to_string(args.size()));
}

Result<std::string> stringArg(std::string_view fn,
                              const ValueList &args,
                              size_t index,
                              std::string_view what)
{
    if (index >= args.size() || !args[index].is(ValueKind::String))
        return Result<std::string>::error(std::string(fn) + " expects a string " + std::string(what));
    return args[index].asString();
}

Value makeRecord(std::vector<std::pair<std::string, BuiltinFn>> members)
{
    MapEntries entries;
    entries.reserve(members.size());
    for (auto &[name, fn] : members)
        entries.push_back(MapEntry{Value::string(name), Value::builtin(name, std::move(fn))});
    return Value::hashMap(std::move(entries));
}

std::vector<std::pair<std::string, Value>> preludeBuiltins()
{
    std::vector<std::pair<std::string, Value>> out;
    auto add = [&out](const char *name, BuiltinFn fn)
    { out.emplace_back(name, Value::builtin(name, std::move(fn))); };

    add("print", builtinPrint);
    add("len", builtinLen);
    add("str", builtinStr);
    add("int", builtinInt);
    add("float", builtinFloat);
    add("bool", builtinBool);
    add("exit", builtinExit);
    add("type", builtinType);
    add("input", builtinInput);
    return out;
}

void installPrelude(Environment &env)
{
    for (auto &[name, value] : preludeBuiltins())
        env.declare(name, std::move(value), false);
}

} // namespace nikl::runtime
