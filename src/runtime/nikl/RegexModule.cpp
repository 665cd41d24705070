//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file RegexModule.cpp
/// @brief The `regex` builtin module.
///
/// @details Patterns use the ECMAScript grammar of std::regex and are compiled
/// on every call. std::regex reports bad patterns (and runaway matches) by
/// throwing std::regex_error; each entry point converts that into a
/// "regex: <reason>" Result error.
///
//===----------------------------------------------------------------------===//

#include "runtime/nikl/Builtins.hpp"
#include "runtime/nikl/Modules.hpp"

#include <regex>

namespace nikl::runtime
{

using support::Result;

namespace
{

Result<Value> regexError(const std::regex_error &e)
{
    return Result<Value>::error(std::string("regex: ") + e.what());
}

/// @brief Validated (pattern, text) argument pair.
struct PatternArgs
{
    std::string pattern;
    std::string text;
};

Result<PatternArgs> patternArgs(std::string_view fn, const ValueList &args)
{
    auto arity = checkArity(fn, args, 2);
    if (!arity.isOk())
        return Result<PatternArgs>::error(arity.error());
    auto pattern = stringArg(fn, args, 0, "pattern");
    if (!pattern.isOk())
        return Result<PatternArgs>::error(pattern.error());
    auto text = stringArg(fn, args, 1, "text");
    if (!text.isOk())
        return Result<PatternArgs>::error(text.error());
    return PatternArgs{pattern.value(), text.value()};
}

/// @brief Capture groups of the first match, group 0 first; None if no match.
Result<Value> regexMatch(const ValueList &args)
{
    auto parsed = patternArgs("match", args);
    if (!parsed.isOk())
        return Result<Value>::error(parsed.error());

    try
    {
        std::regex re(parsed.value().pattern);
        std::smatch m;
        if (!std::regex_search(parsed.value().text, m, re))
            return Value();

        ValueList groups;
        groups.reserve(m.size());
        for (const auto &group : m)
            groups.push_back(group.matched ? Value::string(group.str()) : Value());
        return Value::array(std::move(groups));
    }
    catch (const std::regex_error &e)
    {
        return regexError(e);
    }
}

Result<Value> regexIsMatch(const ValueList &args)
{
    auto parsed = patternArgs("is_match", args);
    if (!parsed.isOk())
        return Result<Value>::error(parsed.error());

    try
    {
        std::regex re(parsed.value().pattern);
        return Value::boolean(std::regex_search(parsed.value().text, re));
    }
    catch (const std::regex_error &e)
    {
        return regexError(e);
    }
}

Result<Value> regexFindAll(const ValueList &args)
{
    auto parsed = patternArgs("find_all", args);
    if (!parsed.isOk())
        return Result<Value>::error(parsed.error());

    try
    {
        std::regex re(parsed.value().pattern);
        const std::string &text = parsed.value().text;
        ValueList found;
        for (std::sregex_iterator it(text.begin(), text.end(), re), end; it != end; ++it)
            found.push_back(Value::string(it->str()));
        return Value::array(std::move(found));
    }
    catch (const std::regex_error &e)
    {
        return regexError(e);
    }
}

/// @brief replace(pattern, replacement, text); `$1`, `$&` refer to groups.
Result<Value> regexReplace(const ValueList &args)
{
    auto arity = checkArity("replace", args, 3);
    if (!arity.isOk())
        return Result<Value>::error(arity.error());
    auto pattern = stringArg("replace", args, 0, "pattern");
    if (!pattern.isOk())
        return Result<Value>::error(pattern.error());
    auto replacement = stringArg("replace", args, 1, "replacement");
    if (!replacement.isOk())
        return Result<Value>::error(replacement.error());
    auto text = stringArg("replace", args, 2, "text");
    if (!text.isOk())
        return Result<Value>::error(text.error());

    try
    {
        std::regex re(pattern.value());
        return Value::string(std::regex_replace(text.value(), re, replacement.value()));
    }
    catch (const std::regex_error &e)
    {
        return regexError(e);
    }
}

} // namespace

Value makeRegexModule()
{
    return makeRecord({
        {"match", regexMatch},
        {"is_match", regexIsMatch},
        {"find_all", regexFindAll},
        {"replace", regexReplace},
    });
}

} // namespace nikl::runtime
