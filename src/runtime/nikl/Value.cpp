//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Value.cpp
/// @brief Construction, inspection and display of runtime values.
///
//===----------------------------------------------------------------------===//

#include "runtime/nikl/Value.hpp"

#include "runtime/nikl/Environment.hpp"

#include <charconv>
#include <cmath>

namespace nikl::runtime
{

const char *valueKindName(ValueKind kind)
{
    switch (kind)
    {
        case ValueKind::Integer:
            return "Integer";
        case ValueKind::Float:
            return "Float";
        case ValueKind::Bool:
            return "Boolean";
        case ValueKind::String:
            return "String";
        case ValueKind::Array:
            return "Array";
        case ValueKind::Tuple:
            return "Tuple";
        case ValueKind::HashMap:
            return "HashMap";
        case ValueKind::Function:
            return "Function";
        case ValueKind::BuiltinFunction:
            return "BuiltinFunction";
        case ValueKind::Null:
            return "None";
    }
    return "?";
}

//===----------------------------------------------------------------------===//
// Construction
//===----------------------------------------------------------------------===//

Value Value::integer(int64_t v)
{
    return Value(Storage(std::in_place_type<int64_t>, v));
}

Value Value::floating(double v)
{
    return Value(Storage(std::in_place_type<double>, v));
}

Value Value::boolean(bool v)
{
    return Value(Storage(std::in_place_type<bool>, v));
}

Value Value::string(std::string v)
{
    return Value(Storage(std::in_place_type<std::string>, std::move(v)));
}

Value Value::array(ValueList items)
{
    return Value(Storage(ArrayBox{std::make_shared<const ValueList>(std::move(items))}));
}

Value Value::tuple(ValueList items)
{
    return Value(Storage(TupleBox{std::make_shared<const ValueList>(std::move(items))}));
}

Value Value::hashMap(MapEntries entries)
{
    return Value(Storage(MapBox{std::make_shared<const MapEntries>(std::move(entries))}));
}

Value Value::function(std::shared_ptr<const FunctionValue> fn)
{
    return Value(Storage(std::move(fn)));
}

Value Value::builtin(std::string name, BuiltinFn fn)
{
    return Value(Storage(std::make_shared<const BuiltinFunction>(
        BuiltinFunction{std::move(name), std::move(fn)})));
}

//===----------------------------------------------------------------------===//
// Inspection
//===----------------------------------------------------------------------===//

ValueKind Value::kind() const
{
    switch (data_.index())
    {
        case 1:
            return ValueKind::Integer;
        case 2:
            return ValueKind::Float;
        case 3:
            return ValueKind::Bool;
        case 4:
            return ValueKind::String;
        case 5:
            return ValueKind::Array;
        case 6:
            return ValueKind::Tuple;
        case 7:
            return ValueKind::HashMap;
        case 8:
            return ValueKind::Function;
        case 9:
            return ValueKind::BuiltinFunction;
        default:
            return ValueKind::Null;
    }
}

int64_t Value::asInteger() const
{
    return std::get<int64_t>(data_);
}

double Value::asFloat() const
{
    return std::get<double>(data_);
}

bool Value::asBool() const
{
    return std::get<bool>(data_);
}

const std::string &Value::asString() const
{
    return std::get<std::string>(data_);
}

const ValueList &Value::elements() const
{
    if (const auto *tuple = std::get_if<TupleBox>(&data_))
        return *tuple->items;
    return *std::get<ArrayBox>(data_).items;
}

const MapEntries &Value::entries() const
{
    return *std::get<MapBox>(data_).entries;
}

const FunctionValue &Value::asFunction() const
{
    return *std::get<std::shared_ptr<const FunctionValue>>(data_);
}

const BuiltinFunction &Value::asBuiltin() const
{
    return *std::get<std::shared_ptr<const BuiltinFunction>>(data_);
}

const Value *Value::lookup(std::string_view key) const
{
    const auto *map = std::get_if<MapBox>(&data_);
    if (!map)
        return nullptr;
    for (const auto &entry : *map->entries)
    {
        if (entry.key.is(ValueKind::String) && entry.key.asString() == key)
            return &entry.value;
    }
    return nullptr;
}

//===----------------------------------------------------------------------===//
// Display
//===----------------------------------------------------------------------===//

std::string formatFloat(double v)
{
    if (std::isnan(v))
        return "NaN";
    if (std::isinf(v))
        return v < 0 ? "-inf" : "inf";

    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc())
        return std::to_string(v);
    return std::string(buf, ptr);
}

namespace
{

void appendJoined(std::string &out, const ValueList &items)
{
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (i != 0)
            out += ", ";
        out += items[i].toString();
    }
}

} // namespace

std::string Value::toString() const
{
    switch (kind())
    {
        case ValueKind::Integer:
            return std::to_string(asInteger());
        case ValueKind::Float:
            return formatFloat(asFloat());
        case ValueKind::Bool:
            return asBool() ? "True" : "False";
        case ValueKind::String:
            return asString();
        case ValueKind::Array:
        {
            std::string out = "[";
            appendJoined(out, elements());
            return out + "]";
        }
        case ValueKind::Tuple:
        {
            std::string out = "(";
            appendJoined(out, elements());
            return out + ")";
        }
        case ValueKind::HashMap:
        {
            std::string out = "{";
            bool first = true;
            for (const auto &entry : entries())
            {
                if (!first)
                    out += ", ";
                first = false;
                out += entry.key.toString() + ": " + entry.value.toString();
            }
            return out + "}";
        }
        case ValueKind::Function:
            return "<function " + asFunction().name + ">";
        case ValueKind::BuiltinFunction:
            return "<builtin function>";
        case ValueKind::Null:
            return "None";
    }
    return "None";
}

} // namespace nikl::runtime
