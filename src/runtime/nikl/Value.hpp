//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Value.hpp
/// @brief Runtime value model of the Nikl interpreter.
///
/// @details A Value is a tagged union over the ten runtime kinds. Scalars and
/// strings are stored inline. Composite payloads (arrays, tuples, hash maps,
/// functions, builtins) are immutable once built and shared between copies,
/// so copying a Value never deep-copies a container.
///
/// Hash maps are ordered entry lists: lookup is linear and iteration follows
/// insertion order. Keys are not deduplicated.
///
/// @invariant A default-constructed Value is Null.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/result.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace nikl::runtime
{

class Value;
struct MapEntry;
struct FunctionValue;
struct BuiltinFunction;

using ValueList = std::vector<Value>;
using MapEntries = std::vector<MapEntry>;

/// @brief Host callable signature; arity and kind checks are the callee's job.
using BuiltinFn = std::function<support::Result<Value>(const ValueList &)>;

enum class ValueKind
{
    Integer,
    Float,
    Bool,
    String,
    Array,
    Tuple,
    HashMap,
    Function,
    BuiltinFunction,
    Null,
};

/// @brief Script-visible kind name as returned by `type()`, e.g. "Boolean".
const char *valueKindName(ValueKind kind);

class Value
{
  public:
    /// @brief Construct Null.
    Value() = default;

    static Value integer(int64_t v);
    static Value floating(double v);
    static Value boolean(bool v);
    static Value string(std::string v);
    static Value array(ValueList items);
    static Value tuple(ValueList items);
    static Value hashMap(MapEntries entries);
    static Value function(std::shared_ptr<const FunctionValue> fn);
    static Value builtin(std::string name, BuiltinFn fn);

    [[nodiscard]] ValueKind kind() const;

    bool isNull() const
    {
        return kind() == ValueKind::Null;
    }

    bool is(ValueKind k) const
    {
        return kind() == k;
    }

    /// @name Payload accessors
    /// @pre The value holds the matching kind.
    /// @{
    int64_t asInteger() const;
    double asFloat() const;
    bool asBool() const;
    const std::string &asString() const;

    /// @brief Elements of an Array or a Tuple.
    const ValueList &elements() const;

    const MapEntries &entries() const;
    const FunctionValue &asFunction() const;
    const BuiltinFunction &asBuiltin() const;
    /// @}

    /// @brief Linear scan of a HashMap for a String key equal to @p key.
    /// @return The mapped value, or nullptr when absent or not a HashMap.
    const Value *lookup(std::string_view key) const;

    /// @brief Display form used by print and str.
    std::string toString() const;

  private:
    struct ArrayBox
    {
        std::shared_ptr<const ValueList> items;
    };

    struct TupleBox
    {
        std::shared_ptr<const ValueList> items;
    };

    struct MapBox
    {
        std::shared_ptr<const MapEntries> entries;
    };

    using Storage = std::variant<std::monostate,
                                 int64_t,
                                 double,
                                 bool,
                                 std::string,
                                 ArrayBox,
                                 TupleBox,
                                 MapBox,
                                 std::shared_ptr<const FunctionValue>,
                                 std::shared_ptr<const BuiltinFunction>>;

    explicit Value(Storage data) : data_(std::move(data)) {}

    Storage data_;
};

/// @brief One key/value pair of a HashMap.
struct MapEntry
{
    Value key;
    Value value;
};

/// @brief Host-provided callable exposed as an ordinary value.
struct BuiltinFunction
{
    std::string name;
    BuiltinFn fn;
};

/// @brief Format a float the way scripts see it: shortest round-trip text,
///        `3` for 3.0, `NaN`, `inf`, `-inf`.
std::string formatFloat(double v);

} // namespace nikl::runtime
