//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Environment.cpp
/// @brief Scope chain operations.
///
//===----------------------------------------------------------------------===//

#include "runtime/nikl/Environment.hpp"

namespace nikl::runtime
{

using support::Result;

Environment::Environment(const Environment &other)
    : values_(other.values_),
      parent_(other.parent_ ? std::make_unique<Environment>(*other.parent_) : nullptr)
{
}

Environment &Environment::operator=(const Environment &other)
{
    if (this != &other)
    {
        Environment copy(other);
        *this = std::move(copy);
    }
    return *this;
}

Result<void> Environment::define(const std::string &name, Value value, bool isMutable)
{
    if (values_.count(name) != 0)
        return Result<void>::error("Variable '" + name + "' is already declared in this scope");
    values_.emplace(name, Binding{std::move(value), isMutable});
    return Result<void>::success();
}

void Environment::declare(const std::string &name, Value value, bool isMutable)
{
    values_[name] = Binding{std::move(value), isMutable};
}

const Binding *Environment::find(const std::string &name) const
{
    for (const Environment *scope = this; scope; scope = scope->parent_.get())
    {
        auto it = scope->values_.find(name);
        if (it != scope->values_.end())
            return &it->second;
    }
    return nullptr;
}

const Binding *Environment::findLocal(const std::string &name) const
{
    auto it = values_.find(name);
    return it != values_.end() ? &it->second : nullptr;
}

Binding *Environment::findMutable(const std::string &name)
{
    for (Environment *scope = this; scope; scope = scope->parent_.get())
    {
        auto it = scope->values_.find(name);
        if (it != scope->values_.end())
            return &it->second;
    }
    return nullptr;
}

Result<Value> Environment::get(const std::string &name) const
{
    if (const Binding *binding = find(name))
        return binding->value;
    return Result<Value>::error("Undefined variable '" + name + "'");
}

Result<void> Environment::assign(const std::string &name, Value value)
{
    Binding *binding = findMutable(name);
    if (!binding)
        return Result<void>::error("Variable '" + name + "' is not defined");
    if (!binding->isMutable)
        return Result<void>::error("Cannot assign to constant '" + name + "'");
    binding->value = std::move(value);
    return Result<void>::success();
}

Result<void> Environment::remove(const std::string &name)
{
    for (Environment *scope = this; scope; scope = scope->parent_.get())
    {
        if (scope->values_.erase(name) != 0)
            return Result<void>::success();
    }
    return Result<void>::error("Variable '" + name + "' is not defined");
}

void Environment::pushScope()
{
    auto parent = std::make_unique<Environment>(std::move(*this));
    values_.clear();
    parent_ = std::move(parent);
}

void Environment::popScope()
{
    if (!parent_)
        return;
    Environment parent = std::move(*parent_);
    *this = std::move(parent);
}

size_t Environment::depth() const
{
    size_t n = 0;
    for (const Environment *scope = this; scope; scope = scope->parent_.get())
        ++n;
    return n;
}

std::vector<std::pair<std::string, Value>> Environment::flatten(size_t skipOutermost) const
{
    std::vector<const Environment *> chain;
    for (const Environment *scope = this; scope; scope = scope->parent_.get())
        chain.push_back(scope);

    // Walk outermost to innermost so inner bindings overwrite outer ones.
    std::map<std::string, Value> merged;
    size_t keep = chain.size() > skipOutermost ? chain.size() - skipOutermost : 0;
    for (size_t i = keep; i-- > 0;)
    {
        for (const auto &[name, binding] : chain[i]->values_)
            merged[name] = binding.value;
    }

    return {merged.begin(), merged.end()};
}

} // namespace nikl::runtime
