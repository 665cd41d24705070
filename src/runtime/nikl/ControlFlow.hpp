//===----------------------------------------------------------------------===//
//
// Part of the Nikl project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: runtime/nikl/ControlFlow.hpp
// Purpose: Signal threaded through statement execution for non-local exits.
// Key invariants: Only Kind::Value and Kind::Return carry a meaningful value.
//                 Any kind other than Value stops the enclosing statement list.
// Ownership/Lifetime: Value type.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "runtime/nikl/Value.hpp"

#include <utility>

namespace nikl::runtime
{

struct ControlFlow
{
    enum class Kind
    {
        Value,    ///< Fall-through; carries the last expression statement's value
        Return,   ///< Unwind to the nearest call boundary
        Break,    ///< Leave the nearest loop
        Continue, ///< Restart the nearest loop
    };

    Kind kind = Kind::Value;
    runtime::Value value;

    static ControlFlow normal(runtime::Value v = {})
    {
        return ControlFlow{Kind::Value, std::move(v)};
    }

    static ControlFlow returning(runtime::Value v)
    {
        return ControlFlow{Kind::Return, std::move(v)};
    }

    static ControlFlow breaking()
    {
        return ControlFlow{Kind::Break, {}};
    }

    static ControlFlow continuing()
    {
        return ControlFlow{Kind::Continue, {}};
    }

    bool isNormal() const
    {
        return kind == Kind::Value;
    }
};

} // namespace nikl::runtime
