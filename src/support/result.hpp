// File: src/support/result.hpp
// Purpose: Provides a simple Result type for runtime error propagation.
// Key invariants: Either holds a value or an error string, never both.
// Ownership/Lifetime: Result owns contained value or error.
#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace nikl::support
{

/// @brief Tag type used to construct successful Result values explicitly.
struct SuccessTag
{
    constexpr SuccessTag() = default;
};

/// @brief Sentinel instance for success construction convenience.
inline constexpr SuccessTag kSuccessTag{};

/// @brief Minimal expected-like container carrying an error message.
/// @invariant Either holds a value or an error string.
template <typename T> class Result
{
  public:
    /// @brief Creates a successful result containing a value.
    /// @param value Value to store; ownership is transferred to the Result.
    template <typename U = T> Result(SuccessTag /*tag*/, U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Creates a successful result from a value without an explicit tag.
    /// @details Never selected for Result arguments so copies and moves use the
    ///          implicit special members.
    template <typename U = T,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Result>>>
    Result(U &&value) : Result(kSuccessTag, std::forward<U>(value))
    {
    }

    /// @brief Factory that constructs a successful result.
    template <typename U = T> static Result success(U &&value)
    {
        return Result(kSuccessTag, std::forward<U>(value));
    }

    /// @brief Factory that constructs an error result with a message.
    static Result error(std::string error)
    {
        return Result(ErrorTag{}, std::move(error));
    }

    /// @brief Indicates whether the Result currently holds a value.
    /// @invariant When true, @c value() is valid; when false, @c error() is
    /// valid.
    [[nodiscard]] bool isOk() const
    {
        return value_.has_value();
    }

    /// @brief Provides mutable access to the contained value.
    /// @pre @c isOk() must return true.
    T &value()
    {
        return *value_;
    }

    /// @brief Provides read-only access to the contained value.
    /// @pre @c isOk() must return true.
    const T &value() const
    {
        return *value_;
    }

    /// @brief Retrieves the stored error message.
    /// @pre @c isOk() must return false.
    const std::string &error() const
    {
        return error_;
    }

  private:
    struct ErrorTag
    {
        constexpr ErrorTag() = default;
    };

    Result(ErrorTag /*tag*/, std::string error) : error_(std::move(error)) {}

    /// Storage for the value when present; otherwise empty.
    std::optional<T> value_;
    /// Storage for the error message when no value is present; otherwise empty.
    std::string error_;
};

/// @brief Result specialization for operations with no payload.
template <> class Result<void>
{
  public:
    /// @brief Constructs a successful result.
    Result() = default;

    static Result success()
    {
        return Result();
    }

    static Result error(std::string error)
    {
        Result r;
        r.ok_ = false;
        r.error_ = std::move(error);
        return r;
    }

    [[nodiscard]] bool isOk() const
    {
        return ok_;
    }

    const std::string &error() const
    {
        return error_;
    }

  private:
    bool ok_ = true;
    std::string error_;
};
} // namespace nikl::support
