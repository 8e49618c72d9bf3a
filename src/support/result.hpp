//===----------------------------------------------------------------------===//
//
// Part of the Sieve project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/result.hpp
// Purpose: Value-or-error-message carrier for host-facing fallible calls.
// Key invariants: Exactly one of value or error is engaged.
// Ownership/Lifetime: Owns the stored value or message.
// Links: vm/HostBindings.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace sieve::support
{

/// @brief Holds either a value of type @p T or an error message.
/// @details Used where the caller is a host program rather than the compiler:
///          attach failures and host callable results.
template <typename T> class Result
{
  public:
    /// @brief Creates a successful result containing @p value.
    template <typename U = T>
        requires(!std::is_same_v<std::remove_cvref_t<U>, Result>)
    Result(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Factory that constructs a successful result.
    template <typename U = T> static Result success(U &&value)
    {
        return Result(std::forward<U>(value));
    }

    /// @brief Factory that constructs an error result with a message.
    static Result error(std::string message)
    {
        Result r(ErrorTag{});
        r.error_ = std::move(message);
        return r;
    }

    /// @brief True when a value is present.
    bool isOk() const
    {
        return value_.has_value();
    }

    /// @pre isOk()
    T &value()
    {
        return *value_;
    }

    /// @pre isOk()
    const T &value() const
    {
        return *value_;
    }

    /// @pre !isOk()
    const std::string &error() const
    {
        return error_;
    }

  private:
    struct ErrorTag
    {
    };

    explicit Result(ErrorTag) {}

    std::optional<T> value_;
    std::string error_;
};

} // namespace sieve::support
