//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

/*!
  \file Result.h
  \brief Outcome of an I/O style operation: a value or a `std::error_code`.

  Used by the serialization layer, where every failure is described by a
  standard error condition (`std::errc`). Operations that need a richer error
  payload use `std::expected` with a dedicated error type instead.
*/

#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace kestrel {

//! Holds either a value of type `T` or a `std::error_code`.
template <typename T> class Result {
public:
  //! Successful result holding `value`.
  explicit(false) constexpr Result(T value) noexcept(
    std::is_nothrow_move_constructible_v<T>)
    : value_(std::move(value))
  {
  }

  //! Failed result holding `error`.
  explicit(false) Result(std::error_code error) noexcept
    : value_(error)
  {
  }

  //! Failed result from a standard error condition.
  explicit(false) Result(std::errc error) noexcept
    : value_(std::make_error_code(error))
  {
  }

  [[nodiscard]] constexpr auto has_value() const noexcept -> bool
  {
    return std::holds_alternative<T>(value_);
  }

  [[nodiscard]] constexpr auto value() const& -> const T&
  {
    return std::get<T>(value_);
  }

  constexpr auto value() && -> T&& { return std::get<T>(std::move(value_)); }

  [[nodiscard]] constexpr auto error() const -> const std::error_code&
  {
    return std::get<std::error_code>(value_);
  }

  constexpr explicit operator bool() const noexcept { return has_value(); }

  template <typename U>
  [[nodiscard]] constexpr auto value_or(U&& default_value) const& -> T
  {
    return has_value() ? value() : static_cast<T>(std::forward<U>(default_value));
  }

  constexpr auto operator*() const& -> const T& { return value(); }
  constexpr auto operator*() & -> T& { return std::get<T>(value_); }

private:
  std::variant<T, std::error_code> value_;
};

//! Specialization for operations that produce no value.
template <> class Result<void> {
public:
  constexpr Result() noexcept
    : value_(std::monostate {})
  {
  }

  explicit(false) Result(std::error_code error) noexcept
    : value_(error)
  {
  }

  explicit(false) Result(std::errc error) noexcept
    : value_(std::make_error_code(error))
  {
  }

  [[nodiscard]] constexpr auto has_value() const noexcept -> bool
  {
    return std::holds_alternative<std::monostate>(value_);
  }

  [[nodiscard]] constexpr auto error() const -> const std::error_code&
  {
    return std::get<std::error_code>(value_);
  }

  constexpr explicit operator bool() const noexcept { return has_value(); }

private:
  std::variant<std::monostate, std::error_code> value_;
};

} // namespace kestrel

//! Evaluate an expression returning a Result and, if it holds an error,
//! return that error from the enclosing function.
#define CHECK_RESULT(expr)                                                     \
  if (const auto result = (expr); !result)                                     \
  return result.error()
