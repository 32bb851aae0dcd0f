//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <compare>
#include <concepts>
#include <cstddef>
#include <iterator>
#include <ranges>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace kestrel {

//! Concept: EnumWithCount
/*!
 Constrains enums that can be exhaustively enumerated. An enum satisfying
 `EnumWithCount` must expose `kFirst` and `kCount` enumerators where `kFirst`
 has underlying value `0` and `kCount` is greater than zero. Every value in
 `[kFirst, kCount)` is a valid member of the set, in a stable order.

 ### Example

 ```cpp
 enum class Action : uint8_t {
   kFirst = 0,
   kRun = kFirst,
   kJump,
   kCount
 };
 ```

 @tparam E The enum type being tested.
*/
template <typename E>
concept EnumWithCount = std::is_enum_v<E>
  && requires { { E::kCount } -> std::same_as<E>; }
  && (std::to_underlying(E::kCount) > 0)
  && requires { { E::kFirst } -> std::same_as<E>; }
  && (std::to_underlying(E::kFirst) == 0);

//! Number of values in the enumeration.
template <EnumWithCount E>
inline constexpr std::size_t kEnumCount
  = static_cast<std::size_t>(std::to_underlying(E::kCount));

//! Dense, zero-based index of an enum value.
template <EnumWithCount E>
[[nodiscard]] constexpr auto EnumIndex(E value) noexcept -> std::size_t
{
  return static_cast<std::size_t>(std::to_underlying(value));
}

//! True when `value` is inside `[kFirst, kCount)`.
template <EnumWithCount E>
[[nodiscard]] constexpr auto IsValidEnumValue(E value) noexcept -> bool
{
  // Signed underlying types may hold negative garbage from a bad cast.
  if constexpr (std::is_signed_v<std::underlying_type_t<E>>) {
    if (std::to_underlying(value) < 0) {
      return false;
    }
  }
  return EnumIndex(value) < kEnumCount<E>;
}

//! Random-access iterator over the values of an `EnumWithCount` enum.
template <EnumWithCount E> class EnumValueIterator {
public:
  using value_type = E;
  using difference_type = std::ptrdiff_t;
  using reference = E; // dereference returns a prvalue
  using pointer = void;
  using iterator_category = std::random_access_iterator_tag;
  using iterator_concept = std::random_access_iterator_tag;

  constexpr EnumValueIterator() noexcept = default;
  constexpr explicit EnumValueIterator(std::size_t raw) noexcept
    : raw_(raw)
  {
  }

  constexpr auto operator*() const noexcept -> reference
  {
    return static_cast<E>(raw_);
  }

  constexpr auto operator[](difference_type off) const noexcept -> reference
  {
    return *(*this + off);
  }

  constexpr auto operator++() noexcept -> EnumValueIterator&
  {
    ++raw_;
    return *this;
  }
  constexpr auto operator++(int) noexcept -> EnumValueIterator
  {
    auto tmp = *this;
    ++*this;
    return tmp;
  }
  constexpr auto operator--() noexcept -> EnumValueIterator&
  {
    --raw_;
    return *this;
  }
  constexpr auto operator--(int) noexcept -> EnumValueIterator
  {
    auto tmp = *this;
    --*this;
    return tmp;
  }

  constexpr auto operator+=(difference_type off) noexcept -> EnumValueIterator&
  {
    raw_ = static_cast<std::size_t>(static_cast<difference_type>(raw_) + off);
    return *this;
  }
  constexpr auto operator-=(difference_type off) noexcept -> EnumValueIterator&
  {
    raw_ = static_cast<std::size_t>(static_cast<difference_type>(raw_) - off);
    return *this;
  }

  friend constexpr auto operator+(
    EnumValueIterator it, difference_type off) noexcept -> EnumValueIterator
  {
    it += off;
    return it;
  }
  friend constexpr auto operator+(
    difference_type off, EnumValueIterator it) noexcept -> EnumValueIterator
  {
    it += off;
    return it;
  }
  friend constexpr auto operator-(
    EnumValueIterator it, difference_type off) noexcept -> EnumValueIterator
  {
    it -= off;
    return it;
  }
  friend constexpr auto operator-(
    EnumValueIterator a, EnumValueIterator b) noexcept -> difference_type
  {
    return static_cast<difference_type>(a.raw_)
      - static_cast<difference_type>(b.raw_);
  }

  constexpr auto operator<=>(const EnumValueIterator&) const noexcept
    = default;

private:
  std::size_t raw_ = 0;
};

//! Range view over every value of an `EnumWithCount` enum, in ascending
//! underlying order.
/*!
 ### Example Usage:

 ```cpp
   for (const auto action : enum_values<Action>) {
     // action is an Action
   }
 ```
*/
template <EnumWithCount E>
class EnumValues : public std::ranges::view_interface<EnumValues<E>> {
public:
  using iterator = EnumValueIterator<E>;

  constexpr EnumValues() noexcept = default;

  [[nodiscard]] constexpr auto begin() const noexcept -> iterator
  {
    return iterator(EnumIndex(E::kFirst));
  }
  [[nodiscard]] constexpr auto end() const noexcept -> iterator
  {
    return iterator(kEnumCount<E>);
  }
  [[nodiscard]] constexpr auto size() const noexcept -> std::size_t
  {
    return kEnumCount<E>;
  }
};

template <EnumWithCount E> inline constexpr auto enum_values = EnumValues<E> {};

//! EnumIndexedArray
/*!
 Lightweight wrapper around `std::array` that is indexed by an enum without
 manual casts. The size is always `E::kCount`, so the array holds exactly one
 element per enum value and can never be missing an entry.

 - `operator[]` is unchecked and noexcept, suitable for hot paths.
 - `at()` performs a range check and throws `std::out_of_range`.

 ```cpp
 EnumIndexedArray<Action, int> arr {};
 arr[Action::kJump] = 10;
 auto v = arr.at(Action::kRun);
 ```

 @tparam E Enum type satisfying `EnumWithCount`.
 @tparam T Value type stored in the array.
*/
template <EnumWithCount E, typename T> struct EnumIndexedArray {
  std::array<T, kEnumCount<E>> data;

  constexpr auto operator[](E e) noexcept -> T& { return data[EnumIndex(e)]; }
  constexpr auto operator[](E e) const noexcept -> const T&
  {
    return data[EnumIndex(e)];
  }

  constexpr auto at(E e) -> T&
  {
    if (!IsValidEnumValue(e)) {
      throw std::out_of_range("EnumIndexedArray::at: enum value out of range");
    }
    return data[EnumIndex(e)];
  }

  constexpr auto at(E e) const -> const T&
  {
    if (!IsValidEnumValue(e)) {
      throw std::out_of_range("EnumIndexedArray::at: enum value out of range");
    }
    return data[EnumIndex(e)];
  }

  //! Fill every slot with `value`.
  constexpr void fill(const T& value) { data.fill(value); }

  [[nodiscard]] constexpr auto size() const noexcept { return data.size(); }
  constexpr auto begin() noexcept { return data.begin(); }
  constexpr auto end() noexcept { return data.end(); }
  [[nodiscard]] constexpr auto begin() const noexcept { return data.begin(); }
  [[nodiscard]] constexpr auto end() const noexcept { return data.end(); }

  auto operator==(const EnumIndexedArray&) const -> bool = default;
};

} // namespace kestrel

namespace std::ranges {
template <kestrel::EnumWithCount E>
inline constexpr bool enable_borrowed_range<kestrel::EnumValues<E>> = true;
} // namespace std::ranges
