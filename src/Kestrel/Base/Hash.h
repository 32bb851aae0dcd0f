//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <functional>

namespace kestrel {

//! Combines a hash seed with the hash of a value.
/*!
 Boost `hash_combine` mixing, used to implement `std::hash` for composite
 types.

 \param seed The existing hash value, updated in place.
 \param v The value to be hashed and combined with the seed.
*/
template <class T> void HashCombine(std::size_t& seed, const T& v)
{
  constexpr std::size_t golden_ratio = 0x9e3779b97f4a7c15ULL;
  constexpr std::size_t shift_left = 6;
  constexpr std::size_t shift_right = 2;

  std::hash<T> hasher;
  seed
    ^= hasher(v) + golden_ratio + (seed << shift_left) + (seed >> shift_right);
}

} // namespace kestrel
