//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>

#include <Kestrel/Base/Result.h>

namespace kestrel::serio {

//! Concept to specify a byte stream that can be written to and read from.
/*!
 @note All methods should be noexcept and report failures through `Result`.
*/
template <typename T>
concept Stream = requires(T t, const std::byte* cdata, std::byte* data,
  std::span<const std::byte> sdata, std::size_t size) {
  { t.Read(data, size) } -> std::same_as<Result<void>>;
  { t.Write(cdata, size) } -> std::same_as<Result<void>>;
  { t.Write(sdata) } -> std::same_as<Result<void>>;
  { t.Flush() } -> std::same_as<Result<void>>;
  { t.Size() } -> std::same_as<Result<std::size_t>>;
  { t.Position() } -> std::same_as<Result<std::size_t>>;
  { t.Seek(size) } -> std::same_as<Result<void>>;
  { t.Reset() } -> std::same_as<void>;
};

//! Serialization limits for sequences.
namespace limits {
  using SequenceSizeType = uint32_t;
  //! Upper bound on the number of elements in a serialized sequence.
  constexpr SequenceSizeType kMaxArrayLength = 64U * 1024U;
} // namespace limits

} // namespace kestrel::serio
