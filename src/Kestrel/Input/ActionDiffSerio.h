//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

/*!
  \file ActionDiffSerio.h
  \brief Binary encoding of `ActionDiff` for the Serio readers and writers.

  Wire layout, packed and little-endian:

  | Field  | Type     | Notes                              |
  |--------|----------|------------------------------------|
  | kind   | uint8_t  | 0 = pressed, 1 = released          |
  | action | uint16_t | index of the action in its enum    |
  | id     | ID       | encoded by the `Store` found for ID |

  A `std::vector` of diffs is encoded by the generic Serio sequence overloads
  (32-bit count followed by each diff).
*/

#include <cstdint>
#include <utility>

#include <Kestrel/Base/EnumIndexedArray.h>
#include <Kestrel/Base/Logging.h>
#include <Kestrel/Base/Result.h>
#include <Kestrel/Input/ActionDiff.h>
#include <Kestrel/Serio/Reader.h>
#include <Kestrel/Serio/Writer.h>

namespace kestrel::input {

namespace detail {
  using WireActionIndex = uint16_t;
} // namespace detail

template <EnumWithCount A, ActionStateOwnerId ID>
auto Store(serio::AnyWriter& writer, const ActionDiff<A, ID>& diff)
  -> Result<void>
{
  static_assert(kEnumCount<A> <= (1U << 16U),
    "action set too large for the action diff wire format");

  CHECK_RESULT(writer.Write(diff.kind));
  CHECK_RESULT(writer.Write(
    static_cast<detail::WireActionIndex>(EnumIndex(diff.action))));
  CHECK_RESULT(writer.Write(diff.id));
  return {};
}

//! Decode an `ActionDiff`, rejecting unknown kinds and out-of-range actions
//! with `std::errc::invalid_argument`. `diff` is left untouched on failure.
template <EnumWithCount A, ActionStateOwnerId ID>
auto Load(serio::AnyReader& reader, ActionDiff<A, ID>& diff) -> Result<void>
{
  ActionDiffKind kind { ActionDiffKind::kPressed };
  CHECK_RESULT(reader.ReadInto(kind));
  if (kind != ActionDiffKind::kPressed && kind != ActionDiffKind::kReleased) {
    LOG_F(WARNING, "invalid action diff kind {}", std::to_underlying(kind));
    return std::errc::invalid_argument;
  }

  detail::WireActionIndex index { 0 };
  CHECK_RESULT(reader.ReadInto(index));
  if (index >= kEnumCount<A>) {
    LOG_F(WARNING, "action index {} out of range (count {})", index,
      kEnumCount<A>);
    return std::errc::invalid_argument;
  }

  ID id {};
  CHECK_RESULT(reader.ReadInto(id));

  diff.kind = kind;
  diff.action = static_cast<A>(index);
  diff.id = std::move(id);
  return {};
}

} // namespace kestrel::input
