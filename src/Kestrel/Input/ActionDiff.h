//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>

#include <Kestrel/Base/EnumIndexedArray.h>
#include <Kestrel/Base/Hash.h>
#include <Kestrel/Base/Logging.h>
#include <Kestrel/Input/ActionState.h>
#include <Kestrel/Input/api_export.h>

namespace kestrel::input {

enum class ActionDiffKind : uint8_t {
  kPressed = 0,
  kReleased = 1,
};

KSTL_NPUT_NDAPI auto to_string(ActionDiffKind kind) -> const char*;

//! Identity of the owner of an action state, as carried by an ActionDiff.
template <typename ID>
concept ActionStateOwnerId = std::equality_comparable<ID> && std::copyable<ID>;

//=== ActionDiff -------------------------------------------------------------//

//! A press or release of an action, without timing, addressed to the owner of
//! an `ActionState`.
/*!
 Minimal event used to replicate action state transitions to a remote or
 decoupled consumer. `id` is a stable identifier of the owner (typically an
 entity id) so that the receiver can route the diff to the right
 `ActionState`. Durations and instants are never carried; the receiver
 accrues its own timing when it ticks.

 @see GenerateActionDiffs, ApplyActionDiff
*/
template <EnumWithCount A, ActionStateOwnerId ID> struct ActionDiff {
  ActionDiffKind kind { ActionDiffKind::kPressed };
  A action { A::kFirst };
  ID id {};

  [[nodiscard]] static auto Pressed(A action, ID id) -> ActionDiff
  {
    return ActionDiff {
      .kind = ActionDiffKind::kPressed,
      .action = action,
      .id = std::move(id),
    };
  }

  [[nodiscard]] static auto Released(A action, ID id) -> ActionDiff
  {
    return ActionDiff {
      .kind = ActionDiffKind::kReleased,
      .action = action,
      .id = std::move(id),
    };
  }

  [[nodiscard]] auto IsPressed() const -> bool
  {
    return kind == ActionDiffKind::kPressed;
  }

  [[nodiscard]] auto IsReleased() const -> bool
  {
    return kind == ActionDiffKind::kReleased;
  }

  auto operator==(const ActionDiff&) const -> bool = default;
};

//! Diffs describing the transitions of `state` since its last tick.
/*!
 Emits one `Pressed` diff per just-pressed action and one `Released` diff per
 just-released action, in enumeration order. Call it between Update() and
 Tick() on the sending side.
*/
template <EnumWithCount A, ActionStateOwnerId ID>
[[nodiscard]] auto GenerateActionDiffs(
  const ActionState<A>& state, const ID& id) -> std::vector<ActionDiff<A, ID>>
{
  std::vector<ActionDiff<A, ID>> diffs;
  for (const auto action : enum_values<A>) {
    if (state.IsJustPressed(action)) {
      diffs.push_back(ActionDiff<A, ID>::Pressed(action, id));
    } else if (state.IsJustReleased(action)) {
      diffs.push_back(ActionDiff<A, ID>::Released(action, id));
    }
  }
  return diffs;
}

//! Replay `diff` on the receiving side's `state`.
template <EnumWithCount A, ActionStateOwnerId ID>
void ApplyActionDiff(ActionState<A>& state, const ActionDiff<A, ID>& diff)
{
  DLOG_F(2, "apply action diff: action {} {}", EnumIndex(diff.action),
    to_string(diff.kind));
  switch (diff.kind) {
  case ActionDiffKind::kPressed:
    state.Press(diff.action);
    break;
  case ActionDiffKind::kReleased:
    state.Release(diff.action);
    break;
  }
}

//! Replay the diffs addressed to `id` on `state`, skipping the others.
/*!
 @return the number of diffs applied.
*/
template <EnumWithCount A, ActionStateOwnerId ID,
  std::ranges::input_range Diffs>
  requires std::same_as<std::ranges::range_value_t<Diffs>, ActionDiff<A, ID>>
auto ApplyActionDiffs(ActionState<A>& state, const ID& id, Diffs&& diffs)
  -> std::size_t
{
  std::size_t applied = 0;
  for (const auto& diff : diffs) {
    if (diff.id == id) {
      ApplyActionDiff(state, diff);
      ++applied;
    }
  }
  return applied;
}

} // namespace kestrel::input

//! Diffs are hashable so that they can be deduplicated in hashed containers,
//! as long as their owner id is hashable.
template <kestrel::EnumWithCount A, kestrel::input::ActionStateOwnerId ID>
  requires requires(const ID& id) { std::hash<ID> {}(id); }
struct std::hash<kestrel::input::ActionDiff<A, ID>> {
  auto operator()(const kestrel::input::ActionDiff<A, ID>& diff) const noexcept
    -> std::size_t
  {
    std::size_t seed = 0;
    kestrel::HashCombine(seed, diff.kind);
    kestrel::HashCombine(seed, diff.action);
    kestrel::HashCombine(seed, diff.id);
    return seed;
  }
};
