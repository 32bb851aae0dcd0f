//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <concepts>
#include <cstddef>
#include <unordered_set>
#include <utility>

#include <Kestrel/Base/EnumIndexedArray.h>
#include <Kestrel/Base/Logging.h>
#include <Kestrel/Config/InputConfig.h>
#include <Kestrel/Input/Timing.h>
#include <Kestrel/Input/VirtualButtonState.h>

namespace kestrel::input {

//=== ActionState ------------------------------------------------------------//

//! Input-method-agnostic state of every action of an action set.
/*!
 Holds one `VirtualButtonState` per value of the action enum `A`. The table is
 dense and sized from `A::kCount`, so every action always has exactly one
 entry; entries are overwritten, never removed.

### Frame Lifecycle

Driven once per frame by the input layer, in this order:

- Update(pressed_set): presses the actions that are in `pressed_set` but
  released, and releases the actions that are pressed but not in the set.
  Calling it more than once per frame is safe but merges the physical
  transitions of that frame into one.
- Tick(now): stamps the first tick after each transition (which clears the
  "just pressed" / "just released" facts) and accrues the duration of stable
  states.

Between the two calls, and after Tick(), any number of queries can be made.

### Usage

```cpp
enum class Action : uint8_t { kFirst = 0, kRun = kFirst, kJump, kCount };

ActionState<Action> state;
state.Press(Action::kJump);
state.IsJustPressed(Action::kJump); // true
state.Tick(Clock::now());
state.IsJustPressed(Action::kJump); // false
state.IsPressed(Action::kJump);     // true
```

 @tparam A Action set: an enum satisfying `EnumWithCount`.
*/
template <EnumWithCount A> class ActionState {
public:
  using ActionSet = std::unordered_set<A>;

  //! Dense per-action table with one value per action.
  template <typename V> using Map = EnumIndexedArray<A, V>;

  //! Everything released and untimed, default tick configuration.
  ActionState() = default;

  explicit ActionState(const TickConfig& config)
    : config_(config)
  {
  }

  [[nodiscard]] auto GetConfig() const -> const TickConfig& { return config_; }

  //! Synchronize with the set of actions that are physically active.
  void Update(const ActionSet& pressed_set)
  {
    for (const auto action : enum_values<A>) {
      const bool should_be_pressed = pressed_set.contains(action);
      const auto& state = states_[action];
      if (state.IsPressed() && !should_be_pressed) {
        Release(action);
      } else if (state.IsReleased() && should_be_pressed) {
        Press(action);
      }
    }
  }

  //! Advance the timing of every action to `now`.
  /*!
   `now` is expected to be monotonic. When it precedes the instant at which a
   button's current state started, the configured `ClockRegressionPolicy`
   applies: either the duration is clamped to zero and a warning is logged,
   or the process aborts before any button is modified.
  */
  void Tick(const Instant now)
  {
    if (config_.on_clock_regression == ClockRegressionPolicy::kAbort) {
      for (const auto action : enum_values<A>) {
        CHECK_F(!states_[action].StartedAfter(now),
          "clock went backwards for action {}",
          EnumIndex(action));
      }
    }

    std::size_t clamped = 0;
    for (auto& state : states_) {
      if (!state.Tick(now)) {
        ++clamped;
      }
    }
    if (clamped > 0) {
      LOG_F(WARNING,
        "clock went backwards: {} action(s) ticked with a zero duration",
        clamped);
    }
  }

  //! Copy of the state of `action`, or a released, untimed state if `action`
  //! is not part of the action set.
  [[nodiscard]] auto GetState(const A action) const -> VirtualButtonState
  {
    if (!IsValidEnumValue(action)) {
      return VirtualButtonState {};
    }
    return states_[action];
  }

  //! Overwrite the state of `action`, timing included.
  /*!
   Prefer Press() and Release(), which keep the durations consistent. This is
   meant for transferring a state between action sets, or for tests.

   @warning Aborts if `action` is not part of the action set.
  */
  void SetState(const A action, VirtualButtonState state)
  {
    CHECK_F(IsValidEnumValue(action),
      "action {} is not part of the action set (count {})", EnumIndex(action),
      kEnumCount<A>);
    states_[action] = std::move(state);
  }

  //! Press `action`; no-op if it is already pressed.
  void Press(const A action)
  {
    if (Slot(action).Press()) {
      DLOG_F(2, "action {} pressed", EnumIndex(action));
    }
  }

  //! Release `action`; no-op if it is already released.
  void Release(const A action)
  {
    if (Slot(action).Release()) {
      DLOG_F(2, "action {} released", EnumIndex(action));
    }
  }

  void ReleaseAll()
  {
    for (const auto action : enum_values<A>) {
      Release(action);
    }
  }

  // -- Per-action queries -----------------------------------------------------

  [[nodiscard]] auto IsPressed(const A action) const -> bool
  {
    return GetState(action).IsPressed();
  }

  //! Pressed since the last Tick().
  [[nodiscard]] auto IsJustPressed(const A action) const -> bool
  {
    return GetState(action).IsJustPressed();
  }

  //! Always the negation of IsPressed().
  [[nodiscard]] auto IsReleased(const A action) const -> bool
  {
    return GetState(action).IsReleased();
  }

  //! Released since the last Tick().
  [[nodiscard]] auto IsJustReleased(const A action) const -> bool
  {
    return GetState(action).IsJustReleased();
  }

  // -- Set queries ------------------------------------------------------------

  [[nodiscard]] auto GetPressed() const -> ActionSet
  {
    return Collect(&VirtualButtonState::IsPressed);
  }

  [[nodiscard]] auto GetJustPressed() const -> ActionSet
  {
    return Collect(&VirtualButtonState::IsJustPressed);
  }

  [[nodiscard]] auto GetReleased() const -> ActionSet
  {
    return Collect(&VirtualButtonState::IsReleased);
  }

  [[nodiscard]] auto GetJustReleased() const -> ActionSet
  {
    return Collect(&VirtualButtonState::IsJustReleased);
  }

  //! A per-action table with every entry value-initialized.
  template <std::default_initializable V>
  [[nodiscard]] static auto DefaultMap() -> Map<V>
  {
    return Map<V> {};
  }

  //! Two action states are equal when every action has the same state.
  friend auto operator==(const ActionState& lhs, const ActionState& rhs)
    -> bool
  {
    return lhs.states_ == rhs.states_;
  }

private:
  auto Slot(const A action) -> VirtualButtonState&
  {
    CHECK_F(IsValidEnumValue(action),
      "action {} is not part of the action set (count {})", EnumIndex(action),
      kEnumCount<A>);
    return states_[action];
  }

  auto Collect(bool (VirtualButtonState::*predicate)() const) const
    -> ActionSet
  {
    ActionSet result;
    for (const auto action : enum_values<A>) {
      if ((states_[action].*predicate)()) {
        result.insert(action);
      }
    }
    return result;
  }

  TickConfig config_ {};
  Map<VirtualButtonState> states_ { DefaultMap<VirtualButtonState>() };
};

} // namespace kestrel::input
