//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <utility>
#include <variant>

#include <Kestrel/Input/Timing.h>
#include <Kestrel/Input/api_export.h>

namespace kestrel::input {

//=== VirtualButtonState -----------------------------------------------------//

//! Pressed or released state of a single action, with its timing.
/*!
 A virtual button is always in exactly one of two states, each carrying its
 own `Timing`. The "just pressed" and "just released" facts are derived from
 the timing (no tick since the transition), never stored.

### Frame Lifecycle

- Press() / Release(): swap the state when it differs. The new state gets a
  fresh `Timing` with an empty `instant_started`, a zero `current_duration`,
  and the exited state's `current_duration` as `previous_duration`.
- Tick(now): stamps `instant_started` on the first tick after a transition,
  otherwise refreshes `current_duration` from it.

 @see ActionState
*/
class VirtualButtonState {
public:
  struct Pressed {
    Timing timing;
    auto operator==(const Pressed&) const -> bool = default;
  };

  struct Released {
    Timing timing;
    auto operator==(const Released&) const -> bool = default;
  };

  //! Released, never ticked.
  VirtualButtonState() = default;

  explicit(false) VirtualButtonState(Pressed pressed)
    : state_(std::move(pressed))
  {
  }

  explicit(false) VirtualButtonState(Released released)
    : state_(std::move(released))
  {
  }

  // -- State queries ----------------------------------------------------------

  [[nodiscard]] auto IsPressed() const -> bool
  {
    return std::holds_alternative<Pressed>(state_);
  }

  [[nodiscard]] auto IsReleased() const -> bool
  {
    return std::holds_alternative<Released>(state_);
  }

  //! Pressed, and not ticked since it was pressed.
  [[nodiscard]] auto IsJustPressed() const -> bool
  {
    return IsPressed() && !GetTiming().instant_started.has_value();
  }

  //! Released, and not ticked since it was released.
  [[nodiscard]] auto IsJustReleased() const -> bool
  {
    return IsReleased() && !GetTiming().instant_started.has_value();
  }

  // -- Timing -----------------------------------------------------------------

  [[nodiscard]] auto GetTiming() const -> const Timing&
  {
    return std::visit(
      [](const auto& s) -> const Timing& { return s.timing; }, state_);
  }

  [[nodiscard]] auto InstantStarted() const -> std::optional<Instant>
  {
    return GetTiming().instant_started;
  }

  [[nodiscard]] auto CurrentDuration() const -> Duration
  {
    return GetTiming().current_duration;
  }

  [[nodiscard]] auto PreviousDuration() const -> Duration
  {
    return GetTiming().previous_duration;
  }

  //! True when the current state was first ticked at an instant later than
  //! `now`, i.e. ticking with `now` would need a negative duration.
  [[nodiscard]] auto StartedAfter(Instant now) const -> bool
  {
    const auto& started = GetTiming().instant_started;
    return started.has_value() && *started > now;
  }

  //! Pattern-match on the state: `visitor` is called with either a
  //! `const Pressed&` or a `const Released&`.
  template <typename Visitor> decltype(auto) Visit(Visitor&& visitor) const
  {
    return std::visit(std::forward<Visitor>(visitor), state_);
  }

  // -- Transitions ------------------------------------------------------------

  //! Switch to Pressed if currently released.
  /*!
   @return true if the state changed, false if the button was already pressed.
  */
  KSTL_NPUT_API auto Press() -> bool;

  //! Switch to Released if currently pressed.
  /*!
   @return true if the state changed, false if the button was already
   released.
  */
  KSTL_NPUT_API auto Release() -> bool;

  //! Advance the timing of the current state to `now`.
  /*!
   On the first tick after a transition, `now` becomes `instant_started` and
   `current_duration` is zero. Otherwise `current_duration` becomes
   `now - instant_started`. If `now` precedes `instant_started`, the duration
   is clamped to zero and the method returns false so that the caller can
   apply its clock regression policy.

   @return false if the elapsed time had to be clamped, true otherwise.
  */
  KSTL_NPUT_NDAPI auto Tick(Instant now) -> bool;

  auto operator==(const VirtualButtonState&) const -> bool = default;

private:
  [[nodiscard]] auto MutableTiming() -> Timing&
  {
    return std::visit([](auto& s) -> Timing& { return s.timing; }, state_);
  }

  std::variant<Released, Pressed> state_ { Released {} };
};

} // namespace kestrel::input
