//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <optional>

namespace kestrel::input {

//! Monotonic clock expected by the input layer. The core never reads it;
//! callers sample it once per frame and pass the instant to Tick().
using Clock = std::chrono::steady_clock;
using Instant = Clock::time_point;
using Duration = Clock::duration;

//! Timing information for the current state of a virtual button.
/*!
 ### Invariants

 - `instant_started` is empty from the moment the button changes state until
   the next tick. An empty value is what makes the button "just pressed" or
   "just released".
 - `current_duration` is measured from `instant_started` and is zero until the
   second tick after a transition. Both are reset together on a transition.
 - `previous_duration` is the `current_duration` of the state that was exited
   by the last transition. Ticking never changes it.
*/
struct Timing {
  //! Instant of the first tick after the state last changed.
  std::optional<Instant> instant_started;
  //! How long the button has been in its current state.
  Duration current_duration { Duration::zero() };
  //! How long the button was in its previous state.
  Duration previous_duration { Duration::zero() };

  auto operator==(const Timing&) const -> bool = default;
};

} // namespace kestrel::input
