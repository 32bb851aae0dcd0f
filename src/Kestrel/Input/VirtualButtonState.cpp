//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Kestrel/Input/VirtualButtonState.h>

using kestrel::input::Instant;
using kestrel::input::Timing;
using kestrel::input::VirtualButtonState;

namespace {

// Fresh timing for a state that was just entered.
auto TimingAfterTransition(const Timing& exited) -> Timing
{
  return Timing {
    .instant_started = std::nullopt,
    .current_duration = kestrel::input::Duration::zero(),
    .previous_duration = exited.current_duration,
  };
}

} // namespace

auto VirtualButtonState::Press() -> bool
{
  if (IsPressed()) {
    return false;
  }
  state_ = Pressed { .timing = TimingAfterTransition(GetTiming()) };
  return true;
}

auto VirtualButtonState::Release() -> bool
{
  if (IsReleased()) {
    return false;
  }
  state_ = Released { .timing = TimingAfterTransition(GetTiming()) };
  return true;
}

auto VirtualButtonState::Tick(const Instant now) -> bool
{
  auto& timing = MutableTiming();
  if (!timing.instant_started) {
    timing.instant_started = now;
    timing.current_duration = Duration::zero();
    return true;
  }

  const auto started = *timing.instant_started;
  if (now < started) {
    timing.current_duration = Duration::zero();
    return false;
  }
  timing.current_duration = now - started;
  return true;
}
