//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <cstdint>

#include <Kestrel/Input/ActionState.h>
#include <Kestrel/Input/Timing.h>

namespace kestrel::input::testing {

//! Small action set shared by the input tests.
enum class Action : uint8_t {
  kFirst = 0,
  kRun = kFirst,
  kJump,
  kHide,
  kCount,
};

using TestActionState = ActionState<Action>;

//! Fixed origin for deterministic timestamps; tests never read the clock.
inline auto T0() -> Instant { return Instant {} + std::chrono::hours(1); }

} // namespace kestrel::input::testing
