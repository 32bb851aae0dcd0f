//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace kestrel {

//! What ActionState::Tick() does when the supplied instant precedes the
//! instant at which a button's current state was first ticked.
enum class ClockRegressionPolicy : uint8_t {
  //! Keep `instant_started`, report a zero `current_duration`, log a warning.
  kClampToZero,
  //! Treat the out-of-order timestamp as a programming error and abort before
  //! any button is modified.
  kAbort,
};

//! Per-frame time integration settings for action states.
struct TickConfig {
  ClockRegressionPolicy on_clock_regression {
    ClockRegressionPolicy::kClampToZero
  };
};

//! Initial analog thresholds for virtual buttons.
/*!
 Both values must be in [0, 1] and `pressed` must not be lower than
 `released`. The defaults make the button a pure digital threshold.
*/
struct ButtonThresholdsConfig {
  float pressed { 0.5F };
  float released { 0.5F };
};

struct InputConfig {
  TickConfig tick; //!< Time integration of action states.
  ButtonThresholdsConfig thresholds; //!< Default analog thresholds.
};

} // namespace kestrel
