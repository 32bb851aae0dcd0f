//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <expected>

#include <Kestrel/Config/InputConfig.h>
#include <Kestrel/Input/api_export.h>

namespace kestrel::input {

//! A threshold update was rejected and a different value was committed.
struct ThresholdError {
  //! The value that was actually stored instead of the requested one.
  float clamped_to;

  auto operator==(const ThresholdError&) const -> bool = default;
};

//! Analog values at which a button is considered pressed or released.
/*!
 Both thresholds are in [0, 1] and `pressed` is never lower than `released`.
 With the default 0.5 / 0.5 the button behaves as a single digital threshold.
 When `released` is lower than `pressed`, values in between keep the previous
 decision (see Evaluate()).

 Values outside [0, 1] are programming errors and abort. Values that would
 break the ordering are clamped and reported through `ThresholdError`.
*/
class ButtonThresholds {
public:
  ButtonThresholds() = default;

  //! Construct from configuration; aborts if the configuration is invalid.
  KSTL_NPUT_API explicit ButtonThresholds(const ButtonThresholdsConfig& config);

  //! Value at or above which the button is considered pressed.
  [[nodiscard]] auto Pressed() const -> float { return pressed_; }

  //! Value below which the button is considered released.
  [[nodiscard]] auto Released() const -> float { return released_; }

  //! Set the pressed threshold.
  /*!
   If `value` is lower than the released threshold, the pressed threshold is
   set to the released threshold instead and the returned error carries it.

   @warning Aborts if `value` is not in [0, 1].
  */
  KSTL_NPUT_NDAPI auto SetPressed(float value)
    -> std::expected<void, ThresholdError>;

  //! Set the released threshold.
  /*!
   If `value` is higher than the pressed threshold, the released threshold is
   set to the pressed threshold instead and the returned error carries it.
   The pressed threshold is never modified by this call.

   @warning Aborts if `value` is not in [0, 1].
  */
  KSTL_NPUT_NDAPI auto SetReleased(float value)
    -> std::expected<void, ThresholdError>;

  //! Turn an analog `value` into a pressed (true) or released (false)
  //! decision, given the current decision for the same button.
  KSTL_NPUT_NDAPI auto Evaluate(float value, bool currently_pressed) const
    -> bool;

private:
  float pressed_ { 0.5F };
  float released_ { 0.5F };
};

} // namespace kestrel::input
