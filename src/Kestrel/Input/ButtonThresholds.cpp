//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Kestrel/Input/ButtonThresholds.h>

#include <Kestrel/Base/Logging.h>

using kestrel::input::ButtonThresholds;
using kestrel::input::ThresholdError;

namespace {

// NaN fails both comparisons and is rejected as well.
auto IsUnitValue(const float value) -> bool
{
  return value >= 0.0F && value <= 1.0F;
}

} // namespace

ButtonThresholds::ButtonThresholds(const ButtonThresholdsConfig& config)
  : pressed_(config.pressed)
  , released_(config.released)
{
  CHECK_F(IsUnitValue(pressed_), "pressed threshold {} is not in [0, 1]",
    pressed_);
  CHECK_F(IsUnitValue(released_), "released threshold {} is not in [0, 1]",
    released_);
  CHECK_F(pressed_ >= released_,
    "pressed threshold {} is lower than released threshold {}", pressed_,
    released_);
}

auto ButtonThresholds::SetPressed(const float value)
  -> std::expected<void, ThresholdError>
{
  CHECK_F(IsUnitValue(value), "pressed threshold {} is not in [0, 1]", value);

  if (value >= released_) {
    pressed_ = value;
    return {};
  }
  DLOG_F(1, "pressed threshold {} is below released threshold, clamped to {}",
    value, released_);
  pressed_ = released_;
  return std::unexpected(ThresholdError { .clamped_to = released_ });
}

auto ButtonThresholds::SetReleased(const float value)
  -> std::expected<void, ThresholdError>
{
  CHECK_F(IsUnitValue(value), "released threshold {} is not in [0, 1]", value);

  if (value <= pressed_) {
    released_ = value;
    return {};
  }
  DLOG_F(1, "released threshold {} is above pressed threshold, clamped to {}",
    value, pressed_);
  released_ = pressed_;
  return std::unexpected(ThresholdError { .clamped_to = pressed_ });
}

auto ButtonThresholds::Evaluate(const float value, const bool currently_pressed)
  const -> bool
{
  if (value >= pressed_) {
    return true;
  }
  if (value < released_) {
    return false;
  }
  return currently_pressed;
}
