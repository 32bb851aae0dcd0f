//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

//! Tests for ActionState

#include <chrono>
#include <initializer_list>

#include <Kestrel/Config/InputConfig.h>
#include <Kestrel/Input/ActionState.h>
#include <Kestrel/Testing/GTest.h>
#include <Kestrel/Testing/ScopedLogCapture.h>

#include "./TestActions.h"

namespace {

using kestrel::ClockRegressionPolicy;
using kestrel::TickConfig;
using kestrel::input::Duration;
using kestrel::input::VirtualButtonState;
using kestrel::input::testing::Action;
using kestrel::input::testing::T0;
using kestrel::input::testing::TestActionState;
using kestrel::testing::ScopedLogCapture;

using ::testing::IsEmpty;
using ::testing::UnorderedElementsAre;

using namespace std::chrono_literals;

//=== Lifecycle ===-----------------------------------------------------------//

//! Full press / hold / release lifecycle driven by Update() and Tick().
NOLINT_TEST(ActionState, PressLifecycle)
{
  // Arrange
  TestActionState state;

  // Act & Assert
  // Nothing pressed, every action released.
  state.Update({});
  state.Tick(T0());
  EXPECT_TRUE(state.IsReleased(Action::kRun));
  EXPECT_FALSE(state.IsJustReleased(Action::kRun));
  EXPECT_FALSE(state.IsPressed(Action::kRun));
  EXPECT_FALSE(state.IsJustPressed(Action::kRun));

  // Pressed this frame.
  state.Update({ Action::kRun });
  EXPECT_TRUE(state.IsPressed(Action::kRun));
  EXPECT_TRUE(state.IsJustPressed(Action::kRun));
  EXPECT_FALSE(state.IsReleased(Action::kRun));
  EXPECT_FALSE(state.IsJustReleased(Action::kRun));

  // Held: no longer just pressed after the tick.
  state.Tick(T0() + 16ms);
  state.Update({ Action::kRun });
  EXPECT_TRUE(state.IsPressed(Action::kRun));
  EXPECT_FALSE(state.IsJustPressed(Action::kRun));

  // Released this frame.
  state.Tick(T0() + 32ms);
  state.Update({});
  EXPECT_TRUE(state.IsReleased(Action::kRun));
  EXPECT_TRUE(state.IsJustReleased(Action::kRun));
  EXPECT_FALSE(state.IsPressed(Action::kRun));

  // Stays released.
  state.Tick(T0() + 48ms);
  state.Update({});
  EXPECT_TRUE(state.IsReleased(Action::kRun));
  EXPECT_FALSE(state.IsJustReleased(Action::kRun));
}

//! Durations accrue from the first tick after a transition, and the
//! previous duration is carried over by each transition.
NOLINT_TEST(ActionState, Durations)
{
  // Arrange
  TestActionState state;

  // Act & Assert
  state.Update({ Action::kJump });
  state.Tick(T0());
  EXPECT_EQ(state.GetState(Action::kJump).InstantStarted(), T0());
  EXPECT_EQ(state.GetState(Action::kJump).CurrentDuration(), Duration::zero());

  state.Tick(T0() + 40ms);
  EXPECT_EQ(state.GetState(Action::kJump).CurrentDuration(), 40ms);

  state.Update({});
  const auto released = state.GetState(Action::kJump);
  EXPECT_FALSE(released.InstantStarted().has_value());
  EXPECT_EQ(released.CurrentDuration(), Duration::zero());
  EXPECT_EQ(released.PreviousDuration(), 40ms);

  state.Tick(T0() + 50ms);
  state.Tick(T0() + 80ms);
  EXPECT_EQ(state.GetState(Action::kJump).CurrentDuration(), 30ms);
  EXPECT_EQ(state.GetState(Action::kJump).PreviousDuration(), 40ms);
}

//! Updating twice with the same set is the same as updating once.
NOLINT_TEST(ActionState, Update_IsIdempotent)
{
  // Arrange
  TestActionState once;
  TestActionState twice;

  // Act
  once.Update({ Action::kRun, Action::kHide });
  twice.Update({ Action::kRun, Action::kHide });
  twice.Update({ Action::kRun, Action::kHide });

  // Assert
  EXPECT_EQ(once, twice);
}

//! Updating with the currently pressed set leaves accrued timing untouched.
NOLINT_TEST(ActionState, Update_WithPressedSetIsNoOpAfterTick)
{
  // Arrange
  TestActionState state;
  state.Update({ Action::kRun, Action::kHide });
  state.Tick(T0());
  state.Tick(T0() + 25ms);
  const auto before = state;

  // Act
  state.Update({ Action::kRun, Action::kHide });

  // Assert
  EXPECT_EQ(state, before);
  EXPECT_EQ(state.GetState(Action::kRun).CurrentDuration(), 25ms);
  EXPECT_EQ(state.GetState(Action::kJump).CurrentDuration(), 25ms);
}

//! Press and Release on an action already in that state change nothing,
//! timing included.
NOLINT_TEST(ActionState, PressRelease_NoOpWhenUnchanged)
{
  // Arrange
  TestActionState state;
  state.Press(Action::kRun);
  state.Tick(T0());
  state.Tick(T0() + 10ms);
  const auto before = state;

  // Act
  state.Press(Action::kRun);
  state.Release(Action::kJump);

  // Assert
  EXPECT_EQ(state, before);
}

//=== Set queries ===---------------------------------------------------------//

NOLINT_TEST(ActionState, SetQueries)
{
  // Arrange
  TestActionState state;
  state.Press(Action::kRun);
  state.Press(Action::kJump);
  state.Tick(T0());

  // Act
  state.Release(Action::kJump);
  state.Press(Action::kHide);

  // Assert
  EXPECT_THAT(
    state.GetPressed(), UnorderedElementsAre(Action::kRun, Action::kHide));
  EXPECT_THAT(state.GetJustPressed(), UnorderedElementsAre(Action::kHide));
  EXPECT_THAT(state.GetReleased(), UnorderedElementsAre(Action::kJump));
  EXPECT_THAT(state.GetJustReleased(), UnorderedElementsAre(Action::kJump));
}

//! Every pressed action is released and becomes just released.
NOLINT_TEST(ActionState, ReleaseAll)
{
  // Arrange
  TestActionState state;
  state.Update({ Action::kRun, Action::kJump });
  state.Tick(T0());

  // Act
  state.ReleaseAll();

  // Assert
  EXPECT_THAT(state.GetPressed(), IsEmpty());
  EXPECT_THAT(
    state.GetJustReleased(), UnorderedElementsAre(Action::kRun, Action::kJump));
  EXPECT_FALSE(state.IsJustReleased(Action::kHide));

  // Releasing again changes nothing.
  const auto released = state;
  state.ReleaseAll();
  EXPECT_EQ(state, released);
}

//! A default map has one value-initialized entry per action.
NOLINT_TEST(ActionState, DefaultMap)
{
  // Arrange & Act
  auto map = TestActionState::DefaultMap<int>();

  // Assert
  EXPECT_EQ(map.size(), 3U);
  for (const auto value : map) {
    EXPECT_EQ(value, 0);
  }
  map[Action::kHide] = 3;
  EXPECT_EQ(map[Action::kHide], 3);
}

//=== State access ===--------------------------------------------------------//

//! SetState overwrites the whole state, timing included.
NOLINT_TEST(ActionState, SetState_OverwritesTiming)
{
  // Arrange
  TestActionState source;
  source.Press(Action::kRun);
  source.Tick(T0());
  source.Tick(T0() + 5ms);
  TestActionState target;

  // Act
  target.SetState(Action::kRun, source.GetState(Action::kRun));

  // Assert
  EXPECT_EQ(target.GetState(Action::kRun), source.GetState(Action::kRun));
  EXPECT_EQ(target.GetState(Action::kRun).CurrentDuration(), 5ms);
  // Only the targeted slot changes.
  EXPECT_EQ(target.GetState(Action::kJump), VirtualButtonState {});
  EXPECT_EQ(target.GetState(Action::kHide), VirtualButtonState {});
}

//! Querying a value outside the action set yields a released default state.
NOLINT_TEST(ActionState, GetState_InvalidActionIsDefault)
{
  // Arrange
  TestActionState state;
  state.Update({ Action::kRun, Action::kJump, Action::kHide });

  // Act
  const auto invalid = state.GetState(Action::kCount);

  // Assert
  EXPECT_EQ(invalid, VirtualButtonState {});
  EXPECT_FALSE(state.IsPressed(Action::kCount));
}

NOLINT_TEST(ActionStateDeathTest, SetState_InvalidActionAborts)
{
  TestActionState state;
  NOLINT_EXPECT_DEATH(
    state.SetState(Action::kCount, VirtualButtonState {}), "not part of");
}

NOLINT_TEST(ActionStateDeathTest, Press_InvalidActionAborts)
{
  TestActionState state;
  NOLINT_EXPECT_DEATH(state.Press(static_cast<Action>(42)), "not part of");
}

//=== Clock regression ===----------------------------------------------------//

//! With the default policy, a tick in the past clamps durations to zero,
//! keeps the start instants, and logs a single warning.
NOLINT_TEST(ActionState, Tick_ClockRegressionClampsAndWarns)
{
  // Arrange
  TestActionState state;
  state.Update({ Action::kRun, Action::kJump });
  state.Tick(T0());
  state.Tick(T0() + 20ms);
  ScopedLogCapture capture { "clock", loguru::Verbosity_WARNING };

  // Act
  state.Tick(T0() - 5ms);

  // Assert
  EXPECT_EQ(capture.Count("clock went backwards"), 1);
  for (const auto action : { Action::kRun, Action::kJump, Action::kHide }) {
    EXPECT_EQ(state.GetState(action).InstantStarted(), T0());
    EXPECT_EQ(state.GetState(action).CurrentDuration(), Duration::zero());
  }
}

NOLINT_TEST(ActionState, Tick_MonotonicDoesNotWarn)
{
  // Arrange
  TestActionState state;
  state.Update({ Action::kRun });
  ScopedLogCapture capture { "clock", loguru::Verbosity_WARNING };

  // Act
  state.Tick(T0());
  state.Tick(T0());
  state.Tick(T0() + 1ms);

  // Assert
  EXPECT_FALSE(capture.Contains("clock went backwards"));
}

//! With the abort policy, a tick in the past is fatal.
NOLINT_TEST(ActionStateDeathTest, Tick_ClockRegressionAbortsWhenConfigured)
{
  TestActionState state {
    TickConfig { .on_clock_regression = ClockRegressionPolicy::kAbort },
  };
  EXPECT_EQ(
    state.GetConfig().on_clock_regression, ClockRegressionPolicy::kAbort);
  state.Press(Action::kRun);
  state.Tick(T0());

  NOLINT_EXPECT_DEATH(state.Tick(T0() - 1ms), "clock went backwards");
}

} // namespace
