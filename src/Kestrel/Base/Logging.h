//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

//! Single entry point for logging in Kestrel.
/*!
 All modules log through loguru, configured (by the build) to use fmt-style
 `{}` placeholders. Use:

 - `LOG_F(INFO|WARNING|ERROR, ...)` for messages that must always be emitted,
 - `DLOG_F(verbosity, ...)` for debug-only traces (1 = configuration, 2 = per-frame
   detail),
 - `CHECK_F(cond, ...)` / `ABORT_F(...)` for programming errors. These never
   return when they fire.

 The test runner (see Kestrel/Testing/gtest_main.cpp) initializes loguru;
 library code never calls `loguru::init()` itself.
*/

#include <loguru.hpp>
