//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Kestrel/Input/ActionDiff.h>

auto kestrel::input::to_string(const ActionDiffKind kind) -> const char*
{
  switch (kind) {
  case ActionDiffKind::kPressed:
    return "Pressed";
  case ActionDiffKind::kReleased:
    return "Released";
  }
  return "__NotSupported__";
}
