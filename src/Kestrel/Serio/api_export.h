//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#if defined(_WIN32) || defined(_WIN64)
#  ifdef KESTREL_SERIO_STATIC
#    define KSTL_SERIO_API
#  else
#    ifdef KESTREL_SERIO_EXPORTS
#      define KSTL_SERIO_API __declspec(dllexport)
#    else
#      define KSTL_SERIO_API __declspec(dllimport)
#    endif
#  endif
#elif defined(__APPLE__) || defined(__linux__)
#  ifdef KESTREL_SERIO_EXPORTS
#    define KSTL_SERIO_API __attribute__((visibility("default")))
#  else
#    define KSTL_SERIO_API
#  endif
#else
#  define KSTL_SERIO_API
#endif

#define KSTL_SERIO_NDAPI [[nodiscard]] KSTL_SERIO_API
