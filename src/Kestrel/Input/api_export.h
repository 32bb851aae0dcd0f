//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#if defined(_WIN32) || defined(_WIN64)
#  ifdef KESTREL_INPUT_STATIC
#    define KSTL_NPUT_API
#  else
#    ifdef KESTREL_INPUT_EXPORTS
#      define KSTL_NPUT_API __declspec(dllexport)
#    else
#      define KSTL_NPUT_API __declspec(dllimport)
#    endif
#  endif
#elif defined(__APPLE__) || defined(__linux__)
#  ifdef KESTREL_INPUT_EXPORTS
#    define KSTL_NPUT_API __attribute__((visibility("default")))
#  else
#    define KSTL_NPUT_API
#  endif
#else
#  define KSTL_NPUT_API
#endif

#define KSTL_NPUT_NDAPI [[nodiscard]] KSTL_NPUT_API
