// Copyright 2017-2020, Schlumberger
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include "declspec.h"

#include <cstring>
#include <cstdint>
#include <type_traits>

/**
 * \file structaccess.h
 * \brief Big-endian loads and stores.
 *
 * SEG-Y headers and samples are big-endian regardless of the machine
 * that wrote them. Pointers into header buffers are often misaligned,
 * so every access goes through memcpy.
 */

namespace InternalSEGY {
#if 0
}
#endif

/**
 * Reverse the bytes of each of the n values starting at ptr.
 */
template<typename T>
static void
byteswapAlways(T *ptr, std::size_t n = 1)
{
  unsigned char buf[sizeof(T)];
  for (std::size_t ii = 0; ii < n; ++ii, ++ptr) {
    std::memcpy(buf, ptr, sizeof(T));
    for (std::size_t lo = 0, hi = sizeof(T) - 1; lo < hi; ++lo, --hi) {
      const unsigned char tmp = buf[lo];
      buf[lo] = buf[hi];
      buf[hi] = tmp;
    }
    std::memcpy(ptr, buf, sizeof(T));
  }
}

/**
 * Convert between file order and native order. A no-op on
 * big-endian machines.
 */
template<typename T>
static void
byteswapT(T *ptr, std::size_t n = 1)
{
#if !BIG_ENDIAN_ARCH
  byteswapAlways(ptr, n);
#else
  (void)ptr;
  (void)n;
#endif
}

template<typename T>
T
loadBE(const void* ptr)
{
  static_assert(std::is_arithmetic<T>::value, "scalar types only");
  T result;
  std::memcpy(&result, ptr, sizeof(T));
  byteswapT(&result);
  return result;
}

template<typename T>
void
storeBE(void* ptr, T value)
{
  static_assert(std::is_arithmetic<T>::value, "scalar types only");
  byteswapT(&value);
  std::memcpy(ptr, &value, sizeof(T));
}

/**
 * Signed big-endian integer of 1, 2 or 4 bytes widened to 64 bits.
 * Other widths raise SegyInternalError.
 */
extern OPENSEGY_TEST_API std::int64_t loadSignedBE(const void* ptr, int width);

/**
 * Store the low "width" bytes of value big-endian. No range check,
 * callers validate first.
 */
extern OPENSEGY_TEST_API void storeSignedBE(void* ptr, int width, std::int64_t value);

} // namespace
