// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_BASE_BITS_H_
#define LIB_JPEGKIT_BASE_BITS_H_

// Specialized instructions for processing register-sized bit arrays.

#include "lib/jpegkit/base/compiler_specific.h"

#ifdef _MSC_VER
#include <intrin.h>
#endif

#include <stddef.h>
#include <stdint.h>

namespace jpegkit {

// Undefined results for x == 0.
static JPEGKIT_INLINE size_t NumZeroBitsAboveMSBNonzero(const uint32_t x) {
#ifdef _MSC_VER
  unsigned long index;
  _BitScanReverse(&index, x);
  return 31 - index;
#else
  return static_cast<size_t>(__builtin_clz(x));
#endif
}

// Returns the index of the most significant set bit; undefined for x == 0.
static JPEGKIT_INLINE int FloorLog2Nonzero(const uint32_t x) {
  return 31 - static_cast<int>(NumZeroBitsAboveMSBNonzero(x));
}

// Number of bits needed to represent |x|, i.e. the JPEG magnitude category.
static JPEGKIT_INLINE int BitLength(const uint32_t x) {
  return x == 0 ? 0 : FloorLog2Nonzero(x) + 1;
}

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_BASE_BITS_H_
