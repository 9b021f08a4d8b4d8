// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_DCT_H_
#define LIB_JPEGKIT_DCT_H_

// Forward DCT and quantization of the encoder.

#include <stddef.h>
#include <stdint.h>

#include "lib/jpegkit/common_internal.h"

namespace jpegkit {

// Number of fractional bits of the quantization reciprocals.
constexpr int kQuantReciprocalBits = 20;

// Transforms the 8x8 samples at pixels (row stride in bytes) after the level
// shift by 128. The output is in natural order and scaled up by 8 relative to
// the JPEG coefficient definition.
void ForwardDCTBlockInteger(const uint8_t* pixels, size_t stride,
                            int32_t* out);

// Direct summation of the cosine basis in double precision, same output
// scaling as above.
void ForwardDCTBlockFloat(const uint8_t* pixels, size_t stride, int32_t* out);

// Per-coefficient divisors of one quantization table, including the factor 8
// of the forward transform output.
struct QuantDivisors {
  uint32_t reciprocal[kDCTBlockSize];
  uint32_t rounding[kDCTBlockSize];
};

void ComputeQuantDivisors(const uint16_t* quant, QuantDivisors* divisors);

// Divides by the quantization step with rounding to the nearest integer, ties
// away from zero for both signs.
void QuantizeBlock(const int32_t* dct, const QuantDivisors& divisors,
                   coeff_t* block);

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_DCT_H_
