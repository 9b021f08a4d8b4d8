// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_IDCT_H_
#define LIB_JPEGKIT_IDCT_H_

#include <stddef.h>
#include <stdint.h>

#include "lib/jpegkit/common_internal.h"

namespace jpegkit {

// Dequantizes one block of coefficients (natural order) with the quantization
// table and writes the 8x8 reconstructed samples, level shifted by 128 and
// clamped to [0, 255], to out with the given row stride.
//
// Fixed-point separable transform with 13 fractional bits. Rows and columns
// whose AC terms are all zero are filled from their DC term directly.
void InverseDCTBlockInteger(const coeff_t* coeffs, const uint16_t* quant,
                            uint8_t* out, size_t stride);

// Same as above without any of the all-zero shortcuts, the output is
// identical.
void InverseDCTBlockIntegerFull(const coeff_t* coeffs, const uint16_t* quant,
                                uint8_t* out, size_t stride);

// Reference transform by direct summation of the cosine basis in single
// precision.
void InverseDCTBlockFloat(const coeff_t* coeffs, const uint16_t* quant,
                          uint8_t* out, size_t stride);

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_IDCT_H_
