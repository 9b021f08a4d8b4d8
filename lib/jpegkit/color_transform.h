// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_COLOR_TRANSFORM_H_
#define LIB_JPEGKIT_COLOR_TRANSFORM_H_

#include <stddef.h>
#include <stdint.h>

#include "lib/jpegkit/base/compiler_specific.h"

namespace jpegkit {

// In-place conversion of one row, row0..row2 hold Y, Cb, Cr on input and R,
// G, B on output. Uses the 16-bit fixed-point BT.601 coefficients of libjpeg.
void YCbCrToRGB(uint8_t* JPEGKIT_RESTRICT row0, uint8_t* JPEGKIT_RESTRICT row1,
                uint8_t* JPEGKIT_RESTRICT row2, size_t xsize);

// Inverse of the above, used by the encoder.
void RGBToYCbCr(uint8_t* JPEGKIT_RESTRICT row0, uint8_t* JPEGKIT_RESTRICT row1,
                uint8_t* JPEGKIT_RESTRICT row2, size_t xsize);

// In-place conversion of one row of YCCK to the inverted CMYK convention of
// Adobe files. Row3 (K) is left as is.
void YCCKToCMYK(uint8_t* JPEGKIT_RESTRICT row0, uint8_t* JPEGKIT_RESTRICT row1,
                uint8_t* JPEGKIT_RESTRICT row2, size_t xsize);

// In-place conversion of inverted CMYK to RGB, row0..row2 receive R, G, B.
void CMYKToRGB(uint8_t* JPEGKIT_RESTRICT row0, uint8_t* JPEGKIT_RESTRICT row1,
               uint8_t* JPEGKIT_RESTRICT row2,
               const uint8_t* JPEGKIT_RESTRICT row3, size_t xsize);

// Best-effort guess for 4-component images without an Adobe marker: the
// chroma planes of YCCK data stay close to 128, the magenta and yellow
// planes of CMYK data usually do not. The top left xsize x ysize samples of
// both planes are examined.
bool LooksLikeYCCK(const uint8_t* plane1, size_t stride1,
                   const uint8_t* plane2, size_t stride2, size_t xsize,
                   size_t ysize);

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_COLOR_TRANSFORM_H_
