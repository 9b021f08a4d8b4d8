// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_QUANT_H_
#define LIB_JPEGKIT_QUANT_H_

#include <stdint.h>

namespace jpegkit {

// Annex K quantization tables in natural order.
extern const uint8_t kStdLumaQuantTable[64];
extern const uint8_t kStdChromaQuantTable[64];

// libjpeg quality to percentage scale mapping, quality is clamped to
// [1, 100].
int QualityToScale(int quality);

// Scales a base table (natural order) to the given quality, clamping every
// entry to [1, 255].
void ScaleQuantTable(const uint8_t* base, int quality, uint16_t* table);

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_QUANT_H_
