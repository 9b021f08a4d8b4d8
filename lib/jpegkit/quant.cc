// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/jpegkit/quant.h"

#include <algorithm>

#include "lib/jpegkit/common_internal.h"

namespace jpegkit {

/* clang-format off */
const uint8_t kStdLumaQuantTable[64] = {
  16,  11,  10,  16,  24,  40,  51,  61,
  12,  12,  14,  19,  26,  58,  60,  55,
  14,  13,  16,  24,  40,  57,  69,  56,
  14,  17,  22,  29,  51,  87,  80,  62,
  18,  22,  37,  56,  68, 109, 103,  77,
  24,  35,  55,  64,  81, 104, 113,  92,
  49,  64,  78,  87, 103, 121, 120, 101,
  72,  92,  95,  98, 112, 100, 103,  99,
};

const uint8_t kStdChromaQuantTable[64] = {
  17,  18,  24,  47,  99,  99,  99,  99,
  18,  21,  26,  66,  99,  99,  99,  99,
  24,  26,  56,  99,  99,  99,  99,  99,
  47,  66,  99,  99,  99,  99,  99,  99,
  99,  99,  99,  99,  99,  99,  99,  99,
  99,  99,  99,  99,  99,  99,  99,  99,
  99,  99,  99,  99,  99,  99,  99,  99,
  99,  99,  99,  99,  99,  99,  99,  99,
};
/* clang-format on */

int QualityToScale(int quality) {
  quality = std::min(100, std::max(1, quality));
  return quality < 50 ? 5000 / quality : 200 - 2 * quality;
}

void ScaleQuantTable(const uint8_t* base, int quality, uint16_t* table) {
  const int scale = QualityToScale(quality);
  for (size_t i = 0; i < kDCTBlockSize; ++i) {
    const int q = (base[i] * scale + 50) / 100;
    table[i] = std::min(255, std::max(1, q));
  }
}

}  // namespace jpegkit
