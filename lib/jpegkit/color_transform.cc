// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/jpegkit/color_transform.h"

#include <stdlib.h>

namespace jpegkit {
namespace {

constexpr int kScaleBits = 16;
constexpr int32_t kOneHalf = 1 << (kScaleBits - 1);

// Round(x * 2^16) of the BT.601 coefficients.
constexpr int32_t kCrToR = 91881;   // 1.40200
constexpr int32_t kCbToG = 22554;   // 0.34414
constexpr int32_t kCrToG = 46802;   // 0.71414
constexpr int32_t kCbToB = 116130;  // 1.77200

constexpr int32_t kRToY = 19595;  // 0.29900
constexpr int32_t kGToY = 38470;  // 0.58700
constexpr int32_t kBToY = 7471;   // 0.11400
constexpr int32_t kRToCb = 11059;  // 0.16874
constexpr int32_t kGToCb = 21709;  // 0.33126
constexpr int32_t kBToCb = 32768;  // 0.50000
constexpr int32_t kRToCr = 32768;  // 0.50000
constexpr int32_t kGToCr = 27439;  // 0.41869
constexpr int32_t kBToCr = 5329;   // 0.08131
constexpr int32_t kCbCrOffset = (128 << kScaleBits) + kOneHalf - 1;

// Maps v + 256 to clamp(v, 0, 255) for v in [-256, 512).
struct RangeLimitTable {
  RangeLimitTable() {
    for (int i = 0; i < 768; ++i) {
      const int v = i - 256;
      table[i] = v < 0 ? 0 : v > 255 ? 255 : v;
    }
  }
  uint8_t table[768];
};

const uint8_t* RangeLimit() {
  static const RangeLimitTable* kTable = new RangeLimitTable();
  return kTable->table + 256;
}

JPEGKIT_INLINE uint8_t MulDiv255(int a, int b) {
  return static_cast<uint8_t>((a * b + 127) / 255);
}

}  // namespace

void YCbCrToRGB(uint8_t* JPEGKIT_RESTRICT row0, uint8_t* JPEGKIT_RESTRICT row1,
                uint8_t* JPEGKIT_RESTRICT row2, size_t xsize) {
  const uint8_t* limit = RangeLimit();
  for (size_t x = 0; x < xsize; ++x) {
    const int y = row0[x];
    const int cb = row1[x] - 128;
    const int cr = row2[x] - 128;
    row0[x] = limit[y + ((kCrToR * cr + kOneHalf) >> kScaleBits)];
    row1[x] = limit[y + ((-kCbToG * cb - kCrToG * cr + kOneHalf) >>
                         kScaleBits)];
    row2[x] = limit[y + ((kCbToB * cb + kOneHalf) >> kScaleBits)];
  }
}

void RGBToYCbCr(uint8_t* JPEGKIT_RESTRICT row0, uint8_t* JPEGKIT_RESTRICT row1,
                uint8_t* JPEGKIT_RESTRICT row2, size_t xsize) {
  for (size_t x = 0; x < xsize; ++x) {
    const int32_t r = row0[x];
    const int32_t g = row1[x];
    const int32_t b = row2[x];
    row0[x] = (kRToY * r + kGToY * g + kBToY * b + kOneHalf) >> kScaleBits;
    row1[x] = (-kRToCb * r - kGToCb * g + kBToCb * b + kCbCrOffset) >>
              kScaleBits;
    row2[x] = (kRToCr * r - kGToCr * g - kBToCr * b + kCbCrOffset) >>
              kScaleBits;
  }
}

void YCCKToCMYK(uint8_t* JPEGKIT_RESTRICT row0, uint8_t* JPEGKIT_RESTRICT row1,
                uint8_t* JPEGKIT_RESTRICT row2, size_t xsize) {
  YCbCrToRGB(row0, row1, row2, xsize);
  for (size_t x = 0; x < xsize; ++x) {
    row0[x] = 255 - row0[x];
    row1[x] = 255 - row1[x];
    row2[x] = 255 - row2[x];
  }
}

void CMYKToRGB(uint8_t* JPEGKIT_RESTRICT row0, uint8_t* JPEGKIT_RESTRICT row1,
               uint8_t* JPEGKIT_RESTRICT row2,
               const uint8_t* JPEGKIT_RESTRICT row3, size_t xsize) {
  for (size_t x = 0; x < xsize; ++x) {
    const int k = row3[x];
    row0[x] = MulDiv255(row0[x], k);
    row1[x] = MulDiv255(row1[x], k);
    row2[x] = MulDiv255(row2[x], k);
  }
}

bool LooksLikeYCCK(const uint8_t* plane1, size_t stride1,
                   const uint8_t* plane2, size_t stride2, size_t xsize,
                   size_t ysize) {
  // Mean absolute deviation from 128 below which the planes are treated as
  // chroma.
  constexpr uint64_t kChromaDeviation = 24;
  uint64_t sum = 0;
  for (size_t y = 0; y < ysize; ++y) {
    const uint8_t* row1 = plane1 + y * stride1;
    const uint8_t* row2 = plane2 + y * stride2;
    for (size_t x = 0; x < xsize; ++x) {
      sum += abs(row1[x] - 128) + abs(row2[x] - 128);
    }
  }
  const uint64_t num_samples = 2 * static_cast<uint64_t>(xsize) * ysize;
  return num_samples > 0 && sum < kChromaDeviation * num_samples;
}

}  // namespace jpegkit
