// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/jpegkit/idct.h"

#include <math.h>

#include "lib/jpegkit/base/compiler_specific.h"

namespace jpegkit {
namespace {

constexpr int kConstBits = 13;
constexpr int kPass1Bits = 2;

// Round(x * 2^13) of the rotation constants.
constexpr int64_t kFix_0_298631336 = 2446;
constexpr int64_t kFix_0_390180644 = 3196;
constexpr int64_t kFix_0_541196100 = 4433;
constexpr int64_t kFix_0_765366865 = 6270;
constexpr int64_t kFix_0_899976223 = 7373;
constexpr int64_t kFix_1_175875602 = 9633;
constexpr int64_t kFix_1_501321110 = 12299;
constexpr int64_t kFix_1_847759065 = 15137;
constexpr int64_t kFix_1_961570560 = 16069;
constexpr int64_t kFix_2_053119869 = 16819;
constexpr int64_t kFix_2_562915447 = 20995;
constexpr int64_t kFix_3_072711026 = 25172;

JPEGKIT_INLINE int Descale(int64_t x, int n) {
  return static_cast<int>((x + (int64_t{1} << (n - 1))) >> n);
}

JPEGKIT_INLINE uint8_t ClampSample(int v) {
  return v < 0 ? 0 : v > 255 ? 255 : static_cast<uint8_t>(v);
}

// One dimensional 8-point inverse transform, the results are scaled by
// 2^kConstBits.
JPEGKIT_INLINE void Transform1D(const int64_t* in, int64_t* out) {
  int64_t z2 = in[2];
  int64_t z3 = in[6];

  // Even part.
  int64_t z1 = (z2 + z3) * kFix_0_541196100;
  int64_t tmp2 = z1 - z3 * kFix_1_847759065;
  int64_t tmp3 = z1 + z2 * kFix_0_765366865;

  int64_t tmp0 = (in[0] + in[4]) * (int64_t{1} << kConstBits);
  int64_t tmp1 = (in[0] - in[4]) * (int64_t{1} << kConstBits);

  int64_t tmp10 = tmp0 + tmp3;
  int64_t tmp13 = tmp0 - tmp3;
  int64_t tmp11 = tmp1 + tmp2;
  int64_t tmp12 = tmp1 - tmp2;

  // Odd part.
  int64_t o0 = in[7];
  int64_t o1 = in[5];
  int64_t o2 = in[3];
  int64_t o3 = in[1];

  int64_t oz1 = o0 + o3;
  int64_t oz2 = o1 + o2;
  int64_t oz3 = o0 + o2;
  int64_t oz4 = o1 + o3;
  int64_t oz5 = (oz3 + oz4) * kFix_1_175875602;

  o0 *= kFix_0_298631336;
  o1 *= kFix_2_053119869;
  o2 *= kFix_3_072711026;
  o3 *= kFix_1_501321110;
  oz1 *= -kFix_0_899976223;
  oz2 *= -kFix_2_562915447;
  oz3 *= -kFix_1_961570560;
  oz4 *= -kFix_0_390180644;

  oz3 += oz5;
  oz4 += oz5;

  o0 += oz1 + oz3;
  o1 += oz2 + oz4;
  o2 += oz2 + oz3;
  o3 += oz1 + oz4;

  out[0] = tmp10 + o3;
  out[7] = tmp10 - o3;
  out[1] = tmp11 + o2;
  out[6] = tmp11 - o2;
  out[2] = tmp12 + o1;
  out[5] = tmp12 - o1;
  out[3] = tmp13 + o0;
  out[4] = tmp13 - o0;
}

template <bool kShortcuts>
void InverseDCTBlockIntegerImpl(const coeff_t* coeffs, const uint16_t* quant,
                                uint8_t* out, size_t stride) {
  if (kShortcuts) {
    bool ac_zero = true;
    for (size_t i = 1; i < kDCTBlockSize; ++i) {
      if (coeffs[i] != 0) {
        ac_zero = false;
        break;
      }
    }
    if (ac_zero) {
      const uint8_t v = ClampSample(
          Descale(static_cast<int64_t>(coeffs[0]) * quant[0], 3) + 128);
      for (size_t y = 0; y < kBlockDim; ++y) {
        for (size_t x = 0; x < kBlockDim; ++x) out[y * stride + x] = v;
      }
      return;
    }
  }

  // Pass 1: rows, the results keep kPass1Bits extra bits of precision.
  int64_t workspace[kDCTBlockSize];
  int64_t in[kBlockDim];
  int64_t res[kBlockDim];
  for (size_t y = 0; y < kBlockDim; ++y) {
    const coeff_t* row = &coeffs[y * kBlockDim];
    const uint16_t* qrow = &quant[y * kBlockDim];
    int64_t* ws = &workspace[y * kBlockDim];
    if (kShortcuts && (row[1] | row[2] | row[3] | row[4] | row[5] | row[6] |
                       row[7]) == 0) {
      const int64_t dcval =
          static_cast<int64_t>(row[0]) * qrow[0] * (1 << kPass1Bits);
      for (size_t x = 0; x < kBlockDim; ++x) ws[x] = dcval;
      continue;
    }
    for (size_t x = 0; x < kBlockDim; ++x) {
      in[x] = static_cast<int64_t>(row[x]) * qrow[x];
    }
    Transform1D(in, res);
    for (size_t x = 0; x < kBlockDim; ++x) {
      ws[x] = Descale(res[x], kConstBits - kPass1Bits);
    }
  }

  // Pass 2: columns, descaled by the row and column scaling and by 8.
  for (size_t x = 0; x < kBlockDim; ++x) {
    const int64_t* col = &workspace[x];
    if (kShortcuts && (col[8] | col[16] | col[24] | col[32] | col[40] |
                       col[48] | col[56]) == 0) {
      const uint8_t v = ClampSample(Descale(col[0], kPass1Bits + 3) + 128);
      for (size_t y = 0; y < kBlockDim; ++y) out[y * stride + x] = v;
      continue;
    }
    for (size_t y = 0; y < kBlockDim; ++y) in[y] = col[y * kBlockDim];
    Transform1D(in, res);
    for (size_t y = 0; y < kBlockDim; ++y) {
      out[y * stride + x] =
          ClampSample(Descale(res[y], kConstBits + kPass1Bits + 3) + 128);
    }
  }
}

struct FloatIDCTTables {
  FloatIDCTTables() {
    for (int p = 0; p < 8; ++p) {
      for (int q = 0; q < 8; ++q) {
        cos_table[p * 8 + q] =
            static_cast<float>(cos((2 * p + 1) * q * M_PI / 16.0));
      }
    }
  }
  // cos((2p + 1) q pi / 16) at index p * 8 + q.
  float cos_table[64];
};

const FloatIDCTTables& GetFloatIDCTTables() {
  static const FloatIDCTTables* tables = new FloatIDCTTables();
  return *tables;
}

constexpr float kCu[8] = {0.70710678f, 1.0f, 1.0f, 1.0f,
                          1.0f,        1.0f, 1.0f, 1.0f};

JPEGKIT_INLINE uint8_t RoundFloatSample(float v) {
  return ClampSample(static_cast<int>(v + 128.5f));
}

}  // namespace

void InverseDCTBlockInteger(const coeff_t* coeffs, const uint16_t* quant,
                            uint8_t* out, size_t stride) {
  InverseDCTBlockIntegerImpl<true>(coeffs, quant, out, stride);
}

void InverseDCTBlockIntegerFull(const coeff_t* coeffs, const uint16_t* quant,
                                uint8_t* out, size_t stride) {
  InverseDCTBlockIntegerImpl<false>(coeffs, quant, out, stride);
}

void InverseDCTBlockFloat(const coeff_t* coeffs, const uint16_t* quant,
                          uint8_t* out, size_t stride) {
  bool ac_zero = true;
  for (size_t i = 1; i < kDCTBlockSize; ++i) {
    if (coeffs[i] != 0) {
      ac_zero = false;
      break;
    }
  }
  if (ac_zero) {
    const float dc = static_cast<float>(coeffs[0]) * quant[0];
    const uint8_t v = RoundFloatSample(dc * 0.125f);
    for (size_t y = 0; y < kBlockDim; ++y) {
      for (size_t x = 0; x < kBlockDim; ++x) out[y * stride + x] = v;
    }
    return;
  }
  const float* cos_table = GetFloatIDCTTables().cos_table;
  // tmp[y * 8 + u]: vertical transform of horizontal frequency u at row y.
  float tmp[kDCTBlockSize];
  for (size_t y = 0; y < kBlockDim; ++y) {
    for (size_t u = 0; u < kBlockDim; ++u) {
      float sum = 0;
      for (size_t v = 0; v < kBlockDim; ++v) {
        const size_t idx = v * kBlockDim + u;
        const float deq = static_cast<float>(coeffs[idx]) * quant[idx];
        sum += kCu[v] * deq * cos_table[y * 8 + v];
      }
      tmp[y * kBlockDim + u] = sum;
    }
  }
  for (size_t y = 0; y < kBlockDim; ++y) {
    for (size_t x = 0; x < kBlockDim; ++x) {
      float sum = 0;
      for (size_t u = 0; u < kBlockDim; ++u) {
        sum += kCu[u] * tmp[y * kBlockDim + u] * cos_table[x * 8 + u];
      }
      out[y * stride + x] = RoundFloatSample(sum * 0.25f);
    }
  }
}

}  // namespace jpegkit
