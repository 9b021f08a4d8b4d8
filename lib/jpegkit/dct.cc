// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/jpegkit/dct.h"

#include <math.h>
#include <stdlib.h>

#include "lib/jpegkit/base/compiler_specific.h"

namespace jpegkit {
namespace {

constexpr int kConstBits = 13;
constexpr int kPass1Bits = 2;

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

JPEGKIT_INLINE int64_t Descale(int64_t x, int n) {
  return (x + (int64_t{1} << (n - 1))) >> n;
}

// One dimensional 8-point forward transform, the results are scaled by
// 2^kConstBits.
JPEGKIT_INLINE void Transform1D(const int64_t* in, int64_t* out) {
  const int64_t tmp0 = in[0] + in[7];
  int64_t tmp7 = in[0] - in[7];
  const int64_t tmp1 = in[1] + in[6];
  int64_t tmp6 = in[1] - in[6];
  const int64_t tmp2 = in[2] + in[5];
  int64_t tmp5 = in[2] - in[5];
  const int64_t tmp3 = in[3] + in[4];
  int64_t tmp4 = in[3] - in[4];

  // Even part.
  const int64_t tmp10 = tmp0 + tmp3;
  const int64_t tmp13 = tmp0 - tmp3;
  const int64_t tmp11 = tmp1 + tmp2;
  const int64_t tmp12 = tmp1 - tmp2;

  out[0] = (tmp10 + tmp11) * (int64_t{1} << kConstBits);
  out[4] = (tmp10 - tmp11) * (int64_t{1} << kConstBits);
  const int64_t z1 = (tmp12 + tmp13) * kFix_0_541196100;
  out[2] = z1 + tmp13 * kFix_0_765366865;
  out[6] = z1 - tmp12 * kFix_1_847759065;

  // Odd part.
  int64_t oz1 = tmp4 + tmp7;
  int64_t oz2 = tmp5 + tmp6;
  int64_t oz3 = tmp4 + tmp6;
  int64_t oz4 = tmp5 + tmp7;
  const int64_t oz5 = (oz3 + oz4) * kFix_1_175875602;

  tmp4 *= kFix_0_298631336;
  tmp5 *= kFix_2_053119869;
  tmp6 *= kFix_3_072711026;
  tmp7 *= kFix_1_501321110;
  oz1 *= -kFix_0_899976223;
  oz2 *= -kFix_2_562915447;
  oz3 *= -kFix_1_961570560;
  oz4 *= -kFix_0_390180644;

  oz3 += oz5;
  oz4 += oz5;

  out[7] = tmp4 + oz1 + oz3;
  out[5] = tmp5 + oz2 + oz4;
  out[3] = tmp6 + oz2 + oz3;
  out[1] = tmp7 + oz1 + oz4;
}

struct FloatDCTTables {
  FloatDCTTables() {
    for (int x = 0; x < 8; ++x) {
      for (int u = 0; u < 8; ++u) {
        const double cu = u == 0 ? sqrt(0.5) : 1.0;
        basis[u * 8 + x] = 0.5 * cu * cos((2 * x + 1) * u * M_PI / 16.0);
      }
    }
  }
  // Orthonormal 1D basis, basis[u * 8 + x].
  double basis[64];
};

const FloatDCTTables& GetFloatDCTTables() {
  static const FloatDCTTables* tables = new FloatDCTTables();
  return *tables;
}

}  // namespace

void ForwardDCTBlockInteger(const uint8_t* pixels, size_t stride,
                            int32_t* out) {
  int64_t workspace[kDCTBlockSize];
  int64_t in[kBlockDim];
  int64_t res[kBlockDim];
  // Pass 1: rows, the results keep kPass1Bits extra bits of precision.
  for (size_t y = 0; y < kBlockDim; ++y) {
    const uint8_t* row = pixels + y * stride;
    for (size_t x = 0; x < kBlockDim; ++x) {
      in[x] = static_cast<int64_t>(row[x]) - 128;
    }
    Transform1D(in, res);
    for (size_t x = 0; x < kBlockDim; ++x) {
      workspace[y * kBlockDim + x] = Descale(res[x], kConstBits - kPass1Bits);
    }
  }
  // Pass 2: columns, removes the extra precision again.
  for (size_t x = 0; x < kBlockDim; ++x) {
    for (size_t y = 0; y < kBlockDim; ++y) {
      in[y] = workspace[y * kBlockDim + x];
    }
    Transform1D(in, res);
    for (size_t y = 0; y < kBlockDim; ++y) {
      out[y * kBlockDim + x] =
          static_cast<int32_t>(Descale(res[y], kConstBits + kPass1Bits));
    }
  }
}

void ForwardDCTBlockFloat(const uint8_t* pixels, size_t stride, int32_t* out) {
  const double* basis = GetFloatDCTTables().basis;
  double tmp[kDCTBlockSize];
  for (size_t y = 0; y < kBlockDim; ++y) {
    const uint8_t* row = pixels + y * stride;
    for (size_t u = 0; u < kBlockDim; ++u) {
      double sum = 0;
      for (size_t x = 0; x < kBlockDim; ++x) {
        sum += basis[u * 8 + x] * (static_cast<int>(row[x]) - 128);
      }
      tmp[y * kBlockDim + u] = sum;
    }
  }
  for (size_t v = 0; v < kBlockDim; ++v) {
    for (size_t u = 0; u < kBlockDim; ++u) {
      double sum = 0;
      for (size_t y = 0; y < kBlockDim; ++y) {
        sum += basis[v * 8 + y] * tmp[y * kBlockDim + u];
      }
      out[v * kBlockDim + u] = static_cast<int32_t>(lround(sum * 8.0));
    }
  }
}

void ComputeQuantDivisors(const uint16_t* quant, QuantDivisors* divisors) {
  for (size_t k = 0; k < kDCTBlockSize; ++k) {
    const uint32_t divisor = static_cast<uint32_t>(quant[k]) * 8;
    divisors->reciprocal[k] =
        ((1u << kQuantReciprocalBits) + divisor - 1) / divisor;
    divisors->rounding[k] = divisor / 2;
  }
}

void QuantizeBlock(const int32_t* dct, const QuantDivisors& divisors,
                   coeff_t* block) {
  for (size_t k = 0; k < kDCTBlockSize; ++k) {
    const int32_t v = dct[k];
    const uint64_t magnitude = static_cast<uint64_t>(abs(v));
    const int32_t q = static_cast<int32_t>(
        ((magnitude + divisors.rounding[k]) * divisors.reciprocal[k]) >>
        kQuantReciprocalBits);
    block[k] = static_cast<coeff_t>(v < 0 ? -q : q);
  }
}

}  // namespace jpegkit
