// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_COMMON_INTERNAL_H_
#define LIB_JPEGKIT_COMMON_INTERNAL_H_

#include <stddef.h>
#include <stdint.h>

namespace jpegkit {

template <typename T1, typename T2>
constexpr inline T1 DivCeil(T1 a, T2 b) {
  return (a + b - 1) / b;
}

typedef int16_t coeff_t;

constexpr size_t kBlockDim = 8;
constexpr size_t kDCTBlockSize = 64;
constexpr int kJpegPrecision = 8;
constexpr int kMaxComponents = 4;
constexpr int kMaxQuantTables = 4;
constexpr int kMaxHuffmanTables = 4;
constexpr int kMaxSamplingFactor = 4;
constexpr size_t kJpegHuffmanMaxBitLength = 16;
constexpr int kJpegHuffmanAlphabetSize = 256;
constexpr int kJpegDCAlphabetSize = 12;
constexpr int kMaxDimPixels = 65535;
// Largest successive approximation bit position accepted in a SOS header.
constexpr int kMaxApproximationBit = 13;

// Marker codes, the byte following 0xFF.
constexpr uint8_t kMarkerSOF0 = 0xC0;
constexpr uint8_t kMarkerSOF1 = 0xC1;
constexpr uint8_t kMarkerSOF2 = 0xC2;
constexpr uint8_t kMarkerDHT = 0xC4;
constexpr uint8_t kMarkerRST0 = 0xD0;
constexpr uint8_t kMarkerRST7 = 0xD7;
constexpr uint8_t kMarkerSOI = 0xD8;
constexpr uint8_t kMarkerEOI = 0xD9;
constexpr uint8_t kMarkerSOS = 0xDA;
constexpr uint8_t kMarkerDQT = 0xDB;
constexpr uint8_t kMarkerDRI = 0xDD;
constexpr uint8_t kMarkerAPP0 = 0xE0;
constexpr uint8_t kMarkerAPP1 = 0xE1;
constexpr uint8_t kMarkerAPP2 = 0xE2;
constexpr uint8_t kMarkerAPP14 = 0xEE;
constexpr uint8_t kMarkerAPP15 = 0xEF;
constexpr uint8_t kMarkerCOM = 0xFE;

const uint8_t kIccProfileTag[12] = "ICC_PROFILE";
const uint8_t kExifTag[6] = {'E', 'x', 'i', 'f', 0, 0};
const uint8_t kJfifTag[5] = {'J', 'F', 'I', 'F', 0};
const uint8_t kAdobeTag[5] = {'A', 'd', 'o', 'b', 'e'};

// Payload bytes of one APP2 ICC chunk: 65535 - 2 (length) - 12 (tag) - 2
// (sequence number and chunk count).
constexpr size_t kMaxIccBytesInMarker = 65519;
// Payload bytes of one APP1 EXIF segment after the length field.
constexpr size_t kMaxExifBytesInMarker = 65533;

/* clang-format off */
constexpr uint32_t kJPEGNaturalOrder[80] = {
  0,   1,  8, 16,  9,  2,  3, 10,
  17, 24, 32, 25, 18, 11,  4,  5,
  12, 19, 26, 33, 40, 48, 41, 34,
  27, 20, 13,  6,  7, 14, 21, 28,
  35, 42, 49, 56, 57, 50, 43, 36,
  29, 22, 15, 23, 30, 37, 44, 51,
  58, 59, 52, 45, 38, 31, 39, 46,
  53, 60, 61, 54, 47, 55, 62, 63,
  // extra entries for safety in decoder
  63, 63, 63, 63, 63, 63, 63, 63,
  63, 63, 63, 63, 63, 63, 63, 63
};

constexpr uint32_t kJPEGZigZagOrder[64] = {
  0,   1,  5,  6, 14, 15, 27, 28,
  2,   4,  7, 13, 16, 26, 29, 42,
  3,   8, 12, 17, 25, 30, 41, 43,
  9,  11, 18, 24, 31, 40, 44, 53,
  10, 19, 23, 32, 39, 45, 52, 54,
  20, 22, 33, 38, 46, 51, 55, 60,
  21, 34, 37, 47, 50, 56, 59, 61,
  35, 36, 48, 49, 57, 58, 62, 63
};
/* clang-format on */

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_COMMON_INTERNAL_H_
