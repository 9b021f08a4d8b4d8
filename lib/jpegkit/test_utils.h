// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_TEST_UTILS_H_
#define LIB_JPEGKIT_TEST_UTILS_H_

/* clang-format off */
#include <stdio.h>
#include <jpeglib.h>
#include <setjmp.h>
/* clang-format on */

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "lib/jpegkit/packed_image.h"

namespace jpegkit {

// Image in the layout libjpeg reads and writes: interleaved 8-bit samples.
struct TestImage {
  size_t xsize = 0;
  size_t ysize = 0;
  J_COLOR_SPACE color_space = JCS_RGB;
  size_t components = 3;
  std::vector<uint8_t> pixels;
};

struct CompressParams {
  int quality = 90;
  bool progressive = false;
  // Sampling factors of the first component, the others are always 1x1.
  int h_sampling = 1;
  int v_sampling = 1;
  int restart_interval = 0;
  bool optimize_coding = false;
  // Coded color space, JCS_UNKNOWN keeps the libjpeg default for the input.
  J_COLOR_SPACE jpeg_color_space = JCS_UNKNOWN;
  // -1 keeps the libjpeg default.
  int override_JFIF = -1;
  int override_Adobe = -1;
  std::vector<uint8_t> exif;
  std::vector<uint8_t> icc;
};

// Fills img->pixels with a deterministic pattern of gradients and edges in
// the color space of the image. The size must already be set.
void GeneratePixels(TestImage* img);

// Minimal big endian TIFF structure with a single orientation entry.
std::vector<uint8_t> MakeExifWithOrientation(int orientation);

bool EncodeWithLibjpeg(const TestImage& input, const CompressParams& jparams,
                       std::vector<uint8_t>* compressed);

// Decodes with the accurate integer IDCT and without fancy upsampling into
// output->color_space.
bool DecodeWithLibjpeg(const std::vector<uint8_t>& compressed,
                       TestImage* output);

struct ComponentCoeffs {
  size_t width_in_blocks = 0;
  size_t height_in_blocks = 0;
  // Natural order, without the blocks that only pad the last MCU.
  std::vector<JCOEF> coeffs;
  std::vector<uint16_t> quant;
};

bool ReadCoefficientsWithLibjpeg(const std::vector<uint8_t>& compressed,
                                 std::vector<ComponentCoeffs>* components);

PackedImage ToPackedImage(const TestImage& img);

double DistanceRms(const uint8_t* a, const uint8_t* b, size_t len);
int MaxAbsDiff(const uint8_t* a, const uint8_t* b, size_t len);

// Returns a copy of the file with every marker segment of the given type
// that precedes the first scan removed.
std::vector<uint8_t> RemoveMarkerSegments(const std::vector<uint8_t>& jpg,
                                          int marker);

// Offset of the first segment with the given marker before the scan data,
// 0 if there is none.
size_t FindMarkerSegment(const std::vector<uint8_t>& jpg, int marker);

// Offset of the first byte after the first SOS segment, 0 if there is none.
size_t FirstScanDataOffset(const std::vector<uint8_t>& jpg);

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_TEST_UTILS_H_
