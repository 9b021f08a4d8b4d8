// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_TYPES_H_
#define LIB_JPEGKIT_TYPES_H_

// Public enums and parameter structs of the codec.

#include <stddef.h>
#include <stdint.h>

#include <vector>

namespace jpegkit {

// Color space of the coded components, derived from the component count and
// the Adobe APP14 transform flag.
enum class JpegColorSpace {
  kUnknown,
  kGray,
  kRGB,
  kYCbCr,
  kCMYK,
  kYCCK,
};

const char* JpegColorSpaceName(JpegColorSpace cs);

enum class OutputMode {
  // 3 bytes per pixel.
  kRGB,
  // 4 bytes per pixel, alpha is always 255.
  kRGBA,
  // Gray stays gray, 4-component images keep their coded channels.
  kNative,
};

enum class DctMethod {
  kInteger,
  kFloat,
};

struct DecodeParams {
  OutputMode output = OutputMode::kRGB;
  DctMethod idct = DctMethod::kInteger;
  // When false, every Huffman symbol is decoded through the canonical
  // bit-by-bit path instead of the direct lookup table.
  bool use_fast_huffman = true;
  // Read chunk size of stream inputs.
  size_t stream_buffer_size = 1 << 16;
};

// One entry of a progressive scan script. Component indexes refer to the
// frame component order.
struct ScanInfo {
  int num_components = 0;
  int component_index[4] = {0, 0, 0, 0};
  int Ss = 0;
  int Se = 63;
  int Ah = 0;
  int Al = 0;
};

struct EncodeParams {
  // JPEG quality in [1, 100].
  int quality = 75;
  // 4:2:0 chroma subsampling when true, 4:4:4 otherwise.
  bool chroma_subsampling = true;
  DctMethod fdct = DctMethod::kInteger;
  bool progressive = false;
  // Explicit progressive scan script, the default progression is used when
  // empty.
  std::vector<ScanInfo> scan_script;
  // Restart interval in MCUs, 0 disables restart markers.
  int restart_interval = 0;
  // Emit the EXIF and ICC blobs of the input image.
  bool write_metadata = false;
  // The pixels were already rotated, so the emitted EXIF orientation is 1.
  bool orientation_applied = false;
};

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_TYPES_H_
