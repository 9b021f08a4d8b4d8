// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_PACKED_IMAGE_H_
#define LIB_JPEGKIT_PACKED_IMAGE_H_

// Interleaved 8-bit image shared by the codec, the image operations and the
// file format helpers.

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "lib/jpegkit/base/status.h"
#include "lib/jpegkit/metadata.h"

namespace jpegkit {

class PackedImage {
 public:
  PackedImage() : xsize(0), ysize(0), num_channels(0) {}
  PackedImage(size_t xsize, size_t ysize, size_t num_channels);

  // Reallocates the pixel buffer, the contents are zeroed.
  Status Resize(size_t new_xsize, size_t new_ysize, size_t new_num_channels);

  bool empty() const { return pixels.empty(); }

  // The number of bytes per row.
  size_t stride() const { return xsize * num_channels; }

  uint8_t* row(size_t y) { return pixels.data() + y * stride(); }
  const uint8_t* row(size_t y) const { return pixels.data() + y * stride(); }

  uint8_t* pixel(size_t y, size_t x) {
    return row(y) + x * num_channels;
  }
  const uint8_t* pixel(size_t y, size_t x) const {
    return row(y) + x * num_channels;
  }

  size_t xsize;
  size_t ysize;
  // 1 (gray), 3 (RGB) or 4 (RGBA, or CMYK/YCCK for native decodes).
  size_t num_channels;
  std::vector<uint8_t> pixels;
  ImageMetadata metadata;
};

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_PACKED_IMAGE_H_
