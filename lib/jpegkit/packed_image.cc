// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/jpegkit/packed_image.h"

#include "lib/jpegkit/base/printf_macros.h"

namespace jpegkit {

namespace {
// Upper bound on the number of bytes of one image buffer.
constexpr uint64_t kMaxImageBytes = 1ull << 32;
}  // namespace

PackedImage::PackedImage(size_t xsize, size_t ysize, size_t num_channels)
    : xsize(0), ysize(0), num_channels(0) {
  JPEGKIT_CHECK(Resize(xsize, ysize, num_channels));
}

Status PackedImage::Resize(size_t new_xsize, size_t new_ysize,
                           size_t new_num_channels) {
  if (new_num_channels != 1 && new_num_channels != 3 &&
      new_num_channels != 4) {
    return JPEGKIT_FAILURE("Invalid number of channels %" PRIuS,
                           new_num_channels);
  }
  const uint64_t num_bytes = static_cast<uint64_t>(new_xsize) * new_ysize *
                             new_num_channels;
  if (num_bytes > kMaxImageBytes) {
    return JPEGKIT_FAILURE("Image too large: %" PRIuS "x%" PRIuS, new_xsize,
                           new_ysize);
  }
  xsize = new_xsize;
  ysize = new_ysize;
  num_channels = new_num_channels;
  pixels.assign(num_bytes, 0);
  return true;
}

}  // namespace jpegkit
