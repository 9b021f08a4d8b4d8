// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_EXTRAS_CODEC_WEBP_H_
#define LIB_EXTRAS_CODEC_WEBP_H_

// Still WebP reading and lossy writing through libwebp.

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "lib/jpegkit/base/status.h"
#include "lib/jpegkit/packed_image.h"

namespace jpegkit {
namespace extras {

// Decodes to RGBA if the bitstream has alpha, RGB otherwise.
Status DecodeImageWebP(const uint8_t* data, size_t size, PackedImage* image);

// Lossy encoding, quality is in [1, 100]. Gray images are written as RGB.
Status EncodeImageWebP(const PackedImage& image, int quality,
                       std::vector<uint8_t>* bytes);

}  // namespace extras
}  // namespace jpegkit

#endif  // LIB_EXTRAS_CODEC_WEBP_H_
