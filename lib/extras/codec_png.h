// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_EXTRAS_CODEC_PNG_H_
#define LIB_EXTRAS_CODEC_PNG_H_

// PNG reading and writing through lodepng.

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "lib/jpegkit/base/status.h"
#include "lib/jpegkit/packed_image.h"

namespace jpegkit {
namespace extras {

// Decodes to 8 bits per sample: gray images without transparency to 1
// channel, other images without transparency to RGB and everything else to
// RGBA. An embedded ICC profile is stored in the image metadata.
Status DecodeImagePNG(const uint8_t* data, size_t size, PackedImage* image);

Status EncodeImagePNG(const PackedImage& image, std::vector<uint8_t>* bytes);

}  // namespace extras
}  // namespace jpegkit

#endif  // LIB_EXTRAS_CODEC_PNG_H_
