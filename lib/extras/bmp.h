// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_EXTRAS_BMP_H_
#define LIB_EXTRAS_BMP_H_

// Uncompressed Windows bitmap reading and writing.

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "lib/jpegkit/base/status.h"
#include "lib/jpegkit/packed_image.h"

namespace jpegkit {
namespace extras {

// Decodes 8-bit palette images and 24 or 32-bit BGR images, stored either
// bottom-up or top-down. Images whose palette is all gray decode to one
// channel, everything else to RGB. The fourth byte of 32-bit pixels is
// ignored.
Status DecodeImageBMP(const uint8_t* data, size_t size, PackedImage* image);

// Writes gray images as 8-bit with a gray palette and color images as 24-bit,
// the alpha channel of RGBA images is dropped.
Status EncodeImageBMP(const PackedImage& image, std::vector<uint8_t>* bytes);

}  // namespace extras
}  // namespace jpegkit

#endif  // LIB_EXTRAS_BMP_H_
