// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_EXTRAS_PNM_H_
#define LIB_EXTRAS_PNM_H_

// Binary PGM (P5) and PPM (P6) reading and writing.

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "lib/jpegkit/base/status.h"
#include "lib/jpegkit/packed_image.h"

namespace jpegkit {
namespace extras {

// Decodes an 8-bit P5 or P6 image. Samples with a maxval below 255 are
// rescaled to the full 8-bit range.
Status DecodeImagePNM(const uint8_t* data, size_t size, PackedImage* image);

// Writes gray images as P5 and color images as P6, the alpha channel of RGBA
// images is dropped.
Status EncodeImagePNM(const PackedImage& image, std::vector<uint8_t>* bytes);

}  // namespace extras
}  // namespace jpegkit

#endif  // LIB_EXTRAS_PNM_H_
