// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_EXTRAS_IMAGE_OPS_H_
#define LIB_EXTRAS_IMAGE_OPS_H_

// Geometric and color operations on interleaved 8-bit images. All of them
// accept 1, 3 and 4 channel images, copy the metadata of the input, and
// allow out to point to the input image.

#include <stddef.h>

#include "lib/jpegkit/base/status.h"
#include "lib/jpegkit/packed_image.h"

namespace jpegkit {
namespace extras {

// Transforms the pixels so that they display upright for the given EXIF
// orientation (1..8), and sets the orientation of the output to 1.
// Orientations 5..8 swap the dimensions.
Status ApplyOrientation(const PackedImage& in, int orientation,
                        PackedImage* out);

// Converts to a single channel with the (77 R + 150 G + 29 B) >> 8 weights.
// Alpha is dropped.
Status Grayscale(const PackedImage& in, PackedImage* out);

// Nearest neighbour resampling.
Status Resize(const PackedImage& in, size_t xsize, size_t ysize,
              PackedImage* out);

// Bilinear resampling with the corner samples of the input and the output
// aligned.
Status ResizeBilinear(const PackedImage& in, size_t xsize, size_t ysize,
                      PackedImage* out);

// Bilinear resampling to the largest size that fits into max_xsize x
// max_ysize and keeps the aspect ratio, rounded to the nearest pixel and at
// least 1x1.
Status ResizeToFit(const PackedImage& in, size_t max_xsize, size_t max_ysize,
                   PackedImage* out);

}  // namespace extras
}  // namespace jpegkit

#endif  // LIB_EXTRAS_IMAGE_OPS_H_
