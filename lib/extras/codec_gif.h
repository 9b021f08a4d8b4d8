// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_EXTRAS_CODEC_GIF_H_
#define LIB_EXTRAS_CODEC_GIF_H_

// GIF reading through giflib.

#include <stddef.h>
#include <stdint.h>

#include "lib/jpegkit/base/status.h"
#include "lib/jpegkit/packed_image.h"

namespace jpegkit {
namespace extras {

// Decodes the first frame of a GIF, placed on the logical screen. The result
// is RGBA if the frame has a transparent color, RGB otherwise. Screen areas
// the frame does not cover are transparent or take the background color.
Status DecodeImageGIF(const uint8_t* data, size_t size, PackedImage* image);

}  // namespace extras
}  // namespace jpegkit

#endif  // LIB_EXTRAS_CODEC_GIF_H_
