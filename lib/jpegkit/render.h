// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_RENDER_H_
#define LIB_JPEGKIT_RENDER_H_

#include "lib/jpegkit/base/status.h"
#include "lib/jpegkit/decode_internal.h"
#include "lib/jpegkit/packed_image.h"

namespace jpegkit {

// Runs the inverse DCT over all coefficient buffers, upsamples the component
// planes to the image size and converts them to the requested output layout.
// Resolves the color space of 4-component images without an Adobe marker.
Status RenderImage(DecoderState* m, PackedImage* image);

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_RENDER_H_
