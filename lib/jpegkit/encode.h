// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_ENCODE_H_
#define LIB_JPEGKIT_ENCODE_H_

// Baseline and progressive JPEG encoder.

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "lib/jpegkit/base/status.h"
#include "lib/jpegkit/decode.h"
#include "lib/jpegkit/error.h"
#include "lib/jpegkit/packed_image.h"
#include "lib/jpegkit/types.h"

namespace jpegkit {

// Encodes a gray (1 channel), RGB (3 channels) or RGBA (4 channels, alpha is
// ignored) image. Color images are coded as YCbCr, with 4:2:0 chroma
// subsampling if params.chroma_subsampling is set. On failure *out is left
// unchanged and *error, if not null, describes the problem.
Status EncodeJpeg(const PackedImage& image, const EncodeParams& params,
                  std::vector<uint8_t>* out, JpegError* error = nullptr);

// Writes already quantized coefficients, for example the output of
// JpegDecoder::ReadCoefficients(), without touching their values. Only the
// scan structure, restart interval and metadata related fields of params are
// used.
Status EncodeJpegCoefficients(const JpegCoefficients& coefficients,
                              const EncodeParams& params,
                              std::vector<uint8_t>* out,
                              JpegError* error = nullptr);

// Successive approximation progression in the style of libjpeg's
// jpeg_simple_progression(): DC and two AC bands with the lowest bit held
// back, then the refinement scans. If interleave_dc is false every DC scan
// codes a single component.
std::vector<ScanInfo> DefaultScanScript(int num_components,
                                        bool interleave_dc = true);

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_ENCODE_H_
