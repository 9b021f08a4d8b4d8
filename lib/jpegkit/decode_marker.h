// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_DECODE_MARKER_H_
#define LIB_JPEGKIT_DECODE_MARKER_H_

#include "lib/jpegkit/base/status.h"
#include "lib/jpegkit/decode_internal.h"

namespace jpegkit {

// Checks the SOI marker at the start of the input.
Status ReadSOI(DecoderState* m);

// Returns the marker code that follows in the input, skipping any bytes
// between the previous segment and the next 0xFF. Returns -1 at the end of
// the input.
int ReadMarker(DecoderState* m);

// Reads the segment of the given marker (its marker code was already
// consumed) and updates the decoder state. For SOS only the scan header is
// parsed, the entropy coded data is left in the input and scan_pending_ is
// set.
Status ProcessMarker(DecoderState* m, int marker);

// Derives the color space from the component count, the component ids and
// the Adobe transform flag. 4-component images without an Adobe marker stay
// kUnknown until their samples are seen.
JpegColorSpace DetermineColorSpace(const DecoderState& m);

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_DECODE_MARKER_H_
