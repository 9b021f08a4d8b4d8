// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_DECODE_SCAN_H_
#define LIB_JPEGKIT_DECODE_SCAN_H_

#include "lib/jpegkit/base/status.h"
#include "lib/jpegkit/decode_internal.h"

namespace jpegkit {

// Decodes the entropy coded data of the scan whose header was parsed last
// into the coefficient buffers of its components. On return the marker that
// ended the scan is in next_marker_, or input_exhausted_ is set if the input
// ended without one.
//
// An undecodable block right before a marker abandons the rest of the scan
// with a warning. Other decoding failures are fatal.
Status DecodeScan(DecoderState* m);

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_DECODE_SCAN_H_
