// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_ERROR_H_
#define LIB_JPEGKIT_ERROR_H_

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "lib/jpegkit/base/compiler_specific.h"
#include "lib/jpegkit/base/status.h"

namespace jpegkit {

enum class JpegErrorKind {
  kNone,
  // Invalid or unsupported stream structure outside of entropy-coded data.
  kHeaderError,
  // Undecodable entropy-coded data before any marker was reached.
  kScanError,
  // The input ended in the middle of entropy-coded data.
  kStreamTruncation,
  // The caller's cancellation callback asked to stop.
  kCancelled,
  // Invalid encoder input or a segment that does not fit the format.
  kEncodeError,
};

const char* JpegErrorKindName(JpegErrorKind kind);

// Describes the first fatal error of a decode or encode call, together with
// the bit reader position where it happened.
struct JpegError {
  JpegErrorKind kind = JpegErrorKind::kNone;
  std::string message;
  // Offset of the next unread input byte, -1 when not applicable.
  int64_t byte_offset = -1;
  // Number of buffered bits not yet consumed by the entropy decoder.
  int bit_count = 0;
  // Marker code the bit reader stopped at, -1 if none.
  int pending_marker = -1;

  bool ok() const { return kind == JpegErrorKind::kNone; }
  void Clear() { *this = JpegError(); }

  // Records the error (only the first one is kept) and logs it. Always
  // returns false so that it can be used as a return value.
  JPEGKIT_FORMAT(5, 6)
  bool Set(JpegErrorKind error_kind, const char* file, int line,
           const char* format, ...);

  // Attaches bit reader diagnostics to the recorded error.
  void SetReaderState(int64_t offset, int bits, int marker) {
    byte_offset = offset;
    bit_count = bits;
    pending_marker = marker;
  }

  std::string ToString() const;
};

#define JPEGKIT_ERROR(error, kind, format, ...) \
  ((error)->Set((kind), __FILE__, __LINE__, format, ##__VA_ARGS__))

#define JPEGKIT_HEADER_ERROR(error, format, ...)                          \
  JPEGKIT_ERROR(error, ::jpegkit::JpegErrorKind::kHeaderError, format, \
                ##__VA_ARGS__)

#define JPEGKIT_ENCODE_ERROR(error, format, ...)                          \
  JPEGKIT_ERROR(error, ::jpegkit::JpegErrorKind::kEncodeError, format, \
                ##__VA_ARGS__)

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_ERROR_H_
