// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/jpegkit/error.h"

#include <stdarg.h>
#include <stdio.h>

namespace jpegkit {

const char* JpegErrorKindName(JpegErrorKind kind) {
  switch (kind) {
    case JpegErrorKind::kNone:
      return "None";
    case JpegErrorKind::kHeaderError:
      return "HeaderError";
    case JpegErrorKind::kScanError:
      return "ScanError";
    case JpegErrorKind::kStreamTruncation:
      return "StreamTruncation";
    case JpegErrorKind::kCancelled:
      return "Cancelled";
    case JpegErrorKind::kEncodeError:
      return "EncodeError";
  }
  return "Unknown";
}

bool JpegError::Set(JpegErrorKind error_kind, const char* file, int line,
                    const char* format, ...) {
  if (kind != JpegErrorKind::kNone) return false;
  char buf[1024];
  va_list args;
  va_start(args, format);
  vsnprintf(buf, sizeof(buf), format, args);
  va_end(args);
  kind = error_kind;
  message = buf;
  JPEGKIT_DEBUG(JPEGKIT_DEBUG_ON_ERROR, "%s:%d: %s: %s", file, line,
                JpegErrorKindName(kind), buf);
  return false;
}

std::string JpegError::ToString() const {
  char buf[160];
  snprintf(buf, sizeof(buf),
           " (byte_offset=%lld, bit_count=%d, pending_marker=%d)",
           static_cast<long long>(byte_offset), bit_count, pending_marker);
  return std::string(JpegErrorKindName(kind)) + ": " + message + buf;
}

}  // namespace jpegkit
