// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/jpegkit/base/status.h"

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>

namespace jpegkit {

bool Debug(const char* format, ...) {
// Show the debug messages in debug or opt mode, not in release mode.
#if JPEGKIT_DEBUG_WARNING || JPEGKIT_DEBUG_ON_ERROR
  va_list args;
  va_start(args, format);
  vfprintf(stderr, format, args);
  va_end(args);
#endif
  return false;
}

bool Abort(const char* file, int line, const char* format, ...) {
  char buf[2000];
  va_list args;
  va_start(args, format);
  vsnprintf(buf, sizeof(buf), format, args);
  va_end(args);

  fprintf(stderr, "Abort at %s:%d: %s\n", file, line, buf);
  abort();
}

}  // namespace jpegkit
