// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef TOOLS_ARGS_H_
#define TOOLS_ARGS_H_

// Helpers for parsing command line arguments.

#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <string>
#include <vector>

#include "lib/jpegkit/base/status.h"
#include "lib/jpegkit/types.h"

namespace jpegkit {
namespace tools {

static inline bool ParseUnsigned(const char* arg, size_t* out) {
  char* end;
  *out = static_cast<size_t>(strtoull(arg, &end, 0));
  if (end[0] != '\0') {
    fprintf(stderr, "Unable to interpret as unsigned integer: %s.\n", arg);
    return JPEGKIT_FAILURE("Args");
  }
  return true;
}

static inline bool ParseSigned(const char* arg, int* out) {
  char* end;
  *out = static_cast<int>(strtol(arg, &end, 0));
  if (end[0] != '\0') {
    fprintf(stderr, "Unable to interpret as signed integer: %s.\n", arg);
    return JPEGKIT_FAILURE("Args");
  }
  return true;
}

// Parses "WxH" into two positive dimensions.
static inline bool ParseDimensions(const char* arg, size_t* xsize,
                                   size_t* ysize) {
  char* end;
  *xsize = static_cast<size_t>(strtoull(arg, &end, 10));
  if (end == arg || (end[0] != 'x' && end[0] != 'X')) {
    fprintf(stderr, "Unable to interpret as WxH: %s.\n", arg);
    return JPEGKIT_FAILURE("Args");
  }
  const char* second = end + 1;
  *ysize = static_cast<size_t>(strtoull(second, &end, 10));
  if (end == second || end[0] != '\0' || *xsize == 0 || *ysize == 0) {
    fprintf(stderr, "Unable to interpret as WxH: %s.\n", arg);
    return JPEGKIT_FAILURE("Args");
  }
  return true;
}

// "int" or "float".
static inline bool ParseDctMethod(const char* arg, DctMethod* out) {
  const std::string s_arg(arg);
  if (s_arg == "int") {
    *out = DctMethod::kInteger;
    return true;
  }
  if (s_arg == "float") {
    *out = DctMethod::kFloat;
    return true;
  }
  fprintf(stderr, "Invalid DCT method %s, must be int or float\n", arg);
  return JPEGKIT_FAILURE("Args");
}

// "420" or "444", stored as the chroma_subsampling flag.
static inline bool ParseSubsampling(const char* arg, bool* out) {
  const std::string s_arg(arg);
  if (s_arg == "420") {
    *out = true;
    return true;
  }
  if (s_arg == "444") {
    *out = false;
    return true;
  }
  fprintf(stderr, "Invalid subsampling %s, must be 420 or 444\n", arg);
  return JPEGKIT_FAILURE("Args");
}

static inline bool ParseAndAppendString(const char* arg,
                                        std::vector<std::string>* out) {
  out->push_back(arg);
  return true;
}

static inline bool ParseCString(const char* arg, const char** out) {
  *out = arg;
  return true;
}

static inline bool SetBooleanTrue(bool* out) {
  *out = true;
  return true;
}

}  // namespace tools
}  // namespace jpegkit

#endif  // TOOLS_ARGS_H_
