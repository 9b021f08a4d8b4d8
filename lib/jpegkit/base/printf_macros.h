// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_BASE_PRINTF_MACROS_H_
#define LIB_JPEGKIT_BASE_PRINTF_MACROS_H_

// Format specifiers and macros helpful for printf.

#include <inttypes.h>

// Use this for code that prints size_t values.
#ifdef _MSC_VER
#define PRIuS "Iu"
#else
#define PRIuS "zu"
#endif

#endif  // LIB_JPEGKIT_BASE_PRINTF_MACROS_H_
