// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_BASE_COMPILER_SPECIFIC_H_
#define LIB_JPEGKIT_BASE_COMPILER_SPECIFIC_H_

// Macros for compiler version + nonstandard keywords, e.g. __builtin_expect.

#ifdef _MSC_VER
#define JPEGKIT_COMPILER_MSVC _MSC_VER
#else
#define JPEGKIT_COMPILER_MSVC 0
#endif

#if JPEGKIT_COMPILER_MSVC
#define JPEGKIT_RESTRICT __restrict
#define JPEGKIT_INLINE __forceinline
#define JPEGKIT_NOINLINE __declspec(noinline)
#define JPEGKIT_NORETURN __declspec(noreturn)
#define JPEGKIT_LIKELY(expr) (expr)
#define JPEGKIT_UNLIKELY(expr) (expr)
#define JPEGKIT_MUST_USE_RESULT
#define JPEGKIT_FORMAT(idx_fmt, idx_arg)
#else
#define JPEGKIT_RESTRICT __restrict__
#define JPEGKIT_INLINE inline __attribute__((always_inline))
#define JPEGKIT_NOINLINE __attribute__((noinline))
#define JPEGKIT_NORETURN __attribute__((noreturn))
#define JPEGKIT_LIKELY(expr) __builtin_expect(!!(expr), 1)
#define JPEGKIT_UNLIKELY(expr) __builtin_expect(!!(expr), 0)
#define JPEGKIT_MUST_USE_RESULT __attribute__((warn_unused_result))
#define JPEGKIT_FORMAT(idx_fmt, idx_arg) \
  __attribute__((format(printf, idx_fmt, idx_arg)))
#endif

#endif  // LIB_JPEGKIT_BASE_COMPILER_SPECIFIC_H_
