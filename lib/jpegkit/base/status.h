// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_BASE_STATUS_H_
#define LIB_JPEGKIT_BASE_STATUS_H_

// Error handling: Status return type + helper macros.

#include <stdio.h>
#include <stdlib.h>

#include "lib/jpegkit/base/compiler_specific.h"

namespace jpegkit {

// Uncomment to abort when JPEGKIT_FAILURE is reached
// #define JPEGKIT_CRASH_ON_ERROR

#ifndef JPEGKIT_ENABLE_ASSERT
#define JPEGKIT_ENABLE_ASSERT 1
#endif

// Pass -DJPEGKIT_DEBUG_ON_ERROR at compile time to print debug messages when
// a function returns JPEGKIT_FAILURE or records a codec error. Note that this
// is irrelevant if you also pass -DJPEGKIT_CRASH_ON_ERROR.
#ifdef JPEGKIT_DEBUG_ON_ERROR
#undef JPEGKIT_DEBUG_ON_ERROR
#define JPEGKIT_DEBUG_ON_ERROR 1
#else  // JPEGKIT_DEBUG_ON_ERROR
#ifdef NDEBUG
#define JPEGKIT_DEBUG_ON_ERROR 0
#else  // NDEBUG
#define JPEGKIT_DEBUG_ON_ERROR 1
#endif  // NDEBUG
#endif  // JPEGKIT_DEBUG_ON_ERROR

// The Verbose level for the library
#ifndef JPEGKIT_DEBUG_V_LEVEL
#define JPEGKIT_DEBUG_V_LEVEL 0
#endif  // JPEGKIT_DEBUG_V_LEVEL

// Print a debug message on standard error. You should use the JPEGKIT_DEBUG
// macro instead of calling Debug directly. This function returns false, so it
// can be used as a return value in JPEGKIT_FAILURE.
JPEGKIT_FORMAT(1, 2)
bool Debug(const char* format, ...);

// Print a debug message on standard error if "enabled" is true. "enabled" is
// normally a macro that evaluates to 0 or 1 at compile time, so the Debug
// function is never called and optimized out in release builds. Note that the
// arguments are compiled but not evaluated when enabled is false. The format
// string must be a explicit string in the call, for example:
//   JPEGKIT_DEBUG(JPEGKIT_DEBUG_MYMODULE, "my module message: %d", some_var);
// Add a header at the top of your module's .cc or .h file (depending on
// whether you have JPEGKIT_DEBUG calls from the .h as well) like this:
//   #ifndef JPEGKIT_DEBUG_MYMODULE
//   #define JPEGKIT_DEBUG_MYMODULE 0
//   #endif JPEGKIT_DEBUG_MYMODULE
#define JPEGKIT_DEBUG(enabled, format, ...)                         \
  do {                                                              \
    if (enabled) {                                                  \
      ::jpegkit::Debug(("%s:%d: " format "\n"), __FILE__, __LINE__, \
                       ##__VA_ARGS__);                              \
    }                                                               \
  } while (0)

// JPEGKIT_DEBUG version that prints the debug message if the global verbose
// level defined at compile time by JPEGKIT_DEBUG_V_LEVEL is greater or equal
// than the passed level.
#define JPEGKIT_DEBUG_V(level, ...) \
  JPEGKIT_DEBUG(level <= JPEGKIT_DEBUG_V_LEVEL, __VA_ARGS__)

// Warnings (via JPEGKIT_WARNING) are enabled by default in debug builds (opt
// and debug).
#ifdef JPEGKIT_DEBUG_WARNING
#undef JPEGKIT_DEBUG_WARNING
#define JPEGKIT_DEBUG_WARNING 1
#else  // JPEGKIT_DEBUG_WARNING
#ifdef NDEBUG
#define JPEGKIT_DEBUG_WARNING 0
#else  // NDEBUG
#define JPEGKIT_DEBUG_WARNING 1
#endif  // NDEBUG
#endif  // JPEGKIT_DEBUG_WARNING
#define JPEGKIT_WARNING(...) JPEGKIT_DEBUG(JPEGKIT_DEBUG_WARNING, __VA_ARGS__)

// Exits the program after printing file/line plus a formatted string.
JPEGKIT_FORMAT(3, 4)
JPEGKIT_NORETURN bool Abort(const char* file, int line, const char* format,
                            ...);

// Exits the program after printing file/line plus a formatted string.
#define JPEGKIT_ABORT(...) ::jpegkit::Abort(__FILE__, __LINE__, __VA_ARGS__)

// Does not guarantee running the code, use only for debug mode checks.
#if JPEGKIT_ENABLE_ASSERT
#define JPEGKIT_ASSERT(condition)                                    \
  do {                                                               \
    if (!(condition)) {                                              \
      ::jpegkit::Abort(__FILE__, __LINE__, "Assert %s", #condition); \
    }                                                                \
  } while (0)
#else
#define JPEGKIT_ASSERT(condition) \
  do {                            \
  } while (0)
#endif

// Same as above, but only runs in debug builds (builds where NDEBUG is not
// defined). This is useful for slower asserts that we want to run more rarely
// than usual. These will run on asan, msan and other debug builds, but not in
// opt or release.
#if !defined(NDEBUG) || defined(ADDRESS_SANITIZER) || \
    defined(MEMORY_SANITIZER) || defined(THREAD_SANITIZER)
#define JPEGKIT_DASSERT(condition)                                         \
  do {                                                                     \
    if (!(condition)) {                                                    \
      ::jpegkit::Abort(__FILE__, __LINE__, "Debug Assert %s", #condition); \
    }                                                                      \
  } while (0)
#else
#define JPEGKIT_DASSERT(condition) \
  do {                             \
  } while (0)
#endif

// Always runs the condition, so can be used for non-debug calls.
#define JPEGKIT_CHECK(condition)                                    \
  do {                                                              \
    if (!(condition)) {                                             \
      ::jpegkit::Abort(__FILE__, __LINE__, "Check %s", #condition); \
    }                                                               \
  } while (0)

// Always runs the condition, so can be used for non-debug calls.
#define JPEGKIT_RETURN_IF_ERROR(condition) \
  do {                                     \
    if (!(condition)) return false;        \
  } while (0)

// Annotation for the location where an error condition is first noticed.
// Error codes are too unspecific to pinpoint the exact location, so we
// add a build flag that crashes and dumps stack at the actual error source.
#ifdef JPEGKIT_CRASH_ON_ERROR
#define JPEGKIT_NOTIFY_ERROR(...) \
  (void)::jpegkit::Abort(__FILE__, __LINE__, __VA_ARGS__)
#define JPEGKIT_FAILURE(...) ::jpegkit::Abort(__FILE__, __LINE__, __VA_ARGS__)
#else  // JPEGKIT_CRASH_ON_ERROR
#define JPEGKIT_NOTIFY_ERROR(...) \
  JPEGKIT_DEBUG(JPEGKIT_DEBUG_ON_ERROR, __VA_ARGS__)
#define JPEGKIT_FAILURE(format, ...)                                 \
  ((JPEGKIT_DEBUG_ON_ERROR) &&                                       \
   ::jpegkit::Debug(("%s:%d: " format "\n"), __FILE__, __LINE__,     \
                    ##__VA_ARGS__) &&                                \
   false)
#endif  // JPEGKIT_CRASH_ON_ERROR

// Drop-in replacement for bool that raises compiler warnings if not used
// after being returned from a function. Example:
// Status LoadFile(...) { return true; } is more compact than
// bool JPEGKIT_MUST_USE_RESULT LoadFile(...) { return true; }
class JPEGKIT_MUST_USE_RESULT Status {
 public:
  // We want implicit constructor from bool to allow returning "true" or
  // "false" on a function when using Status.
  Status(bool ok) : ok_(ok) {}  // NOLINT(google-explicit-constructor)

  // We also want implicit cast to bool to check for return values of
  // functions.
  operator bool() const { return ok_; }  // NOLINT(google-explicit-constructor)

 private:
  bool ok_;
};

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_BASE_STATUS_H_
