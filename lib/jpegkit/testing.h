// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_TESTING_H_
#define LIB_JPEGKIT_TESTING_H_

// GoogleTest glue shared by the tests.

#include "gtest/gtest.h"

// googletest before 1.10 only has the INSTANTIATE_TEST_CASE_P spelling.
#ifdef INSTANTIATE_TEST_SUITE_P
#define JPEGKIT_INSTANTIATE_TEST_SUITE_P INSTANTIATE_TEST_SUITE_P
#else
#define JPEGKIT_INSTANTIATE_TEST_SUITE_P INSTANTIATE_TEST_CASE_P
#endif

#endif  // LIB_JPEGKIT_TESTING_H_
