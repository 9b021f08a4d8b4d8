// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef TOOLS_FILE_IO_H_
#define TOOLS_FILE_IO_H_

#include <stdint.h>

#include <vector>

namespace jpegkit {
namespace tools {

// "-" reads from stdin.
bool ReadFile(const char* filename, std::vector<uint8_t>* out);

// "-" writes to stdout.
bool WriteFile(const char* filename, const std::vector<uint8_t>& bytes);

}  // namespace tools
}  // namespace jpegkit

#endif  // TOOLS_FILE_IO_H_
