// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "tools/file_io.h"

#include <errno.h>
#include <stdio.h>
#include <string.h>

#include "lib/jpegkit/base/status.h"

namespace jpegkit {
namespace tools {
namespace {

// RAII, ensures files are closed even when returning early.
class FileWrapper {
 public:
  FileWrapper(const FileWrapper& other) = delete;
  FileWrapper& operator=(const FileWrapper& other) = delete;

  explicit FileWrapper(const char* pathname, const char* mode)
      : file_(strcmp(pathname, "-") == 0 ? nullptr : fopen(pathname, mode)),
        close_fn_(fclose) {
    if (strcmp(pathname, "-") == 0) {
      file_ = strchr(mode, 'w') ? stdout : stdin;
      close_fn_ = nullptr;
    }
  }

  ~FileWrapper() {
    if (file_ != nullptr && close_fn_ != nullptr) {
      const int err = close_fn_(file_);
      if (err) {
        JPEGKIT_WARNING("Could not close file: %s", strerror(errno));
      }
    }
  }

  // We intend to use FileWrapper as a replacement of FILE.
  // NOLINTNEXTLINE(google-explicit-constructor)
  operator FILE*() const { return file_; }

 private:
  FILE* file_;
  int (*close_fn_)(FILE*);
};

}  // namespace

bool ReadFile(const char* filename, std::vector<uint8_t>* out) {
  FileWrapper f(filename, "rb");
  if (!f) {
    fprintf(stderr, "Failed to open %s for reading: %s\n", filename,
            strerror(errno));
    return false;
  }
  out->clear();
  uint8_t buf[65536];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), f)) > 0) {
    out->insert(out->end(), buf, buf + n);
  }
  if (ferror(f)) {
    fprintf(stderr, "Failed to read %s\n", filename);
    return false;
  }
  return true;
}

bool WriteFile(const char* filename, const std::vector<uint8_t>& bytes) {
  FileWrapper f(filename, "wb");
  if (!f) {
    fprintf(stderr, "Failed to open %s for writing: %s\n", filename,
            strerror(errno));
    return false;
  }
  if (fwrite(bytes.data(), 1, bytes.size(), f) != bytes.size()) {
    fprintf(stderr, "Failed to write %s\n", filename);
    return false;
  }
  if (fflush(f) != 0) {
    fprintf(stderr, "Failed to flush %s\n", filename);
    return false;
  }
  return true;
}

}  // namespace tools
}  // namespace jpegkit
