// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_INPUT_SOURCE_H_
#define LIB_JPEGKIT_INPUT_SOURCE_H_

// Byte sources feeding the marker parser and the entropy decoder.

#include <stddef.h>
#include <stdint.h>

#include <functional>
#include <istream>
#include <vector>

#include "lib/jpegkit/base/compiler_specific.h"

namespace jpegkit {

class InputSource {
 public:
  virtual ~InputSource() = default;

  // Returns the next byte, or -1 at the end of the input.
  virtual int ReadByte() = 0;

  // Copies up to len bytes and returns the number of bytes copied.
  virtual size_t Read(uint8_t* data, size_t len) = 0;

  // Repositions the input, returns false if the source is not seekable or
  // the offset is out of range.
  virtual bool Seek(int64_t offset) = 0;

  virtual bool seekable() const = 0;

  // Offset of the next unread byte.
  virtual int64_t position() const = 0;

  // True once a cancellation request stopped the input.
  virtual bool cancelled() const { return false; }
};

// The whole input is resident in memory.
class MemorySource final : public InputSource {
 public:
  MemorySource(const uint8_t* data, size_t size)
      : data_(data), size_(size), pos_(0) {}

  JPEGKIT_INLINE int ReadByte() override {
    return pos_ < size_ ? data_[pos_++] : -1;
  }
  size_t Read(uint8_t* data, size_t len) override;
  bool Seek(int64_t offset) override;
  bool seekable() const override { return true; }
  int64_t position() const override { return pos_; }

 private:
  const uint8_t* data_;
  size_t size_;
  size_t pos_;
};

// Reads a std::istream through a fixed size buffer. The optional cancel
// callback is polled before every refill; once it returns true the source
// behaves as if the input ended.
class StreamSource final : public InputSource {
 public:
  StreamSource(std::istream* in, size_t buffer_size,
               std::function<bool()> cancel);

  JPEGKIT_INLINE int ReadByte() override {
    if (JPEGKIT_UNLIKELY(next_ == end_) && !Refill()) return -1;
    return buffer_[next_++];
  }
  size_t Read(uint8_t* data, size_t len) override;
  bool Seek(int64_t offset) override;
  bool seekable() const override { return seekable_; }
  int64_t position() const override {
    return buffer_offset_ + static_cast<int64_t>(next_);
  }
  bool cancelled() const override { return cancelled_; }

 private:
  bool Refill();

  std::istream* in_;
  std::function<bool()> cancel_;
  std::vector<uint8_t> buffer_;
  // Stream offset of buffer_[0].
  int64_t buffer_offset_;
  size_t next_;
  size_t end_;
  bool seekable_;
  bool cancelled_;
};

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_INPUT_SOURCE_H_
