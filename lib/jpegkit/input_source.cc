// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/jpegkit/input_source.h"

#include <string.h>

#include <algorithm>
#include <utility>

#include "lib/jpegkit/base/status.h"

namespace jpegkit {

size_t MemorySource::Read(uint8_t* data, size_t len) {
  const size_t n = std::min(len, size_ - pos_);
  memcpy(data, data_ + pos_, n);
  pos_ += n;
  return n;
}

bool MemorySource::Seek(int64_t offset) {
  if (offset < 0 || static_cast<uint64_t>(offset) > size_) return false;
  pos_ = offset;
  return true;
}

StreamSource::StreamSource(std::istream* in, size_t buffer_size,
                           std::function<bool()> cancel)
    : in_(in),
      cancel_(std::move(cancel)),
      buffer_(std::max<size_t>(buffer_size, 1)),
      buffer_offset_(0),
      next_(0),
      end_(0),
      seekable_(false),
      cancelled_(false) {
  const std::istream::pos_type start = in_->tellg();
  if (start != std::istream::pos_type(-1)) {
    buffer_offset_ = static_cast<int64_t>(start);
    seekable_ = true;
  } else {
    in_->clear();
  }
}

bool StreamSource::Refill() {
  if (cancelled_) return false;
  if (cancel_ && cancel_()) {
    JPEGKIT_DEBUG_V(1, "Input cancelled at offset %lld",
                    static_cast<long long>(position()));
    cancelled_ = true;
    return false;
  }
  buffer_offset_ += end_;
  next_ = 0;
  end_ = 0;
  if (!in_->good()) return false;
  in_->read(reinterpret_cast<char*>(buffer_.data()), buffer_.size());
  end_ = static_cast<size_t>(in_->gcount());
  return end_ > 0;
}

size_t StreamSource::Read(uint8_t* data, size_t len) {
  size_t copied = 0;
  while (copied < len) {
    if (next_ == end_ && !Refill()) break;
    const size_t n = std::min(len - copied, end_ - next_);
    memcpy(data + copied, buffer_.data() + next_, n);
    next_ += n;
    copied += n;
  }
  return copied;
}

bool StreamSource::Seek(int64_t offset) {
  if (!seekable_ || cancelled_ || offset < 0) return false;
  if (offset >= buffer_offset_ &&
      offset <= buffer_offset_ + static_cast<int64_t>(end_)) {
    next_ = offset - buffer_offset_;
    return true;
  }
  in_->clear();
  in_->seekg(offset);
  if (!in_->good()) return false;
  buffer_offset_ = offset;
  next_ = 0;
  end_ = 0;
  return true;
}

}  // namespace jpegkit
