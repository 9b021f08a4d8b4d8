// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/extras/pnm.h"

#include <stdio.h>
#include <string.h>

#include <algorithm>

#include "lib/jpegkit/base/printf_macros.h"

namespace jpegkit {
namespace extras {
namespace {

constexpr size_t kMaxHeaderSize = 200;

class Parser {
 public:
  Parser(const uint8_t* data, size_t size) : pos_(data), end_(data + size) {}

  Status ParseHeader(size_t* xsize, size_t* ysize, size_t* num_channels,
                     uint32_t* max_val, const uint8_t** pixels) {
    if (end_ - pos_ < 2 || pos_[0] != 'P') {
      return JPEGKIT_FAILURE("Not a PNM file");
    }
    if (pos_[1] == '5') {
      *num_channels = 1;
    } else if (pos_[1] == '6') {
      *num_channels = 3;
    } else {
      return JPEGKIT_FAILURE("Unsupported PNM type P%c", pos_[1]);
    }
    pos_ += 2;
    JPEGKIT_RETURN_IF_ERROR(SkipWhitespace());
    JPEGKIT_RETURN_IF_ERROR(ParseUnsigned(xsize));
    JPEGKIT_RETURN_IF_ERROR(SkipWhitespace());
    JPEGKIT_RETURN_IF_ERROR(ParseUnsigned(ysize));
    JPEGKIT_RETURN_IF_ERROR(SkipWhitespace());
    size_t value;
    JPEGKIT_RETURN_IF_ERROR(ParseUnsigned(&value));
    if (value == 0 || value > 255) {
      return JPEGKIT_FAILURE("Unsupported PNM maxval %" PRIuS, value);
    }
    *max_val = value;
    // Exactly one whitespace character separates the header from the data.
    if (pos_ == end_ || !IsWhitespace(*pos_)) {
      return JPEGKIT_FAILURE("PNM header is not terminated");
    }
    ++pos_;
    *pixels = pos_;
    return true;
  }

  size_t remaining() const { return end_ - pos_; }

 private:
  static bool IsWhitespace(uint8_t c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
           c == '\v';
  }

  // Also skips '#' comments that run to the end of the line.
  Status SkipWhitespace() {
    if (pos_ == end_ || (!IsWhitespace(*pos_) && *pos_ != '#')) {
      return JPEGKIT_FAILURE("PNM header: expected whitespace");
    }
    while (pos_ < end_) {
      if (*pos_ == '#') {
        while (pos_ < end_ && *pos_ != '\n') ++pos_;
      } else if (IsWhitespace(*pos_)) {
        ++pos_;
      } else {
        break;
      }
    }
    return true;
  }

  Status ParseUnsigned(size_t* number) {
    if (pos_ == end_ || *pos_ < '0' || *pos_ > '9') {
      return JPEGKIT_FAILURE("PNM header: expected unsigned number");
    }
    *number = 0;
    while (pos_ < end_ && *pos_ >= '0' && *pos_ <= '9') {
      *number = *number * 10 + (*pos_ - '0');
      if (*number > (1u << 24)) {
        return JPEGKIT_FAILURE("PNM header: number too large");
      }
      ++pos_;
    }
    return true;
  }

  const uint8_t* pos_;
  const uint8_t* const end_;
};

}  // namespace

Status DecodeImagePNM(const uint8_t* data, size_t size, PackedImage* image) {
  Parser parser(data, size);
  size_t xsize;
  size_t ysize;
  size_t num_channels;
  uint32_t max_val;
  const uint8_t* pixels;
  JPEGKIT_RETURN_IF_ERROR(
      parser.ParseHeader(&xsize, &ysize, &num_channels, &max_val, &pixels));
  if (xsize == 0 || ysize == 0) {
    return JPEGKIT_FAILURE("Empty PNM image");
  }
  JPEGKIT_RETURN_IF_ERROR(image->Resize(xsize, ysize, num_channels));
  if (parser.remaining() < image->pixels.size()) {
    return JPEGKIT_FAILURE("PNM file is truncated: %" PRIuS " of %" PRIuS
                           " pixel bytes", parser.remaining(),
                           image->pixels.size());
  }
  memcpy(image->pixels.data(), pixels, image->pixels.size());
  if (max_val != 255) {
    for (uint8_t& v : image->pixels) {
      v = (std::min<uint32_t>(v, max_val) * 255 + max_val / 2) / max_val;
    }
  }
  image->metadata = ImageMetadata();
  return true;
}

Status EncodeImagePNM(const PackedImage& image, std::vector<uint8_t>* bytes) {
  if (image.empty()) return JPEGKIT_FAILURE("Empty image");
  if (!image.metadata.exif.empty() || !image.metadata.icc.empty()) {
    JPEGKIT_WARNING("PNM encoder ignoring metadata - use a different codec");
  }
  const bool is_gray = image.num_channels == 1;
  char header[kMaxHeaderSize];
  const int header_size =
      snprintf(header, kMaxHeaderSize, "P%c\n%" PRIuS " %" PRIuS "\n255\n",
               is_gray ? '5' : '6', image.xsize, image.ysize);
  JPEGKIT_RETURN_IF_ERROR(header_size > 0 &&
                          static_cast<size_t>(header_size) < kMaxHeaderSize);
  const size_t out_channels = is_gray ? 1 : 3;
  bytes->resize(header_size + image.xsize * image.ysize * out_channels);
  memcpy(bytes->data(), header, header_size);
  uint8_t* out = bytes->data() + header_size;
  if (image.num_channels == out_channels) {
    memcpy(out, image.pixels.data(), image.pixels.size());
    return true;
  }
  for (size_t y = 0; y < image.ysize; ++y) {
    for (size_t x = 0; x < image.xsize; ++x) {
      const uint8_t* px = image.pixel(y, x);
      *out++ = px[0];
      *out++ = px[1];
      *out++ = px[2];
    }
  }
  return true;
}

}  // namespace extras
}  // namespace jpegkit
