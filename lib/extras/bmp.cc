// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/extras/bmp.h"

#include <string.h>

#include "lib/jpegkit/base/printf_macros.h"

namespace jpegkit {
namespace extras {
namespace {

constexpr size_t kFileHeaderSize = 14;
constexpr size_t kInfoHeaderSize = 40;
constexpr uint32_t kCompressionRGB = 0;
constexpr uint32_t kCompressionBitfields = 3;
constexpr int32_t kMaxDimension = 1 << 24;
// 72 DPI.
constexpr uint32_t kPixelsPerMeter = 2835;

uint32_t LoadLE16(const uint8_t* p) { return p[0] | (p[1] << 8); }

uint32_t LoadLE32(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

void StoreLE16(uint32_t v, uint8_t* p) {
  p[0] = v & 0xFF;
  p[1] = (v >> 8) & 0xFF;
}

void StoreLE32(uint32_t v, uint8_t* p) {
  StoreLE16(v & 0xFFFF, p);
  StoreLE16(v >> 16, p + 2);
}

// Rows are padded to a multiple of 4 bytes.
size_t RowStride(size_t xsize, size_t bits_per_pixel) {
  return (xsize * bits_per_pixel + 31) / 32 * 4;
}

struct BMPHeader {
  size_t xsize;
  size_t ysize;
  bool bottom_up;
  uint32_t bits_per_pixel;
  size_t data_offset;
  // Offset and number of the BGRX palette entries.
  size_t palette_offset;
  size_t palette_size;
};

Status ParseHeader(const uint8_t* data, size_t size, BMPHeader* header) {
  if (size < kFileHeaderSize + kInfoHeaderSize || data[0] != 'B' ||
      data[1] != 'M') {
    return JPEGKIT_FAILURE("Not a BMP file");
  }
  header->data_offset = LoadLE32(data + 10);
  const uint32_t dib_size = LoadLE32(data + 14);
  if (dib_size < kInfoHeaderSize || dib_size > size - kFileHeaderSize) {
    return JPEGKIT_FAILURE("Unsupported DIB header size %u", dib_size);
  }
  const int32_t width = static_cast<int32_t>(LoadLE32(data + 18));
  const int32_t height = static_cast<int32_t>(LoadLE32(data + 22));
  if (width <= 0 || width > kMaxDimension || height == 0 ||
      height < -kMaxDimension || height > kMaxDimension) {
    return JPEGKIT_FAILURE("Invalid BMP dimensions %d x %d", width, height);
  }
  header->xsize = width;
  header->ysize = height < 0 ? -height : height;
  header->bottom_up = height > 0;
  header->bits_per_pixel = LoadLE16(data + 28);
  const uint32_t compression = LoadLE32(data + 30);
  const uint32_t colors_used = LoadLE32(data + 46);
  header->palette_offset = kFileHeaderSize + dib_size;
  header->palette_size = 0;

  if (header->bits_per_pixel == 8) {
    if (compression != kCompressionRGB) {
      return JPEGKIT_FAILURE("Compressed 8-bit BMP is not supported");
    }
    if (header->data_offset < header->palette_offset + 4) {
      return JPEGKIT_FAILURE("8-bit BMP without palette");
    }
    header->palette_size = (header->data_offset - header->palette_offset) / 4;
    if (colors_used > 0 && colors_used < header->palette_size) {
      header->palette_size = colors_used;
    }
    if (header->palette_size > 256) header->palette_size = 256;
  } else if (header->bits_per_pixel == 24 || header->bits_per_pixel == 32) {
    if (compression == kCompressionBitfields) {
      // The masks follow the 40 byte header, either inside a larger header
      // or as a separate table.
      const size_t masks = kFileHeaderSize + kInfoHeaderSize;
      if (size < masks + 12) return JPEGKIT_FAILURE("Missing BMP bit masks");
      if (LoadLE32(data + masks) != 0x00FF0000u ||
          LoadLE32(data + masks + 4) != 0x0000FF00u ||
          LoadLE32(data + masks + 8) != 0x000000FFu) {
        return JPEGKIT_FAILURE("Unsupported BMP bit masks");
      }
    } else if (compression != kCompressionRGB) {
      return JPEGKIT_FAILURE("Unsupported BMP compression %u", compression);
    }
  } else {
    return JPEGKIT_FAILURE("Unsupported BMP bit depth %u",
                           header->bits_per_pixel);
  }
  if (header->data_offset < header->palette_offset ||
      header->data_offset > size) {
    return JPEGKIT_FAILURE("Invalid BMP data offset %" PRIuS,
                           header->data_offset);
  }
  return true;
}

}  // namespace

Status DecodeImageBMP(const uint8_t* data, size_t size, PackedImage* image) {
  BMPHeader header;
  JPEGKIT_RETURN_IF_ERROR(ParseHeader(data, size, &header));
  const size_t stride = RowStride(header.xsize, header.bits_per_pixel);
  if ((size - header.data_offset) / stride < header.ysize) {
    return JPEGKIT_FAILURE("BMP file is truncated");
  }
  const uint8_t* palette = data + header.palette_offset;
  bool is_gray = header.bits_per_pixel == 8;
  for (size_t i = 0; i < header.palette_size; ++i) {
    const uint8_t* bgr = &palette[i * 4];
    if (bgr[0] != bgr[1] || bgr[0] != bgr[2]) is_gray = false;
  }
  JPEGKIT_RETURN_IF_ERROR(
      image->Resize(header.xsize, header.ysize, is_gray ? 1 : 3));
  const size_t bytes_per_pixel = header.bits_per_pixel / 8;
  for (size_t y = 0; y < header.ysize; ++y) {
    const size_t src_y = header.bottom_up ? header.ysize - 1 - y : y;
    const uint8_t* row = data + header.data_offset + src_y * stride;
    uint8_t* out = image->row(y);
    for (size_t x = 0; x < header.xsize; ++x) {
      const uint8_t* bgr = row + x * bytes_per_pixel;
      if (header.bits_per_pixel == 8) {
        if (row[x] >= header.palette_size) {
          return JPEGKIT_FAILURE("BMP palette index %d out of range", row[x]);
        }
        bgr = &palette[row[x] * 4];
      }
      if (is_gray) {
        *out++ = bgr[0];
      } else {
        *out++ = bgr[2];
        *out++ = bgr[1];
        *out++ = bgr[0];
      }
    }
  }
  image->metadata = ImageMetadata();
  return true;
}

Status EncodeImageBMP(const PackedImage& image, std::vector<uint8_t>* bytes) {
  if (image.empty()) return JPEGKIT_FAILURE("Empty image");
  if (image.xsize > static_cast<size_t>(kMaxDimension) ||
      image.ysize > static_cast<size_t>(kMaxDimension)) {
    return JPEGKIT_FAILURE("Image too large for BMP");
  }
  if (!image.metadata.exif.empty() || !image.metadata.icc.empty()) {
    JPEGKIT_WARNING("BMP encoder ignoring metadata - use a different codec");
  }
  const bool is_gray = image.num_channels == 1;
  const uint32_t bits_per_pixel = is_gray ? 8 : 24;
  const size_t palette_size = is_gray ? 256 * 4 : 0;
  const size_t data_offset = kFileHeaderSize + kInfoHeaderSize + palette_size;
  const size_t stride = RowStride(image.xsize, bits_per_pixel);
  const size_t data_size = stride * image.ysize;
  if (data_offset + data_size > 0xFFFFFFFFu) {
    return JPEGKIT_FAILURE("Image too large for BMP");
  }
  bytes->assign(data_offset + data_size, 0);
  uint8_t* p = bytes->data();
  p[0] = 'B';
  p[1] = 'M';
  StoreLE32(bytes->size(), p + 2);
  StoreLE32(data_offset, p + 10);
  StoreLE32(kInfoHeaderSize, p + 14);
  StoreLE32(image.xsize, p + 18);
  StoreLE32(image.ysize, p + 22);
  StoreLE16(1, p + 26);
  StoreLE16(bits_per_pixel, p + 28);
  StoreLE32(kCompressionRGB, p + 30);
  StoreLE32(data_size, p + 34);
  StoreLE32(kPixelsPerMeter, p + 38);
  StoreLE32(kPixelsPerMeter, p + 42);
  StoreLE32(is_gray ? 256 : 0, p + 46);
  uint8_t* palette = p + kFileHeaderSize + kInfoHeaderSize;
  for (size_t i = 0; i < palette_size / 4; ++i) {
    palette[i * 4 + 0] = i;
    palette[i * 4 + 1] = i;
    palette[i * 4 + 2] = i;
  }
  for (size_t y = 0; y < image.ysize; ++y) {
    uint8_t* out = p + data_offset + (image.ysize - 1 - y) * stride;
    if (is_gray) {
      memcpy(out, image.row(y), image.xsize);
      continue;
    }
    for (size_t x = 0; x < image.xsize; ++x) {
      const uint8_t* px = image.pixel(y, x);
      *out++ = px[2];
      *out++ = px[1];
      *out++ = px[0];
    }
  }
  return true;
}

}  // namespace extras
}  // namespace jpegkit
