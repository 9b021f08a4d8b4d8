// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/extras/bmp.h"

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "gtest/gtest.h"
#include "lib/jpegkit/packed_image.h"

namespace jpegkit {
namespace extras {
namespace {

void AppendLE16(uint32_t v, std::vector<uint8_t>* out) {
  out->push_back(v & 0xFF);
  out->push_back((v >> 8) & 0xFF);
}

void AppendLE32(uint32_t v, std::vector<uint8_t>* out) {
  AppendLE16(v & 0xFFFF, out);
  AppendLE16(v >> 16, out);
}

// File and info header of an uncompressed bitmap, followed by the given
// palette. Rows have to be appended by the caller.
std::vector<uint8_t> BMPHeader(int32_t width, int32_t height,
                               uint32_t bits_per_pixel,
                               const std::vector<uint8_t>& palette) {
  std::vector<uint8_t> out = {'B', 'M'};
  AppendLE32(0, &out);
  AppendLE32(0, &out);
  AppendLE32(54 + palette.size(), &out);
  AppendLE32(40, &out);
  AppendLE32(width, &out);
  AppendLE32(height, &out);
  AppendLE16(1, &out);
  AppendLE16(bits_per_pixel, &out);
  for (int i = 0; i < 6; ++i) AppendLE32(0, &out);
  out.insert(out.end(), palette.begin(), palette.end());
  return out;
}

TEST(BMPTest, RoundTripRowPadding) {
  for (size_t xsize = 1; xsize <= 5; ++xsize) {
    PackedImage image(xsize, 3, 3);
    for (size_t i = 0; i < image.pixels.size(); ++i) {
      image.pixels[i] = i * 11;
    }
    std::vector<uint8_t> bytes;
    ASSERT_TRUE(EncodeImageBMP(image, &bytes));
    const size_t stride = (xsize * 3 + 3) / 4 * 4;
    EXPECT_EQ(54 + 3 * stride, bytes.size()) << "xsize " << xsize;
    PackedImage decoded;
    ASSERT_TRUE(DecodeImageBMP(bytes.data(), bytes.size(), &decoded));
    EXPECT_EQ(xsize, decoded.xsize);
    EXPECT_EQ(3u, decoded.ysize);
    EXPECT_EQ(3u, decoded.num_channels);
    EXPECT_EQ(image.pixels, decoded.pixels) << "xsize " << xsize;
  }
}

TEST(BMPTest, GrayUsesPalette) {
  PackedImage image(3, 2, 1);
  image.pixels = {0, 10, 20, 200, 250, 255};
  std::vector<uint8_t> bytes;
  ASSERT_TRUE(EncodeImageBMP(image, &bytes));
  EXPECT_EQ(54u + 1024u + 2 * 4, bytes.size());
  EXPECT_EQ(8, bytes[28]);
  PackedImage decoded;
  ASSERT_TRUE(DecodeImageBMP(bytes.data(), bytes.size(), &decoded));
  EXPECT_EQ(1u, decoded.num_channels);
  EXPECT_EQ(image.pixels, decoded.pixels);
}

TEST(BMPTest, EncodeDropsAlpha) {
  PackedImage image(2, 1, 4);
  image.pixels = {1, 2, 3, 100, 4, 5, 6, 200};
  std::vector<uint8_t> bytes;
  ASSERT_TRUE(EncodeImageBMP(image, &bytes));
  PackedImage decoded;
  ASSERT_TRUE(DecodeImageBMP(bytes.data(), bytes.size(), &decoded));
  EXPECT_EQ(3u, decoded.num_channels);
  EXPECT_EQ(std::vector<uint8_t>({1, 2, 3, 4, 5, 6}), decoded.pixels);
}

TEST(BMPTest, DecodeTopDown32Bit) {
  std::vector<uint8_t> bytes = BMPHeader(2, -2, 32, {});
  // BGRX pixels, the first row is the top one.
  const std::vector<uint8_t> rows = {3, 2, 1, 0,    6, 5, 4, 0,
                                     9, 8, 7, 0xFF, 12, 11, 10, 0};
  bytes.insert(bytes.end(), rows.begin(), rows.end());
  PackedImage decoded;
  ASSERT_TRUE(DecodeImageBMP(bytes.data(), bytes.size(), &decoded));
  EXPECT_EQ(2u, decoded.xsize);
  EXPECT_EQ(2u, decoded.ysize);
  EXPECT_EQ(3u, decoded.num_channels);
  EXPECT_EQ(std::vector<uint8_t>({1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12}),
            decoded.pixels);
}

TEST(BMPTest, DecodeColorPalette) {
  // Two BGRX entries: blue and yellow.
  std::vector<uint8_t> bytes =
      BMPHeader(3, 1, 8, {255, 0, 0, 0, 0, 255, 255, 0});
  const std::vector<uint8_t> row = {1, 0, 1, 0};
  bytes.insert(bytes.end(), row.begin(), row.end());
  PackedImage decoded;
  ASSERT_TRUE(DecodeImageBMP(bytes.data(), bytes.size(), &decoded));
  EXPECT_EQ(3u, decoded.num_channels);
  EXPECT_EQ(
      std::vector<uint8_t>({255, 255, 0, 0, 0, 255, 255, 255, 0}),
      decoded.pixels);
}

TEST(BMPTest, InvalidInput) {
  PackedImage image;
  std::vector<std::vector<uint8_t>> inputs;
  inputs.push_back({'B', 'M', 0, 0});
  inputs.push_back(BMPHeader(0, 1, 24, {}));
  inputs.push_back(BMPHeader(1, 1, 16, {}));
  inputs.push_back(BMPHeader(1, 1, 8, {}));
  // Truncated pixel data.
  std::vector<uint8_t> truncated = BMPHeader(4, 4, 24, {});
  truncated.resize(truncated.size() + 40);
  inputs.push_back(truncated);
  // Palette index out of range.
  std::vector<uint8_t> bad_index = BMPHeader(1, 1, 8, {0, 0, 0, 0});
  bad_index.insert(bad_index.end(), {5, 0, 0, 0});
  inputs.push_back(bad_index);
  for (const auto& bytes : inputs) {
    EXPECT_FALSE(DecodeImageBMP(bytes.data(), bytes.size(), &image));
  }
  std::vector<uint8_t> out;
  EXPECT_FALSE(EncodeImageBMP(PackedImage(), &out));
}

}  // namespace
}  // namespace extras
}  // namespace jpegkit
