// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/extras/pnm.h"

#include <stdint.h>

#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "lib/jpegkit/packed_image.h"

namespace jpegkit {
namespace extras {
namespace {

std::vector<uint8_t> Bytes(const std::string& header,
                           const std::vector<uint8_t>& pixels) {
  std::vector<uint8_t> bytes(header.begin(), header.end());
  bytes.insert(bytes.end(), pixels.begin(), pixels.end());
  return bytes;
}

TEST(PNMTest, DecodeGray) {
  const std::vector<uint8_t> bytes =
      Bytes("P5\n# comment\n3 2\n255\n", {0, 1, 2, 3, 4, 255});
  PackedImage image;
  ASSERT_TRUE(DecodeImagePNM(bytes.data(), bytes.size(), &image));
  EXPECT_EQ(3u, image.xsize);
  EXPECT_EQ(2u, image.ysize);
  EXPECT_EQ(1u, image.num_channels);
  EXPECT_EQ(std::vector<uint8_t>({0, 1, 2, 3, 4, 255}), image.pixels);
}

TEST(PNMTest, DecodeColorWithMaxVal) {
  const std::vector<uint8_t> bytes =
      Bytes("P6 2 1 15 ", {0, 15, 7, 15, 15, 20});
  PackedImage image;
  ASSERT_TRUE(DecodeImagePNM(bytes.data(), bytes.size(), &image));
  EXPECT_EQ(3u, image.num_channels);
  // Values are rescaled to 255, the out of range sample is clamped.
  EXPECT_EQ(std::vector<uint8_t>({0, 255, 119, 255, 255, 255}), image.pixels);
}

TEST(PNMTest, RoundTrip) {
  PackedImage image(5, 4, 3);
  for (size_t i = 0; i < image.pixels.size(); ++i) image.pixels[i] = i * 3;
  std::vector<uint8_t> bytes;
  ASSERT_TRUE(EncodeImagePNM(image, &bytes));
  const std::string header = "P6\n5 4\n255\n";
  ASSERT_GT(bytes.size(), header.size());
  EXPECT_EQ(header, std::string(bytes.begin(), bytes.begin() + header.size()));
  PackedImage decoded;
  ASSERT_TRUE(DecodeImagePNM(bytes.data(), bytes.size(), &decoded));
  EXPECT_EQ(image.xsize, decoded.xsize);
  EXPECT_EQ(image.ysize, decoded.ysize);
  EXPECT_EQ(image.pixels, decoded.pixels);
}

TEST(PNMTest, EncodeDropsAlpha) {
  PackedImage image(2, 1, 4);
  image.pixels = {1, 2, 3, 255, 4, 5, 6, 255};
  std::vector<uint8_t> bytes;
  ASSERT_TRUE(EncodeImagePNM(image, &bytes));
  PackedImage decoded;
  ASSERT_TRUE(DecodeImagePNM(bytes.data(), bytes.size(), &decoded));
  EXPECT_EQ(3u, decoded.num_channels);
  EXPECT_EQ(std::vector<uint8_t>({1, 2, 3, 4, 5, 6}), decoded.pixels);
}

TEST(PNMTest, InvalidInput) {
  PackedImage image;
  const std::vector<std::vector<uint8_t>> inputs = {
      Bytes("", {}),
      Bytes("P3\n1 1\n255\n", {0, 0, 0}),
      Bytes("P5\n1\n", {}),
      Bytes("P5\n0 1\n255\n", {0}),
      Bytes("P5\n1 1\n65535\n", {0, 0}),
      Bytes("P5\n2 2\n255\n", {0, 0, 0}),
      Bytes("P5\n1 1\n255", {}),
  };
  for (const auto& bytes : inputs) {
    EXPECT_FALSE(DecodeImagePNM(bytes.data(), bytes.size(), &image));
  }
  std::vector<uint8_t> out;
  EXPECT_FALSE(EncodeImagePNM(PackedImage(), &out));
}

}  // namespace
}  // namespace extras
}  // namespace jpegkit
