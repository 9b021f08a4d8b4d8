// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "tools/convert_ops.h"

#include <stdint.h>

#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "lib/jpegkit/packed_image.h"

namespace jpegkit {
namespace tools {
namespace {

TEST(ConvertOpsTest, ParseOperations) {
  ImageOperation op;
  ASSERT_TRUE(ParseImageOperation("resize:64x32", &op));
  EXPECT_EQ(ImageOperation::Type::kResize, op.type);
  EXPECT_EQ(64u, op.xsize);
  EXPECT_EQ(32u, op.ysize);

  ASSERT_TRUE(ParseImageOperation("resizebilinear:8X9", &op));
  EXPECT_EQ(ImageOperation::Type::kResizeBilinear, op.type);
  EXPECT_EQ(8u, op.xsize);
  EXPECT_EQ(9u, op.ysize);

  ASSERT_TRUE(ParseImageOperation("resizefit:100x100", &op));
  EXPECT_EQ(ImageOperation::Type::kResizeToFit, op.type);

  ASSERT_TRUE(ParseImageOperation("grayscale", &op));
  EXPECT_EQ(ImageOperation::Type::kGrayscale, op.type);
  EXPECT_EQ(0u, op.xsize);
}

TEST(ConvertOpsTest, ParseInvalidOperations) {
  ImageOperation op;
  const std::vector<std::string> invalid = {
      "",
      "blur",
      "blur:3x3",
      "resize",
      "resize:",
      "resize:64",
      "resize:0x4",
      "resize:4x",
      "resize:4x4x",
      "grayscale:1x1",
  };
  for (const std::string& text : invalid) {
    EXPECT_FALSE(ParseImageOperation(text, &op)) << text;
  }
}

TEST(ConvertOpsTest, ApplyInOrder) {
  PackedImage image(40, 20, 3);
  for (size_t i = 0; i < image.pixels.size(); ++i) image.pixels[i] = i % 251;
  std::vector<ImageOperation> ops(3);
  ASSERT_TRUE(ParseImageOperation("resizefit:10x10", &ops[0]));
  ASSERT_TRUE(ParseImageOperation("grayscale", &ops[1]));
  ASSERT_TRUE(ParseImageOperation("resize:6x4", &ops[2]));
  ASSERT_TRUE(ApplyImageOperations(ops, &image));
  EXPECT_EQ(6u, image.xsize);
  EXPECT_EQ(4u, image.ysize);
  EXPECT_EQ(1u, image.num_channels);
  EXPECT_EQ(24u, image.pixels.size());
}

TEST(ConvertOpsTest, NoOperationsKeepsImage) {
  PackedImage image(3, 3, 1);
  image.pixels[4] = 99;
  const std::vector<uint8_t> pixels = image.pixels;
  ASSERT_TRUE(ApplyImageOperations({}, &image));
  EXPECT_EQ(pixels, image.pixels);
}

TEST(ConvertOpsTest, FailureOnEmptyImage) {
  PackedImage image;
  std::vector<ImageOperation> ops(1);
  ASSERT_TRUE(ParseImageOperation("grayscale", &ops[0]));
  EXPECT_FALSE(ApplyImageOperations(ops, &image));
}

}  // namespace
}  // namespace tools
}  // namespace jpegkit
