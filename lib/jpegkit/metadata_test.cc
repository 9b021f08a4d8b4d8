// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/jpegkit/metadata.h"

#include <stdint.h>

#include <vector>

#include "gtest/gtest.h"
#include "lib/jpegkit/test_utils.h"

namespace jpegkit {
namespace {

// Little endian TIFF with a width entry followed by a LONG orientation entry.
std::vector<uint8_t> MakeLittleEndianExif(uint32_t orientation) {
  std::vector<uint8_t> exif = {'I', 'I', 42, 0, 8, 0, 0, 0, 2, 0};
  const uint8_t width_entry[12] = {0x00, 0x01, 3, 0, 1, 0, 0, 0, 64, 0, 0, 0};
  const uint8_t orientation_entry[12] = {
      0x12, 0x01, 4, 0, 1, 0, 0, 0, static_cast<uint8_t>(orientation),
      0,    0,    0};
  exif.insert(exif.end(), width_entry, width_entry + 12);
  exif.insert(exif.end(), orientation_entry, orientation_entry + 12);
  exif.insert(exif.end(), 4, 0);
  return exif;
}

TEST(MetadataTest, ParseBigEndian) {
  for (int orientation = 1; orientation <= 8; ++orientation) {
    int parsed = 0;
    ASSERT_TRUE(
        ParseExifOrientation(MakeExifWithOrientation(orientation), &parsed));
    EXPECT_EQ(orientation, parsed);
  }
}

TEST(MetadataTest, ParseLittleEndian) {
  int parsed = 0;
  ASSERT_TRUE(ParseExifOrientation(MakeLittleEndianExif(7), &parsed));
  EXPECT_EQ(7, parsed);
}

TEST(MetadataTest, SetOrientation) {
  std::vector<uint8_t> exif = MakeExifWithOrientation(6);
  const size_t size = exif.size();
  ASSERT_TRUE(SetExifOrientation(&exif, 1));
  EXPECT_EQ(size, exif.size());
  int parsed = 0;
  ASSERT_TRUE(ParseExifOrientation(exif, &parsed));
  EXPECT_EQ(1, parsed);

  std::vector<uint8_t> le = MakeLittleEndianExif(8);
  const std::vector<uint8_t> original = le;
  ASSERT_TRUE(SetExifOrientation(&le, 3));
  ASSERT_TRUE(ParseExifOrientation(le, &parsed));
  EXPECT_EQ(3, parsed);
  // Only the value field of the orientation entry changes.
  size_t num_changed = 0;
  for (size_t i = 0; i < le.size(); ++i) {
    if (le[i] != original[i]) ++num_changed;
  }
  EXPECT_EQ(1u, num_changed);
}

TEST(MetadataTest, InvalidExif) {
  int parsed = 5;
  EXPECT_FALSE(ParseExifOrientation(std::vector<uint8_t>(), &parsed));
  EXPECT_FALSE(ParseExifOrientation(std::vector<uint8_t>(6, 'I'), &parsed));

  std::vector<uint8_t> bad_magic = MakeExifWithOrientation(3);
  bad_magic[3] = 43;
  EXPECT_FALSE(ParseExifOrientation(bad_magic, &parsed));

  std::vector<uint8_t> bad_offset = MakeExifWithOrientation(3);
  bad_offset[7] = 200;
  EXPECT_FALSE(ParseExifOrientation(bad_offset, &parsed));

  std::vector<uint8_t> truncated = MakeExifWithOrientation(3);
  truncated.resize(16);
  EXPECT_FALSE(ParseExifOrientation(truncated, &parsed));
  EXPECT_FALSE(SetExifOrientation(&truncated, 1));

  EXPECT_FALSE(ParseExifOrientation(MakeLittleEndianExif(9), &parsed));
  EXPECT_FALSE(ParseExifOrientation(MakeLittleEndianExif(0), &parsed));
  EXPECT_EQ(5, parsed);
}

TEST(MetadataTest, NoOrientationEntry) {
  std::vector<uint8_t> exif = MakeLittleEndianExif(6);
  // Drop the orientation entry from the entry count.
  exif[8] = 1;
  int parsed = 0;
  EXPECT_FALSE(ParseExifOrientation(exif, &parsed));
  EXPECT_FALSE(SetExifOrientation(&exif, 1));
}

}  // namespace
}  // namespace jpegkit
