// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/jpegkit/metadata.h"

namespace jpegkit {
namespace {

constexpr uint16_t kOrientationTag = 0x0112;
constexpr uint16_t kTypeShort = 3;
constexpr uint16_t kTypeLong = 4;
constexpr size_t kIfdEntrySize = 12;

uint32_t LoadU16(const uint8_t* p, bool big_endian) {
  return big_endian ? (p[0] << 8) | p[1] : (p[1] << 8) | p[0];
}

uint32_t LoadU32(const uint8_t* p, bool big_endian) {
  return big_endian ? (static_cast<uint32_t>(p[0]) << 24) | (p[1] << 16) |
                          (p[2] << 8) | p[3]
                    : (static_cast<uint32_t>(p[3]) << 24) | (p[2] << 16) |
                          (p[1] << 8) | p[0];
}

void StoreU16(uint32_t v, bool big_endian, uint8_t* p) {
  if (big_endian) {
    p[0] = v >> 8;
    p[1] = v & 0xff;
  } else {
    p[0] = v & 0xff;
    p[1] = v >> 8;
  }
}

void StoreU32(uint32_t v, bool big_endian, uint8_t* p) {
  for (int i = 0; i < 4; ++i) {
    p[big_endian ? 3 - i : i] = (v >> (8 * i)) & 0xff;
  }
}

// Returns the offset of the 12-byte IFD0 orientation entry, or 0 if there is
// none. Sets *big_endian to the byte order of the TIFF header.
size_t FindOrientationEntry(const std::vector<uint8_t>& exif,
                            bool* big_endian) {
  if (exif.size() < 8) return 0;
  const uint8_t* data = exif.data();
  if (data[0] == 'I' && data[1] == 'I') {
    *big_endian = false;
  } else if (data[0] == 'M' && data[1] == 'M') {
    *big_endian = true;
  } else {
    return 0;
  }
  if (LoadU16(data + 2, *big_endian) != 42) return 0;
  const uint32_t ifd_offset = LoadU32(data + 4, *big_endian);
  if (ifd_offset < 8 || ifd_offset > exif.size() - 2) return 0;
  const size_t num_entries = LoadU16(data + ifd_offset, *big_endian);
  size_t pos = ifd_offset + 2;
  for (size_t i = 0; i < num_entries; ++i, pos += kIfdEntrySize) {
    if (pos + kIfdEntrySize > exif.size()) return 0;
    if (LoadU16(data + pos, *big_endian) != kOrientationTag) continue;
    const uint32_t type = LoadU16(data + pos + 2, *big_endian);
    const uint32_t count = LoadU32(data + pos + 4, *big_endian);
    if (count != 1 || (type != kTypeShort && type != kTypeLong)) return 0;
    return pos;
  }
  return 0;
}

}  // namespace

bool ParseExifOrientation(const std::vector<uint8_t>& exif, int* orientation) {
  bool big_endian = false;
  const size_t pos = FindOrientationEntry(exif, &big_endian);
  if (pos == 0) return false;
  const uint8_t* entry = exif.data() + pos;
  const uint32_t type = LoadU16(entry + 2, big_endian);
  const uint32_t value = type == kTypeShort ? LoadU16(entry + 8, big_endian)
                                            : LoadU32(entry + 8, big_endian);
  if (value < 1 || value > 8) return false;
  *orientation = value;
  return true;
}

bool SetExifOrientation(std::vector<uint8_t>* exif, int orientation) {
  bool big_endian = false;
  const size_t pos = FindOrientationEntry(*exif, &big_endian);
  if (pos == 0) return false;
  uint8_t* entry = exif->data() + pos;
  if (LoadU16(entry + 2, big_endian) == kTypeShort) {
    StoreU16(orientation, big_endian, entry + 8);
    // Unused half of the 4-byte value field.
    entry[10] = entry[11] = 0;
  } else {
    StoreU32(orientation, big_endian, entry + 8);
  }
  return true;
}

}  // namespace jpegkit
