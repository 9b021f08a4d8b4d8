// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_METADATA_H_
#define LIB_JPEGKIT_METADATA_H_

#include <stddef.h>
#include <stdint.h>

#include <vector>

namespace jpegkit {

// Metadata carried through the codec as opaque blobs.
struct ImageMetadata {
  // EXIF orientation, 1..8.
  int orientation = 1;
  // APP1 payload after the "Exif\0\0" header, starting with the TIFF header.
  std::vector<uint8_t> exif;
  // Reassembled APP2 ICC_PROFILE chunks.
  std::vector<uint8_t> icc;
  bool has_jfif = false;
  bool has_adobe = false;
  // Byte 11 of the APP14 segment, -1 when there is none.
  int adobe_transform = -1;
};

// Finds the orientation tag in IFD0 of a TIFF structured EXIF blob. Returns
// false if the blob is malformed or has no valid orientation entry.
bool ParseExifOrientation(const std::vector<uint8_t>& exif, int* orientation);

// Overwrites the orientation value in place, keeping the byte order and the
// entry type. Returns false if there is no orientation entry to patch.
bool SetExifOrientation(std::vector<uint8_t>* exif, int orientation);

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_METADATA_H_
