// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_EXTRAS_CODEC_H_
#define LIB_EXTRAS_CODEC_H_

// Format selection and whole-file decoding and encoding of the formats known
// to the converter.

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "lib/jpegkit/base/status.h"
#include "lib/jpegkit/packed_image.h"
#include "lib/jpegkit/types.h"

namespace jpegkit {
namespace extras {

enum class Codec : uint32_t {
  kUnknown = 0,
  kJPG,
  kPNM,
  kPNG,
  kBMP,
  kGIF,
  kWEBP,
};

// Chooses the codec by the (case insensitive) file name extension.
Codec CodecFromPath(const std::string& path);

// Chooses the codec by the signature at the start of the file.
Codec DetectCodec(const uint8_t* data, size_t size);

// PNG, GIF and WebP support depends on the build configuration. GIF can
// only be decoded.
bool CanDecode(Codec codec);
bool CanEncode(Codec codec);

std::string ListOfCodecs();

// Decodes a file of any supported format, detected from its contents. Gray
// JPEG images decode to one channel and all other JPEG images to RGB, the
// EXIF orientation is reported in the metadata but not applied.
Status DecodeBytes(const uint8_t* data, size_t size,
                   const DecodeParams& params, PackedImage* image,
                   Codec* orig_codec = nullptr);

// jpeg_params is used for JPEG output, its quality also for WebP output.
Status EncodeBytes(const PackedImage& image, Codec codec,
                   const EncodeParams& jpeg_params,
                   std::vector<uint8_t>* bytes);

}  // namespace extras
}  // namespace jpegkit

#endif  // LIB_EXTRAS_CODEC_H_
