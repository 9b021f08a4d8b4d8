// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/extras/codec.h"

#include <string.h>

#include <algorithm>
#include <cctype>
#include <locale>
#include <utility>

#include "lib/extras/bmp.h"
#include "lib/extras/pnm.h"
#include "lib/jpegkit/decode.h"
#include "lib/jpegkit/encode.h"
#include "lib/jpegkit/error.h"

#ifndef JPEGKIT_ENABLE_PNG
#define JPEGKIT_ENABLE_PNG 0
#endif

#ifndef JPEGKIT_ENABLE_GIF
#define JPEGKIT_ENABLE_GIF 0
#endif

#ifndef JPEGKIT_ENABLE_WEBP
#define JPEGKIT_ENABLE_WEBP 0
#endif

#if JPEGKIT_ENABLE_PNG
#include "lib/extras/codec_png.h"
#endif
#if JPEGKIT_ENABLE_GIF
#include "lib/extras/codec_gif.h"
#endif
#if JPEGKIT_ENABLE_WEBP
#include "lib/extras/codec_webp.h"
#endif

namespace jpegkit {
namespace extras {
namespace {

struct Signature {
  Codec codec;
  size_t offset;
  size_t size;
  uint8_t bytes[8];
};

// Identifying bytes of the supported formats. Only binary PNM is recognized.
// A WebP file is a RIFF container with the WEBP form type.
const Signature kSignatures[] = {
    {Codec::kJPG, 0, 3, {0xFF, 0xD8, 0xFF}},
    {Codec::kPNG, 0, 8, {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'}},
    {Codec::kPNM, 0, 2, {'P', '5'}},
    {Codec::kPNM, 0, 2, {'P', '6'}},
    {Codec::kBMP, 0, 2, {'B', 'M'}},
    {Codec::kGIF, 0, 6, {'G', 'I', 'F', '8', '7', 'a'}},
    {Codec::kGIF, 0, 6, {'G', 'I', 'F', '8', '9', 'a'}},
    {Codec::kWEBP, 8, 4, {'W', 'E', 'B', 'P'}},
};

struct Extension {
  const char* name;
  Codec codec;
};

const Extension kExtensions[] = {
    {"jpg", Codec::kJPG}, {"jpeg", Codec::kJPG}, {"jpe", Codec::kJPG},
    {"pnm", Codec::kPNM}, {"pgm", Codec::kPNM},  {"ppm", Codec::kPNM},
    {"png", Codec::kPNG}, {"bmp", Codec::kBMP},  {"gif", Codec::kGIF},
    {"webp", Codec::kWEBP},
};

Status DecodeImageJPG(const uint8_t* data, size_t size,
                      const DecodeParams& params, PackedImage* image) {
  JpegDecoder decoder(params);
  decoder.SetInput(data, size);
  PackedImage rgb;
  if (!decoder.ReadImage(&rgb)) {
    return JPEGKIT_FAILURE("%s", decoder.error().ToString().c_str());
  }
  if (decoder.num_components() != 1 || rgb.num_channels == 1) {
    *image = std::move(rgb);
    return true;
  }
  // Gray images are rendered with identical channels, keep only one.
  JPEGKIT_RETURN_IF_ERROR(image->Resize(rgb.xsize, rgb.ysize, 1));
  for (size_t y = 0; y < rgb.ysize; ++y) {
    for (size_t x = 0; x < rgb.xsize; ++x) {
      image->row(y)[x] = rgb.pixel(y, x)[0];
    }
  }
  image->metadata = rgb.metadata;
  return true;
}

}  // namespace

Codec CodecFromPath(const std::string& path) {
  const size_t dot = path.find_last_of('.');
  if (dot == std::string::npos) return Codec::kUnknown;
  std::string ext = path.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](char c) {
    return std::tolower(c, std::locale::classic());
  });
  for (const Extension& e : kExtensions) {
    if (ext == e.name) return e.codec;
  }
  return Codec::kUnknown;
}

Codec DetectCodec(const uint8_t* data, size_t size) {
  for (const Signature& sig : kSignatures) {
    if (size >= sig.offset + sig.size &&
        memcmp(data + sig.offset, sig.bytes, sig.size) == 0) {
      if (sig.codec == Codec::kWEBP && memcmp(data, "RIFF", 4) != 0) {
        continue;
      }
      return sig.codec;
    }
  }
  return Codec::kUnknown;
}

bool CanDecode(Codec codec) {
  switch (codec) {
    case Codec::kJPG:
    case Codec::kPNM:
    case Codec::kBMP:
      return true;
    case Codec::kPNG:
      return JPEGKIT_ENABLE_PNG;
    case Codec::kGIF:
      return JPEGKIT_ENABLE_GIF;
    case Codec::kWEBP:
      return JPEGKIT_ENABLE_WEBP;
    default:
      return false;
  }
}

bool CanEncode(Codec codec) {
  return codec != Codec::kGIF && CanDecode(codec);
}

std::string ListOfCodecs() {
  std::string list_of_codecs("JPEG, PGM, PPM, BMP");
  if (CanDecode(Codec::kPNG)) list_of_codecs.append(", PNG");
  if (CanDecode(Codec::kGIF)) list_of_codecs.append(", GIF (decode only)");
  if (CanDecode(Codec::kWEBP)) list_of_codecs.append(", WebP");
  return list_of_codecs;
}

Status DecodeBytes(const uint8_t* data, size_t size,
                   const DecodeParams& params, PackedImage* image,
                   Codec* orig_codec) {
  const Codec codec = DetectCodec(data, size);
  bool ok = false;
  switch (codec) {
    case Codec::kJPG:
      ok = DecodeImageJPG(data, size, params, image);
      break;

    case Codec::kPNM:
      ok = DecodeImagePNM(data, size, image);
      break;

    case Codec::kPNG:
#if JPEGKIT_ENABLE_PNG
      ok = DecodeImagePNG(data, size, image);
      break;
#else
      return JPEGKIT_FAILURE("PNG support is not enabled in this build");
#endif

    case Codec::kBMP:
      ok = DecodeImageBMP(data, size, image);
      break;

    case Codec::kGIF:
#if JPEGKIT_ENABLE_GIF
      ok = DecodeImageGIF(data, size, image);
      break;
#else
      return JPEGKIT_FAILURE("GIF support is not enabled in this build");
#endif

    case Codec::kWEBP:
#if JPEGKIT_ENABLE_WEBP
      ok = DecodeImageWebP(data, size, image);
      break;
#else
      return JPEGKIT_FAILURE("WebP support is not enabled in this build");
#endif

    case Codec::kUnknown:
      return JPEGKIT_FAILURE("Unrecognized codec");
  }

  if (!ok) {
    return JPEGKIT_FAILURE("Codecs failed to decode");
  }
  if (orig_codec) *orig_codec = codec;
  return true;
}

Status EncodeBytes(const PackedImage& image, Codec codec,
                   const EncodeParams& jpeg_params,
                   std::vector<uint8_t>* bytes) {
  switch (codec) {
    case Codec::kJPG: {
      JpegError error;
      if (!EncodeJpeg(image, jpeg_params, bytes, &error)) {
        return JPEGKIT_FAILURE("%s", error.ToString().c_str());
      }
      return true;
    }

    case Codec::kPNM:
      return EncodeImagePNM(image, bytes);

    case Codec::kPNG:
#if JPEGKIT_ENABLE_PNG
      return EncodeImagePNG(image, bytes);
#else
      return JPEGKIT_FAILURE("PNG support is not enabled in this build");
#endif

    case Codec::kBMP:
      return EncodeImageBMP(image, bytes);

    case Codec::kWEBP:
#if JPEGKIT_ENABLE_WEBP
      return EncodeImageWebP(image, jpeg_params.quality, bytes);
#else
      return JPEGKIT_FAILURE("WebP support is not enabled in this build");
#endif

    case Codec::kGIF:
    case Codec::kUnknown:
      break;
  }
  return JPEGKIT_FAILURE("Unsupported output format");
}

}  // namespace extras
}  // namespace jpegkit
