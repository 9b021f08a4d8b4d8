// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/extras/codec_png.h"

#include <stdlib.h>
#include <string.h>

// Lodepng library:
#include <lodepng.h>

#include <memory>

namespace jpegkit {
namespace extras {
namespace {

// Owns a lodepng decoder or encoder state.
struct PNGState {
  PNGState() { lodepng_state_init(&s); }
  ~PNGState() { lodepng_state_cleanup(&s); }

  LodePNGState s;
};

// Buffers returned by lodepng are released with free().
typedef std::unique_ptr<unsigned char, void (*)(void*)> LodePNGBuffer;

// Picks the 8-bit layout the pixels are decoded to. Palettes count as gray
// when all entries are gray and no ICC profile is attached, and have alpha
// when any entry is not opaque.
Status ChooseRawColorType(const LodePNGColorMode& mode, bool has_icc,
                          LodePNGColorType* type) {
  bool gray = false;
  bool alpha = mode.key_defined != 0;
  if (mode.colortype == LCT_GREY || mode.colortype == LCT_GREY_ALPHA) {
    gray = true;
    alpha = alpha || mode.colortype == LCT_GREY_ALPHA;
  } else if (mode.colortype == LCT_RGB || mode.colortype == LCT_RGBA) {
    alpha = alpha || mode.colortype == LCT_RGBA;
  } else if (mode.colortype == LCT_PALETTE) {
    gray = !has_icc;
    for (size_t i = 0; i < mode.palettesize; ++i) {
      const unsigned char* rgba = &mode.palette[i * 4];
      if (rgba[0] != rgba[1] || rgba[0] != rgba[2]) gray = false;
      if (rgba[3] != 255) alpha = true;
    }
  } else {
    return JPEGKIT_FAILURE("Unsupported PNG color type %d", mode.colortype);
  }
  *type = alpha ? LCT_RGBA : (gray ? LCT_GREY : LCT_RGB);
  return true;
}

// Reads the first chunk of the given type into the state, if there is one.
Status InspectChunkType(const uint8_t* data, size_t size, const char* type,
                        LodePNGState* state) {
  const unsigned char* chunk =
      lodepng_chunk_find_const(data, data + size, type);
  if (chunk &&
      lodepng_inspect_chunk(state, chunk - data, data, size) != 0) {
    return JPEGKIT_FAILURE("Invalid chunk \"%s\" in PNG image", type);
  }
  return true;
}

}  // namespace

Status DecodeImagePNG(const uint8_t* data, size_t size, PackedImage* image) {
  PNGState state;
  unsigned w;
  unsigned h;
  if (lodepng_inspect(&w, &h, &state.s, data, size) != 0) {
    return JPEGKIT_FAILURE("Invalid PNG header");
  }
  // The palette, transparency and profile chunks decide the output layout.
  JPEGKIT_RETURN_IF_ERROR(InspectChunkType(data, size, "PLTE", &state.s));
  JPEGKIT_RETURN_IF_ERROR(InspectChunkType(data, size, "tRNS", &state.s));
  JPEGKIT_RETURN_IF_ERROR(InspectChunkType(data, size, "iCCP", &state.s));
  LodePNGColorType raw_type;
  JPEGKIT_RETURN_IF_ERROR(ChooseRawColorType(
      state.s.info_png.color, state.s.info_png.iccp_defined != 0, &raw_type));
  const size_t num_channels =
      raw_type == LCT_RGBA ? 4 : (raw_type == LCT_RGB ? 3 : 1);
  state.s.info_raw.colortype = raw_type;
  state.s.info_raw.bitdepth = 8;

  unsigned char* out = nullptr;
  const unsigned err = lodepng_decode(&out, &w, &h, &state.s, data, size);
  LodePNGBuffer owned(out, free);
  if (err != 0) {
    return JPEGKIT_FAILURE("Failed to decode PNG: %s",
                           lodepng_error_text(err));
  }
  JPEGKIT_RETURN_IF_ERROR(image->Resize(w, h, num_channels));
  memcpy(image->pixels.data(), out, image->pixels.size());
  image->metadata = ImageMetadata();
  if (state.s.info_png.iccp_defined) {
    const uint8_t* icc = state.s.info_png.iccp_profile;
    image->metadata.icc.assign(icc, icc + state.s.info_png.iccp_profile_size);
  }
  return true;
}

Status EncodeImagePNG(const PackedImage& image, std::vector<uint8_t>* bytes) {
  if (image.empty()) return JPEGKIT_FAILURE("Empty image");
  PNGState state;
  // Keep the channel layout of the image instead of the smallest one.
  state.s.encoder.auto_convert = 0;

  LodePNGInfo* info = &state.s.info_png;
  info->color.bitdepth = 8;
  info->color.colortype = image.num_channels == 1   ? LCT_GREY
                          : image.num_channels == 3 ? LCT_RGB
                                                    : LCT_RGBA;
  state.s.info_raw = info->color;
  if (!image.metadata.icc.empty() &&
      lodepng_set_icc(info, "ICC profile", image.metadata.icc.data(),
                      image.metadata.icc.size()) != 0) {
    return JPEGKIT_FAILURE("Failed to add ICC profile");
  }
  if (!image.metadata.exif.empty()) {
    JPEGKIT_WARNING("PNG encoder ignoring EXIF metadata");
  }

  unsigned char* out = nullptr;
  size_t out_size = 0;
  const unsigned err = lodepng_encode(&out, &out_size, image.pixels.data(),
                                      image.xsize, image.ysize, &state.s);
  LodePNGBuffer owned(out, free);
  if (err != 0) {
    return JPEGKIT_FAILURE("Failed to encode PNG: %s",
                           lodepng_error_text(err));
  }
  bytes->assign(out, out + out_size);
  return true;
}

}  // namespace extras
}  // namespace jpegkit
