// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/extras/codec_gif.h"

#include <gif_lib.h>
#include <string.h>

#include <memory>

namespace jpegkit {
namespace extras {
namespace {

struct ReadState {
  const uint8_t* data;
  size_t size;
};

struct DGifCloser {
  void operator()(GifFileType* const ptr) const { DGifCloseFile(ptr, nullptr); }
};
using GifUniquePtr = std::unique_ptr<GifFileType, DGifCloser>;

int ReadFromState(GifFileType* gif, GifByteType* bytes, int n) {
  ReadState* state = static_cast<ReadState*>(gif->UserData);
  if (n < 0) return 0;
  size_t to_read = static_cast<size_t>(n);
  if (to_read > state->size) to_read = state->size;
  memcpy(bytes, state->data, to_read);
  state->data += to_read;
  state->size -= to_read;
  return static_cast<int>(to_read);
}

}  // namespace

Status DecodeImageGIF(const uint8_t* data, size_t size, PackedImage* image) {
  ReadState state = {data, size};
  int error = GIF_OK;
  GifUniquePtr gif(DGifOpen(&state, &ReadFromState, &error));
  if (gif == nullptr) {
    return JPEGKIT_FAILURE("Failed to read GIF: %s", GifErrorString(error));
  }
  // DGifSlurp puts the rows of interlaced frames in order.
  if (DGifSlurp(gif.get()) != GIF_OK) {
    return JPEGKIT_FAILURE("Failed to read GIF: %s",
                           GifErrorString(gif->Error));
  }
  if (gif->ImageCount < 1) {
    return JPEGKIT_FAILURE("GIF has no frames");
  }
  if (gif->ImageCount > 1) {
    JPEGKIT_WARNING("GIF has %d frames, only the first is decoded",
                    gif->ImageCount);
  }
  if (gif->SWidth <= 0 || gif->SHeight <= 0) {
    return JPEGKIT_FAILURE("Invalid GIF screen size %d x %d", gif->SWidth,
                           gif->SHeight);
  }

  const SavedImage& frame = gif->SavedImages[0];
  const GifImageDesc& desc = frame.ImageDesc;
  if (desc.Left < 0 || desc.Top < 0 || desc.Width <= 0 || desc.Height <= 0 ||
      desc.Left + desc.Width > gif->SWidth ||
      desc.Top + desc.Height > gif->SHeight) {
    return JPEGKIT_FAILURE("GIF frame lies outside of the screen");
  }
  const ColorMapObject* color_map =
      desc.ColorMap ? desc.ColorMap : gif->SColorMap;
  if (color_map == nullptr) {
    return JPEGKIT_FAILURE("GIF frame has no color map");
  }
  GraphicsControlBlock gcb;
  int transparent = NO_TRANSPARENT_COLOR;
  if (DGifSavedExtensionToGCB(gif.get(), 0, &gcb) == GIF_OK) {
    transparent = gcb.TransparentColor;
  }
  const bool has_alpha = transparent != NO_TRANSPARENT_COLOR;
  const size_t num_channels = has_alpha ? 4 : 3;
  JPEGKIT_RETURN_IF_ERROR(
      image->Resize(gif->SWidth, gif->SHeight, num_channels));

  if (!has_alpha && gif->SColorMap != nullptr &&
      gif->SBackGroundColor < gif->SColorMap->ColorCount) {
    const GifColorType& bg = gif->SColorMap->Colors[gif->SBackGroundColor];
    for (size_t y = 0; y < image->ysize; ++y) {
      for (size_t x = 0; x < image->xsize; ++x) {
        uint8_t* px = image->pixel(y, x);
        px[0] = bg.Red;
        px[1] = bg.Green;
        px[2] = bg.Blue;
      }
    }
  }

  for (int y = 0; y < desc.Height; ++y) {
    const GifByteType* row = frame.RasterBits + y * desc.Width;
    for (int x = 0; x < desc.Width; ++x) {
      const int index = row[x];
      uint8_t* px = image->pixel(desc.Top + y, desc.Left + x);
      if (index == transparent) {
        px[0] = px[1] = px[2] = px[3] = 0;
        continue;
      }
      if (index >= color_map->ColorCount) {
        return JPEGKIT_FAILURE("GIF color index %d out of range", index);
      }
      const GifColorType& color = color_map->Colors[index];
      px[0] = color.Red;
      px[1] = color.Green;
      px[2] = color.Blue;
      if (has_alpha) px[3] = 255;
    }
  }
  image->metadata = ImageMetadata();
  return true;
}

}  // namespace extras
}  // namespace jpegkit
