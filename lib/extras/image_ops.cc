// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/extras/image_ops.h"

#include <string.h>

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

#include "lib/jpegkit/base/printf_macros.h"

namespace jpegkit {
namespace extras {
namespace {

Status CheckInput(const PackedImage& in) {
  if (in.xsize == 0 || in.ysize == 0 || in.empty()) {
    return JPEGKIT_FAILURE("Empty input image");
  }
  return true;
}

Status PrepareOutput(const PackedImage& in, size_t xsize, size_t ysize,
                     size_t num_channels, PackedImage* out) {
  if (xsize == 0 || ysize == 0) {
    return JPEGKIT_FAILURE("Invalid output size %" PRIuS "x%" PRIuS, xsize,
                           ysize);
  }
  JPEGKIT_RETURN_IF_ERROR(out->Resize(xsize, ysize, num_channels));
  out->metadata = in.metadata;
  return true;
}

// Position of output pixel (x, y) in the input for each orientation.
void SourcePosition(int orientation, size_t xsize, size_t ysize, size_t x,
                    size_t y, size_t* sx, size_t* sy) {
  switch (orientation) {
    case 2:  // Mirror horizontal
      *sx = xsize - 1 - x;
      *sy = y;
      break;
    case 3:  // Rotate 180
      *sx = xsize - 1 - x;
      *sy = ysize - 1 - y;
      break;
    case 4:  // Mirror vertical
      *sx = x;
      *sy = ysize - 1 - y;
      break;
    case 5:  // Transpose
      *sx = y;
      *sy = x;
      break;
    case 6:  // Rotate 90 clockwise
      *sx = y;
      *sy = ysize - 1 - x;
      break;
    case 7:  // Transverse
      *sx = xsize - 1 - y;
      *sy = ysize - 1 - x;
      break;
    case 8:  // Rotate 270 clockwise
      *sx = xsize - 1 - y;
      *sy = x;
      break;
    default:
      *sx = x;
      *sy = y;
      break;
  }
}

}  // namespace

Status ApplyOrientation(const PackedImage& in, int orientation,
                        PackedImage* out) {
  JPEGKIT_RETURN_IF_ERROR(CheckInput(in));
  if (orientation < 1 || orientation > 8) {
    return JPEGKIT_FAILURE("Invalid orientation %d", orientation);
  }
  const bool transposed = orientation >= 5;
  const size_t xsize = transposed ? in.ysize : in.xsize;
  const size_t ysize = transposed ? in.xsize : in.ysize;
  PackedImage result;
  JPEGKIT_RETURN_IF_ERROR(
      PrepareOutput(in, xsize, ysize, in.num_channels, &result));
  const size_t nc = in.num_channels;
  for (size_t y = 0; y < ysize; ++y) {
    uint8_t* row_out = result.row(y);
    for (size_t x = 0; x < xsize; ++x) {
      size_t sx;
      size_t sy;
      SourcePosition(orientation, in.xsize, in.ysize, x, y, &sx, &sy);
      memcpy(row_out + x * nc, in.pixel(sy, sx), nc);
    }
  }
  result.metadata.orientation = 1;
  *out = std::move(result);
  return true;
}

Status Grayscale(const PackedImage& in, PackedImage* out) {
  JPEGKIT_RETURN_IF_ERROR(CheckInput(in));
  PackedImage result;
  JPEGKIT_RETURN_IF_ERROR(PrepareOutput(in, in.xsize, in.ysize, 1, &result));
  for (size_t y = 0; y < in.ysize; ++y) {
    uint8_t* row_out = result.row(y);
    for (size_t x = 0; x < in.xsize; ++x) {
      const uint8_t* px = in.pixel(y, x);
      if (in.num_channels == 1) {
        row_out[x] = px[0];
      } else {
        row_out[x] = (77 * px[0] + 150 * px[1] + 29 * px[2]) >> 8;
      }
    }
  }
  *out = std::move(result);
  return true;
}

Status Resize(const PackedImage& in, size_t xsize, size_t ysize,
              PackedImage* out) {
  JPEGKIT_RETURN_IF_ERROR(CheckInput(in));
  PackedImage result;
  JPEGKIT_RETURN_IF_ERROR(
      PrepareOutput(in, xsize, ysize, in.num_channels, &result));
  const size_t nc = in.num_channels;
  std::vector<size_t> src_x(xsize);
  for (size_t x = 0; x < xsize; ++x) src_x[x] = x * in.xsize / xsize;
  for (size_t y = 0; y < ysize; ++y) {
    const uint8_t* row_in = in.row(y * in.ysize / ysize);
    uint8_t* row_out = result.row(y);
    for (size_t x = 0; x < xsize; ++x) {
      memcpy(row_out + x * nc, row_in + src_x[x] * nc, nc);
    }
  }
  *out = std::move(result);
  return true;
}

Status ResizeBilinear(const PackedImage& in, size_t xsize, size_t ysize,
                      PackedImage* out) {
  JPEGKIT_RETURN_IF_ERROR(CheckInput(in));
  PackedImage result;
  JPEGKIT_RETURN_IF_ERROR(
      PrepareOutput(in, xsize, ysize, in.num_channels, &result));
  const size_t nc = in.num_channels;
  const float scale_x =
      in.xsize <= 1 ? 0.0f
                    : static_cast<float>(in.xsize - 1) /
                          std::max<size_t>(1, xsize - 1);
  const float scale_y =
      in.ysize <= 1 ? 0.0f
                    : static_cast<float>(in.ysize - 1) /
                          std::max<size_t>(1, ysize - 1);
  std::vector<size_t> x0(xsize);
  std::vector<size_t> x1(xsize);
  std::vector<float> wx(xsize);
  for (size_t x = 0; x < xsize; ++x) {
    const float fx = x * scale_x;
    x0[x] = std::min<size_t>(static_cast<size_t>(fx), in.xsize - 1);
    x1[x] = std::min(x0[x] + 1, in.xsize - 1);
    wx[x] = fx - x0[x];
  }
  for (size_t y = 0; y < ysize; ++y) {
    const float fy = y * scale_y;
    const size_t y0 = std::min<size_t>(static_cast<size_t>(fy), in.ysize - 1);
    const size_t y1 = std::min(y0 + 1, in.ysize - 1);
    const float wy = fy - y0;
    const uint8_t* row0 = in.row(y0);
    const uint8_t* row1 = in.row(y1);
    uint8_t* row_out = result.row(y);
    for (size_t x = 0; x < xsize; ++x) {
      for (size_t c = 0; c < nc; ++c) {
        const float top = row0[x0[x] * nc + c] * (1.0f - wx[x]) +
                          row0[x1[x] * nc + c] * wx[x];
        const float bottom = row1[x0[x] * nc + c] * (1.0f - wx[x]) +
                             row1[x1[x] * nc + c] * wx[x];
        const float v = top * (1.0f - wy) + bottom * wy + 0.5f;
        row_out[x * nc + c] = static_cast<uint8_t>(std::min(v, 255.0f));
      }
    }
  }
  *out = std::move(result);
  return true;
}

Status ResizeToFit(const PackedImage& in, size_t max_xsize, size_t max_ysize,
                   PackedImage* out) {
  JPEGKIT_RETURN_IF_ERROR(CheckInput(in));
  if (max_xsize == 0 || max_ysize == 0) {
    return JPEGKIT_FAILURE("Invalid bounding box %" PRIuS "x%" PRIuS,
                           max_xsize, max_ysize);
  }
  const double scale =
      std::min(static_cast<double>(max_xsize) / in.xsize,
               static_cast<double>(max_ysize) / in.ysize);
  const size_t xsize = std::max<size_t>(
      1, static_cast<size_t>(std::lround(in.xsize * scale)));
  const size_t ysize = std::max<size_t>(
      1, static_cast<size_t>(std::lround(in.ysize * scale)));
  return ResizeBilinear(in, std::min(xsize, max_xsize),
                        std::min(ysize, max_ysize), out);
}

}  // namespace extras
}  // namespace jpegkit
