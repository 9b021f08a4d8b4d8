// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/jpegkit/render.h"

#include <string.h>

#include <algorithm>
#include <hwy/aligned_allocator.h>
#include <vector>

#include "lib/jpegkit/base/compiler_specific.h"
#include "lib/jpegkit/base/printf_macros.h"
#include "lib/jpegkit/color_transform.h"
#include "lib/jpegkit/idct.h"

namespace jpegkit {
namespace {

typedef void (*InverseDCTFunc)(const coeff_t* coeffs, const uint16_t* quant,
                               uint8_t* out, size_t stride);

// Reconstructed samples of one component, padded to whole blocks.
struct ComponentPlane {
  hwy::AlignedFreeUniquePtr<uint8_t[]> samples;
  size_t stride = 0;
  // Number of meaningful samples, derived from the image size and the
  // sampling factors.
  size_t xsize = 0;
  size_t ysize = 0;

  const uint8_t* row(size_t y) const { return samples.get() + y * stride; }
};

Status ReconstructPlane(DecoderState* m, const JPEGComponent& c,
                        InverseDCTFunc idct, ComponentPlane* plane) {
  plane->stride = c.width_in_blocks * kBlockDim;
  plane->xsize = DivCeil(m->xsize_ * c.h_samp_factor, m->max_h_samp_);
  plane->ysize = DivCeil(m->ysize_ * c.v_samp_factor, m->max_v_samp_);
  const size_t num_rows = c.height_in_blocks * kBlockDim;
  plane->samples = hwy::AllocateAligned<uint8_t>(plane->stride * num_rows);
  if (!plane->samples) {
    return JPEGKIT_HEADER_ERROR(&m->error_,
                                "Could not allocate component %d plane", c.id);
  }
  // Only the blocks that cover meaningful samples are transformed.
  const size_t xblocks = DivCeil(plane->xsize, kBlockDim);
  const size_t yblocks = DivCeil(plane->ysize, kBlockDim);
  for (size_t by = 0; by < yblocks; ++by) {
    const coeff_t* block_row =
        &c.coeffs[by * c.width_in_blocks * kDCTBlockSize];
    uint8_t* out = plane->samples.get() + by * kBlockDim * plane->stride;
    for (size_t bx = 0; bx < xblocks; ++bx) {
      idct(&block_row[bx * kDCTBlockSize], c.quant, out + bx * kBlockDim,
           plane->stride);
    }
  }
  return true;
}

// Returns the frame component index of each color channel: components with
// ids 1, 2, 3(, 4) (or 'R', 'G', 'B') in that order, otherwise the frame
// order.
void ChannelOrder(const DecoderState& m, int* order) {
  const int num_components = m.components_.size();
  static const int kRGBIds[3] = {'R', 'G', 'B'};
  bool found = true;
  for (int i = 0; i < num_components; ++i) {
    order[i] = m.comp_index_by_id_[i + 1];
    if (order[i] < 0) found = false;
  }
  if (!found && num_components == 3) {
    found = true;
    for (int i = 0; i < 3; ++i) {
      order[i] = m.comp_index_by_id_[kRGBIds[i]];
      if (order[i] < 0) found = false;
    }
  }
  if (!found) {
    for (int i = 0; i < num_components; ++i) order[i] = i;
  }
}

// Nearest neighbour index of the source sample of each output position.
std::vector<uint32_t> SampleMap(size_t plane_size, size_t image_size) {
  std::vector<uint32_t> map(image_size);
  for (size_t i = 0; i < image_size; ++i) {
    map[i] = static_cast<uint32_t>(
        static_cast<uint64_t>(i) * plane_size / image_size);
  }
  return map;
}

bool Is420(const DecoderState& m, const int* order) {
  if (m.components_.size() != 3) return false;
  const JPEGComponent& y = m.components_[order[0]];
  const JPEGComponent& cb = m.components_[order[1]];
  const JPEGComponent& cr = m.components_[order[2]];
  return y.h_samp_factor == 2 && y.v_samp_factor == 2 &&
         cb.h_samp_factor == 1 && cb.v_samp_factor == 1 &&
         cr.h_samp_factor == 1 && cr.v_samp_factor == 1;
}

size_t OutputChannels(OutputMode mode, JpegColorSpace cs) {
  switch (mode) {
    case OutputMode::kRGB:
      return 3;
    case OutputMode::kRGBA:
      return 4;
    case OutputMode::kNative:
      if (cs == JpegColorSpace::kGray) return 1;
      if (cs == JpegColorSpace::kCMYK || cs == JpegColorSpace::kYCCK) {
        return 4;
      }
      return 3;
  }
  return 3;
}

// Converts the upsampled channel rows to the output color space in place.
void ConvertRow(JpegColorSpace cs, bool native, uint8_t** rows,
                size_t xsize) {
  switch (cs) {
    case JpegColorSpace::kYCbCr:
      YCbCrToRGB(rows[0], rows[1], rows[2], xsize);
      break;
    case JpegColorSpace::kCMYK:
      if (!native) CMYKToRGB(rows[0], rows[1], rows[2], rows[3], xsize);
      break;
    case JpegColorSpace::kYCCK:
      if (!native) {
        YCCKToCMYK(rows[0], rows[1], rows[2], xsize);
        CMYKToRGB(rows[0], rows[1], rows[2], rows[3], xsize);
      }
      break;
    default:
      break;
  }
}

void WriteOutputRow(uint8_t** rows, size_t num_channels, size_t xsize,
                    bool is_gray, uint8_t* JPEGKIT_RESTRICT out) {
  if (is_gray) {
    const uint8_t* gray = rows[0];
    if (num_channels == 1) {
      memcpy(out, gray, xsize);
      return;
    }
    for (size_t x = 0; x < xsize; ++x) {
      uint8_t* px = out + x * num_channels;
      px[0] = px[1] = px[2] = gray[x];
      if (num_channels == 4) px[3] = 255;
    }
    return;
  }
  if (num_channels == 3) {
    for (size_t x = 0; x < xsize; ++x) {
      out[3 * x + 0] = rows[0][x];
      out[3 * x + 1] = rows[1][x];
      out[3 * x + 2] = rows[2][x];
    }
  } else {
    // Native 4-channel output keeps the fourth plane, RGBA gets opaque
    // alpha.
    const uint8_t* fourth = rows[3];
    for (size_t x = 0; x < xsize; ++x) {
      out[4 * x + 0] = rows[0][x];
      out[4 * x + 1] = rows[1][x];
      out[4 * x + 2] = rows[2][x];
      out[4 * x + 3] = fourth ? fourth[x] : 255;
    }
  }
}

}  // namespace

Status RenderImage(DecoderState* m, PackedImage* image) {
  const size_t num_components = m->components_.size();
  const size_t xsize = m->xsize_;
  const size_t ysize = m->ysize_;
  InverseDCTFunc idct = m->params_.idct == DctMethod::kFloat
                            ? InverseDCTBlockFloat
                            : InverseDCTBlockInteger;
  std::vector<ComponentPlane> planes(num_components);
  for (size_t c = 0; c < num_components; ++c) {
    JPEGKIT_RETURN_IF_ERROR(
        ReconstructPlane(m, m->components_[c], idct, &planes[c]));
  }
  int order[kMaxComponents];
  ChannelOrder(*m, order);

  if (m->color_space_ == JpegColorSpace::kUnknown && num_components == 4) {
    const ComponentPlane& p1 = planes[order[1]];
    const ComponentPlane& p2 = planes[order[2]];
    const bool ycck = LooksLikeYCCK(p1.row(0), p1.stride, p2.row(0),
                                    p2.stride, std::min(p1.xsize, p2.xsize),
                                    std::min(p1.ysize, p2.ysize));
    m->color_space_ = ycck ? JpegColorSpace::kYCCK : JpegColorSpace::kCMYK;
    JPEGKIT_DEBUG_V(1, "4-component image without Adobe marker, using %s",
                    JpegColorSpaceName(m->color_space_));
  }
  const JpegColorSpace cs = m->color_space_;
  if (cs == JpegColorSpace::kUnknown) {
    return JPEGKIT_HEADER_ERROR(&m->error_,
                                "Unsupported component count %" PRIuS,
                                num_components);
  }
  const bool native = m->params_.output == OutputMode::kNative;
  const bool is_gray = cs == JpegColorSpace::kGray;
  const size_t num_channels = OutputChannels(m->params_.output, cs);
  if (!image->Resize(xsize, ysize, num_channels)) {
    return JPEGKIT_HEADER_ERROR(&m->error_, "Could not allocate output image");
  }
  image->metadata = m->metadata_;

  auto scratch = hwy::AllocateAligned<uint8_t>(kMaxComponents * xsize);
  if (!scratch) {
    return JPEGKIT_HEADER_ERROR(&m->error_, "Could not allocate row buffers");
  }
  uint8_t* rows[kMaxComponents] = {nullptr, nullptr, nullptr, nullptr};
  for (size_t c = 0; c < num_components; ++c) {
    rows[c] = scratch.get() + c * xsize;
  }
  std::vector<std::vector<uint32_t>> x_maps(num_components);
  std::vector<std::vector<uint32_t>> y_maps(num_components);
  for (size_t c = 0; c < num_components; ++c) {
    const ComponentPlane& plane = planes[order[c]];
    x_maps[c] = SampleMap(plane.xsize, xsize);
    y_maps[c] = SampleMap(plane.ysize, ysize);
  }
  const bool is_420 = Is420(*m, order);

  for (size_t y = 0; y < ysize; ++y) {
    if (is_gray) {
      // Single component, the plane has the image size.
      memcpy(rows[0], planes[order[0]].row(y), xsize);
    } else if (is_420) {
      memcpy(rows[0], planes[order[0]].row(y), xsize);
      const uint8_t* cb = planes[order[1]].row(y >> 1);
      const uint8_t* cr = planes[order[2]].row(y >> 1);
      for (size_t x = 0; x < xsize; ++x) {
        rows[1][x] = cb[x >> 1];
        rows[2][x] = cr[x >> 1];
      }
    } else {
      for (size_t c = 0; c < num_components; ++c) {
        const uint8_t* src = planes[order[c]].row(y_maps[c][y]);
        const uint32_t* x_map = x_maps[c].data();
        uint8_t* dst = rows[c];
        for (size_t x = 0; x < xsize; ++x) dst[x] = src[x_map[x]];
      }
    }
    ConvertRow(cs, native, rows, xsize);
    uint8_t* out_rows[kMaxComponents] = {
        rows[0], rows[1], rows[2], native && num_channels == 4 ? rows[3]
                                                               : nullptr};
    WriteOutputRow(out_rows, num_channels, xsize, is_gray, image->row(y));
  }
  return true;
}

}  // namespace jpegkit
