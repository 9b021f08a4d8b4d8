// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/jpegkit/decode.h"

#include <string.h>

#include <utility>

#include "lib/jpegkit/decode_internal.h"
#include "lib/jpegkit/decode_marker.h"
#include "lib/jpegkit/decode_scan.h"
#include "lib/jpegkit/render.h"

namespace jpegkit {

const char* JpegColorSpaceName(JpegColorSpace cs) {
  switch (cs) {
    case JpegColorSpace::kUnknown:
      return "Unknown";
    case JpegColorSpace::kGray:
      return "Gray";
    case JpegColorSpace::kRGB:
      return "RGB";
    case JpegColorSpace::kYCbCr:
      return "YCbCr";
    case JpegColorSpace::kCMYK:
      return "CMYK";
    case JpegColorSpace::kYCCK:
      return "YCCK";
  }
  return "Invalid";
}

JpegDecoder::JpegDecoder(const DecodeParams& params)
    : params_(params), state_(new DecoderState(params)) {}

JpegDecoder::~JpegDecoder() = default;

void JpegDecoder::SetInput(const uint8_t* data, size_t len) {
  state_.reset(new DecoderState(params_));
  state_->memory_source_.reset(new MemorySource(data, len));
}

void JpegDecoder::SetInputStream(std::istream* in,
                                 std::function<bool()> cancel) {
  state_.reset(new DecoderState(params_));
  state_->stream_source_.reset(
      new StreamSource(in, params_.stream_buffer_size, std::move(cancel)));
}

Status JpegDecoder::ReadHeaders() {
  DecoderState* m = state_.get();
  if (!m->error_.ok()) return false;
  if (m->headers_done_) return true;
  if (!m->source()) {
    return JPEGKIT_HEADER_ERROR(&m->error_, "No input was set.");
  }
  JPEGKIT_RETURN_IF_ERROR(ReadSOI(m));
  while (!m->scan_pending_) {
    const int marker = ReadMarker(m);
    if (marker < 0 || marker == kMarkerEOI) {
      if (m->source()->cancelled()) {
        return JPEGKIT_ERROR(&m->error_, JpegErrorKind::kCancelled,
                             "Decoding cancelled.");
      }
      m->error_.byte_offset = m->source()->position();
      if (!m->found_sof_) {
        return JPEGKIT_HEADER_ERROR(&m->error_, "Missing SOF marker.");
      }
      return JPEGKIT_HEADER_ERROR(&m->error_, "Missing scan data.");
    }
    JPEGKIT_RETURN_IF_ERROR(ProcessMarker(m, marker));
  }
  if (m->components_.size() == 2) {
    return JPEGKIT_HEADER_ERROR(&m->error_,
                                "Unsupported number of components: 2");
  }
  m->color_space_ = DetermineColorSpace(*m);
  m->headers_done_ = true;
  JPEGKIT_DEBUG_V(1, "JPEG %dx%d components=%d progressive=%d color=%s",
                  static_cast<int>(m->xsize_), static_cast<int>(m->ysize_),
                  static_cast<int>(m->components_.size()),
                  m->is_progressive_ ? 1 : 0,
                  JpegColorSpaceName(m->color_space_));
  return true;
}

Status JpegDecoder::ReadScans() {
  DecoderState* m = state_.get();
  JPEGKIT_RETURN_IF_ERROR(ReadHeaders());
  if (m->scans_done_) return true;
  for (;;) {
    if (m->scan_pending_) {
      JPEGKIT_RETURN_IF_ERROR(DecodeScan(m));
      if (m->input_exhausted_) break;
    }
    int marker = m->next_marker_;
    m->next_marker_ = -1;
    if (marker < 0) marker = ReadMarker(m);
    if (marker < 0) {
      if (m->source()->cancelled()) {
        return JPEGKIT_ERROR(&m->error_, JpegErrorKind::kCancelled,
                             "Decoding cancelled.");
      }
      JPEGKIT_WARNING("Missing EOI marker.");
      break;
    }
    JPEGKIT_RETURN_IF_ERROR(ProcessMarker(m, marker));
    if (m->found_eoi_) break;
  }
  for (const JPEGComponent& c : m->components_) {
    if (!c.has_scan_data) {
      return JPEGKIT_HEADER_ERROR(&m->error_,
                                  "Missing scan data for component %d.", c.id);
    }
  }
  m->scans_done_ = true;
  return true;
}

Status JpegDecoder::ReadImage(PackedImage* image) {
  JPEGKIT_RETURN_IF_ERROR(ReadScans());
  return RenderImage(state_.get(), image);
}

Status JpegDecoder::ReadCoefficients(JpegCoefficients* coefficients) {
  JPEGKIT_RETURN_IF_ERROR(ReadScans());
  const DecoderState& m = *state_;
  coefficients->xsize = m.xsize_;
  coefficients->ysize = m.ysize_;
  coefficients->is_progressive = m.is_progressive_;
  coefficients->color_space = m.color_space_;
  coefficients->metadata = m.metadata_;
  coefficients->components.resize(m.components_.size());
  for (size_t i = 0; i < m.components_.size(); ++i) {
    const JPEGComponent& c = m.components_[i];
    JpegCoefficients::Component* out = &coefficients->components[i];
    out->id = c.id;
    out->h_samp_factor = c.h_samp_factor;
    out->v_samp_factor = c.v_samp_factor;
    out->width_in_blocks = c.width_in_blocks;
    out->height_in_blocks = c.height_in_blocks;
    const size_t num_coeffs =
        c.width_in_blocks * c.height_in_blocks * kDCTBlockSize;
    out->coeffs.assign(c.coeffs.get(), c.coeffs.get() + num_coeffs);
    out->quant.assign(c.quant, c.quant + kDCTBlockSize);
  }
  return true;
}

const JpegError& JpegDecoder::error() const { return state_->error_; }

size_t JpegDecoder::xsize() const { return state_->xsize_; }

size_t JpegDecoder::ysize() const { return state_->ysize_; }

size_t JpegDecoder::num_components() const {
  return state_->components_.size();
}

bool JpegDecoder::is_progressive() const { return state_->is_progressive_; }

JpegColorSpace JpegDecoder::color_space() const {
  return state_->color_space_;
}

const ImageMetadata& JpegDecoder::metadata() const {
  return state_->metadata_;
}

int JpegDecoder::num_huffman_rescans() const {
  return state_->num_huffman_rescans_;
}

int JpegDecoder::num_skipped_scans() const {
  return state_->num_skipped_scans_;
}

Status DecodeJpeg(const uint8_t* data, size_t len, const DecodeParams& params,
                  PackedImage* image, JpegError* error) {
  JpegDecoder decoder(params);
  decoder.SetInput(data, len);
  if (!decoder.ReadImage(image)) {
    if (error) *error = decoder.error();
    return false;
  }
  if (error) error->Clear();
  return true;
}

}  // namespace jpegkit
