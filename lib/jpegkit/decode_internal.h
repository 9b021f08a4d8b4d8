// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_DECODE_INTERNAL_H_
#define LIB_JPEGKIT_DECODE_INTERNAL_H_

#include <stdint.h>

#include <hwy/aligned_allocator.h>
#include <memory>
#include <vector>

#include "lib/jpegkit/common_internal.h"
#include "lib/jpegkit/error.h"
#include "lib/jpegkit/huffman.h"
#include "lib/jpegkit/input_source.h"
#include "lib/jpegkit/metadata.h"
#include "lib/jpegkit/types.h"

#ifndef JPEGKIT_DEBUG_MARKERS
#define JPEGKIT_DEBUG_MARKERS 0
#endif

#ifndef JPEGKIT_DEBUG_SCAN
#define JPEGKIT_DEBUG_SCAN 0
#endif

namespace jpegkit {

struct JPEGComponent {
  int id = 0;
  int h_samp_factor = 1;
  int v_samp_factor = 1;
  // Quantization table slot (0..3) named by the frame header.
  int quant_idx = 0;
  size_t width_in_blocks = 0;
  size_t height_in_blocks = 0;
  // width_in_blocks * height_in_blocks blocks of 64 coefficients in natural
  // order.
  hwy::AlignedFreeUniquePtr<coeff_t[]> coeffs;
  // Copy of the quantization table taken at the first scan of the component,
  // later DQT segments redefining the slot do not affect it.
  uint16_t quant[kDCTBlockSize];
  bool quant_latched = false;
  // DC predictor of the current scan, reset at the scan start and at every
  // restart marker.
  int dc_pred = 0;
  // Set once any scan covered this component.
  bool has_scan_data = false;
};

struct JPEGQuantTable {
  uint16_t values[kDCTBlockSize];
  bool defined = false;
};

struct JPEGComponentScanInfo {
  int comp_idx;
  int dc_tbl_idx;
  int ac_tbl_idx;
  // Number of blocks of this component in one MCU of the scan.
  int mcu_xsize_blocks;
  int mcu_ysize_blocks;
};

struct JPEGScanHeader {
  int num_components = 0;
  JPEGComponentScanInfo components[kMaxComponents];
  int Ss = 0;
  int Se = 63;
  int Ah = 0;
  int Al = 0;
  size_t MCU_rows = 0;
  size_t MCU_cols = 0;
  // The scan references an undefined Huffman table, its data is skipped.
  bool skip = false;
};

// Decoding state of one image.
struct DecoderState {
  explicit DecoderState(const DecodeParams& params) : params_(params) {
    for (int16_t& idx : comp_index_by_id_) idx = -1;
  }

  InputSource* source() const {
    return memory_source_ ? static_cast<InputSource*>(memory_source_.get())
                          : static_cast<InputSource*>(stream_source_.get());
  }

  DecodeParams params_;
  JpegError error_;

  std::unique_ptr<MemorySource> memory_source_;
  std::unique_ptr<StreamSource> stream_source_;

  bool found_soi_ = false;
  bool found_sof_ = false;
  bool found_sos_ = false;
  bool found_eoi_ = false;
  bool found_dri_ = false;
  bool is_progressive_ = false;
  bool headers_done_ = false;
  bool scans_done_ = false;

  size_t xsize_ = 0;
  size_t ysize_ = 0;
  std::vector<JPEGComponent> components_;
  int16_t comp_index_by_id_[256];
  int max_h_samp_ = 1;
  int max_v_samp_ = 1;
  size_t iMCU_cols_ = 0;
  size_t iMCU_rows_ = 0;

  JPEGQuantTable quant_[kMaxQuantTables];
  HuffmanDecodingTable dc_huff_[kMaxHuffmanTables];
  HuffmanDecodingTable ac_huff_[kMaxHuffmanTables];
  int restart_interval_ = 0;

  JPEGScanHeader scan_info_;
  // Bitmask of the already coded bit positions of each coefficient.
  uint16_t scan_progression_[kMaxComponents][kDCTBlockSize];
  int eobrun_ = 0;
  // Offset of the SOI marker.
  int64_t input_start_pos_ = 0;
  // Offset of the SOS marker of the current scan.
  int64_t scan_start_pos_ = 0;
  // Marker already consumed from the input by the entropy decoder, -1 if the
  // next marker has to be read from the input.
  int next_marker_ = -1;
  // A SOS header was parsed and its entropy coded data is next in the input.
  bool scan_pending_ = false;
  // Payload of the marker segment being parsed.
  std::vector<uint8_t> segment_;
  bool input_exhausted_ = false;
  // The segments before a scan are searched for missing Huffman tables at
  // most once per decode.
  int num_huffman_rescans_ = 0;
  int num_skipped_scans_ = 0;

  ImageMetadata metadata_;
  int icc_index_ = 0;
  int icc_total_ = 0;
  JpegColorSpace color_space_ = JpegColorSpace::kUnknown;
};

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_DECODE_INTERNAL_H_
