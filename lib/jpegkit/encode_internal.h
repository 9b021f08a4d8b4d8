// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_ENCODE_INTERNAL_H_
#define LIB_JPEGKIT_ENCODE_INTERNAL_H_

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include "lib/jpegkit/common_internal.h"
#include "lib/jpegkit/error.h"
#include "lib/jpegkit/types.h"

#ifndef JPEGKIT_DEBUG_ENCODER
#define JPEGKIT_DEBUG_ENCODER 0
#endif

namespace jpegkit {

// Largest number of refinement bits buffered during an EOB run of an AC
// refinement scan.
constexpr size_t kJPEGMaxCorrectionBits = 1u << 16;

// Largest number of blocks in the MCU of an interleaved scan.
constexpr int kMaxBlocksInMCU = 10;

struct EncoderComponent {
  int id = 0;
  int h_samp_factor = 1;
  int v_samp_factor = 1;
  int quant_idx = 0;
  size_t width_in_blocks = 0;
  size_t height_in_blocks = 0;
  // width_in_blocks * height_in_blocks quantized blocks in natural order, not
  // owned.
  const coeff_t* coeffs = nullptr;
};

// Frame level state shared by the segment and scan writers.
struct EncoderState {
  JpegError* error = nullptr;
  std::vector<uint8_t>* output = nullptr;

  size_t xsize = 0;
  size_t ysize = 0;
  bool progressive = false;
  JpegColorSpace color_space = JpegColorSpace::kYCbCr;
  std::vector<EncoderComponent> components;
  int max_h_samp = 1;
  int max_v_samp = 1;
  uint16_t quant[kMaxQuantTables][kDCTBlockSize];
  int num_quant_tables = 0;
  int restart_interval = 0;
};

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_ENCODE_INTERNAL_H_
