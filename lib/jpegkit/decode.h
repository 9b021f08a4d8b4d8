// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_DECODE_H_
#define LIB_JPEGKIT_DECODE_H_

// Baseline and progressive JPEG decoder.

#include <stddef.h>
#include <stdint.h>

#include <functional>
#include <istream>
#include <memory>
#include <vector>

#include "lib/jpegkit/base/status.h"
#include "lib/jpegkit/common_internal.h"
#include "lib/jpegkit/error.h"
#include "lib/jpegkit/metadata.h"
#include "lib/jpegkit/packed_image.h"
#include "lib/jpegkit/types.h"

namespace jpegkit {

struct DecoderState;

// Quantized DCT coefficients of a decoded file together with the tables
// needed to reconstruct or re-encode it.
struct JpegCoefficients {
  struct Component {
    int id = 0;
    int h_samp_factor = 1;
    int v_samp_factor = 1;
    size_t width_in_blocks = 0;
    size_t height_in_blocks = 0;
    // width_in_blocks * height_in_blocks blocks of 64 coefficients in natural
    // order.
    std::vector<coeff_t> coeffs;
    // Quantization table in natural order.
    std::vector<uint16_t> quant;

    coeff_t* block(size_t by, size_t bx) {
      return &coeffs[(by * width_in_blocks + bx) * kDCTBlockSize];
    }
    const coeff_t* block(size_t by, size_t bx) const {
      return &coeffs[(by * width_in_blocks + bx) * kDCTBlockSize];
    }
  };

  size_t xsize = 0;
  size_t ysize = 0;
  bool is_progressive = false;
  JpegColorSpace color_space = JpegColorSpace::kUnknown;
  std::vector<Component> components;
  ImageMetadata metadata;
};

// Decodes one JPEG image. Usage: SetInput() or SetInputStream(), then
// optionally ReadHeaders(), then ReadImage() or ReadCoefficients(). After a
// failed call error() describes the failure and every further call fails.
class JpegDecoder {
 public:
  explicit JpegDecoder(const DecodeParams& params = DecodeParams());
  ~JpegDecoder();

  // The data must outlive the decoder.
  void SetInput(const uint8_t* data, size_t len);

  // Reads the stream through a buffer of params.stream_buffer_size bytes.
  // The cancel callback, if any, is polled before every refill of the buffer,
  // once it returns true decoding stops with a kCancelled error.
  void SetInputStream(std::istream* in,
                      std::function<bool()> cancel = nullptr);

  // Parses the marker segments up to the first scan.
  Status ReadHeaders();

  // Decodes all scans and renders the pixels in the layout selected by
  // DecodeParams::output.
  Status ReadImage(PackedImage* image);

  // Decodes all scans and returns the quantized coefficients.
  Status ReadCoefficients(JpegCoefficients* coefficients);

  const JpegError& error() const;

  // Valid after ReadHeaders().
  size_t xsize() const;
  size_t ysize() const;
  size_t num_components() const;
  bool is_progressive() const;
  JpegColorSpace color_space() const;
  const ImageMetadata& metadata() const;

  // Number of times the segments before a scan were searched again for an
  // undefined Huffman table, at most 1.
  int num_huffman_rescans() const;
  // Number of scans whose entropy coded data was skipped because they use an
  // undefined Huffman table.
  int num_skipped_scans() const;

 private:
  Status ReadScans();

  DecodeParams params_;
  std::unique_ptr<DecoderState> state_;
};

// Decodes the in-memory file into *image. On failure *error, if not null,
// receives the error record.
Status DecodeJpeg(const uint8_t* data, size_t len, const DecodeParams& params,
                  PackedImage* image, JpegError* error = nullptr);

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_DECODE_H_
