// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_BITSTREAM_H_
#define LIB_JPEGKIT_BITSTREAM_H_

// Marker segment and entropy coded scan writers of the encoder.

#include <stddef.h>
#include <stdint.h>

#include <initializer_list>
#include <vector>

#include "lib/jpegkit/base/status.h"
#include "lib/jpegkit/encode_internal.h"
#include "lib/jpegkit/huffman.h"
#include "lib/jpegkit/metadata.h"

namespace jpegkit {

// Entropy coding contexts of a scan: DC of the i-th scan component is
// context i, its AC is context 4 + i.
constexpr int kNumScanContexts = 2 * kMaxComponents;

void WriteOutput(EncoderState* m, const uint8_t* buf, size_t bufsize);
void WriteOutput(EncoderState* m, const std::vector<uint8_t>& bytes);
void WriteOutput(EncoderState* m, std::initializer_list<uint8_t> bytes);

void EncodeSOI(EncoderState* m);
void EncodeEOI(EncoderState* m);
void EncodeAPP0(EncoderState* m);
// Adobe segment with the color transform flag of the frame color space.
void EncodeAPP14(EncoderState* m);
// APP1 EXIF and APP2 ICC segments. With orientation_applied the orientation
// tag of the emitted EXIF copy is set to 1.
Status EncodeMetadata(EncoderState* m, const ImageMetadata& metadata,
                      bool orientation_applied);
Status EncodeDQT(EncoderState* m);
void EncodeSOF(EncoderState* m);
void EncodeDRI(EncoderState* m);
void EncodeDHT(EncoderState* m, const JpegHuffmanCode* huffman_codes,
               size_t num_huffman_codes);
// dc_tbl_idx and ac_tbl_idx hold the table slot of each scan component.
void EncodeSOS(EncoderState* m, const ScanInfo& scan, const int* dc_tbl_idx,
               const int* ac_tbl_idx);

// Runs the entropy coder of the scan without output and accumulates the
// symbol counts of every context into histograms[kNumScanContexts].
Status CountScanSymbols(EncoderState* m, const ScanInfo& scan,
                        Histogram* histograms);

// Writes the entropy coded data of the scan, tables[context] is the code of
// each context used by the scan.
Status EncodeScan(EncoderState* m, const ScanInfo& scan,
                  const HuffmanCodeTable* const* tables);

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_BITSTREAM_H_
