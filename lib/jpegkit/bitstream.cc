// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/jpegkit/bitstream.h"

#include <algorithm>
#include <vector>

#include "lib/jpegkit/base/bits.h"
#include "lib/jpegkit/base/printf_macros.h"

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "lib/jpegkit/bitstream.cc"
#include <hwy/foreach_target.h>
#include <hwy/highway.h>

HWY_BEFORE_NAMESPACE();
namespace jpegkit {
namespace HWY_NAMESPACE {

using hwy::HWY_NAMESPACE::CountTrue;
using hwy::HWY_NAMESPACE::Eq;

// Number of non-zero AC coefficients in a block of 64 coefficients.
int CountNonZeroAC(const coeff_t* block) {
  const HWY_CAPPED(coeff_t, 8) d;
  const auto zero = Zero(d);
  size_t num_zeros = 0;
  for (size_t i = 0; i < kDCTBlockSize; i += Lanes(d)) {
    num_zeros += CountTrue(d, Eq(LoadU(d, block + i), zero));
  }
  const int num_nonzeros = static_cast<int>(kDCTBlockSize - num_zeros);
  return block[0] == 0 ? num_nonzeros : num_nonzeros - 1;
}

// NOLINTNEXTLINE(google-readability-namespace-comments)
}  // namespace HWY_NAMESPACE
}  // namespace jpegkit
HWY_AFTER_NAMESPACE();

#if HWY_ONCE
namespace jpegkit {
namespace {
HWY_EXPORT(CountNonZeroAC);

// Packs entropy coded bits into the output, most significant bit first. A
// zero byte is stuffed after every 0xFF data byte.
class BitWriter {
 public:
  explicit BitWriter(std::vector<uint8_t>* output) : output_(output) {}

  JPEGKIT_INLINE void Write(int nbits, uint32_t bits) {
    JPEGKIT_DASSERT(nbits <= 16);
    acc_ = (acc_ << nbits) | (bits & ((1u << nbits) - 1));
    num_bits_ += nbits;
    while (num_bits_ >= 8) {
      num_bits_ -= 8;
      EmitByte((acc_ >> num_bits_) & 0xFF);
    }
  }

  // Completes the last partial byte with 1 bits.
  void PadToByte() {
    if (num_bits_ > 0) Write(8 - num_bits_, 0xFF);
  }

  void Marker(int marker) {
    PadToByte();
    output_->push_back(0xFF);
    output_->push_back(static_cast<uint8_t>(marker));
  }

 private:
  void EmitByte(uint8_t byte) {
    output_->push_back(byte);
    if (byte == 0xFF) output_->push_back(0);
  }

  std::vector<uint8_t>* output_;
  uint64_t acc_ = 0;
  int num_bits_ = 0;
};

// Sends the symbols through the Huffman code of their context to the bit
// writer.
class HuffmanWriter {
 public:
  HuffmanWriter(BitWriter* bw, const HuffmanCodeTable* const* tables)
      : bw_(bw), tables_(tables) {}

  JPEGKIT_INLINE void Symbol(int context, int symbol) {
    const HuffmanCodeTable* table = tables_[context];
    if (table->depth[symbol] == 0) {
      healthy_ = false;
      return;
    }
    bw_->Write(table->depth[symbol], table->code[symbol]);
  }
  JPEGKIT_INLINE void Bits(int nbits, uint32_t bits) {
    bw_->Write(nbits, bits);
  }
  void Restart(int marker) { bw_->Marker(marker); }
  void Finish() { bw_->PadToByte(); }

  // False if a symbol without a code was written.
  bool healthy() const { return healthy_; }

 private:
  BitWriter* bw_;
  const HuffmanCodeTable* const* tables_;
  bool healthy_ = true;
};

// Collects the symbol statistics of a scan for building optimized codes.
class SymbolCounter {
 public:
  explicit SymbolCounter(Histogram* histograms) : histograms_(histograms) {}

  JPEGKIT_INLINE void Symbol(int context, int symbol) {
    histograms_[context].Add(symbol);
  }
  JPEGKIT_INLINE void Bits(int /* nbits */, uint32_t /* bits */) {}
  void Restart(int /* marker */) {}
  void Finish() {}

 private:
  Histogram* histograms_;
};

// The end-of-band run of a progressive AC scan together with the correction
// bits of the blocks inside the run. Both carry over from block to block
// until a block with a coded coefficient, a restart or the end of the scan.
class BandState {
 public:
  template <typename Output>
  void Flush(Output* out) {
    if (eob_run_ > 0) {
      const int nbits = FloorLog2Nonzero(static_cast<uint32_t>(eob_run_));
      out->Symbol(context_, nbits << 4);
      out->Bits(nbits, eob_run_ - (1 << nbits));
      eob_run_ = 0;
    }
    for (uint8_t bit : correction_bits_) out->Bits(1, bit);
    correction_bits_.clear();
  }

  // Adds one more block ending in the band. The EOBRUN symbol tops out at
  // 0x7FFF and the correction bits are bounded.
  template <typename Output>
  void AddEndOfBand(int ac_context, const std::vector<uint8_t>* bits,
                    Output* out) {
    if (eob_run_ == 0) context_ = ac_context;
    ++eob_run_;
    if (bits != nullptr) {
      correction_bits_.insert(correction_bits_.end(), bits->begin(),
                              bits->end());
    }
    if (eob_run_ == 0x7FFF ||
        correction_bits_.size() > kJPEGMaxCorrectionBits - kDCTBlockSize + 1) {
      Flush(out);
    }
  }

 private:
  int eob_run_ = 0;
  int context_ = 0;
  std::vector<uint8_t> correction_bits_;
};

// Returns the magnitude category of v and stores the extra bits that encode
// it in *bits.
JPEGKIT_INLINE int Categorize(int v, uint32_t* bits) {
  if (v < 0) {
    const int nbits = BitLength(-v);
    *bits = (v - 1) & ((1u << nbits) - 1);
    return nbits;
  }
  *bits = v;
  return BitLength(v);
}

// Codes the difference to the previous DC value of the component. Fails when
// the difference has no DC category.
template <typename Output>
bool EncodeDC(int dc, int context, int* last_dc, Output* out) {
  uint32_t bits;
  const int nbits = Categorize(dc - *last_dc, &bits);
  *last_dc = dc;
  if (nbits >= 12) return false;
  out->Symbol(context, nbits);
  out->Bits(nbits, bits);
  return true;
}

// Emits ZRL symbols until the zero run fits into a run-length symbol.
template <typename Output>
JPEGKIT_INLINE void EmitLongZeroRuns(int context, int* run, Output* out) {
  for (; *run >= 16; *run -= 16) out->Symbol(context, 0xF0);
}

template <typename Output>
bool EncodeBlockSequential(const coeff_t* coeffs, int dc_context,
                           int ac_context, int* last_dc, Output* out) {
  if (!EncodeDC(coeffs[0], dc_context, last_dc, out)) return false;
  int remaining = HWY_DYNAMIC_DISPATCH(CountNonZeroAC)(coeffs);
  int run = 0;
  int k = 1;
  for (; remaining > 0; ++k) {
    const int v = coeffs[kJPEGNaturalOrder[k]];
    if (v == 0) {
      ++run;
      continue;
    }
    EmitLongZeroRuns(ac_context, &run, out);
    uint32_t bits;
    const int nbits = Categorize(v, &bits);
    if (nbits >= 16) return false;
    out->Symbol(ac_context, (run << 4) | nbits);
    out->Bits(nbits, bits);
    run = 0;
    --remaining;
  }
  // k is one past the last non-zero coefficient.
  if (k < static_cast<int>(kDCTBlockSize)) out->Symbol(ac_context, 0);
  return true;
}

// First pass over a spectral band: codes the coefficients divided by 2^Al.
template <typename Output>
bool EncodeBlockFirstPass(const coeff_t* coeffs, int dc_context,
                          int ac_context, const ScanInfo& scan,
                          BandState* band, int* last_dc, Output* out) {
  int start = scan.Ss;
  if (start == 0) {
    // The DC point transform is an arithmetic shift.
    if (!EncodeDC(coeffs[0] >> scan.Al, dc_context, last_dc, out)) {
      return false;
    }
    start = 1;
  }
  int run = 0;
  for (int k = start; k <= scan.Se; ++k) {
    const int v = coeffs[kJPEGNaturalOrder[k]];
    // The AC point transform divides the magnitude.
    const int magnitude = (v < 0 ? -v : v) >> scan.Al;
    if (magnitude == 0) {
      ++run;
      continue;
    }
    band->Flush(out);
    EmitLongZeroRuns(ac_context, &run, out);
    const int nbits = FloorLog2Nonzero(static_cast<uint32_t>(magnitude)) + 1;
    if (nbits >= 15) return false;
    const int bits = v < 0 ? ~magnitude : magnitude;
    out->Symbol(ac_context, (run << 4) | nbits);
    out->Bits(nbits, bits & ((1 << nbits) - 1));
    run = 0;
  }
  if (run > 0) {
    band->AddEndOfBand(ac_context, nullptr, out);
    // Only AC scans may carry an end-of-band run to the next block.
    if (scan.Ss == 0) band->Flush(out);
  }
  return true;
}

// Successive approximation pass: sends bit Al of the coefficients. Newly
// non-zero coefficients are coded with their sign, the others contribute a
// correction bit.
template <typename Output>
bool EncodeBlockRefinement(const coeff_t* coeffs, int ac_context,
                           const ScanInfo& scan, BandState* band,
                           Output* out) {
  int start = scan.Ss;
  if (start == 0) {
    out->Bits(1, (coeffs[0] >> scan.Al) & 1);
    start = 1;
  }
  if (start > scan.Se) return true;
  int magnitude[kDCTBlockSize];
  int last_new = 0;
  for (int k = start; k <= scan.Se; ++k) {
    const int v = coeffs[kJPEGNaturalOrder[k]];
    magnitude[k] = (v < 0 ? -v : v) >> scan.Al;
    if (magnitude[k] == 1) last_new = k;
  }
  std::vector<uint8_t> pending;
  pending.reserve(kDCTBlockSize);
  int run = 0;
  for (int k = start; k <= scan.Se; ++k) {
    if (magnitude[k] == 0) {
      ++run;
      continue;
    }
    // A ZRL is only worth sending when a newly non-zero coefficient follows,
    // otherwise the run is folded into the end of band.
    while (run >= 16 && k <= last_new) {
      band->Flush(out);
      out->Symbol(ac_context, 0xF0);
      for (uint8_t bit : pending) out->Bits(1, bit);
      pending.clear();
      run -= 16;
    }
    if (magnitude[k] > 1) {
      pending.push_back(magnitude[k] & 1);
      continue;
    }
    band->Flush(out);
    out->Symbol(ac_context, (run << 4) | 1);
    out->Bits(1, coeffs[kJPEGNaturalOrder[k]] < 0 ? 0 : 1);
    for (uint8_t bit : pending) out->Bits(1, bit);
    pending.clear();
    run = 0;
  }
  if (run > 0 || !pending.empty()) {
    band->AddEndOfBand(ac_context, &pending, out);
    if (scan.Ss == 0) band->Flush(out);
  }
  return true;
}

template <typename Output>
bool EncodeBlock(const EncoderState& m, const ScanInfo& scan, int i,
                 const coeff_t* block, BandState* band, int* last_dc,
                 Output* out) {
  const int dc_context = i;
  const int ac_context = kMaxComponents + i;
  if (!m.progressive) {
    return EncodeBlockSequential(block, dc_context, ac_context, last_dc, out);
  }
  if (scan.Ah == 0) {
    return EncodeBlockFirstPass(block, dc_context, ac_context, scan, band,
                                last_dc, out);
  }
  return EncodeBlockRefinement(block, ac_context, scan, band, out);
}

// Walks the MCUs of the scan and feeds every block to the block coder of the
// scan type. Blocks outside of the component plane are coded as zero blocks.
template <typename Output>
bool EncodeScanData(const EncoderState& m, const ScanInfo& scan,
                    Output* out) {
  static const coeff_t kZeroBlock[kDCTBlockSize] = {0};
  const bool interleaved = scan.num_components > 1;
  // A non-interleaved MCU is a single block of the component.
  const EncoderComponent& first = m.components[scan.component_index[0]];
  const size_t h_scale = interleaved ? 1 : first.h_samp_factor;
  const size_t v_scale = interleaved ? 1 : first.v_samp_factor;
  const size_t mcu_cols = DivCeil(m.xsize * h_scale, kBlockDim * m.max_h_samp);
  const size_t mcu_rows = DivCeil(m.ysize * v_scale, kBlockDim * m.max_v_samp);

  int last_dc[kMaxComponents] = {0};
  BandState band;
  int mcus_to_restart = m.restart_interval;
  int restart_index = 0;
  for (size_t mcu_y = 0; mcu_y < mcu_rows; ++mcu_y) {
    for (size_t mcu_x = 0; mcu_x < mcu_cols; ++mcu_x) {
      if (m.restart_interval > 0) {
        if (mcus_to_restart == 0) {
          band.Flush(out);
          out->Restart(kMarkerRST0 + restart_index);
          restart_index = (restart_index + 1) & 7;
          mcus_to_restart = m.restart_interval;
          std::fill(last_dc, last_dc + kMaxComponents, 0);
        }
        --mcus_to_restart;
      }
      for (int i = 0; i < scan.num_components; ++i) {
        const EncoderComponent& comp = m.components[scan.component_index[i]];
        const size_t bw = interleaved ? comp.h_samp_factor : 1;
        const size_t bh = interleaved ? comp.v_samp_factor : 1;
        for (size_t by = mcu_y * bh; by < (mcu_y + 1) * bh; ++by) {
          for (size_t bx = mcu_x * bw; bx < (mcu_x + 1) * bw; ++bx) {
            const bool inside =
                bx < comp.width_in_blocks && by < comp.height_in_blocks;
            const coeff_t* block =
                inside ? &comp.coeffs[(by * comp.width_in_blocks + bx) *
                                      kDCTBlockSize]
                       : kZeroBlock;
            if (!EncodeBlock(m, scan, i, block, &band, &last_dc[i], out)) {
              return false;
            }
          }
        }
      }
    }
  }
  band.Flush(out);
  out->Finish();
  return true;
}

}  // namespace

void WriteOutput(EncoderState* m, const uint8_t* buf, size_t bufsize) {
  m->output->insert(m->output->end(), buf, buf + bufsize);
}

void WriteOutput(EncoderState* m, const std::vector<uint8_t>& bytes) {
  WriteOutput(m, bytes.data(), bytes.size());
}

void WriteOutput(EncoderState* m, std::initializer_list<uint8_t> bytes) {
  WriteOutput(m, bytes.begin(), bytes.size());
}

void EncodeSOI(EncoderState* m) { WriteOutput(m, {0xFF, kMarkerSOI}); }

void EncodeEOI(EncoderState* m) { WriteOutput(m, {0xFF, kMarkerEOI}); }

void EncodeAPP0(EncoderState* m) {
  // JFIF 1.01, aspect ratio 1:1, no thumbnail.
  WriteOutput(m, {0xff, 0xe0, 0, 16, 'J', 'F', 'I', 'F', '\0', 1, 1, 0, 0, 1,
                  0, 1, 0, 0});
}

void EncodeAPP14(EncoderState* m) {
  uint8_t color_transform =
      m->color_space == JpegColorSpace::kYCbCr  ? 1
      : m->color_space == JpegColorSpace::kYCCK ? 2
                                                : 0;
  WriteOutput(m, {0xff, 0xee, 0, 14, 'A', 'd', 'o', 'b', 'e', 0, 100, 0, 0,
                  0, 0, color_transform});
}

Status EncodeMetadata(EncoderState* m, const ImageMetadata& metadata,
                      bool orientation_applied) {
  if (!metadata.exif.empty()) {
    std::vector<uint8_t> exif = metadata.exif;
    if (orientation_applied && !SetExifOrientation(&exif, 1)) {
      JPEGKIT_DEBUG_V(1, "EXIF blob has no orientation entry to reset.");
    }
    const size_t payload_size = sizeof(kExifTag) + exif.size();
    if (payload_size > kMaxExifBytesInMarker) {
      return JPEGKIT_ENCODE_ERROR(m->error,
                                  "EXIF data of %" PRIuS
                                  " bytes does not fit in an APP1 segment.",
                                  exif.size());
    }
    const size_t marker_len = 2 + payload_size;
    WriteOutput(m, {0xFF, kMarkerAPP1, static_cast<uint8_t>(marker_len >> 8),
                    static_cast<uint8_t>(marker_len & 0xFF)});
    WriteOutput(m, kExifTag, sizeof(kExifTag));
    WriteOutput(m, exif);
  }
  if (!metadata.icc.empty()) {
    const size_t num_chunks =
        DivCeil(metadata.icc.size(), kMaxIccBytesInMarker);
    if (num_chunks > 255) {
      return JPEGKIT_ENCODE_ERROR(m->error,
                                  "ICC profile of %" PRIuS
                                  " bytes needs more than 255 APP2 segments.",
                                  metadata.icc.size());
    }
    size_t begin = 0;
    for (size_t i = 0; i < num_chunks; ++i) {
      const size_t length =
          std::min(kMaxIccBytesInMarker, metadata.icc.size() - begin);
      const size_t marker_len = 2 + sizeof(kIccProfileTag) + 2 + length;
      WriteOutput(m, {0xFF, kMarkerAPP2, static_cast<uint8_t>(marker_len >> 8),
                      static_cast<uint8_t>(marker_len & 0xFF)});
      WriteOutput(m, kIccProfileTag, sizeof(kIccProfileTag));
      WriteOutput(m, {static_cast<uint8_t>(i + 1),
                      static_cast<uint8_t>(num_chunks)});
      WriteOutput(m, &metadata.icc[begin], length);
      begin += length;
    }
  }
  return true;
}

Status EncodeDQT(EncoderState* m) {
  uint8_t data[4 + kMaxQuantTables * (1 + 2 * kDCTBlockSize)];  // 520 bytes
  size_t pos = 0;
  data[pos++] = 0xFF;
  data[pos++] = kMarkerDQT;
  pos += 2;  // Length will be filled in later.
  for (int i = 0; i < m->num_quant_tables; ++i) {
    const uint16_t* quant_table = m->quant[i];
    int precision = 0;
    for (size_t k = 0; k < kDCTBlockSize; ++k) {
      if (quant_table[k] > 255) precision = 1;
    }
    data[pos++] = (precision << 4) + i;
    for (size_t j = 0; j < kDCTBlockSize; ++j) {
      int val_idx = kJPEGNaturalOrder[j];
      int val = quant_table[val_idx];
      if (val == 0) {
        return JPEGKIT_ENCODE_ERROR(m->error, "Invalid quantization value 0.");
      }
      if (precision) {
        data[pos++] = val >> 8;
      }
      data[pos++] = val & 0xFFu;
    }
  }
  data[2] = (pos - 2) >> 8u;
  data[3] = (pos - 2) & 0xFFu;
  WriteOutput(m, data, pos);
  return true;
}

void EncodeSOF(EncoderState* m) {
  const uint8_t marker = m->progressive ? kMarkerSOF2 : kMarkerSOF0;
  const size_t n_comps = m->components.size();
  const size_t marker_len = 8 + 3 * n_comps;
  std::vector<uint8_t> data(marker_len + 2);
  size_t pos = 0;
  data[pos++] = 0xFF;
  data[pos++] = marker;
  data[pos++] = marker_len >> 8u;
  data[pos++] = marker_len & 0xFFu;
  data[pos++] = kJpegPrecision;
  data[pos++] = m->ysize >> 8u;
  data[pos++] = m->ysize & 0xFFu;
  data[pos++] = m->xsize >> 8u;
  data[pos++] = m->xsize & 0xFFu;
  data[pos++] = n_comps;
  for (size_t i = 0; i < n_comps; ++i) {
    const EncoderComponent& comp = m->components[i];
    data[pos++] = comp.id;
    data[pos++] = ((comp.h_samp_factor << 4u) | (comp.v_samp_factor));
    data[pos++] = comp.quant_idx;
  }
  WriteOutput(m, data);
}

void EncodeDRI(EncoderState* m) {
  WriteOutput(m, {0xFF, kMarkerDRI, 0, 4,
                  static_cast<uint8_t>(m->restart_interval >> 8),
                  static_cast<uint8_t>(m->restart_interval & 0xFF)});
}

void EncodeDHT(EncoderState* m, const JpegHuffmanCode* huffman_codes,
               size_t num_huffman_codes) {
  if (num_huffman_codes == 0) {
    return;
  }
  size_t marker_len = 2;
  for (size_t i = 0; i < num_huffman_codes; ++i) {
    marker_len += 1 + kJpegHuffmanMaxBitLength + huffman_codes[i].values.size();
  }
  std::vector<uint8_t> data(marker_len + 2);
  size_t pos = 0;
  data[pos++] = 0xFF;
  data[pos++] = kMarkerDHT;
  data[pos++] = marker_len >> 8u;
  data[pos++] = marker_len & 0xFFu;
  for (size_t i = 0; i < num_huffman_codes; ++i) {
    const JpegHuffmanCode& huff = huffman_codes[i];
    data[pos++] = huff.slot_id;
    for (size_t l = 1; l <= kJpegHuffmanMaxBitLength; ++l) {
      data[pos++] = huff.counts[l];
    }
    for (uint8_t value : huff.values) {
      data[pos++] = value;
    }
  }
  WriteOutput(m, data);
}

void EncodeSOS(EncoderState* m, const ScanInfo& scan, const int* dc_tbl_idx,
               const int* ac_tbl_idx) {
  const size_t marker_len = 6 + 2 * scan.num_components;
  std::vector<uint8_t> data(marker_len + 2);
  size_t pos = 0;
  data[pos++] = 0xFF;
  data[pos++] = kMarkerSOS;
  data[pos++] = marker_len >> 8u;
  data[pos++] = marker_len & 0xFFu;
  data[pos++] = scan.num_components;
  for (int i = 0; i < scan.num_components; ++i) {
    int comp_idx = scan.component_index[i];
    data[pos++] = m->components[comp_idx].id;
    data[pos++] = (dc_tbl_idx[i] << 4u) + ac_tbl_idx[i];
  }
  data[pos++] = scan.Ss;
  data[pos++] = scan.Se;
  data[pos++] = ((scan.Ah << 4u) | (scan.Al));
  WriteOutput(m, data);
}

Status CountScanSymbols(EncoderState* m, const ScanInfo& scan,
                        Histogram* histograms) {
  SymbolCounter counter(histograms);
  if (!EncodeScanData(*m, scan, &counter)) {
    return JPEGKIT_ENCODE_ERROR(
        m->error, "Coefficient out of range in scan Ss=%d Se=%d Ah=%d Al=%d.",
        scan.Ss, scan.Se, scan.Ah, scan.Al);
  }
  return true;
}

Status EncodeScan(EncoderState* m, const ScanInfo& scan,
                  const HuffmanCodeTable* const* tables) {
  BitWriter bw(m->output);
  HuffmanWriter writer(&bw, tables);
  if (!EncodeScanData(*m, scan, &writer)) {
    return JPEGKIT_ENCODE_ERROR(
        m->error, "Coefficient out of range in scan Ss=%d Se=%d Ah=%d Al=%d.",
        scan.Ss, scan.Se, scan.Ah, scan.Al);
  }
  if (!writer.healthy()) {
    return JPEGKIT_ENCODE_ERROR(m->error,
                                "Failed to encode scan, a symbol has no "
                                "Huffman code.");
  }
  return true;
}

}  // namespace jpegkit
#endif  // HWY_ONCE
