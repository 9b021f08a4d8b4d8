// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/jpegkit/decode_scan.h"

#include <stdio.h>
#include <string.h>

#include <string>

#include "lib/jpegkit/base/printf_macros.h"
#include "lib/jpegkit/bit_reader.h"

namespace jpegkit {
namespace {

enum class ScanOutcome {
  kContinue,
  // A marker was reached early, the rest of the scan is dropped.
  kAbandoned,
  kError,
};

// Decodes one 8x8 block of DCT coefficients from the bit stream.
// *eobrun is the number of following blocks of the band that are empty.
template <typename Reader>
bool DecodeDCTBlock(const HuffmanDecodingTable& dc_huff,
                    const HuffmanDecodingTable& ac_huff, int Ss, int Se,
                    int Al, bool use_lookup, int* eobrun, Reader* br,
                    int* dc_pred, coeff_t* coeffs) {
  // Nowadays multiplication is even faster than variable shift.
  int Am = 1 << Al;
  bool eobrun_allowed = Ss > 0;
  if (Ss == 0) {
    int s = br->DecodeSymbol(dc_huff, use_lookup);
    if (s < 0 || s >= kJpegDCAlphabetSize) {
      return false;
    }
    int diff;
    if (!br->ReceiveAndExtend(s, &diff)) {
      return false;
    }
    int coeff = diff + *dc_pred;
    const int dc_coeff = coeff * Am;
    coeffs[0] = dc_coeff;
    if (dc_coeff != coeffs[0]) {
      return false;
    }
    *dc_pred = coeff;
    ++Ss;
  }
  if (Ss > Se) {
    return true;
  }
  if (*eobrun > 0) {
    --(*eobrun);
    return true;
  }
  for (int k = Ss; k <= Se; k++) {
    int sr = br->DecodeSymbol(ac_huff, use_lookup);
    if (sr < 0) {
      return false;
    }
    int r = sr >> 4;
    int s = sr & 15;
    if (s > 0) {
      k += r;
      if (k > Se) {
        return false;
      }
      if (s + Al >= kJpegDCAlphabetSize) {
        return false;
      }
      int coeff;
      if (!br->ReceiveAndExtend(s, &coeff)) {
        return false;
      }
      coeffs[kJPEGNaturalOrder[k]] = coeff * Am;
    } else if (r == 15) {
      k += 15;
    } else {
      *eobrun = (1 << r) - 1;
      if (r > 0) {
        if (!eobrun_allowed) {
          return false;
        }
        int bits;
        if (!br->ReadBits(r, &bits)) {
          return false;
        }
        *eobrun += bits;
      }
      break;
    }
  }
  return true;
}

template <typename Reader>
JPEGKIT_INLINE bool RefineNonZero(Reader* br, int p1, int m1,
                                  coeff_t* coeff) {
  int bit;
  if (!br->ReadBits(1, &bit)) return false;
  if (bit && (*coeff & p1) == 0) {
    *coeff += *coeff >= 0 ? p1 : m1;
  }
  return true;
}

// Successive approximation refinement of one block (section G.1.2.3).
template <typename Reader>
bool RefineDCTBlock(const HuffmanDecodingTable& ac_huff, int Ss, int Se,
                    int Al, bool use_lookup, int* eobrun, Reader* br,
                    coeff_t* coeffs) {
  // Nowadays multiplication is even faster than variable shift.
  int Am = 1 << Al;
  bool eobrun_allowed = Ss > 0;
  if (Ss == 0) {
    int s;
    if (!br->ReadBits(1, &s)) {
      return false;
    }
    coeff_t dc_coeff = coeffs[0];
    dc_coeff |= s * Am;
    coeffs[0] = dc_coeff;
    ++Ss;
  }
  if (Ss > Se) {
    return true;
  }
  int p1 = Am;
  int m1 = -Am;
  int k = Ss;
  int r;
  int s;
  if (*eobrun <= 0) {
    for (; k <= Se; k++) {
      s = br->DecodeSymbol(ac_huff, use_lookup);
      if (s < 0) {
        return false;
      }
      r = s >> 4;
      s &= 15;
      if (s) {
        if (s != 1) {
          return false;
        }
        int sign;
        if (!br->ReadBits(1, &sign)) {
          return false;
        }
        s = sign ? p1 : m1;
      } else {
        if (r != 15) {
          // The run includes this block.
          *eobrun = 1 << r;
          if (r > 0) {
            if (!eobrun_allowed) {
              return false;
            }
            int bits;
            if (!br->ReadBits(r, &bits)) {
              return false;
            }
            *eobrun += bits;
          }
          break;
        }
      }
      do {
        coeff_t* thiscoef = &coeffs[kJPEGNaturalOrder[k]];
        if (*thiscoef != 0) {
          if (!RefineNonZero(br, p1, m1, thiscoef)) {
            return false;
          }
        } else {
          if (--r < 0) {
            break;
          }
        }
        k++;
      } while (k <= Se);
      if (s) {
        if (k > Se) {
          return false;
        }
        coeffs[kJPEGNaturalOrder[k]] = s;
      }
    }
  }
  if (*eobrun > 0) {
    // The rest of the band is in an EOB run: only the correction bits of the
    // already nonzero coefficients are coded.
    for (; k <= Se; k++) {
      coeff_t* thiscoef = &coeffs[kJPEGNaturalOrder[k]];
      if (*thiscoef != 0 && !RefineNonZero(br, p1, m1, thiscoef)) {
        return false;
      }
    }
    --(*eobrun);
  }
  return true;
}

std::string DescribeScan(const DecoderState& m) {
  const JPEGScanHeader& s = m.scan_info_;
  std::string ids;
  for (int i = 0; i < s.num_components; ++i) {
    if (i > 0) ids += ",";
    ids += std::to_string(m.components_[s.components[i].comp_idx].id);
  }
  char buf[128];
  snprintf(buf, sizeof(buf), "components=[%s] Ss=%d Se=%d Ah=%d Al=%d",
           ids.c_str(), s.Ss, s.Se, s.Ah, s.Al);
  return buf;
}

// Decides what a failed block decode means: a cancelled input or one that
// ran out is fatal, as is corrupt data that is not followed by a marker. If
// the bit reader already stopped at a real marker the scan is abandoned.
template <typename Source>
ScanOutcome HandleBlockFailure(DecoderState* m, BitReader<Source>* br,
                               size_t mcu_x, size_t mcu_y) {
  JpegError* error = &m->error_;
  if (m->source()->cancelled()) {
    JPEGKIT_ERROR(error, JpegErrorKind::kCancelled, "Decoding cancelled.");
  } else if (br->input_exhausted()) {
    JPEGKIT_ERROR(error, JpegErrorKind::kStreamTruncation,
                  "Unexpected end of input in scan %s at MCU (%" PRIuS
                  ", %" PRIuS ")",
                  DescribeScan(*m).c_str(), mcu_x, mcu_y);
  } else if (br->has_pending_marker()) {
    JPEGKIT_WARNING("Abandoning scan %s at MCU (%" PRIuS ", %" PRIuS
                    "), reached marker 0x%02x",
                    DescribeScan(*m).c_str(), mcu_x, mcu_y,
                    br->pending_marker());
    m->next_marker_ = br->pending_marker();
    return ScanOutcome::kAbandoned;
  } else {
    JPEGKIT_ERROR(error, JpegErrorKind::kScanError,
                  "Failed to decode block in scan %s at MCU (%" PRIuS
                  ", %" PRIuS ")",
                  DescribeScan(*m).c_str(), mcu_x, mcu_y);
  }
  error->SetReaderState(br->position(), br->bits_left(),
                        br->pending_marker());
  return ScanOutcome::kError;
}

template <typename Source>
ScanOutcome ProcessRestart(DecoderState* m, BitReader<Source>* br,
                           int* next_restart_marker) {
  const size_t num_skipped = br->SeekNextMarker();
  if (m->source()->cancelled()) {
    JPEGKIT_ERROR(&m->error_, JpegErrorKind::kCancelled,
                  "Decoding cancelled.");
  } else if (br->input_exhausted()) {
    JPEGKIT_ERROR(&m->error_, JpegErrorKind::kStreamTruncation,
                  "Missing restart marker in scan %s",
                  DescribeScan(*m).c_str());
  } else {
    if (num_skipped > 0) {
      JPEGKIT_WARNING("Skipped %" PRIuS " bytes before restart marker",
                      num_skipped);
    }
    const int marker = br->pending_marker();
    if (marker < kMarkerRST0 || marker > kMarkerRST7) {
      JPEGKIT_WARNING("Abandoning scan %s, found marker 0x%02x instead of a "
                      "restart marker",
                      DescribeScan(*m).c_str(), marker);
      m->next_marker_ = marker;
      return ScanOutcome::kAbandoned;
    }
    if (marker != kMarkerRST0 + *next_restart_marker) {
      JPEGKIT_WARNING("Expected restart marker %d, found %d",
                      *next_restart_marker, marker - kMarkerRST0);
    }
    *next_restart_marker = (marker - kMarkerRST0 + 1) & 7;
    br->ClearPendingMarker();
    const JPEGScanHeader& s = m->scan_info_;
    for (int i = 0; i < s.num_components; ++i) {
      m->components_[s.components[i].comp_idx].dc_pred = 0;
    }
    if (m->eobrun_ > 0) {
      JPEGKIT_WARNING("End-of-block run crosses a restart marker.");
    }
    m->eobrun_ = 0;
    return ScanOutcome::kContinue;
  }
  m->error_.SetReaderState(br->position(), br->bits_left(),
                           br->pending_marker());
  return ScanOutcome::kError;
}

// Reads past the end of the scan to the marker that follows it.
template <typename Source>
Status FinishScan(DecoderState* m, BitReader<Source>* br) {
  size_t num_skipped = br->SeekNextMarker();
  while (!br->input_exhausted() && br->pending_marker() >= kMarkerRST0 &&
         br->pending_marker() <= kMarkerRST7) {
    br->ClearPendingMarker();
    num_skipped += br->SeekNextMarker();
  }
  if (m->source()->cancelled()) {
    return JPEGKIT_ERROR(&m->error_, JpegErrorKind::kCancelled,
                         "Decoding cancelled.");
  }
  if (num_skipped > 0 && !m->scan_info_.skip) {
    JPEGKIT_WARNING("Skipped %" PRIuS " bytes of entropy coded data after "
                    "the last MCU",
                    num_skipped);
  }
  if (br->input_exhausted()) {
    JPEGKIT_WARNING("Missing EOI marker.");
    m->input_exhausted_ = true;
    m->next_marker_ = -1;
  } else {
    m->next_marker_ = br->pending_marker();
  }
  return true;
}

template <typename Source>
Status DecodeScanData(DecoderState* m, Source* source) {
  const JPEGScanHeader& s = m->scan_info_;
  m->scan_pending_ = false;
  BitReader<Source> br(source);
  JPEGKIT_DEBUG(JPEGKIT_DEBUG_SCAN, "Scan %s at offset %lld%s",
                DescribeScan(*m).c_str(),
                static_cast<long long>(source->position()),
                s.skip ? " skipped" : "");
  if (s.skip) {
    return FinishScan(m, &br);
  }
  const bool use_lookup = m->params_.use_fast_huffman;
  int restarts_to_go = m->restart_interval_;
  int next_restart_marker = 0;
  for (size_t mcu_y = 0; mcu_y < s.MCU_rows; ++mcu_y) {
    for (size_t mcu_x = 0; mcu_x < s.MCU_cols; ++mcu_x) {
      // Handle the restart intervals.
      if (m->restart_interval_ > 0 && restarts_to_go == 0) {
        ScanOutcome outcome = ProcessRestart(m, &br, &next_restart_marker);
        if (outcome == ScanOutcome::kError) return false;
        if (outcome == ScanOutcome::kAbandoned) return true;
        restarts_to_go = m->restart_interval_;
      }
      // Decode one MCU.
      for (int i = 0; i < s.num_components; ++i) {
        const JPEGComponentScanInfo& si = s.components[i];
        JPEGComponent* c = &m->components_[si.comp_idx];
        const HuffmanDecodingTable& dc_huff = m->dc_huff_[si.dc_tbl_idx];
        const HuffmanDecodingTable& ac_huff = m->ac_huff_[si.ac_tbl_idx];
        for (int iy = 0; iy < si.mcu_ysize_blocks; ++iy) {
          size_t block_y = mcu_y * si.mcu_ysize_blocks + iy;
          for (int ix = 0; ix < si.mcu_xsize_blocks; ++ix) {
            size_t block_x = mcu_x * si.mcu_xsize_blocks + ix;
            size_t block_idx = block_y * c->width_in_blocks + block_x;
            coeff_t* coeffs = &c->coeffs[block_idx * kDCTBlockSize];
            bool ok;
            if (s.Ah == 0) {
              ok = DecodeDCTBlock(dc_huff, ac_huff, s.Ss, s.Se, s.Al,
                                  use_lookup, &m->eobrun_, &br, &c->dc_pred,
                                  coeffs);
            } else {
              ok = RefineDCTBlock(ac_huff, s.Ss, s.Se, s.Al, use_lookup,
                                  &m->eobrun_, &br, coeffs);
            }
            if (!ok) {
              ScanOutcome outcome = HandleBlockFailure(m, &br, mcu_x, mcu_y);
              return outcome != ScanOutcome::kError;
            }
          }
        }
      }
      if (restarts_to_go > 0) {
        --restarts_to_go;
      }
    }
  }
  if (m->eobrun_ > 0) {
    JPEGKIT_WARNING("End-of-block run too long.");
  }
  return FinishScan(m, &br);
}

}  // namespace

Status DecodeScan(DecoderState* m) {
  if (m->memory_source_) {
    return DecodeScanData(m, m->memory_source_.get());
  }
  return DecodeScanData(m, m->stream_source_.get());
}

}  // namespace jpegkit
