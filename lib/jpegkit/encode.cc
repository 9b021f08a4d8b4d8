// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/jpegkit/encode.h"

#include <string.h>

#include <algorithm>
#include <hwy/aligned_allocator.h>
#include <utility>

#include "lib/jpegkit/base/printf_macros.h"
#include "lib/jpegkit/bitstream.h"
#include "lib/jpegkit/color_transform.h"
#include "lib/jpegkit/dct.h"
#include "lib/jpegkit/encode_internal.h"
#include "lib/jpegkit/huffman.h"
#include "lib/jpegkit/quant.h"

namespace jpegkit {
namespace {

struct ProgressiveScan {
  int Ss, Se, Ah, Al;
  bool interleaved;
};

// Samples of one component, padded to whole MCUs.
struct Plane {
  hwy::AlignedFreeUniquePtr<uint8_t[]> samples;
  size_t xsize = 0;
  size_t ysize = 0;

  uint8_t* row(size_t y) { return samples.get() + y * xsize; }
  const uint8_t* row(size_t y) const { return samples.get() + y * xsize; }
};

Status AllocatePlane(size_t xsize, size_t ysize, Plane* plane,
                     JpegError* error) {
  plane->xsize = xsize;
  plane->ysize = ysize;
  plane->samples = hwy::AllocateAligned<uint8_t>(xsize * ysize);
  if (!plane->samples) {
    return JPEGKIT_ENCODE_ERROR(error, "Could not allocate %" PRIuS "x%" PRIuS
                                " sample plane.", xsize, ysize);
  }
  return true;
}

// Replicates the last meaningful column and row into the padding.
void PadPlane(size_t xsize, size_t ysize, Plane* plane) {
  for (size_t y = 0; y < ysize; ++y) {
    uint8_t* row = plane->row(y);
    memset(row + xsize, row[xsize - 1], plane->xsize - xsize);
  }
  for (size_t y = ysize; y < plane->ysize; ++y) {
    memcpy(plane->row(y), plane->row(ysize - 1), plane->xsize);
  }
}

// 2x2 box filter with rounding, the input has even dimensions.
void Downsample2x2(const Plane& in, Plane* out) {
  for (size_t y = 0; y < out->ysize; ++y) {
    const uint8_t* row0 = in.row(2 * y);
    const uint8_t* row1 = in.row(2 * y + 1);
    uint8_t* row_out = out->row(y);
    for (size_t x = 0; x < out->xsize; ++x) {
      const int sum = row0[2 * x] + row0[2 * x + 1] + row1[2 * x] +
                      row1[2 * x + 1];
      row_out[x] = (sum + 2) >> 2;
    }
  }
}

// Returns the table slot of the i-th component of the scan. Baseline frames
// use one luminance and one shared chrominance table, the per-scan tables of
// progressive frames have one slot per scan component.
int TableSlot(const EncoderState& m, const ScanInfo& scan, int i) {
  if (!m.progressive) return scan.component_index[i] == 0 ? 0 : 1;
  return i;
}

bool CoversHistogram(const HuffmanCodeTable& table, const Histogram& histo) {
  for (int s = 0; s < kJpegHuffmanAlphabetSize; ++s) {
    if (histo.count[s] > 0 && table.depth[s] == 0) return false;
  }
  return true;
}

// Builds the Huffman codes of one scan, writes the DHT, SOS and entropy
// coded data.
Status WriteScan(EncoderState* m, const ScanInfo& scan) {
  Histogram histograms[kNumScanContexts];
  JPEGKIT_RETURN_IF_ERROR(CountScanSymbols(m, scan, histograms));

  const bool codes_dc = scan.Ss == 0 && scan.Ah == 0;
  const bool codes_ac = scan.Se > 0;
  int dc_tbl_idx[kMaxComponents] = {0};
  int ac_tbl_idx[kMaxComponents] = {0};
  // Merged statistics of the DC and AC slots.
  Histogram slot_histograms[2 * kMaxComponents];
  bool slot_used[2 * kMaxComponents] = {false};
  for (int i = 0; i < scan.num_components; ++i) {
    const int slot = TableSlot(*m, scan, i);
    if (codes_dc) dc_tbl_idx[i] = slot;
    if (codes_ac) ac_tbl_idx[i] = slot;
    for (int is_ac = 0; is_ac < 2; ++is_ac) {
      if (is_ac ? !codes_ac : !codes_dc) continue;
      const Histogram& histo = histograms[is_ac * kMaxComponents + i];
      Histogram* merged = &slot_histograms[is_ac * kMaxComponents + slot];
      for (int s = 0; s < kJpegHuffmanAlphabetSize; ++s) {
        merged->count[s] += histo.count[s];
      }
      slot_used[is_ac * kMaxComponents + slot] = true;
    }
  }

  std::vector<JpegHuffmanCode> huffman_codes;
  std::vector<HuffmanCodeTable> code_tables(2 * kMaxComponents);
  for (int idx = 0; idx < 2 * kMaxComponents; ++idx) {
    if (!slot_used[idx]) continue;
    const int slot = idx % kMaxComponents;
    const int slot_id = (idx >= kMaxComponents ? 0x10 : 0) | slot;
    JpegHuffmanCode huff;
    bool use_std = false;
    if (!m->progressive && slot < 2) {
      huff = StdHuffmanCode(slot_id);
      JPEGKIT_RETURN_IF_ERROR(BuildHuffmanCodeTable(huff, &code_tables[idx]));
      use_std = CoversHistogram(code_tables[idx], slot_histograms[idx]);
      if (!use_std) {
        JPEGKIT_DEBUG(JPEGKIT_DEBUG_ENCODER,
                      "Standard table 0x%02x does not cover the scan symbols.",
                      slot_id);
      }
    }
    if (!use_std) {
      if (slot_histograms[idx].empty()) slot_histograms[idx].Add(0);
      BuildJpegHuffmanCode(slot_histograms[idx], &huff);
      if (!BuildHuffmanCodeTable(huff, &code_tables[idx])) {
        return JPEGKIT_ENCODE_ERROR(m->error,
                                    "Failed to build Huffman code table.");
      }
    }
    huff.slot_id = slot_id;
    huffman_codes.push_back(std::move(huff));
  }

  const HuffmanCodeTable* tables[kNumScanContexts] = {nullptr};
  for (int i = 0; i < scan.num_components; ++i) {
    tables[i] = &code_tables[dc_tbl_idx[i]];
    tables[kMaxComponents + i] = &code_tables[kMaxComponents + ac_tbl_idx[i]];
  }
  EncodeDHT(m, huffman_codes.data(), huffman_codes.size());
  EncodeSOS(m, scan, dc_tbl_idx, ac_tbl_idx);
  JPEGKIT_DEBUG(JPEGKIT_DEBUG_ENCODER,
                "Scan components=%d Ss=%d Se=%d Ah=%d Al=%d at offset %" PRIuS,
                scan.num_components, scan.Ss, scan.Se, scan.Ah, scan.Al,
                m->output->size());
  return EncodeScan(m, scan, tables);
}

int BlocksInMCU(const EncoderState& m) {
  int blocks = 0;
  for (const EncoderComponent& comp : m.components) {
    blocks += comp.h_samp_factor * comp.v_samp_factor;
  }
  return blocks;
}

Status ValidateScanScript(const EncoderState& m,
                          const std::vector<ScanInfo>& scans) {
  JpegError* error = m.error;
  const int num_components = m.components.size();
  // Lowest bit position coded so far of every coefficient, -1 if none.
  int coded_al[kMaxComponents][kDCTBlockSize];
  for (int c = 0; c < num_components; ++c) {
    for (size_t k = 0; k < kDCTBlockSize; ++k) coded_al[c][k] = -1;
  }
  for (size_t n = 0; n < scans.size(); ++n) {
    const ScanInfo& scan = scans[n];
    if (scan.num_components < 1 || scan.num_components > kMaxComponents) {
      return JPEGKIT_ENCODE_ERROR(error, "Scan %" PRIuS
                                  " has %d components.", n,
                                  scan.num_components);
    }
    int blocks = 0;
    for (int i = 0; i < scan.num_components; ++i) {
      const int c = scan.component_index[i];
      if (c < 0 || c >= num_components ||
          (i > 0 && c <= scan.component_index[i - 1])) {
        return JPEGKIT_ENCODE_ERROR(error, "Invalid component index %d in "
                                    "scan %" PRIuS, c, n);
      }
      blocks += m.components[c].h_samp_factor * m.components[c].v_samp_factor;
    }
    if (scan.num_components > 1 && blocks > kMaxBlocksInMCU) {
      return JPEGKIT_ENCODE_ERROR(error, "Too many blocks in MCU of scan %"
                                  PRIuS, n);
    }
    if (scan.Ss < 0 || scan.Se > 63 || scan.Ss > scan.Se || scan.Ah < 0 ||
        scan.Al < 0 || scan.Ah > kMaxApproximationBit ||
        scan.Al > kMaxApproximationBit) {
      return JPEGKIT_ENCODE_ERROR(error, "Invalid scan %" PRIuS
                                  ": Ss=%d Se=%d Ah=%d Al=%d", n, scan.Ss,
                                  scan.Se, scan.Ah, scan.Al);
    }
    if (m.progressive) {
      if ((scan.Ss == 0 && scan.Se != 0) ||
          (scan.Ss > 0 && scan.num_components != 1) ||
          (scan.Ah != 0 && scan.Al != scan.Ah - 1)) {
        return JPEGKIT_ENCODE_ERROR(error, "Invalid progressive scan %" PRIuS
                                    ": Ss=%d Se=%d Ah=%d Al=%d", n, scan.Ss,
                                    scan.Se, scan.Ah, scan.Al);
      }
    } else if (scan.Ss != 0 || scan.Se != 63 || scan.Ah != 0 || scan.Al != 0) {
      return JPEGKIT_ENCODE_ERROR(error, "Invalid sequential scan %" PRIuS, n);
    }
    for (int i = 0; i < scan.num_components; ++i) {
      const int c = scan.component_index[i];
      if (scan.Ss > 0 && coded_al[c][0] < 0) {
        return JPEGKIT_ENCODE_ERROR(error, "AC scan %" PRIuS " before the "
                                    "DC scan of component %d", n, c);
      }
      for (int k = scan.Ss; k <= scan.Se; ++k) {
        const int expected = scan.Ah == 0 ? -1 : scan.Ah;
        if (coded_al[c][k] != expected) {
          return JPEGKIT_ENCODE_ERROR(error, "Scan %" PRIuS " does not "
                                      "continue the progression of "
                                      "coefficient %d of component %d", n, k,
                                      c);
        }
        coded_al[c][k] = scan.Al;
      }
    }
  }
  for (int c = 0; c < num_components; ++c) {
    if (coded_al[c][0] < 0) {
      return JPEGKIT_ENCODE_ERROR(error, "No scan codes the DC of component "
                                  "%d.", c);
    }
  }
  return true;
}

std::vector<ScanInfo> SequentialScans(const EncoderState& m) {
  std::vector<ScanInfo> scans;
  const int num_components = m.components.size();
  if (BlocksInMCU(m) <= kMaxBlocksInMCU) {
    ScanInfo scan;
    scan.num_components = num_components;
    for (int c = 0; c < num_components; ++c) scan.component_index[c] = c;
    scans.push_back(scan);
  } else {
    for (int c = 0; c < num_components; ++c) {
      ScanInfo scan;
      scan.num_components = 1;
      scan.component_index[0] = c;
      scans.push_back(scan);
    }
  }
  return scans;
}

// Writes the complete file of the frame described by m.
Status WriteJpeg(EncoderState* m, const EncodeParams& params,
                 const ImageMetadata& metadata) {
  if (params.restart_interval < 0 || params.restart_interval > 65535) {
    return JPEGKIT_ENCODE_ERROR(m->error, "Invalid restart interval %d",
                                params.restart_interval);
  }
  m->restart_interval = params.restart_interval;
  m->progressive = params.progressive;
  std::vector<ScanInfo> scans;
  if (!m->progressive) {
    scans = SequentialScans(*m);
  } else if (!params.scan_script.empty()) {
    scans = params.scan_script;
  } else {
    scans = DefaultScanScript(m->components.size(),
                              BlocksInMCU(*m) <= kMaxBlocksInMCU);
  }
  JPEGKIT_RETURN_IF_ERROR(ValidateScanScript(*m, scans));

  EncodeSOI(m);
  if (m->color_space == JpegColorSpace::kGray ||
      m->color_space == JpegColorSpace::kYCbCr) {
    EncodeAPP0(m);
  } else {
    EncodeAPP14(m);
  }
  if (params.write_metadata) {
    JPEGKIT_RETURN_IF_ERROR(
        EncodeMetadata(m, metadata, params.orientation_applied));
  }
  JPEGKIT_RETURN_IF_ERROR(EncodeDQT(m));
  EncodeSOF(m);
  if (m->restart_interval > 0) {
    EncodeDRI(m);
  }
  for (const ScanInfo& scan : scans) {
    JPEGKIT_RETURN_IF_ERROR(WriteScan(m, scan));
  }
  EncodeEOI(m);
  return true;
}

Status CheckDimensions(size_t xsize, size_t ysize, JpegError* error) {
  if (xsize == 0 || ysize == 0 || xsize > static_cast<size_t>(kMaxDimPixels) ||
      ysize > static_cast<size_t>(kMaxDimPixels)) {
    return JPEGKIT_ENCODE_ERROR(error, "Invalid image dimensions %" PRIuS
                                "x%" PRIuS, xsize, ysize);
  }
  return true;
}

}  // namespace

std::vector<ScanInfo> DefaultScanScript(int num_components,
                                        bool interleave_dc) {
  static const ProgressiveScan kProgression[] = {
      {0, 0, 0, 1, true},   {1, 5, 0, 2, false},  {6, 63, 0, 2, false},
      {1, 63, 2, 1, false}, {0, 0, 1, 0, true},   {1, 63, 1, 0, false},
  };
  std::vector<ScanInfo> scans;
  for (const ProgressiveScan& p : kProgression) {
    ScanInfo scan;
    scan.Ss = p.Ss;
    scan.Se = p.Se;
    scan.Ah = p.Ah;
    scan.Al = p.Al;
    if (p.interleaved && interleave_dc) {
      scan.num_components = num_components;
      for (int c = 0; c < num_components; ++c) scan.component_index[c] = c;
      scans.push_back(scan);
    } else {
      scan.num_components = 1;
      for (int c = 0; c < num_components; ++c) {
        scan.component_index[0] = c;
        scans.push_back(scan);
      }
    }
  }
  return scans;
}

Status EncodeJpeg(const PackedImage& image, const EncodeParams& params,
                  std::vector<uint8_t>* out, JpegError* error) {
  JpegError local_error;
  if (!error) error = &local_error;
  error->Clear();
  const size_t xsize = image.xsize;
  const size_t ysize = image.ysize;
  JPEGKIT_RETURN_IF_ERROR(CheckDimensions(xsize, ysize, error));
  if (image.num_channels != 1 && image.num_channels != 3 &&
      image.num_channels != 4) {
    return JPEGKIT_ENCODE_ERROR(error, "Unsupported number of channels %" PRIuS,
                                image.num_channels);
  }
  if (image.pixels.size() != image.stride() * ysize) {
    return JPEGKIT_ENCODE_ERROR(error, "Pixel buffer has %" PRIuS
                                " bytes, expected %" PRIuS,
                                image.pixels.size(), image.stride() * ysize);
  }
  if (params.quality < 1 || params.quality > 100) {
    return JPEGKIT_ENCODE_ERROR(error, "Quality %d is outside [1, 100]",
                                params.quality);
  }

  std::vector<uint8_t> output;
  EncoderState m;
  m.error = error;
  m.output = &output;
  m.xsize = xsize;
  m.ysize = ysize;
  const int num_components = image.num_channels == 1 ? 1 : 3;
  const bool subsample = num_components == 3 && params.chroma_subsampling;
  m.color_space = num_components == 1 ? JpegColorSpace::kGray
                                      : JpegColorSpace::kYCbCr;
  m.max_h_samp = m.max_v_samp = subsample ? 2 : 1;
  const size_t iMCU_cols = DivCeil(xsize, kBlockDim * m.max_h_samp);
  const size_t iMCU_rows = DivCeil(ysize, kBlockDim * m.max_v_samp);
  m.components.resize(num_components);
  for (int c = 0; c < num_components; ++c) {
    EncoderComponent* comp = &m.components[c];
    comp->id = c + 1;
    comp->h_samp_factor = comp->v_samp_factor = (c == 0 && subsample) ? 2 : 1;
    comp->quant_idx = c == 0 ? 0 : 1;
    comp->width_in_blocks = iMCU_cols * comp->h_samp_factor;
    comp->height_in_blocks = iMCU_rows * comp->v_samp_factor;
  }
  m.num_quant_tables = num_components == 1 ? 1 : 2;
  ScaleQuantTable(kStdLumaQuantTable, params.quality, m.quant[0]);
  if (num_components > 1) {
    ScaleQuantTable(kStdChromaQuantTable, params.quality, m.quant[1]);
  }

  // Full resolution planes of the MCU padded image.
  const size_t padded_xsize = iMCU_cols * kBlockDim * m.max_h_samp;
  const size_t padded_ysize = iMCU_rows * kBlockDim * m.max_v_samp;
  std::vector<Plane> planes(num_components);
  for (int c = 0; c < num_components; ++c) {
    JPEGKIT_RETURN_IF_ERROR(
        AllocatePlane(padded_xsize, padded_ysize, &planes[c], error));
  }
  for (size_t y = 0; y < ysize; ++y) {
    const uint8_t* in = image.row(y);
    if (num_components == 1) {
      memcpy(planes[0].row(y), in, xsize);
      continue;
    }
    uint8_t* row0 = planes[0].row(y);
    uint8_t* row1 = planes[1].row(y);
    uint8_t* row2 = planes[2].row(y);
    for (size_t x = 0; x < xsize; ++x) {
      const uint8_t* px = in + x * image.num_channels;
      row0[x] = px[0];
      row1[x] = px[1];
      row2[x] = px[2];
    }
    RGBToYCbCr(row0, row1, row2, xsize);
  }
  for (int c = 0; c < num_components; ++c) {
    PadPlane(xsize, ysize, &planes[c]);
  }
  if (subsample) {
    for (int c = 1; c < 3; ++c) {
      Plane chroma;
      JPEGKIT_RETURN_IF_ERROR(AllocatePlane(padded_xsize / 2, padded_ysize / 2,
                                            &chroma, error));
      Downsample2x2(planes[c], &chroma);
      planes[c] = std::move(chroma);
    }
  }

  // Forward DCT and quantization.
  QuantDivisors divisors[2];
  for (int i = 0; i < m.num_quant_tables; ++i) {
    ComputeQuantDivisors(m.quant[i], &divisors[i]);
  }
  std::vector<hwy::AlignedFreeUniquePtr<coeff_t[]>> coeffs(num_components);
  int32_t dct[kDCTBlockSize];
  for (int c = 0; c < num_components; ++c) {
    EncoderComponent* comp = &m.components[c];
    const size_t num_blocks = comp->width_in_blocks * comp->height_in_blocks;
    coeffs[c] = hwy::AllocateAligned<coeff_t>(num_blocks * kDCTBlockSize);
    if (!coeffs[c]) {
      return JPEGKIT_ENCODE_ERROR(error, "Could not allocate coefficients.");
    }
    const Plane& plane = planes[c];
    const QuantDivisors& q = divisors[comp->quant_idx];
    for (size_t by = 0; by < comp->height_in_blocks; ++by) {
      const uint8_t* row = plane.row(by * kBlockDim);
      for (size_t bx = 0; bx < comp->width_in_blocks; ++bx) {
        if (params.fdct == DctMethod::kFloat) {
          ForwardDCTBlockFloat(row + bx * kBlockDim, plane.xsize, dct);
        } else {
          ForwardDCTBlockInteger(row + bx * kBlockDim, plane.xsize, dct);
        }
        QuantizeBlock(
            dct, q,
            &coeffs[c][(by * comp->width_in_blocks + bx) * kDCTBlockSize]);
      }
    }
    comp->coeffs = coeffs[c].get();
  }

  JPEGKIT_RETURN_IF_ERROR(WriteJpeg(&m, params, image.metadata));
  out->swap(output);
  return true;
}

Status EncodeJpegCoefficients(const JpegCoefficients& coefficients,
                              const EncodeParams& params,
                              std::vector<uint8_t>* out, JpegError* error) {
  JpegError local_error;
  if (!error) error = &local_error;
  error->Clear();
  JPEGKIT_RETURN_IF_ERROR(
      CheckDimensions(coefficients.xsize, coefficients.ysize, error));
  const size_t num_components = coefficients.components.size();
  if (num_components != 1 && num_components != 3 && num_components != 4) {
    return JPEGKIT_ENCODE_ERROR(error, "Unsupported number of components %"
                                PRIuS, num_components);
  }

  std::vector<uint8_t> output;
  EncoderState m;
  m.error = error;
  m.output = &output;
  m.xsize = coefficients.xsize;
  m.ysize = coefficients.ysize;
  m.color_space = coefficients.color_space;
  if (m.color_space == JpegColorSpace::kUnknown) {
    m.color_space = num_components == 1   ? JpegColorSpace::kGray
                    : num_components == 3 ? JpegColorSpace::kYCbCr
                                          : JpegColorSpace::kCMYK;
  }
  bool seen_id[256] = {false};
  for (const JpegCoefficients::Component& c : coefficients.components) {
    if (c.id < 0 || c.id > 255 || seen_id[c.id]) {
      return JPEGKIT_ENCODE_ERROR(error, "Invalid component id %d", c.id);
    }
    seen_id[c.id] = true;
    if (c.h_samp_factor < 1 || c.h_samp_factor > kMaxSamplingFactor ||
        c.v_samp_factor < 1 || c.v_samp_factor > kMaxSamplingFactor) {
      return JPEGKIT_ENCODE_ERROR(error, "Invalid sampling factors %dx%d",
                                  c.h_samp_factor, c.v_samp_factor);
    }
    m.max_h_samp = std::max(m.max_h_samp, c.h_samp_factor);
    m.max_v_samp = std::max(m.max_v_samp, c.v_samp_factor);
  }
  m.components.resize(num_components);
  for (size_t i = 0; i < num_components; ++i) {
    const JpegCoefficients::Component& c = coefficients.components[i];
    EncoderComponent* comp = &m.components[i];
    comp->id = c.id;
    comp->h_samp_factor = c.h_samp_factor;
    comp->v_samp_factor = c.v_samp_factor;
    comp->width_in_blocks = c.width_in_blocks;
    comp->height_in_blocks = c.height_in_blocks;
    const size_t min_width = DivCeil(
        DivCeil(m.xsize * c.h_samp_factor, m.max_h_samp), kBlockDim);
    const size_t min_height = DivCeil(
        DivCeil(m.ysize * c.v_samp_factor, m.max_v_samp), kBlockDim);
    if (c.width_in_blocks < min_width || c.height_in_blocks < min_height ||
        c.coeffs.size() !=
            c.width_in_blocks * c.height_in_blocks * kDCTBlockSize) {
      return JPEGKIT_ENCODE_ERROR(error, "Coefficient buffer of component %d "
                                  "does not match the image size.", c.id);
    }
    comp->coeffs = c.coeffs.data();
    if (c.quant.size() != kDCTBlockSize) {
      return JPEGKIT_ENCODE_ERROR(error, "Missing quantization table of "
                                  "component %d", c.id);
    }
    int quant_idx = 0;
    while (quant_idx < m.num_quant_tables &&
           !std::equal(c.quant.begin(), c.quant.end(), m.quant[quant_idx])) {
      ++quant_idx;
    }
    if (quant_idx == m.num_quant_tables) {
      if (m.num_quant_tables == kMaxQuantTables) {
        return JPEGKIT_ENCODE_ERROR(error, "Too many quantization tables.");
      }
      std::copy(c.quant.begin(), c.quant.end(), m.quant[quant_idx]);
      ++m.num_quant_tables;
    }
    comp->quant_idx = quant_idx;
  }

  JPEGKIT_RETURN_IF_ERROR(WriteJpeg(&m, params, coefficients.metadata));
  out->swap(output);
  return true;
}

}  // namespace jpegkit
