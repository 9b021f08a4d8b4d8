// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/jpegkit/decode_marker.h"

#include <string.h>

#include <algorithm>
#include <vector>

#include "lib/jpegkit/base/printf_macros.h"
#include "lib/jpegkit/huffman.h"

namespace jpegkit {
namespace {

// Upper bound of the coefficient memory of one frame.
constexpr uint64_t kMaxCoefficientBytes = 1ull << 31;
// Limit of T.81 B.2.3 on the number of blocks in an interleaved MCU.
constexpr int kMaxBlocksInMCU = 10;

// The checks below expect the segment payload in data[0, len) and the read
// position in pos.

#define HEADER_ERROR(format, ...) \
  JPEGKIT_HEADER_ERROR(&m->error_, format, ##__VA_ARGS__)

#define JPEGKIT_NEED_BYTES(n)                                              \
  if (pos + static_cast<size_t>(n) > len) {                                \
    return HEADER_ERROR("Marker segment truncated, %d bytes needed at "    \
                        "offset %" PRIuS " of %" PRIuS,                    \
                        static_cast<int>(n), pos, len);                    \
  }

#define JPEGKIT_CHECK_RANGE(var, low, high)                                \
  if ((var) < (low) || (var) > (high)) {                                   \
    return HEADER_ERROR(#var " out of range: %d", static_cast<int>(var));  \
  }

#define JPEGKIT_CHECK_SEGMENT_END()                                        \
  if (pos != len) {                                                        \
    return HEADER_ERROR("Marker segment length %" PRIuS " but %" PRIuS     \
                        " bytes parsed",                                   \
                        len, pos);                                         \
  }

inline int ReadUint8(const uint8_t* data, size_t* pos) {
  return data[(*pos)++];
}

inline int ReadUint16(const uint8_t* data, size_t* pos) {
  int v = (data[*pos] << 8) + data[*pos + 1];
  *pos += 2;
  return v;
}

bool IsUnsupportedSOF(int marker) {
  switch (marker) {
    case 0xC1:
    case 0xC3:
    case 0xC5:
    case 0xC6:
    case 0xC7:
    case 0xC9:
    case 0xCA:
    case 0xCB:
    case 0xCD:
    case 0xCE:
    case 0xCF:
      return true;
    default:
      return false;
  }
}

// Reads the length field and the payload of a marker segment. Returns false
// at the end of the input.
bool ReadSegment(InputSource* in, std::vector<uint8_t>* segment) {
  uint8_t len_bytes[2];
  if (in->Read(len_bytes, 2) != 2) return false;
  const size_t marker_len = (len_bytes[0] << 8) + len_bytes[1];
  if (marker_len < 2) return false;
  segment->resize(marker_len - 2);
  if (segment->empty()) return true;
  return in->Read(segment->data(), segment->size()) == segment->size();
}

Status ProcessSOF(DecoderState* m, int marker, const uint8_t* data,
                  size_t len) {
  if (m->found_sof_) {
    return HEADER_ERROR("Duplicate SOF marker.");
  }
  m->found_sof_ = true;
  m->is_progressive_ = (marker == kMarkerSOF2);
  size_t pos = 0;
  JPEGKIT_NEED_BYTES(6);
  int precision = ReadUint8(data, &pos);
  int image_height = ReadUint16(data, &pos);
  int image_width = ReadUint16(data, &pos);
  int num_components = ReadUint8(data, &pos);
  JPEGKIT_CHECK_RANGE(precision, kJpegPrecision, kJpegPrecision);
  JPEGKIT_CHECK_RANGE(image_height, 1, kMaxDimPixels);
  JPEGKIT_CHECK_RANGE(image_width, 1, kMaxDimPixels);
  JPEGKIT_CHECK_RANGE(num_components, 1, kMaxComponents);
  JPEGKIT_NEED_BYTES(3 * num_components);
  m->xsize_ = image_width;
  m->ysize_ = image_height;
  m->components_.resize(num_components);

  // Read sampling factors and quant table index for each component.
  m->max_h_samp_ = 1;
  m->max_v_samp_ = 1;
  for (size_t i = 0; i < m->components_.size(); ++i) {
    JPEGComponent* c = &m->components_[i];
    const int id = ReadUint8(data, &pos);
    if (m->comp_index_by_id_[id] >= 0) {  // (cf. section B.2.2, syntax of Ci)
      return HEADER_ERROR("Duplicate ID %d in SOF.", id);
    }
    m->comp_index_by_id_[id] = static_cast<int16_t>(i);
    c->id = id;
    int factor = ReadUint8(data, &pos);
    int h_samp_factor = factor >> 4;
    int v_samp_factor = factor & 0xf;
    JPEGKIT_CHECK_RANGE(h_samp_factor, 1, kMaxSamplingFactor);
    JPEGKIT_CHECK_RANGE(v_samp_factor, 1, kMaxSamplingFactor);
    c->h_samp_factor = h_samp_factor;
    c->v_samp_factor = v_samp_factor;
    m->max_h_samp_ = std::max(m->max_h_samp_, h_samp_factor);
    m->max_v_samp_ = std::max(m->max_v_samp_, v_samp_factor);
    int quant_tbl_idx = ReadUint8(data, &pos);
    JPEGKIT_CHECK_RANGE(quant_tbl_idx, 0, kMaxQuantTables - 1);
    c->quant_idx = quant_tbl_idx;
  }
  JPEGKIT_CHECK_SEGMENT_END();

  // Sampling ratios that do not divide the maximum are accepted, such
  // components are upsampled by index mapping.
  m->iMCU_rows_ = DivCeil(m->ysize_, m->max_v_samp_ * kBlockDim);
  m->iMCU_cols_ = DivCeil(m->xsize_, m->max_h_samp_ * kBlockDim);
  uint64_t total_bytes = 0;
  for (size_t i = 0; i < m->components_.size(); ++i) {
    JPEGComponent* c = &m->components_[i];
    c->width_in_blocks = m->iMCU_cols_ * c->h_samp_factor;
    c->height_in_blocks = m->iMCU_rows_ * c->v_samp_factor;
    total_bytes += static_cast<uint64_t>(c->width_in_blocks) *
                   c->height_in_blocks * kDCTBlockSize * sizeof(coeff_t);
  }
  if (total_bytes > kMaxCoefficientBytes) {
    return HEADER_ERROR("Image too large: %" PRIuS "x%" PRIuS, m->xsize_,
                      m->ysize_);
  }
  for (size_t i = 0; i < m->components_.size(); ++i) {
    JPEGComponent* c = &m->components_[i];
    const size_t num_coeffs =
        c->width_in_blocks * c->height_in_blocks * kDCTBlockSize;
    c->coeffs = hwy::AllocateAligned<coeff_t>(num_coeffs);
    if (!c->coeffs) {
      return HEADER_ERROR("Could not allocate %" PRIuS " coefficients.",
                        num_coeffs);
    }
    memset(c->coeffs.get(), 0, num_coeffs * sizeof(coeff_t));
  }
  memset(m->scan_progression_, 0, sizeof(m->scan_progression_));
  JPEGKIT_DEBUG(JPEGKIT_DEBUG_MARKERS,
                "SOF%d %" PRIuS "x%" PRIuS " components=%d max_samp=%dx%d",
                marker - kMarkerSOF0, m->xsize_, m->ysize_, num_components,
                m->max_h_samp_, m->max_v_samp_);
  return true;
}

bool HuffmanTablesDefined(const DecoderState& m) {
  const JPEGScanHeader& s = m.scan_info_;
  for (int i = 0; i < s.num_components; ++i) {
    if (s.Ss == 0 && s.Ah == 0 &&
        !m.dc_huff_[s.components[i].dc_tbl_idx].defined) {
      return false;
    }
    if (s.Se > 0 && !m.ac_huff_[s.components[i].ac_tbl_idx].defined) {
      return false;
    }
  }
  return true;
}

// Reads forward over entropy coded data up to the first marker that is not a
// restart marker, and returns its code or -1 at the end of the input.
int SkipEntropyCodedData(InputSource* in) {
  for (;;) {
    int c = in->ReadByte();
    if (c < 0) return -1;
    if (c != 0xFF) continue;
    do {
      c = in->ReadByte();
    } while (c == 0xFF);
    if (c < 0) return -1;
    if (c == 0 || (c >= kMarkerRST0 && c <= kMarkerRST7)) continue;
    return c;
  }
}

Status ProcessDHT(DecoderState* m, const uint8_t* data, size_t len);

// Walks the segments before the current scan once more and applies every DHT
// segment found there. Returns false if the input could not be rewound.
Status RescanHuffmanTables(DecoderState* m) {
  InputSource* in = m->source();
  if (!in->seekable()) return false;
  const int64_t saved_pos = in->position();
  if (!in->Seek(m->input_start_pos_ + 2)) return false;
  std::vector<uint8_t> segment;
  int marker = -1;
  size_t num_tables = 0;
  while (in->position() < m->scan_start_pos_) {
    if (marker < 0) {
      int c;
      do {
        c = in->ReadByte();
      } while (c >= 0 && c != 0xFF);
      do {
        c = in->ReadByte();
      } while (c == 0xFF);
      if (c < 0) break;
      if (c == 0) continue;
      marker = c;
    }
    const int current = marker;
    marker = -1;
    if (current == kMarkerSOI || current == kMarkerEOI || current == 0x01 ||
        (current >= kMarkerRST0 && current <= kMarkerRST7)) {
      continue;
    }
    if (!ReadSegment(in, &segment)) break;
    if (current == kMarkerDHT) {
      JPEGKIT_RETURN_IF_ERROR(ProcessDHT(m, segment.data(), segment.size()));
      ++num_tables;
    } else if (current == kMarkerSOS && in->position() < m->scan_start_pos_) {
      marker = SkipEntropyCodedData(in);
    }
  }
  JPEGKIT_DEBUG_V(1, "Huffman table rescan found %" PRIuS " DHT segments",
                  num_tables);
  if (!in->Seek(saved_pos)) {
    return HEADER_ERROR("Could not rewind the input after a table rescan.");
  }
  return true;
}

Status ProcessSOS(DecoderState* m, const uint8_t* data, size_t len) {
  if (!m->found_sof_) {
    return HEADER_ERROR("Unexpected SOS marker.");
  }
  m->found_sos_ = true;
  JPEGScanHeader* s = &m->scan_info_;
  size_t pos = 0;
  JPEGKIT_NEED_BYTES(1);
  int comps_in_scan = ReadUint8(data, &pos);
  JPEGKIT_CHECK_RANGE(comps_in_scan, 1,
                    static_cast<int>(m->components_.size()));

  s->num_components = comps_in_scan;
  JPEGKIT_NEED_BYTES(2 * comps_in_scan);
  bool is_interleaved = (s->num_components > 1);
  bool ids_seen[256] = {false};
  for (int i = 0; i < s->num_components; ++i) {
    JPEGComponentScanInfo* si = &s->components[i];
    int id = ReadUint8(data, &pos);
    if (ids_seen[id]) {  // (cf. section B.2.3, regarding CSj)
      return HEADER_ERROR("Duplicate ID %d in SOS.", id);
    }
    ids_seen[id] = true;
    if (m->comp_index_by_id_[id] < 0) {
      return HEADER_ERROR("SOS marker: Could not find component with id %d",
                        id);
    }
    si->comp_idx = m->comp_index_by_id_[id];
    const JPEGComponent& comp = m->components_[si->comp_idx];
    int c = ReadUint8(data, &pos);
    si->dc_tbl_idx = c >> 4;
    si->ac_tbl_idx = c & 0xf;
    JPEGKIT_CHECK_RANGE(si->dc_tbl_idx, 0, kMaxHuffmanTables - 1);
    JPEGKIT_CHECK_RANGE(si->ac_tbl_idx, 0, kMaxHuffmanTables - 1);
    si->mcu_xsize_blocks = is_interleaved ? comp.h_samp_factor : 1;
    si->mcu_ysize_blocks = is_interleaved ? comp.v_samp_factor : 1;
  }
  JPEGKIT_NEED_BYTES(3);
  s->Ss = ReadUint8(data, &pos);
  s->Se = ReadUint8(data, &pos);
  int c = ReadUint8(data, &pos);
  s->Ah = c >> 4;
  s->Al = c & 0xf;
  JPEGKIT_CHECK_SEGMENT_END();

  if (!m->is_progressive_) {
    if (s->Ss != 0 || s->Se != 63 || s->Ah != 0 || s->Al != 0) {
      return HEADER_ERROR("Invalid baseline SOS parameters: Ss=%d Se=%d Ah=%d "
                        "Al=%d",
                        s->Ss, s->Se, s->Ah, s->Al);
    }
  } else {
    if (s->Se > 63 || s->Ss > s->Se || s->Ah > kMaxApproximationBit ||
        s->Al > kMaxApproximationBit) {
      return HEADER_ERROR("Invalid progressive SOS parameters: Ss=%d Se=%d "
                        "Ah=%d Al=%d",
                        s->Ss, s->Se, s->Ah, s->Al);
    }
    // section G.1.1.1.1: DC and AC coefficients are never mixed and AC
    // scans code a single component.
    if (s->Ss == 0 && s->Se != 0) {
      return HEADER_ERROR("Invalid progressive SOS parameters: Ss=0 Se=%d",
                        s->Se);
    }
    if (s->Ss > 0 && is_interleaved) {
      return HEADER_ERROR("Interleaved AC scan with %d components.",
                        s->num_components);
    }
  }
  if (s->Ah != 0 && s->Al != s->Ah - 1) {
    // section G.1.1.1.2 : Successive approximation control only improves
    // by one bit at a time.
    return HEADER_ERROR("Invalid progressive parameters: Al=%d Ah=%d", s->Al,
                      s->Ah);
  }
  const uint16_t scan_bitmask =
      s->Ah == 0 ? (0xffff << s->Al) : (1u << s->Al);
  const uint16_t refinement_bitmask = (1 << s->Al) - 1;
  for (int i = 0; i < s->num_components; ++i) {
    int comp_idx = s->components[i].comp_idx;
    for (int k = s->Ss; k <= s->Se; ++k) {
      if (m->scan_progression_[comp_idx][k] & scan_bitmask) {
        return HEADER_ERROR(
            "Overlapping scans: component=%d k=%d prev_mask: %u cur_mask %u",
            comp_idx, k, m->scan_progression_[comp_idx][k], scan_bitmask);
      }
      if (m->scan_progression_[comp_idx][k] & refinement_bitmask) {
        return HEADER_ERROR(
            "Invalid scan order, a more refined scan was already done: "
            "component=%d k=%d prev_mask=%u cur_mask=%u",
            comp_idx, k, m->scan_progression_[comp_idx][k], scan_bitmask);
      }
      m->scan_progression_[comp_idx][k] |= scan_bitmask;
    }
  }

  // The quantization table of a component is fixed by its first scan.
  for (int i = 0; i < s->num_components; ++i) {
    JPEGComponent* comp = &m->components_[s->components[i].comp_idx];
    if (comp->quant_latched) continue;
    const JPEGQuantTable& q = m->quant_[comp->quant_idx];
    if (!q.defined) {
      return HEADER_ERROR("Quantization table with index %d not found",
                        comp->quant_idx);
    }
    memcpy(comp->quant, q.values, sizeof(comp->quant));
    comp->quant_latched = true;
  }

  s->skip = false;
  if (!HuffmanTablesDefined(*m)) {
    if (m->num_huffman_rescans_ == 0) {
      ++m->num_huffman_rescans_;
      JPEGKIT_WARNING("Scan references an undefined Huffman table, "
                      "rescanning the preceding segments.");
      if (!RescanHuffmanTables(m) && !m->error_.ok()) return false;
    }
    if (!HuffmanTablesDefined(*m)) {
      JPEGKIT_WARNING("Skipping scan with undefined Huffman table: Ss=%d "
                      "Se=%d Ah=%d Al=%d",
                      s->Ss, s->Se, s->Ah, s->Al);
      s->skip = true;
      ++m->num_skipped_scans_;
    }
  }

  s->MCU_rows = m->iMCU_rows_;
  s->MCU_cols = m->iMCU_cols_;
  if (!is_interleaved) {
    const JPEGComponent& comp = m->components_[s->components[0].comp_idx];
    s->MCU_cols = DivCeil(m->xsize_ * comp.h_samp_factor,
                          m->max_h_samp_ * kBlockDim);
    s->MCU_rows = DivCeil(m->ysize_ * comp.v_samp_factor,
                          m->max_v_samp_ * kBlockDim);
  }
  int mcu_size = 0;
  for (int i = 0; i < s->num_components; ++i) {
    const JPEGComponentScanInfo& si = s->components[i];
    mcu_size += si.mcu_xsize_blocks * si.mcu_ysize_blocks;
    JPEGComponent* comp = &m->components_[si.comp_idx];
    comp->dc_pred = 0;
    comp->has_scan_data = true;
  }
  if (mcu_size > kMaxBlocksInMCU) {
    return HEADER_ERROR("Too many blocks in MCU: %d", mcu_size);
  }
  m->eobrun_ = 0;
  m->scan_pending_ = true;
  JPEGKIT_DEBUG(JPEGKIT_DEBUG_MARKERS,
                "SOS components=%d Ss=%d Se=%d Ah=%d Al=%d MCUs=%" PRIuS
                "x%" PRIuS "%s",
                s->num_components, s->Ss, s->Se, s->Ah, s->Al, s->MCU_cols,
                s->MCU_rows, s->skip ? " (skipped)" : "");
  return true;
}

// Reads the Define Huffman Table (DHT) marker segment and builds the Huffman
// decoding table in either dc_huff_ or ac_huff_, depending on the class and
// slot id of the code being read.
Status ProcessDHT(DecoderState* m, const uint8_t* data, size_t len) {
  size_t pos = 0;
  if (pos == len) {
    return HEADER_ERROR("DHT marker: no Huffman table found");
  }
  while (pos < len) {
    JPEGKIT_NEED_BYTES(1 + kJpegHuffmanMaxBitLength);
    JpegHuffmanCode huff;
    huff.slot_id = ReadUint8(data, &pos);
    int huffman_index = huff.slot_id & 0xf;
    int table_class = huff.slot_id >> 4;
    JPEGKIT_CHECK_RANGE(table_class, 0, 1);
    JPEGKIT_CHECK_RANGE(huffman_index, 0, kMaxHuffmanTables - 1);
    const bool is_ac_table = (table_class == 1);
    int total_count = 0;
    for (size_t i = 1; i <= kJpegHuffmanMaxBitLength; ++i) {
      huff.counts[i] = ReadUint8(data, &pos);
      total_count += huff.counts[i];
    }
    if (is_ac_table) {
      JPEGKIT_CHECK_RANGE(total_count, 1, kJpegHuffmanAlphabetSize);
    } else {
      JPEGKIT_CHECK_RANGE(total_count, 1, kJpegDCAlphabetSize);
    }
    JPEGKIT_NEED_BYTES(total_count);
    bool values_seen[kJpegHuffmanAlphabetSize] = {false};
    huff.values.resize(total_count);
    for (int i = 0; i < total_count; ++i) {
      int value = ReadUint8(data, &pos);
      if (!is_ac_table) {
        JPEGKIT_CHECK_RANGE(value, 0, kJpegDCAlphabetSize - 1);
      }
      if (values_seen[value]) {
        return HEADER_ERROR("Duplicate Huffman code value %d", value);
      }
      values_seen[value] = true;
      huff.values[i] = value;
    }
    HuffmanDecodingTable* table = is_ac_table ? &m->ac_huff_[huffman_index]
                                              : &m->dc_huff_[huffman_index];
    if (!BuildHuffmanDecodingTable(huff, table)) {
      return HEADER_ERROR("Invalid Huffman code lengths.");
    }
    JPEGKIT_DEBUG(JPEGKIT_DEBUG_MARKERS, "DHT slot 0x%02x symbols=%d",
                  huff.slot_id, total_count);
  }
  JPEGKIT_CHECK_SEGMENT_END();
  return true;
}

// A table id may be redefined, the new values replace the old ones in place.
Status ProcessDQT(DecoderState* m, const uint8_t* data, size_t len) {
  size_t pos = 0;
  if (pos == len) {
    return HEADER_ERROR("DQT marker: no quantization table found");
  }
  while (pos < len) {
    JPEGKIT_NEED_BYTES(1);
    int quant_table_index = ReadUint8(data, &pos);
    int precision = quant_table_index >> 4;
    JPEGKIT_CHECK_RANGE(precision, 0, 1);
    quant_table_index &= 0xf;
    JPEGKIT_CHECK_RANGE(quant_table_index, 0, kMaxQuantTables - 1);
    JPEGKIT_NEED_BYTES((precision + 1) * kDCTBlockSize);
    JPEGQuantTable* table = &m->quant_[quant_table_index];
    for (size_t i = 0; i < kDCTBlockSize; ++i) {
      int quant_val =
          precision ? ReadUint16(data, &pos) : ReadUint8(data, &pos);
      JPEGKIT_CHECK_RANGE(quant_val, 1, 65535);
      table->values[kJPEGNaturalOrder[i]] = quant_val;
    }
    table->defined = true;
  }
  JPEGKIT_CHECK_SEGMENT_END();
  return true;
}

Status ProcessDRI(DecoderState* m, const uint8_t* data, size_t len) {
  m->found_dri_ = true;
  size_t pos = 0;
  JPEGKIT_NEED_BYTES(2);
  m->restart_interval_ = ReadUint16(data, &pos);
  JPEGKIT_CHECK_SEGMENT_END();
  return true;
}

Status ProcessAPP(DecoderState* m, int marker, const uint8_t* payload,
                  size_t payload_size) {
  ImageMetadata* meta = &m->metadata_;
  if (marker == kMarkerAPP0) {
    if (payload_size >= sizeof(kJfifTag) &&
        memcmp(payload, kJfifTag, sizeof(kJfifTag)) == 0) {
      meta->has_jfif = true;
    }
  } else if (marker == kMarkerAPP1) {
    if (payload_size >= sizeof(kExifTag) &&
        memcmp(payload, kExifTag, sizeof(kExifTag)) == 0) {
      if (!meta->exif.empty()) {
        JPEGKIT_WARNING("Ignoring additional EXIF segment.");
        return true;
      }
      meta->exif.assign(payload + sizeof(kExifTag), payload + payload_size);
      int orientation;
      if (ParseExifOrientation(meta->exif, &orientation)) {
        meta->orientation = orientation;
      }
    }
  } else if (marker == kMarkerAPP2) {
    if (payload_size >= sizeof(kIccProfileTag) &&
        memcmp(payload, kIccProfileTag, sizeof(kIccProfileTag)) == 0) {
      payload += sizeof(kIccProfileTag);
      payload_size -= sizeof(kIccProfileTag);
      if (payload_size < 2) {
        return HEADER_ERROR("ICC chunk is too small.");
      }
      uint8_t index = payload[0];
      uint8_t total = payload[1];
      ++m->icc_index_;
      if (m->icc_index_ != index) {
        return HEADER_ERROR("Invalid ICC chunk order.");
      }
      if (total == 0) {
        return HEADER_ERROR("Invalid ICC chunk total.");
      }
      if (m->icc_total_ == 0) {
        m->icc_total_ = total;
      } else if (m->icc_total_ != total) {
        return HEADER_ERROR("Invalid ICC chunk total.");
      }
      if (m->icc_index_ > m->icc_total_) {
        return HEADER_ERROR("Invalid ICC chunk index.");
      }
      meta->icc.insert(meta->icc.end(), payload + 2, payload + payload_size);
    }
  } else if (marker == kMarkerAPP14) {
    if (payload_size >= 12 &&
        memcmp(payload, kAdobeTag, sizeof(kAdobeTag)) == 0) {
      meta->has_adobe = true;
      meta->adobe_transform = payload[11];
    }
  }
  return true;
}

Status DispatchMarker(DecoderState* m, int marker, int64_t marker_pos) {
  if (marker >= kMarkerRST0 && marker <= kMarkerRST7) {
    return HEADER_ERROR(
        "Unexpected restart marker 0x%02x outside entropy-coded data.",
        marker);
  }
  if (marker == kMarkerSOI) {
    return HEADER_ERROR("Duplicate SOI marker.");
  }
  if (marker == kMarkerEOI) {
    m->found_eoi_ = true;
    return true;
  }
  if (marker == 0x01) {
    // TEM has no segment.
    return true;
  }
  if (IsUnsupportedSOF(marker)) {
    return HEADER_ERROR("Unsupported SOF marker 0x%02x.", marker);
  }
  if (marker == 0xCC) {
    return HEADER_ERROR("Arithmetic coding is not supported.");
  }
  InputSource* in = m->source();
  if (!ReadSegment(in, &m->segment_)) {
    if (in->cancelled()) {
      return JPEGKIT_ERROR(&m->error_, JpegErrorKind::kCancelled,
                           "Decoding cancelled.");
    }
    return HEADER_ERROR("Unexpected end of input in marker 0x%02x.", marker);
  }
  const uint8_t* data = m->segment_.data();
  const size_t len = m->segment_.size();
  JPEGKIT_DEBUG(JPEGKIT_DEBUG_MARKERS,
                "Marker 0x%02x at %lld, segment length %" PRIuS, marker,
                static_cast<long long>(marker_pos), len);
  if (marker == kMarkerSOF0 || marker == kMarkerSOF2) {
    return ProcessSOF(m, marker, data, len);
  } else if (marker == kMarkerDHT) {
    return ProcessDHT(m, data, len);
  } else if (marker == kMarkerSOS) {
    m->scan_start_pos_ = marker_pos;
    return ProcessSOS(m, data, len);
  } else if (marker == kMarkerDQT) {
    return ProcessDQT(m, data, len);
  } else if (marker == kMarkerDRI) {
    return ProcessDRI(m, data, len);
  } else if (marker >= kMarkerAPP0 && marker <= kMarkerAPP15) {
    return ProcessAPP(m, marker, data, len);
  } else if (marker == kMarkerCOM) {
    // Nothing to do.
    return true;
  }
  JPEGKIT_WARNING("Skipping unknown marker 0x%02x with %" PRIuS " bytes.",
                  marker, len);
  return true;
}

}  // namespace

Status ReadSOI(DecoderState* m) {
  InputSource* in = m->source();
  m->input_start_pos_ = in->position();
  uint8_t soi[2];
  if (in->Read(soi, 2) != 2 || soi[0] != 0xFF || soi[1] != kMarkerSOI) {
    if (in->cancelled()) {
      return JPEGKIT_ERROR(&m->error_, JpegErrorKind::kCancelled,
                           "Decoding cancelled.");
    }
    m->error_.byte_offset = m->input_start_pos_;
    return HEADER_ERROR("Invalid JPEG header.");
  }
  m->found_soi_ = true;
  return true;
}

int ReadMarker(DecoderState* m) {
  InputSource* in = m->source();
  size_t num_skipped = 0;
  for (;;) {
    int c = in->ReadByte();
    if (c < 0) return -1;
    if (c != 0xFF) {
      ++num_skipped;
      continue;
    }
    do {
      c = in->ReadByte();
    } while (c == 0xFF);
    if (c < 0) return -1;
    if (c == 0) {
      num_skipped += 2;
      continue;
    }
    if (num_skipped > 0) {
      JPEGKIT_WARNING("Skipped %" PRIuS " bytes before marker 0x%02x",
                      num_skipped, c);
    }
    return c;
  }
}

Status ProcessMarker(DecoderState* m, int marker) {
  const int64_t marker_pos = m->source()->position() - 2;
  if (!DispatchMarker(m, marker, marker_pos)) {
    if (m->error_.byte_offset < 0) m->error_.byte_offset = marker_pos;
    return false;
  }
  return true;
}

JpegColorSpace DetermineColorSpace(const DecoderState& m) {
  const ImageMetadata& meta = m.metadata_;
  switch (m.components_.size()) {
    case 1:
      return JpegColorSpace::kGray;
    case 3:
      if (meta.has_adobe && meta.adobe_transform == 0) {
        return JpegColorSpace::kRGB;
      }
      if (!meta.has_jfif && m.components_[0].id == 'R' &&
          m.components_[1].id == 'G' && m.components_[2].id == 'B') {
        return JpegColorSpace::kRGB;
      }
      return JpegColorSpace::kYCbCr;
    case 4:
      if (meta.has_adobe && meta.adobe_transform == 0) {
        return JpegColorSpace::kCMYK;
      }
      if (meta.has_adobe && meta.adobe_transform == 2) {
        return JpegColorSpace::kYCCK;
      }
      return JpegColorSpace::kUnknown;
    default:
      return JpegColorSpace::kUnknown;
  }
}

}  // namespace jpegkit
