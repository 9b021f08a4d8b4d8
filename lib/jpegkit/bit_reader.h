// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_BIT_READER_H_
#define LIB_JPEGKIT_BIT_READER_H_

#include <stddef.h>
#include <stdint.h>

#include "lib/jpegkit/base/compiler_specific.h"
#include "lib/jpegkit/base/status.h"
#include "lib/jpegkit/common_internal.h"
#include "lib/jpegkit/huffman.h"

namespace jpegkit {

// Reads the entropy coded segment of a scan from a byte source. Stuffed
// 0xFF00 pairs are turned back into 0xFF data bytes. The first real marker
// stops the byte consumption and is kept as the pending marker. When the
// pending marker is EOI, either because it was found in the stream or because
// the input ended, up to four 0xFF bytes are appended so that trailing codes
// can still be decoded.
//
// Source is a final InputSource implementation so that the per-byte calls
// are not virtual.
template <typename Source>
class BitReader {
 public:
  explicit BitReader(Source* source) : source_(source) { Reset(); }

  // Drops all buffered bits and the pending marker.
  void Reset() {
    buffer_ = 0;
    bits_left_ = 0;
    pending_marker_ = -1;
    pad_count_ = 0;
  }

  // Returns the next n (at most 32) bits without consuming them. Bits missing
  // after the pending marker read as 1.
  JPEGKIT_INLINE uint32_t PeekBits(int n) {
    if (bits_left_ < n) FillBuffer();
    if (JPEGKIT_LIKELY(bits_left_ >= n)) {
      return (buffer_ >> (bits_left_ - n)) & Mask(n);
    }
    const int missing = n - bits_left_;
    return ((buffer_ << missing) | Mask(missing)) & Mask(n);
  }

  // Consumes n bits, fails if fewer are available.
  JPEGKIT_INLINE bool SkipBits(int n) {
    if (bits_left_ < n) FillBuffer();
    if (JPEGKIT_UNLIKELY(bits_left_ < n)) return false;
    bits_left_ -= n;
    return true;
  }

  JPEGKIT_INLINE bool ReadBits(int n, int* value) {
    if (n == 0) {
      *value = 0;
      return true;
    }
    *value = PeekBits(n);
    return SkipBits(n);
  }

  // Reads the s extra bits of a DC difference or AC value and maps them to
  // the signed value (Table F.1 of T.81): values below 2^(s-1) represent the
  // negative range.
  JPEGKIT_INLINE bool ReceiveAndExtend(int s, int* value) {
    if (s == 0) {
      *value = 0;
      return true;
    }
    int v;
    if (!ReadBits(s, &v)) return false;
    *value = v < (1 << (s - 1)) ? v - (1 << s) + 1 : v;
    return true;
  }

  // Decodes one Huffman symbol, returns -1 if no code of length 1..16
  // matches.
  JPEGKIT_INLINE int DecodeSymbol(const HuffmanDecodingTable& table,
                                  bool use_lookup) {
    if (use_lookup) {
      const uint16_t entry = table.lookup[PeekBits(kHuffmanLookupBits)];
      if (entry != 0) {
        if (!SkipBits(entry >> 8)) return -1;
        return entry & 0xff;
      }
    }
    int32_t code = 0;
    for (size_t len = 1; len <= kJpegHuffmanMaxBitLength; ++len) {
      int bit;
      if (!ReadBits(1, &bit)) return -1;
      code = (code << 1) | bit;
      if (code <= table.max_code[len] && code >= table.min_code[len]) {
        return table.symbols[table.val_ptr[len] + code - table.min_code[len]];
      }
    }
    return -1;
  }

  // Drops the bits of the current partial byte.
  void AlignToByte() { bits_left_ -= bits_left_ & 7; }

  // Discards the buffered bits and reads forward to the next marker, which
  // becomes the pending marker. Returns the number of entropy coded bytes
  // that were skipped.
  size_t SeekNextMarker() {
    AlignToByte();
    const int data_bits = bits_left_ - pad_count_ * 8;
    size_t skipped = data_bits > 0 ? data_bits / 8 : 0;
    bits_left_ = 0;
    buffer_ = 0;
    while (pending_marker_ < 0) {
      const int c = source_->ReadByte();
      if (c < 0) {
        SetInputEnd();
      } else if (c == 0xFF) {
        ReadMarkerByte();
      } else {
        ++skipped;
      }
    }
    return skipped;
  }

  // Consumes the pending marker so that decoding can continue after a
  // restart marker.
  void ClearPendingMarker() {
    buffer_ = 0;
    bits_left_ = 0;
    pending_marker_ = -1;
    pad_count_ = 0;
  }

  int pending_marker() const { return pending_marker_; }
  bool has_pending_marker() const { return pending_marker_ >= 0; }
  // True if the pending EOI was synthesized because the input ended.
  bool input_exhausted() const { return input_exhausted_; }
  int bits_left() const { return bits_left_; }
  int64_t position() const { return source_->position(); }

 private:
  static JPEGKIT_INLINE uint32_t Mask(int n) {
    return n >= 32 ? 0xffffffffu : (1u << n) - 1;
  }

  JPEGKIT_INLINE void AppendByte(int c) {
    buffer_ = (buffer_ << 8) | static_cast<uint64_t>(c);
    bits_left_ += 8;
  }

  void SetInputEnd() {
    pending_marker_ = kMarkerEOI;
    input_exhausted_ = true;
  }

  // Called after a 0xFF byte: consumes fill bytes and either the stuffed zero
  // or the marker code. Returns true for a stuffed data byte.
  bool ReadMarkerByte() {
    int c;
    do {
      c = source_->ReadByte();
    } while (c == 0xFF);
    if (c < 0) {
      SetInputEnd();
      return false;
    }
    if (c == 0) return true;
    pending_marker_ = c;
    return false;
  }

  void FillBuffer() {
    while (bits_left_ <= 56) {
      if (pending_marker_ >= 0) {
        if (pending_marker_ == kMarkerEOI && pad_count_ < 4) {
          AppendByte(0xFF);
          ++pad_count_;
          continue;
        }
        return;
      }
      const int c = source_->ReadByte();
      if (JPEGKIT_UNLIKELY(c < 0)) {
        SetInputEnd();
      } else if (JPEGKIT_UNLIKELY(c == 0xFF)) {
        if (ReadMarkerByte()) AppendByte(0xFF);
      } else {
        AppendByte(c);
      }
    }
  }

  Source* source_;
  uint64_t buffer_;
  int bits_left_;
  int pending_marker_;
  int pad_count_;
  bool input_exhausted_ = false;
};

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_BIT_READER_H_
