// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_JPEGKIT_HUFFMAN_H_
#define LIB_JPEGKIT_HUFFMAN_H_

#include <stddef.h>
#include <stdint.h>

#include <array>
#include <vector>

#include "lib/jpegkit/base/status.h"
#include "lib/jpegkit/common_internal.h"

namespace jpegkit {

// Number of code bits resolved by one lookup in the direct decoding table.
constexpr int kHuffmanLookupBits = 9;
constexpr int kHuffmanLookupSize = 1 << kHuffmanLookupBits;

// A Huffman code as it is transmitted in a DHT segment.
struct JpegHuffmanCode {
  // Number of codes of each bit length, counts[0] is unused.
  std::array<uint32_t, kJpegHuffmanMaxBitLength + 1> counts = {};
  // Symbol values sorted by increasing code length.
  std::vector<uint8_t> values;
  // The table class (1 for AC) in the upper nibble and the table index in the
  // lower nibble.
  int slot_id = 0;
};

// Returns the Annex K table for the given slot: 0x00 / 0x10 are the luminance
// DC / AC codes, 0x01 / 0x11 the chrominance ones.
JpegHuffmanCode StdHuffmanCode(int slot_id);

// Canonical decoding structure of one Huffman code.
struct HuffmanDecodingTable {
  bool defined = false;
  // Smallest and largest code of each length, max_code is -1 for lengths
  // without codes. max_code[17] is a sentinel.
  int32_t min_code[kJpegHuffmanMaxBitLength + 2];
  int32_t max_code[kJpegHuffmanMaxBitLength + 2];
  // Index into symbols of the first code of each length.
  int32_t val_ptr[kJpegHuffmanMaxBitLength + 1];
  uint8_t symbols[kJpegHuffmanAlphabetSize];
  // Indexed by the next kHuffmanLookupBits bits of input, the entries are
  // (length << 8 | symbol) for codes that fit and 0 otherwise.
  uint16_t lookup[kHuffmanLookupSize];
};

// Builds the decoding table, fails if the code lengths oversubscribe the code
// space.
Status BuildHuffmanDecodingTable(const JpegHuffmanCode& huff,
                                 HuffmanDecodingTable* table);

// Code word and length of each symbol, depth is 0 for symbols without a code.
struct HuffmanCodeTable {
  int depth[kJpegHuffmanAlphabetSize];
  uint32_t code[kJpegHuffmanAlphabetSize];
};

// Assigns canonical codes: codes of one length are consecutive and the
// running code is shifted left by one between lengths.
Status BuildHuffmanCodeTable(const JpegHuffmanCode& huff,
                             HuffmanCodeTable* table);

struct Histogram {
  uint32_t count[kJpegHuffmanAlphabetSize];
  Histogram() { Clear(); }
  void Clear();
  void Add(int symbol) { ++count[symbol]; }
  bool empty() const;
};

// Creates a length limited Huffman tree for the symbols of the histogram and
// stores the resulting DHT representation in *huff. The all ones code word
// of the longest length is never assigned.
void BuildJpegHuffmanCode(const Histogram& histo, JpegHuffmanCode* huff);

// Computes depths of a Huffman tree over data[0, length), no depth exceeds
// tree_limit.
void CreateHuffmanTree(const uint32_t* data, size_t length, int tree_limit,
                       uint8_t* depth);

}  // namespace jpegkit

#endif  // LIB_JPEGKIT_HUFFMAN_H_
