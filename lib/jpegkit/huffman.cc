// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/jpegkit/huffman.h"

#include <string.h>

#include <algorithm>
#include <limits>

#include "lib/jpegkit/base/printf_macros.h"

namespace jpegkit {

namespace {

/* clang-format off */
const uint8_t kStdDCLumaCounts[16] = {0, 1, 5, 1, 1, 1, 1, 1, 1, 0, 0, 0, 0, 0, 0, 0};
const uint8_t kStdDCChromaCounts[16] = {0, 3, 1, 1, 1, 1, 1, 1, 1, 1, 1, 0, 0, 0, 0, 0};
const uint8_t kStdDCValues[12] = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11};

const uint8_t kStdACLumaCounts[16] = {0, 2, 1, 3, 3, 2, 4, 3, 5, 5, 4, 4, 0, 0, 1, 0x7d};
const uint8_t kStdACLumaValues[162] = {
  0x01, 0x02, 0x03, 0x00, 0x04, 0x11, 0x05, 0x12, 0x21, 0x31, 0x41, 0x06,
  0x13, 0x51, 0x61, 0x07, 0x22, 0x71, 0x14, 0x32, 0x81, 0x91, 0xa1, 0x08,
  0x23, 0x42, 0xb1, 0xc1, 0x15, 0x52, 0xd1, 0xf0, 0x24, 0x33, 0x62, 0x72,
  0x82, 0x09, 0x0a, 0x16, 0x17, 0x18, 0x19, 0x1a, 0x25, 0x26, 0x27, 0x28,
  0x29, 0x2a, 0x34, 0x35, 0x36, 0x37, 0x38, 0x39, 0x3a, 0x43, 0x44, 0x45,
  0x46, 0x47, 0x48, 0x49, 0x4a, 0x53, 0x54, 0x55, 0x56, 0x57, 0x58, 0x59,
  0x5a, 0x63, 0x64, 0x65, 0x66, 0x67, 0x68, 0x69, 0x6a, 0x73, 0x74, 0x75,
  0x76, 0x77, 0x78, 0x79, 0x7a, 0x83, 0x84, 0x85, 0x86, 0x87, 0x88, 0x89,
  0x8a, 0x92, 0x93, 0x94, 0x95, 0x96, 0x97, 0x98, 0x99, 0x9a, 0xa2, 0xa3,
  0xa4, 0xa5, 0xa6, 0xa7, 0xa8, 0xa9, 0xaa, 0xb2, 0xb3, 0xb4, 0xb5, 0xb6,
  0xb7, 0xb8, 0xb9, 0xba, 0xc2, 0xc3, 0xc4, 0xc5, 0xc6, 0xc7, 0xc8, 0xc9,
  0xca, 0xd2, 0xd3, 0xd4, 0xd5, 0xd6, 0xd7, 0xd8, 0xd9, 0xda, 0xe1, 0xe2,
  0xe3, 0xe4, 0xe5, 0xe6, 0xe7, 0xe8, 0xe9, 0xea, 0xf1, 0xf2, 0xf3, 0xf4,
  0xf5, 0xf6, 0xf7, 0xf8, 0xf9, 0xfa,
};

const uint8_t kStdACChromaCounts[16] = {0, 2, 1, 2, 4, 4, 3, 4, 7, 5, 4, 4, 0, 1, 2, 0x77};
const uint8_t kStdACChromaValues[162] = {
  0x00, 0x01, 0x02, 0x03, 0x11, 0x04, 0x05, 0x21, 0x31, 0x06, 0x12, 0x41,
  0x51, 0x07, 0x61, 0x71, 0x13, 0x22, 0x32, 0x81, 0x08, 0x14, 0x42, 0x91,
  0xa1, 0xb1, 0xc1, 0x09, 0x23, 0x33, 0x52, 0xf0, 0x15, 0x62, 0x72, 0xd1,
  0x0a, 0x16, 0x24, 0x34, 0xe1, 0x25, 0xf1, 0x17, 0x18, 0x19, 0x1a, 0x26,
  0x27, 0x28, 0x29, 0x2a, 0x35, 0x36, 0x37, 0x38, 0x39, 0x3a, 0x43, 0x44,
  0x45, 0x46, 0x47, 0x48, 0x49, 0x4a, 0x53, 0x54, 0x55, 0x56, 0x57, 0x58,
  0x59, 0x5a, 0x63, 0x64, 0x65, 0x66, 0x67, 0x68, 0x69, 0x6a, 0x73, 0x74,
  0x75, 0x76, 0x77, 0x78, 0x79, 0x7a, 0x82, 0x83, 0x84, 0x85, 0x86, 0x87,
  0x88, 0x89, 0x8a, 0x92, 0x93, 0x94, 0x95, 0x96, 0x97, 0x98, 0x99, 0x9a,
  0xa2, 0xa3, 0xa4, 0xa5, 0xa6, 0xa7, 0xa8, 0xa9, 0xaa, 0xb2, 0xb3, 0xb4,
  0xb5, 0xb6, 0xb7, 0xb8, 0xb9, 0xba, 0xc2, 0xc3, 0xc4, 0xc5, 0xc6, 0xc7,
  0xc8, 0xc9, 0xca, 0xd2, 0xd3, 0xd4, 0xd5, 0xd6, 0xd7, 0xd8, 0xd9, 0xda,
  0xe2, 0xe3, 0xe4, 0xe5, 0xe6, 0xe7, 0xe8, 0xe9, 0xea, 0xf2, 0xf3, 0xf4,
  0xf5, 0xf6, 0xf7, 0xf8, 0xf9, 0xfa,
};
/* clang-format on */

void FillCode(const uint8_t* counts, const uint8_t* values, size_t num_values,
              int slot_id, JpegHuffmanCode* huff) {
  huff->counts[0] = 0;
  for (size_t i = 0; i < kJpegHuffmanMaxBitLength; ++i) {
    huff->counts[i + 1] = counts[i];
  }
  huff->values.assign(values, values + num_values);
  huff->slot_id = slot_id;
}

// A node of a Huffman tree, leaves have no left child and store the symbol in
// the second index.
struct HuffmanTreeNode {
  HuffmanTreeNode(uint32_t count, int16_t left, int16_t right_or_symbol)
      : total_count(count), left(left), right_or_symbol(right_or_symbol) {}
  uint32_t total_count;
  int16_t left;
  int16_t right_or_symbol;
};

void SetDepth(const HuffmanTreeNode& node, const HuffmanTreeNode* pool,
              uint8_t* depth, uint8_t level) {
  if (node.left >= 0) {
    ++level;
    SetDepth(pool[node.left], pool, depth, level);
    SetDepth(pool[node.right_or_symbol], pool, depth, level);
  } else {
    depth[node.right_or_symbol] = level;
  }
}

bool LessPopular(const HuffmanTreeNode& a, const HuffmanTreeNode& b) {
  return a.total_count < b.total_count;
}

}  // namespace

JpegHuffmanCode StdHuffmanCode(int slot_id) {
  JpegHuffmanCode huff;
  const bool is_ac = (slot_id & 0x10) != 0;
  const bool is_chroma = (slot_id & 0xf) != 0;
  if (!is_ac) {
    FillCode(is_chroma ? kStdDCChromaCounts : kStdDCLumaCounts, kStdDCValues,
             sizeof(kStdDCValues), slot_id, &huff);
  } else if (!is_chroma) {
    FillCode(kStdACLumaCounts, kStdACLumaValues, sizeof(kStdACLumaValues),
             slot_id, &huff);
  } else {
    FillCode(kStdACChromaCounts, kStdACChromaValues,
             sizeof(kStdACChromaValues), slot_id, &huff);
  }
  return huff;
}

Status BuildHuffmanDecodingTable(const JpegHuffmanCode& huff,
                                 HuffmanDecodingTable* table) {
  table->defined = false;
  size_t total_count = 0;
  for (size_t len = 1; len <= kJpegHuffmanMaxBitLength; ++len) {
    total_count += huff.counts[len];
  }
  if (total_count > kJpegHuffmanAlphabetSize ||
      total_count != huff.values.size()) {
    return JPEGKIT_FAILURE("Invalid Huffman symbol count %" PRIuS,
                           total_count);
  }
  int32_t code = 0;
  int32_t k = 0;
  for (size_t len = 1; len <= kJpegHuffmanMaxBitLength; ++len) {
    table->val_ptr[len] = k;
    table->min_code[len] = code;
    code += huff.counts[len];
    k += huff.counts[len];
    // The all ones code word of a length is reserved, it would be
    // indistinguishable from the 1 bits padding the entropy coded data.
    if (code >= (1 << len)) {
      return JPEGKIT_FAILURE("Invalid Huffman code lengths.");
    }
    table->max_code[len] = huff.counts[len] > 0 ? code - 1 : -1;
    code <<= 1;
  }
  table->min_code[0] = table->max_code[0] = -1;
  table->min_code[kJpegHuffmanMaxBitLength + 1] = 0;
  table->max_code[kJpegHuffmanMaxBitLength + 1] =
      std::numeric_limits<int32_t>::max();
  memset(table->symbols, 0, sizeof(table->symbols));
  std::copy(huff.values.begin(), huff.values.end(), table->symbols);

  memset(table->lookup, 0, sizeof(table->lookup));
  code = 0;
  k = 0;
  for (int len = 1; len <= kHuffmanLookupBits; ++len) {
    for (uint32_t i = 0; i < huff.counts[len]; ++i, ++k, ++code) {
      const int shift = kHuffmanLookupBits - len;
      const uint16_t entry = (len << 8) | table->symbols[k];
      for (int fill = 0; fill < (1 << shift); ++fill) {
        table->lookup[(code << shift) | fill] = entry;
      }
    }
    code <<= 1;
  }
  table->defined = true;
  return true;
}

Status BuildHuffmanCodeTable(const JpegHuffmanCode& huff,
                             HuffmanCodeTable* table) {
  memset(table->depth, 0, sizeof(table->depth));
  memset(table->code, 0, sizeof(table->code));
  uint32_t code = 0;
  size_t k = 0;
  for (size_t len = 1; len <= kJpegHuffmanMaxBitLength; ++len) {
    for (uint32_t i = 0; i < huff.counts[len]; ++i, ++k, ++code) {
      if (k >= huff.values.size()) {
        return JPEGKIT_FAILURE("Huffman code has too few symbols.");
      }
      const int symbol = huff.values[k];
      table->depth[symbol] = len;
      table->code[symbol] = code;
    }
    if (code >= (1u << len)) {
      return JPEGKIT_FAILURE("Invalid Huffman code lengths.");
    }
    code <<= 1;
  }
  return true;
}

void Histogram::Clear() { memset(count, 0, sizeof(count)); }

bool Histogram::empty() const {
  for (size_t i = 0; i < kJpegHuffmanAlphabetSize; ++i) {
    if (count[i] != 0) return false;
  }
  return true;
}

// The tree is built from the sorted leaves and a queue of parent nodes. If
// the deepest leaf exceeds the limit, small counts are raised to count_limit
// and the tree is rebuilt.
void CreateHuffmanTree(const uint32_t* data, const size_t length,
                       const int tree_limit, uint8_t* depth) {
  for (uint32_t count_limit = 1;; count_limit *= 2) {
    std::vector<HuffmanTreeNode> tree;
    tree.reserve(2 * length + 1);
    for (size_t i = length; i != 0;) {
      --i;
      if (data[i]) {
        const uint32_t count = std::max(data[i], count_limit - 1);
        tree.emplace_back(count, -1, static_cast<int16_t>(i));
      }
    }
    const size_t n = tree.size();
    if (n == 1) {
      depth[tree[0].right_or_symbol] = 1;
      break;
    }
    std::stable_sort(tree.begin(), tree.end(), LessPopular);

    // Leaves are [0, n), a sentinel is at n, parents are appended after it
    // in increasing order of their counts, followed by another sentinel.
    const HuffmanTreeNode sentinel(std::numeric_limits<uint32_t>::max(), -1,
                                   -1);
    tree.push_back(sentinel);
    tree.push_back(sentinel);
    size_t next_leaf = 0;
    size_t next_parent = n + 1;
    for (size_t k = n - 1; k != 0; --k) {
      size_t children[2];
      for (size_t& child : children) {
        if (tree[next_leaf].total_count <= tree[next_parent].total_count) {
          child = next_leaf++;
        } else {
          child = next_parent++;
        }
      }
      HuffmanTreeNode& parent = tree.back();
      parent.total_count =
          tree[children[0]].total_count + tree[children[1]].total_count;
      parent.left = static_cast<int16_t>(children[0]);
      parent.right_or_symbol = static_cast<int16_t>(children[1]);
      tree.push_back(sentinel);
    }
    JPEGKIT_DASSERT(tree.size() == 2 * n + 1);
    SetDepth(tree[2 * n - 1], tree.data(), depth, 0);
    if (*std::max_element(depth, depth + length) <= tree_limit) {
      break;
    }
  }
}

void BuildJpegHuffmanCode(const Histogram& histo, JpegHuffmanCode* huff) {
  // One extra symbol with the smallest count takes the all ones code word.
  std::vector<uint32_t> counts(kJpegHuffmanAlphabetSize + 1);
  std::vector<uint8_t> depths(kJpegHuffmanAlphabetSize + 1);
  std::copy(histo.count, histo.count + kJpegHuffmanAlphabetSize,
            counts.begin());
  counts[kJpegHuffmanAlphabetSize] = 1;
  CreateHuffmanTree(counts.data(), counts.size(), kJpegHuffmanMaxBitLength,
                    depths.data());
  std::fill(huff->counts.begin(), huff->counts.end(), 0);
  for (size_t i = 0; i < kJpegHuffmanAlphabetSize; ++i) {
    if (depths[i] > 0) ++huff->counts[depths[i]];
  }
  huff->values.clear();
  for (size_t len = 1; len <= kJpegHuffmanMaxBitLength; ++len) {
    for (size_t i = 0; i < kJpegHuffmanAlphabetSize; ++i) {
      if (depths[i] == len) huff->values.push_back(i);
    }
  }
}

}  // namespace jpegkit
