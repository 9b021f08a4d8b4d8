// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/jpegkit/test_utils.h"

#include <stdlib.h>
#include <string.h>

#include <algorithm>
#include <cmath>

#include "lib/jpegkit/common_internal.h"

namespace jpegkit {
namespace {

#define ERROR_HANDLER_SETUP(action)                               \
  cinfo.err = jpeg_std_error(&jerr);                              \
  if (setjmp(env)) {                                              \
    action;                                                       \
  }                                                               \
  cinfo.client_data = reinterpret_cast<void*>(&env);              \
  cinfo.err->error_exit = [](j_common_ptr cinfo) {                \
    (*cinfo->err->output_message)(cinfo);                         \
    jmp_buf* env = reinterpret_cast<jmp_buf*>(cinfo->client_data); \
    longjmp(*env, 1);                                             \
  };

size_t NumChannels(J_COLOR_SPACE color_space) {
  switch (color_space) {
    case JCS_GRAYSCALE:
      return 1;
    case JCS_CMYK:
    case JCS_YCCK:
      return 4;
    default:
      return 3;
  }
}

void ConvertPixel(size_t x, size_t y, size_t xsize, size_t ysize,
                  J_COLOR_SPACE color_space, uint8_t* out) {
  const uint8_t r = x * 255 / std::max<size_t>(1, xsize - 1);
  const uint8_t g = y * 255 / std::max<size_t>(1, ysize - 1);
  const uint8_t b = ((x / 4 + y / 4) & 1) ? 200 : 40;
  switch (color_space) {
    case JCS_GRAYSCALE:
      out[0] = ((x / 4 + y / 4) & 1) ? r : 255 - g;
      break;
    case JCS_CMYK:
      out[0] = r;
      out[1] = g;
      out[2] = b;
      out[3] = 255 - (x + y) * 255 / std::max<size_t>(1, xsize + ysize - 2);
      break;
    default:
      out[0] = r;
      out[1] = g;
      out[2] = b;
      break;
  }
}

// Big endian segment length at pos, the caller checks the bounds.
size_t SegmentLength(const std::vector<uint8_t>& jpg, size_t pos) {
  return (jpg[pos] << 8) | jpg[pos + 1];
}

}  // namespace

void GeneratePixels(TestImage* img) {
  img->components = NumChannels(img->color_space);
  img->pixels.resize(img->xsize * img->ysize * img->components);
  for (size_t y = 0; y < img->ysize; ++y) {
    for (size_t x = 0; x < img->xsize; ++x) {
      uint8_t* out =
          &img->pixels[(y * img->xsize + x) * img->components];
      ConvertPixel(x, y, img->xsize, img->ysize, img->color_space, out);
    }
  }
}

std::vector<uint8_t> MakeExifWithOrientation(int orientation) {
  return {'M', 'M', 0, 42, 0, 0, 0, 8,
          // IFD0 with one entry.
          0, 1,
          // Orientation, SHORT, count 1.
          0x01, 0x12, 0, 3, 0, 0, 0, 1, 0,
          static_cast<uint8_t>(orientation), 0, 0,
          // No next IFD.
          0, 0, 0, 0};
}

bool EncodeWithLibjpeg(const TestImage& input, const CompressParams& jparams,
                       std::vector<uint8_t>* compressed) {
  std::vector<uint8_t> exif_marker;
  if (!jparams.exif.empty()) {
    exif_marker.assign(kExifTag, kExifTag + sizeof(kExifTag));
    exif_marker.insert(exif_marker.end(), jparams.exif.begin(),
                       jparams.exif.end());
  }
  std::vector<uint8_t> icc_marker;
  if (!jparams.icc.empty()) {
    icc_marker.assign(kIccProfileTag, kIccProfileTag + sizeof(kIccProfileTag));
    icc_marker.push_back(1);
    icc_marker.push_back(1);
    icc_marker.insert(icc_marker.end(), jparams.icc.begin(),
                      jparams.icc.end());
  }
  const size_t stride = input.xsize * input.components;
  std::vector<uint8_t> row_bytes(stride);
  unsigned char* buffer = nullptr;
  unsigned long size = 0;
  jpeg_compress_struct cinfo = {};
  jpeg_error_mgr jerr;
  jmp_buf env;
  ERROR_HANDLER_SETUP({
    jpeg_destroy_compress(&cinfo);
    return false;
  });
  jpeg_create_compress(&cinfo);
  jpeg_mem_dest(&cinfo, &buffer, &size);
  cinfo.image_width = input.xsize;
  cinfo.image_height = input.ysize;
  cinfo.input_components = input.components;
  cinfo.in_color_space = input.color_space;
  jpeg_set_defaults(&cinfo);
  if (jparams.jpeg_color_space != JCS_UNKNOWN) {
    jpeg_set_colorspace(&cinfo, jparams.jpeg_color_space);
  }
  jpeg_set_quality(&cinfo, jparams.quality, TRUE);
  for (int c = 0; c < cinfo.num_components; ++c) {
    cinfo.comp_info[c].h_samp_factor = c == 0 ? jparams.h_sampling : 1;
    cinfo.comp_info[c].v_samp_factor = c == 0 ? jparams.v_sampling : 1;
  }
  if (jparams.override_JFIF >= 0) {
    cinfo.write_JFIF_header = jparams.override_JFIF;
  }
  if (jparams.override_Adobe >= 0) {
    cinfo.write_Adobe_marker = jparams.override_Adobe;
  }
  cinfo.restart_interval = jparams.restart_interval;
  cinfo.optimize_coding = jparams.optimize_coding ? TRUE : FALSE;
  cinfo.dct_method = JDCT_ISLOW;
  if (jparams.progressive) {
    jpeg_simple_progression(&cinfo);
  }
  jpeg_start_compress(&cinfo, TRUE);
  if (!exif_marker.empty()) {
    jpeg_write_marker(&cinfo, JPEG_APP0 + 1, exif_marker.data(),
                      exif_marker.size());
  }
  if (!icc_marker.empty()) {
    jpeg_write_marker(&cinfo, JPEG_APP0 + 2, icc_marker.data(),
                      icc_marker.size());
  }
  for (size_t y = 0; y < input.ysize; ++y) {
    memcpy(row_bytes.data(), &input.pixels[y * stride], stride);
    JSAMPROW row[] = {row_bytes.data()};
    jpeg_write_scanlines(&cinfo, row, 1);
  }
  jpeg_finish_compress(&cinfo);
  jpeg_destroy_compress(&cinfo);
  compressed->assign(buffer, buffer + size);
  free(buffer);
  return true;
}

bool DecodeWithLibjpeg(const std::vector<uint8_t>& compressed,
                       TestImage* output) {
  jpeg_decompress_struct cinfo = {};
  jpeg_error_mgr jerr;
  jmp_buf env;
  ERROR_HANDLER_SETUP({
    jpeg_destroy_decompress(&cinfo);
    return false;
  });
  jpeg_create_decompress(&cinfo);
  jpeg_mem_src(&cinfo, compressed.data(), compressed.size());
  if (jpeg_read_header(&cinfo, /*require_image=*/TRUE) != JPEG_HEADER_OK) {
    jpeg_destroy_decompress(&cinfo);
    return false;
  }
  cinfo.out_color_space = output->color_space;
  cinfo.dct_method = JDCT_ISLOW;
  cinfo.do_fancy_upsampling = FALSE;
  jpeg_start_decompress(&cinfo);
  output->xsize = cinfo.output_width;
  output->ysize = cinfo.output_height;
  output->components = cinfo.out_color_components;
  const size_t stride = output->xsize * output->components;
  output->pixels.resize(output->ysize * stride);
  while (cinfo.output_scanline < cinfo.output_height) {
    JSAMPROW row[] = {&output->pixels[cinfo.output_scanline * stride]};
    jpeg_read_scanlines(&cinfo, row, 1);
  }
  jpeg_finish_decompress(&cinfo);
  jpeg_destroy_decompress(&cinfo);
  return true;
}

bool ReadCoefficientsWithLibjpeg(const std::vector<uint8_t>& compressed,
                                 std::vector<ComponentCoeffs>* components) {
  jpeg_decompress_struct cinfo = {};
  jpeg_error_mgr jerr;
  jmp_buf env;
  ERROR_HANDLER_SETUP({
    jpeg_destroy_decompress(&cinfo);
    return false;
  });
  jpeg_create_decompress(&cinfo);
  jpeg_mem_src(&cinfo, compressed.data(), compressed.size());
  if (jpeg_read_header(&cinfo, /*require_image=*/TRUE) != JPEG_HEADER_OK) {
    jpeg_destroy_decompress(&cinfo);
    return false;
  }
  jvirt_barray_ptr* coef_arrays = jpeg_read_coefficients(&cinfo);
  if (coef_arrays == nullptr) {
    jpeg_destroy_decompress(&cinfo);
    return false;
  }
  j_common_ptr comptr = reinterpret_cast<j_common_ptr>(&cinfo);
  components->resize(cinfo.num_components);
  for (int c = 0; c < cinfo.num_components; ++c) {
    const jpeg_component_info* comp = &cinfo.comp_info[c];
    ComponentCoeffs* out = &(*components)[c];
    out->width_in_blocks = comp->width_in_blocks;
    out->height_in_blocks = comp->height_in_blocks;
    out->coeffs.resize(comp->width_in_blocks * comp->height_in_blocks *
                       DCTSIZE2);
    for (size_t by = 0; by < comp->height_in_blocks; ++by) {
      JBLOCKARRAY ba = (*cinfo.mem->access_virt_barray)(
          comptr, coef_arrays[c], by, 1, FALSE);
      memcpy(&out->coeffs[by * comp->width_in_blocks * DCTSIZE2], ba[0],
             comp->width_in_blocks * sizeof(JBLOCK));
    }
    out->quant.resize(DCTSIZE2);
    for (int k = 0; k < DCTSIZE2; ++k) {
      out->quant[k] = comp->quant_table->quantval[k];
    }
  }
  jpeg_finish_decompress(&cinfo);
  jpeg_destroy_decompress(&cinfo);
  return true;
}

PackedImage ToPackedImage(const TestImage& img) {
  PackedImage image(img.xsize, img.ysize, img.components);
  image.pixels = img.pixels;
  return image;
}

double DistanceRms(const uint8_t* a, const uint8_t* b, size_t len) {
  if (len == 0) return 0.0;
  double diff2 = 0.0;
  for (size_t i = 0; i < len; ++i) {
    const double diff = static_cast<double>(a[i]) - b[i];
    diff2 += diff * diff;
  }
  return std::sqrt(diff2 / len);
}

int MaxAbsDiff(const uint8_t* a, const uint8_t* b, size_t len) {
  int max_diff = 0;
  for (size_t i = 0; i < len; ++i) {
    max_diff = std::max(max_diff, std::abs(a[i] - b[i]));
  }
  return max_diff;
}

std::vector<uint8_t> RemoveMarkerSegments(const std::vector<uint8_t>& jpg,
                                          int marker) {
  std::vector<uint8_t> out(jpg.begin(), jpg.begin() + 2);
  size_t pos = 2;
  while (pos + 4 <= jpg.size() && jpg[pos] == 0xFF) {
    const int current = jpg[pos + 1];
    if (current == kMarkerSOS) break;
    const size_t end = pos + 2 + SegmentLength(jpg, pos + 2);
    if (end > jpg.size()) break;
    if (current != marker) {
      out.insert(out.end(), jpg.begin() + pos, jpg.begin() + end);
    }
    pos = end;
  }
  out.insert(out.end(), jpg.begin() + pos, jpg.end());
  return out;
}

size_t FindMarkerSegment(const std::vector<uint8_t>& jpg, int marker) {
  size_t pos = 2;
  while (pos + 4 <= jpg.size() && jpg[pos] == 0xFF) {
    if (jpg[pos + 1] == marker) return pos;
    if (jpg[pos + 1] == kMarkerSOS) break;
    pos += 2 + SegmentLength(jpg, pos + 2);
  }
  return 0;
}

size_t FirstScanDataOffset(const std::vector<uint8_t>& jpg) {
  size_t pos = 2;
  while (pos + 4 <= jpg.size() && jpg[pos] == 0xFF) {
    const size_t end = pos + 2 + SegmentLength(jpg, pos + 2);
    if (jpg[pos + 1] == kMarkerSOS) return end;
    pos = end;
  }
  return 0;
}

}  // namespace jpegkit
