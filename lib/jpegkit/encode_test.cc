// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/jpegkit/encode.h"

#include <stddef.h>
#include <stdint.h>
#include <stdlib.h>

#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "lib/jpegkit/common_internal.h"
#include "lib/jpegkit/decode.h"
#include "lib/jpegkit/error.h"
#include "lib/jpegkit/metadata.h"
#include "lib/jpegkit/packed_image.h"
#include "lib/jpegkit/test_utils.h"
#include "lib/jpegkit/testing.h"
#include "lib/jpegkit/types.h"

namespace jpegkit {
namespace {

PackedImage GenerateImage(size_t xsize, size_t ysize,
                          J_COLOR_SPACE color_space) {
  TestImage img;
  img.xsize = xsize;
  img.ysize = ysize;
  img.color_space = color_space;
  GeneratePixels(&img);
  return ToPackedImage(img);
}

size_t CountRestartMarkers(const std::vector<uint8_t>& jpg) {
  size_t count = 0;
  for (size_t i = 0; i + 1 < jpg.size(); ++i) {
    if (jpg[i] == 0xFF && jpg[i + 1] >= kMarkerRST0 &&
        jpg[i + 1] <= kMarkerRST7) {
      ++count;
    }
  }
  return count;
}

PackedImage Decode(const std::vector<uint8_t>& compressed,
                   OutputMode output = OutputMode::kNative) {
  DecodeParams params;
  params.output = output;
  PackedImage image;
  JpegError error;
  EXPECT_TRUE(DecodeJpeg(compressed.data(), compressed.size(), params, &image,
                         &error))
      << error.ToString();
  return image;
}

TEST(EncodeTest, UniformGray420) {
  PackedImage image(16, 16, 3);
  for (uint8_t& v : image.pixels) v = 128;
  EncodeParams params;
  params.quality = 75;
  params.chroma_subsampling = true;
  std::vector<uint8_t> compressed;
  ASSERT_TRUE(EncodeJpeg(image, params, &compressed));
  const PackedImage decoded = Decode(compressed, OutputMode::kRGB);
  ASSERT_EQ(16u, decoded.xsize);
  ASSERT_EQ(16u, decoded.ysize);
  for (uint8_t v : decoded.pixels) {
    EXPECT_LE(std::abs(static_cast<int>(v) - 128), 4);
  }
}

TEST(EncodeTest, Quality100RoundTrip) {
  const PackedImage image = GenerateImage(64, 48, JCS_RGB);
  EncodeParams params;
  params.quality = 100;
  params.chroma_subsampling = false;
  std::vector<uint8_t> compressed;
  ASSERT_TRUE(EncodeJpeg(image, params, &compressed));
  const PackedImage decoded = Decode(compressed, OutputMode::kRGB);
  ASSERT_EQ(image.pixels.size(), decoded.pixels.size());
  const size_t len = image.pixels.size();
  EXPECT_LE(DistanceRms(image.pixels.data(), decoded.pixels.data(), len), 1.0);
  EXPECT_LE(MaxAbsDiff(image.pixels.data(), decoded.pixels.data(), len), 5);
}

TEST(EncodeTest, LowerQualityIsSmaller) {
  const PackedImage image = GenerateImage(64, 64, JCS_RGB);
  EncodeParams params;
  size_t last_size = 0;
  for (int quality : {95, 75, 30, 5}) {
    params.quality = quality;
    std::vector<uint8_t> compressed;
    ASSERT_TRUE(EncodeJpeg(image, params, &compressed));
    if (last_size > 0) {
      EXPECT_LT(compressed.size(), last_size) << "quality " << quality;
    }
    last_size = compressed.size();
  }
}

struct EncodeTestConfig {
  std::string name;
  size_t xsize = 64;
  size_t ysize = 48;
  J_COLOR_SPACE color_space = JCS_RGB;
  EncodeParams params;
};

std::vector<EncodeTestConfig> GenerateConfigs() {
  std::vector<EncodeTestConfig> all;
  {
    EncodeTestConfig config;
    config.name = "gray";
    config.color_space = JCS_GRAYSCALE;
    all.push_back(config);
  }
  {
    EncodeTestConfig config;
    config.name = "420";
    all.push_back(config);
  }
  {
    EncodeTestConfig config;
    config.name = "444_float";
    config.params.chroma_subsampling = false;
    config.params.fdct = DctMethod::kFloat;
    all.push_back(config);
  }
  {
    EncodeTestConfig config;
    config.name = "odd_size";
    config.xsize = 33;
    config.ysize = 17;
    all.push_back(config);
  }
  {
    EncodeTestConfig config;
    config.name = "restarts";
    config.params.restart_interval = 2;
    all.push_back(config);
  }
  {
    EncodeTestConfig config;
    config.name = "progressive";
    config.params.progressive = true;
    all.push_back(config);
  }
  {
    EncodeTestConfig config;
    config.name = "progressive_gray_restarts";
    config.color_space = JCS_GRAYSCALE;
    config.xsize = 45;
    config.params.progressive = true;
    config.params.restart_interval = 3;
    all.push_back(config);
  }
  {
    EncodeTestConfig config;
    config.name = "progressive_444_q95";
    config.params.progressive = true;
    config.params.chroma_subsampling = false;
    config.params.quality = 95;
    all.push_back(config);
  }
  return all;
}

class EncodeTestParam : public ::testing::TestWithParam<EncodeTestConfig> {};

TEST_P(EncodeTestParam, LibjpegDecodesOutput) {
  const EncodeTestConfig& config = GetParam();
  const PackedImage image =
      GenerateImage(config.xsize, config.ysize, config.color_space);
  std::vector<uint8_t> compressed;
  JpegError error;
  ASSERT_TRUE(EncodeJpeg(image, config.params, &compressed, &error))
      << error.ToString();
  EXPECT_TRUE(error.ok());

  TestImage expected;
  expected.color_space = config.color_space;
  ASSERT_TRUE(DecodeWithLibjpeg(compressed, &expected));
  ASSERT_EQ(config.xsize, expected.xsize);
  ASSERT_EQ(config.ysize, expected.ysize);

  const PackedImage decoded = Decode(compressed);
  ASSERT_EQ(expected.pixels.size(), decoded.pixels.size());
  const size_t len = decoded.pixels.size();
  EXPECT_LE(DistanceRms(expected.pixels.data(), decoded.pixels.data(), len),
            1.0);
  EXPECT_LE(MaxAbsDiff(expected.pixels.data(), decoded.pixels.data(), len),
            4);
  // Distance from the source image is bounded by the quantization.
  EXPECT_LE(DistanceRms(image.pixels.data(), decoded.pixels.data(), len),
            12.0);
}

std::string TestDescription(
    const testing::TestParamInfo<EncodeTestParam::ParamType>& info) {
  return info.param.name;
}

JPEGKIT_INSTANTIATE_TEST_SUITE_P(EncodeTest, EncodeTestParam,
                                 testing::ValuesIn(GenerateConfigs()),
                                 TestDescription);

TEST(EncodeTest, ProgressiveMatchesSequential) {
  for (J_COLOR_SPACE color_space : {JCS_GRAYSCALE, JCS_RGB}) {
    const PackedImage image = GenerateImage(40, 40, color_space);
    EncodeParams params;
    std::vector<uint8_t> sequential;
    ASSERT_TRUE(EncodeJpeg(image, params, &sequential));
    params.progressive = true;
    std::vector<uint8_t> progressive;
    ASSERT_TRUE(EncodeJpeg(image, params, &progressive));
    EXPECT_NE(sequential, progressive);

    JpegDecoder decoder;
    decoder.SetInput(progressive.data(), progressive.size());
    ASSERT_TRUE(decoder.ReadHeaders());
    EXPECT_TRUE(decoder.is_progressive());
    EXPECT_EQ(Decode(sequential).pixels, Decode(progressive).pixels);
  }
}

TEST(EncodeTest, ChannelLayouts) {
  const PackedImage gray = GenerateImage(24, 16, JCS_GRAYSCALE);
  std::vector<uint8_t> compressed;
  ASSERT_TRUE(EncodeJpeg(gray, EncodeParams(), &compressed));
  JpegDecoder decoder;
  decoder.SetInput(compressed.data(), compressed.size());
  ASSERT_TRUE(decoder.ReadHeaders());
  EXPECT_EQ(1u, decoder.num_components());
  EXPECT_EQ(JpegColorSpace::kGray, decoder.color_space());

  // Alpha is dropped.
  const PackedImage rgb = GenerateImage(24, 16, JCS_RGB);
  PackedImage rgba(24, 16, 4);
  for (size_t y = 0; y < rgb.ysize; ++y) {
    for (size_t x = 0; x < rgb.xsize; ++x) {
      for (size_t c = 0; c < 3; ++c) {
        rgba.pixel(y, x)[c] = rgb.pixel(y, x)[c];
      }
      rgba.pixel(y, x)[3] = x * 10;
    }
  }
  std::vector<uint8_t> from_rgb;
  std::vector<uint8_t> from_rgba;
  ASSERT_TRUE(EncodeJpeg(rgb, EncodeParams(), &from_rgb));
  ASSERT_TRUE(EncodeJpeg(rgba, EncodeParams(), &from_rgba));
  EXPECT_EQ(from_rgb, from_rgba);
}

TEST(EncodeTest, RestartMarkers) {
  const PackedImage image = GenerateImage(64, 64, JCS_RGB);
  EncodeParams params;
  std::vector<uint8_t> plain;
  ASSERT_TRUE(EncodeJpeg(image, params, &plain));
  EXPECT_EQ(0u, CountRestartMarkers(plain));

  params.restart_interval = 1;
  std::vector<uint8_t> with_restarts;
  ASSERT_TRUE(EncodeJpeg(image, params, &with_restarts));
  // 4x4 MCUs of 16x16 pixels, a marker between every two of them.
  EXPECT_EQ(15u, CountRestartMarkers(with_restarts));
  EXPECT_NE(0u, FindMarkerSegment(with_restarts, kMarkerDRI));

  std::vector<uint8_t> again;
  ASSERT_TRUE(EncodeJpeg(image, params, &again));
  EXPECT_EQ(with_restarts, again);
  EXPECT_EQ(Decode(plain).pixels, Decode(with_restarts).pixels);
}

TEST(EncodeTest, Metadata) {
  PackedImage image = GenerateImage(16, 8, JCS_RGB);
  image.metadata.exif = MakeExifWithOrientation(6);
  // Larger than one APP2 segment.
  image.metadata.icc.resize(70000);
  for (size_t i = 0; i < image.metadata.icc.size(); ++i) {
    image.metadata.icc[i] = (i * 13) & 0xFF;
  }
  EncodeParams params;
  std::vector<uint8_t> compressed;
  ASSERT_TRUE(EncodeJpeg(image, params, &compressed));
  EXPECT_TRUE(Decode(compressed).metadata.exif.empty());

  params.write_metadata = true;
  ASSERT_TRUE(EncodeJpeg(image, params, &compressed));
  PackedImage decoded = Decode(compressed);
  EXPECT_EQ(6, decoded.metadata.orientation);
  EXPECT_EQ(image.metadata.exif, decoded.metadata.exif);
  EXPECT_EQ(image.metadata.icc, decoded.metadata.icc);
  EXPECT_TRUE(decoded.metadata.has_jfif);

  params.orientation_applied = true;
  ASSERT_TRUE(EncodeJpeg(image, params, &compressed));
  decoded = Decode(compressed);
  EXPECT_EQ(1, decoded.metadata.orientation);
  int orientation = 0;
  ASSERT_TRUE(ParseExifOrientation(decoded.metadata.exif, &orientation));
  EXPECT_EQ(1, orientation);
  EXPECT_EQ(image.metadata.icc, decoded.metadata.icc);
}

TEST(EncodeTest, InvalidInput) {
  const PackedImage image = GenerateImage(16, 16, JCS_RGB);
  const std::vector<uint8_t> sentinel = {1, 2, 3};
  std::vector<uint8_t> out = sentinel;
  JpegError error;

  EncodeParams params;
  params.quality = 0;
  EXPECT_FALSE(EncodeJpeg(image, params, &out, &error));
  EXPECT_EQ(JpegErrorKind::kEncodeError, error.kind);
  params.quality = 101;
  EXPECT_FALSE(EncodeJpeg(image, params, &out, &error));

  params = EncodeParams();
  params.restart_interval = -1;
  EXPECT_FALSE(EncodeJpeg(image, params, &out, &error));
  EXPECT_EQ(JpegErrorKind::kEncodeError, error.kind);

  PackedImage two_channels(8, 8, 2);
  EXPECT_FALSE(EncodeJpeg(two_channels, EncodeParams(), &out, &error));

  PackedImage empty;
  EXPECT_FALSE(EncodeJpeg(empty, EncodeParams(), &out, &error));

  PackedImage short_buffer = image;
  short_buffer.pixels.resize(10);
  EXPECT_FALSE(EncodeJpeg(short_buffer, EncodeParams(), &out, &error));
  EXPECT_EQ(sentinel, out);

  // A successful call clears the previous error.
  EXPECT_TRUE(EncodeJpeg(image, EncodeParams(), &out, &error));
  EXPECT_TRUE(error.ok());
}

TEST(EncodeTest, InvalidScanScript) {
  const PackedImage image = GenerateImage(16, 16, JCS_GRAYSCALE);
  EncodeParams params;
  params.progressive = true;
  ScanInfo ac_scan;
  ac_scan.num_components = 1;
  ac_scan.Ss = 1;
  ac_scan.Se = 63;
  ScanInfo dc_scan;
  dc_scan.num_components = 1;
  dc_scan.Ss = 0;
  dc_scan.Se = 0;
  std::vector<uint8_t> out;
  JpegError error;

  // AC before DC.
  params.scan_script = {ac_scan, dc_scan};
  EXPECT_FALSE(EncodeJpeg(image, params, &out, &error));
  EXPECT_EQ(JpegErrorKind::kEncodeError, error.kind);

  // Refinement without a first pass.
  ScanInfo refine = ac_scan;
  refine.Ah = 1;
  refine.Al = 0;
  params.scan_script = {dc_scan, refine};
  EXPECT_FALSE(EncodeJpeg(image, params, &out, &error));

  // Coefficient coded twice.
  params.scan_script = {dc_scan, ac_scan, ac_scan};
  EXPECT_FALSE(EncodeJpeg(image, params, &out, &error));

  // No DC scan.
  params.scan_script = {ac_scan};
  EXPECT_FALSE(EncodeJpeg(image, params, &out, &error));

  params.scan_script = {dc_scan, ac_scan};
  EXPECT_TRUE(EncodeJpeg(image, params, &out, &error)) << error.ToString();
}

TEST(EncodeTest, DefaultScanScriptIsComplete) {
  for (int num_components : {1, 3}) {
    for (bool interleave_dc : {true, false}) {
      const std::vector<ScanInfo> scans =
          DefaultScanScript(num_components, interleave_dc);
      // Lowest coded bit of every coefficient.
      std::vector<std::vector<int>> coded_al(num_components,
                                             std::vector<int>(64, -1));
      for (const ScanInfo& scan : scans) {
        ASSERT_GE(scan.num_components, 1);
        if (scan.Ss > 0) ASSERT_EQ(1, scan.num_components);
        if (!interleave_dc) ASSERT_EQ(1, scan.num_components);
        for (int i = 0; i < scan.num_components; ++i) {
          const int c = scan.component_index[i];
          ASSERT_LT(c, num_components);
          for (int k = scan.Ss; k <= scan.Se; ++k) {
            EXPECT_EQ(scan.Ah == 0 ? -1 : scan.Ah, coded_al[c][k]);
            coded_al[c][k] = scan.Al;
          }
        }
      }
      for (int c = 0; c < num_components; ++c) {
        for (int k = 0; k < 64; ++k) EXPECT_EQ(0, coded_al[c][k]);
      }
    }
  }
}

TEST(EncodeTest, TranscodeCoefficients) {
  TestImage input;
  input.xsize = 50;
  input.ysize = 35;
  GeneratePixels(&input);
  CompressParams jparams;
  jparams.h_sampling = 2;
  jparams.v_sampling = 2;
  jparams.exif = MakeExifWithOrientation(3);
  std::vector<uint8_t> original;
  ASSERT_TRUE(EncodeWithLibjpeg(input, jparams, &original));
  std::vector<ComponentCoeffs> expected;
  ASSERT_TRUE(ReadCoefficientsWithLibjpeg(original, &expected));

  JpegDecoder decoder;
  decoder.SetInput(original.data(), original.size());
  JpegCoefficients coefficients;
  ASSERT_TRUE(decoder.ReadCoefficients(&coefficients));

  for (bool progressive : {false, true}) {
    SCOPED_TRACE(progressive ? "progressive" : "sequential");
    EncodeParams params;
    params.progressive = progressive;
    params.write_metadata = true;
    std::vector<uint8_t> transcoded;
    JpegError error;
    ASSERT_TRUE(
        EncodeJpegCoefficients(coefficients, params, &transcoded, &error))
        << error.ToString();
    std::vector<ComponentCoeffs> actual;
    ASSERT_TRUE(ReadCoefficientsWithLibjpeg(transcoded, &actual));
    ASSERT_EQ(expected.size(), actual.size());
    for (size_t c = 0; c < expected.size(); ++c) {
      EXPECT_EQ(expected[c].width_in_blocks, actual[c].width_in_blocks);
      EXPECT_EQ(expected[c].height_in_blocks, actual[c].height_in_blocks);
      EXPECT_EQ(expected[c].quant, actual[c].quant);
      EXPECT_TRUE(expected[c].coeffs == actual[c].coeffs) << "component " << c;
    }
    PackedImage decoded = Decode(transcoded);
    EXPECT_EQ(3, decoded.metadata.orientation);
    EXPECT_EQ(Decode(original).pixels, decoded.pixels);
  }
}

// A three scan progression that codes the DC and the first five AC
// coefficients in two passes decodes like a sequential file that has only
// those coefficients.
TEST(EncodeTest, ShortProgressionMatchesTruncatedBaseline) {
  const PackedImage image = GenerateImage(40, 32, JCS_GRAYSCALE);
  std::vector<uint8_t> source;
  ASSERT_TRUE(EncodeJpeg(image, EncodeParams(), &source));
  JpegDecoder decoder;
  decoder.SetInput(source.data(), source.size());
  JpegCoefficients coefficients;
  ASSERT_TRUE(decoder.ReadCoefficients(&coefficients));
  ASSERT_EQ(1u, coefficients.components.size());

  ScanInfo dc;
  dc.num_components = 1;
  dc.Ss = 0;
  dc.Se = 0;
  ScanInfo band;
  band.num_components = 1;
  band.Ss = 1;
  band.Se = 5;
  band.Ah = 0;
  band.Al = 1;
  ScanInfo refine = band;
  refine.Ah = 1;
  refine.Al = 0;
  EncodeParams params;
  params.progressive = true;
  params.scan_script = {dc, band, refine};
  std::vector<uint8_t> progressive;
  JpegError error;
  ASSERT_TRUE(
      EncodeJpegCoefficients(coefficients, params, &progressive, &error))
      << error.ToString();

  JpegCoefficients truncated = coefficients;
  JpegCoefficients::Component& comp = truncated.components[0];
  const size_t num_blocks = comp.width_in_blocks * comp.height_in_blocks;
  for (size_t b = 0; b < num_blocks; ++b) {
    coeff_t* block = &comp.coeffs[b * kDCTBlockSize];
    for (size_t k = 6; k < kDCTBlockSize; ++k) {
      block[kJPEGNaturalOrder[k]] = 0;
    }
  }
  std::vector<uint8_t> baseline;
  ASSERT_TRUE(EncodeJpegCoefficients(truncated, EncodeParams(), &baseline));

  const PackedImage from_progressive = Decode(progressive);
  const PackedImage from_baseline = Decode(baseline);
  EXPECT_EQ(from_baseline.pixels, from_progressive.pixels);

  JpegDecoder progressive_decoder;
  progressive_decoder.SetInput(progressive.data(), progressive.size());
  JpegCoefficients decoded;
  ASSERT_TRUE(progressive_decoder.ReadCoefficients(&decoded));
  EXPECT_TRUE(decoded.is_progressive);
  EXPECT_TRUE(decoded.components[0].coeffs == comp.coeffs);
}

TEST(EncodeTest, InvalidCoefficients) {
  const PackedImage image = GenerateImage(16, 16, JCS_RGB);
  std::vector<uint8_t> source;
  ASSERT_TRUE(EncodeJpeg(image, EncodeParams(), &source));
  JpegDecoder decoder;
  decoder.SetInput(source.data(), source.size());
  JpegCoefficients coefficients;
  ASSERT_TRUE(decoder.ReadCoefficients(&coefficients));
  std::vector<uint8_t> out;
  JpegError error;

  JpegCoefficients duplicate_id = coefficients;
  duplicate_id.components[1].id = duplicate_id.components[0].id;
  EXPECT_FALSE(EncodeJpegCoefficients(duplicate_id, EncodeParams(), &out,
                                      &error));
  EXPECT_EQ(JpegErrorKind::kEncodeError, error.kind);

  JpegCoefficients bad_sampling = coefficients;
  bad_sampling.components[0].h_samp_factor = 5;
  EXPECT_FALSE(EncodeJpegCoefficients(bad_sampling, EncodeParams(), &out,
                                      &error));

  JpegCoefficients short_coeffs = coefficients;
  short_coeffs.components[2].coeffs.resize(64);
  EXPECT_FALSE(EncodeJpegCoefficients(short_coeffs, EncodeParams(), &out,
                                      &error));

  JpegCoefficients no_quant = coefficients;
  no_quant.components[0].quant.clear();
  EXPECT_FALSE(EncodeJpegCoefficients(no_quant, EncodeParams(), &out,
                                      &error));

  JpegCoefficients two_components = coefficients;
  two_components.components.resize(2);
  EXPECT_FALSE(EncodeJpegCoefficients(two_components, EncodeParams(), &out,
                                      &error));
}

}  // namespace
}  // namespace jpegkit
