// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "lib/extras/codec_webp.h"

#include <string.h>
#include <webp/decode.h>
#include <webp/encode.h>

namespace jpegkit {
namespace extras {
namespace {

// libwebp limit on both dimensions.
constexpr size_t kMaxWebPDimension = 16383;

int WebPVectorWrite(const uint8_t* data, size_t data_size,
                    const WebPPicture* const picture) {
  if (data_size) {
    std::vector<uint8_t>* const out =
        static_cast<std::vector<uint8_t>*>(picture->custom_ptr);
    const size_t pos = out->size();
    out->resize(pos + data_size);
    memcpy(out->data() + pos, data, data_size);
  }
  return 1;
}

// Frees the picture on every return path.
class WebPPictureOwner {
 public:
  explicit WebPPictureOwner(WebPPicture* pic) : pic_(pic) {}
  ~WebPPictureOwner() { WebPPictureFree(pic_); }

 private:
  WebPPicture* pic_;
};

}  // namespace

Status DecodeImageWebP(const uint8_t* data, size_t size, PackedImage* image) {
  WebPDecoderConfig config;
  if (!WebPInitDecoderConfig(&config)) {
    return JPEGKIT_FAILURE("WebPInitDecoderConfig failed");
  }
  if (WebPGetFeatures(data, size, &config.input) != VP8_STATUS_OK) {
    return JPEGKIT_FAILURE("Invalid WebP header");
  }
  if (config.input.has_animation) {
    return JPEGKIT_FAILURE("Animated WebP is not supported");
  }
  const bool has_alpha = config.input.has_alpha != 0;
  config.options.use_threads = 0;
  WebPDecBuffer* const buf = &config.output;
  buf->colorspace = has_alpha ? MODE_RGBA : MODE_RGB;
  if (WebPDecode(data, size, &config) != VP8_STATUS_OK) {
    return JPEGKIT_FAILURE("WebPDecode failed");
  }
  const Status ok = image->Resize(buf->width, buf->height, has_alpha ? 4 : 3);
  if (ok) {
    const size_t row_size = image->stride();
    for (size_t y = 0; y < image->ysize; ++y) {
      memcpy(image->row(y), buf->u.RGBA.rgba + y * buf->u.RGBA.stride,
             row_size);
    }
    image->metadata = ImageMetadata();
  }
  WebPFreeDecBuffer(buf);
  return ok;
}

Status EncodeImageWebP(const PackedImage& image, int quality,
                       std::vector<uint8_t>* bytes) {
  if (image.empty()) return JPEGKIT_FAILURE("Empty image");
  if (image.xsize > kMaxWebPDimension || image.ysize > kMaxWebPDimension) {
    return JPEGKIT_FAILURE("Image too large for WebP");
  }
  if (!image.metadata.exif.empty() || !image.metadata.icc.empty()) {
    JPEGKIT_WARNING("WebP encoder ignoring metadata - use a different codec");
  }
  WebPConfig config;
  if (!WebPConfigInit(&config)) {
    return JPEGKIT_FAILURE("WebPConfigInit failed");
  }
  config.quality = quality;
  if (!WebPValidateConfig(&config)) {
    return JPEGKIT_FAILURE("Invalid WebP quality %d", quality);
  }

  std::vector<uint8_t> rgb;
  const uint8_t* pixels = image.pixels.data();
  size_t stride = image.stride();
  if (image.num_channels == 1) {
    rgb.resize(image.pixels.size() * 3);
    for (size_t i = 0; i < image.pixels.size(); ++i) {
      rgb[3 * i] = rgb[3 * i + 1] = rgb[3 * i + 2] = image.pixels[i];
    }
    pixels = rgb.data();
    stride = image.xsize * 3;
  }

  WebPPicture pic;
  if (!WebPPictureInit(&pic)) {
    return JPEGKIT_FAILURE("WebPPictureInit failed");
  }
  WebPPictureOwner owner(&pic);
  pic.width = static_cast<int>(image.xsize);
  pic.height = static_cast<int>(image.ysize);
  pic.writer = &WebPVectorWrite;
  pic.custom_ptr = bytes;
  bytes->clear();
  if (image.num_channels == 4) {
    if (!WebPPictureImportRGBA(&pic, pixels, static_cast<int>(stride))) {
      return JPEGKIT_FAILURE("WebPPictureImportRGBA failed");
    }
  } else if (!WebPPictureImportRGB(&pic, pixels, static_cast<int>(stride))) {
    return JPEGKIT_FAILURE("WebPPictureImportRGB failed");
  }
  if (!WebPEncode(&config, &pic)) {
    return JPEGKIT_FAILURE("WebPEncode failed with error %d", pic.error_code);
  }
  return true;
}

}  // namespace extras
}  // namespace jpegkit
