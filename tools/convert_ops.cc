// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "tools/convert_ops.h"

#include "lib/extras/image_ops.h"
#include "tools/args.h"

namespace jpegkit {
namespace tools {

Status ParseImageOperation(const std::string& text, ImageOperation* op) {
  if (text == "grayscale") {
    op->type = ImageOperation::Type::kGrayscale;
    op->xsize = op->ysize = 0;
    return true;
  }
  const size_t colon = text.find(':');
  if (colon == std::string::npos) {
    return JPEGKIT_FAILURE("Unknown operation %s", text.c_str());
  }
  const std::string name = text.substr(0, colon);
  if (name == "resize") {
    op->type = ImageOperation::Type::kResize;
  } else if (name == "resizebilinear") {
    op->type = ImageOperation::Type::kResizeBilinear;
  } else if (name == "resizefit") {
    op->type = ImageOperation::Type::kResizeToFit;
  } else {
    return JPEGKIT_FAILURE("Unknown operation %s", name.c_str());
  }
  return ParseDimensions(text.c_str() + colon + 1, &op->xsize, &op->ysize);
}

Status ApplyImageOperations(const std::vector<ImageOperation>& ops,
                            PackedImage* image) {
  for (const ImageOperation& op : ops) {
    switch (op.type) {
      case ImageOperation::Type::kResize:
        JPEGKIT_RETURN_IF_ERROR(
            extras::Resize(*image, op.xsize, op.ysize, image));
        break;
      case ImageOperation::Type::kResizeBilinear:
        JPEGKIT_RETURN_IF_ERROR(
            extras::ResizeBilinear(*image, op.xsize, op.ysize, image));
        break;
      case ImageOperation::Type::kResizeToFit:
        JPEGKIT_RETURN_IF_ERROR(
            extras::ResizeToFit(*image, op.xsize, op.ysize, image));
        break;
      case ImageOperation::Type::kGrayscale:
        JPEGKIT_RETURN_IF_ERROR(extras::Grayscale(*image, image));
        break;
    }
  }
  return true;
}

}  // namespace tools
}  // namespace jpegkit
