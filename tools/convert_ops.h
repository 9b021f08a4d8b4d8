// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef TOOLS_CONVERT_OPS_H_
#define TOOLS_CONVERT_OPS_H_

// The image operations of jpegkit_convert, given on the command line as
// "resize:WxH", "resizebilinear:WxH", "resizefit:WxH" or "grayscale".

#include <stddef.h>

#include <string>
#include <vector>

#include "lib/jpegkit/base/status.h"
#include "lib/jpegkit/packed_image.h"

namespace jpegkit {
namespace tools {

struct ImageOperation {
  enum class Type {
    kResize,
    kResizeBilinear,
    kResizeToFit,
    kGrayscale,
  };
  Type type = Type::kGrayscale;
  size_t xsize = 0;
  size_t ysize = 0;
};

Status ParseImageOperation(const std::string& text, ImageOperation* op);

// Applies the operations in order.
Status ApplyImageOperations(const std::vector<ImageOperation>& ops,
                            PackedImage* image);

}  // namespace tools
}  // namespace jpegkit

#endif  // TOOLS_CONVERT_OPS_H_
