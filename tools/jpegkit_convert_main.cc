// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

// Converts between JPEG and the other image formats known to extras,
// optionally resizing or converting the image to gray on the way.

#include <stdio.h>
#include <stdlib.h>

#include <string>
#include <vector>

#include "lib/extras/codec.h"
#include "lib/extras/image_ops.h"
#include "lib/jpegkit/packed_image.h"
#include "lib/jpegkit/types.h"
#include "tools/args.h"
#include "tools/cmdline.h"
#include "tools/convert_ops.h"
#include "tools/file_io.h"

namespace jpegkit {
namespace tools {
namespace {

struct ConvertArgs {
  void AddCommandLineOptions(CommandLineParser* cmdline) {
    cmdline->AddPositionalOption("INPUT", /* required = */ true,
                                 "The input image, any supported format.",
                                 &file_in);
    cmdline->AddPositionalOption(
        "OUTPUT", /* required = */ true,
        "The output image, the format follows the file extension.", &file_out);

    cmdline->AddOptionValue('q', "quality", "N",
                            "JPEG and WebP quality in [1, 100], default 75.",
                            &quality, &ParseSigned);
    cmdline->AddOptionValue('\0', "subsample", "420|444",
                            "Chroma subsampling of JPEG output.",
                            &encode_params.chroma_subsampling,
                            &ParseSubsampling);
    cmdline->AddOptionValue('\0', "idct", "int|float",
                            "Inverse DCT used to decode JPEG input.",
                            &decode_params.idct, &ParseDctMethod);
    cmdline->AddOptionValue('\0', "fdct", "int|float",
                            "Forward DCT used to encode JPEG output.",
                            &encode_params.fdct, &ParseDctMethod);
    cmdline->AddOptionFlag('p', "progressive",
                           "Write a progressive JPEG file.",
                           &encode_params.progressive, &SetBooleanTrue);
    cmdline->AddOptionFlag('\0', "keep-metadata",
                           "Copy the EXIF and ICC metadata of the input.",
                           &encode_params.write_metadata, &SetBooleanTrue);
    cmdline->AddOptionValue(
        '\0', "op", "OPERATION",
        "resize:WxH, resizebilinear:WxH, resizefit:WxH or grayscale. May "
        "be repeated, the operations run in the given order.",
        &operations, &ParseAndAppendString);
  }

  const char* file_in = nullptr;
  const char* file_out = nullptr;
  int quality = 75;
  std::vector<std::string> operations;
  DecodeParams decode_params;
  EncodeParams encode_params;
};

int Convert(const ConvertArgs& args) {
  std::vector<ImageOperation> ops(args.operations.size());
  for (size_t i = 0; i < ops.size(); ++i) {
    if (!ParseImageOperation(args.operations[i], &ops[i])) {
      fprintf(stderr, "Invalid operation: %s\n", args.operations[i].c_str());
      return EXIT_FAILURE;
    }
  }
  if (args.quality < 1 || args.quality > 100) {
    fprintf(stderr, "Quality must be in [1, 100], got %d\n", args.quality);
    return EXIT_FAILURE;
  }
  const extras::Codec out_codec = extras::CodecFromPath(args.file_out);
  if (!extras::CanEncode(out_codec)) {
    fprintf(stderr, "Unsupported output format %s, supported are: %s\n",
            args.file_out, extras::ListOfCodecs().c_str());
    return EXIT_FAILURE;
  }

  std::vector<uint8_t> input;
  if (!ReadFile(args.file_in, &input)) return EXIT_FAILURE;
  PackedImage image;
  extras::Codec in_codec;
  if (!extras::DecodeBytes(input.data(), input.size(), args.decode_params,
                           &image, &in_codec)) {
    fprintf(stderr, "Failed to decode %s\n", args.file_in);
    return EXIT_FAILURE;
  }

  EncodeParams encode_params = args.encode_params;
  encode_params.quality = args.quality;
  if (in_codec == extras::Codec::kJPG && image.metadata.orientation != 1) {
    if (!extras::ApplyOrientation(image, image.metadata.orientation,
                                  &image)) {
      fprintf(stderr, "Failed to apply the EXIF orientation\n");
      return EXIT_FAILURE;
    }
    encode_params.orientation_applied = true;
  }
  if (!ApplyImageOperations(ops, &image)) {
    fprintf(stderr, "Failed to process the image\n");
    return EXIT_FAILURE;
  }

  std::vector<uint8_t> output;
  if (!extras::EncodeBytes(image, out_codec, encode_params, &output)) {
    fprintf(stderr, "Failed to encode %s\n", args.file_out);
    return EXIT_FAILURE;
  }
  if (!WriteFile(args.file_out, output)) return EXIT_FAILURE;
  return EXIT_SUCCESS;
}

}  // namespace
}  // namespace tools
}  // namespace jpegkit

int main(int argc, const char** argv) {
  jpegkit::tools::ConvertArgs args;
  jpegkit::tools::CommandLineParser cmdline;
  cmdline.SetDescription(
      "Converts between JPEG and other formats, optionally resizing the "
      "image.");
  cmdline.SetEpilog("Supported formats: " +
                    jpegkit::extras::ListOfCodecs() + ".");
  args.AddCommandLineOptions(&cmdline);

  if (!cmdline.Parse(argc, argv)) {
    fprintf(stderr, "See -h for help.\n");
    return EXIT_FAILURE;
  }

  if (cmdline.HelpFlagPassed()) {
    cmdline.PrintHelp();
    return EXIT_SUCCESS;
  }

  return jpegkit::tools::Convert(args);
}
