// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "tools/cmdline.h"

#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "lib/jpegkit/types.h"
#include "tools/args.h"

namespace jpegkit {
namespace tools {
namespace {

struct TestArgs {
  void AddCommandLineOptions(CommandLineParser* cmdline) {
    cmdline->AddPositionalOption("INPUT", /* required = */ true, "Input.",
                                 &file_in);
    cmdline->AddPositionalOption("OUTPUT", /* required = */ false, "Output.",
                                 &file_out);
    cmdline->AddOptionValue('q', "quality", "N", "Quality.", &quality,
                            &ParseSigned);
    cmdline->AddOptionValue('\0', "idct", "int|float", "IDCT.", &idct,
                            &ParseDctMethod);
    cmdline->AddOptionFlag('p', "progressive", "Progressive.", &progressive,
                           &SetBooleanTrue);
    cmdline->AddOptionValue('\0', "op", "OPERATION", "Operation.", &ops,
                            &ParseAndAppendString);
  }

  const char* file_in = nullptr;
  const char* file_out = nullptr;
  int quality = 75;
  DctMethod idct = DctMethod::kInteger;
  bool progressive = false;
  std::vector<std::string> ops;
};

bool ParseArgs(const std::vector<const char*>& argv, TestArgs* args,
               CommandLineParser* cmdline) {
  args->AddCommandLineOptions(cmdline);
  return cmdline->Parse(argv.size(), const_cast<const char**>(argv.data()));
}

TEST(CmdlineTest, ParsesOptionsAndPositionals) {
  TestArgs args;
  CommandLineParser cmdline;
  ASSERT_TRUE(ParseArgs({"convert", "in.jpg", "-q", "90", "--idct=float",
                         "out.ppm", "-p", "--op", "grayscale", "--op",
                         "resize:4x4"},
                        &args, &cmdline));
  EXPECT_STREQ("in.jpg", args.file_in);
  EXPECT_STREQ("out.ppm", args.file_out);
  EXPECT_EQ(90, args.quality);
  EXPECT_EQ(DctMethod::kFloat, args.idct);
  EXPECT_TRUE(args.progressive);
  EXPECT_EQ(std::vector<std::string>({"grayscale", "resize:4x4"}), args.ops);
  EXPECT_FALSE(cmdline.HelpFlagPassed());
}

TEST(CmdlineTest, OptionalPositionalMayBeMissing) {
  TestArgs args;
  CommandLineParser cmdline;
  ASSERT_TRUE(ParseArgs({"convert", "in.jpg"}, &args, &cmdline));
  EXPECT_EQ(nullptr, args.file_out);
}

TEST(CmdlineTest, MissingRequiredPositional) {
  TestArgs args;
  CommandLineParser cmdline;
  EXPECT_FALSE(ParseArgs({"convert", "-q", "50"}, &args, &cmdline));
}

TEST(CmdlineTest, HelpSkipsRequiredCheck) {
  TestArgs args;
  CommandLineParser cmdline;
  ASSERT_TRUE(ParseArgs({"convert", "--help"}, &args, &cmdline));
  EXPECT_TRUE(cmdline.HelpFlagPassed());
}

TEST(CmdlineTest, Errors) {
  {
    TestArgs args;
    CommandLineParser cmdline;
    EXPECT_FALSE(ParseArgs({"convert", "in.jpg", "--unknown"}, &args,
                           &cmdline));
  }
  {
    TestArgs args;
    CommandLineParser cmdline;
    EXPECT_FALSE(
        ParseArgs({"convert", "in.jpg", "--idct", "fast"}, &args, &cmdline));
  }
  {
    TestArgs args;
    CommandLineParser cmdline;
    EXPECT_FALSE(
        ParseArgs({"convert", "a.jpg", "b.ppm", "c.png"}, &args, &cmdline));
  }
}

TEST(CmdlineTest, DoubleDashEndsOptions) {
  TestArgs args;
  CommandLineParser cmdline;
  ASSERT_TRUE(ParseArgs({"convert", "--", "-in.jpg"}, &args, &cmdline));
  EXPECT_STREQ("-in.jpg", args.file_in);
}

}  // namespace
}  // namespace tools
}  // namespace jpegkit
