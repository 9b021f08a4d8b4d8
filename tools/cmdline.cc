// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#include "tools/cmdline.h"

#include <memory>
#include <string>

namespace jpegkit {
namespace tools {

void CommandLineParser::PrintHelp() const {
  // stdout, so the help text can be piped.
  FILE* out = stdout;
  if (description_) fprintf(out, "%s\n\n", description_);
  fprintf(out, "Usage: %s", program_name_ ? program_name_ : "command");
  for (const auto& option : options_) {
    if (!option->positional() || option->verbosity_level() > verbosity) {
      continue;
    }
    const char* format = option->required() ? " %s" : " [%s]";
    fprintf(out, format, option->help_flags().c_str());
  }
  fprintf(out, " [OPTIONS...]\n");

  size_t num_hidden = 0;
  for (int pass = 0; pass < 2; ++pass) {
    const bool positional = pass == 0;
    fprintf(out, "\n%s:\n", positional ? "Arguments" : "Options");
    for (const auto& option : options_) {
      if (option->positional() != positional) continue;
      if (option->verbosity_level() > verbosity) {
        ++num_hidden;
        continue;
      }
      fprintf(out, " %s\n", option->help_flags().c_str());
      if (option->help_text()) fprintf(out, "    %s\n", option->help_text());
    }
  }
  fprintf(out, " -v, --verbose\n    Shows more options in the help.\n");
  fprintf(out, " -h, --help\n    Prints this help message%s.\n",
          num_hidden == 0 ? "" : " (use -v to see more options)");
  if (!epilog_.empty()) fprintf(out, "\n%s\n", epilog_.c_str());
}

bool CommandLineParser::ParseBuiltinFlag(const char* arg) {
  if (!strcmp("-h", arg) || !strcmp("--help", arg)) {
    help_ = true;
    return true;
  }
  if (!strcmp("-v", arg) || !strcmp("--verbose", arg)) {
    verbosity++;
    return true;
  }
  return false;
}

bool CommandLineParser::ParseOption(int argc, const char* argv[], int* i,
                                    bool parse_options) {
  const char* arg = argv[*i];
  for (const auto& option : options_) {
    if (!option->Match(arg, parse_options)) continue;
    // Advances *i past the option and its value.
    if (!option->Parse(argc, argv, i)) {
      fprintf(stderr, "Error parsing flag %s\n", arg);
      return false;
    }
    return true;
  }
  fprintf(stderr, "Unknown argument: %s\n", arg);
  return false;
}

bool CommandLineParser::CheckRequired() const {
  for (const auto& option : options_) {
    if (option->positional() && option->required() && !option->matched()) {
      fprintf(stderr, "Missing required argument %s\n",
              option->help_flags().c_str());
      return false;
    }
  }
  return true;
}

bool CommandLineParser::Parse(int argc, const char* argv[]) {
  if (argc > 0) program_name_ = argv[0];
  // After "--" every argument is positional.
  bool parse_options = true;
  int i = 1;
  while (i < argc) {
    if (parse_options && !strcmp("--", argv[i])) {
      parse_options = false;
      ++i;
    } else if (parse_options && ParseBuiltinFlag(argv[i])) {
      ++i;
    } else if (!ParseOption(argc, argv, &i, parse_options)) {
      return false;
    }
  }
  return help_ || CheckRequired();
}

}  // namespace tools
}  // namespace jpegkit
