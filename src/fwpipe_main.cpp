/**
 * @file fwpipe_main.cpp
 * @brief fwpipe command-line entry point
 *
 * Builds ./test.c into ../../kernel/appbins/test.bin. Takes no arguments;
 * settings come from FWPIPE_* environment variables.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <cstdio>
#include <cstring>

#include "fwpipe/config.hpp"
#include "fwpipe/log.hpp"
#include "fwpipe/pipeline.hpp"

static void print_usage(std::FILE* out)
{
  std::fprintf(out,
               "usage: fwpipe\n"
               "\n"
               "Compile, link and extract %s into %s, then install it into %s.\n"
               "\n"
               "environment:\n"
               "  FWPIPE_CC                  compiler driver (default %s)\n"
               "  FWPIPE_OBJCOPY             object-copy tool (default %s)\n"
               "  FWPIPE_INSTALL_DIR         destination directory (default %s)\n"
               "  FWPIPE_ISOLATE             0 to build in place (default 1)\n"
               "  FWPIPE_KEEP_INTERMEDIATES  0 to keep only the binary (default 1)\n"
               "  SPDLOG_LEVEL               log level (default info)\n",
               fwpipe::DEFAULT_SOURCE, fwpipe::DEFAULT_BINARY, fwpipe::DEFAULT_INSTALL_DIR,
               fwpipe::DEFAULT_CC, fwpipe::DEFAULT_OBJCOPY, fwpipe::DEFAULT_INSTALL_DIR);
}

int main(int argc, char** argv)
{
  if (argc > 1)
  {
    if (argc == 2 && (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0))
    {
      print_usage(stdout);
      return fwpipe::EXIT_OK;
    }
    print_usage(stderr);
    return fwpipe::EXIT_USAGE;
  }

  fwpipe::init_logging();

  fwpipe::Pipeline pipeline(fwpipe::Config::from_environment());
  return pipeline.run().exit_code;
}
