/**
 * @file config.hpp
 * @brief fwpipe pipeline configuration
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <filesystem>
#include <string>

#include "fwpipe/toolchain.hpp"

namespace fwpipe
{

/**
 * @brief Code generation profile passed to the compile stage
 *
 * Renders as: -std=<language_std> [-mthumb] -mcpu=<cpu> [-mhard-float]
 */
struct TargetProfile
{
  std::string language_std = DEFAULT_LANGUAGE_STD;
  std::string cpu = DEFAULT_CPU;
  bool thumb = true;       ///< Thumb instruction encoding
  bool hard_float = true;  ///< Hardware floating point
};

/**
 * @brief Pipeline configuration
 *
 * Every field defaults to the fixed value the firmware tree expects, so a
 * default-constructed Config builds test.c into ../../kernel/appbins/test.bin
 * from the current directory.
 */
struct Config
{
  std::string cc = DEFAULT_CC;
  std::string objcopy = DEFAULT_OBJCOPY;
  TargetProfile target;

  std::string source = DEFAULT_SOURCE;
  std::string object = DEFAULT_OBJECT;
  std::string library = DEFAULT_LIBRARY;
  std::string linker_script = DEFAULT_LINKER_SCRIPT;
  std::string image = DEFAULT_IMAGE;
  std::string map = DEFAULT_MAP;
  std::string binary = DEFAULT_BINARY;

  std::filesystem::path work_dir = ".";
  std::filesystem::path install_dir = DEFAULT_INSTALL_DIR;  ///< Relative to work_dir unless absolute

  /**
   * @brief Build intermediates in a private scratch directory
   *
   * When false, tools write directly to the fixed names in work_dir and
   * concurrent invocations in the same directory race.
   */
  bool isolate = true;

  /**
   * @brief Leave object, image and map next to the blob after a successful run
   *
   * With isolate set, the published map names the object as
   * .fwpipe-XXXXXX/test.o, the scratch path the linker was given. That
   * directory no longer exists once the run finishes.
   */
  bool keep_intermediates = true;

  /**
   * @brief Destination directory with work_dir applied
   */
  std::filesystem::path resolved_install_dir() const;

  /**
   * @brief Default configuration overlaid with FWPIPE_* environment variables
   *
   * FWPIPE_CC, FWPIPE_OBJCOPY, FWPIPE_INSTALL_DIR, FWPIPE_ISOLATE,
   * FWPIPE_KEEP_INTERMEDIATES. Boolean variables accept 0/1, true/false,
   * on/off, yes/no; any other value leaves the default in place.
   */
  static Config from_environment();
};

}  // namespace fwpipe
