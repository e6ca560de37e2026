/**
 * @file toolchain.hpp
 * @brief fwpipe toolchain definitions
 *
 * Fixed tool names, artifact names and target profile used to build a
 * userspace application image for the Cortex-M4 kernel.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstdint>

namespace fwpipe
{

/* ========================================================================= */
/* Tools                                                                     */
/* ========================================================================= */

/**
 * @brief Cross-compiler driver
 *
 * Used for both the compile stage (-c) and the link stage.
 */
constexpr const char* DEFAULT_CC = "arm-none-eabi-gcc";

/**
 * @brief Object-copy utility used to extract the raw image
 */
constexpr const char* DEFAULT_OBJCOPY = "arm-none-eabi-objcopy";

/* ========================================================================= */
/* Target profile                                                            */
/* ========================================================================= */

constexpr const char* DEFAULT_LANGUAGE_STD = "c99";
constexpr const char* DEFAULT_CPU = "cortex-m4";

/* ========================================================================= */
/* Artifacts                                                                 */
/* ========================================================================= */

/**
 * Artifact flow:
 *
 *   test.c --[compile]--> test.o
 *   test.o + libc_userspace.a + link.x --[link]--> test.elf + test.map
 *   test.elf --[extract]--> test.bin --[install]--> ../../kernel/appbins/test.bin
 *
 * Input names are relative to the working directory. The install
 * directory, when relative, is also resolved against the working directory
 * and must already exist.
 */
constexpr const char* DEFAULT_SOURCE = "test.c";
constexpr const char* DEFAULT_OBJECT = "test.o";
constexpr const char* DEFAULT_LIBRARY = "libc_userspace.a";
constexpr const char* DEFAULT_LINKER_SCRIPT = "link.x";
constexpr const char* DEFAULT_IMAGE = "test.elf";
constexpr const char* DEFAULT_MAP = "test.map";
constexpr const char* DEFAULT_BINARY = "test.bin";
constexpr const char* DEFAULT_INSTALL_DIR = "../../kernel/appbins";

/**
 * @brief Prefix of the per-invocation scratch directory
 *
 * Completed by mkdtemp(), e.g. ".fwpipe-Xa91Qz".
 */
constexpr const char* SCRATCH_PREFIX = ".fwpipe-";

/* ========================================================================= */
/* Process exit codes                                                        */
/* ========================================================================= */

constexpr int EXIT_OK = 0;
constexpr int EXIT_INTERNAL = 1;  ///< Pipeline-internal failure
constexpr int EXIT_USAGE = 2;     ///< Command-line usage error

/**
 * @brief Exit status reported when a tool could not be started
 *
 * Same value a POSIX shell uses for "command not found".
 */
constexpr int EXIT_NOT_STARTED = 127;

/**
 * @brief Base added to the signal number of a tool killed by a signal
 */
constexpr int EXIT_SIGNAL_BASE = 128;

/* ========================================================================= */
/* Stages and error codes                                                    */
/* ========================================================================= */

/**
 * @brief Pipeline stages, in execution order
 */
enum class Stage : uint8_t
{
  NONE = 0,     // No stage (success, or nothing run yet)
  COMPILE = 1,  // source -> object
  LINK = 2,     // object + library + script -> image + map
  EXTRACT = 3,  // image -> raw binary
  INSTALL = 4,  // raw binary -> appbins directory
};

/**
 * @brief Pipeline error codes
 *
 * Defined via errors.def so the C API shares the same values.
 */
enum class ErrorCode : uint8_t
{
#define ERR(name, val, msg) name = val,
#include "fwpipe/errors.def"
#undef ERR
};

/**
 * @brief Get the human-readable name of a stage
 */
const char* stage_name(Stage stage);

/**
 * @brief Get the message string of an error code
 */
const char* error_message(ErrorCode code);

}  // namespace fwpipe
