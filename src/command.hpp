/**
 * @file command.hpp
 * @brief Tool command line construction (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "fwpipe/config.hpp"
#include "fwpipe/internal/workspace.hpp"

namespace fwpipe
{
namespace internal
{

/**
 * @brief Resolve the paths the tools see
 *
 * @param config  Pipeline configuration (inputs are taken from work_dir)
 * @param out_dir Directory receiving object, image, map and binary
 * @return Paths ready for the command builders below
 */
ArtifactPaths resolve_paths(const Config& config, const std::filesystem::path& out_dir);

/**
 * @brief Build the compile command
 *
 * <cc> -std=<std> [-mthumb] -mcpu=<cpu> [-mhard-float] -c <source> -o <object>
 */
std::vector<std::string> compile_command(const Config& config, const ArtifactPaths& paths);

/**
 * @brief Build the link command
 *
 * <cc> --static -nostartfiles -T<script> -Wl,-Map=<map> -o <image> <object> <library>
 *
 * The object precedes the library so the library resolves its references.
 */
std::vector<std::string> link_command(const Config& config, const ArtifactPaths& paths);

/**
 * @brief Build the raw binary extraction command
 *
 * <objcopy> -O binary <image> <binary>
 */
std::vector<std::string> extract_command(const Config& config, const ArtifactPaths& paths);

}  // namespace internal
}  // namespace fwpipe
