/**
 * @file command.cpp
 * @brief Tool command line construction
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "command.hpp"

namespace fwpipe
{
namespace internal
{

ArtifactPaths resolve_paths(const Config& config, const std::filesystem::path& out_dir)
{
  ArtifactPaths paths;

  paths.source = join_path(config.work_dir, config.source);
  paths.library = join_path(config.work_dir, config.library);
  paths.linker_script = join_path(config.work_dir, config.linker_script);

  paths.object = join_path(out_dir, config.object);
  paths.image = join_path(out_dir, config.image);
  paths.map = join_path(out_dir, config.map);
  paths.binary = join_path(out_dir, config.binary);

  return paths;
}

std::vector<std::string> compile_command(const Config& config, const ArtifactPaths& paths)
{
  std::vector<std::string> argv;
  argv.reserve(10);

  argv.push_back(config.cc);
  argv.push_back("-std=" + config.target.language_std);
  if (config.target.thumb)
  {
    argv.push_back("-mthumb");
  }
  argv.push_back("-mcpu=" + config.target.cpu);
  if (config.target.hard_float)
  {
    argv.push_back("-mhard-float");
  }
  argv.push_back("-c");
  argv.push_back(paths.source);
  argv.push_back("-o");
  argv.push_back(paths.object);

  return argv;
}

std::vector<std::string> link_command(const Config& config, const ArtifactPaths& paths)
{
  return {
      config.cc,
      "--static",
      "-nostartfiles",
      "-T" + paths.linker_script,
      "-Wl,-Map=" + paths.map,
      "-o",
      paths.image,
      paths.object,
      paths.library,
  };
}

std::vector<std::string> extract_command(const Config& config, const ArtifactPaths& paths)
{
  return {config.objcopy, "-O", "binary", paths.image, paths.binary};
}

}  // namespace internal
}  // namespace fwpipe
