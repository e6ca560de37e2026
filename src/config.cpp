/**
 * @file config.cpp
 * @brief Pipeline configuration
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "fwpipe/config.hpp"

#include <cstdlib>
#include <string>

#include "fwpipe/log.hpp"

namespace fwpipe
{

namespace
{

const char* env_value(const char* name)
{
  const char* value = std::getenv(name);
  if (value == nullptr || value[0] == '\0')
  {
    return nullptr;
  }
  return value;
}

void apply_string(const char* name, std::string& field)
{
  if (const char* value = env_value(name))
  {
    field = value;
  }
}

void apply_bool(const char* name, bool& field)
{
  const char* value = env_value(name);
  if (value == nullptr)
  {
    return;
  }

  const std::string v(value);
  if (v == "1" || v == "true" || v == "on" || v == "yes")
  {
    field = true;
  }
  else if (v == "0" || v == "false" || v == "off" || v == "no")
  {
    field = false;
  }
  else
  {
    logger()->warn("ignoring {}={}: expected 0 or 1", name, v);
  }
}

}  // namespace

std::filesystem::path Config::resolved_install_dir() const
{
  if (install_dir.is_absolute())
  {
    return install_dir;
  }
  return work_dir / install_dir;
}

Config Config::from_environment()
{
  Config config;

  apply_string("FWPIPE_CC", config.cc);
  apply_string("FWPIPE_OBJCOPY", config.objcopy);

  if (const char* dir = env_value("FWPIPE_INSTALL_DIR"))
  {
    config.install_dir = dir;
  }

  apply_bool("FWPIPE_ISOLATE", config.isolate);
  apply_bool("FWPIPE_KEEP_INTERMEDIATES", config.keep_intermediates);

  return config;
}

}  // namespace fwpipe
