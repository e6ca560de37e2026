/**
 * @file log.cpp
 * @brief fwpipe logger
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "fwpipe/log.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fwpipe
{

std::shared_ptr<spdlog::logger> logger()
{
  static const std::shared_ptr<spdlog::logger> instance = []
  {
    std::shared_ptr<spdlog::logger> existing = spdlog::get("fwpipe");
    if (existing)
    {
      return existing;
    }
    auto created = spdlog::stderr_color_mt("fwpipe");
    created->set_pattern("[%n] %^%l%$: %v");
    return created;
  }();
  return instance;
}

void init_logging()
{
  logger();
  spdlog::cfg::load_env_levels();
}

}  // namespace fwpipe
