/**
 * @file log.hpp
 * @brief fwpipe logger
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace fwpipe
{

/**
 * @brief Get the "fwpipe" logger, creating it on first use
 *
 * Writes to stderr, colored when stderr is a terminal.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Create the logger and apply levels from SPDLOG_LEVEL
 *
 * e.g. SPDLOG_LEVEL=debug, or SPDLOG_LEVEL=fwpipe=warn
 */
void init_logging();

}  // namespace fwpipe
