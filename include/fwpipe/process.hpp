/**
 * @file process.hpp
 * @brief External tool execution
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <functional>
#include <string>
#include <vector>

namespace fwpipe
{

/**
 * @brief Process runner callback type
 *
 * Runs argv[0] (looked up on PATH) with the given arguments, waits for it
 * to exit and returns its exit status. Must return EXIT_NOT_STARTED when
 * the process could not be started, and EXIT_SIGNAL_BASE + signal when it
 * was killed by a signal.
 */
using RunFn = std::function<int(const std::vector<std::string>& argv)>;

/**
 * @brief Default runner: posix_spawnp() + waitpid()
 *
 * The child inherits the environment, working directory and standard
 * streams, so tool diagnostics reach the caller's stderr unchanged.
 * Blocks until the child exits; there is no timeout.
 *
 * @param argv Program and arguments (argv[0] is the program)
 * @return Exit status as described for RunFn
 */
int run_process(const std::vector<std::string>& argv);

/**
 * @brief Render argv as a single shell-quoted command line for tracing
 */
std::string format_command(const std::vector<std::string>& argv);

}  // namespace fwpipe
