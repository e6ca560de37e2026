/**
 * @file process.cpp
 * @brief External tool execution
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "fwpipe/process.hpp"

#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <cerrno>
#include <cstring>

#include "fwpipe/log.hpp"
#include "fwpipe/toolchain.hpp"

extern char** environ;

namespace fwpipe
{

namespace
{

bool needs_quoting(const std::string& arg)
{
  if (arg.empty())
  {
    return true;
  }
  for (const char c : arg)
  {
    switch (c)
    {
      case ' ':
      case '\t':
      case '\n':
      case '\'':
      case '"':
      case '\\':
      case '$':
      case '`':
      case '*':
      case '?':
      case '&':
      case ';':
      case '|':
      case '<':
      case '>':
      case '(':
      case ')':
        return true;
      default:
        break;
    }
  }
  return false;
}

}  // namespace

int run_process(const std::vector<std::string>& argv)
{
  if (argv.empty())
  {
    return EXIT_NOT_STARTED;
  }

  std::vector<char*> cargs;
  cargs.reserve(argv.size() + 1);
  for (const auto& arg : argv)
  {
    cargs.push_back(const_cast<char*>(arg.c_str()));
  }
  cargs.push_back(nullptr);

  pid_t pid = -1;
  const int spawn_result = posix_spawnp(&pid, cargs[0], nullptr, nullptr, cargs.data(), environ);
  if (spawn_result != 0)
  {
    logger()->error("cannot start '{}': {}", argv[0], std::strerror(spawn_result));
    return EXIT_NOT_STARTED;
  }

  int status = 0;
  while (waitpid(pid, &status, 0) == -1)
  {
    if (errno != EINTR)
    {
      logger()->error("cannot wait for '{}': {}", argv[0], std::strerror(errno));
      return EXIT_INTERNAL;
    }
  }

  if (WIFEXITED(status))
  {
    return WEXITSTATUS(status);
  }

  if (WIFSIGNALED(status))
  {
    const int signal = WTERMSIG(status);
    logger()->error("'{}' terminated by signal {}", argv[0], signal);
    return EXIT_SIGNAL_BASE + signal;
  }

  return EXIT_INTERNAL;
}

std::string format_command(const std::vector<std::string>& argv)
{
  std::string line;
  for (size_t i = 0; i < argv.size(); ++i)
  {
    if (i > 0)
    {
      line.push_back(' ');
    }

    const std::string& arg = argv[i];
    if (!needs_quoting(arg))
    {
      line += arg;
      continue;
    }

    // Single-quote, closing and escaping embedded quotes: ' -> '\''
    line.push_back('\'');
    for (const char c : arg)
    {
      if (c == '\'')
      {
        line += "'\\''";
      }
      else
      {
        line.push_back(c);
      }
    }
    line.push_back('\'');
  }
  return line;
}

}  // namespace fwpipe
