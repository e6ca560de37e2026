/**
 * @file pipeline.cpp
 * @brief fwpipe main implementation
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "fwpipe/pipeline.hpp"

#include <system_error>
#include <utility>

#include "command.hpp"
#include "crc32.hpp"
#include "fwpipe/log.hpp"

namespace fs = std::filesystem;

namespace fwpipe
{

Pipeline::Pipeline(Config config, RunFn run)
    : config_(std::move(config)),
      run_(std::move(run)),
      state_(State::COMPILE),
      result_(),
      scratch_(),
      paths_()
{
}

Pipeline::~Pipeline() = default;

ErrorCode Pipeline::step()
{
  switch (state_)
  {
    case State::COMPILE:
      handle_compile();
      break;

    case State::LINK:
      handle_link();
      break;

    case State::EXTRACT:
      handle_extract();
      break;

    case State::INSTALL:
      handle_install();
      break;

    case State::DONE:
    case State::FAILED:
      return ErrorCode::INVALID_STATE;
  }

  return result_.error;
}

const Result& Pipeline::run()
{
  while (state_ != State::DONE && state_ != State::FAILED)
  {
    step();
  }
  return result_;
}

void Pipeline::reset()
{
  scratch_.remove();
  paths_ = internal::ArtifactPaths();
  result_ = Result();
  state_ = State::COMPILE;
}

void Pipeline::handle_compile()
{
  if (!prepare_workspace())
  {
    fail(Stage::COMPILE, ErrorCode::WORKSPACE_ERROR, EXIT_INTERNAL);
    return;
  }

  if (!require_input(Stage::COMPILE, paths_.source))
  {
    return;
  }

  if (!run_tool(Stage::COMPILE, internal::compile_command(config_, paths_)))
  {
    return;
  }

  state_ = State::LINK;
}

void Pipeline::handle_link()
{
  // Checked here rather than up front so a bad library is still a link failure
  if (!require_input(Stage::LINK, paths_.linker_script) ||
      !require_input(Stage::LINK, paths_.library))
  {
    return;
  }

  if (!run_tool(Stage::LINK, internal::link_command(config_, paths_)))
  {
    return;
  }

  state_ = State::EXTRACT;
}

void Pipeline::handle_extract()
{
  if (!run_tool(Stage::EXTRACT, internal::extract_command(config_, paths_)))
  {
    return;
  }

  if (!internal::file_crc32(paths_.binary, result_.blob_size, result_.blob_crc32))
  {
    logger()->error("cannot read {}", paths_.binary);
    fail(Stage::EXTRACT, ErrorCode::WORKSPACE_ERROR, EXIT_INTERNAL);
    return;
  }

  state_ = State::INSTALL;
}

void Pipeline::handle_install()
{
  const fs::path dest_dir = config_.resolved_install_dir();

  // Install and publication of one run must not interleave with another's
  internal::PublishLock lock;
  if (config_.isolate && !lock.acquire(config_.work_dir))
  {
    fail(Stage::INSTALL, ErrorCode::WORKSPACE_ERROR, EXIT_INTERNAL);
    return;
  }

  // The blob checksummed in EXTRACT, still private to this run
  logger()->info("+ cp -a {} {}", paths_.binary, dest_dir.string());
  const bool installed = internal::install_file(paths_.binary, dest_dir);

  // Local artifacts are kept even when the copy failed
  if (!publish_artifacts())
  {
    fail(Stage::INSTALL, ErrorCode::WORKSPACE_ERROR, EXIT_INTERNAL);
    return;
  }

  if (!installed)
  {
    fail(Stage::INSTALL, ErrorCode::INSTALL_FAILED, EXIT_INTERNAL);
    return;
  }

  logger()->info("installed {} ({} bytes, crc32 {:08x})", (dest_dir / config_.binary).string(),
                 result_.blob_size, result_.blob_crc32);
  state_ = State::DONE;
}

bool Pipeline::prepare_workspace()
{
  if (!config_.isolate)
  {
    paths_ = internal::resolve_paths(config_, config_.work_dir);
    return true;
  }

  if (!scratch_.create(config_.work_dir, SCRATCH_PREFIX))
  {
    return false;
  }

  paths_ = internal::resolve_paths(config_, scratch_.path());
  return true;
}

bool Pipeline::require_input(Stage stage, const std::string& path)
{
  std::error_code ec;
  if (fs::is_regular_file(path, ec))
  {
    return true;
  }

  logger()->error("{}: missing input {}", stage_name(stage), path);
  fail(stage, ErrorCode::MISSING_INPUT, EXIT_INTERNAL);
  return false;
}

bool Pipeline::run_tool(Stage stage, const std::vector<std::string>& argv)
{
  logger()->info("+ {}", format_command(argv));

  const int status = run_(argv);
  if (status == EXIT_OK)
  {
    return true;
  }

  // Only 1..255 survive as a process exit code
  if (status < 0 || status > 255)
  {
    logger()->error("{} returned status {}", argv[0], status);
    fail(stage, ErrorCode::TOOL_FAILED, EXIT_INTERNAL);
    return false;
  }

  if (status == EXIT_NOT_STARTED)
  {
    fail(stage, ErrorCode::SPAWN_FAILED, status);
  }
  else
  {
    fail(stage, ErrorCode::TOOL_FAILED, status);
  }
  return false;
}

bool Pipeline::publish_artifacts()
{
  if (!config_.isolate)
  {
    if (!config_.keep_intermediates)
    {
      for (const std::string* path : {&paths_.object, &paths_.image, &paths_.map})
      {
        std::error_code ec;
        fs::remove(*path, ec);
        if (ec)
        {
          logger()->warn("cannot remove {}: {}", *path, ec.message());
        }
      }
    }
    return true;
  }

  if (config_.keep_intermediates)
  {
    for (const std::string* name : {&config_.object, &config_.image, &config_.map})
    {
      if (!scratch_.publish(*name, config_.work_dir))
      {
        return false;
      }
    }
  }

  // Blob last: its presence in work_dir means the whole set is in place.
  // Callers hold the PublishLock, so sets from concurrent runs never mix.
  if (!scratch_.publish(config_.binary, config_.work_dir))
  {
    return false;
  }

  scratch_.remove();
  return true;
}

void Pipeline::fail(Stage stage, ErrorCode code, int exit_code)
{
  result_.error = code;
  result_.stage = stage;
  result_.exit_code = exit_code;
  state_ = State::FAILED;

  logger()->error("{} stage failed: {} (exit {})", stage_name(stage), error_message(code),
                  exit_code);

  scratch_.remove();
}

}  // namespace fwpipe
