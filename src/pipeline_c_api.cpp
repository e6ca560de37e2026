/**
 * @file pipeline_c_api.cpp
 * @brief fwpipe C API implementation
 *
 * C wrapper for the C++ Pipeline class.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include <new>
#include <string>
#include <utility>
#include <vector>

#include "fwpipe/pipeline.h"
#include "fwpipe/pipeline.hpp"

using namespace fwpipe;

/* ========================================================================= */
/* Internal wrapper structure                                                */
/* ========================================================================= */

struct FwPipe
{
  Pipeline* cpp_pipeline;
  void* user;
  fwpipe_run_fn run;

  FwPipe(Config config, fwpipe_run_fn run_fn, void* user_ctx)
      : cpp_pipeline(nullptr), user(user_ctx), run(run_fn)
  {
    if (run == nullptr)
    {
      cpp_pipeline = new (std::nothrow) Pipeline(std::move(config));
      return;
    }

    // Adapt the C callback to the C++ runner signature
    cpp_pipeline = new (std::nothrow) Pipeline(
        std::move(config),
        [this](const std::vector<std::string>& argv)
        {
          std::vector<const char*> cargs;
          cargs.reserve(argv.size() + 1);
          for (const auto& arg : argv)
          {
            cargs.push_back(arg.c_str());
          }
          cargs.push_back(nullptr);
          return run(user, cargs.data(), argv.size());
        });
  }

  ~FwPipe()
  {
    delete cpp_pipeline;
  }
};

/* ========================================================================= */
/* Name strings                                                              */
/* ========================================================================= */

const char* fwpipe_strerror(fwpipe_error_t err)
{
  switch (err)
  {
#define ERR(name, val, msg) \
  case FWPIPE_ERR_##name:   \
    return msg;
#include "fwpipe/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

const char* fwpipe_stage_name(fwpipe_stage_t stage)
{
  return stage_name(static_cast<Stage>(stage));
}

/* ========================================================================= */
/* Lifecycle functions                                                       */
/* ========================================================================= */

FwPipe* fwpipe_create(const char* work_dir, const char* install_dir, fwpipe_run_fn run,
                      void* user)
{
  Config config = Config::from_environment();

  if (work_dir != nullptr)
  {
    config.work_dir = work_dir;
  }

  if (install_dir != nullptr)
  {
    config.install_dir = install_dir;
  }

  FwPipe* pipe = new (std::nothrow) FwPipe(std::move(config), run, user);
  if (pipe == nullptr || pipe->cpp_pipeline == nullptr)
  {
    delete pipe;
    return nullptr;
  }

  return pipe;
}

void fwpipe_destroy(FwPipe* pipe)
{
  delete pipe;
}

/* ========================================================================= */
/* Operation functions                                                       */
/* ========================================================================= */

fwpipe_error_t fwpipe_step(FwPipe* pipe)
{
  if (pipe && pipe->cpp_pipeline)
  {
    return static_cast<fwpipe_error_t>(pipe->cpp_pipeline->step());
  }
  return FWPIPE_ERR_INVALID_STATE;
}

fwpipe_error_t fwpipe_run(FwPipe* pipe)
{
  if (pipe && pipe->cpp_pipeline)
  {
    return static_cast<fwpipe_error_t>(pipe->cpp_pipeline->run().error);
  }
  return FWPIPE_ERR_INVALID_STATE;
}

void fwpipe_reset(FwPipe* pipe)
{
  if (pipe && pipe->cpp_pipeline)
  {
    pipe->cpp_pipeline->reset();
  }
}

int fwpipe_done(const FwPipe* pipe)
{
  if (pipe && pipe->cpp_pipeline)
  {
    return pipe->cpp_pipeline->state() == Pipeline::State::DONE ? 1 : 0;
  }
  return 0;
}

fwpipe_stage_t fwpipe_failed_stage(const FwPipe* pipe)
{
  if (pipe && pipe->cpp_pipeline)
  {
    return static_cast<fwpipe_stage_t>(pipe->cpp_pipeline->result().stage);
  }
  return FWPIPE_STAGE_NONE;
}

int fwpipe_exit_code(const FwPipe* pipe)
{
  if (pipe && pipe->cpp_pipeline)
  {
    return pipe->cpp_pipeline->result().exit_code;
  }
  return EXIT_INTERNAL;
}
