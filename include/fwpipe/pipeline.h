/**
 * @file pipeline.h
 * @brief fwpipe C API
 *
 * C-compatible interface for the firmware build pipeline.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <stddef.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /* ========================================================================= */
  /* Constants                                                                 */
  /* ========================================================================= */

  /** @brief Exit status of a tool that could not be started */
#define FWPIPE_EXIT_NOT_STARTED 127

  /* ========================================================================= */
  /* Stages                                                                    */
  /* ========================================================================= */

  typedef enum
  {
    FWPIPE_STAGE_NONE = 0,    /**< No stage */
    FWPIPE_STAGE_COMPILE = 1, /**< source -> object */
    FWPIPE_STAGE_LINK = 2,    /**< object -> image + map */
    FWPIPE_STAGE_EXTRACT = 3, /**< image -> raw binary */
    FWPIPE_STAGE_INSTALL = 4, /**< raw binary -> appbins */
  } fwpipe_stage_t;

  /**
   * @brief Get stage name
   * @param stage Stage
   * @return Stage name (static string)
   */
  const char* fwpipe_stage_name(fwpipe_stage_t stage);

  /* ========================================================================= */
  /* Error codes                                                               */
  /* ========================================================================= */

  typedef enum
  {
#define ERR(name, val, msg) FWPIPE_ERR_##name = val,
#include "fwpipe/errors.def"
#undef ERR
  } fwpipe_error_t;

  /**
   * @brief Get error message string
   * @param err Error code
   * @return Error message (static string)
   */
  const char* fwpipe_strerror(fwpipe_error_t err);

  /* ========================================================================= */
  /* Pipeline handle                                                           */
  /* ========================================================================= */

  /** @brief Opaque handle to Pipeline instance */
  typedef struct FwPipe FwPipe;

  /**
   * @brief Process runner callback type
   *
   * @param user User-defined context pointer
   * @param argv Program and arguments, argv[argc] is NULL
   * @param argc Number of arguments including the program
   * @return Exit status, FWPIPE_EXIT_NOT_STARTED if the program could not start
   */
  typedef int (*fwpipe_run_fn)(void* user, const char* const* argv, size_t argc);

  /* ========================================================================= */
  /* Lifecycle functions                                                       */
  /* ========================================================================= */

  /**
   * @brief Create a new Pipeline instance
   *
   * Starts from the FWPIPE_* environment configuration.
   *
   * @param work_dir     Working directory (NULL for the current directory)
   * @param install_dir  Destination directory (NULL for the default)
   * @param run          Process runner (NULL for the built-in runner)
   * @param user         User context pointer (passed to run)
   * @return Pointer to Pipeline instance, or NULL on allocation failure
   */
  FwPipe* fwpipe_create(const char* work_dir, const char* install_dir, fwpipe_run_fn run,
                        void* user);

  /**
   * @brief Destroy Pipeline instance and remove its scratch directory
   * @param pipe Pipeline instance (NULL-safe)
   */
  void fwpipe_destroy(FwPipe* pipe);

  /* ========================================================================= */
  /* Operation functions                                                       */
  /* ========================================================================= */

  /**
   * @brief Run the next stage
   * @param pipe Pipeline instance
   * @return FWPIPE_ERR_OK, the stage error, or FWPIPE_ERR_INVALID_STATE
   */
  fwpipe_error_t fwpipe_step(FwPipe* pipe);

  /**
   * @brief Run all remaining stages
   * @param pipe Pipeline instance
   * @return FWPIPE_ERR_OK on success, or the first error
   */
  fwpipe_error_t fwpipe_run(FwPipe* pipe);

  /**
   * @brief Return to the initial state
   * @param pipe Pipeline instance
   */
  void fwpipe_reset(FwPipe* pipe);

  /**
   * @brief Check whether all stages completed
   * @param pipe Pipeline instance
   * @return Non-zero when the blob has been installed
   */
  int fwpipe_done(const FwPipe* pipe);

  /**
   * @brief Get the stage that failed
   * @param pipe Pipeline instance
   * @return Failing stage, FWPIPE_STAGE_NONE if nothing failed
   */
  fwpipe_stage_t fwpipe_failed_stage(const FwPipe* pipe);

  /**
   * @brief Get the process exit code for the current outcome
   * @param pipe Pipeline instance
   * @return 0 on success, the failing tool's status, or 1 for internal errors
   */
  int fwpipe_exit_code(const FwPipe* pipe);

#ifdef __cplusplus
} /* extern "C" */
#endif
