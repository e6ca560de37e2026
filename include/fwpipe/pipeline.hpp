/**
 * @file pipeline.hpp
 * @brief fwpipe main API
 *
 * Builds a raw firmware image for a Cortex-M4 userspace application by
 * running the cross toolchain in three fixed stages, then installs the
 * image where the kernel build picks it up.
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "fwpipe/config.hpp"
#include "fwpipe/internal/workspace.hpp"
#include "fwpipe/process.hpp"
#include "fwpipe/toolchain.hpp"

namespace fwpipe
{

/**
 * @brief Outcome of a pipeline run
 */
struct Result
{
  ErrorCode error = ErrorCode::OK;
  Stage stage = Stage::NONE;  ///< Failing stage, NONE on success
  int exit_code = EXIT_OK;    ///< Process exit code for this outcome

  uintmax_t blob_size = 0;   ///< Size of the extracted binary
  uint32_t blob_crc32 = 0;   ///< CRC-32 of the extracted binary

  bool ok() const
  {
    return error == ErrorCode::OK;
  }
};

/**
 * @brief Firmware build pipeline
 *
 * Runs compile, link, extract and install strictly in order. The first
 * failure stops the pipeline; later stages are never entered.
 *
 * With Config::isolate set, all tool outputs go to a private scratch
 * directory inside the working directory. The install stage copies the
 * blob from there, then renames the artifacts to their fixed names, both
 * under a PublishLock on the working directory. The scratch directory is
 * removed on every path out of the pipeline, including destruction.
 *
 * Example usage:
 * @code
 * fwpipe::Pipeline pipeline(fwpipe::Config::from_environment());
 * const fwpipe::Result result = pipeline.run();
 * return result.exit_code;
 * @endcode
 */
class Pipeline
{
 public:
  /**
   * @brief Pipeline state: the stage that runs on the next step()
   */
  enum class State
  {
    COMPILE,  // Nothing run yet
    LINK,     // Object file built
    EXTRACT,  // Image and map linked
    INSTALL,  // Blob extracted and checksummed, not yet installed or published
    DONE,     // Blob installed, artifacts published to work_dir
    FAILED,   // A stage failed, see result()
  };

  /**
   * @brief Construct Pipeline instance
   *
   * @param config Pipeline configuration
   * @param run    Process runner (default: run_process)
   */
  explicit Pipeline(Config config, RunFn run = run_process);

  ~Pipeline();

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  /**
   * @brief Run the next stage
   *
   * @return OK if the stage succeeded, the stage's error on failure, or
   *         INVALID_STATE if the pipeline is DONE or FAILED
   */
  ErrorCode step();

  /**
   * @brief Step until DONE or FAILED
   *
   * @return Final result
   */
  const Result& run();

  /**
   * @brief Return to the COMPILE state
   *
   * Discards the scratch directory and the previous result. Published
   * artifacts stay in place.
   */
  void reset();

  State state() const
  {
    return state_;
  }

  const Result& result() const
  {
    return result_;
  }

  const Config& config() const
  {
    return config_;
  }

 private:
  void handle_compile();
  void handle_link();
  void handle_extract();
  void handle_install();

  /**
   * @brief Create the scratch directory and resolve artifact paths
   */
  bool prepare_workspace();

  /**
   * @brief Check that a stage input exists, failing the stage if not
   */
  bool require_input(Stage stage, const std::string& path);

  /**
   * @brief Trace and run one tool, failing the stage on non-zero exit
   */
  bool run_tool(Stage stage, const std::vector<std::string>& argv);

  /**
   * @brief Move artifacts from the scratch directory to work_dir
   *
   * Caller holds the PublishLock.
   */
  bool publish_artifacts();

  /**
   * @brief Record a failure and enter FAILED
   */
  void fail(Stage stage, ErrorCode code, int exit_code);

  Config config_;                  ///< Pipeline configuration
  RunFn run_;                      ///< Process runner
  State state_;                    ///< Next stage
  Result result_;                  ///< Outcome so far
  internal::ScratchDir scratch_;   ///< Private output directory (isolate mode)
  internal::ArtifactPaths paths_;  ///< Tool input and output paths
};

}  // namespace fwpipe
