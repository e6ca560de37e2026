/**
 * @file workspace.hpp
 * @brief Artifact paths and scratch directory handling (internal)
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#pragma once

#include <filesystem>
#include <string>

namespace fwpipe::internal
{

/**
 * @brief Paths handed to the tools, as they appear on their command lines
 *
 * Inputs live in the working directory. Outputs live in the output
 * directory, which is either the working directory or the scratch
 * directory.
 */
struct ArtifactPaths
{
  std::string source;
  std::string library;
  std::string linker_script;

  std::string object;
  std::string image;
  std::string map;
  std::string binary;
};

/**
 * @brief Join a directory and a file name for use on a command line
 *
 * Returns the bare name when dir is empty or ".", so the default
 * configuration passes the same arguments a shell script run from the
 * working directory would.
 */
std::string join_path(const std::filesystem::path& dir, const std::string& name);

/**
 * @brief Owner of a uniquely named scratch directory
 *
 * The directory and everything in it is removed when the owner is
 * destroyed or remove() is called.
 */
class ScratchDir
{
 public:
  ScratchDir() = default;
  ~ScratchDir();

  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  /**
   * @brief Create a new directory named <prefix>XXXXXX under parent
   *
   * Removes any directory previously owned by this instance first.
   *
   * @param parent Existing parent directory
   * @param prefix Name prefix, completed by mkdtemp()
   * @return true on success, false if the directory could not be created
   */
  bool create(const std::filesystem::path& parent, const std::string& prefix);

  /**
   * @brief Remove the directory tree; no-op when nothing is owned
   */
  void remove();

  /**
   * @brief Rename <path>/<name> to <dest_dir>/<name>, replacing any existing file
   *
   * @return true on success
   */
  bool publish(const std::string& name, const std::filesystem::path& dest_dir) const;

  bool valid() const
  {
    return !path_.empty();
  }

  const std::filesystem::path& path() const
  {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

/**
 * @brief Exclusive lock on a directory's published artifact names
 *
 * flock() on <dir>/.fwpipe.lock. The lock belongs to the open file, so two
 * holders in one process exclude each other as well. Released on
 * destruction.
 */
class PublishLock
{
 public:
  PublishLock() = default;
  ~PublishLock();

  PublishLock(const PublishLock&) = delete;
  PublishLock& operator=(const PublishLock&) = delete;

  /**
   * @brief Block until the lock on dir is held
   *
   * @return true on success, false if the lock file could not be opened or locked
   */
  bool acquire(const std::filesystem::path& dir);

  /**
   * @brief Drop the lock; no-op when not held
   */
  void release();

  bool held() const
  {
    return fd_ >= 0;
  }

 private:
  int fd_ = -1;
};

/**
 * @brief Copy a file into an existing directory, preserving attributes
 *
 * Copies to a unique temporary name (mkstemp) in dest_dir, applies the source's permissions
 * and modification time, then renames over dest_dir/<filename>. Fails
 * without creating anything if dest_dir does not exist.
 *
 * @param src      File to install
 * @param dest_dir Existing destination directory
 * @return true on success
 */
bool install_file(const std::filesystem::path& src, const std::filesystem::path& dest_dir);

}  // namespace fwpipe::internal
