/**
 * @file workspace.cpp
 * @brief Artifact paths and scratch directory handling
 *
 * @copyright Copyright 2025 Akihito Kirisaki
 * @license Dual-licensed under MIT or Apache-2.0
 */

#include "fwpipe/internal/workspace.hpp"

#include <fcntl.h>
#include <stdlib.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>

#include "fwpipe/log.hpp"

namespace fs = std::filesystem;

namespace fwpipe::internal
{

std::string join_path(const fs::path& dir, const std::string& name)
{
  if (dir.empty() || dir == ".")
  {
    return name;
  }
  return (dir / name).string();
}

ScratchDir::~ScratchDir()
{
  remove();
}

bool ScratchDir::create(const fs::path& parent, const std::string& prefix)
{
  remove();

  const std::string pattern = join_path(parent, prefix + "XXXXXX");
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back('\0');

  if (mkdtemp(buffer.data()) == nullptr)
  {
    logger()->error("cannot create scratch directory {}: {}", pattern, std::strerror(errno));
    return false;
  }

  path_ = fs::path(buffer.data());
  logger()->debug("created scratch directory {}", path_.string());
  return true;
}

void ScratchDir::remove()
{
  if (path_.empty())
  {
    return;
  }

  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec)
  {
    logger()->warn("cannot remove scratch directory {}: {}", path_.string(), ec.message());
  }
  else
  {
    logger()->debug("removed scratch directory {}", path_.string());
  }
  path_.clear();
}

bool ScratchDir::publish(const std::string& name, const fs::path& dest_dir) const
{
  const fs::path from = path_ / name;
  const fs::path to = dest_dir / name;

  std::error_code ec;
  fs::rename(from, to, ec);
  if (ec)
  {
    logger()->error("cannot move {} to {}: {}", from.string(), to.string(), ec.message());
    return false;
  }

  logger()->debug("published {}", to.string());
  return true;
}

PublishLock::~PublishLock()
{
  release();
}

bool PublishLock::acquire(const fs::path& dir)
{
  release();

  const std::string path = join_path(dir, ".fwpipe.lock");
  const int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0)
  {
    logger()->error("cannot open lock file {}: {}", path, std::strerror(errno));
    return false;
  }

  while (flock(fd, LOCK_EX) != 0)
  {
    if (errno != EINTR)
    {
      logger()->error("cannot lock {}: {}", path, std::strerror(errno));
      close(fd);
      return false;
    }
  }

  fd_ = fd;
  return true;
}

void PublishLock::release()
{
  if (fd_ < 0)
  {
    return;
  }
  flock(fd_, LOCK_UN);
  close(fd_);
  fd_ = -1;
}

bool install_file(const fs::path& src, const fs::path& dest_dir)
{
  std::error_code ec;
  if (!fs::is_directory(dest_dir, ec))
  {
    logger()->error("cannot install {}: directory {} does not exist", src.string(),
                    dest_dir.string());
    return false;
  }

  const std::string name = src.filename().string();
  const fs::path dest = dest_dir / name;

  const std::string pattern = (dest_dir / ("." + name + ".XXXXXX")).string();
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back('\0');
  const int fd = mkstemp(buffer.data());
  if (fd < 0)
  {
    logger()->error("cannot create temporary file in {}: {}", dest_dir.string(),
                    std::strerror(errno));
    return false;
  }
  close(fd);
  const fs::path temp(buffer.data());

  if (!fs::copy_file(src, temp, fs::copy_options::overwrite_existing, ec))
  {
    logger()->error("cannot copy {} to {}: {}", src.string(), temp.string(), ec.message());
    std::error_code ignored;
    fs::remove(temp, ignored);
    return false;
  }

  // Preserve mode and mtime the way cp -a does
  const fs::file_status src_status = fs::status(src, ec);
  if (!ec)
  {
    fs::permissions(temp, src_status.permissions(), fs::perm_options::replace, ec);
  }
  if (!ec)
  {
    const fs::file_time_type mtime = fs::last_write_time(src, ec);
    if (!ec)
    {
      fs::last_write_time(temp, mtime, ec);
    }
  }
  if (!ec)
  {
    fs::rename(temp, dest, ec);
  }

  if (ec)
  {
    logger()->error("cannot install {}: {}", dest.string(), ec.message());
    std::error_code ignored;
    fs::remove(temp, ignored);
    return false;
  }

  return true;
}

}  // namespace fwpipe::internal
