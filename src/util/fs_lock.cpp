// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/fs_lock.hpp"

#include "util/logging.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace ziacoin {
namespace util {

DirectoryLock::DirectoryLock(const std::filesystem::path &directory,
                             const std::string &name)
    : path_(directory / name) {}

DirectoryLock::~DirectoryLock() { Release(); }

DirectoryLock::Result DirectoryLock::Acquire() {
  if (fd_ != -1) {
    return Result::Success;
  }

  // O_CLOEXEC keeps the lock from leaking into child processes
  int fd = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd == -1) {
    reason_ = std::strerror(errno);
    LOG_ERROR("Failed to open lock file {}: {}", path_.string(), reason_);
    return Result::ErrorWrite;
  }

  if (flock(fd, LOCK_EX | LOCK_NB) == -1) {
    reason_ = std::strerror(errno);
    close(fd);
    LOG_ERROR("Failed to lock {}: {}", path_.string(), reason_);
    return Result::ErrorLock;
  }

  fd_ = fd;
  LOG_TRACE("Acquired directory lock {}", path_.string());
  return Result::Success;
}

void DirectoryLock::Release() {
  if (fd_ == -1) {
    return;
  }
  flock(fd_, LOCK_UN);
  close(fd_);
  fd_ = -1;
}

} // namespace util
} // namespace ziacoin
