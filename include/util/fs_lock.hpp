// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace ziacoin {
namespace util {

/**
 * Exclusive lock on a data directory.
 *
 * Holds flock(LOCK_EX) on <directory>/<name> for as long as the object lives
 * (or until Release()). flock locks belong to the open file description, so
 * a second DirectoryLock on the same directory fails even inside the same
 * process.
 */
class DirectoryLock {
public:
  enum class Result {
    Success,
    ErrorWrite, // Could not create or open the lock file
    ErrorLock,  // Held by someone else
  };

  explicit DirectoryLock(const std::filesystem::path &directory,
                         const std::string &name = ".lock");
  ~DirectoryLock();

  DirectoryLock(const DirectoryLock &) = delete;
  DirectoryLock &operator=(const DirectoryLock &) = delete;

  Result Acquire();
  void Release();

  bool IsHeld() const { return fd_ != -1; }
  const std::string &GetReason() const { return reason_; }
  const std::filesystem::path &GetPath() const { return path_; }

private:
  std::filesystem::path path_;
  int fd_{-1};
  std::string reason_;
};

} // namespace util
} // namespace ziacoin
