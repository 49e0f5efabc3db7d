// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/files.hpp"

#include <cstdio>
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <random>
#include <unistd.h>

namespace ziacoin {
namespace util {

namespace {

constexpr std::uintmax_t kMaxReadSize = 100 * 1024 * 1024;

bool fsync_directory(const std::filesystem::path &dir) {
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0) {
    return false;
  }
  const bool ok = ::fsync(fd) == 0;
  ::close(fd);
  return ok;
}

std::string temp_suffix() {
  static thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<unsigned> dist(0, 0xFFFFFF);
  char buf[12];
  std::snprintf(buf, sizeof(buf), ".tmp.%06x", dist(gen));
  return buf;
}

} // namespace

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode) {
  const auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    return false;
  }

  auto tmp = path;
  tmp += temp_suffix();

  const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode);
  if (fd < 0) {
    return false;
  }

  std::error_code ec;
  size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n <= 0) {
      ::close(fd);
      std::filesystem::remove(tmp, ec);
      return false;
    }
    written += static_cast<size_t>(n);
  }

  if (::fsync(fd) != 0) {
    ::close(fd);
    std::filesystem::remove(tmp, ec);
    return false;
  }
  ::close(fd);

  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    return false;
  }
  return parent.empty() || fsync_directory(parent);
}

std::string read_file_string(const std::filesystem::path &path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec || size > kMaxReadSize) {
    return {};
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return {};
  }
  std::string data(static_cast<size_t>(size), '\0');
  in.read(data.data(), static_cast<std::streamsize>(size));
  if (!in) {
    return {};
  }
  return data;
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return std::filesystem::is_directory(dir, ec);
}

bool copy_directory(const std::filesystem::path &from,
                    const std::filesystem::path &to) {
  std::error_code ec;
  if (!std::filesystem::is_directory(from, ec)) {
    return false;
  }
  std::filesystem::remove_all(to, ec);
  if (ec) {
    return false;
  }
  std::filesystem::copy(from, to, std::filesystem::copy_options::recursive,
                        ec);
  return !ec;
}

std::filesystem::path get_default_datadir() {
  if (const char *home = std::getenv("HOME")) {
    return std::filesystem::path(home) / ".ziacoin";
  }
  return std::filesystem::current_path() / ".ziacoin";
}

} // namespace util
} // namespace ziacoin
