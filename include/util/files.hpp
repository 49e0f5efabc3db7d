// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace ziacoin {
namespace util {

/**
 * Crash-safe file replacement.
 *
 * Data goes to "<path>.tmp.<rand>", is fsync'd, the parent directory is
 * fsync'd, and the temp file is renamed over <path>. Readers therefore see
 * either the old or the new content, never a torn write.
 *
 * @param mode permission bits for the new file
 * @return false on any I/O error (the temp file is removed)
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode = 0644);

// Whole file as a string; empty on error or if larger than 100 MiB
std::string read_file_string(const std::filesystem::path &path);

// Recursive mkdir; true if the directory exists afterwards
bool ensure_directory(const std::filesystem::path &dir);

// Recursive copy of a directory tree, replacing `to` if it exists
bool copy_directory(const std::filesystem::path &from,
                    const std::filesystem::path &to);

// $HOME/.ziacoin, or ./.ziacoin when HOME is unset
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace ziacoin
