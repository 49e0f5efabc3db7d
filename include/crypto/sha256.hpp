// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace ziacoin {
namespace crypto {

using Sha256Digest = std::array<uint8_t, 32>;

// Throws std::runtime_error if OpenSSL fails (out of memory, broken provider)
Sha256Digest Sha256(const void *data, size_t len);
Sha256Digest Sha256(const std::string &data);

// 64 lowercase hex characters
std::string Sha256Hex(const std::string &data);

} // namespace crypto
} // namespace ziacoin
