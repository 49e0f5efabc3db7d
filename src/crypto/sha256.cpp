// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "crypto/sha256.hpp"

#include "util/string_parsing.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <stdexcept>

namespace ziacoin {
namespace crypto {

Sha256Digest Sha256(const void *data, size_t len) {
  Sha256Digest digest;
  unsigned int out_len = 0;
  if (EVP_Digest(data, len, digest.data(), &out_len, EVP_sha256(), nullptr) !=
          1 ||
      out_len != digest.size()) {
    char err_buf[256]{0};
    ERR_error_string_n(ERR_get_error(), err_buf, sizeof(err_buf));
    throw std::runtime_error(std::string("EVP_Digest(sha256): ") + err_buf);
  }
  return digest;
}

Sha256Digest Sha256(const std::string &data) {
  return Sha256(data.data(), data.size());
}

std::string Sha256Hex(const std::string &data) {
  const auto digest = Sha256(data);
  return util::HexStr(digest.data(), digest.size());
}

} // namespace crypto
} // namespace ziacoin
