// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <optional>
#include <string>

typedef struct evp_pkey_st EVP_PKEY;

namespace ziacoin {
namespace crypto {

/**
 * ECDSA over secp256k1 with SHA-256 message digests.
 *
 * Public keys travel as hex-encoded SEC1 points (compressed or uncompressed),
 * signatures as hex-encoded DER.
 */

/**
 * Verify `signature_hex` over `message` with the key in `pubkey_hex`.
 *
 * Malformed keys or signatures verify as false. Only an OpenSSL allocation
 * failure throws (std::runtime_error).
 */
bool VerifySignature(const std::string &pubkey_hex, const std::string &message,
                     const std::string &signature_hex);

/**
 * Signing key. Used by the CLI wallet helper and by tests; the node itself
 * only ever verifies.
 */
class PrivateKey {
public:
  // Fresh random secp256k1 key
  static PrivateKey Generate();

  // PKCS#8 PEM as produced by ToPem()
  static std::optional<PrivateKey> FromPem(const std::string &pem);

  std::string ToPem() const;

  // Uncompressed SEC1 point, hex
  std::string GetPublicKeyHex() const;

  // DER signature of SHA-256(message), hex
  std::string Sign(const std::string &message) const;

private:
  struct PKeyDeleter {
    void operator()(EVP_PKEY *key) const;
  };

  explicit PrivateKey(EVP_PKEY *key) : key_(key) {}

  std::unique_ptr<EVP_PKEY, PKeyDeleter> key_;
};

} // namespace crypto
} // namespace ziacoin
