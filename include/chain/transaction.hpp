// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace ziacoin {
namespace chain {

// Compact JSON with lexicographically sorted keys and ASCII-only output.
// Every hash in the system is taken over this rendering.
std::string CanonicalJson(const nlohmann::json &j);

/**
 * Value transfer from `sender` to `recipient`.
 *
 * `sender` is the hex SEC1 public key of the signer; `recipient` is an opaque
 * address string. A transaction is identified by its signature, so an unsigned
 * transaction can never enter the ledger.
 */
struct Transaction {
  std::string sender;
  std::string recipient;
  double amount{0.0};
  double timestamp{0.0};
  std::optional<std::string> signature;

  // sender + recipient + amount + timestamp, numbers in JSON rendering
  std::string SignatureMessage() const;

  // ECDSA secp256k1 check of `signature` against `sender`.
  // False if the transaction is unsigned or the key/signature is malformed.
  bool Verify() const;

  nlohmann::json ToJson() const;

  // nullopt if a required field is missing or has the wrong JSON type
  static std::optional<Transaction> FromJson(const nlohmann::json &j);

  bool operator==(const Transaction &other) const;
};

} // namespace chain
} // namespace ziacoin
