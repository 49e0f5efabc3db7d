// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/transaction.hpp"

#include "crypto/ecdsa.hpp"

namespace ziacoin {
namespace chain {

std::string CanonicalJson(const nlohmann::json &j) {
  // nlohmann::json objects are std::map backed, so keys are already sorted
  return j.dump(-1, ' ', true);
}

std::string Transaction::SignatureMessage() const {
  return sender + recipient + nlohmann::json(amount).dump() +
         nlohmann::json(timestamp).dump();
}

bool Transaction::Verify() const {
  if (!signature || signature->empty()) {
    return false;
  }
  return crypto::VerifySignature(sender, SignatureMessage(), *signature);
}

nlohmann::json Transaction::ToJson() const {
  nlohmann::json j;
  j["sender"] = sender;
  j["recipient"] = recipient;
  j["amount"] = amount;
  j["timestamp"] = timestamp;
  if (signature) {
    j["signature"] = *signature;
  } else {
    j["signature"] = nullptr;
  }
  return j;
}

std::optional<Transaction> Transaction::FromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return std::nullopt;
  }
  for (const char *key : {"sender", "recipient", "amount", "timestamp"}) {
    if (!j.contains(key)) {
      return std::nullopt;
    }
  }
  if (!j["sender"].is_string() || !j["recipient"].is_string() ||
      !j["amount"].is_number() || !j["timestamp"].is_number()) {
    return std::nullopt;
  }

  Transaction tx;
  tx.sender = j["sender"].get<std::string>();
  tx.recipient = j["recipient"].get<std::string>();
  tx.amount = j["amount"].get<double>();
  tx.timestamp = j["timestamp"].get<double>();

  auto sig = j.find("signature");
  if (sig != j.end() && !sig->is_null()) {
    if (!sig->is_string()) {
      return std::nullopt;
    }
    tx.signature = sig->get<std::string>();
  }
  return tx;
}

bool Transaction::operator==(const Transaction &other) const {
  return sender == other.sender && recipient == other.recipient &&
         amount == other.amount && timestamp == other.timestamp &&
         signature == other.signature;
}

} // namespace chain
} // namespace ziacoin
