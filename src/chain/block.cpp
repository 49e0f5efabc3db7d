// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/block.hpp"

#include "crypto/sha256.hpp"

#include <sstream>

namespace ziacoin {
namespace chain {

namespace {

nlohmann::json HeaderJson(const Block &block) {
  nlohmann::json j;
  j["index"] = block.index;
  j["timestamp"] = block.timestamp;
  j["transactions"] = nlohmann::json::array();
  for (const auto &tx : block.transactions) {
    j["transactions"].push_back(tx.ToJson());
  }
  j["previous_hash"] = block.previous_hash;
  j["nonce"] = block.nonce;
  j["difficulty"] = block.difficulty;
  j["merkle_root"] = block.merkle_root;
  return j;
}

} // namespace

std::string Block::HashPreimage() const {
  return CanonicalJson(HeaderJson(*this));
}

std::string Block::ComputeHash() const {
  return crypto::Sha256Hex(HashPreimage());
}

nlohmann::json Block::ToJson() const {
  nlohmann::json j = HeaderJson(*this);
  j["hash"] = hash;
  return j;
}

std::optional<Block> Block::FromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return std::nullopt;
  }
  for (const char *key : {"index", "timestamp", "transactions",
                          "previous_hash", "nonce", "hash", "difficulty",
                          "merkle_root"}) {
    if (!j.contains(key)) {
      return std::nullopt;
    }
  }
  if (!j["index"].is_number_integer() || !j["timestamp"].is_number() ||
      !j["transactions"].is_array() || !j["previous_hash"].is_string() ||
      !j["hash"].is_string() || !j["difficulty"].is_number_integer() ||
      !j["merkle_root"].is_string() || !j["nonce"].is_number_unsigned()) {
    return std::nullopt;
  }

  Block block;
  block.index = j["index"].get<int64_t>();
  block.timestamp = j["timestamp"].get<double>();
  block.previous_hash = j["previous_hash"].get<std::string>();
  block.hash = j["hash"].get<std::string>();
  block.difficulty = j["difficulty"].get<int>();
  block.merkle_root = j["merkle_root"].get<std::string>();
  block.nonce = j["nonce"].get<uint64_t>();

  block.transactions.reserve(j["transactions"].size());
  for (const auto &tx_json : j["transactions"]) {
    auto tx = Transaction::FromJson(tx_json);
    if (!tx) {
      return std::nullopt;
    }
    block.transactions.push_back(std::move(*tx));
  }
  return block;
}

std::string Block::ToString() const {
  std::ostringstream ss;
  ss << "Block(index=" << index << ", hash=" << hash.substr(0, 16)
     << ", prev=" << previous_hash.substr(0, 16)
     << ", txs=" << transactions.size() << ", difficulty=" << difficulty
     << ", nonce=" << nonce << ")";
  return ss.str();
}

} // namespace chain
} // namespace ziacoin
