// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/node_id.hpp"

#include "crypto/sha256.hpp"
#include "util/string_parsing.hpp"

#include <algorithm>
#include <random>

namespace ziacoin {
namespace network {

NodeId NodeId::FromHostPort(const std::string &host, uint16_t port) {
  const auto digest =
      crypto::Sha256(host + ":" + std::to_string(static_cast<unsigned>(port)));
  Bytes bytes;
  std::copy_n(digest.begin(), SIZE, bytes.begin());
  return NodeId(bytes);
}

std::optional<NodeId> NodeId::FromHex(const std::string &hex) {
  if (hex.size() != SIZE * 2) {
    return std::nullopt;
  }
  auto raw = util::ParseHex(hex);
  if (!raw) {
    return std::nullopt;
  }
  Bytes bytes;
  std::copy(raw->begin(), raw->end(), bytes.begin());
  return NodeId(bytes);
}

NodeId NodeId::Random() {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  std::uniform_int_distribution<unsigned> dist(0, 255);
  Bytes bytes;
  for (auto &b : bytes) {
    b = static_cast<uint8_t>(dist(gen));
  }
  return NodeId(bytes);
}

NodeId NodeId::Distance(const NodeId &other) const {
  Bytes out;
  for (size_t i = 0; i < SIZE; ++i) {
    out[i] = data_[i] ^ other.data_[i];
  }
  return NodeId(out);
}

int NodeId::BitLength() const {
  for (size_t i = 0; i < SIZE; ++i) {
    if (data_[i] != 0) {
      int bits = 0;
      for (uint8_t b = data_[i]; b != 0; b >>= 1) {
        ++bits;
      }
      return static_cast<int>((SIZE - 1 - i) * 8) + bits;
    }
  }
  return 0;
}

std::string NodeId::ToHex() const {
  return util::HexStr(data_.data(), data_.size());
}

} // namespace network
} // namespace ziacoin
