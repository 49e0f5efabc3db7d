// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace ziacoin {
namespace network {

/**
 * 160-bit Kademlia identifier.
 *
 * A peer's id is the first 160 bits of sha256("host:port"), so every node
 * derives the same id for the same endpoint. Distance is bitwise XOR,
 * compared as a big-endian unsigned integer.
 */
class NodeId {
public:
  static constexpr size_t SIZE = 20;
  using Bytes = std::array<uint8_t, SIZE>;

  NodeId() { data_.fill(0); }
  explicit NodeId(const Bytes &bytes) : data_(bytes) {}

  static NodeId FromHostPort(const std::string &host, uint16_t port);

  // 40 hex characters; nullopt otherwise
  static std::optional<NodeId> FromHex(const std::string &hex);

  // Uniformly random id (lookup targets)
  static NodeId Random();

  NodeId Distance(const NodeId &other) const;

  // Position of the highest set bit plus one; 0 for the zero id
  int BitLength() const;

  bool IsZero() const { return BitLength() == 0; }

  std::string ToHex() const;

  const Bytes &bytes() const { return data_; }

  bool operator==(const NodeId &other) const { return data_ == other.data_; }
  bool operator!=(const NodeId &other) const { return data_ != other.data_; }
  bool operator<(const NodeId &other) const { return data_ < other.data_; }

private:
  Bytes data_;
};

} // namespace network
} // namespace ziacoin
