// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/node_id.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace ziacoin {
namespace network {

/**
 * What we know about a remote node.
 *
 * `active` drops to false after a failed request and returns to true on the
 * next successful contact; `last_seen` (unix seconds) is refreshed on every
 * successful contact and drives routing-table expiry.
 */
struct PeerInfo {
  std::string host;
  uint16_t port{0};
  NodeId node_id;
  int64_t last_seen{0};
  std::string version;
  int64_t height{0};
  bool active{true};

  // node_id derived from host:port
  static PeerInfo Make(const std::string &host, uint16_t port,
                       int64_t last_seen, const std::string &version = "",
                       int64_t height = 0);

  std::string ToString() const { return host + ":" + std::to_string(port); }

  // peer_list entry: {host, port, version, height, last_seen}
  nlohmann::json ToJson() const;

  // node_id is recomputed from host:port; nullopt if host/port are missing
  // or the port is out of range
  static std::optional<PeerInfo> FromJson(const nlohmann::json &j);
};

} // namespace network
} // namespace ziacoin
