// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer.hpp"

namespace ziacoin {
namespace network {

PeerInfo PeerInfo::Make(const std::string &host, uint16_t port,
                        int64_t last_seen, const std::string &version,
                        int64_t height) {
  PeerInfo peer;
  peer.host = host;
  peer.port = port;
  peer.node_id = NodeId::FromHostPort(host, port);
  peer.last_seen = last_seen;
  peer.version = version;
  peer.height = height;
  peer.active = true;
  return peer;
}

nlohmann::json PeerInfo::ToJson() const {
  nlohmann::json j;
  j["host"] = host;
  j["port"] = port;
  j["version"] = version;
  j["height"] = height;
  j["last_seen"] = last_seen;
  return j;
}

std::optional<PeerInfo> PeerInfo::FromJson(const nlohmann::json &j) {
  if (!j.is_object() || !j.contains("host") || !j.contains("port") ||
      !j["host"].is_string() || !j["port"].is_number_integer()) {
    return std::nullopt;
  }
  const int64_t port = j["port"].get<int64_t>();
  const std::string host = j["host"].get<std::string>();
  if (port < 1 || port > 65535 || host.empty()) {
    return std::nullopt;
  }

  auto string_or = [&j](const char *key) -> std::string {
    auto it = j.find(key);
    return (it != j.end() && it->is_string()) ? it->get<std::string>() : "";
  };
  auto int_or = [&j](const char *key) -> int64_t {
    auto it = j.find(key);
    return (it != j.end() && it->is_number()) ? it->get<int64_t>() : 0;
  };

  return Make(host, static_cast<uint16_t>(port), int_or("last_seen"),
              string_or("version"), int_or("height"));
}

} // namespace network
} // namespace ziacoin
