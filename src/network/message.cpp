// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/message.hpp"

#include "network/protocol.hpp"
#include "util/logging.hpp"

#include <limits>
#include <type_traits>

namespace ziacoin {
namespace message {

using json = nlohmann::json;
namespace commands = protocol::commands;

namespace {

template <class> inline constexpr bool always_false_v = false;

bool GetString(const json &j, const char *key, std::string &out) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool GetInt64(const json &j, const char *key, int64_t &out) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number_integer()) {
    return false;
  }
  out = it->get<int64_t>();
  return true;
}

bool GetPort(const json &j, const char *key, uint16_t &out) {
  int64_t value = 0;
  if (!GetInt64(j, key, value) || value < 0 ||
      value > std::numeric_limits<uint16_t>::max()) {
    return false;
  }
  out = static_cast<uint16_t>(value);
  return true;
}

const json *GetArray(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_array()) {
    return nullptr;
  }
  return &*it;
}

} // namespace

const char *CommandOf(const Message &msg) {
  return std::visit(
      [](const auto &m) -> const char * {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, HandshakeMessage>) {
          return commands::HANDSHAKE;
        } else if constexpr (std::is_same_v<T, HandshakeAckMessage>) {
          return commands::HANDSHAKE_ACK;
        } else if constexpr (std::is_same_v<T, GetPeersMessage>) {
          return commands::GET_PEERS;
        } else if constexpr (std::is_same_v<T, PeerListMessage>) {
          return commands::PEER_LIST;
        } else if constexpr (std::is_same_v<T, GetBlocksMessage>) {
          return commands::GET_BLOCKS;
        } else if constexpr (std::is_same_v<T, BlocksMessage>) {
          return commands::BLOCKS;
        } else if constexpr (std::is_same_v<T, NewBlockMessage>) {
          return commands::NEW_BLOCK;
        } else if constexpr (std::is_same_v<T, NewTransactionMessage>) {
          return commands::NEW_TRANSACTION;
        } else {
          static_assert(always_false_v<T>, "unhandled message type");
        }
      },
      msg);
}

json ToJson(const Message &msg) {
  json j = std::visit(
      [](const auto &m) -> json {
        using T = std::decay_t<decltype(m)>;
        json out = json::object();
        if constexpr (std::is_same_v<T, HandshakeMessage>) {
          out["host"] = m.host;
          out["port"] = m.port;
          out["version"] = m.version;
          out["height"] = m.height;
        } else if constexpr (std::is_same_v<T, HandshakeAckMessage>) {
          out["version"] = m.version;
          out["height"] = m.height;
        } else if constexpr (std::is_same_v<T, GetPeersMessage>) {
          // no payload
        } else if constexpr (std::is_same_v<T, PeerListMessage>) {
          json peers = json::array();
          for (const auto &p : m.peers) {
            peers.push_back(p.ToJson());
          }
          out["peers"] = std::move(peers);
        } else if constexpr (std::is_same_v<T, GetBlocksMessage>) {
          out["start_height"] = m.start_height;
          out["end_height"] = m.end_height;
        } else if constexpr (std::is_same_v<T, BlocksMessage>) {
          json blocks = json::array();
          for (const auto &b : m.blocks) {
            blocks.push_back(b.ToJson());
          }
          out["blocks"] = std::move(blocks);
        } else if constexpr (std::is_same_v<T, NewBlockMessage>) {
          out["block"] = m.block.ToJson();
        } else if constexpr (std::is_same_v<T, NewTransactionMessage>) {
          out["transaction"] = m.transaction.ToJson();
        } else {
          static_assert(always_false_v<T>, "unhandled message type");
        }
        return out;
      },
      msg);
  j["type"] = CommandOf(msg);
  return j;
}

std::string EncodeMessage(const Message &msg) {
  return ToJson(msg).dump(-1, ' ', true) + "\n";
}

std::optional<Message> FromJson(const json &j) {
  if (!j.is_object()) {
    return std::nullopt;
  }
  std::string type;
  if (!GetString(j, "type", type)) {
    return std::nullopt;
  }

  if (type == commands::HANDSHAKE) {
    HandshakeMessage m;
    if (!GetString(j, "host", m.host) || !GetPort(j, "port", m.port) ||
        !GetString(j, "version", m.version) ||
        !GetInt64(j, "height", m.height)) {
      return std::nullopt;
    }
    return Message{std::move(m)};
  }

  if (type == commands::HANDSHAKE_ACK) {
    HandshakeAckMessage m;
    if (!GetString(j, "version", m.version) ||
        !GetInt64(j, "height", m.height)) {
      return std::nullopt;
    }
    return Message{std::move(m)};
  }

  if (type == commands::GET_PEERS) {
    return Message{GetPeersMessage{}};
  }

  if (type == commands::PEER_LIST) {
    const json *peers = GetArray(j, "peers");
    if (!peers || peers->size() > protocol::MAX_PEER_LIST_SIZE) {
      return std::nullopt;
    }
    PeerListMessage m;
    m.peers.reserve(peers->size());
    for (const auto &entry : *peers) {
      auto peer = network::PeerInfo::FromJson(entry);
      if (!peer) {
        return std::nullopt;
      }
      m.peers.push_back(std::move(*peer));
    }
    return Message{std::move(m)};
  }

  if (type == commands::GET_BLOCKS) {
    GetBlocksMessage m;
    if (!GetInt64(j, "start_height", m.start_height) ||
        !GetInt64(j, "end_height", m.end_height)) {
      return std::nullopt;
    }
    return Message{m};
  }

  if (type == commands::BLOCKS) {
    const json *blocks = GetArray(j, "blocks");
    if (!blocks) {
      return std::nullopt;
    }
    BlocksMessage m;
    m.blocks.reserve(blocks->size());
    for (const auto &entry : *blocks) {
      auto block = chain::Block::FromJson(entry);
      if (!block) {
        return std::nullopt;
      }
      m.blocks.push_back(std::move(*block));
    }
    return Message{std::move(m)};
  }

  if (type == commands::NEW_BLOCK) {
    auto it = j.find("block");
    if (it == j.end()) {
      return std::nullopt;
    }
    auto block = chain::Block::FromJson(*it);
    if (!block) {
      return std::nullopt;
    }
    return Message{NewBlockMessage{std::move(*block)}};
  }

  if (type == commands::NEW_TRANSACTION) {
    auto it = j.find("transaction");
    if (it == j.end()) {
      return std::nullopt;
    }
    auto tx = chain::Transaction::FromJson(*it);
    if (!tx) {
      return std::nullopt;
    }
    return Message{NewTransactionMessage{std::move(*tx)}};
  }

  LOG_NET_DEBUG("rejecting message with unknown type '{}'", type);
  return std::nullopt;
}

std::optional<Message> DecodeMessage(const std::string &line) {
  if (line.size() > protocol::MAX_MESSAGE_SIZE) {
    return std::nullopt;
  }
  std::string text = line;
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.pop_back();
  }
  if (text.empty()) {
    return std::nullopt;
  }

  try {
    return FromJson(json::parse(text));
  } catch (const json::exception &e) {
    LOG_NET_DEBUG("malformed message: {}", e.what());
    return std::nullopt;
  }
}

} // namespace message
} // namespace ziacoin
