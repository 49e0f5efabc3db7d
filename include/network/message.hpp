// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/transaction.hpp"
#include "network/peer.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ziacoin {
namespace message {

/**
 * Wire messages.
 *
 * Every message is one JSON object terminated by '\n' whose "type" field
 * names the variant alternative below. Requests (handshake, get_peers,
 * get_blocks) get exactly one reply on the same connection; new_block and
 * new_transaction are fire-and-forget announcements.
 */

struct HandshakeMessage {
  std::string host;
  uint16_t port{0};
  std::string version;
  int64_t height{0};
};

struct HandshakeAckMessage {
  std::string version;
  int64_t height{0};
};

struct GetPeersMessage {};

struct PeerListMessage {
  std::vector<network::PeerInfo> peers;
};

struct GetBlocksMessage {
  int64_t start_height{0};
  int64_t end_height{0};
};

struct BlocksMessage {
  std::vector<chain::Block> blocks;
};

struct NewBlockMessage {
  chain::Block block;
};

struct NewTransactionMessage {
  chain::Transaction transaction;
};

using Message =
    std::variant<HandshakeMessage, HandshakeAckMessage, GetPeersMessage,
                 PeerListMessage, GetBlocksMessage, BlocksMessage,
                 NewBlockMessage, NewTransactionMessage>;

// protocol::commands::* string of the alternative held
const char *CommandOf(const Message &msg);

nlohmann::json ToJson(const Message &msg);

// Compact JSON plus the trailing newline
std::string EncodeMessage(const Message &msg);

/**
 * Parse one message from a JSON object.
 * Returns nullopt for an unknown "type", a missing or mistyped field, or an
 * embedded block/transaction/peer that does not decode. A peer_list longer
 * than MAX_PEER_LIST_SIZE is rejected.
 */
std::optional<Message> FromJson(const nlohmann::json &j);

// FromJson over one line of text (trailing "\r\n" tolerated)
std::optional<Message> DecodeMessage(const std::string &line);

} // namespace message
} // namespace ziacoin
