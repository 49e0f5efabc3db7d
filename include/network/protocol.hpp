// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace ziacoin {
namespace protocol {

// Sent in handshake / handshake_ack
constexpr const char *PROTOCOL_VERSION = "1.0.0";

namespace ports {
constexpr uint16_t MAINNET = 8333;
constexpr uint16_t TESTNET = 18333;
constexpr uint16_t REGTEST = 28333;
} // namespace ports

// Message type tags ("type" field of every message)
namespace commands {
constexpr const char *HANDSHAKE = "handshake";
constexpr const char *HANDSHAKE_ACK = "handshake_ack";
constexpr const char *GET_PEERS = "get_peers";
constexpr const char *PEER_LIST = "peer_list";
constexpr const char *GET_BLOCKS = "get_blocks";
constexpr const char *BLOCKS = "blocks";
constexpr const char *NEW_BLOCK = "new_block";
constexpr const char *NEW_TRANSACTION = "new_transaction";
} // namespace commands

// ============================================================================
// LIMITS
// ============================================================================

// One newline-terminated JSON message, including the newline
constexpr size_t MAX_MESSAGE_SIZE = 32 * 1024 * 1024;

// Entries accepted in one peer_list
constexpr size_t MAX_PEER_LIST_SIZE = 1000;

// Inbound connections served at once
constexpr size_t MAX_INBOUND_CONNECTIONS = 125;

// ============================================================================
// KADEMLIA
// ============================================================================

constexpr size_t NODE_ID_BITS = 160;
constexpr size_t K_BUCKET_SIZE = 20; // k
constexpr size_t ALPHA = 3;          // parallelism of a lookup round

// ============================================================================
// TIMEOUTS AND INTERVALS
// ============================================================================

// Whole outbound request: connect + write + read
constexpr auto REQUEST_TIMEOUT = std::chrono::seconds(5);

// Inbound connection idle time before we drop it
constexpr auto INBOUND_IDLE_TIMEOUT = std::chrono::seconds(60);

constexpr auto DISCOVERY_INTERVAL = std::chrono::seconds(300);
constexpr auto DHT_MAINTENANCE_INTERVAL = std::chrono::seconds(300);
constexpr auto PEER_MAINTENANCE_INTERVAL = std::chrono::seconds(60);
constexpr auto SYNC_INTERVAL = std::chrono::seconds(60);

// Routing entries not seen for this long are removed
constexpr int64_t PEER_INACTIVITY_TIMEOUT_SEC = 60 * 60;

} // namespace protocol
} // namespace ziacoin
