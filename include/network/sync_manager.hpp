// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/block.hpp"
#include "chain/transaction.hpp"
#include "network/message.hpp"
#include "network/peer.hpp"
#include "network/routing_table.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ziacoin {

namespace chain {
class Ledger;
}
namespace validation {
class ValidationState;
}

namespace network {

class PeerClient;

/**
 * SyncManager - the node's side of the gossip protocol.
 *
 * Inbound: ProcessMessage() answers requests and accepts announcements.
 * Outbound: reconciliation with longer peers, peer discovery, and
 * broadcasting newly accepted blocks and transactions.
 *
 * An item is rebroadcast only when this node accepted it for the first time,
 * so a gossip wave stops once every node has seen it.
 *
 * Rebroadcasts are handed to the post function so the thread serving an
 * inbound connection never blocks on outbound I/O. Without one they run
 * inline.
 */
class SyncManager {
public:
  using Task = std::function<void()>;
  using PostFunction = std::function<void(Task)>;
  using TipChangedCallback = std::function<void(const chain::Block &tip)>;
  using TransactionAcceptedCallback =
      std::function<void(const chain::Transaction &tx)>;

  SyncManager(chain::Ledger &ledger, RoutingTable &routing_table,
              PeerClient &client, std::string self_host, uint16_t self_port);

  SyncManager(const SyncManager &) = delete;
  SyncManager &operator=(const SyncManager &) = delete;

  void SetPostFunction(PostFunction post);
  void SetTipChangedCallback(TipChangedCallback cb);
  void SetTransactionAcceptedCallback(TransactionAcceptedCallback cb);
  void SetBootstrapNodes(std::vector<PeerInfo> nodes);

  // Reply for requests, nullopt for announcements and reply-only types
  std::optional<message::Message>
  ProcessMessage(const message::Message &msg, const std::string &remote);

  /**
   * Gossip acceptance for a block: hash recompute, merkle commitment,
   * proof-of-work at the stated difficulty, and for index > 1 a known
   * predecessor ("orphan-block" otherwise).
   */
  bool CheckIncomingBlock(const chain::Block &block,
                          validation::ValidationState &state) const;

  // amount > 0 and timestamp within the freshness window
  bool CheckIncomingTransaction(const chain::Transaction &tx,
                                validation::ValidationState &state) const;

  // Validate, append on the tip, rebroadcast. "duplicate-block" if known.
  bool AcceptBlock(const chain::Block &block,
                   validation::ValidationState &state);

  // Validate, add to the pool, rebroadcast. Also the local submit path.
  bool AcceptTransaction(const chain::Transaction &tx,
                         validation::ValidationState &state);

  /**
   * Reconcile with every active peer independently: learn its height by
   * handshake and, if it is longer, fetch its whole chain and offer it to
   * Ledger::ReplaceChain. Returns true if the local chain was replaced.
   */
  bool Reconcile();
  bool SyncWithPeer(const PeerInfo &peer);

  /**
   * Contact the bootstrap nodes, merge their peer lists, then ask the
   * peers closest to a random id for theirs. Returns peers added.
   */
  size_t DiscoverPeers();

  // Handshake with inactive peers; revive the ones that answer
  size_t MaintainPeers();

  // Announce to every active peer; returns successful deliveries
  size_t BroadcastBlock(const chain::Block &block);
  size_t BroadcastTransaction(const chain::Transaction &tx);

  // Handshake with host:port and add it to the routing table
  bool AddPeer(const std::string &host, uint16_t port);

  // Liveness check used by the routing table
  bool Ping(const PeerInfo &peer);

  /**
   * Ask the outbound loops to wind down. Reconcile, discovery, maintenance
   * and broadcasts check the flag before each peer, so at most the request
   * already in flight finishes. ClearStop() re-arms them.
   */
  void RequestStop() { stop_requested_.store(true, std::memory_order_release); }
  void ClearStop() { stop_requested_.store(false, std::memory_order_release); }
  bool StopRequested() const {
    return stop_requested_.load(std::memory_order_acquire);
  }

  message::HandshakeMessage MakeHandshake() const;

  const std::string &GetSelfHost() const { return self_host_; }
  uint16_t GetSelfPort() const { return self_port_; }

private:
  message::Message HandleHandshake(const message::HandshakeMessage &msg,
                                   const std::string &remote);
  message::Message HandleGetPeers() const;
  message::Message HandleGetBlocks(const message::GetBlocksMessage &msg) const;

  // Handshake; on success refresh the peer and return its reported height
  std::optional<int64_t> Handshake(const std::string &host, uint16_t port);

  size_t MergePeerList(const std::vector<PeerInfo> &peers);
  size_t RequestPeers(const PeerInfo &peer);
  bool IsSelf(const std::string &host, uint16_t port) const;
  void Post(Task task);
  void NotifyTipChanged();

  template <typename Msg> size_t Broadcast(const Msg &msg, const char *what);

  RoutingTable::PingFunction PingFn();

  chain::Ledger &ledger_;
  RoutingTable &routing_table_;
  PeerClient &client_;
  const std::string self_host_;
  const uint16_t self_port_;

  mutable std::mutex callbacks_mutex_;
  PostFunction post_;
  TipChangedCallback on_tip_changed_;
  TransactionAcceptedCallback on_tx_accepted_;
  std::vector<PeerInfo> bootstrap_nodes_;

  // Serializes Reconcile() so two rounds never fetch the same chain
  std::mutex reconcile_mutex_;

  std::atomic<bool> stop_requested_{false};
};

} // namespace network
} // namespace ziacoin
