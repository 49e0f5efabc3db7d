// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/sync_manager.hpp"

#include "chain/chainparams.hpp"
#include "chain/ledger.hpp"
#include "chain/validation.hpp"
#include "network/peer_client.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <type_traits>

namespace ziacoin {
namespace network {

using namespace message;

namespace {
template <class> inline constexpr bool always_false_v = false;
}

SyncManager::SyncManager(chain::Ledger &ledger, RoutingTable &routing_table,
                         PeerClient &client, std::string self_host,
                         uint16_t self_port)
    : ledger_(ledger), routing_table_(routing_table), client_(client),
      self_host_(std::move(self_host)), self_port_(self_port) {}

void SyncManager::SetPostFunction(PostFunction post) {
  std::lock_guard<std::mutex> lock(callbacks_mutex_);
  post_ = std::move(post);
}

void SyncManager::SetTipChangedCallback(TipChangedCallback cb) {
  std::lock_guard<std::mutex> lock(callbacks_mutex_);
  on_tip_changed_ = std::move(cb);
}

void SyncManager::SetTransactionAcceptedCallback(
    TransactionAcceptedCallback cb) {
  std::lock_guard<std::mutex> lock(callbacks_mutex_);
  on_tx_accepted_ = std::move(cb);
}

void SyncManager::SetBootstrapNodes(std::vector<PeerInfo> nodes) {
  std::lock_guard<std::mutex> lock(callbacks_mutex_);
  bootstrap_nodes_ = std::move(nodes);
}

void SyncManager::Post(Task task) {
  PostFunction post;
  {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    post = post_;
  }
  if (post) {
    post(std::move(task));
  } else {
    task();
  }
}

void SyncManager::NotifyTipChanged() {
  TipChangedCallback cb;
  {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    cb = on_tip_changed_;
  }
  if (cb) {
    cb(ledger_.GetTip());
  }
}

HandshakeMessage SyncManager::MakeHandshake() const {
  HandshakeMessage hs;
  hs.host = self_host_;
  hs.port = self_port_;
  hs.version = protocol::PROTOCOL_VERSION;
  hs.height = ledger_.GetHeight();
  return hs;
}

bool SyncManager::IsSelf(const std::string &host, uint16_t port) const {
  return NodeId::FromHostPort(host, port) == routing_table_.GetLocalId();
}

RoutingTable::PingFunction SyncManager::PingFn() {
  return [this](const PeerInfo &peer) { return Ping(peer); };
}

// ============================================================================
// Inbound
// ============================================================================

std::optional<Message> SyncManager::ProcessMessage(const Message &msg,
                                                   const std::string &remote) {
  LOG_NET_TRACE("received {} from {}", CommandOf(msg), remote);

  return std::visit(
      [&](const auto &m) -> std::optional<Message> {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, HandshakeMessage>) {
          return HandleHandshake(m, remote);
        } else if constexpr (std::is_same_v<T, GetPeersMessage>) {
          return HandleGetPeers();
        } else if constexpr (std::is_same_v<T, GetBlocksMessage>) {
          return HandleGetBlocks(m);
        } else if constexpr (std::is_same_v<T, NewBlockMessage>) {
          validation::ValidationState state;
          if (!AcceptBlock(m.block, state) &&
              state.GetRejectReason() != validation::reject::DUPLICATE_BLOCK) {
            LOG_SYNC_DEBUG("rejected block {} from {}: {}", m.block.index,
                           remote, state.ToString());
          }
          return std::nullopt;
        } else if constexpr (std::is_same_v<T, NewTransactionMessage>) {
          validation::ValidationState state;
          if (!AcceptTransaction(m.transaction, state) &&
              state.GetRejectReason() != validation::reject::DUPLICATE_TX) {
            LOG_SYNC_DEBUG("rejected transaction from {}: {}", remote,
                           state.ToString());
          }
          return std::nullopt;
        } else if constexpr (std::is_same_v<T, HandshakeAckMessage> ||
                             std::is_same_v<T, PeerListMessage> ||
                             std::is_same_v<T, BlocksMessage>) {
          LOG_NET_DEBUG("unsolicited {} from {}, ignoring", CommandOf(msg),
                        remote);
          return std::nullopt;
        } else {
          static_assert(always_false_v<T>, "unhandled message type");
        }
      },
      msg);
}

Message SyncManager::HandleHandshake(const HandshakeMessage &msg,
                                     const std::string &remote) {
  if (msg.port != 0 && !msg.host.empty() && !IsSelf(msg.host, msg.port)) {
    PeerInfo peer = PeerInfo::Make(msg.host, msg.port, util::GetTime(),
                                   msg.version, msg.height);
    // The ping for a full bucket is outbound I/O
    Post([this, peer]() {
      auto result = routing_table_.AddNode(peer, PingFn());
      if (result == RoutingTable::AddResult::Inserted ||
          result == RoutingTable::AddResult::Replaced) {
        LOG_NET_INFO("new peer {} (height={}, version={})", peer.ToString(),
                     peer.height, peer.version);
      }
    });
  } else {
    LOG_NET_TRACE("handshake from {} without a reachable address", remote);
  }

  HandshakeAckMessage ack;
  ack.version = protocol::PROTOCOL_VERSION;
  ack.height = ledger_.GetHeight();
  return ack;
}

Message SyncManager::HandleGetPeers() const {
  PeerListMessage reply;
  reply.peers = routing_table_.GetActivePeers();
  if (reply.peers.size() > protocol::MAX_PEER_LIST_SIZE) {
    reply.peers.resize(protocol::MAX_PEER_LIST_SIZE);
  }
  return reply;
}

Message SyncManager::HandleGetBlocks(const GetBlocksMessage &msg) const {
  BlocksMessage reply;
  reply.blocks = ledger_.GetBlocks(msg.start_height, msg.end_height);
  return reply;
}

bool SyncManager::CheckIncomingBlock(const chain::Block &block,
                                     validation::ValidationState &state) const {
  if (!validation::CheckBlock(block, state)) {
    return false;
  }
  if (block.index > 1 && !ledger_.HasBlock(block.previous_hash)) {
    return state.Invalid(validation::reject::ORPHAN,
                         "unknown previous block " + block.previous_hash);
  }
  return true;
}

bool SyncManager::CheckIncomingTransaction(
    const chain::Transaction &tx, validation::ValidationState &state) const {
  return validation::CheckTransaction(tx, ledger_.GetParams(), state);
}

bool SyncManager::AcceptBlock(const chain::Block &block,
                              validation::ValidationState &state) {
  if (ledger_.HasBlock(block.hash)) {
    return state.Invalid(validation::reject::DUPLICATE_BLOCK);
  }
  if (!CheckIncomingBlock(block, state)) {
    return false;
  }
  if (!ledger_.AppendBlock(block, state)) {
    return false;
  }

  LOG_SYNC_INFO("accepted block {} {} ({} txs)", block.index, block.hash,
                block.transactions.size());
  NotifyTipChanged();
  Post([this, block]() { BroadcastBlock(block); });
  return true;
}

bool SyncManager::AcceptTransaction(const chain::Transaction &tx,
                                    validation::ValidationState &state) {
  if (!CheckIncomingTransaction(tx, state)) {
    return false;
  }
  if (!ledger_.AddTransaction(tx, state)) {
    return false;
  }

  TransactionAcceptedCallback cb;
  {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    cb = on_tx_accepted_;
  }
  if (cb) {
    cb(tx);
  }
  Post([this, tx]() { BroadcastTransaction(tx); });
  return true;
}

// ============================================================================
// Outbound
// ============================================================================

bool SyncManager::Ping(const PeerInfo &peer) {
  auto reply = client_.Request(peer.host, peer.port, MakeHandshake());
  return reply && std::holds_alternative<HandshakeAckMessage>(*reply);
}

std::optional<int64_t> SyncManager::Handshake(const std::string &host,
                                              uint16_t port) {
  auto reply = client_.Request(host, port, MakeHandshake());
  if (!reply || !std::holds_alternative<HandshakeAckMessage>(*reply)) {
    return std::nullopt;
  }
  const auto &ack = std::get<HandshakeAckMessage>(*reply);
  if (ack.version != protocol::PROTOCOL_VERSION) {
    LOG_NET_DEBUG("{}:{} speaks protocol {}, we speak {}", host, port,
                  ack.version, protocol::PROTOCOL_VERSION);
  }
  routing_table_.AddNode(
      PeerInfo::Make(host, port, util::GetTime(), ack.version, ack.height),
      PingFn());
  return ack.height;
}

bool SyncManager::AddPeer(const std::string &host, uint16_t port) {
  if (IsSelf(host, port)) {
    LOG_NET_DEBUG("not adding ourselves ({}:{}) as a peer", host, port);
    return false;
  }
  if (!Handshake(host, port)) {
    LOG_NET_WARN("peer {}:{} did not answer the handshake", host, port);
    return false;
  }
  return routing_table_.GetPeer(NodeId::FromHostPort(host, port)).has_value();
}

bool SyncManager::SyncWithPeer(const PeerInfo &peer) {
  auto height = Handshake(peer.host, peer.port);
  if (!height) {
    routing_table_.MarkInactive(peer.node_id);
    LOG_SYNC_DEBUG("peer {} unreachable, marked inactive", peer.ToString());
    return false;
  }

  const int64_t local_height = ledger_.GetHeight();
  if (*height <= local_height || StopRequested()) {
    return false;
  }

  LOG_SYNC_INFO("peer {} is at height {} (ours {}), fetching chain",
                peer.ToString(), *height, local_height);

  GetBlocksMessage request;
  request.start_height = 0;
  request.end_height = *height;
  auto reply = client_.Request(peer.host, peer.port, request);
  if (!reply || !std::holds_alternative<BlocksMessage>(*reply)) {
    routing_table_.MarkInactive(peer.node_id);
    LOG_SYNC_WARN("failed to fetch blocks from {}", peer.ToString());
    return false;
  }

  const auto &blocks = std::get<BlocksMessage>(*reply).blocks;
  validation::ValidationState state;
  if (!ledger_.ReplaceChain(blocks, state)) {
    LOG_SYNC_WARN("chain from {} rejected: {}", peer.ToString(),
                  state.ToString());
    return false;
  }

  LOG_SYNC_INFO("replaced local chain with {} blocks from {}", blocks.size(),
                peer.ToString());
  NotifyTipChanged();
  return true;
}

bool SyncManager::Reconcile() {
  std::lock_guard<std::mutex> lock(reconcile_mutex_);

  bool replaced = false;
  for (const auto &peer : routing_table_.GetActivePeers()) {
    if (StopRequested()) {
      LOG_SYNC_DEBUG("reconcile interrupted by shutdown");
      break;
    }
    if (SyncWithPeer(peer)) {
      replaced = true;
    }
  }
  return replaced;
}

size_t SyncManager::MergePeerList(const std::vector<PeerInfo> &peers) {
  size_t added = 0;
  const int64_t now = util::GetTime();
  for (const auto &entry : peers) {
    if (IsSelf(entry.host, entry.port)) {
      continue;
    }
    PeerInfo peer = PeerInfo::Make(entry.host, entry.port, now, entry.version,
                                   entry.height);
    auto result = routing_table_.AddNode(peer, PingFn());
    if (result == RoutingTable::AddResult::Inserted ||
        result == RoutingTable::AddResult::Replaced) {
      LOG_NET_DEBUG("discovered peer {}", peer.ToString());
      ++added;
    }
  }
  return added;
}

size_t SyncManager::RequestPeers(const PeerInfo &peer) {
  auto reply = client_.Request(peer.host, peer.port, GetPeersMessage{});
  if (!reply || !std::holds_alternative<PeerListMessage>(*reply)) {
    routing_table_.MarkInactive(peer.node_id);
    return 0;
  }
  routing_table_.MarkActive(peer.node_id, util::GetTime());
  return MergePeerList(std::get<PeerListMessage>(*reply).peers);
}

size_t SyncManager::DiscoverPeers() {
  std::vector<PeerInfo> bootstrap;
  {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    bootstrap = bootstrap_nodes_;
  }

  const size_t before = routing_table_.Size();

  for (const auto &node : bootstrap) {
    if (StopRequested()) {
      return 0;
    }
    if (IsSelf(node.host, node.port)) {
      continue;
    }
    if (!Handshake(node.host, node.port)) {
      LOG_NET_DEBUG("bootstrap node {} unreachable", node.ToString());
      continue;
    }
    RequestPeers(PeerInfo::Make(node.host, node.port, util::GetTime()));
  }

  for (const auto &peer : routing_table_.FindNode(NodeId::Random())) {
    if (StopRequested()) {
      return 0;
    }
    if (peer.active) {
      RequestPeers(peer);
    }
  }

  const size_t after = routing_table_.Size();
  const size_t added = after > before ? after - before : 0;
  LOG_NET_DEBUG("discovery round: {} new peers, {} known", added, after);
  return added;
}

size_t SyncManager::MaintainPeers() {
  size_t revived = 0;
  for (const auto &peer : routing_table_.GetPeers()) {
    if (StopRequested()) {
      break;
    }
    if (peer.active) {
      continue;
    }
    if (Ping(peer)) {
      routing_table_.MarkActive(peer.node_id, util::GetTime());
      LOG_NET_DEBUG("peer {} is reachable again", peer.ToString());
      ++revived;
    }
  }
  return revived;
}

template <typename Msg>
size_t SyncManager::Broadcast(const Msg &msg, const char *what) {
  size_t delivered = 0;
  for (const auto &peer : routing_table_.GetActivePeers()) {
    if (StopRequested()) {
      break;
    }
    if (client_.Send(peer.host, peer.port, msg)) {
      routing_table_.MarkActive(peer.node_id, util::GetTime());
      ++delivered;
    } else {
      routing_table_.MarkInactive(peer.node_id);
      LOG_NET_DEBUG("failed to send {} to {}, marked inactive", what,
                    peer.ToString());
    }
  }
  return delivered;
}

size_t SyncManager::BroadcastBlock(const chain::Block &block) {
  const size_t delivered = Broadcast(NewBlockMessage{block}, "block");
  LOG_SYNC_DEBUG("announced block {} to {} peers", block.index, delivered);
  return delivered;
}

size_t SyncManager::BroadcastTransaction(const chain::Transaction &tx) {
  const size_t delivered =
      Broadcast(NewTransactionMessage{tx}, "transaction");
  LOG_SYNC_DEBUG("announced transaction to {} peers", delivered);
  return delivered;
}

} // namespace network
} // namespace ziacoin
