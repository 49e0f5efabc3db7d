// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/node_id.hpp"
#include "network/peer.hpp"
#include "network/protocol.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace ziacoin {
namespace network {

/**
 * RoutingTable - Kademlia k-buckets around a local node id.
 *
 * Bucket i holds peers whose XOR distance to the local id has bit length
 * 160 - i, so bucket 0 covers the far half of the id space and bucket 159
 * the nearest ids. Each bucket holds at most k entries ordered from least to
 * most recently seen.
 *
 * Thread-safety: a single mutex guards all buckets. Readers receive copies.
 * The liveness ping in AddNode() runs with the mutex released.
 */
class RoutingTable {
public:
  static constexpr size_t NUM_BUCKETS = protocol::NODE_ID_BITS;

  enum class AddResult {
    Inserted,  // Bucket had room
    Refreshed, // Already present; last_seen/height/version updated
    Replaced,  // Took the slot of an inactive or unresponsive entry
    Dropped,   // Bucket full and its oldest entry answered the ping
    Rejected   // The local id itself
  };

  // Returns true if the peer answered
  using PingFunction = std::function<bool(const PeerInfo &)>;

  explicit RoutingTable(const NodeId &local_id,
                        size_t k = protocol::K_BUCKET_SIZE);

  // 159 - (bit_length(local XOR id) - 1); 159 when the ids are equal
  size_t BucketIndex(const NodeId &id) const;

  /**
   * Insert or refresh a peer.
   * When the bucket is full an inactive entry is evicted first; otherwise the
   * least recently seen entry is pinged and replaced only if it fails to
   * answer. Without a ping function a full bucket drops the newcomer.
   */
  AddResult AddNode(const PeerInfo &peer, const PingFunction &ping = {});

  /**
   * Up to `count` known peers closest to `target` by XOR distance. Starts at
   * the target's bucket and widens to neighbouring buckets until at least
   * `count` candidates are collected or every bucket has been visited.
   */
  std::vector<PeerInfo> FindNode(const NodeId &target) const;
  std::vector<PeerInfo> FindNode(const NodeId &target, size_t count) const;

  // Drop entries with now - last_seen > max_age. Returns how many.
  size_t RemoveInactive(int64_t now, int64_t max_age);

  bool MarkInactive(const NodeId &id);
  bool MarkActive(const NodeId &id, int64_t now);
  bool Remove(const NodeId &id);

  std::optional<PeerInfo> GetPeer(const NodeId &id) const;
  std::vector<PeerInfo> GetPeers() const;
  std::vector<PeerInfo> GetActivePeers() const;

  size_t Size() const;
  size_t BucketSize(size_t index) const;
  size_t GetK() const { return k_; }
  const NodeId &GetLocalId() const { return local_id_; }

  // JSON persistence (0600). Load() inserts without pinging; returns the
  // number of peers added.
  bool Save(const std::filesystem::path &path) const;
  size_t Load(const std::filesystem::path &path);

private:
  using Bucket = std::vector<PeerInfo>;

  // Callers hold mutex_
  Bucket::iterator FindInBucket(Bucket &bucket, const NodeId &id);
  PeerInfo *FindLocked(const NodeId &id);

  const NodeId local_id_;
  const size_t k_;

  mutable std::mutex mutex_;
  std::array<Bucket, NUM_BUCKETS> buckets_;
};

} // namespace network
} // namespace ziacoin
