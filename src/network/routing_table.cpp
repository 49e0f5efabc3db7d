// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/routing_table.hpp"

#include "util/files.hpp"
#include "util/logging.hpp"

#include <algorithm>

namespace ziacoin {
namespace network {

using json = nlohmann::json;

RoutingTable::RoutingTable(const NodeId &local_id, size_t k)
    : local_id_(local_id), k_(k) {}

size_t RoutingTable::BucketIndex(const NodeId &id) const {
  const int bits = local_id_.Distance(id).BitLength();
  if (bits == 0) {
    return NUM_BUCKETS - 1;
  }
  return NUM_BUCKETS - 1 - static_cast<size_t>(bits - 1);
}

RoutingTable::Bucket::iterator RoutingTable::FindInBucket(Bucket &bucket,
                                                          const NodeId &id) {
  return std::find_if(bucket.begin(), bucket.end(),
                      [&id](const PeerInfo &p) { return p.node_id == id; });
}

PeerInfo *RoutingTable::FindLocked(const NodeId &id) {
  Bucket &bucket = buckets_[BucketIndex(id)];
  auto it = FindInBucket(bucket, id);
  return it == bucket.end() ? nullptr : &*it;
}

RoutingTable::AddResult RoutingTable::AddNode(const PeerInfo &peer,
                                              const PingFunction &ping) {
  if (peer.node_id == local_id_) {
    return AddResult::Rejected;
  }

  const size_t index = BucketIndex(peer.node_id);
  PeerInfo oldest;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Bucket &bucket = buckets_[index];

    auto it = FindInBucket(bucket, peer.node_id);
    if (it != bucket.end()) {
      PeerInfo updated = *it;
      updated.last_seen = std::max(updated.last_seen, peer.last_seen);
      updated.height = peer.height;
      if (!peer.version.empty()) {
        updated.version = peer.version;
      }
      updated.active = true;
      bucket.erase(it);
      bucket.push_back(std::move(updated));
      return AddResult::Refreshed;
    }

    if (bucket.size() < k_) {
      bucket.push_back(peer);
      LOG_NET_DEBUG("routing: added {} to bucket {}", peer.ToString(), index);
      return AddResult::Inserted;
    }

    auto inactive = std::find_if(bucket.begin(), bucket.end(),
                                 [](const PeerInfo &p) { return !p.active; });
    if (inactive != bucket.end()) {
      LOG_NET_DEBUG("routing: {} replaces inactive {} in bucket {}",
                    peer.ToString(), inactive->ToString(), index);
      bucket.erase(inactive);
      bucket.push_back(peer);
      return AddResult::Replaced;
    }

    if (!ping) {
      return AddResult::Dropped;
    }
    oldest = *std::min_element(bucket.begin(), bucket.end(),
                               [](const PeerInfo &a, const PeerInfo &b) {
                                 return a.last_seen < b.last_seen;
                               });
  }

  const bool alive = ping(oldest);

  std::lock_guard<std::mutex> lock(mutex_);
  Bucket &bucket = buckets_[index];
  auto oldest_it = FindInBucket(bucket, oldest.node_id);

  if (alive) {
    if (oldest_it != bucket.end()) {
      oldest_it->active = true;
    }
    LOG_NET_TRACE("routing: bucket {} full, {} answered, dropping {}", index,
                  oldest.ToString(), peer.ToString());
    return AddResult::Dropped;
  }

  if (oldest_it != bucket.end()) {
    bucket.erase(oldest_it);
  }
  if (FindInBucket(bucket, peer.node_id) != bucket.end() ||
      bucket.size() >= k_) {
    return AddResult::Dropped;
  }
  bucket.push_back(peer);
  LOG_NET_DEBUG("routing: {} replaces unresponsive {} in bucket {}",
                peer.ToString(), oldest.ToString(), index);
  return AddResult::Replaced;
}

std::vector<PeerInfo> RoutingTable::FindNode(const NodeId &target) const {
  return FindNode(target, k_);
}

std::vector<PeerInfo> RoutingTable::FindNode(const NodeId &target,
                                             size_t count) const {
  std::vector<PeerInfo> candidates;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t index = BucketIndex(target);
    const Bucket &home = buckets_[index];
    candidates.insert(candidates.end(), home.begin(), home.end());

    for (size_t i = 1; i < NUM_BUCKETS && candidates.size() < count; ++i) {
      if (index + i < NUM_BUCKETS) {
        const Bucket &b = buckets_[index + i];
        candidates.insert(candidates.end(), b.begin(), b.end());
      }
      if (index >= i) {
        const Bucket &b = buckets_[index - i];
        candidates.insert(candidates.end(), b.begin(), b.end());
      }
    }
  }

  std::sort(candidates.begin(), candidates.end(),
            [&target](const PeerInfo &a, const PeerInfo &b) {
              return a.node_id.Distance(target) < b.node_id.Distance(target);
            });
  if (candidates.size() > count) {
    candidates.resize(count);
  }
  return candidates;
}

size_t RoutingTable::RemoveInactive(int64_t now, int64_t max_age) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t removed = 0;
  for (auto &bucket : buckets_) {
    const size_t before = bucket.size();
    bucket.erase(std::remove_if(bucket.begin(), bucket.end(),
                                [now, max_age](const PeerInfo &p) {
                                  return now - p.last_seen > max_age;
                                }),
                 bucket.end());
    removed += before - bucket.size();
  }
  if (removed > 0) {
    LOG_NET_DEBUG("routing: expired {} peers", removed);
  }
  return removed;
}

bool RoutingTable::MarkInactive(const NodeId &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  PeerInfo *peer = FindLocked(id);
  if (!peer) {
    return false;
  }
  peer->active = false;
  return true;
}

bool RoutingTable::MarkActive(const NodeId &id, int64_t now) {
  std::lock_guard<std::mutex> lock(mutex_);
  PeerInfo *peer = FindLocked(id);
  if (!peer) {
    return false;
  }
  peer->active = true;
  peer->last_seen = std::max(peer->last_seen, now);
  return true;
}

bool RoutingTable::Remove(const NodeId &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Bucket &bucket = buckets_[BucketIndex(id)];
  auto it = FindInBucket(bucket, id);
  if (it == bucket.end()) {
    return false;
  }
  bucket.erase(it);
  return true;
}

std::optional<PeerInfo> RoutingTable::GetPeer(const NodeId &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const Bucket &bucket = buckets_[BucketIndex(id)];
  for (const auto &p : bucket) {
    if (p.node_id == id) {
      return p;
    }
  }
  return std::nullopt;
}

std::vector<PeerInfo> RoutingTable::GetPeers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PeerInfo> out;
  for (const auto &bucket : buckets_) {
    out.insert(out.end(), bucket.begin(), bucket.end());
  }
  return out;
}

std::vector<PeerInfo> RoutingTable::GetActivePeers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PeerInfo> out;
  for (const auto &bucket : buckets_) {
    for (const auto &p : bucket) {
      if (p.active) {
        out.push_back(p);
      }
    }
  }
  return out;
}

size_t RoutingTable::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t n = 0;
  for (const auto &bucket : buckets_) {
    n += bucket.size();
  }
  return n;
}

size_t RoutingTable::BucketSize(size_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index < NUM_BUCKETS ? buckets_[index].size() : 0;
}

bool RoutingTable::Save(const std::filesystem::path &path) const {
  json root;
  root["version"] = 1;
  root["local_id"] = local_id_.ToHex();
  json peers = json::array();
  for (const auto &peer : GetPeers()) {
    json entry = peer.ToJson();
    entry["active"] = peer.active;
    peers.push_back(std::move(entry));
  }
  root["peers"] = std::move(peers);

  try {
    if (!util::atomic_write_file(path, root.dump(2, ' ', true), 0600)) {
      LOG_NET_ERROR("Failed to save peers to {}", path.string());
      return false;
    }
  } catch (const json::exception &e) {
    LOG_NET_ERROR("Failed to serialize peers: {}", e.what());
    return false;
  }
  LOG_NET_TRACE("saved {} peers to {}", root["peers"].size(), path.string());
  return true;
}

size_t RoutingTable::Load(const std::filesystem::path &path) {
  const std::string content = util::read_file_string(path);
  if (content.empty()) {
    LOG_NET_TRACE("peer file {} not found (starting fresh)", path.string());
    return 0;
  }

  size_t added = 0;
  try {
    json root = json::parse(content);
    if (root.value("version", 0) != 1 || !root.contains("peers") ||
        !root["peers"].is_array()) {
      LOG_NET_ERROR("Unsupported peers file {}", path.string());
      return 0;
    }
    for (const auto &entry : root["peers"]) {
      auto peer = PeerInfo::FromJson(entry);
      if (!peer) {
        continue;
      }
      peer->active = entry.value("active", true);
      const auto result = AddNode(*peer);
      if (result == AddResult::Inserted || result == AddResult::Replaced) {
        ++added;
      }
    }
  } catch (const json::exception &e) {
    LOG_NET_ERROR("Corrupt peers file {}: {}", path.string(), e.what());
    return added;
  }
  LOG_NET_INFO("Loaded {} peers from {}", added, path.string());
  return added;
}

} // namespace network
} // namespace ziacoin
