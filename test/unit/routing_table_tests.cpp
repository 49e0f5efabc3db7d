// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/node_id.hpp"
#include "network/routing_table.hpp"
#include "test_helpers.hpp"
#include "util/files.hpp"

#include <algorithm>

using namespace ziacoin;
using namespace ziacoin::network;
using ziacoin::test::TempDir;

namespace {

// Id whose first byte is `first` and last byte `last`, zero elsewhere
NodeId MakeId(uint8_t first, uint8_t last = 0) {
    NodeId::Bytes bytes{};
    bytes.front() = first;
    bytes.back() = last;
    return NodeId(bytes);
}

PeerInfo MakePeer(const NodeId& id, int64_t last_seen, uint16_t port = 9000) {
    PeerInfo peer;
    peer.host = "10.0.0." + std::to_string(id.bytes().front());
    peer.port = port;
    peer.node_id = id;
    peer.last_seen = last_seen;
    peer.active = true;
    return peer;
}

} // namespace

TEST_CASE("NodeId", "[dht][nodeid]") {
    SECTION("Derived from host:port, 160 bits") {
        auto a = NodeId::FromHostPort("127.0.0.1", 8333);
        REQUIRE(a == NodeId::FromHostPort("127.0.0.1", 8333));
        REQUIRE(a != NodeId::FromHostPort("127.0.0.1", 8334));
        REQUIRE(a.ToHex().size() == 40);
    }

    SECTION("Hex round trip and validation") {
        auto id = NodeId::Random();
        REQUIRE(NodeId::FromHex(id.ToHex()) == std::optional<NodeId>(id));
        REQUIRE_FALSE(NodeId::FromHex("abc").has_value());
        REQUIRE_FALSE(NodeId::FromHex(std::string(40, 'z')).has_value());
    }

    SECTION("XOR distance") {
        auto a = MakeId(0x80);
        REQUIRE(a.Distance(a).IsZero());
        REQUIRE(a.Distance(MakeId(0)) == a);
        REQUIRE(MakeId(0x80).BitLength() == 160);
        REQUIRE(MakeId(0x01).BitLength() == 153);
        REQUIRE(MakeId(0, 0x01).BitLength() == 1);
        REQUIRE(NodeId().BitLength() == 0);
    }
}

TEST_CASE("RoutingTable bucket placement", "[dht][routing]") {
    RoutingTable table(NodeId{});

    REQUIRE(table.BucketIndex(MakeId(0x80)) == 0);
    REQUIRE(table.BucketIndex(MakeId(0xff)) == 0);
    REQUIRE(table.BucketIndex(MakeId(0x40)) == 1);
    REQUIRE(table.BucketIndex(MakeId(0x01)) == 7);
    REQUIRE(table.BucketIndex(MakeId(0, 0x01)) == 159);
    REQUIRE(table.BucketIndex(NodeId{}) == 159);

    SECTION("Own id is rejected") {
        REQUIRE(table.AddNode(MakePeer(NodeId{}, 1)) == RoutingTable::AddResult::Rejected);
        REQUIRE(table.Size() == 0);
    }

    SECTION("Re-adding refreshes") {
        REQUIRE(table.AddNode(MakePeer(MakeId(0x80), 10)) == RoutingTable::AddResult::Inserted);
        auto newer = MakePeer(MakeId(0x80), 20);
        newer.height = 7;
        REQUIRE(table.AddNode(newer) == RoutingTable::AddResult::Refreshed);
        REQUIRE(table.Size() == 1);
        auto stored = table.GetPeer(MakeId(0x80));
        REQUIRE(stored->last_seen == 20);
        REQUIRE(stored->height == 7);
    }
}

TEST_CASE("RoutingTable bucket bound", "[dht][routing]") {
    RoutingTable table(NodeId{});
    const size_t k = table.GetK();
    REQUIRE(k == protocol::K_BUCKET_SIZE);

    // Every id with the top bit set lands in bucket 0
    size_t dropped = 0;
    for (int i = 0; i < 100; ++i) {
        auto result = table.AddNode(MakePeer(MakeId(0x80 | (i & 0x7f), static_cast<uint8_t>(i)), i));
        if (result == RoutingTable::AddResult::Dropped) {
            ++dropped;
        }
    }
    REQUIRE(table.BucketSize(0) == k);
    REQUIRE(table.Size() == k);
    REQUIRE(dropped == 100 - k);

    for (size_t i = 0; i < RoutingTable::NUM_BUCKETS; ++i) {
        REQUIRE(table.BucketSize(i) <= k);
    }
}

TEST_CASE("RoutingTable eviction", "[dht][routing]") {
    RoutingTable table(NodeId{}, 2);
    auto oldest = MakePeer(MakeId(0x80), 100);
    auto newer = MakePeer(MakeId(0x81), 200);
    REQUIRE(table.AddNode(oldest) == RoutingTable::AddResult::Inserted);
    REQUIRE(table.AddNode(newer) == RoutingTable::AddResult::Inserted);

    auto candidate = MakePeer(MakeId(0x82), 300);
    std::vector<NodeId> pinged;

    SECTION("Unresponsive oldest entry is replaced") {
        auto result = table.AddNode(candidate, [&](const PeerInfo& p) {
            pinged.push_back(p.node_id);
            return false;
        });
        REQUIRE(result == RoutingTable::AddResult::Replaced);
        REQUIRE(pinged == std::vector<NodeId>{oldest.node_id});
        REQUIRE_FALSE(table.GetPeer(oldest.node_id).has_value());
        REQUIRE(table.GetPeer(candidate.node_id).has_value());
        REQUIRE(table.BucketSize(0) == 2);
    }

    SECTION("Responsive oldest entry stays and the newcomer is dropped") {
        auto result = table.AddNode(candidate, [&](const PeerInfo& p) {
            pinged.push_back(p.node_id);
            return true;
        });
        REQUIRE(result == RoutingTable::AddResult::Dropped);
        REQUIRE(pinged.size() == 1);
        REQUIRE(table.GetPeer(oldest.node_id).has_value());
        REQUIRE_FALSE(table.GetPeer(candidate.node_id).has_value());
    }

    SECTION("Inactive entry is evicted without a ping") {
        REQUIRE(table.MarkInactive(newer.node_id));
        auto result = table.AddNode(candidate, [&](const PeerInfo& p) {
            pinged.push_back(p.node_id);
            return true;
        });
        REQUIRE(result == RoutingTable::AddResult::Replaced);
        REQUIRE(pinged.empty());
        REQUIRE_FALSE(table.GetPeer(newer.node_id).has_value());
        REQUIRE(table.GetPeer(oldest.node_id).has_value());
    }

    SECTION("Without a ping function a full bucket drops the newcomer") {
        REQUIRE(table.AddNode(candidate) == RoutingTable::AddResult::Dropped);
        REQUIRE(table.Size() == 2);
    }

    SECTION("Other buckets are unaffected") {
        REQUIRE(table.AddNode(MakePeer(MakeId(0x40), 1)) == RoutingTable::AddResult::Inserted);
        REQUIRE(table.Size() == 3);
    }
}

TEST_CASE("RoutingTable proximity ordering", "[dht][routing]") {
    RoutingTable table(NodeId::FromHostPort("127.0.0.1", 8333));
    std::vector<PeerInfo> peers;
    for (uint16_t port = 9000; port < 9015; ++port) {
        auto peer = PeerInfo::Make("192.168.1.1", port, 1000);
        peers.push_back(peer);
        REQUIRE(table.AddNode(peer) == RoutingTable::AddResult::Inserted);
    }

    const NodeId target = NodeId::Random();
    auto by_distance = [&target](const PeerInfo& a, const PeerInfo& b) {
        return a.node_id.Distance(target) < b.node_id.Distance(target);
    };
    std::sort(peers.begin(), peers.end(), by_distance);

    SECTION("Every known peer, nearest first") {
        auto found = table.FindNode(target);
        REQUIRE(found.size() == peers.size());
        REQUIRE(std::is_sorted(found.begin(), found.end(), by_distance));
        for (size_t i = 0; i < found.size(); ++i) {
            REQUIRE(found[i].node_id == peers[i].node_id);
        }
    }

    SECTION("Truncated to the requested count") {
        auto found = table.FindNode(target, 5);
        REQUIRE(found.size() == 5);
        for (size_t i = 0; i < found.size(); ++i) {
            REQUIRE(found[i].node_id == peers[i].node_id);
        }
    }

    SECTION("Exact id comes first") {
        auto found = table.FindNode(peers[7].node_id, 1);
        REQUIRE(found.size() == 1);
        REQUIRE(found[0].node_id == peers[7].node_id);
    }
}

TEST_CASE("RoutingTable lookup wider than one bucket", "[dht][routing]") {
    // Two peers in each of the four nearest-to-top buckets, k = 2
    RoutingTable table(NodeId{}, 2);
    const uint8_t firsts[] = {0x80, 0xC0, 0x40, 0x60, 0x20, 0x30, 0x10, 0x18};
    for (uint8_t first : firsts) {
        REQUIRE(table.AddNode(MakePeer(MakeId(first), 1)) == RoutingTable::AddResult::Inserted);
    }
    REQUIRE(table.Size() == 8);

    const NodeId target = MakeId(0x80);
    auto by_distance = [&target](const PeerInfo& a, const PeerInfo& b) {
        return a.node_id.Distance(target) < b.node_id.Distance(target);
    };

    SECTION("Count above k spills into neighbouring buckets") {
        auto found = table.FindNode(target, 5);
        REQUIRE(found.size() == 5);
        REQUIRE(std::is_sorted(found.begin(), found.end(), by_distance));
        REQUIRE(found[0].node_id == target);
    }

    SECTION("Every peer when count covers the table") {
        REQUIRE(table.FindNode(target, 8).size() == 8);
        REQUIRE(table.FindNode(target, 50).size() == 8);
    }

    SECTION("Default count is k") {
        REQUIRE(table.FindNode(target).size() == 2);
    }
}

TEST_CASE("RoutingTable liveness bookkeeping", "[dht][routing]") {
    RoutingTable table(NodeId{});
    auto a = MakePeer(MakeId(0x80), 100);
    auto b = MakePeer(MakeId(0x40), 5000);
    table.AddNode(a);
    table.AddNode(b);

    SECTION("Inactive peers are excluded from the active set") {
        REQUIRE(table.MarkInactive(a.node_id));
        auto active = table.GetActivePeers();
        REQUIRE(active.size() == 1);
        REQUIRE(active[0].node_id == b.node_id);

        REQUIRE(table.MarkActive(a.node_id, 6000));
        REQUIRE(table.GetActivePeers().size() == 2);
        REQUIRE(table.GetPeer(a.node_id)->last_seen == 6000);
    }

    SECTION("Stale entries expire") {
        REQUIRE(table.RemoveInactive(4000, 3600) == 1);
        REQUIRE_FALSE(table.GetPeer(a.node_id).has_value());
        REQUIRE(table.GetPeer(b.node_id).has_value());
    }

    SECTION("Unknown ids") {
        REQUIRE_FALSE(table.MarkInactive(MakeId(0x20)));
        REQUIRE_FALSE(table.Remove(MakeId(0x20)));
        REQUIRE(table.Remove(a.node_id));
        REQUIRE(table.Size() == 1);
    }
}

TEST_CASE("RoutingTable persistence", "[dht][routing]") {
    TempDir dir;
    auto path = dir.path() / "peers.json";
    const NodeId local = NodeId::FromHostPort("127.0.0.1", 8333);

    RoutingTable table(local);
    table.AddNode(PeerInfo::Make("10.1.1.1", 8333, 100, "1.0.0", 4));
    table.AddNode(PeerInfo::Make("10.1.1.2", 8333, 200, "1.0.0", 5));
    table.MarkInactive(NodeId::FromHostPort("10.1.1.2", 8333));
    REQUIRE(table.Save(path));

    RoutingTable restored(local);
    REQUIRE(restored.Load(path) == 2);
    auto first = restored.GetPeer(NodeId::FromHostPort("10.1.1.1", 8333));
    REQUIRE(first.has_value());
    REQUIRE(first->height == 4);
    REQUIRE(first->last_seen == 100);
    REQUIRE(first->active);
    REQUIRE_FALSE(restored.GetPeer(NodeId::FromHostPort("10.1.1.2", 8333))->active);

    SECTION("Missing or corrupt file loads nothing") {
        RoutingTable empty(local);
        REQUIRE(empty.Load(dir.path() / "absent.json") == 0);
        REQUIRE(util::atomic_write_file(path, "{not json"));
        REQUIRE(empty.Load(path) == 0);
    }
}
