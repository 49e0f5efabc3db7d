// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "chain/ledger.hpp"
#include "network/network_manager.hpp"
#include "network/peer_client.hpp"
#include "network/protocol.hpp"
#include "network/real_transport.hpp"
#include "network/routing_table.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace ziacoin;
using namespace ziacoin::test;
using namespace ziacoin::message;
using namespace std::chrono_literals;

namespace {

template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout = 5000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

// Every peer is a black hole: each call waits out `delay` and fails
class StalledPeerClient : public network::PeerClient {
public:
    explicit StalledPeerClient(std::chrono::milliseconds delay) : delay_(delay) {}

    std::optional<Message> Request(const std::string&, uint16_t, const Message&) override {
        Stall();
        return std::nullopt;
    }

    bool Send(const std::string&, uint16_t, const Message&) override {
        Stall();
        return false;
    }

    int calls() const { return calls_.load(); }

private:
    void Stall() {
        ++calls_;
        std::this_thread::sleep_for(delay_);
    }

    const std::chrono::milliseconds delay_;
    std::atomic<int> calls_{0};
};

} // namespace

TEST_CASE("Transport - requests over TCP", "[network][transport]") {
    auto params = chain::ChainParams::CreateRegTest();
    TempDir dir("ziacoin_transport");
    chain::Ledger ledger(*params, dir.path());
    REQUIRE(ledger.Initialize());

    network::NetworkManager::Config config;
    config.host = "127.0.0.1";
    config.listen_port = 0;
    auto transport = std::make_shared<network::RealTransport>();
    network::NetworkManager manager(ledger, config, transport);
    REQUIRE(manager.start());

    const uint16_t port = transport->listening_port();
    REQUIRE(port != 0);

    network::RealPeerClient client(2000ms);

    SECTION("Handshake is acknowledged") {
        HandshakeMessage hs{"127.0.0.1", 0, protocol::PROTOCOL_VERSION, 0};
        auto reply = client.Request("127.0.0.1", port, hs);
        REQUIRE(reply.has_value());
        REQUIRE(std::holds_alternative<HandshakeAckMessage>(*reply));
        REQUIRE(std::get<HandshakeAckMessage>(*reply).height == 0);
    }

    SECTION("Blocks are served") {
        auto reply = client.Request("127.0.0.1", port, GetBlocksMessage{0, 10});
        REQUIRE(reply.has_value());
        const auto& blocks = std::get<BlocksMessage>(*reply).blocks;
        REQUIRE(blocks.size() == 1);
        REQUIRE(blocks[0].hash == ledger.GetTip().hash);
    }

    SECTION("Announced block is appended") {
        auto key = crypto::PrivateKey::Generate();
        auto block = SealBlock(ledger.GetTip(), {MakeTransaction(key, "bob", 1.0)}, 1);
        REQUIRE(client.Send("127.0.0.1", port, NewBlockMessage{block}));
        REQUIRE(WaitFor([&] { return ledger.GetHeight() == 1; }));
        REQUIRE(ledger.GetTip().hash == block.hash);
    }

    SECTION("Listening peers register through the handshake") {
        HandshakeMessage hs{"127.0.0.1", 40001, protocol::PROTOCOL_VERSION, 0};
        REQUIRE(client.Request("127.0.0.1", port, hs).has_value());
        REQUIRE(WaitFor([&] { return manager.routing_table().Size() == 1; }));
    }

    SECTION("Stopped node no longer answers") {
        manager.stop();
        REQUIRE_FALSE(manager.is_running());
        REQUIRE_FALSE(client.Request("127.0.0.1", port, GetPeersMessage{}).has_value());
    }

    manager.stop();
}

TEST_CASE("Transport - unreachable hosts", "[network][transport]") {
    network::RealPeerClient client(500ms);

    SECTION("Nothing listening") {
        // Bind and release a port so it is known to be closed
        auto transport = std::make_shared<network::RealTransport>();
        transport->run();
        REQUIRE(transport->listen(0, [](network::TransportConnectionPtr) {}));
        const uint16_t port = transport->listening_port();
        transport->stop();

        REQUIRE_FALSE(client.Request("127.0.0.1", port, GetPeersMessage{}).has_value());
        REQUIRE_FALSE(client.Send("127.0.0.1", port, GetPeersMessage{}));
    }

    SECTION("Unresolvable host") {
        REQUIRE_FALSE(client.Request("no-such-host.invalid", 8333, GetPeersMessage{}).has_value());
    }
}

TEST_CASE("Network shutdown with unresponsive peers", "[network][shutdown]") {
    auto params = chain::ChainParams::CreateRegTest();
    TempDir dir("ziacoin_shutdown");
    chain::Ledger ledger(*params, dir.path());
    REQUIRE(ledger.Initialize());

    network::NetworkManager::Config config;
    config.listen_enabled = false;
    config.discovery_interval = 1h;
    config.dht_maintenance_interval = 1h;
    config.peer_maintenance_interval = 1h;
    config.sync_interval = 1h;

    auto client = std::make_unique<StalledPeerClient>(300ms);
    StalledPeerClient* stalled = client.get();
    network::NetworkManager manager(ledger, config, nullptr, std::move(client));

    const int64_t now = util::GetTime();
    for (uint16_t port = 9000; port < 9040; ++port) {
        manager.routing_table().AddNode(network::PeerInfo::Make("10.9.0.1", port, now));
    }
    // Enough peers that walking them all would take several seconds
    REQUIRE(manager.routing_table().GetActivePeers().size() >= 10);

    REQUIRE(manager.start());
    manager.request_sync();
    REQUIRE(WaitFor([&] { return stalled->calls() > 0; }));

    const auto started = std::chrono::steady_clock::now();
    manager.stop();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE_FALSE(manager.is_running());
    REQUIRE(elapsed < 2s);
    // Only the request in flight when stop() was called completed
    REQUIRE(stalled->calls() <= 2);
}
