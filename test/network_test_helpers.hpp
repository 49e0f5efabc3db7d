// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// In-memory network: nodes exchange messages through their SyncManagers
// without sockets. Every message is encoded and decoded on the way, as it
// would be on the wire.

#pragma once

#include "chain/chainparams.hpp"
#include "chain/ledger.hpp"
#include "network/message.hpp"
#include "network/node_id.hpp"
#include "network/peer_client.hpp"
#include "network/routing_table.hpp"
#include "network/sync_manager.hpp"
#include "test_helpers.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace ziacoin {
namespace test {

class FakeNetwork {
public:
    void Register(const std::string& endpoint, network::SyncManager* node) {
        std::lock_guard<std::mutex> lock(mutex_);
        nodes_[endpoint] = node;
    }

    // Unreachable endpoints fail every request, as a dead host would
    void SetReachable(const std::string& endpoint, bool reachable) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reachable) {
            down_.erase(endpoint);
        } else {
            down_.insert(endpoint);
        }
    }

    std::optional<message::Message> Deliver(const std::string& from,
                                            const std::string& to,
                                            const message::Message& msg) {
        network::SyncManager* target = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++delivered_[message::CommandOf(msg)];
            if (down_.count(to)) {
                return std::nullopt;
            }
            auto it = nodes_.find(to);
            if (it == nodes_.end()) {
                return std::nullopt;
            }
            target = it->second;
        }
        auto decoded = message::DecodeMessage(message::EncodeMessage(msg));
        if (!decoded) {
            return std::nullopt;
        }
        // Called without the lock: the target may gossip onwards
        return target->ProcessMessage(*decoded, from);
    }

    bool IsReachable(const std::string& endpoint) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return nodes_.count(endpoint) > 0 && down_.count(endpoint) == 0;
    }

    size_t Count(const std::string& command) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = delivered_.find(command);
        return it == delivered_.end() ? 0 : it->second;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, network::SyncManager*> nodes_;
    std::set<std::string> down_;
    std::map<std::string, size_t> delivered_;
};

class FakePeerClient : public network::PeerClient {
public:
    FakePeerClient(FakeNetwork& net, std::string self) : net_(net), self_(std::move(self)) {}

    std::optional<message::Message> Request(const std::string& host, uint16_t port,
                                            const message::Message& request) override {
        auto reply = net_.Deliver(self_, Endpoint(host, port), request);
        if (!reply) {
            return std::nullopt;
        }
        return message::DecodeMessage(message::EncodeMessage(*reply));
    }

    bool Send(const std::string& host, uint16_t port,
              const message::Message& announcement) override {
        const std::string to = Endpoint(host, port);
        if (!net_.IsReachable(to)) {
            return false;
        }
        net_.Deliver(self_, to, announcement);
        return true;
    }

    static std::string Endpoint(const std::string& host, uint16_t port) {
        return host + ":" + std::to_string(port);
    }

private:
    FakeNetwork& net_;
    const std::string self_;
};

// A regtest node wired to a FakeNetwork
struct TestNode {
    TestNode(FakeNetwork& net, const std::string& host_, uint16_t port_)
        : host(host_),
          port(port_),
          params(chain::ChainParams::CreateRegTest()),
          ledger(*params, dir.path()),
          table(network::NodeId::FromHostPort(host_, port_)),
          client(net, FakePeerClient::Endpoint(host_, port_)),
          sync(ledger, table, client, host_, port_) {
        initialized = ledger.Initialize();
        net.Register(FakePeerClient::Endpoint(host_, port_), &sync);
    }

    network::PeerInfo Info() const {
        return network::PeerInfo::Make(host, port, util::GetTime());
    }

    std::string host;
    uint16_t port;
    TempDir dir{"ziacoin_node"};
    std::unique_ptr<chain::ChainParams> params;
    chain::Ledger ledger;
    network::RoutingTable table;
    FakePeerClient client;
    network::SyncManager sync;
    bool initialized{false};
};

} // namespace test
} // namespace ziacoin
