// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/peer.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"

#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ziacoin {

namespace chain {
class Ledger;
struct Block;
} // namespace chain

namespace network {

class PeerClient;
class RoutingTable;
class SyncManager;

// NetworkManager - owns the networking side of a node
//
// - the inbound Transport (requests answered by SyncManager)
// - the RoutingTable of known peers, persisted as <datadir>/peers.json
// - the SyncManager and the PeerClient it uses for outbound requests
// - one I/O thread running the periodic timers (discovery, DHT maintenance,
//   peer maintenance, reconciliation) and posted broadcasts
//
// Timer handlers run on that single thread and never overlap. Outbound
// requests block it for at most REQUEST_TIMEOUT each, so stop() may wait
// that long for an in-flight round to finish.
class NetworkManager {
public:
  struct Config {
    std::string host;         // Address advertised in handshakes
    uint16_t listen_port;     // Also the advertised port
    bool listen_enabled;      // Accept inbound connections
    std::filesystem::path datadir; // peers.json lives here ("" = no persistence)
    std::vector<PeerInfo> bootstrap_nodes;

    std::chrono::milliseconds discovery_interval;
    std::chrono::milliseconds dht_maintenance_interval;
    std::chrono::milliseconds peer_maintenance_interval;
    std::chrono::milliseconds sync_interval;

    Config()
        : host("127.0.0.1"), listen_port(0), listen_enabled(true),
          discovery_interval(protocol::DISCOVERY_INTERVAL),
          dht_maintenance_interval(protocol::DHT_MAINTENANCE_INTERVAL),
          peer_maintenance_interval(protocol::PEER_MAINTENANCE_INTERVAL),
          sync_interval(protocol::SYNC_INTERVAL) {}
  };

  /**
   * @param transport nullptr = RealTransport
   * @param client    nullptr = RealPeerClient
   */
  NetworkManager(chain::Ledger &ledger, const Config &config,
                 std::shared_ptr<Transport> transport = nullptr,
                 std::unique_ptr<PeerClient> client = nullptr);
  ~NetworkManager();

  NetworkManager(const NetworkManager &) = delete;
  NetworkManager &operator=(const NetworkManager &) = delete;

  /**
   * Load peers.json, start the transport and (if enabled) listen, then start
   * the timer thread. The first discovery round runs immediately.
   * Returns false if the listen port cannot be bound.
   */
  bool start();

  // Cancel timers, stop the transport, join the thread, save peers.json.
  // Idempotent.
  void stop();

  bool is_running() const { return running_; }

  // Queue an announcement on the timer thread
  void announce_block(const chain::Block &block);

  // Run a reconciliation round on the timer thread now
  void request_sync();

  RoutingTable &routing_table() { return *routing_table_; }
  SyncManager &sync_manager() { return *sync_manager_; }
  const Config &config() const { return config_; }

  std::filesystem::path peers_path() const;

private:
  void post(std::function<void()> task);
  void handle_inbound(TransportConnectionPtr connection);

  using TimerTask = void (NetworkManager::*)();
  void schedule(boost::asio::steady_timer &timer,
                std::chrono::milliseconds interval, TimerTask task);

  void run_discovery();
  void run_dht_maintenance();
  void run_peer_maintenance();
  void run_sync();
  void save_peers();

  chain::Ledger &ledger_;
  Config config_;

  std::shared_ptr<Transport> transport_;
  std::unique_ptr<PeerClient> client_;
  std::unique_ptr<RoutingTable> routing_table_;
  std::unique_ptr<SyncManager> sync_manager_;

  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::thread io_thread_;

  std::unique_ptr<boost::asio::steady_timer> discovery_timer_;
  std::unique_ptr<boost::asio::steady_timer> dht_timer_;
  std::unique_ptr<boost::asio::steady_timer> peer_maintenance_timer_;
  std::unique_ptr<boost::asio::steady_timer> sync_timer_;

  std::atomic<bool> running_{false};
  std::mutex start_stop_mutex_;
};

} // namespace network
} // namespace ziacoin
