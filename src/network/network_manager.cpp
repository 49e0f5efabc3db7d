// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/network_manager.hpp"

#include "chain/block.hpp"
#include "chain/ledger.hpp"
#include "network/message.hpp"
#include "network/node_id.hpp"
#include "network/peer_client.hpp"
#include "network/real_transport.hpp"
#include "network/routing_table.hpp"
#include "network/sync_manager.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

#include <boost/asio/post.hpp>

namespace ziacoin {
namespace network {

NetworkManager::NetworkManager(chain::Ledger &ledger, const Config &config,
                               std::shared_ptr<Transport> transport,
                               std::unique_ptr<PeerClient> client)
    : ledger_(ledger), config_(config), transport_(std::move(transport)),
      client_(std::move(client)),
      io_context_(std::make_unique<boost::asio::io_context>()) {
  if (!transport_) {
    transport_ = std::make_shared<RealTransport>();
  }
  if (!client_) {
    client_ = std::make_unique<RealPeerClient>();
  }

  routing_table_ = std::make_unique<RoutingTable>(
      NodeId::FromHostPort(config_.host, config_.listen_port));
  sync_manager_ = std::make_unique<SyncManager>(
      ledger_, *routing_table_, *client_, config_.host, config_.listen_port);
  sync_manager_->SetBootstrapNodes(config_.bootstrap_nodes);
  sync_manager_->SetPostFunction(
      [this](SyncManager::Task task) { post(std::move(task)); });

  LOG_NET_DEBUG("local node id {} ({}:{})",
                routing_table_->GetLocalId().ToHex(), config_.host,
                config_.listen_port);
}

NetworkManager::~NetworkManager() { stop(); }

std::filesystem::path NetworkManager::peers_path() const {
  if (config_.datadir.empty()) {
    return {};
  }
  return config_.datadir / "peers.json";
}

void NetworkManager::post(std::function<void()> task) {
  if (!running_.load(std::memory_order_acquire)) {
    // Nothing will run the io_context; do the work here
    task();
    return;
  }
  boost::asio::post(*io_context_, [task = std::move(task)]() {
    try {
      task();
    } catch (const std::exception &e) {
      LOG_NET_ERROR("network task failed: {}", e.what());
    }
  });
}

bool NetworkManager::start() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }

  if (!config_.datadir.empty()) {
    routing_table_->Load(peers_path());
  }

  transport_->run();

  if (config_.listen_enabled) {
    bool ok = transport_->listen(
        config_.listen_port,
        [this](TransportConnectionPtr connection) {
          handle_inbound(std::move(connection));
        });
    if (!ok) {
      LOG_NET_ERROR("Failed to start listener on port {}",
                    config_.listen_port);
      transport_->stop();
      return false;
    }
  }

  sync_manager_->ClearStop();
  running_.store(true, std::memory_order_release);

  io_context_->restart();
  work_guard_ = std::make_unique<boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(*io_context_));

  discovery_timer_ = std::make_unique<boost::asio::steady_timer>(*io_context_);
  dht_timer_ = std::make_unique<boost::asio::steady_timer>(*io_context_);
  peer_maintenance_timer_ =
      std::make_unique<boost::asio::steady_timer>(*io_context_);
  sync_timer_ = std::make_unique<boost::asio::steady_timer>(*io_context_);

  io_thread_ = std::thread([this]() {
    try {
      io_context_->run();
    } catch (const std::exception &e) {
      LOG_NET_ERROR("network thread terminated: {}", e.what());
    }
  });

  // First discovery round straight away, then on the interval
  post([this]() { run_discovery(); });
  schedule(*discovery_timer_, config_.discovery_interval,
           &NetworkManager::run_discovery);
  schedule(*dht_timer_, config_.dht_maintenance_interval,
           &NetworkManager::run_dht_maintenance);
  schedule(*peer_maintenance_timer_, config_.peer_maintenance_interval,
           &NetworkManager::run_peer_maintenance);
  schedule(*sync_timer_, config_.sync_interval, &NetworkManager::run_sync);

  LOG_NET_INFO("network started ({}:{}, {} bootstrap nodes)", config_.host,
               config_.listen_port, config_.bootstrap_nodes.size());
  return true;
}

void NetworkManager::stop() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (!running_.exchange(false)) {
    return;
  }

  // Outbound loops on the io thread give up at their next peer
  sync_manager_->RequestStop();

  for (auto *timer : {discovery_timer_.get(), dht_timer_.get(),
                      peer_maintenance_timer_.get(), sync_timer_.get()}) {
    if (timer) {
      timer->cancel();
    }
  }

  transport_->stop();

  work_guard_.reset();
  io_context_->stop();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }

  discovery_timer_.reset();
  dht_timer_.reset();
  peer_maintenance_timer_.reset();
  sync_timer_.reset();

  save_peers();
}

void NetworkManager::schedule(boost::asio::steady_timer &timer,
                              std::chrono::milliseconds interval,
                              TimerTask task) {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }
  timer.expires_after(interval);
  timer.async_wait([this, &timer, interval,
                    task](const boost::system::error_code &ec) {
    if (ec || !running_.load(std::memory_order_acquire)) {
      return;
    }
    try {
      (this->*task)();
    } catch (const std::exception &e) {
      LOG_NET_ERROR("periodic network task failed: {}", e.what());
    }
    schedule(timer, interval, task);
  });
}

void NetworkManager::handle_inbound(TransportConnectionPtr connection) {
  const std::string remote = connection->remote_address() + ":" +
                             std::to_string(connection->remote_port());
  std::weak_ptr<TransportConnection> weak = connection;

  connection->set_receive_callback(
      [this, weak, remote](const std::string &line) {
        auto conn = weak.lock();
        if (!conn) {
          return;
        }
        auto msg = message::DecodeMessage(line);
        if (!msg) {
          LOG_NET_DEBUG("invalid message from {}, closing connection", remote);
          conn->close();
          return;
        }
        auto reply = sync_manager_->ProcessMessage(*msg, remote);
        if (reply) {
          conn->send(message::EncodeMessage(*reply));
        }
      });
  connection->set_disconnect_callback(
      [remote]() { LOG_NET_TRACE("connection from {} closed", remote); });
  connection->start();
}

void NetworkManager::announce_block(const chain::Block &block) {
  post([this, block]() { sync_manager_->BroadcastBlock(block); });
}

void NetworkManager::request_sync() {
  post([this]() { run_sync(); });
}

void NetworkManager::run_discovery() { sync_manager_->DiscoverPeers(); }

void NetworkManager::run_dht_maintenance() {
  const size_t removed = routing_table_->RemoveInactive(
      util::GetTime(), protocol::PEER_INACTIVITY_TIMEOUT_SEC);
  if (removed > 0) {
    LOG_NET_INFO("removed {} stale peers ({} remain)", removed,
                 routing_table_->Size());
  }
  save_peers();
}

void NetworkManager::run_peer_maintenance() { sync_manager_->MaintainPeers(); }

void NetworkManager::run_sync() {
  if (sync_manager_->Reconcile()) {
    LOG_NET_INFO("chain updated from peers, height {}", ledger_.GetHeight());
  }
}

void NetworkManager::save_peers() {
  if (config_.datadir.empty()) {
    return;
  }
  routing_table_->Save(peers_path());
}

} // namespace network
} // namespace ziacoin
