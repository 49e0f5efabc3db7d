// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/chainparams.hpp"
#include "network/network_manager.hpp"
#include "util/files.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace ziacoin {

namespace chain {
class Ledger;
}
namespace mining {
class MiningEngine;
}
namespace rpc {
class RPCServer;
}
namespace util {
class DirectoryLock;
}

namespace app {

// Application configuration (node.conf, then the command line)
struct AppConfig {
  std::filesystem::path datadir;

  network::NetworkManager::Config network_config;

  chain::ChainType chain_type = chain::ChainType::MAIN;

  // Overrides of the chain parameters (node.conf "blockchain" section)
  std::optional<int> difficulty;
  std::optional<double> block_time;

  // Start the mining worker after startup
  bool mining_enabled = false;

  // Periodic tasks
  std::chrono::seconds save_interval{60};
  std::chrono::seconds health_check_interval{60};
  std::chrono::seconds backup_interval{3600};

  AppConfig() : datadir(util::get_default_datadir()) {
    network_config.listen_port = protocol::ports::MAINNET;
  }
};

/**
 * Merge <path> (JSON) into `config`:
 *   {"network": {"host", "port", "bootstrap_nodes": [{"host", "port"}]},
 *    "blockchain": {"difficulty", "block_time"},
 *    "mining": {"enabled"}}
 * Every key is optional. A missing file is not an error; a file that exists
 * but does not parse, or has a mistyped value, is (error gets the reason).
 */
bool LoadConfigFile(const std::filesystem::path &path, AppConfig &config,
                    std::string &error);

// Application - wires the node together and owns its lifecycle
//
// Initialization order: data directory lock, chain (ledger load/recovery),
// miner, network, RPC. Shutdown runs in reverse: RPC, miner, network, then
// a final ledger flush.
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  chain::Ledger &ledger() { return *ledger_; }
  mining::MiningEngine &miner() { return *miner_; }
  network::NetworkManager &network_manager() { return *network_manager_; }
  const chain::ChainParams &chain_params() const { return *chain_params_; }

  bool is_running() const { return running_; }

  // For the RPC stop command and fatal conditions
  void request_shutdown();

  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  // Components (initialized in order)
  std::unique_ptr<util::DirectoryLock> datadir_lock_;
  std::unique_ptr<chain::ChainParams> chain_params_;
  std::unique_ptr<chain::Ledger> ledger_;
  std::unique_ptr<mining::MiningEngine> miner_;
  std::unique_ptr<network::NetworkManager> network_manager_;
  std::unique_ptr<rpc::RPCServer> rpc_server_;

  // Periodic save / health / backup thread
  std::thread periodic_thread_;
  std::mutex periodic_mutex_;
  std::condition_variable periodic_cv_;

  bool init_datadir();
  bool init_chain();
  bool init_network();
  bool init_rpc();
  void wire_components();

  void periodic_loop();
  void save_state();
  bool check_health();
  void backup_chain(const std::string &name);

  void shutdown();

  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace ziacoin
