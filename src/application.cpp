// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"

#include "chain/ledger.hpp"
#include "chain/miner.hpp"
#include "network/peer_client.hpp"
#include "network/rpc_server.hpp"
#include "network/sync_manager.hpp"
#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include "version.hpp"

#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
#include <unistd.h> // write(), STDOUT_FILENO (async-signal-safe)

namespace ziacoin {
namespace app {

using json = nlohmann::json;

// ============================================================================
// Configuration file
// ============================================================================

bool LoadConfigFile(const std::filesystem::path &path, AppConfig &config,
                    std::string &error) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return true;
  }

  const std::string content = util::read_file_string(path);
  if (content.empty()) {
    return true;
  }

  try {
    const json root = json::parse(content);
    if (!root.is_object()) {
      error = "top level must be an object";
      return false;
    }

    if (root.contains("network")) {
      const json &net = root.at("network");
      if (net.contains("host")) {
        config.network_config.host = net.at("host").get<std::string>();
      }
      if (net.contains("port")) {
        const int port = net.at("port").get<int>();
        if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
          error = "network.port out of range";
          return false;
        }
        config.network_config.listen_port = static_cast<uint16_t>(port);
      }
      if (net.contains("bootstrap_nodes")) {
        config.network_config.bootstrap_nodes.clear();
        for (const auto &entry : net.at("bootstrap_nodes")) {
          auto node = network::PeerInfo::FromJson(entry);
          if (!node) {
            error = "invalid bootstrap node " + entry.dump();
            return false;
          }
          config.network_config.bootstrap_nodes.push_back(std::move(*node));
        }
      }
    }

    if (root.contains("blockchain")) {
      const json &bc = root.at("blockchain");
      if (bc.contains("difficulty")) {
        config.difficulty = bc.at("difficulty").get<int>();
      }
      if (bc.contains("block_time")) {
        config.block_time = bc.at("block_time").get<double>();
      }
    }

    if (root.contains("mining")) {
      const json &mining = root.at("mining");
      if (mining.contains("enabled")) {
        config.mining_enabled = mining.at("enabled").get<bool>();
      }
    }
  } catch (const json::exception &e) {
    error = e.what();
    return false;
  }
  return true;
}

// ============================================================================
// Application
// ============================================================================

Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

void Application::request_shutdown() {
  shutdown_requested_ = true;
  periodic_cv_.notify_all();
}

bool Application::initialize() {
  const std::string chain_name =
      config_.chain_type == chain::ChainType::REGTEST   ? "regtest"
      : config_.chain_type == chain::ChainType::TESTNET ? "test"
                                                        : "main";
  std::cout << GetStartupBanner(chain_name) << std::flush;

  LOG_INFO("Initializing ZiaCoin...");

  if (!init_datadir()) {
    LOG_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_chain()) {
    LOG_ERROR("Failed to initialize blockchain");
    return false;
  }

  LOG_INFO("Initializing miner...");
  miner_ = std::make_unique<mining::MiningEngine>(*ledger_, *chain_params_);

  if (!init_network()) {
    LOG_ERROR("Failed to initialize network manager");
    return false;
  }

  if (!init_rpc()) {
    LOG_ERROR("Failed to initialize RPC server");
    return false;
  }

  wire_components();

  LOG_INFO("Initialization complete");
  return true;
}

void Application::wire_components() {
  auto &sync = network_manager_->sync_manager();

  // Locally mined blocks go out to peers
  miner_->SetBlockFoundCallback([this](const chain::Block &block) {
    network_manager_->announce_block(block);
  });

  // A tip change from the network makes the current candidate stale
  sync.SetTipChangedCallback([this](const chain::Block &tip) {
    LOG_CHAIN_DEBUG("tip changed to {} ({}), interrupting miner", tip.index,
                    tip.hash);
    miner_->Interrupt();
  });

  sync.SetTransactionAcceptedCallback(
      [this](const chain::Transaction &) { miner_->NotifyNewTransaction(); });
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }

  LOG_INFO("Starting ZiaCoin...");

  setup_signal_handlers();

  if (!network_manager_->start()) {
    LOG_ERROR("Failed to start network manager");
    return false;
  }

  if (!rpc_server_->Start()) {
    LOG_ERROR("Failed to start RPC server");
    network_manager_->stop();
    return false;
  }

  running_ = true;

  if (config_.mining_enabled) {
    LOG_INFO("Mining enabled, starting miner");
    miner_->Start();
  }

  periodic_thread_ = std::thread(&Application::periodic_loop, this);

  LOG_INFO("ZiaCoin started successfully");
  LOG_INFO("Data directory: {}", config_.datadir.string());
  if (config_.network_config.listen_enabled) {
    LOG_INFO("Listening on port: {}", config_.network_config.listen_port);
  } else {
    LOG_INFO("Inbound connections disabled");
  }
  LOG_INFO("Press Ctrl+C to stop");

  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_.exchange(false)) {
    return;
  }

  LOG_INFO("Shutting down ZiaCoin...");

  periodic_cv_.notify_all();
  if (periodic_thread_.joinable()) {
    periodic_thread_.join();
  }

  if (rpc_server_) {
    LOG_INFO("Stopping RPC server...");
    rpc_server_->Stop();
  }

  if (miner_ && miner_->IsMining()) {
    LOG_INFO("Stopping miner...");
    miner_->Stop();
  }

  if (network_manager_) {
    LOG_INFO("Stopping network manager...");
    network_manager_->stop();
  }

  if (ledger_) {
    LOG_INFO("Flushing chain state...");
    if (!ledger_->Flush()) {
      LOG_ERROR("Failed to flush chain state");
    }
  }

  if (datadir_lock_) {
    datadir_lock_->Release();
  }

  LOG_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }

  datadir_lock_ = std::make_unique<util::DirectoryLock>(config_.datadir);
  switch (datadir_lock_->Acquire()) {
  case util::DirectoryLock::Result::Success:
    break;
  case util::DirectoryLock::Result::ErrorWrite:
    LOG_ERROR("Cannot write to data directory: {}", config_.datadir.string());
    return false;
  case util::DirectoryLock::Result::ErrorLock:
    LOG_ERROR("Cannot obtain a lock on data directory {}. "
              "ZiaCoin is probably already running.",
              config_.datadir.string());
    return false;
  }

  LOG_DEBUG("Successfully locked data directory");
  return true;
}

bool Application::init_chain() {
  LOG_INFO("Initializing blockchain...");

  chain_params_ = chain::ChainParams::Create(config_.chain_type);
  LOG_INFO("Using {}", chain_params_->GetChainTypeString());

  if (config_.block_time) {
    if (*config_.block_time <= 0) {
      LOG_ERROR("block_time must be positive (got {})", *config_.block_time);
      return false;
    }
    chain_params_->SetTargetBlockTime(*config_.block_time);
  }

  ledger_ = std::make_unique<chain::Ledger>(*chain_params_, config_.datadir);
  try {
    if (!ledger_->Initialize()) {
      return false;
    }
  } catch (const chain::RecoveryFailed &e) {
    LOG_ERROR("{}", e.what());
    return false;
  }

  if (config_.difficulty) {
    LOG_INFO("Overriding mining difficulty: {} (was {})", *config_.difficulty,
             ledger_->GetDifficulty());
    ledger_->SetDifficulty(*config_.difficulty);
  }

  // Recovery needs at least one snapshot of a chain that validated
  backup_chain("startup");

  LOG_INFO("Blockchain initialized at height {} (tip {})",
           ledger_->GetHeight(), ledger_->GetTip().hash);
  return true;
}

bool Application::init_network() {
  LOG_INFO("Initializing network manager...");

  config_.network_config.datadir = config_.datadir;
  if (config_.network_config.bootstrap_nodes.empty()) {
    for (const auto &seed : chain_params_->FixedSeeds()) {
      auto host_port = util::ParseHostPort(seed);
      if (!host_port) {
        LOG_WARN("Ignoring malformed seed node '{}'", seed);
        continue;
      }
      config_.network_config.bootstrap_nodes.push_back(network::PeerInfo::Make(
          host_port->first, host_port->second, util::GetTime()));
    }
  }

  network_manager_ = std::make_unique<network::NetworkManager>(
      *ledger_, config_.network_config);
  return true;
}

bool Application::init_rpc() {
  LOG_INFO("Initializing RPC server...");

  const std::string socket_path = (config_.datadir / "node.sock").string();
  rpc_server_ = std::make_unique<rpc::RPCServer>(
      socket_path, *ledger_, *network_manager_, miner_.get(), *chain_params_,
      [this]() { request_shutdown(); });
  return true;
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    const char *msg = "\nReceived signal\n";
    ssize_t ignored = write(STDOUT_FILENO, msg, 17);
    (void)ignored;
    // Only the atomic flag: wait_for_shutdown() polls it
    instance_->shutdown_requested_ = true;
  }
}

void Application::periodic_loop() {
  using namespace std::chrono;

  auto last_save = steady_clock::now();
  auto last_health = steady_clock::now();
  auto last_backup = steady_clock::now();

  while (running_ && !shutdown_requested_) {
    {
      std::unique_lock<std::mutex> lock(periodic_mutex_);
      periodic_cv_.wait_for(lock, seconds(1), [this]() {
        return !running_ || shutdown_requested_;
      });
    }
    if (!running_ || shutdown_requested_) {
      break;
    }

    const auto now = steady_clock::now();

    if (now - last_save >= config_.save_interval) {
      save_state();
      last_save = now;
    }

    if (now - last_health >= config_.health_check_interval) {
      last_health = now;
      if (!check_health()) {
        break;
      }
    }

    if (now - last_backup >= config_.backup_interval) {
      backup_chain("hourly");
      last_backup = now;
    }
  }
}

void Application::save_state() {
  if (!ledger_->Flush()) {
    LOG_ERROR("Periodic chain state save failed");
  } else {
    LOG_DEBUG("Periodic save complete (height {}, {} pending)",
              ledger_->GetHeight(), ledger_->GetPendingCount());
  }
}

bool Application::check_health() {
  if (ledger_->IsChainValid()) {
    return true;
  }

  LOG_ERROR("Health check: chain is invalid, attempting recovery");
  try {
    ledger_->RecoverChain();
  } catch (const chain::RecoveryFailed &e) {
    LOG_ERROR("{}. Shutting down to protect chain integrity.", e.what());
    request_shutdown();
    return false;
  }
  LOG_INFO("Health check: chain recovered at height {}", ledger_->GetHeight());
  return true;
}

void Application::backup_chain(const std::string &name) {
  if (!ledger_->IsChainValid()) {
    LOG_WARN("Skipping backup '{}': chain is invalid", name);
    return;
  }
  if (!ledger_->Backup(name)) {
    LOG_ERROR("Chain backup '{}' failed", name);
  } else {
    LOG_DEBUG("Chain backup '{}' written (height {})", name,
              ledger_->GetHeight());
  }
}

} // namespace app
} // namespace ziacoin
