// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

/**
 * RPC Server Implementation - Unix Domain Sockets
 *
 * The socket lives at datadir/node.sock and is only reachable locally;
 * access control is the file mode (0600).
 */

#include "network/rpc_server.hpp"

#include "chain/block.hpp"
#include "chain/chainparams.hpp"
#include "chain/ledger.hpp"
#include "chain/miner.hpp"
#include "chain/transaction.hpp"
#include "chain/validation.hpp"
#include "network/network_manager.hpp"
#include "network/routing_table.hpp"
#include "network/sync_manager.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include "version.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace ziacoin {
namespace rpc {

using json = nlohmann::json;

namespace {

std::string Reply(const json &j) {
  return j.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

void SendAll(int fd, const std::string &data) {
  size_t offset = 0;
  while (offset < data.size()) {
    ssize_t sent =
        send(fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      LOG_NET_WARN("failed to send RPC response: {}", std::strerror(errno));
      return;
    }
    offset += static_cast<size_t>(sent);
  }
}

} // namespace

RPCServer::RPCServer(const std::string &socket_path, chain::Ledger &ledger,
                     network::NetworkManager &network_manager,
                     mining::MiningEngine *miner,
                     const chain::ChainParams &params,
                     std::function<void()> shutdown_callback)
    : socket_path_(socket_path), ledger_(ledger),
      network_manager_(network_manager), miner_(miner), params_(params),
      shutdown_callback_(std::move(shutdown_callback)), server_fd_(-1),
      running_(false), shutting_down_(false) {
  RegisterHandlers();
}

RPCServer::~RPCServer() { Stop(); }

void RPCServer::RegisterHandlers() {
  // Chain
  handlers_["getinfo"] = [this](const auto &p) { return HandleGetInfo(p); };
  handlers_["getblockcount"] = [this](const auto &p) {
    return HandleGetBlockCount(p);
  };
  handlers_["getchain"] = [this](const auto &p) { return HandleGetChain(p); };
  handlers_["getblock"] = [this](const auto &p) { return HandleGetBlock(p); };
  handlers_["validatechain"] = [this](const auto &p) {
    return HandleValidateChain(p);
  };
  handlers_["getbalance"] = [this](const auto &p) {
    return HandleGetBalance(p);
  };

  // Transactions
  handlers_["sendtransaction"] = [this](const auto &p) {
    return HandleSendTransaction(p);
  };
  handlers_["getpending"] = [this](const auto &p) {
    return HandleGetPending(p);
  };

  // Mining
  handlers_["mine"] = [this](const auto &p) { return HandleMine(p); };
  handlers_["startmining"] = [this](const auto &p) {
    return HandleStartMining(p);
  };
  handlers_["stopmining"] = [this](const auto &p) {
    return HandleStopMining(p);
  };
  handlers_["getmininginfo"] = [this](const auto &p) {
    return HandleGetMiningInfo(p);
  };

  // Network
  handlers_["getpeers"] = [this](const auto &p) { return HandleGetPeers(p); };
  handlers_["getnetworkinfo"] = [this](const auto &p) {
    return HandleGetNetworkInfo(p);
  };
  handlers_["addpeer"] = [this](const auto &p) { return HandleAddPeer(p); };

  // Storage
  handlers_["backup"] = [this](const auto &p) { return HandleBackup(p); };
  handlers_["recoverchain"] = [this](const auto &p) {
    return HandleRecoverChain(p);
  };

  // Control
  handlers_["stop"] = [this](const auto &p) { return HandleStop(p); };
  handlers_["setmocktime"] = [this](const auto &p) {
    return HandleSetMockTime(p);
  };
}

bool RPCServer::Start() {
  if (running_) {
    return true;
  }

  if (socket_path_.size() >= sizeof(sockaddr_un::sun_path)) {
    LOG_ERROR("RPC socket path too long: {}", socket_path_);
    return false;
  }

  unlink(socket_path_.c_str());

  mode_t old_umask = umask(0077);

  server_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
  if (server_fd_ < 0) {
    umask(old_umask);
    LOG_ERROR("Failed to create RPC socket");
    return false;
  }

  struct sockaddr_un addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

  if (bind(server_fd_, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
    LOG_ERROR("Failed to bind RPC socket to {}: {}", socket_path_,
              std::strerror(errno));
    close(server_fd_);
    server_fd_ = -1;
    umask(old_umask);
    return false;
  }

  umask(old_umask);
  chmod(socket_path_.c_str(), 0600);

  if (listen(server_fd_, 5) < 0) {
    LOG_ERROR("Failed to listen on RPC socket");
    close(server_fd_);
    server_fd_ = -1;
    return false;
  }

  shutting_down_ = false;
  running_ = true;
  server_thread_ = std::thread(&RPCServer::ServerThread, this);

  LOG_NET_INFO("RPC server started on {}", socket_path_);
  return true;
}

void RPCServer::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  shutting_down_.store(true, std::memory_order_release);

  if (server_fd_ >= 0) {
    // shutdown() wakes the blocked accept()
    shutdown(server_fd_, SHUT_RDWR);
    close(server_fd_);
    server_fd_ = -1;
  }

  if (server_thread_.joinable()) {
    server_thread_.join();
  }

  unlink(socket_path_.c_str());

  LOG_NET_INFO("RPC server stopped");
}

void RPCServer::ServerThread() {
  while (running_) {
    struct sockaddr_un client_addr;
    socklen_t client_len = sizeof(client_addr);

    int client_fd =
        accept(server_fd_, (struct sockaddr *)&client_addr, &client_len);
    if (client_fd < 0) {
      if (running_ && errno != EINTR) {
        LOG_NET_WARN("failed to accept RPC connection: {}",
                     std::strerror(errno));
      }
      continue;
    }

    try {
      HandleClient(client_fd);
    } catch (const std::exception &e) {
      LOG_NET_ERROR("RPC client handling failed: {}", e.what());
    }
    close(client_fd);
  }
}

void RPCServer::HandleClient(int client_fd) {
  if (shutting_down_.load(std::memory_order_acquire)) {
    SendAll(client_fd, util::JsonError("Server shutting down"));
    return;
  }

  // Read until newline or EOF
  std::string request;
  char buffer[4096];
  for (;;) {
    ssize_t received = recv(client_fd, buffer, sizeof(buffer), 0);
    if (received < 0) {
      if (errno == EINTR) {
        continue;
      }
      return;
    }
    if (received == 0) {
      break;
    }
    request.append(buffer, static_cast<size_t>(received));
    if (request.size() > MAX_REQUEST_SIZE) {
      LOG_NET_ERROR("RPC request too large: {} bytes", request.size());
      SendAll(client_fd, util::JsonError("Request too large"));
      return;
    }
    if (request.find('\n') != std::string::npos) {
      break;
    }
  }
  if (request.empty()) {
    return;
  }

  std::string method;
  std::vector<std::string> params;

  try {
    json j = json::parse(request);

    if (!j.contains("method") || !j["method"].is_string()) {
      SendAll(client_fd, util::JsonError("Missing or invalid method field"));
      return;
    }
    method = j["method"].get<std::string>();

    if (j.contains("params")) {
      if (j["params"].is_array()) {
        for (const auto &param : j["params"]) {
          params.push_back(param.is_string() ? param.get<std::string>()
                                             : param.dump());
        }
      } else if (j["params"].is_string()) {
        params.push_back(j["params"].get<std::string>());
      }
    }
  } catch (const json::exception &e) {
    LOG_NET_WARN("RPC JSON parse error: {}", e.what());
    SendAll(client_fd, util::JsonError("Invalid JSON"));
    return;
  }

  SendAll(client_fd, ExecuteCommand(method, params));
}

std::string RPCServer::ExecuteCommand(const std::string &method,
                                      const std::vector<std::string> &params) {
  auto it = handlers_.find(method);
  if (it == handlers_.end()) {
    return util::JsonError("Unknown command");
  }

  LOG_DEBUG("RPC {} ({} params)", method, params.size());
  try {
    return it->second(params);
  } catch (const std::exception &e) {
    LOG_NET_ERROR("RPC command '{}' failed: {}", method, e.what());
    return util::JsonError(e.what());
  }
}

// ============================================================================
// Chain
// ============================================================================

std::string RPCServer::HandleGetInfo(const std::vector<std::string> &) {
  const chain::Block tip = ledger_.GetTip();
  json j;
  j["version"] = GetFullVersionString();
  j["protocol_version"] = protocol::PROTOCOL_VERSION;
  j["chain"] = params_.GetChainTypeString();
  j["blocks"] = tip.index;
  j["bestblockhash"] = tip.hash;
  j["time"] = static_cast<int64_t>(tip.timestamp);
  j["time_str"] = util::FormatTime(static_cast<int64_t>(tip.timestamp));
  j["difficulty"] = ledger_.GetDifficulty();
  j["pending"] = ledger_.GetPendingCount();
  j["peers"] = network_manager_.routing_table().Size();
  j["mining"] = miner_ && miner_->IsMining();
  return Reply(j);
}

std::string RPCServer::HandleGetBlockCount(const std::vector<std::string> &) {
  return std::to_string(ledger_.GetHeight()) + "\n";
}

std::string RPCServer::HandleGetChain(const std::vector<std::string> &params) {
  int64_t start = 0;
  int64_t end = ledger_.GetHeight();
  if (!params.empty()) {
    auto v = util::SafeParseInt64(params[0], 0, INT64_MAX);
    if (!v) {
      return util::JsonError("Invalid start height");
    }
    start = *v;
  }
  if (params.size() > 1) {
    auto v = util::SafeParseInt64(params[1], 0, INT64_MAX);
    if (!v) {
      return util::JsonError("Invalid end height");
    }
    end = *v;
  }

  json blocks = json::array();
  for (const auto &block : ledger_.GetBlocks(start, end)) {
    blocks.push_back(block.ToJson());
  }
  json j;
  j["length"] = ledger_.GetChainLength();
  j["blocks"] = std::move(blocks);
  return Reply(j);
}

std::string RPCServer::HandleGetBlock(const std::vector<std::string> &params) {
  if (params.empty()) {
    return util::JsonError("Missing block hash or height parameter");
  }

  std::optional<chain::Block> block;
  if (auto height = util::SafeParseInt64(params[0], 0, INT64_MAX)) {
    auto blocks = ledger_.GetBlocks(*height, *height);
    if (!blocks.empty()) {
      block = blocks.front();
    }
  } else {
    if (params[0].size() != 64 || !util::IsValidHex(params[0])) {
      return util::JsonError("Invalid block hash (must be 64 hex characters)");
    }
    block = ledger_.GetBlockByHash(params[0]);
  }

  if (!block) {
    return util::JsonError("Block not found");
  }
  return Reply(block->ToJson());
}

std::string RPCServer::HandleValidateChain(const std::vector<std::string> &) {
  json j;
  j["valid"] = ledger_.IsChainValid();
  j["length"] = ledger_.GetChainLength();
  return Reply(j);
}

std::string
RPCServer::HandleGetBalance(const std::vector<std::string> &params) {
  if (params.empty()) {
    return util::JsonError("Missing address parameter");
  }
  json j;
  j["address"] = params[0];
  j["balance"] = ledger_.GetBalance(params[0]);
  return Reply(j);
}

// ============================================================================
// Transactions
// ============================================================================

std::string
RPCServer::HandleSendTransaction(const std::vector<std::string> &params) {
  if (params.empty()) {
    return util::JsonError("Missing transaction JSON parameter");
  }

  std::optional<chain::Transaction> tx;
  try {
    tx = chain::Transaction::FromJson(json::parse(params[0]));
  } catch (const json::exception &e) {
    return util::JsonError(std::string("Invalid transaction JSON: ") +
                           e.what());
  }
  if (!tx) {
    return util::JsonError("Transaction is missing required fields");
  }

  validation::ValidationState state;
  if (!network_manager_.sync_manager().AcceptTransaction(*tx, state)) {
    return util::JsonError(state.GetRejectReason());
  }

  json j;
  j["success"] = true;
  j["block_index"] = ledger_.GetHeight() + 1;
  j["signature"] = *tx->signature;
  return Reply(j);
}

std::string RPCServer::HandleGetPending(const std::vector<std::string> &) {
  json txs = json::array();
  for (const auto &tx : ledger_.GetPending()) {
    txs.push_back(tx.ToJson());
  }
  return Reply(txs);
}

// ============================================================================
// Mining
// ============================================================================

std::string RPCServer::HandleMine(const std::vector<std::string> &) {
  if (!miner_) {
    return util::JsonError("Mining not available");
  }
  if (ledger_.GetPendingCount() == 0) {
    return util::JsonError("No pending transactions to mine");
  }

  auto block = miner_->MinePendingTransactions();
  if (!block) {
    return util::JsonError("Mining attempt did not produce a block");
  }
  return Reply(block->ToJson());
}

std::string RPCServer::HandleStartMining(const std::vector<std::string> &) {
  if (!miner_) {
    return util::JsonError("Mining not available");
  }
  if (miner_->IsMining()) {
    return util::JsonError("Already mining");
  }
  if (!miner_->Start()) {
    return util::JsonError("Failed to start mining");
  }
  json j;
  j["mining"] = true;
  j["difficulty"] = ledger_.GetDifficulty();
  return Reply(j);
}

std::string RPCServer::HandleStopMining(const std::vector<std::string> &) {
  if (!miner_) {
    return util::JsonError("Mining not available");
  }
  if (!miner_->IsMining()) {
    return util::JsonError("Not mining");
  }
  miner_->Stop();
  json j;
  j["mining"] = false;
  j["blocks_found"] = miner_->GetBlocksFound();
  return Reply(j);
}

std::string RPCServer::HandleGetMiningInfo(const std::vector<std::string> &) {
  json j;
  j["blocks"] = ledger_.GetHeight();
  j["difficulty"] = ledger_.GetDifficulty();
  j["target_block_time"] = params_.GetConsensus().nTargetBlockTime;
  j["retargeting"] = !params_.GetConsensus().fPowNoRetargeting;
  j["pending"] = ledger_.GetPendingCount();
  j["chain"] = params_.GetChainTypeString();
  if (miner_) {
    j["mining"] = miner_->IsMining();
    j["state"] = mining::MiningEngine::StateName(miner_->GetState());
    j["hashrate"] = miner_->GetHashrate();
    j["total_hashes"] = miner_->GetTotalHashes();
    j["blocks_found"] = miner_->GetBlocksFound();
  } else {
    j["mining"] = false;
  }
  return Reply(j);
}

// ============================================================================
// Network
// ============================================================================

std::string RPCServer::HandleGetPeers(const std::vector<std::string> &) {
  json peers = json::array();
  for (const auto &peer : network_manager_.routing_table().GetPeers()) {
    json p = peer.ToJson();
    p["node_id"] = peer.node_id.ToHex();
    p["active"] = peer.active;
    p["last_seen_str"] = util::FormatTime(peer.last_seen);
    peers.push_back(std::move(p));
  }
  return Reply(peers);
}

std::string RPCServer::HandleGetNetworkInfo(const std::vector<std::string> &) {
  auto &table = network_manager_.routing_table();
  const auto &config = network_manager_.config();
  json j;
  j["protocol_version"] = protocol::PROTOCOL_VERSION;
  j["node_id"] = table.GetLocalId().ToHex();
  j["host"] = config.host;
  j["port"] = config.listen_port;
  j["listening"] = config.listen_enabled && network_manager_.is_running();
  j["peers"] = table.Size();
  j["active_peers"] = table.GetActivePeers().size();
  j["bootstrap_nodes"] = config.bootstrap_nodes.size();
  j["k"] = table.GetK();
  return Reply(j);
}

std::string RPCServer::HandleAddPeer(const std::vector<std::string> &params) {
  if (params.size() < 2) {
    return util::JsonError("Usage: addpeer <host> <port>");
  }
  auto port = util::SafeParsePort(params[1]);
  if (!port) {
    return util::JsonError("Invalid port (must be 1-65535)");
  }

  if (!network_manager_.sync_manager().AddPeer(params[0], *port)) {
    return util::JsonError("Peer did not answer or could not be added");
  }
  json j;
  j["success"] = true;
  j["peer"] = params[0] + ":" + std::to_string(*port);
  return Reply(j);
}

// ============================================================================
// Storage
// ============================================================================

std::string RPCServer::HandleBackup(const std::vector<std::string> &params) {
  const std::string name =
      params.empty() ? "rpc_" + std::to_string(util::GetTime()) : params[0];
  if (!ledger_.Backup(name)) {
    return util::JsonError("Backup failed (name must be 1-64 of [A-Za-z0-9_-])");
  }
  json j;
  j["success"] = true;
  j["name"] = name;
  j["height"] = ledger_.GetHeight();
  return Reply(j);
}

std::string RPCServer::HandleRecoverChain(const std::vector<std::string> &) {
  const bool was_valid = ledger_.IsChainValid();
  try {
    ledger_.RecoverChain();
  } catch (const chain::RecoveryFailed &e) {
    return util::JsonError(e.what());
  }
  json j;
  j["success"] = true;
  j["recovered"] = !was_valid;
  j["height"] = ledger_.GetHeight();
  return Reply(j);
}

// ============================================================================
// Control
// ============================================================================

std::string RPCServer::HandleStop(const std::vector<std::string> &) {
  LOG_INFO("Received stop command via RPC");
  shutting_down_.store(true, std::memory_order_release);
  if (shutdown_callback_) {
    shutdown_callback_();
  }
  return "\"ziacoin stopping\"\n";
}

std::string
RPCServer::HandleSetMockTime(const std::vector<std::string> &params) {
  if (params.empty()) {
    return util::JsonError("Missing timestamp parameter");
  }
  if (params_.GetChainType() == chain::ChainType::MAIN) {
    return util::JsonError("setmocktime not allowed on mainnet");
  }

  auto mock_time = util::SafeParseInt64(params[0], 0, 4294967295LL);
  if (!mock_time) {
    return util::JsonError("Invalid timestamp (must be 0 or 1-4294967295)");
  }
  util::SetMockTime(*mock_time);

  json j;
  j["success"] = true;
  if (*mock_time == 0) {
    j["message"] = "Mock time disabled";
  } else {
    j["mocktime"] = *mock_time;
  }
  return Reply(j);
}

} // namespace rpc
} // namespace ziacoin
