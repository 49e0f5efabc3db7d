// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace ziacoin {

namespace chain {
class ChainParams;
class Ledger;
} // namespace chain
namespace network {
class NetworkManager;
}
namespace mining {
class MiningEngine;
}

namespace rpc {

/**
 * RPC server on a Unix domain socket (<datadir>/node.sock, mode 0600).
 *
 * One request per connection: a JSON object {"method": ..., "params": [...]}
 * terminated by '\n' or EOF. The reply is a JSON document followed by '\n',
 * after which the server closes the connection. Failures are reported as
 * {"error": "..."}.
 *
 * Handlers are thin wrappers over Ledger, MiningEngine and NetworkManager
 * calls. Requests are served one at a time on the server thread.
 */
class RPCServer {
public:
  using CommandHandler =
      std::function<std::string(const std::vector<std::string> &)>;

  // Requests larger than this are refused
  static constexpr size_t MAX_REQUEST_SIZE = 1024 * 1024;

  RPCServer(const std::string &socket_path, chain::Ledger &ledger,
            network::NetworkManager &network_manager,
            mining::MiningEngine *miner, const chain::ChainParams &params,
            std::function<void()> shutdown_callback = nullptr);
  ~RPCServer();

  RPCServer(const RPCServer &) = delete;
  RPCServer &operator=(const RPCServer &) = delete;

  bool Start();
  void Stop();
  bool IsRunning() const { return running_; }

  // Dispatch one command (also used directly by tests)
  std::string ExecuteCommand(const std::string &method,
                             const std::vector<std::string> &params);

private:
  void ServerThread();
  void HandleClient(int client_fd);
  void RegisterHandlers();

  // Chain
  std::string HandleGetInfo(const std::vector<std::string> &params);
  std::string HandleGetBlockCount(const std::vector<std::string> &params);
  std::string HandleGetChain(const std::vector<std::string> &params);
  std::string HandleGetBlock(const std::vector<std::string> &params);
  std::string HandleValidateChain(const std::vector<std::string> &params);
  std::string HandleGetBalance(const std::vector<std::string> &params);

  // Transactions
  std::string HandleSendTransaction(const std::vector<std::string> &params);
  std::string HandleGetPending(const std::vector<std::string> &params);

  // Mining
  std::string HandleMine(const std::vector<std::string> &params);
  std::string HandleStartMining(const std::vector<std::string> &params);
  std::string HandleStopMining(const std::vector<std::string> &params);
  std::string HandleGetMiningInfo(const std::vector<std::string> &params);

  // Network
  std::string HandleGetPeers(const std::vector<std::string> &params);
  std::string HandleGetNetworkInfo(const std::vector<std::string> &params);
  std::string HandleAddPeer(const std::vector<std::string> &params);

  // Storage
  std::string HandleBackup(const std::vector<std::string> &params);
  std::string HandleRecoverChain(const std::vector<std::string> &params);

  // Control
  std::string HandleStop(const std::vector<std::string> &params);
  std::string HandleSetMockTime(const std::vector<std::string> &params);

  std::string socket_path_;
  chain::Ledger &ledger_;
  network::NetworkManager &network_manager_;
  mining::MiningEngine *miner_; // Optional
  const chain::ChainParams &params_;
  std::function<void()> shutdown_callback_;

  int server_fd_;
  std::atomic<bool> running_;
  std::atomic<bool> shutting_down_;
  std::thread server_thread_;

  std::map<std::string, CommandHandler> handlers_;
};

} // namespace rpc
} // namespace ziacoin
