// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>
#include <vector>

namespace ziacoin {
namespace rpc {

/**
 * Client side of the node's Unix socket RPC (used by ziacoin-cli).
 * One command per connection; the server closes after replying.
 */
class RPCClient {
public:
  // @param socket_path e.g. ~/.ziacoin/node.sock
  explicit RPCClient(const std::string &socket_path);
  ~RPCClient();

  RPCClient(const RPCClient &) = delete;
  RPCClient &operator=(const RPCClient &) = delete;

  bool Connect();

  /**
   * Send one command and read the reply until the server closes.
   * @throws std::runtime_error if not connected or the socket fails
   */
  std::string ExecuteCommand(const std::string &method,
                             const std::vector<std::string> &params = {});

  bool IsConnected() const { return socket_fd_ >= 0; }

  void Disconnect();

private:
  std::string socket_path_;
  int socket_fd_;
};

} // namespace rpc
} // namespace ziacoin
