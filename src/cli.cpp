// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/transaction.hpp"
#include "crypto/ecdsa.hpp"
#include "network/rpc_client.hpp"
#include "util/files.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include "version.hpp"
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

void PrintUsage(const char *program_name) {
  std::cout
      << "ZiaCoin CLI - Query and control a local node\n\n"
      << "Usage: " << program_name << " [options] <command> [params]\n\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.ziacoin)\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n\n"
      << "Commands:\n"
      << "\n"
      << "Blockchain:\n"
      << "  getinfo                   Get general node information\n"
      << "  getblockcount             Get current block height\n"
      << "  getchain [start] [end]    Get blocks in [start, end)\n"
      << "  getblock <hash|height>    Get a single block\n"
      << "  validatechain             Re-validate the whole chain\n"
      << "  getbalance <address>      Balance of an address\n"
      << "\n"
      << "Transactions:\n"
      << "  sendtransaction <json>    Submit a signed transaction\n"
      << "  getpending                List pending transactions\n"
      << "\n"
      << "Mining:\n"
      << "  mine                      Mine one block now\n"
      << "  startmining               Start the mining worker\n"
      << "  stopmining                Stop the mining worker\n"
      << "  getmininginfo             Get mining-related information\n"
      << "\n"
      << "Network:\n"
      << "  getpeers                  List known peers\n"
      << "  getnetworkinfo            Routing table and listener state\n"
      << "  addpeer <host> <port>     Handshake with and add a peer\n"
      << "\n"
      << "Storage:\n"
      << "  backup [name]             Snapshot the chain\n"
      << "  recoverchain              Restore the latest valid backup\n"
      << "\n"
      << "Wallet (local, no node needed):\n"
      << "  genkey <keyfile>          Create a signing key, print its public key\n"
      << "  signtransaction <keyfile> <recipient> <amount>\n"
      << "                            Print a signed transaction as JSON\n"
      << "  send <keyfile> <recipient> <amount>\n"
      << "                            Sign and submit in one step\n"
      << "\n"
      << "Control:\n"
      << "  stop                      Stop the node\n"
      << "  setmocktime <timestamp>   Pin the node clock (test chains only)\n"
      << std::endl;
}

namespace {

int GenerateKey(const std::vector<std::string> &params) {
  if (params.size() != 1) {
    std::cerr << "Usage: genkey <keyfile>\n";
    return 1;
  }
  auto key = ziacoin::crypto::PrivateKey::Generate();
  if (!ziacoin::util::atomic_write_file(params[0], key.ToPem(), 0600)) {
    std::cerr << "Error: Cannot write key file " << params[0] << "\n";
    return 1;
  }
  nlohmann::json j;
  j["keyfile"] = params[0];
  j["public_key"] = key.GetPublicKeyHex();
  std::cout << j.dump(2) << std::endl;
  return 0;
}

std::optional<ziacoin::chain::Transaction>
SignTransaction(const std::vector<std::string> &params) {
  if (params.size() != 3) {
    std::cerr << "Usage: signtransaction <keyfile> <recipient> <amount>\n";
    return std::nullopt;
  }
  const std::string pem = ziacoin::util::read_file_string(params[0]);
  auto key = ziacoin::crypto::PrivateKey::FromPem(pem);
  if (!key) {
    std::cerr << "Error: Cannot load key from " << params[0] << "\n";
    return std::nullopt;
  }
  auto amount = ziacoin::util::SafeParseDouble(params[2]);
  if (!amount || *amount <= 0) {
    std::cerr << "Error: Amount must be a positive number\n";
    return std::nullopt;
  }

  ziacoin::chain::Transaction tx;
  tx.sender = key->GetPublicKeyHex();
  tx.recipient = params[1];
  tx.amount = *amount;
  tx.timestamp = ziacoin::util::GetTimeSeconds();
  tx.signature = key->Sign(tx.SignatureMessage());
  return tx;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    if (argc < 2) {
      PrintUsage(argv[0]);
      return 1;
    }

    std::string datadir = ziacoin::util::get_default_datadir().string();
    std::string command;
    std::vector<std::string> params;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (command.empty() && (arg == "--help" || arg == "-h")) {
        PrintUsage(argv[0]);
        return 0;
      } else if (command.empty() && (arg == "--version" || arg == "-v")) {
        std::cout << ziacoin::GetFullVersionString() << std::endl;
        std::cout << ziacoin::GetCopyrightString() << std::endl;
        return 0;
      } else if (command.empty() && arg.find("--datadir=") == 0) {
        datadir = arg.substr(10);
      } else if (command.empty()) {
        command = arg;
      } else {
        params.push_back(arg);
      }
    }

    if (command.empty()) {
      std::cerr << "Error: No command specified\n";
      PrintUsage(argv[0]);
      return 1;
    }

    if (command == "genkey") {
      return GenerateKey(params);
    }
    if (command == "signtransaction") {
      auto tx = SignTransaction(params);
      if (!tx) {
        return 1;
      }
      std::cout << tx->ToJson().dump(2) << std::endl;
      return 0;
    }
    if (command == "send") {
      auto tx = SignTransaction(params);
      if (!tx) {
        return 1;
      }
      command = "sendtransaction";
      params = {tx->ToJson().dump()};
    }

    // RPC is local only: a Unix domain socket in the data directory
    std::string socket_path = datadir + "/node.sock";
    ziacoin::rpc::RPCClient client(socket_path);

    if (!client.Connect()) {
      std::cerr << "Error: Cannot connect to node at " << socket_path << "\n"
                << "Make sure the node is running.\n";
      return 1;
    }

    std::string response = client.ExecuteCommand(command, params);
    std::cout << response;

    // Non-zero exit on {"error": ...} so scripts can check $?
    const auto reply = nlohmann::json::parse(response, nullptr, false);
    if (reply.is_object() && reply.contains("error")) {
      return 1;
    }
    return 0;

  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
