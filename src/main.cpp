// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include "version.hpp"
#include <filesystem>
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <optional>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --datadir=<path>     Data directory (default: ~/.ziacoin)\n"
      << "  --conf=<file>        Config file (default: <datadir>/node.conf)\n"
      << "  --host=<address>     Address advertised to peers (default: 127.0.0.1)\n"
      << "  --port=<port>        Listen port (default: 8333 mainnet, 18333 testnet, 28333 regtest)\n"
      << "  --bootstrap=<host:port>[,<host:port>...]\n"
      << "                       Bootstrap nodes contacted during discovery\n"
      << "  --nolisten           Disable inbound connections (inbound is enabled by default)\n"
      << "  --mine               Start mining after startup\n"
      << "  --regtest            Use regression test chain (fixed low difficulty)\n"
      << "  --testnet            Use test network\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, sync, chain, crypto, app, all\n"
      << "                       Can be comma-separated: --debug=network,sync\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    ziacoin::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;
    std::optional<std::filesystem::path> conf_path;

    // Command-line values win over node.conf, so they are collected first
    // and applied after the file is read
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<std::vector<ziacoin::network::PeerInfo>> bootstrap;
    bool nolisten = false;
    bool mine = false;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << ziacoin::GetFullVersionString() << std::endl;
        std::cout << ziacoin::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--conf=") == 0) {
        conf_path = arg.substr(7);
      } else if (arg.find("--host=") == 0) {
        host = arg.substr(7);
        if (host->empty()) {
          std::cerr << "Error: --host requires an address" << std::endl;
          return 1;
        }
      } else if (arg.find("--port=") == 0) {
        port = ziacoin::util::SafeParsePort(arg.substr(7));
        if (!port) {
          std::cerr << "Error: Invalid port number: " << arg.substr(7) << std::endl;
          std::cerr << "Port must be a number between 1 and 65535" << std::endl;
          return 1;
        }
      } else if (arg.find("--bootstrap=") == 0) {
        bootstrap.emplace();
        for (const auto &entry : ziacoin::util::SplitString(arg.substr(12), ',')) {
          auto host_port = ziacoin::util::ParseHostPort(entry);
          if (!host_port) {
            std::cerr << "Error: Invalid bootstrap node: " << entry << std::endl;
            std::cerr << "Expected <host>:<port>" << std::endl;
            return 1;
          }
          bootstrap->push_back(ziacoin::network::PeerInfo::Make(
              host_port->first, host_port->second, ziacoin::util::GetTime()));
        }
      } else if (arg == "--nolisten") {
        nolisten = true;
      } else if (arg == "--mine") {
        mine = true;
      } else if (arg == "--regtest") {
        config.chain_type = ziacoin::chain::ChainType::REGTEST;
        config.network_config.listen_port = ziacoin::protocol::ports::REGTEST;
      } else if (arg == "--testnet") {
        config.chain_type = ziacoin::chain::ChainType::TESTNET;
        config.network_config.listen_port = ziacoin::protocol::ports::TESTNET;
      } else if (arg == "--verbose") {
        log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Comma-separated components: --debug=network,sync,chain
        for (const auto &component : ziacoin::util::SplitString(arg.substr(8), ',')) {
          debug_components.push_back(component);
        }
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    std::string conf_error;
    const auto conf_file = conf_path ? *conf_path : config.datadir / "node.conf";
    if (!ziacoin::app::LoadConfigFile(conf_file, config, conf_error)) {
      std::cerr << "Error: Invalid config file " << conf_file.string() << ": "
                << conf_error << std::endl;
      return 1;
    }

    if (host) {
      config.network_config.host = *host;
    }
    if (port) {
      config.network_config.listen_port = *port;
    }
    if (bootstrap) {
      config.network_config.bootstrap_nodes = std::move(*bootstrap);
    }
    if (nolisten) {
      config.network_config.listen_enabled = false;
    }
    if (mine) {
      config.mining_enabled = true;
    }

    // Ensure datadir exists before initializing file logger
    if (!ziacoin::util::ensure_directory(config.datadir)) {
      std::cerr << "Error: Cannot create data directory "
                << config.datadir.string() << std::endl;
      return 1;
    }
    std::string log_file = (config.datadir / "debug.log").string();
    ziacoin::util::LogManager::Initialize(log_level, true, log_file);

    for (const auto &component : debug_components) {
      if (component == "all") {
        ziacoin::util::LogManager::SetLogLevel("trace");
      } else if (component == "net" || component == "network") {
        ziacoin::util::LogManager::SetComponentLevel("network", "trace");
      } else if (!ziacoin::util::LogManager::SetComponentLevel(component, "trace")) {
        std::cerr << "WARNING: unknown log component '" << component << "'" << std::endl;
      }
    }

    // Nested scope: the app destructor must run before LogManager::Shutdown()
    // so no network callback logs into a dropped logger
    {
      ziacoin::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        ziacoin::util::LogManager::Shutdown();
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        ziacoin::util::LogManager::Shutdown();
        return 1;
      }

      app.wait_for_shutdown();
    }

    ziacoin::util::LogManager::Shutdown();
    return 0;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    ziacoin::util::LogManager::Shutdown();
    return 1;
  }
}
