// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace ziacoin {
namespace util {

/**
 * Process-wide logging built on spdlog.
 *
 * One logger per component ("default", "network", "sync", "chain", "crypto",
 * "app"), all sharing the same sinks. The daemon writes to a rotating file in
 * the data directory; tests write to the console.
 *
 * Thread-safety: every method may be called from any thread. The first call to
 * Initialize() wins; later calls are no-ops until Shutdown().
 */
class LogManager {
public:
  /**
   * @param log_level   trace, debug, info, warn, error, critical or off
   * @param log_to_file write to log_file_path instead of stdout
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log");

  // Flushes and drops all loggers. A later GetLogger() re-initializes with
  // defaults.
  static void Shutdown();

  // Returns the named component logger, or "default" for unknown names.
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  static void SetLogLevel(const std::string &level);

  // Returns false if the component name is unknown.
  static bool SetComponentLevel(const std::string &component,
                                const std::string &level);

  static bool IsInitialized();
};

} // namespace util
} // namespace ziacoin

#define ZIACOIN_LOG(component, lvl, ...)                                       \
  ziacoin::util::LogManager::GetLogger(component)->lvl(__VA_ARGS__)

#define LOG_TRACE(...) ZIACOIN_LOG("default", trace, __VA_ARGS__)
#define LOG_DEBUG(...) ZIACOIN_LOG("default", debug, __VA_ARGS__)
#define LOG_INFO(...) ZIACOIN_LOG("default", info, __VA_ARGS__)
#define LOG_WARN(...) ZIACOIN_LOG("default", warn, __VA_ARGS__)
#define LOG_ERROR(...) ZIACOIN_LOG("default", error, __VA_ARGS__)

#define LOG_NET_TRACE(...) ZIACOIN_LOG("network", trace, __VA_ARGS__)
#define LOG_NET_DEBUG(...) ZIACOIN_LOG("network", debug, __VA_ARGS__)
#define LOG_NET_INFO(...) ZIACOIN_LOG("network", info, __VA_ARGS__)
#define LOG_NET_WARN(...) ZIACOIN_LOG("network", warn, __VA_ARGS__)
#define LOG_NET_ERROR(...) ZIACOIN_LOG("network", error, __VA_ARGS__)

#define LOG_SYNC_TRACE(...) ZIACOIN_LOG("sync", trace, __VA_ARGS__)
#define LOG_SYNC_DEBUG(...) ZIACOIN_LOG("sync", debug, __VA_ARGS__)
#define LOG_SYNC_INFO(...) ZIACOIN_LOG("sync", info, __VA_ARGS__)
#define LOG_SYNC_WARN(...) ZIACOIN_LOG("sync", warn, __VA_ARGS__)
#define LOG_SYNC_ERROR(...) ZIACOIN_LOG("sync", error, __VA_ARGS__)

#define LOG_CHAIN_TRACE(...) ZIACOIN_LOG("chain", trace, __VA_ARGS__)
#define LOG_CHAIN_DEBUG(...) ZIACOIN_LOG("chain", debug, __VA_ARGS__)
#define LOG_CHAIN_INFO(...) ZIACOIN_LOG("chain", info, __VA_ARGS__)
#define LOG_CHAIN_WARN(...) ZIACOIN_LOG("chain", warn, __VA_ARGS__)
#define LOG_CHAIN_ERROR(...) ZIACOIN_LOG("chain", error, __VA_ARGS__)

#define LOG_CRYPTO_DEBUG(...) ZIACOIN_LOG("crypto", debug, __VA_ARGS__)
#define LOG_CRYPTO_WARN(...) ZIACOIN_LOG("crypto", warn, __VA_ARGS__)
#define LOG_CRYPTO_ERROR(...) ZIACOIN_LOG("crypto", error, __VA_ARGS__)

#define LOG_APP_INFO(...) ZIACOIN_LOG("app", info, __VA_ARGS__)
#define LOG_APP_WARN(...) ZIACOIN_LOG("app", warn, __VA_ARGS__)
#define LOG_APP_ERROR(...) ZIACOIN_LOG("app", error, __VA_ARGS__)
