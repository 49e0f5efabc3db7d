// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace ziacoin {

constexpr int CLIENT_VERSION_MAJOR = 1;
constexpr int CLIENT_VERSION_MINOR = 0;
constexpr int CLIENT_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The ZiaCoin developers";

inline std::string GetFullVersionString() {
  return "ZiaCoin node version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *BLUE = "\033[1;34m";  // Mainnet
constexpr const char *RED = "\033[1;31m";   // Testnet
constexpr const char *GREEN = "\033[1;32m"; // Regtest
} // namespace colors

// Boxed startup banner, colored by network
inline std::string GetStartupBanner(const std::string &chain_type) {
  const char *color = colors::RESET;
  if (chain_type == "main") {
    color = colors::BLUE;
  } else if (chain_type == "test") {
    color = colors::RED;
  } else if (chain_type == "regtest") {
    color = colors::GREEN;
  }

  auto line = [](const std::string &text) {
    constexpr size_t kInner = 61;
    std::string padded = "  " + text;
    if (padded.size() < kInner) {
      padded += std::string(kInner - padded.size(), ' ');
    }
    return "|" + padded + "|\n";
  };
  const std::string rule = "+" + std::string(61, '-') + "+\n";

  std::string banner = "\n";
  banner += color;
  banner += rule;
  banner += line("");
  banner += line("            Z I A C O I N   N O D E");
  banner += line("         Proof of Work / Kademlia Gossip");
  banner += line("");
  banner += rule;
  banner += line("Version: " + GetVersionString());
  banner += line("Network: " + chain_type);
  banner += rule;
  banner += line(GetCopyrightString());
  banner += rule;
  banner += colors::RESET;
  banner += "\n";
  return banner;
}

} // namespace ziacoin
