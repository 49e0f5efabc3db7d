// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"

#include <array>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace ziacoin {
namespace util {

namespace {

constexpr const char *kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";
constexpr size_t kMaxLogFileSize = 10 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 3;

const std::array<const char *, 6> kComponents = {"default", "network", "sync",
                                                 "chain",   "crypto",  "app"};

// Guards everything below
std::mutex g_mutex;
bool g_initialized = false;
std::map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;

spdlog::sink_ptr MakeConsoleSink() {
  auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  sink->set_pattern(kPattern);
  return sink;
}

spdlog::sink_ptr MakeFileSink(const std::string &path_str) {
  namespace fs = std::filesystem;
  fs::path path = path_str.empty() ? fs::path("debug.log") : fs::path(path_str);
  if (path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
  }
  auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      path.string(), kMaxLogFileSize, kMaxLogFiles);
  sink->set_pattern(kPattern);
  return sink;
}

// Caller holds g_mutex
void InitializeLocked(const std::string &log_level, bool log_to_file,
                      const std::string &log_file_path) {
  if (g_initialized) {
    return;
  }

  std::vector<spdlog::sink_ptr> sinks;
  if (log_to_file) {
    try {
      sinks.push_back(MakeFileSink(log_file_path));
    } catch (const spdlog::spdlog_ex &e) {
      std::cerr << "Cannot open log file " << log_file_path << " (" << e.what()
                << "), logging to console\n";
      log_to_file = false;
    }
  }
  if (sinks.empty()) {
    sinks.push_back(MakeConsoleSink());
  }

  const auto level = spdlog::level::from_str(log_level);
  for (const char *component : kComponents) {
    auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(),
                                                   sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::trace);
    spdlog::drop(component);
    spdlog::register_logger(logger);
    g_loggers[component] = logger;
  }
  spdlog::set_default_logger(g_loggers["default"]);
  g_initialized = true;

  if (level != spdlog::level::off) {
    if (log_to_file) {
      g_loggers["default"]->info("");
    }
    g_loggers["default"]->info("Logging initialized (level: {})", log_level);
  }
}

} // namespace

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  std::lock_guard<std::mutex> lock(g_mutex);
  InitializeLocked(log_level, log_to_file, log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_initialized) {
    return;
  }
  for (auto &[name, logger] : g_loggers) {
    logger->flush();
  }
  g_loggers.clear();
  spdlog::shutdown();
  g_initialized = false;
}

bool LogManager::IsInitialized() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return g_initialized;
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (!g_initialized) {
    InitializeLocked("info", false, "");
  }
  auto it = g_loggers.find(name);
  if (it != g_loggers.end()) {
    return it->second;
  }
  return g_loggers["default"];
}

void LogManager::SetLogLevel(const std::string &level) {
  std::lock_guard<std::mutex> lock(g_mutex);
  const auto lvl = spdlog::level::from_str(level);
  for (auto &[name, logger] : g_loggers) {
    logger->set_level(lvl);
  }
}

bool LogManager::SetComponentLevel(const std::string &component,
                                   const std::string &level) {
  std::lock_guard<std::mutex> lock(g_mutex);
  auto it = g_loggers.find(component);
  if (it == g_loggers.end()) {
    return false;
  }
  it->second->set_level(spdlog::level::from_str(level));
  return true;
}

} // namespace util
} // namespace ziacoin
