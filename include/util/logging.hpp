// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace powledger {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One logger per component ("default", "chain", "crypto", "mining", "app"),
 * all sharing the same sinks. Initialization happens once; GetLogger()
 * auto-initializes with defaults so library code can log before the host
 * configured anything.
 *
 * Thread-safety: All methods are thread-safe.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of stdout
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Only the first call after startup (or after Shutdown()) performs
   * initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log");

  // Flush and drop all loggers. A later Initialize() or GetLogger() sets
  // logging up again.
  static void Shutdown();

  /**
   * Get logger for specific component
   * Unknown names fall back to the default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  // Set log level for one component (chain, crypto, mining, app, default)
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace powledger

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  powledger::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  powledger::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  powledger::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  powledger::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  powledger::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_CHAIN_TRACE(...)                                                   \
  powledger::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  powledger::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  powledger::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  powledger::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  powledger::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_MINING_TRACE(...)                                                  \
  powledger::util::LogManager::GetLogger("mining")->trace(__VA_ARGS__)
#define LOG_MINING_INFO(...)                                                   \
  powledger::util::LogManager::GetLogger("mining")->info(__VA_ARGS__)
#define LOG_MINING_WARN(...)                                                   \
  powledger::util::LogManager::GetLogger("mining")->warn(__VA_ARGS__)

#define LOG_CRYPTO_DEBUG(...)                                                  \
  powledger::util::LogManager::GetLogger("crypto")->debug(__VA_ARGS__)
#define LOG_CRYPTO_ERROR(...)                                                  \
  powledger::util::LogManager::GetLogger("crypto")->error(__VA_ARGS__)
