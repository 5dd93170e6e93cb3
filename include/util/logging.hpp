// Copyright (c) 2025 The peerdial developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace peerdial {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One named logger per component ("default", "network", "dial", "app"),
 * all sharing the same sinks. Components are looked up by name; unknown
 * names fall back to the default logger.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once.
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
   * Only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "dial.log");

  // Flush and drop all loggers
  static void Shutdown();

  /**
   * Get logger for specific component
   * Auto-initializes with defaults if Initialize() was never called.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  // Set log level for a single component; unknown components are reported
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace peerdial

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  peerdial::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  peerdial::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  peerdial::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  peerdial::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  peerdial::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  peerdial::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  peerdial::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  peerdial::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  peerdial::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  peerdial::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_DIAL_TRACE(...)                                                    \
  peerdial::util::LogManager::GetLogger("dial")->trace(__VA_ARGS__)
#define LOG_DIAL_DEBUG(...)                                                    \
  peerdial::util::LogManager::GetLogger("dial")->debug(__VA_ARGS__)
#define LOG_DIAL_INFO(...)                                                     \
  peerdial::util::LogManager::GetLogger("dial")->info(__VA_ARGS__)
#define LOG_DIAL_WARN(...)                                                     \
  peerdial::util::LogManager::GetLogger("dial")->warn(__VA_ARGS__)
#define LOG_DIAL_ERROR(...)                                                    \
  peerdial::util::LogManager::GetLogger("dial")->error(__VA_ARGS__)
