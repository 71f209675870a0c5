// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace lanpeer {
namespace util {

// Filter applied when LANPEER_LOG is not set: the presence core logs at info,
// the discovery layer at debug so beacon traffic is visible.
inline constexpr const char *DEFAULT_LOG_FILTER =
    "default=info,peer=info,app=info,discovery=debug";

// Environment variable holding a log filter (see InitializeFromFilter)
inline constexpr const char *LOG_FILTER_ENV = "LANPEER_LOG";

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the library and the desktop binary.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, also log to file
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Thread-safe: Uses std::call_once internally. Multiple calls are safe;
   * only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "lanpeer.log");

  /**
   * Initialize from a filter string and apply per-component levels.
   *
   * Accepted forms:
   *   "debug"                       every component at debug
   *   "peer=info,discovery=trace"   per component
   *   "warn,discovery=debug"        bare level is the default for the rest
   *
   * Malformed entries are skipped with a warning. Returns false if any entry
   * was rejected.
   */
  static bool InitializeFromFilter(const std::string &filter);

  /**
   * Initialize from LANPEER_LOG, or DEFAULT_LOG_FILTER when unset/empty.
   */
  static bool InitializeFromEnvironment();

  /**
   * Shutdown logging system (flushes buffers)
   *
   * Subsequent logging calls after shutdown will auto-reinitialize.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name ("peer", "discovery", "app", "default")
   *
   * Auto-initializes if not initialized. Returns cached logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @return false if the component or level is unknown
   */
  static bool SetComponentLevel(const std::string &component,
                                const std::string &level);

  // True if `level` names an spdlog level ("warning" and "err" included)
  static bool IsValidLevel(const std::string &level);
};

} // namespace util
} // namespace lanpeer

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  lanpeer::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  lanpeer::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  lanpeer::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  lanpeer::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  lanpeer::util::LogManager::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...)                                                      \
  lanpeer::util::LogManager::GetLogger()->critical(__VA_ARGS__)

// Presence core (sessions, consumer, reporter, controller)
#define LOG_PEER_TRACE(...)                                                    \
  lanpeer::util::LogManager::GetLogger("peer")->trace(__VA_ARGS__)
#define LOG_PEER_DEBUG(...)                                                    \
  lanpeer::util::LogManager::GetLogger("peer")->debug(__VA_ARGS__)
#define LOG_PEER_INFO(...)                                                     \
  lanpeer::util::LogManager::GetLogger("peer")->info(__VA_ARGS__)
#define LOG_PEER_WARN(...)                                                     \
  lanpeer::util::LogManager::GetLogger("peer")->warn(__VA_ARGS__)
#define LOG_PEER_ERROR(...)                                                    \
  lanpeer::util::LogManager::GetLogger("peer")->error(__VA_ARGS__)

// Discovery layer (endpoint binders, beacons)
#define LOG_DISC_TRACE(...)                                                    \
  lanpeer::util::LogManager::GetLogger("discovery")->trace(__VA_ARGS__)
#define LOG_DISC_DEBUG(...)                                                    \
  lanpeer::util::LogManager::GetLogger("discovery")->debug(__VA_ARGS__)
#define LOG_DISC_INFO(...)                                                     \
  lanpeer::util::LogManager::GetLogger("discovery")->info(__VA_ARGS__)
#define LOG_DISC_WARN(...)                                                     \
  lanpeer::util::LogManager::GetLogger("discovery")->warn(__VA_ARGS__)

#define LOG_APP_INFO(...)                                                      \
  lanpeer::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  lanpeer::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  lanpeer::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
