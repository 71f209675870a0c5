// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "util/logging.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <utility>
#include <vector>

namespace lanpeer {
namespace util {

static std::once_flag s_init_flag;

// Mutex protecting s_loggers map access (all reads and writes)
static std::mutex s_loggers_mutex;
static std::map<std::string, std::shared_ptr<spdlog::logger>> s_loggers;

static const char *kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

static void InitializeInternal(const std::string &log_level, bool log_to_file,
                               const std::string &log_file_path) {
  try {
    std::vector<spdlog::sink_ptr> sinks;

    if (log_to_file) {
      namespace fs = std::filesystem;
      try {
        fs::path p = log_file_path.empty() ? fs::path("lanpeer.log")
                                           : fs::path(log_file_path);
        if (p.has_parent_path()) {
          std::error_code ec;
          fs::create_directories(p.parent_path(), ec);
        }
        // 5MB per file, 3 files kept
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            p.string(), 5 * 1024 * 1024, 3);
        file_sink->set_pattern(kPattern);
        sinks.push_back(file_sink);
      } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Failed to initialize file logger (" << ex.what()
                  << "), falling back to console logging\n";
      }
    }

    // Console is always attached: the host application's console (Xcode,
    // logcat bridge, terminal) is the only diagnostics channel sessions have.
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kPattern);
    sinks.push_back(console_sink);

    const std::vector<std::string> components = {"default", "peer",
                                                 "discovery", "app"};

    std::lock_guard<std::mutex> lock(s_loggers_mutex);

    for (const auto &component : components) {
      auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(),
                                                     sinks.end());
      logger->set_level(spdlog::level::from_str(log_level));
      logger->flush_on(spdlog::level::info);

      // Another library in the host process may already own the name
      spdlog::drop(component);
      spdlog::register_logger(logger);
      s_loggers[component] = logger;
    }

    spdlog::set_default_logger(s_loggers["default"]);

    // Direct logger access (LOG_INFO would deadlock on s_loggers_mutex)
    if (log_level != "off") {
      s_loggers["default"]->debug("Logging system initialized (level: {})",
                                  log_level);
    }
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
  }
}

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  std::call_once(s_init_flag, InitializeInternal, log_level, log_to_file,
                 log_file_path);
}

bool LogManager::InitializeFromFilter(const std::string &filter) {
  std::string default_level;
  std::vector<std::pair<std::string, std::string>> directives;
  std::vector<std::string> rejected;

  size_t pos = 0;
  while (pos <= filter.size()) {
    size_t comma = filter.find(',', pos);
    if (comma == std::string::npos) {
      comma = filter.size();
    }
    std::string entry = filter.substr(pos, comma - pos);
    pos = comma + 1;

    // Trim surrounding blanks
    const auto first = entry.find_first_not_of(" \t");
    if (first == std::string::npos) {
      continue;
    }
    entry = entry.substr(first, entry.find_last_not_of(" \t") - first + 1);

    const size_t eq = entry.find('=');
    if (eq == std::string::npos) {
      if (IsValidLevel(entry)) {
        default_level = entry;
      } else {
        rejected.push_back(entry);
      }
      continue;
    }

    std::string component = entry.substr(0, eq);
    std::string level = entry.substr(eq + 1);
    if (component.empty() || !IsValidLevel(level)) {
      rejected.push_back(entry);
      continue;
    }
    directives.emplace_back(std::move(component), std::move(level));
  }

  Initialize(default_level.empty() ? "info" : default_level);

  // A bare level overrides whatever an earlier Initialize() chose
  if (!default_level.empty()) {
    SetLogLevel(default_level);
  }

  bool ok = rejected.empty();
  for (const auto &[component, level] : directives) {
    if (!SetComponentLevel(component, level)) {
      ok = false;
    }
  }
  for (const auto &entry : rejected) {
    GetLogger()->warn("Ignoring malformed log filter entry '{}'", entry);
  }
  return ok;
}

bool LogManager::InitializeFromEnvironment() {
  const char *env = std::getenv(LOG_FILTER_ENV);
  if (env == nullptr || *env == '\0') {
    return InitializeFromFilter(DEFAULT_LOG_FILTER);
  }
  return InitializeFromFilter(env);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  for (auto &[name, logger] : s_loggers) {
    logger->flush();
    spdlog::drop(name);
  }
  s_loggers.clear();

  // s_init_flag cannot be reset; GetLogger() installs a fallback logger
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  Initialize();

  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  auto it = s_loggers.find(name);
  if (it != s_loggers.end()) {
    return it->second;
  }

  // Initialization failed or Shutdown() ran: install a silent console logger
  // so call sites never dereference null.
  if (s_loggers.empty()) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kPattern);
    auto logger = std::make_shared<spdlog::logger>("default", console_sink);
    logger->set_level(spdlog::level::off);
    s_loggers["default"] = logger;
    return logger;
  }

  return s_loggers["default"];
}

void LogManager::SetLogLevel(const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  if (s_loggers.empty()) {
    return;
  }

  auto log_level = spdlog::level::from_str(level);
  for (auto &[name, logger] : s_loggers) {
    logger->set_level(log_level);
  }
}

bool LogManager::SetComponentLevel(const std::string &component,
                                   const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  if (s_loggers.empty()) {
    return false;
  }

  auto it = s_loggers.find(component);
  if (it == s_loggers.end() || !IsValidLevel(level)) {
    // Direct logger access (avoid deadlock)
    s_loggers["default"]->warn("Unknown log component or level: {}={}",
                               component, level);
    return false;
  }

  it->second->set_level(spdlog::level::from_str(level));
  return true;
}

bool LogManager::IsValidLevel(const std::string &level) {
  // spdlog::level::from_str maps unknown names to "off", so check explicitly
  static const char *kNames[] = {"trace", "debug",    "info",    "warn",
                                 "warning", "error",  "err",     "critical",
                                 "off"};
  for (const char *name : kNames) {
    if (level == name) {
      return true;
    }
  }
  return false;
}

} // namespace util
} // namespace lanpeer
