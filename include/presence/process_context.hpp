// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include "network/discovery.hpp"
#include "presence/peer_session.hpp"
#include "presence/shutdown_coordinator.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lanpeer {
namespace presence {

/**
 * ProcessContext - execution context and shutdown coordinator shared by every
 * session started in this process
 *
 * Both are created lazily on first use and reused by later starts. The C API
 * reaches one instance through Global(); tests and the desktop runner build
 * their own with whichever binder they need.
 *
 * Thread-safety: all methods may be called concurrently. EnsureContext() and
 * EnsureCoordinator() each create their object exactly once (std::call_once).
 */
class ProcessContext {
public:
  struct Config {
    size_t worker_threads;  // 0 = std::thread::hardware_concurrency()
    std::chrono::steady_clock::duration summary_interval;
    std::chrono::steady_clock::duration shutdown_grace; // Shutdown() drain limit
    bool init_logging;      // first EnsureContext() reads LANPEER_LOG

    Config()
        : worker_threads(0),
          summary_interval(SummaryReporter::DEFAULT_INTERVAL),
          shutdown_grace(std::chrono::seconds(2)), init_logging(true) {}
  };

  explicit ProcessContext(network::EndpointBinderPtr binder,
                          const Config &config = Config{});
  ~ProcessContext();

  ProcessContext(const ProcessContext &) = delete;
  ProcessContext &operator=(const ProcessContext &) = delete;

  /**
   * Shared io_context, created with its worker threads on the first call.
   * Throws std::system_error if a worker thread cannot be started; the
   * context stays uncreated and a later call retries. Throws
   * std::runtime_error once Shutdown() has run.
   */
  boost::asio::io_context &EnsureContext();

  ShutdownCoordinatorPtr EnsureCoordinator();

  // Existing coordinator, or nullptr if no start has created it yet
  ShutdownCoordinatorPtr coordinator() const;

  /**
   * Post a PeerSession for `label` on the shared context. Returns at once;
   * the outcome is logged and reported through PresenceNotifications.
   */
  PeerSessionPtr LaunchSession(const std::string &label,
                               ShutdownSubscriptionPtr subscription);

  /**
   * Broadcast shutdown, release the work guard, give sessions up to
   * Config::shutdown_grace to drain, then stop the context and join the
   * workers. Idempotent. Must not be called from a worker thread.
   */
  void Shutdown();

  bool has_context() const { return context_ready_.load(std::memory_order_acquire); }
  size_t worker_count() const;
  size_t sessions_launched() const { return sessions_launched_.load(std::memory_order_relaxed); }

  const Config &config() const { return config_; }
  const network::EndpointBinderPtr &binder() const { return binder_; }

  // Process-wide instance backed by MulticastDiscovery
  static ProcessContext &Global();

private:
  void CreateContext();

  const network::EndpointBinderPtr binder_;
  const Config config_;

  std::once_flag context_once_;
  std::once_flag coordinator_once_;

  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;
  std::atomic<bool> context_ready_{false};

  mutable std::mutex mutex_;
  ShutdownCoordinatorPtr coordinator_;
  bool shut_down_{false};

  std::atomic<size_t> sessions_launched_{0};
};

} // namespace presence
} // namespace lanpeer
