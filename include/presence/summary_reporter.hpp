// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include "network/discovery.hpp"
#include "presence/shutdown_coordinator.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace lanpeer {
namespace presence {

/**
 * SummaryReporter - periodic count of peers in the endpoint's routing table
 *
 * Ticks immediately, then every `interval`. Zero peers logs a warning, any
 * other count an info line. Timer and shutdown completions race on strand_;
 * a tick that loses is dropped.
 */
class SummaryReporter : public std::enable_shared_from_this<SummaryReporter> {
public:
  static constexpr std::chrono::seconds DEFAULT_INTERVAL{5};

  SummaryReporter(boost::asio::io_context &io_context,
                  std::string session_label, network::EndpointPtr endpoint,
                  ShutdownSubscriptionPtr shutdown,
                  std::chrono::steady_clock::duration interval =
                      DEFAULT_INTERVAL);

  SummaryReporter(const SummaryReporter &) = delete;
  SummaryReporter &operator=(const SummaryReporter &) = delete;

  void start();

  bool is_stopped() const { return stopped_.load(std::memory_order_acquire); }
  size_t ticks() const { return ticks_.load(std::memory_order_relaxed); }
  size_t last_count() const { return last_count_.load(std::memory_order_relaxed); }

private:
  void schedule_next();
  void on_tick();
  void on_shutdown();

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer timer_;
  const std::string session_label_;
  network::EndpointPtr endpoint_;
  ShutdownSubscriptionPtr shutdown_;
  const std::chrono::steady_clock::duration interval_;

  std::atomic<bool> stopped_{false};
  std::atomic<size_t> ticks_{0};
  std::atomic<size_t> last_count_{0};
};

using SummaryReporterPtr = std::shared_ptr<SummaryReporter>;

} // namespace presence
} // namespace lanpeer
