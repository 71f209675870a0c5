// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include "network/discovery.hpp"
#include "presence/notifications.hpp"
#include "presence/shutdown_coordinator.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <memory>
#include <string>

namespace lanpeer {
namespace presence {

/**
 * DiscoveryConsumer - reads one endpoint's discovery stream and logs peers
 *
 * RUNNING -> STOPPED (terminal), on either the shutdown signal or end of
 * stream. Stream reads and the shutdown wait are both outstanding at once;
 * their completions are serialized on strand_ and the first one to run wins.
 * A read that had already completed when shutdown arrived is dropped, but an
 * event whose handler was queued ahead of the shutdown handler is still
 * processed.
 *
 * Self-discoveries are discarded. No de-duplication: the discovery layer
 * re-announces peers and every announcement is logged.
 */
class DiscoveryConsumer
    : public std::enable_shared_from_this<DiscoveryConsumer> {
public:
  enum class State { Running, Stopped };

  DiscoveryConsumer(boost::asio::io_context &io_context,
                    std::string session_label, network::PeerId self_id,
                    network::DiscoveryStreamPtr stream,
                    ShutdownSubscriptionPtr shutdown);

  DiscoveryConsumer(const DiscoveryConsumer &) = delete;
  DiscoveryConsumer &operator=(const DiscoveryConsumer &) = delete;

  // Begin consuming. Handlers keep the consumer alive until STOPPED.
  void start();

  State state() const { return state_.load(std::memory_order_acquire); }
  bool is_stopped() const { return state() == State::Stopped; }

  // Counters (for tests and diagnostics)
  size_t discovered_count() const { return discovered_.load(); }
  size_t expired_count() const { return expired_.load(); }
  size_t self_filtered_count() const { return self_filtered_.load(); }
  size_t error_count() const { return errors_.load(); }

private:
  void read_next();
  void on_item(const boost::system::error_code &ec,
               std::optional<network::DiscoveryEvent> event);
  void handle_discovered(const network::PeerDiscovered &event);
  void handle_expired(const network::PeerExpired &event);
  void on_shutdown();
  void transition_to_stopped(PresenceNotifications::StopReason reason);

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  const std::string session_label_;
  const network::PeerId self_id_;
  network::DiscoveryStreamPtr stream_;
  ShutdownSubscriptionPtr shutdown_;

  std::atomic<State> state_{State::Running};

  std::atomic<size_t> discovered_{0};
  std::atomic<size_t> expired_{0};
  std::atomic<size_t> self_filtered_{0};
  std::atomic<size_t> errors_{0};
};

using DiscoveryConsumerPtr = std::shared_ptr<DiscoveryConsumer>;

} // namespace presence
} // namespace lanpeer
