// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include "network/discovery.hpp"
#include "presence/discovery_consumer.hpp"
#include "presence/shutdown_coordinator.hpp"
#include "presence/summary_reporter.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace lanpeer {
namespace presence {

// Outcome of one session run
struct SessionResult {
  std::string label;
  bool ok{false};
  std::string error; // empty when ok
};

/**
 * PeerSession - one advertised identity for the lifetime of one start call
 *
 * run():
 *   1. Parse the label into UserData (abort on failure)
 *   2. Bind an endpoint through the binder (abort on failure, no retry)
 *   3. Spawn DiscoveryConsumer + SummaryReporter on derived subscriptions
 *   4. Wait for the session's own shutdown subscription
 *   5. Close the endpoint, report SessionResult
 *
 * The session is kept alive by its pending handlers only; callers may drop
 * their pointer right after run().
 */
class PeerSession : public std::enable_shared_from_this<PeerSession> {
public:
  struct Config {
    std::chrono::steady_clock::duration summary_interval;

    Config() : summary_interval(SummaryReporter::DEFAULT_INTERVAL) {}
  };

  using CompletionCallback = std::function<void(const SessionResult &)>;

  enum class State { Idle, Binding, Running, Closing, Finished };

  PeerSession(boost::asio::io_context &io_context, std::string label,
              network::EndpointBinderPtr binder,
              ShutdownSubscriptionPtr shutdown, const Config &config = Config{},
              CompletionCallback on_complete = nullptr);

  PeerSession(const PeerSession &) = delete;
  PeerSession &operator=(const PeerSession &) = delete;

  void run();

  const std::string &label() const { return label_; }
  State state() const { return state_.load(std::memory_order_acquire); }

  // Valid once bound (i.e. state() >= Running); empty before
  network::PeerId node_id() const;

  // Set while running, for tests
  DiscoveryConsumerPtr consumer() const;
  SummaryReporterPtr reporter() const;

private:
  void on_bound(network::EndpointPtr endpoint, const std::string &error);
  void on_shutdown();
  void finish(bool ok, const std::string &error);

  boost::asio::io_context &io_context_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  const std::string label_;
  network::EndpointBinderPtr binder_;
  ShutdownSubscriptionPtr shutdown_;
  Config config_;
  CompletionCallback on_complete_;

  std::atomic<State> state_{State::Idle};

  mutable std::mutex mutex_;
  network::EndpointPtr endpoint_;
  network::PeerId node_id_;
  DiscoveryConsumerPtr consumer_;
  SummaryReporterPtr reporter_;
};

using PeerSessionPtr = std::shared_ptr<PeerSession>;

const char *ToString(PeerSession::State state);

} // namespace presence
} // namespace lanpeer
