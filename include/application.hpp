// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include "network/multicast_discovery.hpp"
#include "presence/notifications.hpp"
#include "presence/peer_controller.hpp"
#include "presence/process_context.hpp"
#include <atomic>
#include <boost/asio/signal_set.hpp>
#include <memory>
#include <string>

namespace lanpeer {
namespace app {

// Identifier used when neither the command line nor PEER_ID names one
inline constexpr const char *DEFAULT_IDENTIFIER = "bob";

// Desktop runner configuration
struct AppConfig {
  std::string identifier = DEFAULT_IDENTIFIER;

  presence::ProcessContext::Config process_config;
  network::MulticastDiscovery::Config discovery_config;

  /**
   * Apply PEER_ID, LANPEER_WORKERS, LANPEER_SUMMARY_SECS and LANPEER_PORT.
   * Unset variables leave the current values alone. Returns false (with
   * *error set) on the first malformed value.
   */
  bool LoadEnvironment(std::string *error);
};

// Application - runs one presence session until Ctrl+C
//
// Owns its own ProcessContext (not the C API's global one). Logging must be
// initialized by the caller. A null binder means MulticastDiscovery built
// from AppConfig::discovery_config.
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{},
                       network::EndpointBinderPtr binder = nullptr);
  ~Application();

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  // Lifecycle
  bool start();
  void stop();
  void wait_for_shutdown();

  // Shutdown request (signal handler, tests)
  void request_shutdown();

  bool is_running() const { return running_; }

  // Valid after wait_for_shutdown() returns
  bool session_ok() const { return session_ok_; }
  const std::string &session_error() const { return session_error_; }

  presence::ProcessContext &process_context() { return *context_; }

private:
  void setup_signal_handlers();

  AppConfig config_;
  network::EndpointBinderPtr binder_;
  std::atomic<bool> running_{false};
  std::atomic<bool> session_finished_{false};
  std::atomic<bool> session_ok_{false};
  std::string session_error_;

  std::unique_ptr<presence::ProcessContext> context_;
  std::unique_ptr<presence::PeerController> controller_;
  std::unique_ptr<boost::asio::signal_set> signals_;

  // Declared after the context so it is released before the context stops
  PresenceNotifications::Subscription finished_sub_;
};

} // namespace app
} // namespace lanpeer
