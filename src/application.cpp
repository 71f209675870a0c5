// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <thread>
#include <utility>

namespace lanpeer {
namespace app {

bool AppConfig::LoadEnvironment(std::string *error) {
  if (const char *peer_id = std::getenv("PEER_ID");
      peer_id != nullptr && *peer_id != '\0') {
    identifier = peer_id;
  }

  if (const char *workers = std::getenv("LANPEER_WORKERS");
      workers != nullptr && *workers != '\0') {
    auto n = util::SafeParseInt(workers, 0, 256);
    if (!n) {
      if (error) {
        *error = std::string("LANPEER_WORKERS must be 0-256, got '") +
                 workers + "'";
      }
      return false;
    }
    process_config.worker_threads = static_cast<size_t>(*n);
  }

  if (const char *secs = std::getenv("LANPEER_SUMMARY_SECS");
      secs != nullptr && *secs != '\0') {
    auto n = util::SafeParseInt(secs, 1, 3600);
    if (!n) {
      if (error) {
        *error = std::string("LANPEER_SUMMARY_SECS must be 1-3600, got '") +
                 secs + "'";
      }
      return false;
    }
    process_config.summary_interval = std::chrono::seconds(*n);
  }

  if (const char *port = std::getenv("LANPEER_PORT");
      port != nullptr && *port != '\0') {
    auto n = util::SafeParsePort(port);
    if (!n) {
      if (error) {
        *error = std::string("LANPEER_PORT must be 1-65535, got '") + port +
                 "'";
      }
      return false;
    }
    discovery_config.port = *n;
  }

  return true;
}

Application::Application(const AppConfig &config,
                         network::EndpointBinderPtr binder)
    : config_(config), binder_(std::move(binder)) {
  // main() already applied the log filter
  config_.process_config.init_logging = false;
  if (!binder_) {
    binder_ =
        std::make_shared<network::MulticastDiscovery>(config_.discovery_config);
  }
}

Application::~Application() { stop(); }

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }

  LOG_APP_INFO("Running as: {}", config_.identifier);

  context_ = std::make_unique<presence::ProcessContext>(binder_,
                                                        config_.process_config);
  controller_ = std::make_unique<presence::PeerController>(*context_);

  const std::string label = config_.identifier;
  finished_sub_ = PresenceEvents().SubscribeSessionFinished(
      [this, label](const std::string &session, bool ok,
                    const std::string &error) {
        if (session != label) {
          return;
        }
        if (!ok) {
          session_error_ = error;
        }
        session_ok_ = ok;
        session_finished_ = true;
      });

  try {
    context_->EnsureContext();
  } catch (const std::exception &e) {
    LOG_APP_ERROR("Failed to create execution context: {}", e.what());
    return false;
  }

  setup_signal_handlers();

  running_ = true;
  controller_->Start(config_.identifier);

  LOG_APP_INFO("Press Ctrl+C to stop");
  return true;
}

void Application::setup_signal_handlers() {
  signals_ = std::make_unique<boost::asio::signal_set>(
      context_->EnsureContext(), SIGINT, SIGTERM);
  signals_->async_wait(
      [this](const boost::system::error_code &ec, int /*signal*/) {
        if (ec) {
          return;
        }
        LOG_APP_INFO("Received Ctrl+C, shutting down...");
        request_shutdown();
      });
}

void Application::request_shutdown() {
  if (controller_) {
    controller_->Stop();
  }
}

void Application::wait_for_shutdown() {
  // The session finishes once the shutdown signal has closed its endpoint,
  // or right away when it fails to start
  while (running_ && !session_finished_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  stop();
}

void Application::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  if (signals_) {
    boost::system::error_code ignored;
    signals_->cancel(ignored);
  }

  finished_sub_.Unsubscribe();
  context_->Shutdown();
  signals_.reset();

  LOG_APP_INFO("Shutdown complete");
}

} // namespace app
} // namespace lanpeer
