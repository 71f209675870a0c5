// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "presence/process_context.hpp"
#include "network/multicast_discovery.hpp"
#include "util/logging.hpp"
#include <boost/asio/post.hpp>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace lanpeer {
namespace presence {

ProcessContext::ProcessContext(network::EndpointBinderPtr binder,
                               const Config &config)
    : binder_(std::move(binder)), config_(config) {}

ProcessContext::~ProcessContext() { Shutdown(); }

boost::asio::io_context &ProcessContext::EnsureContext() {
  std::call_once(context_once_, [this]() { CreateContext(); });
  return *io_context_;
}

void ProcessContext::CreateContext() {
  if (config_.init_logging) {
    util::LogManager::InitializeFromEnvironment();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
      throw std::runtime_error("execution context already shut down");
    }
  }

  size_t threads = config_.worker_threads;
  if (threads == 0) {
    threads = std::thread::hardware_concurrency();
    if (threads == 0) {
      threads = 1;
    }
  }

  auto io_context = std::make_unique<boost::asio::io_context>();
  auto work_guard = std::make_unique<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(*io_context));

  std::vector<std::thread> io_threads;
  try {
    for (size_t i = 0; i < threads; ++i) {
      io_threads.emplace_back([ctx = io_context.get()]() { ctx->run(); });
    }
  } catch (const std::system_error &e) {
    LOG_ERROR("Failed to start execution context thread: {}", e.what());
    // Joinable threads must not be destroyed
    work_guard.reset();
    io_context->stop();
    for (auto &thread : io_threads) {
      if (thread.joinable()) {
        thread.join();
      }
    }
    throw;
  }

  io_context_ = std::move(io_context);
  work_guard_ = std::move(work_guard);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    io_threads_ = std::move(io_threads);
  }
  context_ready_.store(true, std::memory_order_release);

  LOG_PEER_DEBUG("Execution context started with {} worker thread(s)",
                 threads);
}

ShutdownCoordinatorPtr ProcessContext::EnsureCoordinator() {
  std::call_once(coordinator_once_, [this]() {
    auto coordinator = ShutdownCoordinator::Create();
    std::lock_guard<std::mutex> lock(mutex_);
    coordinator_ = std::move(coordinator);
  });
  std::lock_guard<std::mutex> lock(mutex_);
  return coordinator_;
}

ShutdownCoordinatorPtr ProcessContext::coordinator() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return coordinator_;
}

size_t ProcessContext::worker_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return io_threads_.size();
}

PeerSessionPtr ProcessContext::LaunchSession(
    const std::string &label, ShutdownSubscriptionPtr subscription) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
      LOG_PEER_WARN("{}: execution context already shut down, not starting",
                    label);
      return nullptr;
    }
  }

  boost::asio::io_context &io_context = EnsureContext();

  PeerSession::Config session_config;
  session_config.summary_interval = config_.summary_interval;

  auto session = std::make_shared<PeerSession>(
      io_context, label, binder_, std::move(subscription), session_config,
      [](const SessionResult &result) {
        if (result.ok) {
          LOG_PEER_INFO("{} completed successfully", result.label);
        } else {
          LOG_PEER_ERROR("{} error: {}", result.label, result.error);
        }
      });

  sessions_launched_.fetch_add(1, std::memory_order_relaxed);

  boost::asio::post(io_context, [session]() {
    LOG_PEER_INFO("{} starting...", session->label());
    session->run();
  });

  return session;
}

void ProcessContext::Shutdown() {
  std::vector<std::thread> io_threads;
  ShutdownCoordinatorPtr coordinator;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
      return;
    }
    shut_down_ = true;
    coordinator = coordinator_;
    io_threads = std::move(io_threads_);
    io_threads_.clear();
  }

  if (coordinator) {
    coordinator->Send();
  }

  if (!context_ready_.load(std::memory_order_acquire)) {
    return;
  }

  // Let in-flight sessions close their endpoints before the loop stops
  work_guard_.reset();
  const auto deadline = std::chrono::steady_clock::now() + config_.shutdown_grace;
  while (!io_context_->stopped() &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (!io_context_->stopped()) {
    LOG_PEER_WARN("Sessions still running after {} ms, stopping anyway",
                  std::chrono::duration_cast<std::chrono::milliseconds>(
                      config_.shutdown_grace)
                      .count());
  }
  io_context_->stop();

  for (auto &thread : io_threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }

  LOG_PEER_DEBUG("Execution context stopped");
}

ProcessContext &ProcessContext::Global() {
  // Never destroyed: the host process owns the context until it exits
  static ProcessContext *instance = new ProcessContext(
      std::make_shared<network::MulticastDiscovery>());
  return *instance;
}

} // namespace presence
} // namespace lanpeer
