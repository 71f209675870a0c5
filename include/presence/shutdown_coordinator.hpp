// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace lanpeer {
namespace presence {

class ShutdownCoordinator;

/**
 * ShutdownSubscription - one receiver of the shutdown broadcast
 *
 * Holds at most one pending signal. Once signalled it stays signalled: a wait
 * registered afterwards completes immediately, and later broadcasts change
 * nothing. Dropping the last reference unsubscribes.
 */
class ShutdownSubscription {
public:
  using Handler = std::function<void()>;

  ShutdownSubscription(const ShutdownSubscription &) = delete;
  ShutdownSubscription &operator=(const ShutdownSubscription &) = delete;

  /**
   * Wait for the signal. `handler` is posted to `executor` exactly once, when
   * the signal arrives (or right away if it already has). A second call
   * before the first completes replaces the earlier handler.
   */
  void AsyncWait(boost::asio::any_io_executor executor, Handler handler);

  // Forget the pending handler without invoking it
  void Cancel();

  bool signalled() const;

  /**
   * Independent subscription to the same coordinator. If this one has
   * already been signalled the new one starts signalled, so a task spawned
   * after shutdown began still stops.
   */
  std::shared_ptr<ShutdownSubscription> Resubscribe() const;

private:
  friend class ShutdownCoordinator;
  explicit ShutdownSubscription(std::weak_ptr<ShutdownCoordinator> owner);

  // Returns true if this call delivered the signal
  bool Fire();

  std::weak_ptr<ShutdownCoordinator> owner_;

  mutable std::mutex mutex_;
  bool signalled_{false};
  Handler handler_;
  boost::asio::any_io_executor executor_;
};

using ShutdownSubscriptionPtr = std::shared_ptr<ShutdownSubscription>;

/**
 * ShutdownCoordinator - one-to-many cooperative shutdown signal
 *
 * Every subscription alive when Send() runs observes the signal once, in no
 * particular order relative to the others. Send() with no live subscribers,
 * or with all of them already signalled, is a no-op.
 *
 * Thread-safety: all methods may be called concurrently.
 */
class ShutdownCoordinator
    : public std::enable_shared_from_this<ShutdownCoordinator> {
public:
  static std::shared_ptr<ShutdownCoordinator> Create();

  ShutdownCoordinator(const ShutdownCoordinator &) = delete;
  ShutdownCoordinator &operator=(const ShutdownCoordinator &) = delete;

  ShutdownSubscriptionPtr Subscribe();

  // Broadcast. Returns how many subscriptions received the signal by this call.
  size_t Send();

  // Live subscriptions (signalled or not)
  size_t subscriber_count() const;

  uint64_t sends() const { return sends_.load(std::memory_order_relaxed); }

private:
  friend class ShutdownSubscription;
  ShutdownCoordinator() = default;

  ShutdownSubscriptionPtr SubscribeDerived(const ShutdownSubscription &parent);

  // Drops expired entries. Caller holds mutex_.
  void PruneLocked();

  mutable std::mutex mutex_;
  std::vector<std::weak_ptr<ShutdownSubscription>> subscribers_;
  std::atomic<uint64_t> sends_{0};
};

using ShutdownCoordinatorPtr = std::shared_ptr<ShutdownCoordinator>;

} // namespace presence
} // namespace lanpeer
