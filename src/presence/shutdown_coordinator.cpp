// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "presence/shutdown_coordinator.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <utility>

namespace lanpeer {
namespace presence {

// ============================================================================
// ShutdownSubscription
// ============================================================================

ShutdownSubscription::ShutdownSubscription(
    std::weak_ptr<ShutdownCoordinator> owner)
    : owner_(std::move(owner)) {}

void ShutdownSubscription::AsyncWait(boost::asio::any_io_executor executor,
                                     Handler handler) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (signalled_) {
    boost::asio::post(executor, std::move(handler));
    return;
  }

  executor_ = std::move(executor);
  handler_ = std::move(handler);
}

void ShutdownSubscription::Cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  handler_ = nullptr;
  executor_ = boost::asio::any_io_executor();
}

bool ShutdownSubscription::signalled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return signalled_;
}

std::shared_ptr<ShutdownSubscription> ShutdownSubscription::Resubscribe() const {
  auto owner = owner_.lock();
  if (!owner) {
    // Coordinator gone: nothing can ever signal, so hand back a detached
    // subscription in the parent's state.
    auto detached = std::shared_ptr<ShutdownSubscription>(
        new ShutdownSubscription(std::weak_ptr<ShutdownCoordinator>()));
    detached->signalled_ = signalled();
    return detached;
  }
  return owner->SubscribeDerived(*this);
}

bool ShutdownSubscription::Fire() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (signalled_) {
    return false;
  }
  signalled_ = true;

  if (handler_) {
    boost::asio::post(executor_, std::move(handler_));
    handler_ = nullptr;
    executor_ = boost::asio::any_io_executor();
  }
  return true;
}

// ============================================================================
// ShutdownCoordinator
// ============================================================================

std::shared_ptr<ShutdownCoordinator> ShutdownCoordinator::Create() {
  return std::shared_ptr<ShutdownCoordinator>(new ShutdownCoordinator());
}

ShutdownSubscriptionPtr ShutdownCoordinator::Subscribe() {
  auto sub = std::shared_ptr<ShutdownSubscription>(
      new ShutdownSubscription(weak_from_this()));

  std::lock_guard<std::mutex> lock(mutex_);
  PruneLocked();
  subscribers_.push_back(sub);
  return sub;
}

ShutdownSubscriptionPtr
ShutdownCoordinator::SubscribeDerived(const ShutdownSubscription &parent) {
  auto sub = std::shared_ptr<ShutdownSubscription>(
      new ShutdownSubscription(weak_from_this()));

  // Registration and the parent check happen under mutex_, which Send() also
  // holds while firing: either Send() sees the new entry, or the parent was
  // already signalled before we looked.
  std::lock_guard<std::mutex> lock(mutex_);
  PruneLocked();
  subscribers_.push_back(sub);
  if (parent.signalled()) {
    sub->Fire();
  }
  return sub;
}

size_t ShutdownCoordinator::Send() {
  sends_.fetch_add(1, std::memory_order_relaxed);

  std::lock_guard<std::mutex> lock(mutex_);
  PruneLocked();

  size_t delivered = 0;
  for (const auto &weak : subscribers_) {
    if (auto sub = weak.lock()) {
      if (sub->Fire()) {
        ++delivered;
      }
    }
  }
  return delivered;
}

size_t ShutdownCoordinator::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(
      std::count_if(subscribers_.begin(), subscribers_.end(),
                    [](const auto &weak) { return !weak.expired(); }));
}

void ShutdownCoordinator::PruneLocked() {
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [](const auto &weak) { return weak.expired(); }),
      subscribers_.end());
}

} // namespace presence
} // namespace lanpeer
