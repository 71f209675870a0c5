// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "network/discovery_stream.hpp"
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/system/error_code.hpp>
#include <utility>

namespace lanpeer {
namespace network {

BufferedDiscoveryStream::BufferedDiscoveryStream(
    boost::asio::any_io_executor executor, size_t capacity)
    : executor_(std::move(executor)), capacity_(capacity == 0 ? 1 : capacity) {}

void BufferedDiscoveryStream::AsyncNext(NextHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);

  pending_ = std::move(handler);

  if (!queue_.empty()) {
    Item item = std::move(queue_.front());
    queue_.pop_front();
    if (queue_.size() < capacity_) {
      overflowed_ = false;
    }
    CompleteLocked(std::move(item));
    return;
  }

  if (closed_) {
    CompleteLocked(Item{});
  }
}

void BufferedDiscoveryStream::Cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pending_) {
    CompleteLocked(Item{boost::asio::error::operation_aborted, std::nullopt});
  }
}

void BufferedDiscoveryStream::Push(DiscoveryEvent event) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return;
  }

  if (pending_) {
    CompleteLocked(Item{{}, std::move(event)});
    return;
  }

  if (queue_.size() >= capacity_) {
    OverflowLocked();
    return;
  }

  queue_.push_back(Item{{}, std::move(event)});
}

void BufferedDiscoveryStream::PushError(const boost::system::error_code &ec) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_ || !ec) {
    return;
  }

  if (pending_) {
    CompleteLocked(Item{ec, std::nullopt});
    return;
  }

  // A run of identical errors is buffered once
  if (!queue_.empty() && !queue_.back().event && queue_.back().ec == ec) {
    return;
  }

  if (queue_.size() >= capacity_) {
    OverflowLocked();
    return;
  }
  queue_.push_back(Item{ec, std::nullopt});
}

void BufferedDiscoveryStream::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return;
  }
  closed_ = true;

  // Buffered items are still delivered first; only an idle reader sees the end
  if (pending_ && queue_.empty()) {
    CompleteLocked(Item{});
  }
}

bool BufferedDiscoveryStream::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t BufferedDiscoveryStream::buffered() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void BufferedDiscoveryStream::OverflowLocked() {
  if (!overflowed_) {
    // The marker itself may exceed capacity by one
    queue_.push_back(Item{boost::system::errc::make_error_code(
                              boost::system::errc::no_buffer_space),
                          std::nullopt});
    overflowed_ = true;
  }
  dropped_.fetch_add(1, std::memory_order_relaxed);
}

void BufferedDiscoveryStream::CompleteLocked(Item item) {
  NextHandler handler = std::move(pending_);
  pending_ = nullptr;
  boost::asio::post(executor_, [handler = std::move(handler),
                                item = std::move(item)]() mutable {
    handler(item.ec, std::move(item.event));
  });
}

} // namespace network
} // namespace lanpeer
