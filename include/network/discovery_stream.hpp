// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include "network/discovery.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <atomic>
#include <deque>
#include <mutex>

namespace lanpeer {
namespace network {

/**
 * BufferedDiscoveryStream - queue-backed DiscoveryStream
 *
 * Producers (endpoint implementations) call Push/PushError/Close from any
 * thread; the single consumer reads with AsyncNext. Completions are posted to
 * the executor given at construction, never invoked inline.
 *
 * When `capacity` events are buffered further events are dropped and the
 * reader sees one no_buffer_space error before the surviving events, so a slow
 * reader learns it lagged instead of silently missing peers. Errors count
 * against the same capacity; consecutive identical errors are buffered once.
 */
class BufferedDiscoveryStream
    : public DiscoveryStream,
      public std::enable_shared_from_this<BufferedDiscoveryStream> {
public:
  static constexpr size_t DEFAULT_CAPACITY = 256;

  explicit BufferedDiscoveryStream(boost::asio::any_io_executor executor,
                                   size_t capacity = DEFAULT_CAPACITY);

  // DiscoveryStream interface
  void AsyncNext(NextHandler handler) override;
  void Cancel() override;

  // Producer side
  void Push(DiscoveryEvent event);
  void PushError(const boost::system::error_code &ec);

  // End of stream once buffered items are drained. Idempotent.
  void Close();

  bool closed() const;
  size_t buffered() const;
  size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
  struct Item {
    boost::system::error_code ec;
    std::optional<DiscoveryEvent> event;
  };

  // Queue full: drop the item, adding the no_buffer_space marker once per
  // overflow. Caller holds mutex_.
  void OverflowLocked();

  // Hands `item` to the pending reader. Caller holds mutex_ and has checked
  // that a reader is pending.
  void CompleteLocked(Item item);

  boost::asio::any_io_executor executor_;
  const size_t capacity_;

  mutable std::mutex mutex_;
  std::deque<Item> queue_;
  NextHandler pending_;
  bool closed_{false};
  bool overflowed_{false};
  std::atomic<size_t> dropped_{0};
};

} // namespace network
} // namespace lanpeer
