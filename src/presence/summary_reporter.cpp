// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "presence/summary_reporter.hpp"
#include "presence/notifications.hpp"
#include "util/logging.hpp"
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <utility>

namespace lanpeer {
namespace presence {

SummaryReporter::SummaryReporter(boost::asio::io_context &io_context,
                                 std::string session_label,
                                 network::EndpointPtr endpoint,
                                 ShutdownSubscriptionPtr shutdown,
                                 std::chrono::steady_clock::duration interval)
    : strand_(boost::asio::make_strand(io_context)), timer_(strand_),
      session_label_(std::move(session_label)), endpoint_(std::move(endpoint)),
      shutdown_(std::move(shutdown)), interval_(interval) {}

void SummaryReporter::start() {
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    if (self->is_stopped()) {
      return;
    }
    self->shutdown_->AsyncWait(self->strand_,
                               [self]() { self->on_shutdown(); });

    // First tick fires right away
    self->timer_.expires_after(std::chrono::steady_clock::duration::zero());
    self->timer_.async_wait(boost::asio::bind_executor(
        self->strand_, [self](const boost::system::error_code &ec) {
          if (ec == boost::asio::error::operation_aborted) {
            return;
          }
          self->on_tick();
        }));
  });
}

void SummaryReporter::schedule_next() {
  timer_.expires_after(interval_);
  timer_.async_wait(boost::asio::bind_executor(
      strand_, [self = shared_from_this()](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }
        self->on_tick();
      }));
}

void SummaryReporter::on_tick() {
  if (is_stopped()) {
    return;
  }

  const size_t count = endpoint_->RemoteInfos().size();
  ticks_.fetch_add(1, std::memory_order_relaxed);
  last_count_.store(count, std::memory_order_relaxed);

  if (count == 0) {
    LOG_PEER_WARN("{}: No peers discovered yet", session_label_);
  } else {
    LOG_PEER_INFO("{}: Total peers in routing table: {}", session_label_,
                  count);
  }
  PresenceEvents().NotifySummary(session_label_, count);

  schedule_next();
}

void SummaryReporter::on_shutdown() {
  if (is_stopped()) {
    return;
  }
  stopped_.store(true, std::memory_order_release);
  timer_.cancel();
  LOG_PEER_DEBUG("{} summary reporter stopped", session_label_);
  PresenceEvents().NotifyReporterStopped(session_label_);
}

} // namespace presence
} // namespace lanpeer
