// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "presence/discovery_consumer.hpp"
#include "util/logging.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/error.hpp>
#include <type_traits>
#include <utility>

namespace lanpeer {
namespace presence {

DiscoveryConsumer::DiscoveryConsumer(boost::asio::io_context &io_context,
                                     std::string session_label,
                                     network::PeerId self_id,
                                     network::DiscoveryStreamPtr stream,
                                     ShutdownSubscriptionPtr shutdown)
    : strand_(boost::asio::make_strand(io_context)),
      session_label_(std::move(session_label)), self_id_(self_id),
      stream_(std::move(stream)), shutdown_(std::move(shutdown)) {}

void DiscoveryConsumer::start() {
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    if (self->is_stopped()) {
      return;
    }

    self->shutdown_->AsyncWait(
        self->strand_, [self]() { self->on_shutdown(); });

    LOG_PEER_INFO("Listening for peers via local network discovery...");
    self->read_next();
  });
}

void DiscoveryConsumer::read_next() {
  // The stream completes on the io_context; hop onto our strand so the item
  // and the shutdown handler never run concurrently.
  stream_->AsyncNext([self = shared_from_this()](
                         const boost::system::error_code &ec,
                         std::optional<network::DiscoveryEvent> event) {
    boost::asio::dispatch(self->strand_,
                          [self, ec, event = std::move(event)]() mutable {
                            self->on_item(ec, std::move(event));
                          });
  });
}

void DiscoveryConsumer::on_item(const boost::system::error_code &ec,
                                std::optional<network::DiscoveryEvent> event) {
  if (is_stopped()) {
    return; // lost the race against shutdown
  }

  if (ec == boost::asio::error::operation_aborted) {
    return;
  }

  if (ec) {
    errors_.fetch_add(1, std::memory_order_relaxed);
    LOG_PEER_WARN("Discovery error: {}", ec.message());
    read_next();
    return;
  }

  if (!event) {
    LOG_PEER_DEBUG("{} discovery stream ended", session_label_);
    transition_to_stopped(PresenceNotifications::StopReason::StreamEnded);
    return;
  }

  std::visit(
      [this](const auto &e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, network::PeerDiscovered>) {
          handle_discovered(e);
        } else {
          handle_expired(e);
        }
      },
      *event);

  read_next();
}

void DiscoveryConsumer::handle_discovered(const network::PeerDiscovered &event) {
  // Skip self-discovery (our own announcements come back to us)
  if (event.peer == self_id_) {
    self_filtered_.fetch_add(1, std::memory_order_relaxed);
    LOG_PEER_TRACE("{} ignoring self-discovery", session_label_);
    return;
  }

  discovered_.fetch_add(1, std::memory_order_relaxed);

  LOG_PEER_INFO("Peer discovered by {}:", session_label_);
  LOG_PEER_INFO("  Node ID: {}", event.peer.ToString());
  if (event.label) {
    LOG_PEER_INFO("  User data: \"{}\"", *event.label);
  } else {
    LOG_PEER_INFO("  User data: none");
  }
  LOG_PEER_INFO("  Source: {}", event.source);

  if (event.label) {
    LOG_PEER_INFO("[[[ SUCCESS ]]]: Discovered peer '{}'!", *event.label);
  } else {
    LOG_PEER_INFO("  Note: No user_data (legacy peer or different app)");
  }

  PresenceEvents().NotifyPeerDiscovered(session_label_, event.peer, event.label,
                                        event.source);
}

void DiscoveryConsumer::handle_expired(const network::PeerExpired &event) {
  expired_.fetch_add(1, std::memory_order_relaxed);
  LOG_PEER_INFO("{}: Peer expired: {}", session_label_, event.peer.ToString());
  PresenceEvents().NotifyPeerExpired(session_label_, event.peer);
}

void DiscoveryConsumer::on_shutdown() {
  if (is_stopped()) {
    return;
  }
  LOG_PEER_INFO("Discovery task shutting down...");
  transition_to_stopped(PresenceNotifications::StopReason::Shutdown);
}

void DiscoveryConsumer::transition_to_stopped(
    PresenceNotifications::StopReason reason) {
  state_.store(State::Stopped, std::memory_order_release);

  // Release whichever wait lost the race; the cancelled read completes with
  // operation_aborted and the shutdown handler is simply dropped.
  stream_->Cancel();
  shutdown_->Cancel();

  PresenceEvents().NotifyConsumerStopped(session_label_, reason);
}

} // namespace presence
} // namespace lanpeer
