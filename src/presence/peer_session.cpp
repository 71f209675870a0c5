// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "presence/peer_session.hpp"
#include "presence/notifications.hpp"
#include "util/logging.hpp"
#include <boost/asio/dispatch.hpp>
#include <utility>

namespace lanpeer {
namespace presence {

PeerSession::PeerSession(boost::asio::io_context &io_context, std::string label,
                         network::EndpointBinderPtr binder,
                         ShutdownSubscriptionPtr shutdown, const Config &config,
                         CompletionCallback on_complete)
    : io_context_(io_context), strand_(boost::asio::make_strand(io_context)),
      label_(std::move(label)), binder_(std::move(binder)),
      shutdown_(std::move(shutdown)), config_(config),
      on_complete_(std::move(on_complete)) {}

network::PeerId PeerSession::node_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return node_id_;
}

DiscoveryConsumerPtr PeerSession::consumer() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return consumer_;
}

SummaryReporterPtr PeerSession::reporter() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reporter_;
}

void PeerSession::run() {
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    if (self->state() != State::Idle) {
      LOG_PEER_WARN("{}: session already started", self->label_);
      return;
    }

    std::string parse_error;
    auto user_data = network::UserData::Parse(self->label_, &parse_error);
    if (!user_data) {
      LOG_PEER_ERROR("{}: invalid user data: {}", self->label_, parse_error);
      self->finish(false, "invalid user data: " + parse_error);
      return;
    }

    self->state_.store(State::Binding, std::memory_order_release);
    LOG_PEER_DEBUG("{}: binding endpoint", self->label_);

    network::EndpointConfig endpoint_config{*user_data};
    self->binder_->AsyncBind(
        self->io_context_, endpoint_config,
        [self](network::EndpointPtr endpoint, const std::string &error) {
          boost::asio::dispatch(self->strand_, [self, endpoint, error]() {
            self->on_bound(endpoint, error);
          });
        });
  });
}

void PeerSession::on_bound(network::EndpointPtr endpoint,
                           const std::string &error) {
  if (!endpoint) {
    const std::string reason =
        error.empty() ? std::string("endpoint bind failed") : error;
    LOG_PEER_ERROR("{}: failed to bind endpoint: {}", label_, reason);
    finish(false, "failed to bind endpoint: " + reason);
    return;
  }

  const network::PeerId self_id = endpoint->node_id();
  LOG_PEER_INFO("{} node ID: {}", label_, self_id.ToString());

  auto consumer = std::make_shared<DiscoveryConsumer>(
      io_context_, label_, self_id, endpoint->SubscribeDiscovery(),
      shutdown_->Resubscribe());
  auto reporter = std::make_shared<SummaryReporter>(
      io_context_, label_, endpoint, shutdown_->Resubscribe(),
      config_.summary_interval);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoint_ = endpoint;
    node_id_ = self_id;
    consumer_ = consumer;
    reporter_ = reporter;
  }
  state_.store(State::Running, std::memory_order_release);

  PresenceEvents().NotifySessionBound(label_, self_id);

  consumer->start();
  reporter->start();

  shutdown_->AsyncWait(strand_,
                       [self = shared_from_this()]() { self->on_shutdown(); });
}

void PeerSession::on_shutdown() {
  if (state() != State::Running) {
    return;
  }
  state_.store(State::Closing, std::memory_order_release);
  LOG_PEER_INFO("{}: Peer shutting down...", label_);

  network::EndpointPtr endpoint;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoint = endpoint_;
  }

  endpoint->AsyncClose([self = shared_from_this()]() {
    boost::asio::dispatch(self->strand_, [self]() {
      LOG_PEER_INFO("{}: Peer shutdown complete", self->label_);
      self->finish(true, std::string());
    });
  });
}

void PeerSession::finish(bool ok, const std::string &error) {
  state_.store(State::Finished, std::memory_order_release);
  shutdown_->Cancel();

  SessionResult result;
  result.label = label_;
  result.ok = ok;
  result.error = error;

  PresenceEvents().NotifySessionFinished(label_, ok, error);
  if (on_complete_) {
    on_complete_(result);
  }
}

const char *ToString(PeerSession::State state) {
  switch (state) {
  case PeerSession::State::Idle:
    return "idle";
  case PeerSession::State::Binding:
    return "binding";
  case PeerSession::State::Running:
    return "running";
  case PeerSession::State::Closing:
    return "closing";
  case PeerSession::State::Finished:
    return "finished";
  }
  return "unknown";
}

} // namespace presence
} // namespace lanpeer
