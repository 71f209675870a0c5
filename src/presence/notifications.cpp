// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "presence/notifications.hpp"
#include <algorithm>

namespace lanpeer {

// ============================================================================
// PresenceNotifications::Subscription
// ============================================================================

PresenceNotifications::Subscription::Subscription(PresenceNotifications *owner,
                                                  size_t id)
    : owner_(owner), id_(id), active_(true) {}

PresenceNotifications::Subscription::~Subscription() { Unsubscribe(); }

PresenceNotifications::Subscription::Subscription(Subscription &&other) noexcept
    : owner_(other.owner_), id_(other.id_), active_(other.active_) {
  other.owner_ = nullptr;
  other.active_ = false;
}

PresenceNotifications::Subscription &
PresenceNotifications::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    active_ = other.active_;
    other.owner_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

void PresenceNotifications::Subscription::Unsubscribe() {
  if (active_ && owner_) {
    owner_->Unsubscribe(id_);
    active_ = false;
  }
}

// ============================================================================
// PresenceNotifications
// ============================================================================

PresenceNotifications::Subscription
PresenceNotifications::AddEntry(CallbackEntry entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  entry.id = next_id_++;
  size_t id = entry.id;
  callbacks_.push_back(std::move(entry));
  return Subscription(this, id);
}

template <typename Callback>
std::vector<Callback>
PresenceNotifications::Snapshot(Callback CallbackEntry::*member) const {
  std::vector<Callback> snapshot;
  std::lock_guard<std::mutex> lock(mutex_);
  snapshot.reserve(callbacks_.size());
  for (const auto &entry : callbacks_) {
    if (entry.*member) {
      snapshot.push_back(entry.*member);
    }
  }
  return snapshot;
}

PresenceNotifications::Subscription
PresenceNotifications::SubscribeSessionBound(SessionBoundCallback callback) {
  CallbackEntry entry{};
  entry.session_bound = std::move(callback);
  return AddEntry(std::move(entry));
}

PresenceNotifications::Subscription
PresenceNotifications::SubscribePeerDiscovered(PeerDiscoveredCallback callback) {
  CallbackEntry entry{};
  entry.peer_discovered = std::move(callback);
  return AddEntry(std::move(entry));
}

PresenceNotifications::Subscription
PresenceNotifications::SubscribePeerExpired(PeerExpiredCallback callback) {
  CallbackEntry entry{};
  entry.peer_expired = std::move(callback);
  return AddEntry(std::move(entry));
}

PresenceNotifications::Subscription
PresenceNotifications::SubscribeSummary(SummaryCallback callback) {
  CallbackEntry entry{};
  entry.summary = std::move(callback);
  return AddEntry(std::move(entry));
}

PresenceNotifications::Subscription
PresenceNotifications::SubscribeConsumerStopped(
    ConsumerStoppedCallback callback) {
  CallbackEntry entry{};
  entry.consumer_stopped = std::move(callback);
  return AddEntry(std::move(entry));
}

PresenceNotifications::Subscription
PresenceNotifications::SubscribeReporterStopped(
    ReporterStoppedCallback callback) {
  CallbackEntry entry{};
  entry.reporter_stopped = std::move(callback);
  return AddEntry(std::move(entry));
}

PresenceNotifications::Subscription
PresenceNotifications::SubscribeSessionFinished(
    SessionFinishedCallback callback) {
  CallbackEntry entry{};
  entry.session_finished = std::move(callback);
  return AddEntry(std::move(entry));
}

void PresenceNotifications::NotifySessionBound(const std::string &session,
                                               const network::PeerId &node_id) {
  for (const auto &callback : Snapshot(&CallbackEntry::session_bound)) {
    callback(session, node_id);
  }
}

void PresenceNotifications::NotifyPeerDiscovered(
    const std::string &session, const network::PeerId &peer,
    const std::optional<std::string> &label, const std::string &source) {
  for (const auto &callback : Snapshot(&CallbackEntry::peer_discovered)) {
    callback(session, peer, label, source);
  }
}

void PresenceNotifications::NotifyPeerExpired(const std::string &session,
                                              const network::PeerId &peer) {
  for (const auto &callback : Snapshot(&CallbackEntry::peer_expired)) {
    callback(session, peer);
  }
}

void PresenceNotifications::NotifySummary(const std::string &session,
                                          size_t peer_count) {
  for (const auto &callback : Snapshot(&CallbackEntry::summary)) {
    callback(session, peer_count);
  }
}

void PresenceNotifications::NotifyConsumerStopped(const std::string &session,
                                                  StopReason reason) {
  for (const auto &callback : Snapshot(&CallbackEntry::consumer_stopped)) {
    callback(session, reason);
  }
}

void PresenceNotifications::NotifyReporterStopped(const std::string &session) {
  for (const auto &callback : Snapshot(&CallbackEntry::reporter_stopped)) {
    callback(session);
  }
}

void PresenceNotifications::NotifySessionFinished(const std::string &session,
                                                  bool ok,
                                                  const std::string &error) {
  for (const auto &callback : Snapshot(&CallbackEntry::session_finished)) {
    callback(session, ok, error);
  }
}

PresenceNotifications &PresenceNotifications::Get() {
  static PresenceNotifications instance;
  return instance;
}

void PresenceNotifications::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.erase(std::remove_if(callbacks_.begin(), callbacks_.end(),
                                  [id](const CallbackEntry &entry) {
                                    return entry.id == id;
                                  }),
                   callbacks_.end());
}

const char *ToString(PresenceNotifications::StopReason reason) {
  switch (reason) {
  case PresenceNotifications::StopReason::Shutdown:
    return "shutdown";
  case PresenceNotifications::StopReason::StreamEnded:
    return "stream ended";
  }
  return "unknown";
}

} // namespace lanpeer
