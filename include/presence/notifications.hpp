// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

#include "network/peer_id.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lanpeer {

/**
 * Notification system for presence events
 *
 * Design:
 * - Simple observer pattern with std::function
 * - Callbacks run synchronously on the io_context worker that raised the event;
 *   they must be quick and must not block
 * - RAII-based subscription management
 * - Singleton (reached through PresenceEvents())
 *
 * Every event carries the label of the session that raised it, so observers can
 * tell concurrent sessions apart. This is the in-process counterpart of the log
 * lines; the C surface only has the logs.
 */
class PresenceNotifications {
public:
  /**
   * Subscription handle - RAII wrapper
   * Automatically unsubscribes when destroyed
   */
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    // Movable but not copyable
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    void Unsubscribe();

  private:
    friend class PresenceNotifications;
    Subscription(PresenceNotifications *owner, size_t id);

    PresenceNotifications *owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  enum class StopReason { Shutdown, StreamEnded };

  // Callback types
  using SessionBoundCallback = std::function<void(
      const std::string &session, const network::PeerId &node_id)>;
  using PeerDiscoveredCallback = std::function<void(
      const std::string &session, const network::PeerId &peer,
      const std::optional<std::string> &label, const std::string &source)>;
  using PeerExpiredCallback = std::function<void(const std::string &session,
                                                 const network::PeerId &peer)>;
  using SummaryCallback =
      std::function<void(const std::string &session, size_t peer_count)>;
  using ConsumerStoppedCallback =
      std::function<void(const std::string &session, StopReason reason)>;
  using ReporterStoppedCallback = std::function<void(const std::string &session)>;
  using SessionFinishedCallback = std::function<void(
      const std::string &session, bool ok, const std::string &error)>;

  [[nodiscard]] Subscription SubscribeSessionBound(SessionBoundCallback callback);
  [[nodiscard]] Subscription
  SubscribePeerDiscovered(PeerDiscoveredCallback callback);
  [[nodiscard]] Subscription SubscribePeerExpired(PeerExpiredCallback callback);
  [[nodiscard]] Subscription SubscribeSummary(SummaryCallback callback);
  [[nodiscard]] Subscription
  SubscribeConsumerStopped(ConsumerStoppedCallback callback);
  [[nodiscard]] Subscription
  SubscribeReporterStopped(ReporterStoppedCallback callback);
  [[nodiscard]] Subscription
  SubscribeSessionFinished(SessionFinishedCallback callback);

  // Called by PeerSession once the endpoint is bound
  void NotifySessionBound(const std::string &session,
                          const network::PeerId &node_id);

  // Called by DiscoveryConsumer for every non-self discovery
  void NotifyPeerDiscovered(const std::string &session,
                            const network::PeerId &peer,
                            const std::optional<std::string> &label,
                            const std::string &source);

  void NotifyPeerExpired(const std::string &session,
                         const network::PeerId &peer);

  // Called by SummaryReporter on every tick
  void NotifySummary(const std::string &session, size_t peer_count);

  void NotifyConsumerStopped(const std::string &session, StopReason reason);
  void NotifyReporterStopped(const std::string &session);

  // Called once per session, after the endpoint is closed or setup failed
  void NotifySessionFinished(const std::string &session, bool ok,
                             const std::string &error);

  static PresenceNotifications &Get();

private:
  PresenceNotifications() = default;

  void Unsubscribe(size_t id);

  struct CallbackEntry {
    size_t id;
    SessionBoundCallback session_bound;
    PeerDiscoveredCallback peer_discovered;
    PeerExpiredCallback peer_expired;
    SummaryCallback summary;
    ConsumerStoppedCallback consumer_stopped;
    ReporterStoppedCallback reporter_stopped;
    SessionFinishedCallback session_finished;
  };

  Subscription AddEntry(CallbackEntry entry);

  // Copies the selected callbacks under the lock; invoking happens unlocked
  template <typename Callback>
  std::vector<Callback> Snapshot(Callback CallbackEntry::*member) const;

  mutable std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1}; // 0 reserved for invalid
};

inline PresenceNotifications &PresenceEvents() {
  return PresenceNotifications::Get();
}

const char *ToString(PresenceNotifications::StopReason reason);

} // namespace lanpeer
