// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "presence/notifications.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace lanpeer;

TEST_CASE("PresenceNotifications: RAII subscription cleanup",
          "[presence][notifications]") {
  auto &notifications = PresenceEvents();
  bool called = false;

  {
    auto sub = notifications.SubscribeSummary(
        [&](const std::string &, size_t) { called = true; });

    notifications.NotifySummary("raii", 3);
    REQUIRE(called);
  } // subscription goes out of scope

  called = false;
  notifications.NotifySummary("raii", 3);
  REQUIRE(!called); // Callback no longer registered
}

TEST_CASE("PresenceNotifications: Multiple subscribers",
          "[presence][notifications]") {
  auto &notifications = PresenceEvents();
  int count = 0;

  auto sub1 = notifications.SubscribeReporterStopped(
      [&](const std::string &) { count++; });
  auto sub2 = notifications.SubscribeReporterStopped(
      [&](const std::string &) { count++; });

  notifications.NotifyReporterStopped("multi");
  REQUIRE(count == 2);
}

TEST_CASE("PresenceNotifications: Manual unsubscribe and move",
          "[presence][notifications]") {
  auto &notifications = PresenceEvents();
  bool called = false;

  auto sub1 = notifications.SubscribeSessionFinished(
      [&](const std::string &, bool, const std::string &) { called = true; });

  // Move constructor
  auto sub2 = std::move(sub1);
  notifications.NotifySessionFinished("move", true, "");
  REQUIRE(called);

  // Move assignment
  called = false;
  PresenceNotifications::Subscription sub3;
  sub3 = std::move(sub2);
  notifications.NotifySessionFinished("move", true, "");
  REQUIRE(called);

  called = false;
  sub3.Unsubscribe();
  sub3.Unsubscribe(); // second call is a no-op
  notifications.NotifySessionFinished("move", true, "");
  REQUIRE(!called);
}

TEST_CASE("PresenceNotifications: event payloads",
          "[presence][notifications]") {
  auto &notifications = PresenceEvents();
  const network::PeerId node = network::PeerId::Random();
  const network::PeerId peer = network::PeerId::Random();

  SECTION("SessionBound") {
    std::string session;
    network::PeerId received;
    auto sub = notifications.SubscribeSessionBound(
        [&](const std::string &s, const network::PeerId &id) {
          session = s;
          received = id;
        });
    notifications.NotifySessionBound("alice", node);
    REQUIRE(session == "alice");
    REQUIRE(received == node);
  }

  SECTION("PeerDiscovered") {
    std::optional<std::string> label;
    std::string source;
    network::PeerId received;
    auto sub = notifications.SubscribePeerDiscovered(
        [&](const std::string &, const network::PeerId &id,
            const std::optional<std::string> &l, const std::string &src) {
          received = id;
          label = l;
          source = src;
        });
    notifications.NotifyPeerDiscovered("alice", peer, std::string("bob"),
                                       "local-network");
    REQUIRE(received == peer);
    REQUIRE(label == std::optional<std::string>("bob"));
    REQUIRE(source == "local-network");
  }

  SECTION("PeerExpired") {
    network::PeerId received;
    auto sub = notifications.SubscribePeerExpired(
        [&](const std::string &, const network::PeerId &id) { received = id; });
    notifications.NotifyPeerExpired("alice", peer);
    REQUIRE(received == peer);
  }

  SECTION("ConsumerStopped") {
    std::optional<PresenceNotifications::StopReason> reason;
    auto sub = notifications.SubscribeConsumerStopped(
        [&](const std::string &, PresenceNotifications::StopReason r) {
          reason = r;
        });
    notifications.NotifyConsumerStopped(
        "alice", PresenceNotifications::StopReason::StreamEnded);
    REQUIRE(reason == PresenceNotifications::StopReason::StreamEnded);
  }

  SECTION("SessionFinished with error") {
    bool ok = true;
    std::string error;
    auto sub = notifications.SubscribeSessionFinished(
        [&](const std::string &, bool o, const std::string &e) {
          ok = o;
          error = e;
        });
    notifications.NotifySessionFinished("alice", false, "bind failed");
    REQUIRE_FALSE(ok);
    REQUIRE(error == "bind failed");
  }
}

TEST_CASE("PresenceNotifications: stop reasons have names",
          "[presence][notifications]") {
  REQUIRE(std::string(ToString(PresenceNotifications::StopReason::Shutdown)) ==
          "shutdown");
  REQUIRE(std::string(ToString(
              PresenceNotifications::StopReason::StreamEnded)) ==
          "stream ended");
}

TEST_CASE("PresenceNotifications: callback may unsubscribe others",
          "[presence][notifications]") {
  auto &notifications = PresenceEvents();
  int second_calls = 0;
  PresenceNotifications::Subscription second;

  auto first = notifications.SubscribeSummary(
      [&](const std::string &, size_t) { second.Unsubscribe(); });
  second = notifications.SubscribeSummary(
      [&](const std::string &, size_t) { second_calls++; });

  // Snapshot taken before the first callback ran still includes the second
  notifications.NotifySummary("reentrant", 0);
  notifications.NotifySummary("reentrant", 0);
  REQUIRE(second_calls == 1);
}
