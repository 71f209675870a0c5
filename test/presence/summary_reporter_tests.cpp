// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "infra/log_capture.hpp"
#include "infra/simulated_lan.hpp"
#include "infra/test_helpers.hpp"
#include "presence/notifications.hpp"
#include "presence/summary_reporter.hpp"
#include <atomic>
#include <catch2/catch_test_macros.hpp>

using namespace lanpeer;
using namespace lanpeer::presence;
using namespace std::chrono_literals;
using lanpeer::test::BindEndpoint;
using lanpeer::test::IoRunner;
using lanpeer::test::LogCapture;
using lanpeer::test::SimulatedLan;
using lanpeer::test::WaitFor;

TEST_CASE("SummaryReporter: first tick is immediate and warns when alone",
          "[presence][reporter]") {
  LogCapture logs;
  IoRunner io(2);
  auto lan = SimulatedLan::Create();
  auto endpoint = BindEndpoint(*lan, io.context(), "reporter-alone");
  REQUIRE(endpoint);

  auto coordinator = ShutdownCoordinator::Create();
  auto reporter = std::make_shared<SummaryReporter>(
      io.context(), "reporter-alone", endpoint, coordinator->Subscribe(),
      std::chrono::seconds(60));
  reporter->start();

  REQUIRE(WaitFor([&]() { return reporter->ticks() == 1; }, 1000ms));
  CHECK(reporter->last_count() == 0);
  CHECK(logs.Contains("reporter-alone: No peers discovered yet"));

  coordinator->Send();
  REQUIRE(WaitFor([&]() { return reporter->is_stopped(); }));
}

TEST_CASE("SummaryReporter: counts peers in the routing table",
          "[presence][reporter]") {
  LogCapture logs;
  IoRunner io(2);
  auto lan = SimulatedLan::Create();
  auto endpoint = BindEndpoint(*lan, io.context(), "reporter-counting");
  REQUIRE(BindEndpoint(*lan, io.context(), "peer-one"));
  REQUIRE(BindEndpoint(*lan, io.context(), "peer-two"));

  std::atomic<size_t> reported{0};
  auto sub = PresenceEvents().SubscribeSummary(
      [&](const std::string &session, size_t count) {
        if (session == "reporter-counting") {
          reported = count;
        }
      });

  auto coordinator = ShutdownCoordinator::Create();
  auto reporter = std::make_shared<SummaryReporter>(
      io.context(), "reporter-counting", endpoint, coordinator->Subscribe(),
      20ms);
  reporter->start();

  REQUIRE(WaitFor([&]() { return reported.load() == 2; }));
  CHECK(logs.Contains("reporter-counting: Total peers in routing table: 2"));

  // Ticks keep coming at the configured interval
  REQUIRE(WaitFor([&]() { return reporter->ticks() >= 3; }));

  coordinator->Send();
  REQUIRE(WaitFor([&]() { return reporter->is_stopped(); }));
}

TEST_CASE("SummaryReporter: shutdown stops ticking", "[presence][reporter]") {
  IoRunner io(2);
  auto lan = SimulatedLan::Create();
  auto endpoint = BindEndpoint(*lan, io.context(), "reporter-stop");

  std::atomic<bool> stopped{false};
  auto sub = PresenceEvents().SubscribeReporterStopped(
      [&](const std::string &session) {
        if (session == "reporter-stop") {
          stopped = true;
        }
      });

  auto coordinator = ShutdownCoordinator::Create();
  auto reporter = std::make_shared<SummaryReporter>(
      io.context(), "reporter-stop", endpoint, coordinator->Subscribe(), 10ms);
  reporter->start();
  REQUIRE(WaitFor([&]() { return reporter->ticks() >= 1; }));

  coordinator->Send();
  REQUIRE(WaitFor([&]() { return stopped.load(); }));

  const size_t ticks = reporter->ticks();
  std::this_thread::sleep_for(60ms);
  CHECK(reporter->ticks() == ticks);
}
