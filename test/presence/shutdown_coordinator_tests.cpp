// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#include "infra/test_helpers.hpp"
#include "presence/shutdown_coordinator.hpp"
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <thread>
#include <vector>

using namespace lanpeer;
using namespace lanpeer::presence;
using lanpeer::test::IoRunner;
using lanpeer::test::WaitFor;

TEST_CASE("ShutdownCoordinator: every live subscriber observes one send",
          "[presence][shutdown]") {
  IoRunner io(2);
  auto coordinator = ShutdownCoordinator::Create();

  std::atomic<int> fired{0};
  std::vector<ShutdownSubscriptionPtr> subs;
  for (int i = 0; i < 5; ++i) {
    subs.push_back(coordinator->Subscribe());
    subs.back()->AsyncWait(io.context().get_executor(), [&]() { ++fired; });
  }

  REQUIRE(coordinator->subscriber_count() == 5);
  REQUIRE(coordinator->Send() == 5);
  REQUIRE(WaitFor([&]() { return fired.load() == 5; }));

  for (const auto &sub : subs) {
    CHECK(sub->signalled());
  }
}

TEST_CASE("ShutdownCoordinator: send with no subscribers is a no-op",
          "[presence][shutdown]") {
  auto coordinator = ShutdownCoordinator::Create();
  REQUIRE(coordinator->Send() == 0);
  REQUIRE(coordinator->sends() == 1);

  // Subscribers created afterwards are not signalled by the earlier send
  auto sub = coordinator->Subscribe();
  CHECK_FALSE(sub->signalled());
}

TEST_CASE("ShutdownCoordinator: repeated sends have no further effect",
          "[presence][shutdown]") {
  IoRunner io(1);
  auto coordinator = ShutdownCoordinator::Create();
  auto sub = coordinator->Subscribe();

  std::atomic<int> fired{0};
  sub->AsyncWait(io.context().get_executor(), [&]() { ++fired; });

  REQUIRE(coordinator->Send() == 1);
  REQUIRE(coordinator->Send() == 0);
  REQUIRE(coordinator->Send() == 0);
  REQUIRE(WaitFor([&]() { return fired.load() == 1; }));

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  CHECK(fired.load() == 1);
  CHECK(coordinator->sends() == 3);
}

TEST_CASE("ShutdownSubscription: signal is sticky for late waiters",
          "[presence][shutdown]") {
  IoRunner io(1);
  auto coordinator = ShutdownCoordinator::Create();
  auto sub = coordinator->Subscribe();

  coordinator->Send();
  REQUIRE(sub->signalled());

  std::atomic<bool> fired{false};
  sub->AsyncWait(io.context().get_executor(), [&]() { fired = true; });
  REQUIRE(WaitFor([&]() { return fired.load(); }));
}

TEST_CASE("ShutdownSubscription: cancelled wait is never invoked",
          "[presence][shutdown]") {
  IoRunner io(1);
  auto coordinator = ShutdownCoordinator::Create();
  auto sub = coordinator->Subscribe();

  std::atomic<bool> fired{false};
  sub->AsyncWait(io.context().get_executor(), [&]() { fired = true; });
  sub->Cancel();

  REQUIRE(coordinator->Send() == 1);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  CHECK_FALSE(fired.load());
  CHECK(sub->signalled());
}

TEST_CASE("ShutdownSubscription: dropping the last reference unsubscribes",
          "[presence][shutdown]") {
  auto coordinator = ShutdownCoordinator::Create();
  auto keep = coordinator->Subscribe();
  {
    auto temporary = coordinator->Subscribe();
    REQUIRE(coordinator->subscriber_count() == 2);
  }
  CHECK(coordinator->subscriber_count() == 1);
  CHECK(coordinator->Send() == 1);
}

TEST_CASE("ShutdownSubscription: resubscribe inherits the signalled state",
          "[presence][shutdown]") {
  IoRunner io(1);
  auto coordinator = ShutdownCoordinator::Create();
  auto parent = coordinator->Subscribe();

  SECTION("before the send the derived subscription waits like any other") {
    auto child = parent->Resubscribe();
    CHECK_FALSE(child->signalled());
    REQUIRE(coordinator->Send() == 2);
    CHECK(child->signalled());
  }

  SECTION("after the send the derived subscription starts signalled") {
    coordinator->Send();
    auto child = parent->Resubscribe();
    REQUIRE(child->signalled());

    std::atomic<bool> fired{false};
    child->AsyncWait(io.context().get_executor(), [&]() { fired = true; });
    REQUIRE(WaitFor([&]() { return fired.load(); }));
  }

  SECTION("derived subscriptions outlive a destroyed coordinator") {
    coordinator.reset();
    auto child = parent->Resubscribe();
    CHECK_FALSE(child->signalled());
  }
}

TEST_CASE("ShutdownCoordinator: concurrent subscribe and send",
          "[presence][shutdown][threading]") {
  IoRunner io(4);
  auto coordinator = ShutdownCoordinator::Create();

  constexpr int kThreads = 8;
  std::atomic<int> fired{0};
  std::atomic<int> subscribed{0};
  std::vector<ShutdownSubscriptionPtr> subs(kThreads);
  std::vector<std::thread> threads;

  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i]() {
      subs[i] = coordinator->Subscribe();
      subs[i]->AsyncWait(io.context().get_executor(), [&]() { ++fired; });
      ++subscribed;
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  REQUIRE(subscribed.load() == kThreads);

  std::thread a([&]() { coordinator->Send(); });
  std::thread b([&]() { coordinator->Send(); });
  a.join();
  b.join();

  REQUIRE(WaitFor([&]() { return fired.load() == kThreads; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  CHECK(fired.load() == kThreads);
}
