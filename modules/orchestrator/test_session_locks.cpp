#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <optional>
#include <thread>

#include "session_locks.hpp"

using namespace flot::orchestrator;
using namespace std::chrono_literals;

TEST_CASE("Session Locks: Entries live as long as their guards",
          "[orchestrator][locks]") {
  SessionLocks locks;
  REQUIRE(locks.size() == 0);
  {
    auto first = locks.lock("orchestrator-1");
    REQUIRE(first.owns_lock());
    REQUIRE(locks.size() == 1);
    {
      auto second = locks.lock("orchestrator-2");
      REQUIRE(locks.size() == 2);
    }
    REQUIRE(locks.size() == 1);
  }
  REQUIRE(locks.size() == 0);

  for(int i = 0; i < 100; ++i) {
    auto guard = locks.lock("orchestrator-" + std::to_string(i));
  }
  REQUIRE(locks.size() == 0);
}

TEST_CASE("Session Locks: One holder per session", "[orchestrator][locks]") {
  SessionLocks locks;
  std::optional<SessionLocks::Guard> held(locks.lock("orchestrator-1"));

  SECTION("Same session waits") {
    std::atomic_bool entered{ false };
    std::thread waiter([&] {
      auto guard = locks.lock("orchestrator-1");
      entered = true;
    });
    std::this_thread::sleep_for(50ms);
    REQUIRE(!entered);
    REQUIRE(locks.size() == 1);

    held.reset();
    waiter.join();
    REQUIRE(entered);
    REQUIRE(locks.size() == 0);
  }

  SECTION("Other sessions proceed") {
    std::atomic_bool entered{ false };
    std::thread other([&] {
      auto guard = locks.lock("orchestrator-2");
      entered = true;
    });
    other.join();
    REQUIRE(entered);
    REQUIRE(locks.size() == 1);
  }

  SECTION("Moved guards release once") {
    SessionLocks::Guard moved(std::move(*held));
    held.reset();
    REQUIRE(locks.size() == 1);
    REQUIRE(moved.owns_lock());
  }
}
