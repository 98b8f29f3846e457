/**
 * @file test_shutdown.cpp
 * @brief Tests for shutdown.hpp
 */

#include "nspeed/shutdown.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <thread>
#include <vector>

TEST_CASE("ShutdownManager Register callbacks", "[shutdown]") {
  nspeed::ShutdownManager mgr;
  REQUIRE(mgr.IsValid());

  for (uint32_t i = 0; i < nspeed::ShutdownManager::kMaxCallbacks; ++i) {
    auto r = mgr.Register([](int, void*) {});
    REQUIRE(r.has_value());
  }

  auto rn = mgr.Register([](int, void*) {});
  REQUIRE(!rn.has_value());
  REQUIRE(rn.get_error() == nspeed::ShutdownError::kCallbacksFull);
}

TEST_CASE("ShutdownManager null callback rejected", "[shutdown]") {
  nspeed::ShutdownManager mgr;
  auto r = mgr.Register(nullptr);
  REQUIRE(!r.has_value());
}

TEST_CASE("ShutdownManager second instance is invalid", "[shutdown]") {
  nspeed::ShutdownManager first;
  nspeed::ShutdownManager second;
  REQUIRE(first.IsValid());
  REQUIRE_FALSE(second.IsValid());

  auto r = second.Register([](int, void*) {});
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == nspeed::ShutdownError::kAlreadyInstantiated);
}

TEST_CASE("ShutdownManager Quit and IsShutdownRequested", "[shutdown]") {
  nspeed::ShutdownManager mgr;
  REQUIRE(!mgr.IsShutdownRequested());

  mgr.Quit(0);
  REQUIRE(mgr.IsShutdownRequested());
}

TEST_CASE("ShutdownManager InstallSignalHandlers", "[shutdown]") {
  nspeed::ShutdownManager mgr;
  auto result = mgr.InstallSignalHandlers();
  REQUIRE(result.has_value());
}

TEST_CASE("ShutdownManager callbacks run LIFO with their context", "[shutdown]") {
  nspeed::ShutdownManager mgr;
  std::vector<int> order;

  mgr.Register([](int, void* ctx) { static_cast<std::vector<int>*>(ctx)->push_back(1); },
               &order);
  mgr.Register([](int, void* ctx) { static_cast<std::vector<int>*>(ctx)->push_back(2); },
               &order);
  mgr.Register([](int, void* ctx) { static_cast<std::vector<int>*>(ctx)->push_back(3); },
               &order);

  mgr.Quit(0);
  mgr.WaitForShutdown();

  REQUIRE(order.size() == 3);
  REQUIRE(order[0] == 3);
  REQUIRE(order[1] == 2);
  REQUIRE(order[2] == 1);
}

TEST_CASE("ShutdownManager Quit is idempotent and keeps the first signal", "[shutdown]") {
  nspeed::ShutdownManager mgr;
  int calls = 0;
  mgr.Register([](int, void* ctx) { ++*static_cast<int*>(ctx); }, &calls);

  mgr.Quit(15);
  mgr.Quit(2);
  REQUIRE(mgr.Signal() == 15);

  mgr.WaitForShutdown();
  REQUIRE(calls == 1);
}

TEST_CASE("ShutdownManager WaitForShutdown wakes on Quit from another thread",
          "[shutdown]") {
  nspeed::ShutdownManager mgr;
  int seen_signo = -1;
  mgr.Register([](int signo, void* ctx) { *static_cast<int*>(ctx) = signo; },
               &seen_signo);

  std::thread quitter([&mgr]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    mgr.Quit(7);
  });
  mgr.WaitForShutdown();
  quitter.join();

  REQUIRE(seen_signo == 7);
}
