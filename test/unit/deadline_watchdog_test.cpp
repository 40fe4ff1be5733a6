#include <shacl/deadline_watchdog.hpp>

#include <catch2/catch.hpp>

#include <chrono>
#include <thread>

using namespace std::chrono_literals;
using shacl::deadline_watchdog;

namespace {

  // Polls until stop is requested or the limit passes.
  bool
  stopped_within(const std::stop_source& source,
                 std::chrono::milliseconds limit) {
    auto until = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < until) {
      if (source.stop_requested()) return true;
      std::this_thread::sleep_for(1ms);
    }
    return source.stop_requested();
  }

} // namespace

TEST_CASE("watchdog: requests stop after the deadline", "[watchdog]") {
  deadline_watchdog watchdog;
  std::stop_source source;
  watchdog.watch(source, deadline_watchdog::clock::now() + 10ms);
  CHECK(stopped_within(source, 2000ms));
  auto until = std::chrono::steady_clock::now() + 2000ms;
  while (watchdog.pending() != 0 && std::chrono::steady_clock::now() < until)
    std::this_thread::sleep_for(1ms);
  CHECK(watchdog.pending() == 0);
}

TEST_CASE("watchdog: released sources are left alone", "[watchdog]") {
  deadline_watchdog watchdog;
  std::stop_source source;
  auto h = watchdog.watch(source, deadline_watchdog::clock::now() + 30ms);
  watchdog.release(h);
  CHECK(watchdog.pending() == 0);
  std::this_thread::sleep_for(60ms);
  CHECK_FALSE(source.stop_requested());
}

TEST_CASE("watchdog: deadlines fire independently", "[watchdog]") {
  deadline_watchdog watchdog;
  std::stop_source late;
  std::stop_source early;
  watchdog.watch(late, deadline_watchdog::clock::now() + 10s);
  watchdog.watch(early, deadline_watchdog::clock::now() + 10ms);

  CHECK(stopped_within(early, 2000ms));
  CHECK_FALSE(late.stop_requested());
}

TEST_CASE("watchdog: a past deadline fires immediately", "[watchdog]") {
  deadline_watchdog watchdog;
  std::stop_source source;
  watchdog.watch(source, deadline_watchdog::clock::now() - 1ms);
  CHECK(stopped_within(source, 2000ms));
}
