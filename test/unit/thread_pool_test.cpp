#include <shacl/thread_pool.hpp>

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <latch>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

TEST_CASE("thread_pool: runs every task", "[thread_pool]") {
  constexpr int tasks = 200;
  std::atomic<int> sum{0};
  std::latch done(tasks);

  shacl::thread_pool pool(4);
  CHECK(pool.size() == 4);
  for (int i = 1; i <= tasks; ++i) {
    pool.add_task([&, i] {
      sum += i;
      done.count_down();
    });
  }
  done.wait();
  CHECK(sum == tasks * (tasks + 1) / 2);
}

TEST_CASE("thread_pool: work spreads over worker threads", "[thread_pool]") {
  constexpr int tasks = 4;
  std::mutex mutex;
  std::set<std::thread::id> ids;
  std::latch started(tasks);
  std::latch done(tasks);

  shacl::thread_pool pool(tasks);
  for (int i = 0; i < tasks; ++i) {
    pool.add_task([&] {
      {
        std::lock_guard lock(mutex);
        ids.insert(std::this_thread::get_id());
      }
      // Every task waits for the others, so each needs its own worker.
      started.arrive_and_wait();
      done.count_down();
    });
  }
  done.wait();
  CHECK(ids.size() == static_cast<std::size_t>(tasks));
  CHECK(ids.count(std::this_thread::get_id()) == 0);
}

TEST_CASE("thread_pool: tasks added after shutdown are dropped",
          "[thread_pool]") {
  std::atomic<int> ran{0};
  shacl::thread_pool pool(2);
  pool.shutdown();
  pool.add_task([&] { ++ran; });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  CHECK(ran == 0);
  CHECK(pool.size() == 0);
}

TEST_CASE("thread_pool: size must be positive", "[thread_pool]") {
  CHECK_THROWS_AS(shacl::thread_pool(0), std::invalid_argument);
}
