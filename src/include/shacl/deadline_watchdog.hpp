#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <stop_token>
#include <thread>

namespace shacl {

  // Background thread that requests stop on watched stop sources whose
  // deadline has passed. A source released before its deadline is left
  // alone.
  class deadline_watchdog {
  public:
    using clock = std::chrono::steady_clock;
    using handle = std::uint64_t;

    deadline_watchdog();

    ~deadline_watchdog();

    deadline_watchdog(const deadline_watchdog&) = delete;
    deadline_watchdog&
    operator=(const deadline_watchdog&) = delete;

    handle
    watch(std::stop_source source, clock::time_point deadline);

    // No effect if the deadline already fired.
    void
    release(handle h);

    // Number of sources still waiting on their deadline.
    std::size_t
    pending() const;

  private:
    struct entry {
      std::stop_source source;
      clock::time_point deadline;
    };

    void
    run(std::stop_token stop);

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::map<handle, entry> entries_;
    handle next_handle_ = 0;
    bool changed_ = false;
    std::jthread thread_;
  };

} // namespace shacl
