#include <shacl/deadline_watchdog.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace shacl {

  deadline_watchdog::deadline_watchdog()
      : thread_([this](std::stop_token stop) { run(stop); }) {}

  deadline_watchdog::~deadline_watchdog() {
    thread_.request_stop();
    thread_.join();
  }

  deadline_watchdog::handle
  deadline_watchdog::watch(std::stop_source source,
                           clock::time_point deadline) {
    handle h;
    {
      std::lock_guard lock(mutex_);
      h = next_handle_++;
      entries_.emplace(h, entry{std::move(source), deadline});
      changed_ = true;
    }
    cv_.notify_one();
    return h;
  }

  void
  deadline_watchdog::release(handle h) {
    {
      std::lock_guard lock(mutex_);
      if (entries_.erase(h) == 0) return;
      changed_ = true;
    }
    cv_.notify_one();
  }

  std::size_t
  deadline_watchdog::pending() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
  }

  void
  deadline_watchdog::run(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    while (!stop.stop_requested()) {
      auto now = clock::now();
      for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.deadline <= now) {
          spdlog::trace("watchdog: deadline passed for handle {}", it->first);
          it->second.source.request_stop();
          it = entries_.erase(it);
        } else {
          ++it;
        }
      }

      changed_ = false;
      if (entries_.empty()) {
        cv_.wait(lock, stop, [this] { return changed_; });
        continue;
      }
      auto next = std::min_element(entries_.begin(), entries_.end(),
                                   [](const auto& a, const auto& b) {
                                     return a.second.deadline <
                                            b.second.deadline;
                                   })
                      ->second.deadline;
      cv_.wait_until(lock, stop, next, [this] { return changed_; });
    }
  }

} // namespace shacl
