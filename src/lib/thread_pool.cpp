#include <shacl/thread_pool.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace shacl {

  thread_pool::thread_pool(std::size_t size) {
    if (size == 0) {
      throw std::invalid_argument("thread_pool: size must be positive");
    }
    workers_.reserve(size);
    for (std::size_t i = 0; i < size; ++i) {
      workers_.emplace_back(
          [this, stop = stop_source_.get_token()] { worker_loop(stop); });
    }
    spdlog::trace("thread pool started with {} worker(s)", size);
  }

  thread_pool::~thread_pool() {
    if (!stop_source_.stop_requested()) shutdown();
  }

  void
  thread_pool::add_task(task t) {
    {
      std::unique_lock lock(mutex_);
      if (stop_source_.stop_requested()) return;
      queue_.push(std::move(t));
    }
    queue_cv_.notify_one();
  }

  void
  thread_pool::shutdown() {
    {
      std::unique_lock lock(mutex_);
      stop_source_.request_stop();
      std::queue<task> empty;
      queue_.swap(empty);
    }
    queue_cv_.notify_all();
    workers_.clear();
    spdlog::trace("thread pool stopped");
  }

  void
  thread_pool::worker_loop(std::stop_token stop) {
    while (true) {
      task next;
      {
        std::unique_lock lock(mutex_);
        queue_cv_.wait(lock, stop, [this] { return !queue_.empty(); });
        if (stop.stop_requested()) return;
        next = std::move(queue_.front());
        queue_.pop();
      }
      next();
    }
  }

} // namespace shacl
