#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <vector>

namespace shacl {

  // Fixed-size pool of worker threads draining a FIFO task queue.
  //
  // shutdown() discards tasks that have not started and joins the workers;
  // callers that need every task to run wait for completion themselves
  // before the pool goes away.
  class thread_pool {
  public:
    using task = std::function<void()>;

    explicit thread_pool(std::size_t size);

    ~thread_pool();

    thread_pool(const thread_pool&) = delete;
    thread_pool&
    operator=(const thread_pool&) = delete;

    // Ignored after shutdown.
    void
    add_task(task t);

    void
    shutdown();

    std::size_t
    size() const {
      return workers_.size();
    }

  private:
    void
    worker_loop(std::stop_token stop);

    std::mutex mutex_;
    std::condition_variable_any queue_cv_;
    std::queue<task> queue_;
    std::stop_source stop_source_;
    std::vector<std::jthread> workers_;
  };

} // namespace shacl
