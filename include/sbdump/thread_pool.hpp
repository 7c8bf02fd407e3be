#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace sbdump {

// Fixed set of workers draining a FIFO of jobs.
class ThreadPool {
public:
  explicit ThreadPool(unsigned n);
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  void submit(std::function<void()> fn);

  // blocks until the queue is empty and no job is running
  void wait_idle();

private:
  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> q_;
  std::mutex m_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  size_t running_ = 0;
  bool stop_ = false;
};

} // namespace sbdump
