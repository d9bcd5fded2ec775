#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace gitauto {

class ThreadPool {
public:
  explicit ThreadPool(unsigned n);
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  void submit(std::function<void()> fn);
  unsigned size() const { return static_cast<unsigned>(workers_.size()); }

private:
  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> q_;
  std::mutex m_;
  std::condition_variable cv_;
  std::atomic<bool> stop_{false};
};

} // namespace gitauto
