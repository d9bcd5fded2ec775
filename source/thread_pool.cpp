#include <gitauto/thread_pool.hpp>

namespace gitauto {

ThreadPool::ThreadPool(unsigned n) {
  if (n == 0)
    n = std::thread::hardware_concurrency();
  if (n == 0)
    n = 1;
  for (unsigned i = 0; i < n; i++) {
    workers_.emplace_back([this] {
      for (;;) {
        std::function<void()> job;
        {
          std::unique_lock<std::mutex> lk(m_);
          cv_.wait(lk, [&] { return stop_ || !q_.empty(); });
          if (stop_ && q_.empty())
            return;
          job = std::move(q_.front());
          q_.pop();
        }
        job();
      }
    });
  }
}

ThreadPool::~ThreadPool() {
  {
    std::lock_guard<std::mutex> lk(m_);
    stop_ = true;
  }
  cv_.notify_all();
  for (auto &t : workers_)
    t.join();
}

void ThreadPool::submit(std::function<void()> fn) {
  {
    std::lock_guard<std::mutex> lk(m_);
    q_.emplace(std::move(fn));
  }
  cv_.notify_one();
}

} // namespace gitauto
