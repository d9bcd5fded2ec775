#pragma once
#include <any>
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace gitauto {

// Time-windowed memoization keyed by operation identity. Stale entries are
// evicted on read and never returned.
class ResultCache {
public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  ResultCache() : now_([] { return Clock::now(); }) {}
  explicit ResultCache(NowFn now) : now_(std::move(now)) {}

  template <typename T, typename Compute>
  T get_or_compute(const std::string &key,
                   std::chrono::milliseconds freshness_window,
                   Compute &&compute) {
    {
      std::lock_guard<std::mutex> lk(m_);
      auto it = entries_.find(key);
      if (it != entries_.end()) {
        if (now_() - it->second.created_at < freshness_window) {
          if (const T *v = std::any_cast<T>(&it->second.value))
            return *v;
        }
        entries_.erase(it);
      }
    }
    // computed outside the lock: compute may run external processes
    T value = compute();
    std::lock_guard<std::mutex> lk(m_);
    entries_[key] = Entry{value, now_()};
    return value;
  }

  void clear();
  std::size_t size() const;

private:
  struct Entry {
    std::any value;
    Clock::time_point created_at;
  };

  NowFn now_;
  mutable std::mutex m_;
  std::unordered_map<std::string, Entry> entries_;
};

// "<operation>:<xxh3 of the absolute directory>"
std::string cache_key(const std::string &operation,
                      const std::filesystem::path &dir);

} // namespace gitauto
