#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gitauto {

struct PerformanceSample {
  std::string operation_name;
  double duration_ms{0};
};

struct PerfStats {
  std::string operation_name;
  std::size_t count{0};
  double min_ms{0};
  double max_ms{0};
  double avg_ms{0};
};

// Bounded per-operation timing series; the oldest sample is dropped past cap.
class PerfRecorder {
public:
  static constexpr std::size_t kDefaultCap = 100;

  explicit PerfRecorder(std::size_t cap = kDefaultCap) : cap_(cap) {}

  void record(const std::string &operation, double duration_ms);
  std::optional<PerfStats> stats(const std::string &operation) const;
  std::vector<PerfStats> all_stats() const;
  std::vector<PerformanceSample> samples(const std::string &operation) const;
  void clear();

private:
  std::size_t cap_;
  mutable std::mutex m_;
  std::unordered_map<std::string, std::deque<double>> series_;
};

class ScopedTimer {
public:
  ScopedTimer(PerfRecorder &rec, std::string operation)
      : rec_(rec), operation_(std::move(operation)),
        start_(std::chrono::steady_clock::now()) {}
  ~ScopedTimer();

  ScopedTimer(const ScopedTimer &) = delete;
  ScopedTimer &operator=(const ScopedTimer &) = delete;

private:
  PerfRecorder &rec_;
  std::string operation_;
  std::chrono::steady_clock::time_point start_;
};

} // namespace gitauto
