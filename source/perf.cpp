#include <gitauto/perf.hpp>

#include <algorithm>
#include <numeric>

namespace gitauto {

void PerfRecorder::record(const std::string &operation, double duration_ms) {
  std::lock_guard<std::mutex> lk(m_);
  auto &s = series_[operation];
  s.push_back(duration_ms);
  while (s.size() > cap_)
    s.pop_front();
}

static PerfStats summarize(const std::string &name, const std::deque<double> &s) {
  PerfStats st;
  st.operation_name = name;
  st.count = s.size();
  if (s.empty())
    return st;
  auto [mn, mx] = std::minmax_element(s.begin(), s.end());
  st.min_ms = *mn;
  st.max_ms = *mx;
  st.avg_ms = std::accumulate(s.begin(), s.end(), 0.0) / static_cast<double>(s.size());
  return st;
}

std::optional<PerfStats> PerfRecorder::stats(const std::string &operation) const {
  std::lock_guard<std::mutex> lk(m_);
  auto it = series_.find(operation);
  if (it == series_.end() || it->second.empty())
    return std::nullopt;
  return summarize(it->first, it->second);
}

std::vector<PerfStats> PerfRecorder::all_stats() const {
  std::lock_guard<std::mutex> lk(m_);
  std::vector<PerfStats> out;
  for (const auto &[name, s] : series_)
    if (!s.empty())
      out.push_back(summarize(name, s));
  std::sort(out.begin(), out.end(), [](const PerfStats &a, const PerfStats &b) {
    return a.operation_name < b.operation_name;
  });
  return out;
}

std::vector<PerformanceSample>
PerfRecorder::samples(const std::string &operation) const {
  std::lock_guard<std::mutex> lk(m_);
  std::vector<PerformanceSample> out;
  auto it = series_.find(operation);
  if (it == series_.end())
    return out;
  for (double d : it->second)
    out.push_back(PerformanceSample{operation, d});
  return out;
}

void PerfRecorder::clear() {
  std::lock_guard<std::mutex> lk(m_);
  series_.clear();
}

ScopedTimer::~ScopedTimer() {
  auto elapsed = std::chrono::steady_clock::now() - start_;
  rec_.record(operation_,
              std::chrono::duration<double, std::milli>(elapsed).count());
}

} // namespace gitauto
