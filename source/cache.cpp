#include <gitauto/cache.hpp>

#include <spdlog/spdlog.h>
#include <xxhash.h>

#include <sstream>

namespace fs = std::filesystem;

namespace gitauto {

void ResultCache::clear() {
  std::lock_guard<std::mutex> lk(m_);
  spdlog::debug("[cache] cleared {} entries", entries_.size());
  entries_.clear();
}

std::size_t ResultCache::size() const {
  std::lock_guard<std::mutex> lk(m_);
  return entries_.size();
}

static std::string xxh3_64_hex(const std::string &s) {
  auto h = XXH3_64bits(s.data(), s.size());
  std::ostringstream oss;
  oss << std::hex << h;
  return oss.str();
}

std::string cache_key(const std::string &operation, const fs::path &dir) {
  std::error_code ec;
  fs::path abs = fs::absolute(dir, ec);
  if (ec)
    abs = dir;
  fs::path norm = abs.lexically_normal();
  // "/a/b/" and "/a/b" are the same directory
  if (!norm.has_filename() && norm != norm.root_path())
    norm = norm.parent_path();
  return operation + ":" + xxh3_64_hex(norm.string());
}

} // namespace gitauto
