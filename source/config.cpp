#include <gitauto/config.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>

namespace gitauto {

static std::optional<std::string> env(const char *name) {
  const char *v = std::getenv(name);
  if (!v || !*v)
    return std::nullopt;
  return std::string(v);
}

static std::optional<long long> env_number(const char *name) {
  auto v = env(name);
  if (!v)
    return std::nullopt;
  errno = 0;
  char *end = nullptr;
  long long n = std::strtoll(v->c_str(), &end, 10);
  if (errno != 0 || end == v->c_str() || *end != '\0' || n < 0) {
    spdlog::warn("[config] ignoring {}={}: not a non-negative integer", name,
                 *v);
    return std::nullopt;
  }
  return n;
}

Config Config::from_env() {
  Config c;
  if (auto v = env("GITAUTO_GIT"))
    c.git_bin = *v;
  if (auto v = env("GITAUTO_GH"))
    c.gh_bin = *v;
  if (auto v = env("GITAUTO_PROBE_HOST"))
    c.probe_host = *v;
  if (auto n = env_number("GITAUTO_TIMEOUT_MS"))
    c.timeout = std::chrono::milliseconds(*n);
  if (auto n = env_number("GITAUTO_WORKERS")) {
    if (*n > 0)
      c.parallel_workers = static_cast<unsigned>(*n);
    else
      spdlog::warn("[config] ignoring GITAUTO_WORKERS=0");
  }
  if (auto n = env_number("GITAUTO_ANALYTICS_TTL_MS"))
    c.analytics_ttl = std::chrono::milliseconds(*n);
  if (auto n = env_number("GITAUTO_SUGGESTIONS_TTL_MS"))
    c.suggestions_ttl = std::chrono::milliseconds(*n);
  if (auto v = env("GITAUTO_LOG_LEVEL")) {
    auto lvl = spdlog::level::from_str(*v);
    // from_str maps unknown names to off
    if (lvl == spdlog::level::off && *v != "off")
      spdlog::warn("[config] unknown GITAUTO_LOG_LEVEL={}", *v);
    else
      c.log_level = lvl;
  }
  return c;
}

} // namespace gitauto
