#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include <spdlog/common.h>

namespace gitauto {

struct Config {
  std::string git_bin = "git";
  std::string gh_bin = "gh";
  std::filesystem::path working_dir; // empty = current directory
  std::chrono::milliseconds timeout{0}; // 0 = wait forever
  unsigned parallel_workers = 8;
  std::chrono::milliseconds analytics_ttl{30000};
  std::chrono::milliseconds suggestions_ttl{10000};
  std::string probe_host = "github.com";
  spdlog::level::level_enum log_level = spdlog::level::info;
  std::optional<bool> assume; // --yes / --no

  // Defaults overridden by GITAUTO_* variables; malformed values are logged
  // and ignored.
  static Config from_env();

  std::optional<std::chrono::milliseconds> timeout_opt() const {
    if (timeout.count() <= 0)
      return std::nullopt;
    return timeout;
  }

  // "<git_bin> <args>"
  std::string git(const std::string &args) const { return git_bin + " " + args; }
  std::string gh(const std::string &args) const { return gh_bin + " " + args; }
};

} // namespace gitauto
