#pragma once
#include "cache.hpp"
#include "classifier.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "perf.hpp"
#include "process.hpp"
#include "prompt.hpp"
#include "remediator.hpp"

#include <filesystem>

namespace gitauto {

// Everything a handler needs for one working directory. The process CWD is
// never changed; handlers pass working_dir() to every invocation.
class Context {
public:
  Context(Config cfg, Executor &exec, Prompter &prompter,
          CredentialProvider *credentials = nullptr);

  Context(const Context &) = delete;
  Context &operator=(const Context &) = delete;

  const Config &config() const { return cfg_; }
  const std::filesystem::path &working_dir() const { return working_dir_; }

  Executor &executor() { return exec_; }
  Prompter &prompter() { return prompter_; }
  ResultCache &cache() { return cache_; }
  PerfRecorder &perf() { return perf_; }
  Dispatcher &dispatcher() { return dispatcher_; }
  ErrorClassifier &classifier() { return classifier_; }
  Remediator &remediator() { return remediator_; }

  ExecOptions exec_options() const { return exec_options(working_dir_); }
  ExecOptions exec_options(const std::filesystem::path &dir) const;

  // "<git_bin> <args>"
  std::string git(const std::string &args) const { return cfg_.git(args); }

  bool is_repository() const { return is_repository(working_dir_); }
  static bool is_repository(const std::filesystem::path &dir);

private:
  Config cfg_;
  std::filesystem::path working_dir_;
  Executor &exec_;
  Prompter &prompter_;
  ResultCache cache_;
  PerfRecorder perf_;
  Dispatcher dispatcher_;
  ErrorClassifier classifier_;
  Remediator remediator_;
};

} // namespace gitauto
