#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace gitauto {

struct CommandOutcome {
  bool succeeded{false};
  std::string standard_output;
  std::string diagnostic_text;
  int exit_code{0};
  bool timed_out{false};
};

enum class Stdio { Silent, Inherit };

struct ExecOptions {
  std::filesystem::path working_dir; // empty = current directory
  Stdio stdio = Stdio::Silent;
  bool capture_output = true;
  bool ignore_start_errors = false;
  std::optional<std::chrono::milliseconds> timeout; // none = wait forever
};

// The process could not be started at all (as opposed to "started and failed").
class ExecError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class Executor {
public:
  virtual ~Executor() = default;
  virtual CommandOutcome run(const std::string &command,
                             const ExecOptions &opts) = 0;

  CommandOutcome run(const std::string &command) {
    return run(command, ExecOptions{});
  }
};

// Runs commands through /bin/sh -c in a fresh process group.
class ProcessExecutor : public Executor {
public:
  using Executor::run;
  CommandOutcome run(const std::string &command,
                     const ExecOptions &opts) override;
};

// Wraps s in double quotes, escaping the characters sh expands inside them.
std::string quote_double(const std::string &s);

// Wraps s in single quotes.
std::string shell_quote(const std::string &s);

std::string trim(const std::string &s);

} // namespace gitauto
