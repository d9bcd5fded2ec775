#pragma once
#include "process.hpp"
#include "thread_pool.hpp"

#include <string>
#include <vector>

namespace gitauto {

struct Invocation {
  std::string command;
  ExecOptions options;
};

class Dispatcher {
public:
  Dispatcher(Executor &exec, unsigned workers);

  // Outcome i always belongs to command i, whatever the completion order.
  std::vector<CommandOutcome> run_parallel(const std::vector<std::string> &commands,
                                           const ExecOptions &opts = {});
  std::vector<CommandOutcome>
  run_parallel(const std::vector<Invocation> &invocations);

  // One invocation of "c1 && c2 && ...": stops at the first failure.
  CommandOutcome run_batched(const std::vector<std::string> &commands,
                             const ExecOptions &opts = {});

  static std::string join_batch(const std::vector<std::string> &commands);

private:
  Executor &exec_;
  ThreadPool pool_;
};

} // namespace gitauto
