#include <gitauto/dispatcher.hpp>

#include <spdlog/spdlog.h>

#include <future>
#include <memory>

namespace gitauto {

Dispatcher::Dispatcher(Executor &exec, unsigned workers)
    : exec_(exec), pool_(workers) {}

std::vector<CommandOutcome>
Dispatcher::run_parallel(const std::vector<std::string> &commands,
                         const ExecOptions &opts) {
  std::vector<Invocation> inv;
  inv.reserve(commands.size());
  for (const auto &c : commands)
    inv.push_back(Invocation{c, opts});
  return run_parallel(inv);
}

std::vector<CommandOutcome>
Dispatcher::run_parallel(const std::vector<Invocation> &invocations) {
  spdlog::debug("[dispatch] parallel x{} on {} workers", invocations.size(),
                pool_.size());
  std::vector<std::future<CommandOutcome>> futures;
  futures.reserve(invocations.size());
  for (const auto &inv : invocations) {
    auto task = std::make_shared<std::packaged_task<CommandOutcome()>>(
        [this, inv] { return exec_.run(inv.command, inv.options); });
    futures.push_back(task->get_future());
    pool_.submit([task] { (*task)(); });
  }

  // join on everything before a start failure is allowed to propagate
  for (auto &f : futures)
    f.wait();

  std::vector<CommandOutcome> out;
  out.reserve(futures.size());
  for (auto &f : futures)
    out.push_back(f.get());
  return out;
}

std::string Dispatcher::join_batch(const std::vector<std::string> &commands) {
  std::string joined;
  for (size_t i = 0; i < commands.size(); ++i) {
    if (i)
      joined += " && ";
    joined += commands[i];
  }
  return joined;
}

CommandOutcome Dispatcher::run_batched(const std::vector<std::string> &commands,
                                       const ExecOptions &opts) {
  if (commands.empty()) {
    CommandOutcome empty{};
    empty.succeeded = true;
    return empty;
  }
  spdlog::debug("[dispatch] batched x{}", commands.size());
  return exec_.run(join_batch(commands), opts);
}

} // namespace gitauto
