#include "ops_internal.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace fs = std::filesystem;

namespace gitauto {

using namespace detail;

static std::string batch_args(const std::string &op) {
  if (op == "status")
    return "status --porcelain";
  if (op == "pull" || op == "push" || op == "fetch")
    return op;
  throw std::invalid_argument(fmt::format(
      "Invalid operation: {}. Valid operations: status, pull, push, fetch", op));
}

std::vector<BatchRepoResult>
batch_process(Context &ctx, const std::vector<fs::path> &paths,
              const std::string &op) {
  ScopedTimer timer(ctx.perf(), "batch_" + op);
  const std::string cmd = ctx.git(batch_args(op));

  std::vector<BatchRepoResult> results(paths.size());
  std::vector<Invocation> work;
  std::vector<std::size_t> slot;
  for (std::size_t i = 0; i < paths.size(); ++i) {
    fs::path dir = paths[i].is_absolute() ? paths[i] : ctx.working_dir() / paths[i];
    results[i].repo_path = paths[i];
    if (!Context::is_repository(dir)) {
      results[i].error = "Not a git repository";
      continue;
    }
    auto opts = ctx.exec_options(dir);
    // a vanished directory should fail its own row, not the whole batch
    opts.ignore_start_errors = true;
    work.push_back(Invocation{cmd, opts});
    slot.push_back(i);
  }

  auto out = ctx.dispatcher().run_parallel(work);
  for (std::size_t k = 0; k < out.size(); ++k) {
    auto &r = results[slot[k]];
    r.succeeded = out[k].succeeded;
    r.output = out[k].standard_output;
    r.error = out[k].diagnostic_text;
    if (!r.succeeded)
      spdlog::warn("[batch] {} failed in {}", op, r.repo_path.string());
  }
  if (op != "status")
    ctx.cache().clear();
  return results;
}

} // namespace gitauto
