#include "ops_internal.hpp"

#include <spdlog/spdlog.h>

namespace gitauto {

using namespace detail;

OperationResult stage(Context &ctx) {
  ScopedTimer timer(ctx.perf(), "stage");
  if (!ctx.is_repository())
    return not_a_repository();

  spdlog::info("[stage] adding all changes in {}", ctx.working_dir().string());
  auto s = run_step(ctx, ctx.git("add ."));
  if (!s.outcome.succeeded)
    return failed("Failed to add files", s);
  ctx.cache().clear();
  return ok("Files added successfully");
}

OperationResult commit(Context &ctx, const std::string &message) {
  ScopedTimer timer(ctx.perf(), "commit");
  if (!ctx.is_repository())
    return not_a_repository();

  auto status = run_step(ctx, ctx.git("status --porcelain"));
  if (!status.outcome.succeeded)
    return failed("Failed to check repository status", status);
  if (trim(status.outcome.standard_output).empty())
    return ok("No changes to commit");

  auto s = run_step(ctx, ctx.git("commit -m " + quote_double(message)));
  if (!s.outcome.succeeded) {
    if (s.kind == ErrorKind::NothingToCommit)
      return ok("No changes to commit");
    return failed("Failed to commit changes", s);
  }
  ctx.cache().clear();
  return ok("Changes committed successfully");
}

} // namespace gitauto
