#include "ops_internal.hpp"

#include <spdlog/spdlog.h>

namespace gitauto {

using namespace detail;

static OperationResult cancelled(std::string message) {
  OperationResult r = failed(std::move(message));
  r.flags.cancelled_by_caller = true;
  return r;
}

// Remote is ahead: pull, retry once, then offer a lease-protected force push.
static OperationResult negotiate_non_fast_forward(Context &ctx,
                                                  const StepResult &rejected) {
  Prompter &ask = ctx.prompter();
  if (!ask.confirm("Would you like to automatically resolve this by pulling "
                   "changes first?",
                   true)) {
    spdlog::info("[push] automatic resolution declined");
    OperationResult r = failed("Failed to push changes", rejected);
    r.flags.cancelled_by_caller = true;
    r.flags.requires_force_push = true;
    return r;
  }

  spdlog::info("[push] pulling remote changes before retrying");
  OperationResult pulled = pull(ctx);
  if (!pulled.succeeded) {
    OperationResult r = failed(pulled.flags.conflicts_detected
                                   ? "Conflicts detected during pull"
                                   : "Failed to pull changes");
    r.diagnostic = pulled.diagnostic;
    r.kind = pulled.flags.conflicts_detected ? ErrorKind::MergeConflict
                                             : pulled.kind;
    r.flags.conflicts_detected = pulled.flags.conflicts_detected;
    return r;
  }

  auto retry = ctx.executor().run(ctx.git("push"), ctx.exec_options());
  if (retry.succeeded)
    return ok("Changes pushed successfully after pulling remote changes");

  spdlog::warn("[push] still rejected after pull: {}", trim(retry.diagnostic_text));
  if (!ask.confirm("Would you like to force push? (This will overwrite remote "
                   "history!)",
                   false)) {
    OperationResult r = cancelled(
        "Push cancelled by user after conflict resolution attempt");
    r.flags.requires_force_push = true;
    r.diagnostic = retry.diagnostic_text;
    r.kind = ctx.classifier().classify(failure_text(retry));
    return r;
  }

  spdlog::warn("[push] force pushing with lease in {}", ctx.working_dir().string());
  auto forced = ctx.executor().run(ctx.git("push --force-with-lease"),
                                   ctx.exec_options());
  if (!forced.succeeded) {
    OperationResult r = failed("Force push failed");
    r.diagnostic = forced.diagnostic_text;
    r.kind = ctx.classifier().classify(failure_text(forced));
    return r;
  }
  return ok("Changes force-pushed successfully");
}

OperationResult push(Context &ctx, const std::string &message) {
  ScopedTimer timer(ctx.perf(), "push");
  if (!ctx.is_repository())
    return not_a_repository();

  auto added = run_step(ctx, ctx.git("add ."));
  if (!added.outcome.succeeded) {
    spdlog::error("[push] add failed: {}", trim(added.outcome.diagnostic_text));
    if (!ctx.prompter().confirm("Do you want to continue with commit and push? "
                                "(Not recommended if add failed)",
                                false))
      return cancelled("Push cancelled by user");
    spdlog::warn("[push] continuing although add failed");
  }

  auto status = run_step(ctx, ctx.git("status --porcelain"));
  if (!status.outcome.succeeded)
    return failed("Failed to check repository status", status);
  if (trim(status.outcome.standard_output).empty())
    return ok("No changes to commit");

  auto committed = run_step(ctx, ctx.git("commit -m " + quote_double(message)));
  if (!committed.outcome.succeeded) {
    if (committed.kind == ErrorKind::NothingToCommit)
      return ok("No changes to commit");
    spdlog::error("[push] commit failed: {}",
                  trim(committed.outcome.diagnostic_text));
    if (!ctx.prompter().confirm("Do you want to continue with push operation? "
                                "(Not recommended if commit failed)",
                                false))
      return cancelled("Push cancelled by user");
    spdlog::warn("[push] continuing although commit failed");
  }
  ctx.cache().clear();

  auto pushed = run_step(ctx, ctx.git("push"));
  if (pushed.outcome.succeeded)
    return ok("Changes pushed successfully");

  if (pushed.kind == ErrorKind::NonFastForward) {
    spdlog::warn("[push] rejected: remote contains work not present locally");
    auto r = negotiate_non_fast_forward(ctx, pushed);
    if (r.succeeded)
      ctx.cache().clear();
    return r;
  }
  return failed("Failed to push changes", pushed);
}

} // namespace gitauto
