#include "ops_internal.hpp"

#include <spdlog/spdlog.h>

namespace gitauto {

using namespace detail;

OperationResult pull(Context &ctx) {
  ScopedTimer timer(ctx.perf(), "pull");
  if (!ctx.is_repository())
    return not_a_repository();

  const std::string cmd = ctx.git("pull");
  const ExecOptions opts = ctx.exec_options();
  auto first = ctx.executor().run(cmd, opts);

  // content conflicts are left for the user; stashing would lose the merge
  if (!first.succeeded && has_content_conflict(failure_text(first))) {
    spdlog::warn("[pull] merge stopped with conflicts in {}",
                 ctx.working_dir().string());
    OperationResult r = failed("Conflicts detected");
    r.diagnostic = failure_text(first);
    r.kind = ErrorKind::MergeConflict;
    r.flags.conflicts_detected = true;
    return r;
  }

  auto s = recover_step(ctx, cmd, opts, std::move(first));
  if (s.outcome.succeeded) {
    ctx.cache().clear();
    OperationResult r = ok("Pulled latest changes");
    r.output = s.outcome.standard_output;
    return r;
  }
  if (has_content_conflict(failure_text(s.outcome))) {
    OperationResult r = failed("Conflicts detected", s);
    r.kind = ErrorKind::MergeConflict;
    r.flags.conflicts_detected = true;
    return r;
  }
  const ErrorKind kind = s.kind.value_or(ErrorKind::Unclassified);
  return failed(kind == ErrorKind::Unclassified ? "Failed to pull changes"
                                                : title(kind),
                s);
}

} // namespace gitauto
