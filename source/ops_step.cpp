#include "ops_internal.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace gitauto {

namespace detail {

OperationResult ok(std::string message) {
  OperationResult r;
  r.succeeded = true;
  r.message = std::move(message);
  return r;
}

OperationResult failed(std::string message) {
  OperationResult r;
  r.message = std::move(message);
  return r;
}

OperationResult failed(std::string message, const StepResult &step) {
  OperationResult r = failed(std::move(message));
  if (!step.outcome.diagnostic_text.empty())
    r.diagnostic = step.outcome.diagnostic_text;
  r.kind = step.kind;
  return r;
}

OperationResult not_a_repository() {
  OperationResult r = failed(kNotARepository);
  r.kind = ErrorKind::NotARepository;
  return r;
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    auto nl = text.find('\n', pos);
    if (nl == std::string::npos)
      nl = text.size();
    std::string line = text.substr(pos, nl - pos);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' '))
      line.pop_back();
    if (!line.empty())
      out.push_back(std::move(line));
    pos = nl + 1;
  }
  return out;
}

} // namespace detail

std::string failure_text(const CommandOutcome &o) {
  if (o.standard_output.empty() || o.diagnostic_text == o.standard_output)
    return o.diagnostic_text;
  return o.diagnostic_text + "\n" + o.standard_output;
}

static const char *confirm_question(ErrorKind k) {
  switch (k) {
  case ErrorKind::MergeConflict:
    return "Local changes block this operation. Stash them and try again?";
  case ErrorKind::AuthenticationFailed:
    return "Authentication failed. Try to re-authenticate with GitHub CLI?";
  default:
    return "Try to fix this automatically?";
  }
}

static bool confirm_default(ErrorKind k) {
  return k != ErrorKind::MergeConflict;
}

StepResult recover_step(Context &ctx, const std::string &cmd,
                        const ExecOptions &opts, CommandOutcome first) {
  StepResult s;
  s.outcome = std::move(first);
  if (s.outcome.succeeded)
    return s;

  const ErrorKind kind = ctx.classifier().classify(failure_text(s.outcome));
  s.kind = kind;
  spdlog::debug("[step] '{}' failed as {}", cmd, to_string(kind));

  const RemediationPolicy policy = policy_for(kind);
  if (policy == RemediationPolicy::None ||
      policy == RemediationPolicy::Negotiated)
    return s;
  if (policy == RemediationPolicy::Confirm &&
      !ctx.prompter().confirm(confirm_question(kind), confirm_default(kind))) {
    spdlog::info("[step] {} fix declined", to_string(kind));
    return s;
  }

  RemediationContext rc{opts.working_dir.empty() ? ctx.working_dir()
                                                 : opts.working_dir,
                        s.outcome.diagnostic_text};
  s.remediation = ctx.remediator().remediate(kind, rc);
  if (!(s.remediation->applied && s.remediation->succeeded))
    return s;

  spdlog::info("[step] retrying after fix: {}", cmd);
  s.outcome = ctx.executor().run(cmd, opts);
  if (s.outcome.succeeded)
    s.kind.reset();
  else
    s.kind = ctx.classifier().classify(failure_text(s.outcome));
  return s;
}

StepResult run_step(Context &ctx, const std::string &cmd,
                    const ExecOptions &opts) {
  return recover_step(ctx, cmd, opts, ctx.executor().run(cmd, opts));
}

StepResult run_step(Context &ctx, const std::string &cmd) {
  return run_step(ctx, cmd, ctx.exec_options());
}

} // namespace gitauto
