#pragma once
#include "classifier.hpp"
#include "collaborators.hpp"
#include "context.hpp"
#include "remediator.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitauto {

struct ResultFlags {
  bool conflicts_detected{false};
  bool requires_force_push{false};
  bool cancelled_by_caller{false};
};

struct OperationResult {
  bool succeeded{false};
  std::string message;
  std::optional<std::string> diagnostic;
  ResultFlags flags;
  std::optional<ErrorKind> kind;
  std::string output; // report text of read-only handlers
};

// One command after at most one remediation and retry.
struct StepResult {
  CommandOutcome outcome;
  std::optional<ErrorKind> kind; // set while outcome failed
  std::optional<RemediationAttempt> remediation;
};

// Runs cmd; on failure classifies it and, if the kind allows it, remediates
// (asking first for Confirm kinds) and re-runs cmd once.
StepResult run_step(Context &ctx, const std::string &cmd);
StepResult run_step(Context &ctx, const std::string &cmd, const ExecOptions &opts);
// Same recovery for a failure the caller already ran and inspected.
StepResult recover_step(Context &ctx, const std::string &cmd,
                        const ExecOptions &opts, CommandOutcome first);

// Stderr and stdout joined; what the classifier looks at.
std::string failure_text(const CommandOutcome &o);

OperationResult stage(Context &ctx);
OperationResult commit(Context &ctx, const std::string &message = "Auto commit");
OperationResult push(Context &ctx, const std::string &message = "Auto commit");
OperationResult pull(Context &ctx);

bool valid_branch_name(const std::string &name);
OperationResult create_branch(Context &ctx, const std::string &name);
OperationResult switch_branch(Context &ctx, const std::string &name);
OperationResult list_branches(Context &ctx);

struct StatusReport {
  std::string branch;
  std::string commit; // 7 chars or "unknown"
  std::size_t uncommitted_changes{0};
  std::string detailed_status;
};

std::optional<StatusReport> collect_status(Context &ctx);
OperationResult show_status(Context &ctx);

enum class HistoryFormat { Oneline, Full, Graph };
std::optional<HistoryFormat> parse_history_format(const std::string &s);
OperationResult show_history(Context &ctx, HistoryFormat format = HistoryFormat::Oneline,
                             int limit = 10);

OperationResult clone(Context &ctx, const std::string &url,
                      const std::optional<std::string> &dir = std::nullopt);
// Clones every url in parallel, into dirs[i] when dirs is non-empty (it must
// then match urls in size, otherwise std::invalid_argument). One result per
// url, in input order.
std::vector<OperationResult> clone_many(Context &ctx,
                                        const std::vector<std::string> &urls,
                                        const std::vector<std::string> &dirs = {});
OperationResult auto_clone(Context &ctx, const std::string &name,
                           const std::string &url);
OperationResult clone_by_name(Context &ctx, const std::string &name,
                              HostingClient &hosting);
OperationResult delete_local(Context &ctx, const std::string &name);
OperationResult delete_repository(Context &ctx, const std::string &name,
                                  HostingClient &hosting);

struct BatchRepoResult {
  std::filesystem::path repo_path;
  bool succeeded{false};
  std::string output;
  std::string error;
};

// op is one of status, pull, push, fetch; anything else throws
// std::invalid_argument.
std::vector<BatchRepoResult>
batch_process(Context &ctx, const std::vector<std::filesystem::path> &paths,
              const std::string &op);

struct RepoAnalytics {
  std::size_t commit_count{0};
  std::size_t branch_count{0};
  std::size_t file_count{0};
  std::size_t contributor_count{0};
};

std::optional<RepoAnalytics> analytics(Context &ctx);

struct Suggestion {
  std::string type;
  std::string message;
  int priority{0};
};

std::vector<Suggestion> suggestions(Context &ctx);

struct IdentityStatus {
  std::string name;
  std::string email;
  bool configured() const { return !name.empty() && !email.empty(); }
};

IdentityStatus check_identity(Context &ctx);

} // namespace gitauto
