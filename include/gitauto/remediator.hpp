#pragma once
#include "classifier.hpp"
#include "collaborators.hpp"
#include "config.hpp"
#include "process.hpp"
#include "prompt.hpp"

#include <filesystem>
#include <string>

namespace gitauto {

enum class RemediationPolicy {
  None,       // surface immediately
  Automatic,  // fix silently, retry once
  Confirm,    // ask the caller before fixing
  Negotiated, // multi-step protocol owned by the push workflow
};

RemediationPolicy policy_for(ErrorKind k);

struct RemediationContext {
  std::filesystem::path working_dir;
  std::string diagnostic;
};

// applied == false && succeeded == true means there was nothing to fix.
struct RemediationAttempt {
  ErrorKind kind{ErrorKind::Unclassified};
  bool applied{false};
  bool succeeded{false};
  std::string detail;
};

class Remediator {
public:
  Remediator(Executor &exec, Prompter &prompter, const Config &cfg,
             CredentialProvider *credentials = nullptr)
      : exec_(exec), prompter_(prompter), cfg_(cfg), credentials_(credentials) {}

  RemediationAttempt remediate(ErrorKind kind, const RemediationContext &ctx);

  void set_credential_provider(CredentialProvider *p) { credentials_ = p; }

  // Lock path named in "Unable to create '<path>': File exists", or
  // <working_dir>/.git/index.lock when the text names none.
  static std::filesystem::path lock_path(const RemediationContext &ctx);

private:
  CommandOutcome run(const std::string &cmd, const RemediationContext &ctx);

  RemediationAttempt remove_index_lock(const RemediationContext &ctx);
  RemediationAttempt init_repository(const RemediationContext &ctx);
  RemediationAttempt fix_permissions(const RemediationContext &ctx);
  RemediationAttempt track_large_files(const RemediationContext &ctx);
  RemediationAttempt rebuild_index(const RemediationContext &ctx);
  RemediationAttempt stash_changes(const RemediationContext &ctx);
  RemediationAttempt set_upstream(const RemediationContext &ctx);
  RemediationAttempt refresh_auth(const RemediationContext &ctx);
  RemediationAttempt probe_network(const RemediationContext &ctx);
  RemediationAttempt configure_identity(const RemediationContext &ctx);
  RemediationAttempt check_remote(const RemediationContext &ctx);
  RemediationAttempt collect_garbage(const RemediationContext &ctx);

  Executor &exec_;
  Prompter &prompter_;
  const Config &cfg_;
  CredentialProvider *credentials_;
};

} // namespace gitauto
