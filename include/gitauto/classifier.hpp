#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace gitauto {

enum class ErrorKind {
  NotARepository,
  IndexLocked,
  PermissionDenied,
  LargeFile,
  CorruptedIndex,
  MergeConflict,
  BranchConfigMissing,
  AuthenticationFailed,
  NetworkUnreachable,
  IdentityNotConfigured,
  RemoteNotConfigured,
  DiskSpaceExhausted,
  NonFastForward,
  NothingToCommit,
  Unclassified,
};

const char *to_string(ErrorKind k);
// Short label used as the message of a failed operation.
const char *title(ErrorKind k);
// Manual troubleshooting steps shown next to a surfaced failure.
std::vector<std::string> fix_hints(ErrorKind k);

// Matches when every substring in all_of occurs in the lower-cased text.
struct Rule {
  ErrorKind kind;
  std::vector<std::string> all_of;
  bool catch_all = false;
};

class ErrorClassifier {
public:
  ErrorClassifier();
  explicit ErrorClassifier(std::vector<Rule> rules);

  ErrorKind classify(std::string_view diagnostic) const;

  // Inserted ahead of the first catch-all row so broad rows never shadow it.
  void add_rule(Rule r);

  const std::vector<Rule> &rules() const { return rules_; }

  static std::vector<Rule> default_rules();

private:
  std::vector<Rule> rules_;
};

// "CONFLICT (content): ..." or "Automatic merge failed" in pull output.
bool has_content_conflict(std::string_view text);

} // namespace gitauto
