#include <gitauto/classifier.hpp>

#include <algorithm>
#include <cctype>

namespace gitauto {

const char *to_string(ErrorKind k) {
  switch (k) {
  case ErrorKind::NotARepository: return "NotARepository";
  case ErrorKind::IndexLocked: return "IndexLocked";
  case ErrorKind::PermissionDenied: return "PermissionDenied";
  case ErrorKind::LargeFile: return "LargeFile";
  case ErrorKind::CorruptedIndex: return "CorruptedIndex";
  case ErrorKind::MergeConflict: return "MergeConflict";
  case ErrorKind::BranchConfigMissing: return "BranchConfigMissing";
  case ErrorKind::AuthenticationFailed: return "AuthenticationFailed";
  case ErrorKind::NetworkUnreachable: return "NetworkUnreachable";
  case ErrorKind::IdentityNotConfigured: return "IdentityNotConfigured";
  case ErrorKind::RemoteNotConfigured: return "RemoteNotConfigured";
  case ErrorKind::DiskSpaceExhausted: return "DiskSpaceExhausted";
  case ErrorKind::NonFastForward: return "NonFastForward";
  case ErrorKind::NothingToCommit: return "NothingToCommit";
  case ErrorKind::Unclassified: return "Unclassified";
  }
  return "Unclassified";
}

const char *title(ErrorKind k) {
  switch (k) {
  case ErrorKind::NotARepository: return "Not a Git repository";
  case ErrorKind::IndexLocked: return "Git index is locked";
  case ErrorKind::PermissionDenied: return "Permission denied";
  case ErrorKind::LargeFile: return "File too large";
  case ErrorKind::CorruptedIndex: return "Git index is corrupted";
  case ErrorKind::MergeConflict: return "Merge conflicts";
  case ErrorKind::BranchConfigMissing: return "Branch configuration issue";
  case ErrorKind::AuthenticationFailed: return "Authentication failed";
  case ErrorKind::NetworkUnreachable: return "Network connectivity issue";
  case ErrorKind::IdentityNotConfigured: return "Git identity not configured";
  case ErrorKind::RemoteNotConfigured: return "Repository not found";
  case ErrorKind::DiskSpaceExhausted: return "Disk space exhausted";
  case ErrorKind::NonFastForward: return "Non-fast-forward push rejected";
  case ErrorKind::NothingToCommit: return "Nothing to commit";
  case ErrorKind::Unclassified: return "Unrecognized error";
  }
  return "Unrecognized error";
}

std::vector<std::string> fix_hints(ErrorKind k) {
  switch (k) {
  case ErrorKind::NotARepository:
    return {"Navigate to your project directory: cd /path/to/your/project",
            "Or clone a repository: git clone <repository-url>",
            "Or initialize a new repository: git init"};
  case ErrorKind::IndexLocked:
    return {"Make sure no other git process is running",
            "Remove the stale lock: rm -f .git/index.lock"};
  case ErrorKind::PermissionDenied:
    return {"Check file ownership: ls -la .git",
            "Fix permissions: chmod -R u+w .git",
            "Verify you have write access to the repository"};
  case ErrorKind::LargeFile:
    return {"Remove large files from the index: git rm --cached <file>",
            "Track large files with Git LFS: git lfs track \"*.zip\"",
            "Add large files to .gitignore"};
  case ErrorKind::CorruptedIndex:
    return {"Remove the index: rm -f .git/index", "Rebuild it: git reset"};
  case ErrorKind::MergeConflict:
    return {"Edit the conflicted files and look for conflict markers "
            "(<<<<<<<, =======, >>>>>>>)",
            "After resolving conflicts, add the files with \"git add <file>\"",
            "Commit the resolved changes with \"git commit\"",
            "Push the changes with \"git push\""};
  case ErrorKind::BranchConfigMissing:
    return {"Set the upstream branch: git push --set-upstream origin <branch>",
            "Check remote branches: git branch -r"};
  case ErrorKind::AuthenticationFailed:
    return {"Check your authentication: gh auth status",
            "Re-authenticate if needed: gh auth login",
            "Check repository URL: git remote -v"};
  case ErrorKind::NetworkUnreachable:
    return {"Check your internet connection",
            "Verify the remote host is reachable: ping github.com",
            "Check proxy settings: git config --get http.proxy"};
  case ErrorKind::IdentityNotConfigured:
    return {"git config --global user.name \"Your Name\"",
            "git config --global user.email \"you@example.com\""};
  case ErrorKind::RemoteNotConfigured:
    return {"Check the configured remotes: git remote -v",
            "Add a remote: git remote add origin <repository-url>",
            "Verify the repository exists and you have access"};
  case ErrorKind::DiskSpaceExhausted:
    return {"Free up disk space: df -h",
            "Clean up the repository: git gc --prune=now"};
  case ErrorKind::NonFastForward:
    return {"Pull latest changes: git pull",
            "Resolve any conflicts if they occur",
            "Try pushing again: git push",
            "Force pushing rewrites history and can affect other collaborators"};
  case ErrorKind::NothingToCommit:
    return {"Make some changes to your files before committing",
            "Check status: git status"};
  case ErrorKind::Unclassified:
    return {"Run \"git status\" to inspect the repository state",
            "Check the error details above"};
  }
  return {};
}

std::vector<Rule> ErrorClassifier::default_rules() {
  using K = ErrorKind;
  // First match wins: specific signatures stay above broader ones.
  return {
      {K::NotARepository, {"not a git repository"}},
      {K::IndexLocked, {"unable to create", "index.lock"}},
      {K::IndexLocked, {"index.lock", "file exists"}},
      {K::CorruptedIndex, {"index file corrupt"}},
      {K::CorruptedIndex, {"bad index"}},
      {K::CorruptedIndex, {"index file smaller than expected"}},
      {K::DiskSpaceExhausted, {"no space left"}},
      {K::DiskSpaceExhausted, {"disk quota exceeded"}},
      {K::LargeFile, {"large files detected"}},
      {K::LargeFile, {"file size limit"}},
      {K::LargeFile, {"too big"}},
      {K::LargeFile, {"too many revisions"}},
      {K::IdentityNotConfigured, {"please tell me who you are"}},
      {K::IdentityNotConfigured, {"empty ident name"}},
      {K::IdentityNotConfigured, {"unable to auto-detect email address"}},
      {K::AuthenticationFailed, {"authentication failed"}},
      {K::AuthenticationFailed, {"invalid credentials"}},
      {K::AuthenticationFailed, {"invalid username or password"}},
      {K::AuthenticationFailed, {"could not read username"}},
      {K::AuthenticationFailed, {"permission denied (publickey"}},
      {K::PermissionDenied, {"permission denied"}},
      {K::PermissionDenied, {"operation not permitted"}},
      {K::PermissionDenied, {"insufficient permission"}},
      {K::PermissionDenied, {"permission to", "denied to"}},
      {K::NetworkUnreachable, {"could not resolve"}},
      {K::NetworkUnreachable, {"connection refused"}},
      {K::NetworkUnreachable, {"network is unreachable"}},
      {K::NetworkUnreachable, {"connection timed out"}},
      {K::NetworkUnreachable, {"operation timed out"}},
      {K::NetworkUnreachable, {"failed to connect"}},
      {K::RemoteNotConfigured, {"repository not found"}},
      {K::RemoteNotConfigured, {"does not appear to be a git repository"}},
      {K::RemoteNotConfigured, {"no configured push destination"}},
      {K::BranchConfigMissing, {"couldn't find remote ref"}},
      {K::BranchConfigMissing, {"your configuration specifies to merge with the ref"}},
      {K::BranchConfigMissing, {"has no upstream branch"}},
      {K::BranchConfigMissing, {"there is no tracking information"}},
      {K::NothingToCommit, {"nothing to commit"}},
      {K::NothingToCommit, {"no changes added to commit"}},
      {K::NonFastForward, {"updates were rejected"}},
      {K::NonFastForward, {"non-fast-forward"}},
      {K::NonFastForward, {"remote contains work that you do not have locally"}},
      {K::NonFastForward, {"tip of your current branch is behind"}},
      {K::NonFastForward, {"[rejected]", "fetch first"}},
      {K::MergeConflict, {"would be overwritten by merge"}},
      {K::MergeConflict, {"unmerged files"}},
      {K::MergeConflict, {"fix conflicts"}},
      {K::MergeConflict, {"conflict"}},
      {K::Unclassified, {"fatal:"}, true},
      {K::Unclassified, {"error:"}, true},
  };
}

ErrorClassifier::ErrorClassifier() : rules_(default_rules()) {}

ErrorClassifier::ErrorClassifier(std::vector<Rule> rules)
    : rules_(std::move(rules)) {}

static std::string lower(std::string_view s) {
  std::string o(s);
  std::transform(o.begin(), o.end(), o.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return o;
}

static bool matches(const Rule &r, const std::string &text) {
  if (r.all_of.empty())
    return false;
  for (const auto &needle : r.all_of)
    if (text.find(needle) == std::string::npos)
      return false;
  return true;
}

ErrorKind ErrorClassifier::classify(std::string_view diagnostic) const {
  const std::string text = lower(diagnostic);
  for (const auto &r : rules_) {
    if (matches(r, text))
      return r.kind;
  }
  return ErrorKind::Unclassified;
}

void ErrorClassifier::add_rule(Rule r) {
  for (auto &needle : r.all_of)
    needle = lower(needle);
  auto pos = std::find_if(rules_.begin(), rules_.end(),
                          [](const Rule &x) { return x.catch_all; });
  rules_.insert(r.catch_all ? rules_.end() : pos, std::move(r));
}

bool has_content_conflict(std::string_view text) {
  const std::string t = lower(text);
  return t.find("conflict (") != std::string::npos ||
         t.find("automatic merge failed") != std::string::npos;
}

} // namespace gitauto
