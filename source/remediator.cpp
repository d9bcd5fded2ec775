#include <gitauto/remediator.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <system_error>

namespace fs = std::filesystem;

namespace gitauto {

RemediationPolicy policy_for(ErrorKind k) {
  switch (k) {
  case ErrorKind::MergeConflict:
  case ErrorKind::AuthenticationFailed:
    return RemediationPolicy::Confirm;
  case ErrorKind::NonFastForward:
    return RemediationPolicy::Negotiated;
  case ErrorKind::NothingToCommit:
  case ErrorKind::Unclassified:
    return RemediationPolicy::None;
  default:
    return RemediationPolicy::Automatic;
  }
}

static RemediationAttempt done(ErrorKind k, bool applied, bool ok,
                               std::string detail) {
  return RemediationAttempt{k, applied, ok, std::move(detail)};
}

static const char *kLargeFileTypes[] = {"*.psd", "*.ai",  "*.sketch", "*.zip",
                                        "*.rar", "*.mp4", "*.mov"};

RemediationAttempt Remediator::remediate(ErrorKind kind,
                                         const RemediationContext &ctx) {
  spdlog::debug("[remediate] {} in {}", to_string(kind),
                ctx.working_dir.string());
  RemediationAttempt a;
  switch (kind) {
  case ErrorKind::IndexLocked: a = remove_index_lock(ctx); break;
  case ErrorKind::NotARepository: a = init_repository(ctx); break;
  case ErrorKind::PermissionDenied: a = fix_permissions(ctx); break;
  case ErrorKind::LargeFile: a = track_large_files(ctx); break;
  case ErrorKind::CorruptedIndex: a = rebuild_index(ctx); break;
  case ErrorKind::MergeConflict: a = stash_changes(ctx); break;
  case ErrorKind::BranchConfigMissing: a = set_upstream(ctx); break;
  case ErrorKind::AuthenticationFailed: a = refresh_auth(ctx); break;
  case ErrorKind::NetworkUnreachable: a = probe_network(ctx); break;
  case ErrorKind::IdentityNotConfigured: a = configure_identity(ctx); break;
  case ErrorKind::RemoteNotConfigured: a = check_remote(ctx); break;
  case ErrorKind::DiskSpaceExhausted: a = collect_garbage(ctx); break;
  case ErrorKind::NothingToCommit:
    a = done(kind, false, true, "nothing to commit");
    break;
  case ErrorKind::NonFastForward:
    a = done(kind, false, false, "requires negotiated recovery");
    break;
  case ErrorKind::Unclassified:
    a = done(kind, false, false, "no automatic fix available");
    break;
  }
  if (a.applied && a.succeeded)
    spdlog::info("[remediate] {}: {}", to_string(kind), a.detail);
  else if (!a.succeeded)
    spdlog::warn("[remediate] {} not fixed: {}", to_string(kind), a.detail);
  else
    spdlog::debug("[remediate] {}: {}", to_string(kind), a.detail);
  return a;
}

CommandOutcome Remediator::run(const std::string &cmd,
                               const RemediationContext &ctx) {
  ExecOptions o;
  o.working_dir = ctx.working_dir;
  o.timeout = cfg_.timeout_opt();
  return exec_.run(cmd, o);
}

fs::path Remediator::lock_path(const RemediationContext &ctx) {
  const fs::path fallback = ctx.working_dir / ".git" / "index.lock";
  const std::string &d = ctx.diagnostic;
  auto at = d.find("index.lock");
  if (at == std::string::npos)
    return fallback;
  auto open = d.rfind('\'', at);
  auto close = d.find('\'', at);
  if (open == std::string::npos || close == std::string::npos)
    return fallback;
  fs::path p = d.substr(open + 1, close - open - 1);
  // never delete anything that is not an index lock
  if (p.filename() != "index.lock")
    return fallback;
  if (p.is_relative())
    p = ctx.working_dir / p;
  return p;
}

RemediationAttempt Remediator::remove_index_lock(const RemediationContext &ctx) {
  const auto k = ErrorKind::IndexLocked;
  const fs::path p = lock_path(ctx);
  std::error_code ec;
  if (!fs::exists(p, ec))
    return done(k, false, true, fmt::format("no lock at {}", p.string()));
  if (!fs::remove(p, ec) || ec)
    return done(k, true, false,
                fmt::format("cannot remove {}: {}", p.string(), ec.message()));
  return done(k, true, true, fmt::format("removed stale {}", p.string()));
}

RemediationAttempt Remediator::init_repository(const RemediationContext &ctx) {
  auto r = run(cfg_.git("init"), ctx);
  if (!r.succeeded)
    return done(ErrorKind::NotARepository, true, false, r.diagnostic_text);
  return done(ErrorKind::NotARepository, true, true, "initialized repository");
}

RemediationAttempt Remediator::fix_permissions(const RemediationContext &ctx) {
  const auto k = ErrorKind::PermissionDenied;
  const fs::path git_dir = ctx.working_dir / ".git";
  std::error_code ec;
  if (!fs::is_directory(git_dir, ec))
    return done(k, false, true, "no .git directory to fix");

  std::size_t failed = 0;
  fs::permissions(git_dir, fs::perms::owner_all, fs::perm_options::add, ec);
  if (ec)
    ++failed;
  for (auto it = fs::recursive_directory_iterator(git_dir, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code pec;
    auto add = it->is_directory(pec) ? fs::perms::owner_all
                                     : fs::perms::owner_read | fs::perms::owner_write;
    if (it->is_symlink(pec))
      continue;
    fs::permissions(it->path(), add, fs::perm_options::add, pec);
    if (pec)
      ++failed;
  }
  if (ec)
    return done(k, true, false,
                fmt::format("cannot walk {}: {}", git_dir.string(), ec.message()));
  if (failed)
    return done(k, true, false,
                fmt::format("{} entries under .git kept their permissions", failed));
  return done(k, true, true, "added owner write permission under .git");
}

RemediationAttempt Remediator::track_large_files(const RemediationContext &ctx) {
  const auto k = ErrorKind::LargeFile;
  if (!run(cfg_.git("lfs version"), ctx).succeeded)
    return done(k, false, true,
                "Git LFS is not installed; install it from https://git-lfs.com "
                "to store large files");
  for (const char *pattern : kLargeFileTypes) {
    auto r = run(cfg_.git("lfs track " + quote_double(pattern)), ctx);
    if (!r.succeeded)
      return done(k, true, false, r.diagnostic_text);
  }
  return done(k, true, true,
              "Git LFS tracking configured for common large file types");
}

RemediationAttempt Remediator::rebuild_index(const RemediationContext &ctx) {
  const auto k = ErrorKind::CorruptedIndex;
  std::error_code ec;
  fs::remove(ctx.working_dir / ".git" / "index", ec);
  if (ec)
    return done(k, true, false, fmt::format("cannot remove index: {}", ec.message()));
  auto r = run(cfg_.git("reset"), ctx);
  if (!r.succeeded)
    return done(k, true, false, r.diagnostic_text);
  return done(k, true, true, "index rebuilt");
}

RemediationAttempt Remediator::stash_changes(const RemediationContext &ctx) {
  auto r = run(cfg_.git("stash"), ctx);
  if (!r.succeeded)
    return done(ErrorKind::MergeConflict, true, false, r.diagnostic_text);
  return done(ErrorKind::MergeConflict, true, true, "local changes stashed");
}

RemediationAttempt Remediator::set_upstream(const RemediationContext &ctx) {
  const auto k = ErrorKind::BranchConfigMissing;
  auto cur = run(cfg_.git("branch --show-current"), ctx);
  const std::string branch = trim(cur.standard_output);
  if (!cur.succeeded || branch.empty())
    return done(k, false, false, "no current branch (detached HEAD?)");

  auto r = run(cfg_.git(fmt::format("branch --set-upstream-to=origin/{} {}",
                                    branch, branch)),
               ctx);
  if (r.succeeded)
    return done(k, true, true, fmt::format("tracking origin/{}", branch));

  r = run(cfg_.git("push --set-upstream origin " + branch), ctx);
  if (!r.succeeded)
    return done(k, true, false, r.diagnostic_text);
  return done(k, true, true,
              fmt::format("pushed {} and set upstream to origin/{}", branch, branch));
}

RemediationAttempt Remediator::refresh_auth(const RemediationContext &ctx) {
  const auto k = ErrorKind::AuthenticationFailed;
  if (run(cfg_.gh("auth status"), ctx).succeeded) {
    // logged in but git does not use the gh session yet
    auto r = run(cfg_.gh("auth setup-git"), ctx);
    if (r.succeeded)
      return done(k, true, true, "git configured to use GitHub CLI credentials");
  }
  if (run(cfg_.gh("auth refresh"), ctx).succeeded)
    return done(k, true, true, "GitHub CLI session refreshed");
  if (!credentials_)
    return done(k, false, false, "not authenticated; run gh auth login");
  auto creds = credentials_->interactive_login();
  if (!creds)
    return done(k, true, false, "login was not completed");
  return done(k, true, true, fmt::format("logged in as {}", creds->username));
}

RemediationAttempt Remediator::probe_network(const RemediationContext &ctx) {
  const auto k = ErrorKind::NetworkUnreachable;
  auto r = run("ping -c 1 " + shell_quote(cfg_.probe_host), ctx);
  if (r.succeeded)
    return done(k, false, true,
                fmt::format("{} is reachable; the remote host may be down",
                            cfg_.probe_host));
  return done(k, false, false,
              fmt::format("{} is unreachable; check your connection",
                          cfg_.probe_host));
}

RemediationAttempt Remediator::configure_identity(const RemediationContext &ctx) {
  const auto k = ErrorKind::IdentityNotConfigured;
  bool applied = false;
  for (const char *key : {"user.name", "user.email"}) {
    auto cur = run(cfg_.git(fmt::format("config {}", key)), ctx);
    if (cur.succeeded && !trim(cur.standard_output).empty())
      continue;
    std::string value = prompter_.ask(fmt::format("Enter your git {}", key));
    if (value.empty())
      return done(k, applied, false, fmt::format("{} is not configured", key));
    auto set = run(cfg_.git(fmt::format("config --global {} {}", key,
                                        quote_double(value))),
                   ctx);
    if (!set.succeeded)
      return done(k, true, false, set.diagnostic_text);
    applied = true;
  }
  if (!applied)
    return done(k, false, true, "identity already configured");
  return done(k, true, true, "git identity configured");
}

RemediationAttempt Remediator::check_remote(const RemediationContext &ctx) {
  const auto k = ErrorKind::RemoteNotConfigured;
  auto r = run(cfg_.git("remote -v"), ctx);
  if (!r.succeeded || trim(r.standard_output).empty())
    return done(k, false, false,
                "no remote configured; add one with git remote add origin <url>");
  return done(k, false, true,
              "remote is configured; check the URL and your access to it");
}

RemediationAttempt Remediator::collect_garbage(const RemediationContext &ctx) {
  auto r = run(cfg_.git("gc --prune=now"), ctx);
  if (!r.succeeded)
    return done(ErrorKind::DiskSpaceExhausted, true, false, r.diagnostic_text);
  return done(ErrorKind::DiskSpaceExhausted, true, true,
              "repository garbage collected");
}

} // namespace gitauto
