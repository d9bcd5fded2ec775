#include "ops_internal.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cstdlib>

namespace gitauto {

using namespace detail;

static std::size_t parse_count(const CommandOutcome &o) {
  if (!o.succeeded)
    return 0;
  return static_cast<std::size_t>(
      std::strtoull(trim(o.standard_output).c_str(), nullptr, 10));
}

static std::string branch_from_status(const std::string &status) {
  for (const auto &line : split_lines(status)) {
    if (line.rfind("On branch ", 0) == 0)
      return line.substr(10);
  }
  return "unknown";
}

std::optional<StatusReport> collect_status(Context &ctx) {
  if (!ctx.is_repository())
    return std::nullopt;

  auto out = ctx.dispatcher().run_parallel(
      std::vector<std::string>{ctx.git("status"),
                               ctx.git("branch --show-current"),
                               ctx.git("rev-parse HEAD"),
                               ctx.git("status --porcelain")},
      ctx.exec_options());
  if (!out[0].succeeded) {
    spdlog::error("[status] {}", trim(out[0].diagnostic_text));
    return std::nullopt;
  }

  StatusReport rep;
  rep.detailed_status = out[0].standard_output;
  rep.branch = trim(out[1].standard_output);
  if (!out[1].succeeded || rep.branch.empty())
    rep.branch = branch_from_status(rep.detailed_status);
  // rev-parse fails before the first commit
  const std::string head = trim(out[2].standard_output);
  rep.commit = out[2].succeeded && head.size() >= 7 ? head.substr(0, 7) : "unknown";
  rep.uncommitted_changes =
      out[3].succeeded ? split_lines(out[3].standard_output).size() : 0;
  return rep;
}

OperationResult show_status(Context &ctx) {
  ScopedTimer timer(ctx.perf(), "status");
  if (!ctx.is_repository())
    return not_a_repository();

  auto rep = collect_status(ctx);
  if (!rep) {
    auto o = ctx.executor().run(ctx.git("status"), ctx.exec_options());
    OperationResult r = failed("Failed to get repository status");
    r.diagnostic = o.diagnostic_text;
    r.kind = ctx.classifier().classify(failure_text(o));
    return r;
  }
  OperationResult r = ok("Repository Status");
  r.output = fmt::format("Current branch: {}\nLatest commit: {}\n"
                         "Uncommitted changes: {}\n",
                         rep->branch, rep->commit, rep->uncommitted_changes);
  if (!rep->detailed_status.empty())
    r.output += "\nDetailed status:\n" + rep->detailed_status;
  return r;
}

std::optional<HistoryFormat> parse_history_format(const std::string &s) {
  if (s == "oneline")
    return HistoryFormat::Oneline;
  if (s == "full")
    return HistoryFormat::Full;
  if (s == "graph")
    return HistoryFormat::Graph;
  return std::nullopt;
}

OperationResult show_history(Context &ctx, HistoryFormat format, int limit) {
  ScopedTimer timer(ctx.perf(), "history");
  if (limit <= 0)
    return failed(fmt::format("History limit must be positive, got {}", limit));
  if (!ctx.is_repository())
    return not_a_repository();

  std::string args;
  switch (format) {
  case HistoryFormat::Oneline:
    args = fmt::format("log --oneline -{}", limit);
    break;
  case HistoryFormat::Full:
    args = fmt::format("log --pretty=format:\"%h - %an, %ar : %s\" -{}", limit);
    break;
  case HistoryFormat::Graph:
    args = fmt::format("log --oneline --graph -{}", limit);
    break;
  }
  auto s = run_step(ctx, ctx.git(args));
  if (!s.outcome.succeeded)
    return failed("Failed to show commit history", s);
  OperationResult r = ok("Commit History");
  r.output = s.outcome.standard_output;
  return r;
}

std::optional<RepoAnalytics> analytics(Context &ctx) {
  ScopedTimer timer(ctx.perf(), "analytics");
  if (!ctx.is_repository())
    return std::nullopt;

  return ctx.cache().get_or_compute<RepoAnalytics>(
      cache_key("analytics", ctx.working_dir()), ctx.config().analytics_ttl,
      [&] {
        auto out = ctx.dispatcher().run_parallel(
            std::vector<std::string>{ctx.git("rev-list --count HEAD"),
                                     ctx.git("branch"), ctx.git("ls-files"),
                                     ctx.git("shortlog -sn HEAD")},
            ctx.exec_options());
        RepoAnalytics a;
        a.commit_count = parse_count(out[0]);
        a.branch_count = out[1].succeeded ? split_lines(out[1].standard_output).size() : 0;
        a.file_count = out[2].succeeded ? split_lines(out[2].standard_output).size() : 0;
        a.contributor_count =
            out[3].succeeded ? split_lines(out[3].standard_output).size() : 0;
        spdlog::debug("[analytics] commits={} branches={} files={} contributors={}",
                      a.commit_count, a.branch_count, a.file_count,
                      a.contributor_count);
        return a;
      });
}

std::vector<Suggestion> suggestions(Context &ctx) {
  ScopedTimer timer(ctx.perf(), "suggestions");
  if (!ctx.is_repository())
    return {};

  return ctx.cache().get_or_compute<std::vector<Suggestion>>(
      cache_key("suggestions", ctx.working_dir()), ctx.config().suggestions_ttl,
      [&] {
        auto out = ctx.dispatcher().run_parallel(
            std::vector<std::string>{ctx.git("status --porcelain"),
                                     ctx.git("rev-list --count @{u}..HEAD"),
                                     ctx.git("rev-list --count HEAD..@{u}")},
            ctx.exec_options());
        std::vector<Suggestion> v;
        if (out[0].succeeded && !trim(out[0].standard_output).empty())
          v.push_back({"commit",
                       "You have uncommitted changes. Consider committing them.", 1});
        if (!out[1].succeeded)
          spdlog::debug("[suggest] no upstream: {}", trim(out[1].diagnostic_text));
        if (auto ahead = parse_count(out[1]))
          v.push_back({"push",
                       fmt::format("Your branch is {} commit(s) ahead of remote. "
                                   "Consider pushing your changes.",
                                   ahead),
                       2});
        if (auto behind = parse_count(out[2]))
          v.push_back({"pull",
                       fmt::format("Your branch is {} commit(s) behind remote. "
                                   "Consider pulling the latest changes.",
                                   behind),
                       3});
        return v;
      });
}

IdentityStatus check_identity(Context &ctx) {
  auto out = ctx.dispatcher().run_parallel(
      std::vector<std::string>{ctx.git("config user.name"),
                               ctx.git("config user.email")},
      ctx.exec_options());
  IdentityStatus id;
  if (out[0].succeeded)
    id.name = trim(out[0].standard_output);
  if (out[1].succeeded)
    id.email = trim(out[1].standard_output);
  if (!id.configured())
    spdlog::warn("[identity] git user.name/user.email not configured");
  return id;
}

} // namespace gitauto
