#include <gitauto/app.hpp>
#include <gitauto/classifier.hpp>
#include <gitauto/cli.hpp>
#include <gitauto/config.hpp>
#include <gitauto/context.hpp>
#include <gitauto/operations.hpp>
#include <gitauto/process.hpp>
#include <gitauto/prompt.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef GITAUTO_VERSION
#define GITAUTO_VERSION "0.0.0"
#endif
#ifndef GITAUTO_COMMIT
#define GITAUTO_COMMIT "unknown"
#endif
#ifndef GITAUTO_BUILD_TIME
#define GITAUTO_BUILD_TIME "unknown"
#endif

namespace fs = std::filesystem;

namespace gitauto {

static void print_help() {
  std::cout <<
      R"(gitauto - git workflow runner with error recovery

Usage:
  gitauto [--yes|--no] [--cwd DIR] [--timeout-ms N] [--verbose] <command>

Commands:
  push [-m MSG]                   add, commit and push (default message "Auto commit")
  add                             stage all changes
  commit [-m MSG]                 commit staged changes
  pull                            pull from the upstream branch
  branch create|switch <name>
  branches                        list local and remote branches
  status [--json]
  log [--format oneline|full|graph] [--limit N]
  clone <url> [dir] [--exit]
  clone-many <url>... [-- <dir>...]  clone several repositories in parallel
  delete <dir>                    remove a local clone
  batch <status|pull|push|fetch> <path>...
  analytics                       commit, branch, file and contributor counts
  suggest                         next steps for the current repository
  stats [--runs N]                time the read-only queries
  classify <text>                 show how an error message is classified
)";
}

static std::string json_escape(const std::string &s) {
  std::string o;
  o.reserve(s.size() + 2);
  for (char c : s) {
    switch (c) {
    case '"': o += "\\\""; break;
    case '\\': o += "\\\\"; break;
    case '\n': o += "\\n"; break;
    case '\r': o += "\\r"; break;
    case '\t': o += "\\t"; break;
    default:
      if (static_cast<unsigned char>(c) < 0x20)
        o += fmt::format("\\u{:04x}", static_cast<int>(c));
      else
        o.push_back(c);
    }
  }
  return o;
}

static void print_hints(ErrorKind kind) {
  auto hints = fix_hints(kind);
  if (hints.empty())
    return;
  std::cout << "\nHow to fix:\n";
  for (size_t i = 0; i < hints.size(); ++i)
    std::cout << fmt::format("{}. {}\n", i + 1, hints[i]);
}

static int report(const OperationResult &r) {
  if (!r.output.empty()) {
    std::cout << r.output;
    if (r.output.back() != '\n')
      std::cout << "\n";
  }
  if (r.succeeded) {
    std::cout << r.message << "\n";
    return 0;
  }
  std::cout << "Error: " << r.message << "\n";
  if (r.diagnostic && !r.diagnostic->empty())
    std::cout << "Error details: " << trim(*r.diagnostic) << "\n";
  if (r.kind)
    print_hints(*r.kind);
  return 1;
}

static bool git_available(Executor &exec, const Config &cfg) {
  ExecOptions o;
  o.ignore_start_errors = true;
  return exec.run(cfg.git("--version"), o).succeeded;
}

static bool needs_git(const Command &cmd) {
  return !std::holds_alternative<CmdHelp>(cmd) &&
         !std::holds_alternative<CmdVersion>(cmd) &&
         !std::holds_alternative<CmdClassify>(cmd);
}

int App::run(int argc, char **argv) {
  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  Config cfg = Config::from_env();
  if (pr.global.cwd)
    cfg.working_dir = *pr.global.cwd;
  if (pr.global.timeout_ms)
    cfg.timeout = std::chrono::milliseconds(*pr.global.timeout_ms);
  if (pr.global.verbose)
    cfg.log_level = spdlog::level::debug;
  cfg.assume = pr.global.assume;
  spdlog::set_level(cfg.log_level);

  std::error_code ec;
  if (!cfg.working_dir.empty() && !fs::is_directory(cfg.working_dir, ec)) {
    spdlog::error("--cwd {}: not a directory", cfg.working_dir.string());
    return 2;
  }

  ProcessExecutor exec;
  if (needs_git(*pr.cmd) && !git_available(exec, cfg)) {
    spdlog::error("'{}' was not found. Install git and make sure it is on PATH.",
                  cfg.git_bin);
    return 1;
  }

  std::unique_ptr<Prompter> prompter;
  if (cfg.assume)
    prompter = std::make_unique<NonInteractivePrompter>(cfg.assume);
  else
    prompter = std::make_unique<ConsolePrompter>();

  Context ctx(cfg, exec, *prompter);

  try {
    return std::visit(
        [&](auto &&c) -> int {
          using T = std::decay_t<decltype(c)>;

          if constexpr (std::is_same_v<T, CmdHelp>) {
            print_help();
            return 0;

          } else if constexpr (std::is_same_v<T, CmdVersion>) {
            std::cout << fmt::format("gitauto {} ({}, built {})\n",
                                     GITAUTO_VERSION, GITAUTO_COMMIT,
                                     GITAUTO_BUILD_TIME);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdPush>) {
            return report(push(ctx, c.message));

          } else if constexpr (std::is_same_v<T, CmdAdd>) {
            return report(stage(ctx));

          } else if constexpr (std::is_same_v<T, CmdCommit>) {
            return report(commit(ctx, c.message));

          } else if constexpr (std::is_same_v<T, CmdPull>) {
            return report(pull(ctx));

          } else if constexpr (std::is_same_v<T, CmdBranchCreate>) {
            return report(create_branch(ctx, c.name));

          } else if constexpr (std::is_same_v<T, CmdBranchSwitch>) {
            return report(switch_branch(ctx, c.name));

          } else if constexpr (std::is_same_v<T, CmdBranches>) {
            return report(list_branches(ctx));

          } else if constexpr (std::is_same_v<T, CmdStatus>) {
            if (!c.json)
              return report(show_status(ctx));
            auto st = collect_status(ctx);
            if (!st) {
              std::cout << R"({"error":"not a git repository or status failed"})"
                        << "\n";
              return 1;
            }
            std::cout << fmt::format(
                             R"({{"branch":"{}","commit":"{}","uncommitted_changes":{}}})",
                             json_escape(st->branch), json_escape(st->commit),
                             st->uncommitted_changes)
                      << "\n";
            return 0;

          } else if constexpr (std::is_same_v<T, CmdLog>) {
            auto fmt_kind = parse_history_format(c.format);
            return report(show_history(
                ctx, fmt_kind.value_or(HistoryFormat::Oneline), c.limit));

          } else if constexpr (std::is_same_v<T, CmdClone>) {
            if (!c.exit_after)
              return report(clone(ctx, c.url, c.dir));
            const std::string name = c.dir ? *c.dir : repo_name_from_url(c.url);
            int rc = report(auto_clone(ctx, name, c.url));
            if (rc == 0)
              spdlog::info("[clone] '{}' is ready, exiting", name);
            return rc;

          } else if constexpr (std::is_same_v<T, CmdCloneMany>) {
            auto results = clone_many(ctx, c.urls, c.dirs);
            int rc = 0;
            for (size_t i = 0; i < results.size(); ++i) {
              std::cout << fmt::format("== {}\n", c.urls[i]);
              rc = std::max(rc, report(results[i]));
            }
            return rc;

          } else if constexpr (std::is_same_v<T, CmdDelete>) {
            return report(delete_local(ctx, c.dir));

          } else if constexpr (std::is_same_v<T, CmdBatch>) {
            std::vector<fs::path> paths(c.paths.begin(), c.paths.end());
            auto results = batch_process(ctx, paths, c.op);
            int failed = 0;
            for (const auto &r : results) {
              std::cout << fmt::format("== {}: {}\n", r.repo_path.string(),
                                       r.succeeded ? "ok" : "failed");
              if (!r.output.empty())
                std::cout << r.output;
              if (!r.succeeded) {
                std::cout << "   " << trim(r.error) << "\n";
                ++failed;
              }
            }
            std::cout << fmt::format("{}/{} repositories succeeded\n",
                                     results.size() - failed, results.size());
            return failed == 0 ? 0 : 1;

          } else if constexpr (std::is_same_v<T, CmdAnalytics>) {
            auto a = analytics(ctx);
            if (!a)
              return report(OperationResult{false, "This is not a Git repository!"});
            std::cout << fmt::format("Commits: {}\nBranches: {}\nFiles: {}\n"
                                     "Contributors: {}\n",
                                     a->commit_count, a->branch_count,
                                     a->file_count, a->contributor_count);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdSuggest>) {
            if (!ctx.is_repository())
              return report(OperationResult{false, "This is not a Git repository!"});
            auto id = check_identity(ctx);
            if (!id.configured())
              std::cout << "- [identity] Set git user.name and user.email "
                           "before committing.\n";
            auto list = suggestions(ctx);
            if (list.empty() && id.configured())
              std::cout << "Nothing to suggest, the repository is up to date.\n";
            for (const auto &s : list)
              std::cout << fmt::format("- [{}] {}\n", s.type, s.message);
            return 0;

          } else if constexpr (std::is_same_v<T, CmdStats>) {
            if (!ctx.is_repository())
              return report(OperationResult{false, "This is not a Git repository!"});
            for (int i = 0; i < c.runs; ++i) {
              (void)show_status(ctx);
              (void)analytics(ctx);
              (void)suggestions(ctx);
            }
            std::cout << fmt::format("{:<14} {:>6} {:>10} {:>10} {:>10}\n",
                                     "operation", "count", "min ms", "avg ms",
                                     "max ms");
            for (const auto &s : ctx.perf().all_stats())
              std::cout << fmt::format("{:<14} {:>6} {:>10.2f} {:>10.2f} {:>10.2f}\n",
                                       s.operation_name, s.count, s.min_ms,
                                       s.avg_ms, s.max_ms);
            return 0;

          } else {
            static_assert(std::is_same_v<T, CmdClassify>);
            ErrorKind k = ctx.classifier().classify(c.text);
            std::cout << fmt::format("{}: {}\n", to_string(k), title(k));
            print_hints(k);
            return 0;
          }
        },
        *pr.cmd);
  } catch (const ExecError &e) {
    spdlog::error("[app] {}", e.what());
    return 1;
  } catch (const std::invalid_argument &e) {
    spdlog::error("[app] {}", e.what());
    return 2;
  }
}

} // namespace gitauto
