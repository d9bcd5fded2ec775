#include "support.hpp"

#include <gitauto/context.hpp>
#include <gitauto/operations.hpp>

#include <fmt/format.h>

#include <stdexcept>

using namespace gitauto;

namespace {

Config config_for(const fs::path &dir) {
  Config c;
  c.working_dir = dir;
  c.parallel_workers = 4;
  c.timeout = std::chrono::milliseconds(30000);
  return c;
}

std::string q(const fs::path &p) { return "\"" + p.string() + "\""; }

// Bare remote plus a first clone that has pushed one commit with upstream set.
struct Remote {
  fs::path bare;
  fs::path first;
};

Remote make_remote(const std::string &name) {
  Remote r;
  r.bare = testing::mkd(name + "_bare");
  testing::sh("git init --bare", r.bare);
  r.first = testing::git_repo(name + "_first");
  testing::sh("git remote add origin " + q(r.bare), r.first);
  testing::sh("git push -u origin HEAD", r.first);
  return r;
}

fs::path clone_of(const Remote &r, const std::string &name) {
  auto parent = testing::mkd(name + "_parent");
  testing::sh("git clone " + q(r.bare) + " work", parent);
  auto dir = parent / "work";
  testing::git_identity(dir);
  testing::sh("git config pull.rebase false", dir);
  return dir;
}

} // namespace

TEST_CASE("Stage and commit on a clean tree create no commit") {
  auto repo = testing::git_repo("ops_clean");
  ProcessExecutor ex;
  NonInteractivePrompter ask(false);
  Context ctx(config_for(repo), ex, ask);

  auto staged = stage(ctx);
  REQUIRE(staged.succeeded);
  REQUIRE(staged.message == "Files added successfully");

  auto committed = commit(ctx);
  REQUIRE(committed.succeeded);
  REQUIRE(committed.message == "No changes to commit");
  REQUIRE(testing::sh_out("git rev-list --count HEAD", repo) == "1");
}

TEST_CASE("Commit records staged changes with the message") {
  auto repo = testing::git_repo("ops_commit");
  testing::write_file(repo / "notes.txt", "todo\n");
  ProcessExecutor ex;
  NonInteractivePrompter ask(false);
  Context ctx(config_for(repo), ex, ask);

  REQUIRE(stage(ctx).succeeded);
  auto r = commit(ctx, "Add \"notes\" $HOME");
  REQUIRE(r.succeeded);
  REQUIRE(r.message == "Changes committed successfully");
  REQUIRE(testing::sh_out("git log -1 --pretty=%s", repo) == "Add \"notes\" $HOME");
}

TEST_CASE("Handlers refuse to run outside a repository") {
  auto dir = testing::mkd("ops_norepo");
  ProcessExecutor ex;
  NonInteractivePrompter ask(false);
  Context ctx(config_for(dir), ex, ask);

  for (auto r : {stage(ctx), commit(ctx), pull(ctx), show_status(ctx),
                 list_branches(ctx), show_history(ctx)}) {
    REQUIRE_FALSE(r.succeeded);
    REQUIRE(r.message == "This is not a Git repository!");
  }
  REQUIRE_FALSE(collect_status(ctx));
  REQUIRE_FALSE(analytics(ctx));
  REQUIRE(suggestions(ctx).empty());
}

TEST_CASE("Branch create, switch and list") {
  auto repo = testing::git_repo("ops_branch");
  const auto main_branch = testing::sh_out("git symbolic-ref --short HEAD", repo);
  ProcessExecutor ex;
  NonInteractivePrompter ask(false);
  Context ctx(config_for(repo), ex, ask);

  auto created = create_branch(ctx, "feature");
  REQUIRE(created.succeeded);
  REQUIRE(created.message == "Created and switched to branch 'feature'");
  REQUIRE(testing::sh_out("git branch --show-current", repo) == "feature");

  auto dup = create_branch(ctx, "feature");
  REQUIRE_FALSE(dup.succeeded);
  REQUIRE(dup.message == "Branch 'feature' already exists");

  REQUIRE(switch_branch(ctx, "feature").message == "Already on branch 'feature'");

  auto back = switch_branch(ctx, main_branch);
  REQUIRE(back.succeeded);
  REQUIRE(back.message == "Switched to branch '" + main_branch + "'");

  auto missing = switch_branch(ctx, "nope");
  REQUIRE_FALSE(missing.succeeded);
  REQUIRE(missing.message == "Branch 'nope' does not exist");

  auto listed = list_branches(ctx);
  REQUIRE(listed.succeeded);
  REQUIRE(listed.output.find("feature") != std::string::npos);
  REQUIRE(listed.output.find("Local branches:") == 0);
}

TEST_CASE("Branch names are validated before any command") {
  REQUIRE(valid_branch_name("feature/login-2"));
  REQUIRE_FALSE(valid_branch_name(""));
  REQUIRE_FALSE(valid_branch_name("two words"));
  REQUIRE_FALSE(valid_branch_name("x;rm -rf ~"));
  REQUIRE_FALSE(valid_branch_name("-D"));
  REQUIRE_FALSE(valid_branch_name("a..b"));

  testing::FakeExecutor fake;
  NonInteractivePrompter ask(false);
  Context ctx(config_for(testing::mkd("ops_badbranch")), fake, ask);
  auto r = create_branch(ctx, "bad name");
  REQUIRE_FALSE(r.succeeded);
  REQUIRE(r.message == "Invalid branch name 'bad name'");
  REQUIRE(fake.calls().empty());
}

TEST_CASE("Status report") {
  auto repo = testing::git_repo("ops_status");
  testing::write_file(repo / "a.txt", "a");
  testing::write_file(repo / "b.txt", "b");
  ProcessExecutor ex;
  NonInteractivePrompter ask(false);
  Context ctx(config_for(repo), ex, ask);

  auto st = collect_status(ctx);
  REQUIRE(st);
  REQUIRE(st->branch == testing::sh_out("git symbolic-ref --short HEAD", repo));
  REQUIRE(st->commit == testing::sh_out("git rev-parse HEAD", repo).substr(0, 7));
  REQUIRE(st->uncommitted_changes == 2);
  REQUIRE(st->detailed_status.find("a.txt") != std::string::npos);

  auto r = show_status(ctx);
  REQUIRE(r.succeeded);
  REQUIRE(r.output.find("Uncommitted changes: 2") != std::string::npos);
  REQUIRE(ctx.perf().stats("status"));
}

TEST_CASE("Status before the first commit") {
  auto repo = testing::mkd("ops_status_empty");
  testing::sh("git init", repo);
  ProcessExecutor ex;
  NonInteractivePrompter ask(false);
  Context ctx(config_for(repo), ex, ask);

  auto st = collect_status(ctx);
  REQUIRE(st);
  REQUIRE(st->commit == "unknown");
  REQUIRE_FALSE(st->branch.empty());
}

TEST_CASE("History formats") {
  auto repo = testing::git_repo("ops_history");
  testing::write_file(repo / "x.txt", "x");
  testing::sh("git add . && git commit -m second", repo);
  ProcessExecutor ex;
  NonInteractivePrompter ask(false);
  Context ctx(config_for(repo), ex, ask);

  auto one = show_history(ctx, HistoryFormat::Oneline, 1);
  REQUIRE(one.succeeded);
  REQUIRE(one.output.find("second") != std::string::npos);
  REQUIRE(one.output.find("init") == std::string::npos);

  auto full = show_history(ctx, HistoryFormat::Full);
  REQUIRE(full.output.find(" - tester, ") != std::string::npos);
  REQUIRE(full.output.find(": init") != std::string::npos);

  auto graph = show_history(ctx, HistoryFormat::Graph);
  REQUIRE(graph.output.find("* ") != std::string::npos);

  auto zero = show_history(ctx, HistoryFormat::Oneline, 0);
  REQUIRE_FALSE(zero.succeeded);
  REQUIRE(zero.message == "History limit must be positive, got 0");
  REQUIRE(parse_history_format("graph") == HistoryFormat::Graph);
  REQUIRE_FALSE(parse_history_format("fancy"));
}

TEST_CASE("Push and pull through a local remote") {
  auto remote = make_remote("ops_sync");
  auto other = clone_of(remote, "ops_sync_other");
  ProcessExecutor ex;
  NonInteractivePrompter ask(false);

  testing::write_file(remote.first / "feature.txt", "v1\n");
  {
    Context ctx(config_for(remote.first), ex, ask);
    auto r = push(ctx, "Add feature");
    REQUIRE(r.succeeded);
    REQUIRE(r.message == "Changes pushed successfully");
  }
  {
    Context ctx(config_for(other), ex, ask);
    auto r = pull(ctx);
    REQUIRE(r.succeeded);
    REQUIRE(r.message == "Pulled latest changes");
    REQUIRE(fs::exists(other / "feature.txt"));
  }
}

TEST_CASE("Rejected push recovers by pulling first") {
  auto remote = make_remote("ops_nff");
  auto other = clone_of(remote, "ops_nff_other");
  ProcessExecutor ex;

  testing::write_file(remote.first / "one.txt", "1\n");
  testing::sh("git add . && git commit -m one && git push", remote.first);

  testing::write_file(other / "two.txt", "2\n");
  testing::ScriptedPrompter ask({true});
  Context ctx(config_for(other), ex, ask);
  auto r = push(ctx, "two");
  REQUIRE(r.succeeded);
  REQUIRE(r.message == "Changes pushed successfully after pulling remote changes");
  REQUIRE(fs::exists(other / "one.txt"));
  REQUIRE(testing::sh_out("git rev-list --count HEAD", remote.bare) == "4");
}

TEST_CASE("Clone, auto-clone and delete") {
  auto remote = make_remote("ops_clone");
  auto base = testing::mkd("ops_clone_base");
  ProcessExecutor ex;
  NonInteractivePrompter ask(false);
  Context ctx(config_for(base), ex, ask);

  auto r = clone(ctx, remote.bare.string(), std::string("copy"));
  REQUIRE(r.succeeded);
  REQUIRE(r.message == "Repository cloned successfully");
  REQUIRE(fs::exists(base / "copy" / "README.md"));

  auto again = clone(ctx, remote.bare.string(), std::string("copy"));
  REQUIRE_FALSE(again.succeeded);
  REQUIRE(again.diagnostic);

  auto ready = auto_clone(ctx, "auto", remote.bare.string());
  REQUIRE(ready.succeeded);
  REQUIRE(ready.message == "Repository 'auto' is ready");

  testing::FakeHosting hosting(remote.bare.string());
  REQUIRE(clone_by_name(ctx, "byname", hosting).succeeded);
  REQUIRE(fs::is_directory(base / "byname" / ".git"));

  auto del = delete_local(ctx, "copy");
  REQUIRE(del.succeeded);
  REQUIRE(del.message == "Local folder 'copy' deleted");
  REQUIRE_FALSE(fs::exists(base / "copy"));

  auto absent = delete_local(ctx, "copy");
  REQUIRE(absent.succeeded);
  REQUIRE(absent.message == "Folder 'copy' does not exist");

  REQUIRE_FALSE(delete_local(ctx, "../outside").succeeded);
  REQUIRE_FALSE(delete_local(ctx, "/tmp").succeeded);
}

TEST_CASE("Deleting never removes the working directory itself") {
  auto base = testing::mkd("ops_delete_self");
  fs::create_directories(base / "keep");
  testing::write_file(base / "keep" / "file.txt", "x");
  ProcessExecutor ex;
  testing::ScriptedPrompter ask({true});
  Context ctx(config_for(base), ex, ask);

  for (const char *name : {".", "./", "keep/..", "keep/../.", ""}) {
    auto r = delete_local(ctx, name);
    REQUIRE_FALSE(r.succeeded);
    REQUIRE(r.message == fmt::format("Invalid folder name '{}'", name));
  }
  REQUIRE(fs::exists(base / "keep" / "file.txt"));

  testing::FakeHosting hosting;
  REQUIRE_FALSE(delete_repository(ctx, ".", hosting).succeeded);
  REQUIRE(hosting.deleted.empty());
  REQUIRE(ask.questions.empty());
  REQUIRE(fs::exists(base / "keep" / "file.txt"));

  auto sub = delete_local(ctx, "keep/");
  REQUIRE(sub.succeeded);
  REQUIRE_FALSE(fs::exists(base / "keep"));
  REQUIRE(fs::is_directory(base));
}

TEST_CASE("Several repositories clone in parallel") {
  auto one = make_remote("ops_many_one");
  auto two = make_remote("ops_many_two");
  auto base = testing::mkd("ops_many_base");
  ProcessExecutor ex;
  NonInteractivePrompter ask(false);
  Context ctx(config_for(base), ex, ask);

  auto missing = base / "no_such_remote";
  auto res = clone_many(ctx,
                        {one.bare.string(), missing.string(), two.bare.string()},
                        {"first copy", "broken", "second"});
  REQUIRE(res.size() == 3);
  REQUIRE(res[0].succeeded);
  REQUIRE(res[0].message == "Repository cloned successfully");
  REQUIRE_FALSE(res[1].succeeded);
  REQUIRE(res[1].message == "Failed to clone repository");
  REQUIRE(res[1].diagnostic);
  REQUIRE(res[2].succeeded);
  REQUIRE(fs::exists(base / "first copy" / "README.md"));
  REQUIRE(fs::exists(base / "second" / "README.md"));
  REQUIRE_FALSE(fs::exists(base / "broken"));

  REQUIRE_THROWS_AS(clone_many(ctx, {one.bare.string()}, {"a", "b"}),
                    std::invalid_argument);
}

TEST_CASE("Repository deletion asks first") {
  auto base = testing::mkd("ops_delrepo");
  fs::create_directories(base / "proj");
  ProcessExecutor ex;
  testing::FakeHosting hosting;

  {
    testing::ScriptedPrompter ask({false});
    Context ctx(config_for(base), ex, ask);
    auto r = delete_repository(ctx, "proj", hosting);
    REQUIRE_FALSE(r.succeeded);
    REQUIRE(r.flags.cancelled_by_caller);
    REQUIRE(hosting.deleted.empty());
    REQUIRE(fs::exists(base / "proj"));
  }
  {
    testing::ScriptedPrompter ask({true});
    Context ctx(config_for(base), ex, ask);
    auto r = delete_repository(ctx, "proj", hosting);
    REQUIRE(r.succeeded);
    REQUIRE(hosting.deleted == std::vector<std::string>{"proj"});
    REQUIRE_FALSE(fs::exists(base / "proj"));
  }
}

TEST_CASE("Batch processing keeps path order and per-repo directories") {
  auto clean = testing::git_repo("ops_batch_clean");
  auto dirty = testing::git_repo("ops_batch_dirty");
  testing::write_file(dirty / "new.txt", "n");
  auto plain = testing::mkd("ops_batch_plain");
  const auto cwd_before = fs::current_path();

  ProcessExecutor ex;
  NonInteractivePrompter ask(false);
  Context ctx(config_for(testing::mkd("ops_batch_base")), ex, ask);

  auto res = batch_process(ctx, {clean, plain, dirty}, "status");
  REQUIRE(res.size() == 3);
  REQUIRE(res[0].succeeded);
  REQUIRE(res[0].output.empty());
  REQUIRE_FALSE(res[1].succeeded);
  REQUIRE(res[1].error == "Not a git repository");
  REQUIRE(res[2].succeeded);
  REQUIRE(res[2].output.find("new.txt") != std::string::npos);
  REQUIRE(fs::current_path() == cwd_before);

  REQUIRE_THROWS_AS(batch_process(ctx, {clean}, "reset"), std::invalid_argument);
}

TEST_CASE("Analytics are cached until cleared") {
  auto repo = testing::git_repo("ops_analytics");
  ProcessExecutor ex;
  NonInteractivePrompter ask(false);
  Context ctx(config_for(repo), ex, ask);

  auto a = analytics(ctx);
  REQUIRE(a);
  REQUIRE(a->commit_count == 1);
  REQUIRE(a->branch_count == 1);
  REQUIRE(a->file_count == 1);
  REQUIRE(a->contributor_count == 1);

  testing::write_file(repo / "more.txt", "m");
  testing::sh("git add . && git commit -m more", repo);
  REQUIRE(analytics(ctx)->commit_count == 1);

  ctx.cache().clear();
  auto b = analytics(ctx);
  REQUIRE(b->commit_count == 2);
  REQUIRE(b->file_count == 2);
}

TEST_CASE("Suggestions follow the repository state") {
  auto remote = make_remote("ops_suggest");
  ProcessExecutor ex;
  NonInteractivePrompter ask(false);
  Context ctx(config_for(remote.first), ex, ask);

  REQUIRE(suggestions(ctx).empty());

  testing::write_file(remote.first / "w.txt", "w");
  testing::sh("git add . && git commit -m local", remote.first);
  testing::write_file(remote.first / "dirty.txt", "d");
  ctx.cache().clear();

  auto s = suggestions(ctx);
  REQUIRE(s.size() == 2);
  REQUIRE(s[0].type == "commit");
  REQUIRE(s[0].priority == 1);
  REQUIRE(s[1].type == "push");
  REQUIRE(s[1].message.find("1 commit(s) ahead") != std::string::npos);
}

TEST_CASE("Identity check reads the repository config") {
  auto repo = testing::git_repo("ops_identity");
  ProcessExecutor ex;
  NonInteractivePrompter ask(false);
  Context ctx(config_for(repo), ex, ask);
  auto id = check_identity(ctx);
  REQUIRE(id.configured());
  REQUIRE(id.name == "tester");
  REQUIRE(id.email == "test@example.com");
}
