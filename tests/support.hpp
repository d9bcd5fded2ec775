#pragma once
#include <catch2/catch_all.hpp>
#include <gitauto/collaborators.hpp>
#include <gitauto/process.hpp>
#include <gitauto/prompt.hpp>

#include <cstdio>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace testing {

inline fs::path mkd(const std::string &name) {
  auto d = fs::temp_directory_path() / ("gitauto_" + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

inline void sh(const std::string &cmd, const fs::path &wd) {
  auto full = "cd \"" + wd.string() + "\" && " + cmd + " >/dev/null 2>&1";
  REQUIRE(std::system(full.c_str()) == 0);
}

inline std::string sh_out(const std::string &cmd, const fs::path &wd) {
  FILE *p = popen(("cd \"" + wd.string() + "\" && " + cmd).c_str(), "r");
  REQUIRE(p);
  std::string out;
  char buf[256];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), p)) > 0)
    out.append(buf, n);
  pclose(p);
  while (!out.empty() && (out.back() == '\n' || out.back() == '\r'))
    out.pop_back();
  return out;
}

inline void write_file(const fs::path &p, const std::string &text) {
  std::ofstream(p) << text;
}

inline void git_identity(const fs::path &repo) {
  sh("git config user.email test@example.com", repo);
  sh("git config user.name tester", repo);
}

// Fresh repository with one commit of README.md.
inline fs::path git_repo(const std::string &name) {
  auto repo = mkd(name);
  sh("git init", repo);
  git_identity(repo);
  write_file(repo / "README.md", "hello\n");
  sh("git add .", repo);
  sh("git commit -m init", repo);
  return repo;
}

inline gitauto::CommandOutcome ok(std::string out = {}) {
  gitauto::CommandOutcome o;
  o.succeeded = true;
  o.standard_output = std::move(out);
  return o;
}

inline gitauto::CommandOutcome fail(std::string diag, int code = 1) {
  gitauto::CommandOutcome o;
  o.succeeded = false;
  o.diagnostic_text = std::move(diag);
  o.exit_code = code;
  return o;
}

// Replies by exact command text; unknown commands succeed with no output.
class FakeExecutor : public gitauto::Executor {
public:
  using gitauto::Executor::run;

  // times < 0: reply forever; otherwise the reply is used up after n calls.
  void on(std::string command, gitauto::CommandOutcome o, int times = -1) {
    std::lock_guard<std::mutex> lk(m_);
    replies_.push_back(Reply{std::move(command), std::move(o), times});
  }

  gitauto::CommandOutcome run(const std::string &command,
                              const gitauto::ExecOptions &opts) override {
    std::lock_guard<std::mutex> lk(m_);
    calls_.push_back(command);
    dirs_.push_back(opts.working_dir);
    for (auto &r : replies_) {
      if (r.command != command || r.times == 0)
        continue;
      if (r.times > 0)
        --r.times;
      return r.outcome;
    }
    return ok();
  }

  std::vector<std::string> calls() const {
    std::lock_guard<std::mutex> lk(m_);
    return calls_;
  }

  std::vector<fs::path> dirs() const {
    std::lock_guard<std::mutex> lk(m_);
    return dirs_;
  }

  size_t count(const std::string &command) const {
    std::lock_guard<std::mutex> lk(m_);
    size_t n = 0;
    for (const auto &c : calls_)
      if (c == command)
        ++n;
    return n;
  }

private:
  struct Reply {
    std::string command;
    gitauto::CommandOutcome outcome;
    int times;
  };
  mutable std::mutex m_;
  std::vector<Reply> replies_;
  std::vector<std::string> calls_;
  std::vector<fs::path> dirs_;
};

// Answers confirmations from a queue, then falls back to the default.
class ScriptedPrompter : public gitauto::Prompter {
public:
  ScriptedPrompter(std::deque<bool> confirms = {},
                   std::deque<std::string> answers = {})
      : confirms_(std::move(confirms)), answers_(std::move(answers)) {}

  bool confirm(const std::string &message, bool default_value) override {
    questions.push_back(message);
    if (confirms_.empty())
      return default_value;
    bool v = confirms_.front();
    confirms_.pop_front();
    return v;
  }

  std::string ask(const std::string &message) override {
    questions.push_back(message);
    if (answers_.empty())
      return {};
    auto v = answers_.front();
    answers_.pop_front();
    return v;
  }

  std::vector<std::string> questions;

private:
  std::deque<bool> confirms_;
  std::deque<std::string> answers_;
};

class FakeHosting : public gitauto::HostingClient {
public:
  explicit FakeHosting(std::string clone_url = {}) : url_(std::move(clone_url)) {}

  bool create_repository(const std::string &name, bool) override {
    created.push_back(name);
    return true;
  }
  bool delete_repository(const std::string &name) override {
    deleted.push_back(name);
    return allow_delete;
  }
  bool set_visibility(const std::string &, bool) override { return true; }
  gitauto::RepoPresence repository_exists(const std::string &) override {
    return {};
  }
  std::string authenticated_clone_url(const std::string &) override {
    return url_;
  }

  bool allow_delete = true;
  std::vector<std::string> created;
  std::vector<std::string> deleted;

private:
  std::string url_;
};

} // namespace testing
