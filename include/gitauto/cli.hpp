#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gitauto {

// Options accepted before the command name.
struct GlobalOptions {
  std::optional<bool> assume; // --yes / --no
  std::optional<std::string> cwd;
  std::optional<long long> timeout_ms;
  bool verbose = false;
};

struct CmdPush {
  std::string message = "Auto commit";
};
struct CmdAdd {};
struct CmdCommit {
  std::string message = "Auto commit";
};
struct CmdPull {};

struct CmdBranchCreate {
  std::string name;
};
struct CmdBranchSwitch {
  std::string name;
};
struct CmdBranches {};

struct CmdStatus {
  bool json = false;
};
struct CmdLog {
  std::string format = "oneline";
  int limit = 10;
};

struct CmdClone {
  std::string url;
  std::optional<std::string> dir;
  bool exit_after = false;
};
// clone-many <url>... [-- <dir>...]
struct CmdCloneMany {
  std::vector<std::string> urls;
  std::vector<std::string> dirs;
};
struct CmdDelete {
  std::string dir;
};
struct CmdBatch {
  std::string op;
  std::vector<std::string> paths;
};

struct CmdAnalytics {};
struct CmdSuggest {};
struct CmdStats {
  int runs = 3;
};
struct CmdClassify {
  std::string text;
};

struct CmdHelp {};
struct CmdVersion {};

using Command =
    std::variant<CmdPush, CmdAdd, CmdCommit, CmdPull, CmdBranchCreate,
                 CmdBranchSwitch, CmdBranches, CmdStatus, CmdLog, CmdClone,
                 CmdCloneMany, CmdDelete, CmdBatch, CmdAnalytics, CmdSuggest, CmdStats,
                 CmdClassify, CmdHelp, CmdVersion>;

struct ParseResult {
  GlobalOptions global;
  std::optional<Command> cmd;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

// "https://host/user/repo.git" -> "repo"
std::string repo_name_from_url(const std::string &url);

} // namespace gitauto
