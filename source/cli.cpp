#include <cerrno>
#include <cstdlib>
#include <gitauto/cli.hpp>
#include <string_view>

namespace gitauto {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

static std::optional<long long> to_number(const char *s) {
  errno = 0;
  char *end = nullptr;
  long long n = std::strtoll(s, &end, 10);
  if (errno != 0 || end == s || *end != '\0')
    return std::nullopt;
  return n;
}

// -m <msg> / --message <msg>
static bool parse_message(int argc, char **argv, int from, std::string &msg,
                          std::string &error, const std::string &cmd) {
  for (int i = from; i < argc; i++) {
    std::string_view a = argv[i];
    if (a == "-m" || a == "--message") {
      if (!has_arg(i, argc)) {
        error = cmd + ": " + std::string(a) + " requires a value";
        return false;
      }
      msg = argv[++i];
      if (msg.empty()) {
        error = cmd + ": empty commit message";
        return false;
      }
    } else {
      error = cmd + ": unexpected argument " + std::string(a);
      return false;
    }
  }
  return true;
}

std::string repo_name_from_url(const std::string &url) {
  std::string s = url;
  while (!s.empty() && s.back() == '/')
    s.pop_back();
  auto cut = s.find_last_of("/:");
  if (cut != std::string::npos)
    s = s.substr(cut + 1);
  if (s.size() > 4 && s.compare(s.size() - 4, 4, ".git") == 0)
    s.resize(s.size() - 4);
  return s;
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  int i = 1;
  for (; i < argc; i++) {
    std::string_view a = argv[i];
    if (a == "--yes" || a == "-y") {
      r.global.assume = true;
    } else if (a == "--no") {
      r.global.assume = false;
    } else if (a == "--verbose" || a == "-v") {
      r.global.verbose = true;
    } else if (a == "--cwd") {
      if (!has_arg(i, argc)) {
        r.error = "--cwd requires a directory";
        return r;
      }
      r.global.cwd = argv[++i];
    } else if (a == "--timeout-ms") {
      auto n = has_arg(i, argc) ? to_number(argv[i + 1]) : std::nullopt;
      if (!n || *n < 0) {
        r.error = "--timeout-ms requires a non-negative number";
        return r;
      }
      r.global.timeout_ms = *n;
      ++i;
    } else {
      break;
    }
  }

  if (i >= argc) {
    r.cmd = CmdHelp{};
    return r;
  }

  const std::string cmd = argv[i];
  const int first = i + 1;
  const int nargs = argc - first;

  if (cmd == "--help" || cmd == "help" || cmd == "-h") {
    r.cmd = CmdHelp{};
    return r;
  }
  if (cmd == "--version" || cmd == "version") {
    r.cmd = CmdVersion{};
    return r;
  }

  if (cmd == "push") {
    CmdPush c{};
    if (parse_message(argc, argv, first, c.message, r.error, cmd))
      r.cmd = c;
    return r;
  }
  if (cmd == "commit") {
    CmdCommit c{};
    if (parse_message(argc, argv, first, c.message, r.error, cmd))
      r.cmd = c;
    return r;
  }
  if (cmd == "add" || cmd == "pull" || cmd == "branches" ||
      cmd == "analytics" || cmd == "suggest") {
    if (nargs > 0) {
      r.error = cmd + ": takes no arguments";
      return r;
    }
    if (cmd == "add")
      r.cmd = CmdAdd{};
    else if (cmd == "pull")
      r.cmd = CmdPull{};
    else if (cmd == "branches")
      r.cmd = CmdBranches{};
    else if (cmd == "analytics")
      r.cmd = CmdAnalytics{};
    else
      r.cmd = CmdSuggest{};
    return r;
  }

  if (cmd == "branch") {
    if (nargs != 2) {
      r.error = "branch: usage branch create|switch <name>";
      return r;
    }
    std::string_view sub = argv[first];
    if (sub == "create")
      r.cmd = CmdBranchCreate{argv[first + 1]};
    else if (sub == "switch")
      r.cmd = CmdBranchSwitch{argv[first + 1]};
    else
      r.error = "branch: unknown subcommand " + std::string(sub);
    return r;
  }

  if (cmd == "status") {
    CmdStatus c{};
    for (int k = first; k < argc; k++) {
      if (std::string_view(argv[k]) == "--json") {
        c.json = true;
      } else {
        r.error = "status: unexpected argument " + std::string(argv[k]);
        return r;
      }
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "log") {
    CmdLog c{};
    for (int k = first; k < argc; k++) {
      std::string_view a = argv[k];
      if (a == "--format" && has_arg(k, argc)) {
        c.format = argv[++k];
        if (c.format != "oneline" && c.format != "full" && c.format != "graph") {
          r.error = "log: --format must be oneline, full or graph";
          return r;
        }
      } else if (a == "--limit" && has_arg(k, argc)) {
        auto n = to_number(argv[++k]);
        if (!n || *n <= 0 || *n > 100000) {
          r.error = "log: --limit must be a positive number";
          return r;
        }
        c.limit = static_cast<int>(*n);
      } else {
        r.error = "log: unexpected argument " + std::string(a);
        return r;
      }
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "clone") {
    CmdClone c{};
    for (int k = first; k < argc; k++) {
      std::string_view a = argv[k];
      if (a == "--exit")
        c.exit_after = true;
      else if (c.url.empty())
        c.url = argv[k];
      else if (!c.dir)
        c.dir = argv[k];
      else {
        r.error = "clone: unexpected argument " + std::string(a);
        return r;
      }
    }
    if (c.url.empty()) {
      r.error = "clone: url required";
      return r;
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "clone-many") {
    CmdCloneMany c{};
    bool into = false;
    for (int k = first; k < argc; k++) {
      std::string_view a = argv[k];
      if (a == "--" && !into)
        into = true;
      else
        (into ? c.dirs : c.urls).emplace_back(a);
    }
    if (c.urls.empty()) {
      r.error = "clone-many: at least one url required";
      return r;
    }
    if (into && c.dirs.size() != c.urls.size()) {
      r.error = "clone-many: give one directory per url after --";
      return r;
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "delete") {
    if (nargs != 1) {
      r.error = "delete: usage delete <dir>";
      return r;
    }
    r.cmd = CmdDelete{argv[first]};
    return r;
  }

  if (cmd == "batch") {
    if (nargs < 2) {
      r.error = "batch: usage batch <status|pull|push|fetch> <path>...";
      return r;
    }
    CmdBatch c{argv[first], {}};
    if (c.op != "status" && c.op != "pull" && c.op != "push" && c.op != "fetch") {
      r.error = "batch: unknown operation " + c.op;
      return r;
    }
    for (int k = first + 1; k < argc; k++)
      c.paths.emplace_back(argv[k]);
    r.cmd = c;
    return r;
  }

  if (cmd == "stats") {
    CmdStats c{};
    for (int k = first; k < argc; k++) {
      std::string_view a = argv[k];
      auto n = (a == "--runs" && has_arg(k, argc)) ? to_number(argv[++k])
                                                    : std::nullopt;
      if (!n || *n <= 0 || *n > 1000) {
        r.error = "stats: usage stats [--runs N]";
        return r;
      }
      c.runs = static_cast<int>(*n);
    }
    r.cmd = c;
    return r;
  }

  if (cmd == "classify") {
    if (nargs < 1) {
      r.error = "classify: text required";
      return r;
    }
    CmdClassify c{};
    for (int k = first; k < argc; k++) {
      if (k > first)
        c.text += ' ';
      c.text += argv[k];
    }
    r.cmd = c;
    return r;
  }

  r.error = "unknown command: " + cmd;
  return r;
}

} // namespace gitauto
