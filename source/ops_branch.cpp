#include "ops_internal.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstring>

namespace gitauto {

using namespace detail;

bool valid_branch_name(const std::string &name) {
  if (name.empty() || name.front() == '-')
    return false;
  static const char *forbidden = ";&|$`'\"<>(){}[]*?!~^:\\";
  for (char c : name) {
    if (std::isspace(static_cast<unsigned char>(c)) ||
        std::iscntrl(static_cast<unsigned char>(c)) ||
        std::strchr(forbidden, c) != nullptr)
      return false;
  }
  return name.find("..") == std::string::npos;
}

// "* main", "  feature", "+ wt" -> names
static std::vector<std::string> branch_names(const std::string &listing) {
  std::vector<std::string> names;
  for (auto &line : split_lines(listing)) {
    std::string n = line.size() > 2 ? line.substr(2) : trim(line);
    names.push_back(trim(n));
  }
  return names;
}

static bool contains(const std::vector<std::string> &v, const std::string &s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

OperationResult create_branch(Context &ctx, const std::string &name) {
  ScopedTimer timer(ctx.perf(), "create_branch");
  if (!valid_branch_name(name))
    return failed(fmt::format("Invalid branch name '{}'", name));
  if (!ctx.is_repository())
    return not_a_repository();

  auto listing = run_step(ctx, ctx.git("branch"));
  if (!listing.outcome.succeeded)
    return failed("Failed to list branches", listing);
  if (contains(branch_names(listing.outcome.standard_output), name)) {
    spdlog::warn("[branch] '{}' already exists", name);
    return failed(fmt::format("Branch '{}' already exists", name));
  }

  auto s = run_step(ctx, ctx.git("checkout -b " + name));
  if (!s.outcome.succeeded)
    return failed(fmt::format("Failed to create branch '{}'", name), s);
  ctx.cache().clear();
  return ok(fmt::format("Created and switched to branch '{}'", name));
}

OperationResult switch_branch(Context &ctx, const std::string &name) {
  ScopedTimer timer(ctx.perf(), "switch_branch");
  if (!valid_branch_name(name))
    return failed(fmt::format("Invalid branch name '{}'", name));
  if (!ctx.is_repository())
    return not_a_repository();

  auto current = ctx.executor().run(ctx.git("branch --show-current"),
                                    ctx.exec_options());
  if (current.succeeded && trim(current.standard_output) == name)
    return ok(fmt::format("Already on branch '{}'", name));

  auto listing = run_step(ctx, ctx.git("branch"));
  if (!listing.outcome.succeeded)
    return failed("Failed to list branches", listing);
  if (!contains(branch_names(listing.outcome.standard_output), name))
    return failed(fmt::format("Branch '{}' does not exist", name));

  auto s = run_step(ctx, ctx.git("checkout " + name));
  if (!s.outcome.succeeded)
    return failed(fmt::format("Failed to switch to branch '{}'", name), s);
  ctx.cache().clear();
  return ok(fmt::format("Switched to branch '{}'", name));
}

OperationResult list_branches(Context &ctx) {
  ScopedTimer timer(ctx.perf(), "list_branches");
  if (!ctx.is_repository())
    return not_a_repository();

  auto out = ctx.dispatcher().run_parallel(
      std::vector<std::string>{ctx.git("branch"), ctx.git("branch -r")},
      ctx.exec_options());
  if (!out[0].succeeded) {
    OperationResult r = failed("Failed to list branches");
    r.diagnostic = out[0].diagnostic_text;
    r.kind = ctx.classifier().classify(failure_text(out[0]));
    return r;
  }
  OperationResult r = ok("Branches");
  r.output = "Local branches:\n" + out[0].standard_output;
  // no remotes is not an error
  if (out[1].succeeded && !trim(out[1].standard_output).empty())
    r.output += "\nRemote branches:\n" + out[1].standard_output;
  return r;
}

} // namespace gitauto
