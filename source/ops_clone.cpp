#include "ops_internal.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace gitauto {

using namespace detail;

// The target must be a strict descendant of the working directory.
static bool unsafe_folder(const std::string &name) {
  if (name.empty())
    return true;
  fs::path p = fs::path(name).lexically_normal();
  if (p.is_absolute())
    return true;
  if (!p.has_filename())
    p = p.parent_path();
  if (p.empty() || p == ".")
    return true;
  for (const auto &part : p)
    if (part == "..")
      return true;
  return false;
}

OperationResult clone(Context &ctx, const std::string &url,
                      const std::optional<std::string> &dir) {
  ScopedTimer timer(ctx.perf(), "clone");
  std::string args = "clone " + quote_double(url);
  if (dir)
    args += " " + quote_double(*dir);

  auto s = run_step(ctx, ctx.git(args));
  if (!s.outcome.succeeded)
    return failed("Failed to clone repository", s);
  ctx.cache().clear();
  return ok("Repository cloned successfully");
}

std::vector<OperationResult> clone_many(Context &ctx,
                                        const std::vector<std::string> &urls,
                                        const std::vector<std::string> &dirs) {
  ScopedTimer timer(ctx.perf(), "clone_many");
  if (!dirs.empty() && dirs.size() != urls.size())
    throw std::invalid_argument(
        fmt::format("clone_many: {} urls but {} directories", urls.size(),
                    dirs.size()));

  std::vector<std::string> commands;
  commands.reserve(urls.size());
  for (size_t i = 0; i < urls.size(); ++i) {
    std::string args = "clone " + quote_double(urls[i]);
    if (!dirs.empty())
      args += " " + quote_double(dirs[i]);
    commands.push_back(ctx.git(args));
  }

  spdlog::info("[clone] cloning {} repositories in parallel", urls.size());
  auto outcomes = ctx.dispatcher().run_parallel(commands, ctx.exec_options());

  std::vector<OperationResult> results;
  results.reserve(outcomes.size());
  bool any = false;
  for (size_t i = 0; i < outcomes.size(); ++i) {
    const auto &o = outcomes[i];
    if (o.succeeded) {
      any = true;
      results.push_back(ok("Repository cloned successfully"));
      continue;
    }
    spdlog::warn("[clone] clone #{} failed (exit {})", i + 1, o.exit_code);
    OperationResult r = failed("Failed to clone repository");
    r.diagnostic = o.diagnostic_text;
    r.kind = ctx.classifier().classify(failure_text(o));
    results.push_back(std::move(r));
  }
  if (any)
    ctx.cache().clear();
  return results;
}

OperationResult auto_clone(Context &ctx, const std::string &name,
                           const std::string &url) {
  if (unsafe_folder(name))
    return failed(fmt::format("Invalid folder name '{}'", name));
  spdlog::info("[clone] cloning {}", name);
  OperationResult r = clone(ctx, url, name);
  if (!r.succeeded)
    return r;
  std::error_code ec;
  if (!fs::is_directory(ctx.working_dir() / name, ec))
    return failed(fmt::format("Cloned folder '{}' not found", name));
  return ok(fmt::format("Repository '{}' is ready", name));
}

OperationResult clone_by_name(Context &ctx, const std::string &name,
                              HostingClient &hosting) {
  // the URL may carry a token: never log it
  return auto_clone(ctx, name, hosting.authenticated_clone_url(name));
}

OperationResult delete_local(Context &ctx, const std::string &name) {
  ScopedTimer timer(ctx.perf(), "delete_local");
  if (unsafe_folder(name))
    return failed(fmt::format("Invalid folder name '{}'", name));

  const fs::path dir = ctx.working_dir() / name;
  std::error_code ec;
  if (!fs::exists(dir, ec))
    return ok(fmt::format("Folder '{}' does not exist", name));
  fs::remove_all(dir, ec);
  if (ec) {
    spdlog::error("[delete] {}: {}", dir.string(), ec.message());
    OperationResult r = failed(fmt::format("Failed to delete folder '{}'", name));
    r.diagnostic = ec.message();
    return r;
  }
  ctx.cache().clear();
  return ok(fmt::format("Local folder '{}' deleted", name));
}

OperationResult delete_repository(Context &ctx, const std::string &name,
                                  HostingClient &hosting) {
  if (unsafe_folder(name))
    return failed(fmt::format("Invalid folder name '{}'", name));
  if (!ctx.prompter().confirm(
          fmt::format("Are you sure you want to delete repository '{}'? "
                      "This cannot be undone.",
                      name),
          false)) {
    OperationResult r = failed("Deletion cancelled by user");
    r.flags.cancelled_by_caller = true;
    return r;
  }
  if (!hosting.delete_repository(name)) {
    spdlog::error("[delete] hosting refused to delete {}", name);
    return failed(fmt::format("Failed to delete repository '{}'", name));
  }
  OperationResult local = delete_local(ctx, name);
  if (!local.succeeded)
    return local;
  return ok(fmt::format("Repository '{}' deleted", name));
}

} // namespace gitauto
