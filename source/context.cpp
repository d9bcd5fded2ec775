#include <gitauto/context.hpp>

#include <system_error>

namespace fs = std::filesystem;

namespace gitauto {

static fs::path resolve_dir(const fs::path &p) {
  std::error_code ec;
  fs::path base = p.empty() ? fs::current_path() : fs::absolute(p);
  auto canon = fs::weakly_canonical(base, ec);
  return ec ? base.lexically_normal() : canon;
}

Context::Context(Config cfg, Executor &exec, Prompter &prompter,
                 CredentialProvider *credentials)
    : cfg_(std::move(cfg)), working_dir_(resolve_dir(cfg_.working_dir)),
      exec_(exec), prompter_(prompter),
      dispatcher_(exec, cfg_.parallel_workers),
      remediator_(exec, prompter, cfg_, credentials) {}

ExecOptions Context::exec_options(const fs::path &dir) const {
  ExecOptions o;
  o.working_dir = dir;
  o.timeout = cfg_.timeout_opt();
  return o;
}

bool Context::is_repository(const fs::path &dir) {
  std::error_code ec;
  return fs::exists(dir / ".git", ec);
}

} // namespace gitauto
