#include <gitauto/process.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace gitauto {

static int make_cloexec_pipe(int pfd[2]) {
#ifdef __linux__
  if (::pipe2(pfd, O_CLOEXEC) == 0)
    return 0;
#endif
  if (::pipe(pfd) != 0)
    return -1;
  ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
  ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
  return 0;
}

static void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

static int wait_child(pid_t pid) {
  int st = 0;
  while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {
  }
  return st;
}

CommandOutcome ProcessExecutor::run(const std::string &command,
                                    const ExecOptions &opts) {
  CommandOutcome res{};
  const bool pipe_out = opts.capture_output;
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};

  auto close_all = [&] {
    for (int *fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1],
                    &exec_pipe[0], &exec_pipe[1]})
      close_fd(*fd);
  };
  auto start_failure = [&](const std::string &what) -> CommandOutcome {
    close_all();
    spdlog::error("[exec] {}: {}", what, command);
    if (!opts.ignore_start_errors)
      throw ExecError(fmt::format("{}: {}", what, command));
    res.succeeded = false;
    res.exit_code = -1;
    res.diagnostic_text = what;
    return res;
  };

  if ((pipe_out && make_cloexec_pipe(out_pipe) != 0) ||
      make_cloexec_pipe(err_pipe) != 0 || make_cloexec_pipe(exec_pipe) != 0)
    return start_failure(fmt::format("pipe failed: {}", std::strerror(errno)));

  spdlog::debug("[exec] {} (cwd={})", command,
                opts.working_dir.empty() ? "." : opts.working_dir.string());

  pid_t pid = ::fork();
  if (pid < 0)
    return start_failure(fmt::format("fork failed: {}", std::strerror(errno)));

  if (pid == 0) {
    ::setpgid(0, 0);
    if (opts.stdio == Stdio::Silent) {
      int devnull = ::open("/dev/null", O_RDONLY);
      if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::close(devnull);
      }
    }
    if (!opts.working_dir.empty() && ::chdir(opts.working_dir.c_str()) != 0) {
      int err = errno;
      (void)!::write(exec_pipe[1], &err, sizeof(err));
      _exit(127);
    }
    if (pipe_out)
      ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);

    ::execl("/bin/sh", "sh", "-c", command.c_str(), (char *)nullptr);

    int err = errno;
    (void)!::write(exec_pipe[1], &err, sizeof(err));
    _exit(127);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(exec_pipe[1]);

  // exec_pipe is CLOEXEC: EOF means exec succeeded, data is the child errno
  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(exec_pipe[0]);
  if (n > 0) {
    (void)wait_child(pid);
    std::string where = opts.working_dir.empty()
                            ? std::string{}
                            : " in " + opts.working_dir.string();
    return start_failure(fmt::format("cannot start process{} ({})", where,
                                     std::strerror(child_errno)));
  }

  std::string out, err;
  std::optional<std::chrono::steady_clock::time_point> deadline;
  if (opts.timeout)
    deadline = std::chrono::steady_clock::now() + *opts.timeout;

  std::array<char, 4096> buf{};
  while (out_pipe[0] >= 0 || err_pipe[0] >= 0) {
    std::array<pollfd, 2> fds{};
    std::array<int *, 2> owners{};
    std::array<std::string *, 2> sinks{};
    nfds_t nfds = 0;
    if (out_pipe[0] >= 0) {
      fds[nfds] = pollfd{out_pipe[0], POLLIN, 0};
      owners[nfds] = &out_pipe[0];
      sinks[nfds++] = &out;
    }
    if (err_pipe[0] >= 0) {
      fds[nfds] = pollfd{err_pipe[0], POLLIN, 0};
      owners[nfds] = &err_pipe[0];
      sinks[nfds++] = &err;
    }

    int wait_ms = -1;
    if (deadline) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                      *deadline - std::chrono::steady_clock::now())
                      .count();
      if (left <= 0) {
        res.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(left);
    }

    int rc = ::poll(fds.data(), nfds, wait_ms);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      spdlog::warn("[exec] poll failed: {}", std::strerror(errno));
      break;
    }
    if (rc == 0)
      continue;

    for (nfds_t i = 0; i < nfds; ++i) {
      if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
        continue;
      ssize_t got = ::read(fds[i].fd, buf.data(), buf.size());
      if (got > 0)
        sinks[i]->append(buf.data(), static_cast<size_t>(got));
      else if (got == 0 || (errno != EINTR && errno != EAGAIN))
        close_fd(*owners[i]);
    }
  }

  if (res.timed_out) {
    spdlog::warn("[exec] timeout after {} ms, killing pgid={}: {}",
                 opts.timeout->count(), pid, command);
    ::kill(-pid, SIGKILL);
  }
  close_fd(out_pipe[0]);
  close_fd(err_pipe[0]);

  int st = wait_child(pid);
  if (res.timed_out)
    res.exit_code = -1;
  else if (WIFEXITED(st))
    res.exit_code = WEXITSTATUS(st);
  else if (WIFSIGNALED(st))
    res.exit_code = 128 + WTERMSIG(st);
  res.succeeded = !res.timed_out && res.exit_code == 0;

  if (opts.stdio == Stdio::Inherit && !err.empty())
    std::cerr << err << std::flush;

  res.standard_output = std::move(out);
  if (!res.succeeded) {
    if (res.timed_out)
      res.diagnostic_text =
          fmt::format("timed out after {} ms{}", opts.timeout->count(),
                      err.empty() ? std::string{} : "\n" + err);
    else if (!err.empty())
      res.diagnostic_text = std::move(err);
    else if (!res.standard_output.empty())
      res.diagnostic_text = res.standard_output;
    else
      res.diagnostic_text =
          fmt::format("command exited with code {}", res.exit_code);
  }

  spdlog::debug("[exec] rc={} {}", res.exit_code, command);
  return res;
}

std::string quote_double(const std::string &s) {
  std::string o;
  o.reserve(s.size() + 2);
  o.push_back('"');
  for (char c : s) {
    if (c == '"' || c == '\\' || c == '$' || c == '`')
      o.push_back('\\');
    o.push_back(c);
  }
  o.push_back('"');
  return o;
}

std::string shell_quote(const std::string &s) {
  std::string o = "'";
  for (char c : s) {
    if (c == '\'')
      o += "'\\''";
    else
      o.push_back(c);
  }
  o += "'";
  return o;
}

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  auto b = s.find_first_not_of(ws);
  if (b == std::string::npos)
    return {};
  auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

} // namespace gitauto
