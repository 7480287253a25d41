#include "internal/exec/process_launcher.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>

namespace vaultd::exec {

namespace {

constexpr int kPollIntervalMs = 20;
constexpr int kTimedOutExit   = 124;

// Keeps reading past the limit so the child never blocks on a full pipe.
void AppendLimited(std::string& dst, const char* src, ssize_t n, size_t limit, bool& truncated) {
  if (n <= 0) return;
  const size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const size_t take  = std::min<size_t>(static_cast<size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<size_t>(n)) {
    truncated = true;
  }
}

// Returns false once the pipe reached EOF.
bool Drain(int fd, std::string& dst, size_t limit, bool& truncated) {
  char buf[16384];
  while (true) {
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
      AppendLimited(dst, buf, n, limit, truncated);
      continue;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

void ClosePipe(int fds[2]) {
  if (fds[0] >= 0) close(fds[0]);
  if (fds[1] >= 0) close(fds[1]);
}

} // namespace

LaunchResult PosixProcessLauncher::Launch(const LaunchSpec& spec) {
  LaunchResult result;

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  // close-on-exec so children launched concurrently never inherit these ends
  if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0) {
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
  }

  // argv/envp are built before fork; the child only calls async-signal-safe functions
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.args.begin(), spec.args.end());
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all) argv.push_back(s.data());
  argv.push_back(nullptr);

  std::vector<std::string> envs = spec.env;
  std::vector<char*>       envp;
  envp.reserve(envs.size() + 1);
  for (auto& e : envs) envp.push_back(e.data());
  envp.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);
    throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
  }

  if (pid == 0) {
    setsid();
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    close(out_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[0]);
    close(err_pipe[1]);

    if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) {
      _exit(127);
    }

    execvpe(spec.command.c_str(), argv.data(), envp.data());

    const char* msg = "exec failed\n";
    ssize_t     ignored = write(STDERR_FILENO, msg, std::strlen(msg));
    (void)ignored;
    _exit(127);
  }

  close(out_pipe[1]);
  close(err_pipe[1]);
  fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
  fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

  const auto start         = std::chrono::steady_clock::now();
  const auto term_deadline = start + std::chrono::milliseconds(spec.timeout_ms);
  const auto kill_deadline = term_deadline + std::chrono::milliseconds(spec.kill_grace_ms);

  bool stdout_open = true;
  bool stderr_open = true;
  bool term_sent   = false;
  bool kill_sent   = false;
  int  status      = 0;
  bool exited      = false;

  while (!exited) {
    pollfd fds[2];
    nfds_t nfds = 0;
    if (stdout_open) fds[nfds++] = {out_pipe[0], POLLIN, 0};
    if (stderr_open) fds[nfds++] = {err_pipe[0], POLLIN, 0};

    if (nfds > 0) {
      poll(fds, nfds, kPollIntervalMs);
    } else {
      usleep(kPollIntervalMs * 1000);
    }

    if (stdout_open) stdout_open = Drain(out_pipe[0], result.stdout_text, spec.max_output_bytes, result.truncated);
    if (stderr_open) stderr_open = Drain(err_pipe[0], result.stderr_text, spec.max_output_bytes, result.truncated);

    pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid) {
      exited = true;
      break;
    }

    const auto now = std::chrono::steady_clock::now();
    if (spec.timeout_ms > 0 && !term_sent && now >= term_deadline) {
      kill(-pid, SIGTERM);
      result.timed_out = true;
      term_sent        = true;
    }
    if (term_sent && !kill_sent && now >= kill_deadline) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      kill_sent = true;
    }
  }

  // grandchildren may still hold the write ends; read what is buffered and stop
  if (stdout_open) Drain(out_pipe[0], result.stdout_text, spec.max_output_bytes, result.truncated);
  if (stderr_open) Drain(err_pipe[0], result.stderr_text, spec.max_output_bytes, result.truncated);
  close(out_pipe[0]);
  close(err_pipe[0]);

  if (result.timed_out) {
    result.exit_code = kTimedOutExit;
  } else if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

} // namespace vaultd::exec
