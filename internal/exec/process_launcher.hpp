#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vaultd::exec {

struct LaunchSpec {
  std::string              command; // looked up on PATH when it has no '/'
  std::vector<std::string> args;
  std::string              cwd;
  std::vector<std::string> env; // KEY=VALUE, the child's entire environment

  uint32_t timeout_ms       = 0; // SIGTERM to the process group
  uint32_t kill_grace_ms    = 0; // SIGKILL this long after timeout_ms
  size_t   max_output_bytes = 0; // per stream
};

struct LaunchResult {
  std::string stdout_text;
  std::string stderr_text;

  // exit status; 128 + signal when killed; 124 when timed out
  int  exit_code = 0;
  bool timed_out = false;
  bool truncated = false;
};

/*
  Spawns one process and waits for it.

  Implementations must never involve a shell: argv goes to exec as-is.
*/
class ProcessLauncher {
 public:
  virtual ~ProcessLauncher() = default;

  virtual LaunchResult Launch(const LaunchSpec& spec) = 0;
};

/*
  fork + execvpe with pipes for stdout/stderr.

  The child starts its own session so the timeout can signal the whole
  process group.
*/
class PosixProcessLauncher final : public ProcessLauncher {
 public:
  LaunchResult Launch(const LaunchSpec& spec) override;
};

} // namespace vaultd::exec
