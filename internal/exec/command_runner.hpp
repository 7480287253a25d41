#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/exec/process_launcher.hpp"
#include "internal/observability/event_log.hpp"
#include "internal/security/permission_gate.hpp"

namespace vaultd::exec {

struct RunOptions {
  std::optional<std::string> cwd;        // relative to permissions.baseDir
  std::optional<int64_t>     timeout_ms; // <= 0 means default
};

struct CommandResult {
  std::string              command;
  std::vector<std::string> args;
  std::string              stdout_text;
  std::string              stderr_text;
  int                      exit_code   = 0;
  int64_t                  duration_ms = 0;
  bool                     truncated   = false;
};

/*
  CommandRunner

  Allowlisted, shell-free command execution inside the base directory.

  Checks, in order, before anything is spawned:
    - permission level is full-access
    - basename(command) is allowlisted
    - no argument contains "$(" or "`"
    - cwd resolves inside permissions.baseDir
*/
class CommandRunner {
 public:
  static constexpr uint32_t kMaxTimeoutMs    = 30000;
  static constexpr uint32_t kHardKillGraceMs = 1000;
  static constexpr size_t   kMaxOutputBytes  = 1048576;

  CommandRunner(std::shared_ptr<security::PermissionGate> gate, std::shared_ptr<ProcessLauncher> launcher, std::shared_ptr<observability::EventLog> log);

  CommandResult Run(const std::string& command, const std::vector<std::string>& args, const RunOptions& options = {});

  static const std::vector<std::string>& AllowedCommands();

  // ----------------------------------------------------------------
  // Shorthands
  // ----------------------------------------------------------------

  CommandResult GitStatus(const std::optional<std::string>& cwd = std::nullopt);
  CommandResult GitLog(int limit = 10, const std::optional<std::string>& cwd = std::nullopt);
  CommandResult Ripgrep(const std::string& pattern, const std::optional<std::string>& search_path = std::nullopt, const std::optional<std::string>& cwd = std::nullopt);
  CommandResult FindFiles(const std::string& name_pattern, int max_depth = 0, const std::optional<std::string>& cwd = std::nullopt);
  CommandResult WordCount(const std::string& file_path);

 private:
  std::shared_ptr<security::PermissionGate> gate_;
  std::shared_ptr<ProcessLauncher>          launcher_;
  std::shared_ptr<observability::EventLog>  log_;
};

} // namespace vaultd::exec
