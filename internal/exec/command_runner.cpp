#include "internal/exec/command_runner.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>

#include "internal/fs/path_guard.hpp"
#include "internal/util/errors.hpp"

namespace vaultd::exec {

using observability::IntField;
using observability::StringField;

namespace {

std::string JoinAllowed() {
  std::string out;
  for (const auto& name : CommandRunner::AllowedCommands()) {
    if (!out.empty()) out += ", ";
    out += name;
  }
  return out;
}

std::vector<std::string> MinimalEnvironment() {
  const char* path = std::getenv("PATH");
  const char* home = std::getenv("HOME");
  return {
      std::string("PATH=") + (path ? path : "/usr/local/bin:/usr/bin:/bin"),
      std::string("HOME=") + (home ? home : ""),
      "LANG=en_US.UTF-8",
  };
}

} // namespace

const std::vector<std::string>& CommandRunner::AllowedCommands() {
  static const std::vector<std::string> kAllowed = {
      "git", "rg", "find", "ls", "cat", "head", "tail", "wc", "grep", "diff", "tree", "stat", "file", "which", "echo",
  };
  return kAllowed;
}

CommandRunner::CommandRunner(std::shared_ptr<security::PermissionGate> gate, std::shared_ptr<ProcessLauncher> launcher, std::shared_ptr<observability::EventLog> log)
    : gate_(std::move(gate)), launcher_(std::move(launcher)), log_(std::move(log)) {}

CommandResult CommandRunner::Run(const std::string& command, const std::vector<std::string>& args, const RunOptions& options) {
  gate_->AssertFullAccess();

  const std::string base_name = std::filesystem::path(command).filename().string();
  const auto&       allowed   = AllowedCommands();
  if (std::find(allowed.begin(), allowed.end(), base_name) == allowed.end()) {
    gate_->Deny("Command \"" + base_name + "\" is not allowlisted. Allowed: " + JoinAllowed());
  }

  for (const auto& arg : args) {
    if (arg.find("$(") != std::string::npos || arg.find('`') != std::string::npos) {
      gate_->Deny("Suspicious argument rejected: \"" + arg + "\"");
    }
  }

  const std::string base_dir = gate_->BaseDir();
  if (base_dir.empty()) {
    gate_->Deny("No base directory configured for shell execution");
  }

  std::filesystem::path cwd;
  try {
    cwd = fs::ResolvePath(base_dir, options.cwd.value_or(""));
  } catch (const util::AccessDenied&) {
    gate_->Deny("Working directory \"" + options.cwd.value_or("") + "\" resolves outside base directory");
  }

  uint32_t timeout_ms = kMaxTimeoutMs;
  if (options.timeout_ms && *options.timeout_ms > 0) {
    timeout_ms = static_cast<uint32_t>(std::min<int64_t>(*options.timeout_ms, kMaxTimeoutMs));
  }

  log_->Info("shell:exec " + command,
             {IntField("args", static_cast<int64_t>(args.size())), StringField("cwd", cwd.string()), IntField("timeout_ms", timeout_ms)});

  LaunchSpec spec;
  spec.command          = command;
  spec.args             = args;
  spec.cwd              = cwd.string();
  spec.env              = MinimalEnvironment();
  spec.timeout_ms       = timeout_ms;
  spec.kill_grace_ms    = kHardKillGraceMs;
  spec.max_output_bytes = kMaxOutputBytes;

  const auto   start  = std::chrono::steady_clock::now();
  LaunchResult launch = launcher_->Launch(spec);
  const auto   end    = std::chrono::steady_clock::now();

  CommandResult result;
  result.command     = command;
  result.args        = args;
  result.stdout_text = std::move(launch.stdout_text);
  result.stderr_text = std::move(launch.stderr_text);
  result.exit_code   = launch.exit_code;
  result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
  result.truncated   = launch.truncated;

  log_->Info("shell:done " + command,
             {IntField("duration_ms", result.duration_ms),
              IntField("exit", result.exit_code),
              IntField("stdout_len", static_cast<int64_t>(result.stdout_text.size())),
              IntField("stderr_len", static_cast<int64_t>(result.stderr_text.size())),
              observability::BoolField("timed_out", launch.timed_out)});

  return result;
}

// ------------------------------------------------------------------
// Shorthands
// ------------------------------------------------------------------

CommandResult CommandRunner::GitStatus(const std::optional<std::string>& cwd) {
  return Run("git", {"status", "--porcelain"}, {cwd, std::nullopt});
}

CommandResult CommandRunner::GitLog(int limit, const std::optional<std::string>& cwd) {
  return Run("git", {"log", "--oneline", "-" + std::to_string(limit)}, {cwd, std::nullopt});
}

CommandResult CommandRunner::Ripgrep(const std::string& pattern, const std::optional<std::string>& search_path, const std::optional<std::string>& cwd) {
  std::vector<std::string> args = {"--max-count=100", "--no-heading", pattern};
  if (search_path) args.push_back(*search_path);
  return Run("rg", args, {cwd, std::nullopt});
}

CommandResult CommandRunner::FindFiles(const std::string& name_pattern, int max_depth, const std::optional<std::string>& cwd) {
  std::vector<std::string> args = {".", "-name", name_pattern, "-type", "f"};
  if (max_depth > 0) {
    args.push_back("-maxdepth");
    args.push_back(std::to_string(max_depth));
  }
  return Run("find", args, {cwd, std::nullopt});
}

CommandResult CommandRunner::WordCount(const std::string& file_path) {
  return Run("wc", {"-l", "-w", file_path});
}

} // namespace vaultd::exec
