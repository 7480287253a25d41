#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace vaultd::config { class ConfigStore; }
namespace vaultd::observability { class EventLog; }
namespace vaultd::db { class NotesStore; }
namespace vaultd::security { class PermissionGate; }
namespace vaultd::fs { class SandboxedFs; class MarkdownSync; }
namespace vaultd::exec { class CommandRunner; }
namespace vaultd::llm { class LanguageModel; }

namespace vaultd::runtime {

using ModelProvider = std::function<std::shared_ptr<::vaultd::llm::LanguageModel>()>;

/*
  Everything a task or the control service may touch.

  Built once by the factory and passed by reference; there is no global
  instance. The cancellation flag is raised by Scheduler::Stop() and
  polled by long-running tasks between model calls.
*/
struct Context {
  // Fully qualified: the generated bootstrap config lives in
  // vaultd::runtime::config.
  std::shared_ptr<::vaultd::config::ConfigStore>      config;
  std::shared_ptr<::vaultd::observability::EventLog>  log;
  std::shared_ptr<::vaultd::db::NotesStore>           notes;
  std::shared_ptr<::vaultd::security::PermissionGate> gate;
  std::shared_ptr<::vaultd::fs::SandboxedFs>          fs;
  std::shared_ptr<::vaultd::fs::MarkdownSync>         sync;
  std::shared_ptr<::vaultd::exec::CommandRunner>      shell;

  // Throws util::ModelError when no model is usable.
  ModelProvider resolve_model;

  std::atomic<bool> cancel_requested{false};

  bool CancelRequested() const {
    return cancel_requested.load();
  }

  // vault.activeId, nullopt when unset
  std::optional<std::string> ActiveVaultId() const;
};

} // namespace vaultd::runtime
