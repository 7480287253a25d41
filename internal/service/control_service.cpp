#include "control_service.hpp"

#include <unistd.h>

#include <thread>
#include <utility>

#include "internal/config/config_store.hpp"
#include "internal/exec/command_runner.hpp"
#include "internal/fs/markdown_sync.hpp"
#include "internal/fs/sandboxed_fs.hpp"
#include "internal/observability/event_log.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/context.hpp"
#include "internal/scheduler/scheduler.hpp"
#include "internal/security/permission_gate.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace vaultd::service {

using namespace vaultd::daemon::v1;

namespace {

// Logs the failure with its route and rethrows.
template <typename Fn>
auto Guarded(const char* route, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const std::exception& ex) {
    VAULTD_LOG_ERROR("RPC failed", {vaultd::observability::StringField("route", route), vaultd::observability::StringField("error", ex.what())});
    throw;
  }
}

TaskResult ToProto(scheduler::TaskResult result) {
  switch (result) {
    case scheduler::TaskResult::kPending:
      return TASK_RESULT_PENDING;
    case scheduler::TaskResult::kSuccess:
      return TASK_RESULT_SUCCESS;
    case scheduler::TaskResult::kError:
      return TASK_RESULT_ERROR;
  }
  return TASK_RESULT_UNSPECIFIED;
}

PermissionLevel ToProto(security::PermissionLevel level) {
  switch (level) {
    case security::PermissionLevel::kSandboxed:
      return PERMISSION_LEVEL_SANDBOXED;
    case security::PermissionLevel::kFileAccess:
      return PERMISSION_LEVEL_FILE_ACCESS;
    case security::PermissionLevel::kFullAccess:
      return PERMISSION_LEVEL_FULL_ACCESS;
  }
  return PERMISSION_LEVEL_UNSPECIFIED;
}

} // namespace

ControlService::ControlService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::string ControlService::VaultOrActive(const std::string& vault_id) const {
  if (!vault_id.empty()) return vault_id;
  if (auto active = ctx_.runtime->ActiveVaultId()) return *active;
  throw util::InvalidArgument("No active vault");
}

GetStatusResponse ControlService::GetStatus(const GetStatusRequest&) {
  return Guarded("ControlService.GetStatus", [&] {
    GetStatusResponse resp;
    const auto        status = ctx_.scheduler->Status();

    resp.set_running(status.running);
    if (status.current_task) resp.set_current_task(*status.current_task);
    resp.set_pid(static_cast<int64_t>(::getpid()));

    if (status.started_at_ms) {
      const int64_t elapsed = util::ToUnixMillis(util::Now()) - *status.started_at_ms;
      resp.set_uptime_seconds(elapsed > 0 ? static_cast<double>(elapsed) / 1000.0 : 0.0);
    }

    for (const auto& task : status.tasks) {
      auto* out = resp.add_tasks();
      out->set_name(task.name);
      out->set_description(task.description);
      out->set_last_result(ToProto(task.state.last_result));
      if (task.state.last_run_at_ms > 0) {
        *out->mutable_last_run_at() = util::ToProto(util::FromUnixMillis(task.state.last_run_at_ms));
      }
      if (task.state.last_error) out->set_last_error(*task.state.last_error);
    }
    return resp;
  });
}

GetConfigResponse ControlService::GetConfig(const GetConfigRequest&) {
  return Guarded("ControlService.GetConfig", [&] {
    GetConfigResponse resp;
    for (const auto& [key, value] : ctx_.runtime->config->GetAll()) {
      (*resp.mutable_values())[key] = value;
    }
    return resp;
  });
}

UpdateConfigResponse ControlService::UpdateConfig(const UpdateConfigRequest& req) {
  return Guarded("ControlService.UpdateConfig", [&] {
    std::map<std::string, std::string> values;
    for (const auto& [key, value] : req.values()) {
      if (key.empty()) throw util::InvalidArgument("config key must not be empty");
      values.emplace(key, value);
    }

    ctx_.runtime->config->SetMany(values);
    ctx_.runtime->log->Info("Config updated", {vaultd::observability::IntField("keys", static_cast<int64_t>(values.size()))});

    UpdateConfigResponse resp;
    resp.set_ok(true);
    return resp;
  });
}

ListEventsResponse ControlService::ListEvents(const ListEventsRequest& req) {
  return Guarded("ControlService.ListEvents", [&] {
    uint32_t limit = req.limit() == 0 ? kDefaultEventLimit : req.limit();
    if (limit > kMaxEventLimit) limit = kMaxEventLimit;

    ListEventsResponse resp;
    for (const auto& event : ctx_.runtime->log->Recent(limit)) {
      auto* out = resp.add_events();
      out->set_id(event.id);
      out->set_event_type(event.event_type);
      if (event.task_name) out->set_task_name(*event.task_name);
      out->set_payload_json(event.payload_json);
      *out->mutable_created_at() = util::ToProto(util::FromUnixMillis(event.created_at_ms));
    }
    return resp;
  });
}

StopResponse ControlService::Stop(const StopRequest&) {
  return Guarded("ControlService.Stop", [&] {
    ctx_.runtime->log->Info("Stop requested via control surface");

    if (ctx_.request_shutdown) {
      std::thread([shutdown = ctx_.request_shutdown] {
        std::this_thread::sleep_for(kShutdownDelay);
        shutdown();
      }).detach();
    }

    StopResponse resp;
    resp.set_ok(true);
    resp.set_message("Daemon shutting down");
    return resp;
  });
}

ReadFileResponse ControlService::ReadFile(const ReadFileRequest& req) {
  return Guarded("ControlService.ReadFile", [&] {
    if (req.path().empty()) throw util::InvalidArgument("path is required");
    ReadFileResponse resp;
    resp.set_content(ctx_.runtime->fs->Read(req.path()));
    return resp;
  });
}

WriteFileResponse ControlService::WriteFile(const WriteFileRequest& req) {
  return Guarded("ControlService.WriteFile", [&] {
    if (req.path().empty()) throw util::InvalidArgument("path is required");
    WriteFileResponse resp;
    resp.set_bytes_written(ctx_.runtime->fs->Write(req.path(), req.content()));
    return resp;
  });
}

ListDirectoryResponse ControlService::ListDirectory(const ListDirectoryRequest& req) {
  return Guarded("ControlService.ListDirectory", [&] {
    ListDirectoryResponse resp;
    for (const auto& entry : ctx_.runtime->fs->List(req.path().empty() ? "." : req.path())) {
      auto* out = resp.add_entries();
      out->set_name(entry.name);
      out->set_is_directory(entry.is_directory);
      out->set_size_bytes(entry.size_bytes);
      if (entry.modified_at_ms > 0) {
        *out->mutable_modified_at() = util::ToProto(util::FromUnixMillis(entry.modified_at_ms));
      }
    }
    return resp;
  });
}

FileExistsResponse ControlService::FileExists(const FileExistsRequest& req) {
  return Guarded("ControlService.FileExists", [&] {
    if (req.path().empty()) throw util::InvalidArgument("path is required");
    FileExistsResponse resp;
    resp.set_exists(ctx_.runtime->fs->Exists(req.path()));
    return resp;
  });
}

DeleteFileResponse ControlService::DeleteFile(const DeleteFileRequest& req) {
  return Guarded("ControlService.DeleteFile", [&] {
    if (req.path().empty()) throw util::InvalidArgument("path is required");
    ctx_.runtime->fs->Delete(req.path());
    return DeleteFileResponse{};
  });
}

SyncExportResponse ControlService::SyncExport(const SyncExportRequest& req) {
  return Guarded("ControlService.SyncExport", [&] {
    const auto result = ctx_.runtime->sync->Export(VaultOrActive(req.vault_id()), req.sub_dir());

    SyncExportResponse resp;
    resp.set_exported(static_cast<uint32_t>(result.exported));
    resp.set_dir(result.dir);
    return resp;
  });
}

SyncImportResponse ControlService::SyncImport(const SyncImportRequest& req) {
  return Guarded("ControlService.SyncImport", [&] {
    const auto result = ctx_.runtime->sync->Import(VaultOrActive(req.vault_id()), req.sub_dir());

    SyncImportResponse resp;
    resp.set_imported(static_cast<uint32_t>(result.imported));
    resp.set_updated(static_cast<uint32_t>(result.updated));
    return resp;
  });
}

ExecCommandResponse ControlService::ExecCommand(const ExecCommandRequest& req) {
  return Guarded("ControlService.ExecCommand", [&] {
    if (req.command().empty()) throw util::InvalidArgument("command is required");

    exec::RunOptions options;
    if (!req.cwd().empty()) options.cwd = req.cwd();
    if (req.timeout_ms() > 0) options.timeout_ms = static_cast<int64_t>(req.timeout_ms());

    const std::vector<std::string> args(req.args().begin(), req.args().end());
    const auto                     result = ctx_.runtime->shell->Run(req.command(), args, options);

    ExecCommandResponse resp;
    resp.set_command(result.command);
    for (const auto& arg : result.args) resp.add_args(arg);
    resp.set_stdout(result.stdout_text);
    resp.set_stderr(result.stderr_text);
    resp.set_exit_code(result.exit_code);
    resp.set_duration_ms(static_cast<uint64_t>(result.duration_ms));
    resp.set_truncated(result.truncated);
    return resp;
  });
}

ListAllowedCommandsResponse ControlService::ListAllowedCommands(const ListAllowedCommandsRequest&) {
  ListAllowedCommandsResponse resp;
  for (const auto& command : exec::CommandRunner::AllowedCommands()) {
    resp.add_commands(command);
  }
  return resp;
}

GetPermissionsResponse ControlService::GetPermissions(const GetPermissionsRequest&) {
  return Guarded("ControlService.GetPermissions", [&] {
    const auto level = ctx_.runtime->gate->Level();
    const bool files = level >= security::PermissionLevel::kFileAccess;

    GetPermissionsResponse resp;
    resp.set_level(ToProto(level));
    resp.set_base_dir(ctx_.runtime->gate->BaseDir());

    auto* caps = resp.mutable_capabilities();
    caps->set_sqlite(true);
    caps->set_llm(true);
    caps->set_file_read(files);
    caps->set_file_write(files);
    caps->set_shell(level == security::PermissionLevel::kFullAccess);
    caps->set_markdown_sync(files);
    return resp;
  });
}

} // namespace vaultd::service
