#pragma once

#include <chrono>

#include "service_context.hpp"
#include "vaultd/daemon/v1.hpp"

namespace vaultd::service {

/*
  ControlService

  Local control surface: status, configuration, event history and the
  gated filesystem, sync and process operations. Errors propagate as the
  util:: exception types; the gRPC adapter maps them to status codes.
*/
class ControlService {
 public:
  static constexpr uint32_t                  kDefaultEventLimit = 50;
  static constexpr uint32_t                  kMaxEventLimit     = 1000;
  static constexpr std::chrono::milliseconds kShutdownDelay{100};

  explicit ControlService(ServiceContext ctx);

  vaultd::daemon::v1::GetStatusResponse GetStatus(const vaultd::daemon::v1::GetStatusRequest& req);

  vaultd::daemon::v1::GetConfigResponse    GetConfig(const vaultd::daemon::v1::GetConfigRequest& req);
  vaultd::daemon::v1::UpdateConfigResponse UpdateConfig(const vaultd::daemon::v1::UpdateConfigRequest& req);

  vaultd::daemon::v1::ListEventsResponse ListEvents(const vaultd::daemon::v1::ListEventsRequest& req);

  // Acknowledges at once; shutdown begins kShutdownDelay later.
  vaultd::daemon::v1::StopResponse Stop(const vaultd::daemon::v1::StopRequest& req);

  vaultd::daemon::v1::ReadFileResponse      ReadFile(const vaultd::daemon::v1::ReadFileRequest& req);
  vaultd::daemon::v1::WriteFileResponse     WriteFile(const vaultd::daemon::v1::WriteFileRequest& req);
  vaultd::daemon::v1::ListDirectoryResponse ListDirectory(const vaultd::daemon::v1::ListDirectoryRequest& req);
  vaultd::daemon::v1::FileExistsResponse    FileExists(const vaultd::daemon::v1::FileExistsRequest& req);
  vaultd::daemon::v1::DeleteFileResponse    DeleteFile(const vaultd::daemon::v1::DeleteFileRequest& req);
  vaultd::daemon::v1::SyncExportResponse    SyncExport(const vaultd::daemon::v1::SyncExportRequest& req);
  vaultd::daemon::v1::SyncImportResponse    SyncImport(const vaultd::daemon::v1::SyncImportRequest& req);

  vaultd::daemon::v1::ExecCommandResponse         ExecCommand(const vaultd::daemon::v1::ExecCommandRequest& req);
  vaultd::daemon::v1::ListAllowedCommandsResponse ListAllowedCommands(const vaultd::daemon::v1::ListAllowedCommandsRequest& req);

  vaultd::daemon::v1::GetPermissionsResponse GetPermissions(const vaultd::daemon::v1::GetPermissionsRequest& req);

 private:
  std::string VaultOrActive(const std::string& vault_id) const;

  ServiceContext ctx_;
};

} // namespace vaultd::service
