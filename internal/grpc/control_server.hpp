#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/control_service.hpp"
#include "vaultd/daemon/v1.hpp"

namespace vaultd::grpc {

class ControlServer final : public vaultd::daemon::v1::DaemonControlService::Service {
 public:
  explicit ControlServer(std::shared_ptr<vaultd::service::ControlService> svc);

  ::grpc::Status GetStatus(::grpc::ServerContext*, const vaultd::daemon::v1::GetStatusRequest*, vaultd::daemon::v1::GetStatusResponse*) override;
  ::grpc::Status GetConfig(::grpc::ServerContext*, const vaultd::daemon::v1::GetConfigRequest*, vaultd::daemon::v1::GetConfigResponse*) override;
  ::grpc::Status UpdateConfig(::grpc::ServerContext*, const vaultd::daemon::v1::UpdateConfigRequest*, vaultd::daemon::v1::UpdateConfigResponse*) override;
  ::grpc::Status ListEvents(::grpc::ServerContext*, const vaultd::daemon::v1::ListEventsRequest*, vaultd::daemon::v1::ListEventsResponse*) override;
  ::grpc::Status Stop(::grpc::ServerContext*, const vaultd::daemon::v1::StopRequest*, vaultd::daemon::v1::StopResponse*) override;
  ::grpc::Status ReadFile(::grpc::ServerContext*, const vaultd::daemon::v1::ReadFileRequest*, vaultd::daemon::v1::ReadFileResponse*) override;
  ::grpc::Status WriteFile(::grpc::ServerContext*, const vaultd::daemon::v1::WriteFileRequest*, vaultd::daemon::v1::WriteFileResponse*) override;
  ::grpc::Status ListDirectory(::grpc::ServerContext*, const vaultd::daemon::v1::ListDirectoryRequest*, vaultd::daemon::v1::ListDirectoryResponse*) override;
  ::grpc::Status FileExists(::grpc::ServerContext*, const vaultd::daemon::v1::FileExistsRequest*, vaultd::daemon::v1::FileExistsResponse*) override;
  ::grpc::Status DeleteFile(::grpc::ServerContext*, const vaultd::daemon::v1::DeleteFileRequest*, vaultd::daemon::v1::DeleteFileResponse*) override;
  ::grpc::Status SyncExport(::grpc::ServerContext*, const vaultd::daemon::v1::SyncExportRequest*, vaultd::daemon::v1::SyncExportResponse*) override;
  ::grpc::Status SyncImport(::grpc::ServerContext*, const vaultd::daemon::v1::SyncImportRequest*, vaultd::daemon::v1::SyncImportResponse*) override;
  ::grpc::Status ExecCommand(::grpc::ServerContext*, const vaultd::daemon::v1::ExecCommandRequest*, vaultd::daemon::v1::ExecCommandResponse*) override;
  ::grpc::Status ListAllowedCommands(::grpc::ServerContext*, const vaultd::daemon::v1::ListAllowedCommandsRequest*, vaultd::daemon::v1::ListAllowedCommandsResponse*) override;
  ::grpc::Status GetPermissions(::grpc::ServerContext*, const vaultd::daemon::v1::GetPermissionsRequest*, vaultd::daemon::v1::GetPermissionsResponse*) override;

 private:
  std::shared_ptr<vaultd::service::ControlService> service_;
};

} // namespace vaultd::grpc
