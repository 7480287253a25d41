#include "control_server.hpp"

#include "grpc_error.hpp"

namespace vaultd::grpc {

using namespace vaultd::daemon::v1;

ControlServer::ControlServer(std::shared_ptr<vaultd::service::ControlService> svc) : service_(std::move(svc)) {
}

::grpc::Status ControlServer::GetStatus(::grpc::ServerContext*, const GetStatusRequest* req, GetStatusResponse* resp) {
  try {
    *resp = service_->GetStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::GetConfig(::grpc::ServerContext*, const GetConfigRequest* req, GetConfigResponse* resp) {
  try {
    *resp = service_->GetConfig(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::UpdateConfig(::grpc::ServerContext*, const UpdateConfigRequest* req, UpdateConfigResponse* resp) {
  try {
    *resp = service_->UpdateConfig(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::ListEvents(::grpc::ServerContext*, const ListEventsRequest* req, ListEventsResponse* resp) {
  try {
    *resp = service_->ListEvents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::Stop(::grpc::ServerContext*, const StopRequest* req, StopResponse* resp) {
  try {
    *resp = service_->Stop(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::ReadFile(::grpc::ServerContext*, const ReadFileRequest* req, ReadFileResponse* resp) {
  try {
    *resp = service_->ReadFile(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::WriteFile(::grpc::ServerContext*, const WriteFileRequest* req, WriteFileResponse* resp) {
  try {
    *resp = service_->WriteFile(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::ListDirectory(::grpc::ServerContext*, const ListDirectoryRequest* req, ListDirectoryResponse* resp) {
  try {
    *resp = service_->ListDirectory(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::FileExists(::grpc::ServerContext*, const FileExistsRequest* req, FileExistsResponse* resp) {
  try {
    *resp = service_->FileExists(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::DeleteFile(::grpc::ServerContext*, const DeleteFileRequest* req, DeleteFileResponse* resp) {
  try {
    *resp = service_->DeleteFile(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::SyncExport(::grpc::ServerContext*, const SyncExportRequest* req, SyncExportResponse* resp) {
  try {
    *resp = service_->SyncExport(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::SyncImport(::grpc::ServerContext*, const SyncImportRequest* req, SyncImportResponse* resp) {
  try {
    *resp = service_->SyncImport(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::ExecCommand(::grpc::ServerContext*, const ExecCommandRequest* req, ExecCommandResponse* resp) {
  try {
    *resp = service_->ExecCommand(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::ListAllowedCommands(::grpc::ServerContext*, const ListAllowedCommandsRequest* req, ListAllowedCommandsResponse* resp) {
  try {
    *resp = service_->ListAllowedCommands(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ControlServer::GetPermissions(::grpc::ServerContext*, const GetPermissionsRequest* req, GetPermissionsResponse* resp) {
  try {
    *resp = service_->GetPermissions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace vaultd::grpc
