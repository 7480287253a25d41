#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace vaultd::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace vaultd::grpc
