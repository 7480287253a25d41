#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace vaultd::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace vaultd::util;

  if (dynamic_cast<const AccessDenied*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace vaultd::grpc
