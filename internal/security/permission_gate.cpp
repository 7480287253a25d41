#include "internal/security/permission_gate.hpp"

#include "internal/util/errors.hpp"

namespace vaultd::security {

PermissionLevel ParsePermissionLevel(const std::string& value) {
  if (value == "file-access") return PermissionLevel::kFileAccess;
  if (value == "full-access") return PermissionLevel::kFullAccess;
  return PermissionLevel::kSandboxed;
}

std::string ToString(PermissionLevel level) {
  switch (level) {
    case PermissionLevel::kFileAccess:
      return "file-access";
    case PermissionLevel::kFullAccess:
      return "full-access";
    case PermissionLevel::kSandboxed:
    default:
      return "sandboxed";
  }
}

PermissionGate::PermissionGate(std::shared_ptr<config::ConfigStore> config, std::shared_ptr<observability::EventLog> log)
    : config_(std::move(config)), log_(std::move(log)) {}

PermissionLevel PermissionGate::Level() const {
  return ParsePermissionLevel(config_->Get("permissions.level"));
}

std::string PermissionGate::BaseDir() const {
  return config_->Get("permissions.baseDir");
}

void PermissionGate::AssertFileAccess() const {
  if (Level() < PermissionLevel::kFileAccess) {
    Deny("Filesystem access requires \"file-access\" or \"full-access\" permission level");
  }
}

void PermissionGate::AssertFullAccess() const {
  if (Level() != PermissionLevel::kFullAccess) {
    Deny("Shell execution requires \"full-access\" permission level");
  }
}

void PermissionGate::Deny(const std::string& message) const {
  log_->Warn("access denied", {observability::StringField("reason", message)});
  throw util::AccessDenied(message);
}

} // namespace vaultd::security
