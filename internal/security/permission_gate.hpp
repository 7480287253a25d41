#pragma once

#include <memory>
#include <string>

#include "internal/config/config_store.hpp"
#include "internal/observability/event_log.hpp"

namespace vaultd::security {

// Ordered: each level includes the capabilities of the ones below it.
enum class PermissionLevel {
  kSandboxed  = 0,
  kFileAccess = 1,
  kFullAccess = 2,
};

// Unknown strings map to kSandboxed.
PermissionLevel ParsePermissionLevel(const std::string& value);
std::string     ToString(PermissionLevel level);

/*
  PermissionGate

  Reads permissions.level and permissions.baseDir from the config store on
  every call, so a level change applies to the next operation without a
  restart. Denials are written to the event log and thrown as
  util::AccessDenied.
*/
class PermissionGate {
 public:
  PermissionGate(std::shared_ptr<config::ConfigStore> config, std::shared_ptr<observability::EventLog> log);

  PermissionLevel Level() const;
  std::string     BaseDir() const;

  // level >= file-access
  void AssertFileAccess() const;

  // level == full-access
  void AssertFullAccess() const;

  // Logs the denial and throws util::AccessDenied(message).
  [[noreturn]] void Deny(const std::string& message) const;

 private:
  std::shared_ptr<config::ConfigStore>     config_;
  std::shared_ptr<observability::EventLog> log_;
};

} // namespace vaultd::security
