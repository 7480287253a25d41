#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "internal/observability/event_log.hpp"
#include "internal/security/permission_gate.hpp"

namespace vaultd::fs {

struct DirectoryEntry {
  std::string name;
  bool        is_directory     = false;
  uint64_t    size_bytes       = 0;
  int64_t     modified_at_ms   = 0; // 0 when stat failed
};

/*
  SandboxedFs

  Every operation:
    1. asserts file-access through the permission gate
    2. resolves the relative path with ResolvePath()
    3. performs the I/O and logs one line with the relative path

  Paths are relative to permissions.baseDir.
*/
class SandboxedFs {
 public:
  SandboxedFs(std::shared_ptr<security::PermissionGate> gate, std::shared_ptr<observability::EventLog> log);

  std::string Read(const std::string& relative_path);

  // Creates missing parent directories. Returns bytes written.
  uint64_t Write(const std::string& relative_path, const std::string& content);

  std::vector<DirectoryEntry> List(const std::string& relative_path);

  bool Exists(const std::string& relative_path);

  void Delete(const std::string& relative_path);

  void EnsureDir(const std::string& relative_path);

  // Gate check + path resolution without I/O. Denials are logged.
  std::filesystem::path Resolve(const std::string& relative_path) const;

  const security::PermissionGate& Gate() const {
    return *gate_;
  }

 private:
  std::shared_ptr<security::PermissionGate> gate_;
  std::shared_ptr<observability::EventLog>  log_;
};

} // namespace vaultd::fs
