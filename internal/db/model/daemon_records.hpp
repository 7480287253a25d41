#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace vaultd::db::model {

struct ConfigEntryRecord {
  std::string key;
  std::string value;
  int64_t     updated_at_ms = 0;
};

/*
  Single status row polled by external tools.

  Never read back for control decisions.
*/
struct StatusRecord {
  int64_t                    pid   = 0;
  std::string                state = "stopped"; // running | stopped
  std::optional<std::string> current_task;
  std::optional<int64_t>     started_at_ms;
  int64_t                    updated_at_ms = 0;
};

// Append-only; rows are never updated or deleted by the daemon.
struct EventRecord {
  int64_t                    id = 0; // assigned on append
  std::string                event_type;
  std::optional<std::string> task_name;
  std::string                payload_json;
  int64_t                    created_at_ms = 0;
};

} // namespace vaultd::db::model
