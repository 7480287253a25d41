#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"

namespace vaultd::observability {

/*
  Durable daemon log.

  Every call emits one console line through spdlog and appends one
  daemon_event_log row whose payload is {"message": ..., <fields>...}.
  A failed append is reported on the console and never thrown.

  Must not be called while the caller holds a repository transaction.
*/
class EventLog {
 public:
  explicit EventLog(std::shared_ptr<db::Repository> repository);

  void Info(const std::string& message, std::initializer_list<LogField> fields = {});
  void Warn(const std::string& message, std::initializer_list<LogField> fields = {});
  void Error(const std::string& message, std::initializer_list<LogField> fields = {});

  // Info-level entry attributed to a task.
  void Task(const std::string& task_name, const std::string& message, std::initializer_list<LogField> fields = {});

  std::vector<db::model::EventRecord> Recent(uint32_t limit) const;

 private:
  void Append(const std::string& level, const std::optional<std::string>& task_name, const std::string& message, const std::vector<LogField>& fields);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace vaultd::observability
