#include "internal/observability/event_log.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <exception>

#include "internal/util/time.hpp"

namespace vaultd::observability {

namespace {

spdlog::level::level_enum ToSpdlogLevel(const std::string& level) {
  if (level == "warn") return spdlog::level::warn;
  if (level == "error") return spdlog::level::err;
  return spdlog::level::info;
}

std::string PayloadJson(const std::string& message, const std::vector<LogField>& fields) {
  google::protobuf::Struct payload;
  (*payload.mutable_fields())["message"].set_string_value(message);
  for (const auto& field : fields) {
    (*payload.mutable_fields())[field.key].set_string_value(field.value);
  }

  std::string json;
  if (!google::protobuf::util::MessageToJsonString(payload, &json).ok()) {
    return "{}";
  }
  return json;
}

} // namespace

EventLog::EventLog(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {}

void EventLog::Info(const std::string& message, std::initializer_list<LogField> fields) {
  Append("info", std::nullopt, message, fields);
}

void EventLog::Warn(const std::string& message, std::initializer_list<LogField> fields) {
  Append("warn", std::nullopt, message, fields);
}

void EventLog::Error(const std::string& message, std::initializer_list<LogField> fields) {
  Append("error", std::nullopt, message, fields);
}

void EventLog::Task(const std::string& task_name, const std::string& message, std::initializer_list<LogField> fields) {
  Append("info", task_name, message, fields);
}

std::vector<db::model::EventRecord> EventLog::Recent(uint32_t limit) const {
  auto tx     = repository_->Begin();
  auto events = repository_->ListRecentEvents(*tx, limit);
  tx->Commit();
  return events;
}

void EventLog::Append(const std::string& level, const std::optional<std::string>& task_name, const std::string& message, const std::vector<LogField>& fields) {
  const std::string prefix = "[" + task_name.value_or("daemon") + "] ";
  Log(ToSpdlogLevel(level), prefix + message, fields);

  db::model::EventRecord record;
  record.event_type    = level;
  record.task_name     = task_name;
  record.payload_json  = PayloadJson(message, fields);
  record.created_at_ms = util::ToUnixMillis(util::Now());

  try {
    auto tx     = repository_->Begin();
    auto result = repository_->AppendEvent(*tx, record);
    if (!result) {
      VAULTD_LOG_ERROR("event log append failed", {StringField("error", result.message)});
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    VAULTD_LOG_ERROR("event log append failed", {StringField("error", e.what())});
  }
}

} // namespace vaultd::observability
