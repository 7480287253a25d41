#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace vaultd::runtime::config {
class RuntimeConfig;
}

namespace vaultd::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const vaultd::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});
void Log(spdlog::level::level_enum level, std::string_view message, const std::vector<LogField>& fields);

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace vaultd::observability

#define VAULTD_LOG_INFO(message, ...) ::vaultd::observability::LogInfo((message), ##__VA_ARGS__)
#define VAULTD_LOG_WARN(message, ...) ::vaultd::observability::LogWarn((message), ##__VA_ARGS__)
#define VAULTD_LOG_ERROR(message, ...) ::vaultd::observability::LogError((message), ##__VA_ARGS__)
