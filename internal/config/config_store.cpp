#include "config_store.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

#include "internal/util/time.hpp"

namespace vaultd::config {

const std::map<std::string, std::string>& ConfigStore::Defaults() {
  static const std::map<std::string, std::string> kDefaults = {
      // language model
      {"llm.mode", "local"}, // local | api
      {"llm.provider", "anthropic"}, // openai | anthropic
      {"llm.apiKey", ""},
      {"llm.ollamaBaseUrl", "http://localhost:11434"},
      {"llm.ollamaModel", "llama3.1"},
      {"llm.openaiModel", "gpt-4o"},
      {"llm.anthropicModel", "claude-sonnet-4-20250514"},
      {"llm.allowCloudFallback", "false"},
      {"llm.requestTimeoutMs", "120000"},

      // task intervals are minutes
      {"task.connectionFinder.interval", "480"},
      {"task.connectionFinder.enabled", "true"},
      {"task.dailyBrief.interval", "60"},
      {"task.dailyBrief.hour", "8"},
      {"task.dailyBrief.enabled", "true"},
      {"task.autoOrganizer.interval", "10080"},
      {"task.autoOrganizer.enabled", "true"},
      {"task.researchAssistant.interval", "240"},
      {"task.researchAssistant.enabled", "true"},
      {"task.learningRunner.interval", "1440"},
      {"task.learningRunner.enabled", "true"},
      {"task.learningRunner.depth", "moderate"}, // shallow | moderate | deep
      {"task.learningRunner.maxIterations", "2"},
      {"task.learningRunner.continueOnParseFailure", "false"},

      // sandbox
      {"permissions.level", "sandboxed"}, // sandboxed | file-access | full-access
      {"permissions.baseDir", ""},

      {"vault.activeId", ""},
  };
  return kDefaults;
}

ConfigStore::ConfigStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {}

std::string ConfigStore::Get(const std::string& key) const {
  std::optional<std::string> stored;
  {
    auto tx = repository_->Begin();
    stored  = repository_->GetConfigValue(*tx, key);
    tx->Commit();
  }
  if (stored) return *stored;

  const auto& defaults = Defaults();
  auto        it       = defaults.find(key);
  return it == defaults.end() ? std::string() : it->second;
}

double ConfigStore::GetNumber(const std::string& key) const {
  const std::string value = Get(key);
  const double      parsed = std::strtod(value.c_str(), nullptr);
  return std::isfinite(parsed) ? parsed : 0.0;
}

int ConfigStore::GetInt(const std::string& key, int lo, int hi) const {
  const double value = std::clamp(std::trunc(GetNumber(key)), static_cast<double>(lo), static_cast<double>(hi));
  return static_cast<int>(value);
}

bool ConfigStore::GetBool(const std::string& key) const {
  return Get(key) == "true";
}

void ConfigStore::Set(const std::string& key, const std::string& value) {
  SetMany({{key, value}});
}

void ConfigStore::SetMany(const std::map<std::string, std::string>& values) {
  const int64_t now = util::ToUnixMillis(util::Now());

  auto tx = repository_->Begin();
  for (const auto& [key, value] : values) {
    db::ThrowIfError(repository_->UpsertConfig(*tx, {key, value, now}), "config update failed for " + key);
  }
  tx->Commit();
}

std::map<std::string, std::string> ConfigStore::GetAll() const {
  std::map<std::string, std::string> merged = Defaults();

  auto tx = repository_->Begin();
  for (const auto& entry : repository_->ListConfig(*tx)) {
    merged[entry.key] = entry.value;
  }
  tx->Commit();

  return merged;
}

} // namespace vaultd::config
