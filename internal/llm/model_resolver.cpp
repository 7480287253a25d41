#include "internal/llm/model_resolver.hpp"

#include <stdexcept>

#include "internal/llm/provider_models.hpp"
#include "internal/util/errors.hpp"

namespace vaultd::llm {

using observability::StringField;

namespace {

constexpr int kMaxRequestTimeoutMs = 600000;

} // namespace

ModelResolver::ModelResolver(std::shared_ptr<config::ConfigStore> config, std::shared_ptr<net::HttpClient> http, std::shared_ptr<observability::EventLog> log)
    : config_(std::move(config)), http_(std::move(http)), log_(std::move(log)) {}

std::shared_ptr<LanguageModel> ModelResolver::Resolve() {
  const std::string mode       = config_->Get("llm.mode");
  const long        timeout_ms = static_cast<long>(config_->GetInt("llm.requestTimeoutMs", 0, kMaxRequestTimeoutMs));

  if (mode == "api") {
    return ResolveHosted(timeout_ms);
  }

  try {
    return ResolveLocal(timeout_ms);
  } catch (const util::ModelError& e) {
    if (config_->GetBool("llm.allowCloudFallback") && !config_->Get("llm.apiKey").empty()) {
      log_->Warn("Local LLM failed, falling back to cloud API", {StringField("error", e.what())});
      return ResolveHosted(timeout_ms);
    }
    throw;
  }
}

std::shared_ptr<LanguageModel> ModelResolver::ResolveLocal(long timeout_ms) {
  ProviderSettings settings;
  settings.base_url   = config_->Get("llm.ollamaBaseUrl");
  settings.model      = config_->Get("llm.ollamaModel");
  settings.timeout_ms = timeout_ms > 0 ? timeout_ms : 120000;

  if (settings.base_url.empty()) {
    throw util::ModelError("llm.ollamaBaseUrl is not configured");
  }

  std::string probe_url = settings.base_url;
  while (!probe_url.empty() && probe_url.back() == '/') probe_url.pop_back();
  probe_url += "/api/tags";

  net::HttpResponse probe;
  try {
    probe = http_->Get(probe_url, kProbeTimeoutMs);
  } catch (const std::runtime_error& e) {
    throw util::ModelError("Ollama unreachable at " + settings.base_url + ": " + e.what());
  }
  if (probe.status != 200) {
    throw util::ModelError("Ollama probe returned HTTP " + std::to_string(probe.status));
  }

  return std::make_shared<OllamaModel>(http_, std::move(settings));
}

std::shared_ptr<LanguageModel> ModelResolver::ResolveHosted(long timeout_ms) {
  const std::string provider = config_->Get("llm.provider");

  ProviderSettings settings;
  settings.api_key    = config_->Get("llm.apiKey");
  settings.timeout_ms = timeout_ms > 0 ? timeout_ms : 120000;

  if (settings.api_key.empty()) {
    throw util::ModelError("llm.apiKey is required for provider " + provider);
  }

  if (provider == "openai") {
    settings.model = config_->Get("llm.openaiModel");
    return std::make_shared<OpenAIModel>(http_, std::move(settings));
  }
  if (provider == "anthropic") {
    settings.model = config_->Get("llm.anthropicModel");
    return std::make_shared<AnthropicModel>(http_, std::move(settings));
  }

  throw util::ModelError("unsupported llm.provider: " + provider);
}

} // namespace vaultd::llm
