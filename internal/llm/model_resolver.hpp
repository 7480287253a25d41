#pragma once

#include <memory>
#include <string>

#include "internal/config/config_store.hpp"
#include "internal/llm/language_model.hpp"
#include "internal/net/http_client.hpp"
#include "internal/observability/event_log.hpp"

namespace vaultd::llm {

/*
  ModelResolver

  Picks the language model from the llm.* config keys on every call.

    llm.mode = local : Ollama after a GET {base}/api/tags probe. When the
                       probe fails and llm.allowCloudFallback is true with
                       an llm.apiKey, the hosted provider is used instead
                       and a warning is logged.
    llm.mode = api   : the hosted provider named by llm.provider
                       (openai | anthropic).

  Throws util::ModelError when nothing usable is configured.
*/
class ModelResolver {
 public:
  static constexpr long kProbeTimeoutMs = 3000;

  ModelResolver(std::shared_ptr<config::ConfigStore> config, std::shared_ptr<net::HttpClient> http, std::shared_ptr<observability::EventLog> log);

  std::shared_ptr<LanguageModel> Resolve();

 private:
  std::shared_ptr<LanguageModel> ResolveLocal(long timeout_ms);
  std::shared_ptr<LanguageModel> ResolveHosted(long timeout_ms);

  std::shared_ptr<config::ConfigStore>     config_;
  std::shared_ptr<net::HttpClient>         http_;
  std::shared_ptr<observability::EventLog> log_;
};

} // namespace vaultd::llm
