#pragma once

#include <memory>
#include <string>

#include "internal/llm/language_model.hpp"
#include "internal/net/http_client.hpp"

namespace vaultd::llm {

struct ProviderSettings {
  std::string base_url;
  std::string model;
  std::string api_key;
  long        timeout_ms = 120000;
};

// Local Ollama server, POST {base}/api/chat with stream=false.
class OllamaModel final : public LanguageModel {
 public:
  OllamaModel(std::shared_ptr<net::HttpClient> http, ProviderSettings settings);

  std::string Generate(const GenerateRequest& request) override;
  std::string Describe() const override;

 private:
  std::shared_ptr<net::HttpClient> http_;
  ProviderSettings                 settings_;
};

// OpenAI chat completions.
class OpenAIModel final : public LanguageModel {
 public:
  static constexpr const char* kDefaultBaseUrl = "https://api.openai.com";

  OpenAIModel(std::shared_ptr<net::HttpClient> http, ProviderSettings settings);

  std::string Generate(const GenerateRequest& request) override;
  std::string Describe() const override;

 private:
  std::shared_ptr<net::HttpClient> http_;
  ProviderSettings                 settings_;
};

// Anthropic messages API.
class AnthropicModel final : public LanguageModel {
 public:
  static constexpr const char* kDefaultBaseUrl = "https://api.anthropic.com";
  static constexpr const char* kApiVersion     = "2023-06-01";

  AnthropicModel(std::shared_ptr<net::HttpClient> http, ProviderSettings settings);

  std::string Generate(const GenerateRequest& request) override;
  std::string Describe() const override;

 private:
  std::shared_ptr<net::HttpClient> http_;
  ProviderSettings                 settings_;
};

} // namespace vaultd::llm
