#include "internal/llm/provider_models.hpp"

#include <stdexcept>

#include "internal/llm/json_body.hpp"
#include "internal/util/errors.hpp"

namespace vaultd::llm {

namespace {

constexpr size_t kErrorBodyPreview = 300;

std::string TrimSlash(std::string url) {
  while (!url.empty() && url.back() == '/') url.pop_back();
  return url;
}

net::HttpResponse Post(net::HttpClient& http, const std::string& provider, const std::string& url, const google::protobuf::Struct& body,
                       const net::HttpHeaders& headers, long timeout_ms) {
  net::HttpResponse response;
  try {
    response = http.PostJson(url, ToJson(body), headers, timeout_ms);
  } catch (const std::runtime_error& e) {
    throw util::ModelError(provider + " request failed: " + e.what());
  }

  if (response.status < 200 || response.status >= 300) {
    throw util::ModelError(provider + " returned HTTP " + std::to_string(response.status) + ": " + response.body.substr(0, kErrorBodyPreview));
  }
  return response;
}

const google::protobuf::Struct* StructAt(const google::protobuf::Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end() || !it->second.has_struct_value()) return nullptr;
  return &it->second.struct_value();
}

const google::protobuf::ListValue* ListAt(const google::protobuf::Struct& object, const std::string& key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end() || !it->second.has_list_value()) return nullptr;
  return &it->second.list_value();
}

} // namespace

// ------------------------------------------------------------------
// Ollama
// ------------------------------------------------------------------

OllamaModel::OllamaModel(std::shared_ptr<net::HttpClient> http, ProviderSettings settings) : http_(std::move(http)), settings_(std::move(settings)) {}

std::string OllamaModel::Generate(const GenerateRequest& request) {
  google::protobuf::Struct body;
  auto&                    fields = *body.mutable_fields();
  fields["model"].set_string_value(settings_.model);
  fields["stream"].set_bool_value(false);

  auto* messages = fields["messages"].mutable_list_value();
  *messages->add_values() = TextMessage("system", request.system);
  *messages->add_values() = TextMessage("user", request.user);

  auto& options = *fields["options"].mutable_struct_value()->mutable_fields();
  options["temperature"].set_number_value(request.temperature);
  options["num_predict"].set_number_value(request.max_tokens);

  const auto response = Post(*http_, "ollama", TrimSlash(settings_.base_url) + "/api/chat", body, {}, settings_.timeout_ms);
  const auto parsed   = ParseJsonObject(response.body, "ollama");

  const auto* message = StructAt(parsed, "message");
  if (!message) {
    throw util::ModelError("ollama: response has no message");
  }
  return StringAt(*message, "content");
}

std::string OllamaModel::Describe() const {
  return "ollama/" + settings_.model;
}

// ------------------------------------------------------------------
// OpenAI
// ------------------------------------------------------------------

OpenAIModel::OpenAIModel(std::shared_ptr<net::HttpClient> http, ProviderSettings settings) : http_(std::move(http)), settings_(std::move(settings)) {
  if (settings_.base_url.empty()) settings_.base_url = kDefaultBaseUrl;
}

std::string OpenAIModel::Generate(const GenerateRequest& request) {
  google::protobuf::Struct body;
  auto&                    fields = *body.mutable_fields();
  fields["model"].set_string_value(settings_.model);
  fields["temperature"].set_number_value(request.temperature);
  fields["max_tokens"].set_number_value(request.max_tokens);

  auto* messages = fields["messages"].mutable_list_value();
  *messages->add_values() = TextMessage("system", request.system);
  *messages->add_values() = TextMessage("user", request.user);

  const auto response = Post(*http_, "openai", TrimSlash(settings_.base_url) + "/v1/chat/completions", body, {{"Authorization", "Bearer " + settings_.api_key}},
                             settings_.timeout_ms);
  const auto parsed   = ParseJsonObject(response.body, "openai");

  const auto* choices = ListAt(parsed, "choices");
  if (!choices || choices->values_size() == 0 || !choices->values(0).has_struct_value()) {
    throw util::ModelError("openai: response has no choices");
  }
  const auto* message = StructAt(choices->values(0).struct_value(), "message");
  if (!message) {
    throw util::ModelError("openai: choice has no message");
  }
  return StringAt(*message, "content");
}

std::string OpenAIModel::Describe() const {
  return "openai/" + settings_.model;
}

// ------------------------------------------------------------------
// Anthropic
// ------------------------------------------------------------------

AnthropicModel::AnthropicModel(std::shared_ptr<net::HttpClient> http, ProviderSettings settings) : http_(std::move(http)), settings_(std::move(settings)) {
  if (settings_.base_url.empty()) settings_.base_url = kDefaultBaseUrl;
}

std::string AnthropicModel::Generate(const GenerateRequest& request) {
  google::protobuf::Struct body;
  auto&                    fields = *body.mutable_fields();
  fields["model"].set_string_value(settings_.model);
  fields["max_tokens"].set_number_value(request.max_tokens);
  fields["temperature"].set_number_value(request.temperature);
  fields["system"].set_string_value(request.system);

  auto* messages          = fields["messages"].mutable_list_value();
  *messages->add_values() = TextMessage("user", request.user);

  const auto response = Post(*http_, "anthropic", TrimSlash(settings_.base_url) + "/v1/messages", body,
                             {{"x-api-key", settings_.api_key}, {"anthropic-version", kApiVersion}}, settings_.timeout_ms);
  const auto parsed   = ParseJsonObject(response.body, "anthropic");

  const auto* content = ListAt(parsed, "content");
  if (!content) {
    throw util::ModelError("anthropic: response has no content");
  }

  std::string text;
  for (const auto& part : content->values()) {
    if (part.has_struct_value() && StringAt(part.struct_value(), "type") == "text") {
      text += StringAt(part.struct_value(), "text");
    }
  }
  return text;
}

std::string AnthropicModel::Describe() const {
  return "anthropic/" + settings_.model;
}

} // namespace vaultd::llm
