#pragma once

#include <string>

namespace vaultd::llm {

struct GenerateRequest {
  std::string system;
  std::string user;
  int         max_tokens  = 1024;
  double      temperature = 0.3;
};

/*
  Free-text completion from a {system, user} prompt pair.

  Implementations throw util::ModelError when the provider is
  unreachable or answers with an error.
*/
class LanguageModel {
 public:
  virtual ~LanguageModel() = default;

  virtual std::string Generate(const GenerateRequest& request) = 0;

  // provider/model, for logs
  virtual std::string Describe() const = 0;
};

} // namespace vaultd::llm
