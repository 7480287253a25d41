#pragma once

#include <string>

#include "internal/learning/step.hpp"

namespace vaultd::learning {

struct PromptPair {
  std::string system;
  std::string user;
};

/*
  Inputs available to a step's prompt. Prerequisite outputs are
  guaranteed present by the executor before Build() is called.
*/
struct PromptInputs {
  const std::string& corpus;
  const StepOutputs& outputs;
  Depth              depth = Depth::kModerate;
};

class PromptLibrary {
 public:
  virtual ~PromptLibrary() = default;

  virtual PromptPair Build(StepType step, const PromptInputs& inputs) const = 0;
};

// Built-in prompts; every step asks for a single JSON object.
class DefaultPromptLibrary final : public PromptLibrary {
 public:
  PromptPair Build(StepType step, const PromptInputs& inputs) const override;
};

// Per-entry cap for the iterate step's session summary.
inline constexpr size_t kIterateSummaryEntryChars = 500;

} // namespace vaultd::learning
