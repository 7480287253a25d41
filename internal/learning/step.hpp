#pragma once

#include <array>
#include <map>
#include <string>

namespace vaultd::learning {

enum class StepType {
  kInventory,
  kGapAnalysis,
  kDeepDive,
  kCrossReference,
  kSynthesis,
  kQuestions,
  kIterate,
};

// Fixed order of one iteration.
inline constexpr std::array<StepType, 7> kStepSequence = {
    StepType::kInventory, StepType::kGapAnalysis, StepType::kDeepDive, StepType::kCrossReference,
    StepType::kSynthesis, StepType::kQuestions,   StepType::kIterate,
};

enum class Depth {
  kShallow,
  kModerate,
  kDeep,
};

std::string ToString(StepType step);
std::string ToString(Depth depth);

// Unknown values map to kModerate.
Depth ParseDepth(const std::string& text);

struct StepBudget {
  double temperature = 0.3;
  int    max_tokens  = 1024;
};

StepBudget BudgetFor(StepType step, Depth depth);

// Raw model text per step, for the current iteration only.
using StepOutputs = std::map<StepType, std::string>;

} // namespace vaultd::learning
