#include "internal/learning/step.hpp"

namespace vaultd::learning {

std::string ToString(StepType step) {
  switch (step) {
    case StepType::kInventory:
      return "inventory";
    case StepType::kGapAnalysis:
      return "gap-analysis";
    case StepType::kDeepDive:
      return "deep-dive";
    case StepType::kCrossReference:
      return "cross-reference";
    case StepType::kSynthesis:
      return "synthesis";
    case StepType::kQuestions:
      return "questions";
    case StepType::kIterate:
      return "iterate";
  }
  return "unknown";
}

std::string ToString(Depth depth) {
  switch (depth) {
    case Depth::kShallow:
      return "shallow";
    case Depth::kModerate:
      return "moderate";
    case Depth::kDeep:
      return "deep";
  }
  return "moderate";
}

Depth ParseDepth(const std::string& text) {
  if (text == "shallow") return Depth::kShallow;
  if (text == "deep") return Depth::kDeep;
  return Depth::kModerate;
}

StepBudget BudgetFor(StepType step, Depth depth) {
  int base = 2048;
  if (depth == Depth::kShallow) base = 1024;
  if (depth == Depth::kDeep) base = 4096;

  switch (step) {
    case StepType::kInventory:
    case StepType::kGapAnalysis:
    case StepType::kQuestions:
      return {0.3, base};
    case StepType::kCrossReference:
      return {0.5, base};
    case StepType::kDeepDive:
    case StepType::kSynthesis:
      return {0.7, base * 2};
    case StepType::kIterate:
      return {0.3, 512};
  }
  return {0.3, base};
}

} // namespace vaultd::learning
