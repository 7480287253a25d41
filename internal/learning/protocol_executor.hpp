#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/learning/prompt_library.hpp"
#include "internal/learning/result_extractor.hpp"
#include "internal/learning/step.hpp"
#include "internal/runtime/context.hpp"

namespace vaultd::llm { class LanguageModel; }

namespace vaultd::learning {

struct LearningSession {
  std::vector<StepType> steps{kStepSequence.begin(), kStepSequence.end()};

  int   max_iterations = 1;
  Depth depth          = Depth::kModerate;

  // Reserved for scoped runs; the daemon always learns from the whole vault.
  std::set<std::string> target_page_ids;
};

/*
  Content produced by deep-dive and synthesis, carried into the next
  iteration's context.
*/
class GeneratedContentAccumulator {
 public:
  void Append(const ExtractedPage& page);

  const std::string& Text() const {
    return text_;
  }

  bool Empty() const {
    return text_.empty();
  }

 private:
  std::string text_;
};

struct ProtocolOutcome {
  int iterations    = 0;
  int insights      = 0;
  int pages_created = 0;

  // "Completed N iteration(s): I insights, P pages created"
  std::string Summary() const;
};

struct ProtocolOptions {
  // Used when the iterate step yields no shouldContinue value.
  bool continue_on_parse_failure = false;
};

/*
  ProtocolExecutor

  Runs the learning steps in order for up to max_iterations. A step whose
  prerequisite output is missing is skipped without a model call. A
  failing step is logged and contributes nothing; the iteration goes on.
  Cancellation is checked between steps.
*/
class ProtocolExecutor {
 public:
  static constexpr const char* kQuestionsPageTitle = "Open Questions (AI Generated)";

  ProtocolExecutor(runtime::Context& ctx, std::shared_ptr<llm::LanguageModel> model, std::shared_ptr<const PromptLibrary> prompts,
                   std::shared_ptr<const ResultExtractor> extractor, ProtocolOptions options = {});

  ProtocolOutcome Run(const std::string& vault_id, const std::string& corpus, const LearningSession& session);

  static bool PrerequisiteMet(StepType step, const StepOutputs& outputs);

 private:
  struct StepCounts {
    int insights      = 0;
    int pages_created = 0;
  };

  StepCounts Apply(const std::string& vault_id, StepType step, const ExtractedResult& result, GeneratedContentAccumulator& accumulator);
  void       CreatePage(const std::string& vault_id, const std::string& title, const std::vector<std::string>& blocks, StepType source);

  runtime::Context&                      ctx_;
  std::shared_ptr<llm::LanguageModel>    model_;
  std::shared_ptr<const PromptLibrary>   prompts_;
  std::shared_ptr<const ResultExtractor> extractor_;
  ProtocolOptions                        options_;
};

} // namespace vaultd::learning
