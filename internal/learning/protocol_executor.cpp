#include "internal/learning/protocol_executor.hpp"

#include <stdexcept>

#include "internal/db/notes_store.hpp"
#include "internal/llm/language_model.hpp"
#include "internal/observability/event_log.hpp"

namespace vaultd::learning {

using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kTaskName = "learning-runner";

std::string ContextFor(const std::string& corpus, const GeneratedContentAccumulator& accumulator) {
  if (accumulator.Empty()) return corpus;
  return corpus + "\n\n---\n\n## Generated in previous pass\n\n" + accumulator.Text();
}

} // namespace

// ----------------------------------------------------------------------------

void GeneratedContentAccumulator::Append(const ExtractedPage& page) {
  if (!text_.empty()) text_ += "\n\n";
  text_ += "## " + page.title;
  for (const auto& block : page.blocks) {
    text_ += "\n" + block;
  }
}

std::string ProtocolOutcome::Summary() const {
  return "Completed " + std::to_string(iterations) + " iteration(s): " + std::to_string(insights) + " insights, " +
         std::to_string(pages_created) + " pages created";
}

// ----------------------------------------------------------------------------

ProtocolExecutor::ProtocolExecutor(runtime::Context& ctx, std::shared_ptr<llm::LanguageModel> model, std::shared_ptr<const PromptLibrary> prompts,
                                   std::shared_ptr<const ResultExtractor> extractor, ProtocolOptions options)
    : ctx_(ctx), model_(std::move(model)), prompts_(std::move(prompts)), extractor_(std::move(extractor)), options_(options) {
  if (!model_ || !prompts_ || !extractor_) {
    throw std::invalid_argument("protocol executor requires model, prompts and extractor");
  }
}

bool ProtocolExecutor::PrerequisiteMet(StepType step, const StepOutputs& outputs) {
  switch (step) {
    case StepType::kGapAnalysis:
    case StepType::kQuestions:
      return outputs.count(StepType::kInventory) > 0;
    case StepType::kDeepDive:
      return outputs.count(StepType::kGapAnalysis) > 0;
    case StepType::kSynthesis:
      return outputs.count(StepType::kCrossReference) > 0;
    case StepType::kInventory:
    case StepType::kCrossReference:
    case StepType::kIterate:
      return true;
  }
  return false;
}

ProtocolOutcome ProtocolExecutor::Run(const std::string& vault_id, const std::string& corpus, const LearningSession& session) {
  ProtocolOutcome             outcome;
  GeneratedContentAccumulator accumulator;

  const int max_iterations = session.max_iterations < 1 ? 1 : session.max_iterations;

  for (int iteration = 1; iteration <= max_iterations; ++iteration) {
    ctx_.log->Task(kTaskName, "Starting iteration " + std::to_string(iteration) + "/" + std::to_string(max_iterations));

    const std::string context = ContextFor(corpus, accumulator);
    StepOutputs       outputs;
    bool              should_continue = options_.continue_on_parse_failure;

    for (StepType step : session.steps) {
      if (ctx_.CancelRequested()) {
        ctx_.log->Task(kTaskName, "Cancelled before step " + ToString(step));
        outcome.iterations = iteration;
        return outcome;
      }

      if (!PrerequisiteMet(step, outputs)) {
        continue;
      }

      ctx_.log->Task(kTaskName, "Step: " + ToString(step));

      const PromptPair prompt = prompts_->Build(step, PromptInputs{context, outputs, session.depth});
      const StepBudget budget = BudgetFor(step, session.depth);

      std::string text;
      try {
        text = model_->Generate(llm::GenerateRequest{prompt.system, prompt.user, budget.max_tokens, budget.temperature});
      } catch (const std::exception& e) {
        ctx_.log->Error("Learning step \"" + ToString(step) + "\" failed: " + e.what(), {StringField("step", ToString(step))});
        continue;
      }
      outputs[step] = text;

      const ExtractedResult result = extractor_->Extract(text);
      if (result.Empty()) {
        ctx_.log->Warn("Learning step \"" + ToString(step) + "\" produced no usable output", {StringField("step", ToString(step))});
      }

      if (step == StepType::kIterate) {
        should_continue = result.should_continue.value_or(options_.continue_on_parse_failure);
        continue;
      }

      const StepCounts counts = Apply(vault_id, step, result, accumulator);
      outcome.insights += counts.insights;
      outcome.pages_created += counts.pages_created;
    }

    outcome.iterations = iteration;

    if (!should_continue) {
      ctx_.log->Task(kTaskName, "Iteration check: stopping", {IntField("iteration", iteration)});
      break;
    }
  }

  return outcome;
}

ProtocolExecutor::StepCounts ProtocolExecutor::Apply(const std::string& vault_id, StepType step, const ExtractedResult& result,
                                                     GeneratedContentAccumulator& accumulator) {
  StepCounts counts;
  counts.insights = static_cast<int>(result.InsightCount());

  const std::vector<ExtractedPage>* pages = nullptr;
  if (step == StepType::kDeepDive) pages = &result.generated_content;
  if (step == StepType::kSynthesis) pages = &result.synth_pages;

  if (pages) {
    for (const auto& page : *pages) {
      try {
        CreatePage(vault_id, page.title, page.blocks, step);
        ++counts.pages_created;
        accumulator.Append(page);
      } catch (const std::exception& e) {
        ctx_.log->Error("Learning step \"" + ToString(step) + "\" could not save page: " + e.what(), {StringField("title", page.title)});
      }
    }
  }

  if (step == StepType::kQuestions && !result.questions.empty()) {
    std::vector<std::string> blocks;
    blocks.reserve(result.questions.size());
    for (const auto& q : result.questions) {
      std::string block = "**" + q.question + "**";
      if (!q.why_it_matters.empty()) block += "\n" + q.why_it_matters;
      blocks.push_back(std::move(block));
    }

    try {
      CreatePage(vault_id, kQuestionsPageTitle, blocks, step);
      ++counts.pages_created;
    } catch (const std::exception& e) {
      ctx_.log->Error(std::string("Learning step \"questions\" could not save page: ") + e.what());
    }
  }

  return counts;
}

void ProtocolExecutor::CreatePage(const std::string& vault_id, const std::string& title, const std::vector<std::string>& blocks, StepType source) {
  db::GeneratedPage page;
  page.vault_id = vault_id;
  page.title    = title;
  page.source   = ToString(source);
  page.blocks   = blocks;
  ctx_.notes->SaveGeneratedPage(page);
}

} // namespace vaultd::learning
