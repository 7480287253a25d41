#include "internal/learning/protocol_executor.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <map>
#include <string>

#include "internal/util/errors.hpp"
#include "support/test_runtime.hpp"

namespace {

using vaultd::learning::BudgetFor;
using vaultd::learning::Depth;
using vaultd::learning::LearningSession;
using vaultd::learning::PromptInputs;
using vaultd::learning::PromptPair;
using vaultd::learning::ProtocolExecutor;
using vaultd::learning::ProtocolOptions;
using vaultd::learning::StepType;
using vaultd::learning::TolerantResultExtractor;
using vaultd::testing::AddVault;
using vaultd::testing::FakeModel;
using vaultd::testing::MakeRuntime;

// system = step name so replies can be scripted per step; user = the context.
class StepNamePrompts final : public vaultd::learning::PromptLibrary {
 public:
  PromptPair Build(StepType step, const PromptInputs& inputs) const override {
    return {vaultd::learning::ToString(step), inputs.corpus};
  }
};

const std::map<std::string, std::string>& StandardReplies() {
  static const std::map<std::string, std::string> kReplies = {
      {"inventory", R"({"topics": [{"name": "caching"}, {"name": "queues"}], "insights": ["Caching appears everywhere"]})"},
      {"gap-analysis", R"({"gaps": [{"topic": "eviction"}]})"},
      {"deep-dive", R"({"generatedContent": [{"pageTitle": "Deep Page", "blocks": ["deep block"]}]})"},
      {"cross-reference", R"({"connections": [{"sourcePageTitle": "a"}, {"sourcePageTitle": "b"}]})"},
      {"synthesis", R"({"synthPages": [{"title": "Synth Page", "blocks": ["synth block"]}]})"},
      {"questions", R"({"questions": [{"question": "What evicts first?", "whyItMatters": "Memory pressure"}]})"},
  };
  return kReplies;
}

size_t CallsFor(const FakeModel& model, const std::string& step) {
  return static_cast<size_t>(std::count_if(model.requests.begin(), model.requests.end(), [&](const auto& r) { return r.system == step; }));
}

ProtocolExecutor MakeExecutor(vaultd::runtime::Context& ctx, std::shared_ptr<FakeModel> model, ProtocolOptions options = {}) {
  return ProtocolExecutor(ctx, std::move(model), std::make_shared<StepNamePrompts>(), std::make_shared<TolerantResultExtractor>(), options);
}

bool HasEvent(vaultd::runtime::Context& ctx, const std::string& needle) {
  for (const auto& event : ctx.log->Recent(500)) {
    if (event.payload_json.find(needle) != std::string::npos) return true;
  }
  return false;
}

void TestBudgets() {
  assert(BudgetFor(StepType::kInventory, Depth::kModerate).max_tokens == 2048);
  assert(BudgetFor(StepType::kInventory, Depth::kModerate).temperature == 0.3);
  assert(BudgetFor(StepType::kCrossReference, Depth::kShallow).max_tokens == 1024);
  assert(BudgetFor(StepType::kCrossReference, Depth::kShallow).temperature == 0.5);
  assert(BudgetFor(StepType::kDeepDive, Depth::kDeep).max_tokens == 8192);
  assert(BudgetFor(StepType::kSynthesis, Depth::kModerate).temperature == 0.7);
  assert(BudgetFor(StepType::kIterate, Depth::kDeep).max_tokens == 512);

  assert(vaultd::learning::ParseDepth("deep") == Depth::kDeep);
  assert(vaultd::learning::ParseDepth("bogus") == Depth::kModerate);
}

void TestPrerequisites() {
  vaultd::learning::StepOutputs outputs;
  assert(ProtocolExecutor::PrerequisiteMet(StepType::kInventory, outputs));
  assert(ProtocolExecutor::PrerequisiteMet(StepType::kCrossReference, outputs));
  assert(ProtocolExecutor::PrerequisiteMet(StepType::kIterate, outputs));
  assert(!ProtocolExecutor::PrerequisiteMet(StepType::kGapAnalysis, outputs));
  assert(!ProtocolExecutor::PrerequisiteMet(StepType::kQuestions, outputs));
  assert(!ProtocolExecutor::PrerequisiteMet(StepType::kDeepDive, outputs));
  assert(!ProtocolExecutor::PrerequisiteMet(StepType::kSynthesis, outputs));

  outputs[StepType::kInventory] = "x";
  assert(ProtocolExecutor::PrerequisiteMet(StepType::kGapAnalysis, outputs));
  assert(!ProtocolExecutor::PrerequisiteMet(StepType::kDeepDive, outputs));
}

void TestConvergesWhenIterateSaysStop() {
  auto rt = MakeRuntime();
  AddVault(*rt.ctx, "v1");

  int  iterate_calls = 0;
  auto model         = std::make_shared<FakeModel>([&](const vaultd::llm::GenerateRequest& request) {
    if (request.system == "iterate") {
      ++iterate_calls;
      return std::string(iterate_calls < 3 ? R"({"shouldContinue": true})" : R"({"shouldContinue": false})");
    }
    return StandardReplies().at(request.system);
  });

  LearningSession session;
  session.max_iterations = 5;

  auto       executor = MakeExecutor(*rt.ctx, model);
  const auto outcome  = executor.Run("v1", "## Caching\nnotes about caching", session);

  assert(outcome.iterations == 3);
  assert(iterate_calls == 3);
  assert(CallsFor(*model, "inventory") == 3);
  assert(model->requests.size() == 21);

  // per iteration: 3 + 1 + 2 + 1 insights; deep-dive, synthesis and questions pages
  assert(outcome.insights == 21);
  assert(outcome.pages_created == 9);
  assert(outcome.Summary() == "Completed 3 iteration(s): 21 insights, 9 pages created");

  // the second pass sees what the first one generated
  assert(model->requests[0].user == "## Caching\nnotes about caching");
  const auto& second_inventory = model->requests[7];
  assert(second_inventory.system == "inventory");
  assert(second_inventory.user.find("## Generated in previous pass") != std::string::npos);
  assert(second_inventory.user.find("## Deep Page\ndeep block") != std::string::npos);
  assert(second_inventory.user.find("## Synth Page\nsynth block") != std::string::npos);

  assert(rt.ctx->notes->ListPages("v1").size() == 9);
}

void TestMaxIterationsCapsAContinuingModel() {
  auto rt = MakeRuntime();
  AddVault(*rt.ctx, "v1");

  int  iterate_calls = 0;
  auto model         = std::make_shared<FakeModel>([&](const vaultd::llm::GenerateRequest& request) {
    if (request.system == "iterate") {
      ++iterate_calls;
      return std::string(R"({"shouldContinue": true})");
    }
    return StandardReplies().at(request.system);
  });

  LearningSession session;
  session.max_iterations = 2;

  auto       executor = MakeExecutor(*rt.ctx, model);
  const auto outcome  = executor.Run("v1", "corpus", session);

  assert(outcome.iterations == 2);
  assert(iterate_calls == 2);
  assert(model->requests.size() == 14);
  assert(outcome.Summary() == "Completed 2 iteration(s): 14 insights, 6 pages created");
}

void TestGeneratedPagesAreTagged() {
  auto rt = MakeRuntime();
  AddVault(*rt.ctx, "v1");

  auto model = std::make_shared<FakeModel>([](const vaultd::llm::GenerateRequest& request) {
    if (request.system == "iterate") return std::string(R"({"shouldContinue": false})");
    return StandardReplies().at(request.system);
  });

  auto       executor = MakeExecutor(*rt.ctx, model);
  const auto outcome  = executor.Run("v1", "corpus", LearningSession{});
  assert(outcome.iterations == 1);
  assert(outcome.pages_created == 3);

  bool saw_deep = false;
  bool saw_questions = false;
  for (const auto& page : rt.ctx->notes->ListPages("v1")) {
    assert(page.properties.at("autoGenerated") == "true");
    assert(std::find(page.tags.begin(), page.tags.end(), "auto-generated") != page.tags.end());

    if (page.title == "Deep Page") {
      saw_deep = true;
      assert(page.properties.at("source") == "daemon-deep-dive");
      assert(std::find(page.tags.begin(), page.tags.end(), "deep-dive") != page.tags.end());
    }
    if (page.title == ProtocolExecutor::kQuestionsPageTitle) {
      saw_questions = true;
      const auto blocks = rt.ctx->notes->ListPageBlocks(page.id);
      assert(blocks.size() == 1);
      assert(blocks[0].content == "**What evicts first?**\nMemory pressure");
      assert(blocks[0].properties.at("autoGenerated") == "true");
    }
  }
  assert(saw_deep);
  assert(saw_questions);
}

void TestStepsWithoutInventorySkipDependents() {
  auto rt = MakeRuntime();
  AddVault(*rt.ctx, "v1");

  auto model = std::make_shared<FakeModel>([](const vaultd::llm::GenerateRequest& request) {
    if (request.system == "iterate") return std::string("no opinion");
    return StandardReplies().at(request.system);
  });

  LearningSession session;
  session.steps = {StepType::kGapAnalysis, StepType::kDeepDive, StepType::kQuestions, StepType::kCrossReference, StepType::kIterate};

  auto       executor = MakeExecutor(*rt.ctx, model);
  const auto outcome  = executor.Run("v1", "corpus", session);

  assert(model->requests.size() == 2);
  assert(model->requests[0].system == "cross-reference");
  assert(model->requests[1].system == "iterate");
  assert(outcome.insights == 2);
  assert(outcome.pages_created == 0);
}

void TestFailedInventorySkipsDependentsAndContinues() {
  auto rt = MakeRuntime();
  AddVault(*rt.ctx, "v1");

  auto model = std::make_shared<FakeModel>([](const vaultd::llm::GenerateRequest& request) -> std::string {
    if (request.system == "inventory") throw vaultd::util::ModelError("Ollama request failed: connection refused");
    if (request.system == "iterate") return R"({"shouldContinue": false})";
    return StandardReplies().at(request.system);
  });

  auto       executor = MakeExecutor(*rt.ctx, model);
  const auto outcome  = executor.Run("v1", "corpus", LearningSession{});

  assert(CallsFor(*model, "inventory") == 1);
  assert(CallsFor(*model, "gap-analysis") == 0);
  assert(CallsFor(*model, "deep-dive") == 0);
  assert(CallsFor(*model, "questions") == 0);
  assert(CallsFor(*model, "cross-reference") == 1);
  assert(CallsFor(*model, "synthesis") == 1);
  assert(outcome.pages_created == 1);
  assert(HasEvent(*rt.ctx, "Learning step \\\"inventory\\\" failed"));
}

void TestRequestsCarryStepBudgets() {
  auto rt = MakeRuntime();
  AddVault(*rt.ctx, "v1");

  auto model = std::make_shared<FakeModel>([](const vaultd::llm::GenerateRequest& request) {
    if (request.system == "iterate") return std::string(R"({"shouldContinue": false})");
    return StandardReplies().at(request.system);
  });

  LearningSession session;
  session.depth = Depth::kDeep;

  auto executor = MakeExecutor(*rt.ctx, model);
  (void)executor.Run("v1", "corpus", session);

  for (const auto& request : model->requests) {
    if (request.system == "deep-dive") {
      assert(request.max_tokens == 8192);
      assert(request.temperature == 0.7);
    }
    if (request.system == "inventory") assert(request.max_tokens == 4096);
    if (request.system == "iterate") assert(request.max_tokens == 512);
  }
}

void TestUnparseableIterateUsesConfiguredDefault() {
  auto rt = MakeRuntime();
  AddVault(*rt.ctx, "v1");

  auto reply = [](const vaultd::llm::GenerateRequest& request) {
    if (request.system == "iterate") return std::string("I think so, probably.");
    return StandardReplies().at(request.system);
  };

  LearningSession session;
  session.max_iterations = 3;

  auto stop_model = std::make_shared<FakeModel>(reply);
  auto stopping   = MakeExecutor(*rt.ctx, stop_model);
  assert(stopping.Run("v1", "corpus", session).iterations == 1);

  auto go_model = std::make_shared<FakeModel>(reply);
  auto going    = MakeExecutor(*rt.ctx, go_model, ProtocolOptions{true});
  assert(going.Run("v1", "corpus", session).iterations == 3);
}

void TestEmptyOutputIsLoggedNotFatal() {
  auto rt = MakeRuntime();
  AddVault(*rt.ctx, "v1");

  auto model = std::make_shared<FakeModel>([](const vaultd::llm::GenerateRequest& request) {
    if (request.system == "inventory") return std::string("ok");
    if (request.system == "iterate") return std::string(R"({"shouldContinue": false})");
    return StandardReplies().at(request.system);
  });

  auto       executor = MakeExecutor(*rt.ctx, model);
  const auto outcome  = executor.Run("v1", "corpus", LearningSession{});

  // the raw text still satisfies prerequisites
  assert(CallsFor(*model, "gap-analysis") == 1);
  assert(outcome.iterations == 1);
  assert(HasEvent(*rt.ctx, "produced no usable output"));
}

void TestCancellationStopsBetweenSteps() {
  auto rt = MakeRuntime();
  AddVault(*rt.ctx, "v1");

  auto* ctx   = rt.ctx.get();
  auto  model = std::make_shared<FakeModel>([ctx](const vaultd::llm::GenerateRequest& request) {
    ctx->cancel_requested = true;
    return StandardReplies().at(request.system);
  });

  LearningSession session;
  session.max_iterations = 4;

  auto       executor = MakeExecutor(*rt.ctx, model);
  const auto outcome  = executor.Run("v1", "corpus", session);

  assert(model->requests.size() == 1);
  assert(outcome.iterations == 1);
  assert(outcome.insights == 3);
  assert(HasEvent(*rt.ctx, "Cancelled before step gap-analysis"));
}

void TestDefaultPromptsEmbedPrerequisites() {
  const std::string                   corpus = "## Page\nbody";
  vaultd::learning::StepOutputs       outputs{{StepType::kInventory, "INVENTORY-OUT"}, {StepType::kCrossReference, std::string(900, 'c')}};
  vaultd::learning::DefaultPromptLibrary library;

  const auto gaps = library.Build(StepType::kGapAnalysis, PromptInputs{corpus, outputs, Depth::kModerate});
  assert(gaps.user.find("INVENTORY-OUT") != std::string::npos);
  assert(gaps.user.find(corpus) != std::string::npos);
  assert(gaps.system.find("\"gaps\"") != std::string::npos);

  const auto iterate = library.Build(StepType::kIterate, PromptInputs{corpus, outputs, Depth::kModerate});
  assert(iterate.user.find(std::string(vaultd::learning::kIterateSummaryEntryChars, 'c')) != std::string::npos);
  assert(iterate.user.find(std::string(vaultd::learning::kIterateSummaryEntryChars + 1, 'c')) == std::string::npos);
}

} // namespace

int main() {
  TestBudgets();
  TestPrerequisites();
  TestConvergesWhenIterateSaysStop();
  TestMaxIterationsCapsAContinuingModel();
  TestGeneratedPagesAreTagged();
  TestStepsWithoutInventorySkipDependents();
  TestFailedInventorySkipsDependentsAndContinues();
  TestRequestsCarryStepBudgets();
  TestUnparseableIterateUsesConfiguredDefault();
  TestEmptyOutputIsLoggedNotFatal();
  TestCancellationStopsBetweenSteps();
  TestDefaultPromptsEmbedPrerequisites();

  std::cout << "vaultd_unit_protocol_executor: pass\n";
  return 0;
}
