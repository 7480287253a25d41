#include "internal/tasks/learning_runner.hpp"

#include <memory>

#include "internal/config/config_store.hpp"
#include "internal/db/notes_store.hpp"
#include "internal/learning/protocol_executor.hpp"
#include "internal/observability/event_log.hpp"
#include "internal/tasks/notes_corpus.hpp"

namespace vaultd::tasks {

namespace {

constexpr int kMaxIterationsCap = 100;

} // namespace

std::string LearningRunner::Run(runtime::Context& ctx) {
  const auto vault_id = ctx.ActiveVaultId();
  if (!vault_id) return "No active vault";

  const auto pages = ctx.notes->ListPages(*vault_id);
  if (pages.empty()) return "No pages to learn from";

  const std::string corpus = BuildCorpus(pages, ctx.notes->ListBlocks(*vault_id));

  learning::LearningSession session;
  session.depth          = learning::ParseDepth(ctx.config->Get("task.learningRunner.depth"));
  session.max_iterations = ctx.config->GetInt("task.learningRunner.maxIterations", 1, kMaxIterationsCap);

  learning::ProtocolOptions options;
  options.continue_on_parse_failure = ctx.config->GetBool("task.learningRunner.continueOnParseFailure");

  learning::ProtocolExecutor executor(ctx, ctx.resolve_model(), std::make_shared<learning::DefaultPromptLibrary>(),
                                      std::make_shared<learning::TolerantResultExtractor>(), options);

  return executor.Run(*vault_id, corpus, session).Summary();
}

} // namespace vaultd::tasks
