#include "internal/tasks/daily_brief.hpp"

#include <algorithm>
#include <chrono>

#include "internal/db/notes_store.hpp"
#include "internal/fs/markdown_sync.hpp"
#include "internal/llm/language_model.hpp"
#include "internal/observability/event_log.hpp"
#include "internal/tasks/notes_corpus.hpp"
#include "internal/util/time.hpp"

namespace vaultd::tasks {

namespace {

constexpr int64_t kWindowMs = 24LL * 60 * 60 * 1000;

constexpr const char* kSystemPrompt =
    "You write a short morning brief from the notes a person changed during the last day. Open with two or "
    "three sentences on the overall theme, then one short paragraph per notable page, then a list of "
    "suggested next steps. Use markdown and separate paragraphs with blank lines. Do not invent facts that "
    "are not in the notes.";

bool IsOwnBrief(const db::model::PageRecord& page) {
  return std::find(page.tags.begin(), page.tags.end(), "daily-brief") != page.tags.end();
}

} // namespace

std::string DailyBrief::Run(runtime::Context& ctx) {
  const auto vault_id = ctx.ActiveVaultId();
  if (!vault_id) return "No active vault";

  const auto    now    = util::Now();
  const int64_t cutoff = util::ToUnixMillis(now) - kWindowMs;

  std::vector<db::model::PageRecord> recent;
  for (const auto& page : ctx.notes->ListPages(*vault_id)) {
    if (page.updated_at_ms >= cutoff && !IsOwnBrief(page)) recent.push_back(page);
  }

  if (recent.empty()) return "No pages updated in the last 24 hours";

  const auto        blocks = ctx.notes->ListBlocks(*vault_id);
  const std::string corpus = BuildCorpus(recent, blocks);

  ctx.log->Task(Name(), "Summarising " + std::to_string(recent.size()) + " updated pages");

  auto              model = ctx.resolve_model();
  const std::string text  = model->Generate(llm::GenerateRequest{kSystemPrompt, "<notes>\n" + corpus + "\n</notes>", 1024, 0.5});

  std::vector<std::string> paragraphs = fs::MergeIntoBlocks(text);
  if (paragraphs.empty()) return "Model returned an empty brief";

  const std::string date = util::LocalDate(now);

  db::GeneratedPage page;
  page.vault_id         = *vault_id;
  page.title            = "Daily Brief " + date;
  page.source           = Name();
  page.blocks           = std::move(paragraphs);
  page.journal_date     = date;
  page.replace_existing = true;
  ctx.notes->SaveGeneratedPage(page);

  return "Daily brief written for " + std::to_string(recent.size()) + " updated page(s)";
}

} // namespace vaultd::tasks
