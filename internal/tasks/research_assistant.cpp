#include "internal/tasks/research_assistant.hpp"

#include <algorithm>

#include "internal/db/notes_store.hpp"
#include "internal/learning/result_extractor.hpp"
#include "internal/llm/language_model.hpp"
#include "internal/observability/event_log.hpp"
#include "internal/tasks/notes_corpus.hpp"
#include "internal/util/time.hpp"

namespace vaultd::tasks {

namespace {

constexpr size_t kRecentPages = 5;

constexpr const char* kSystemPrompt =
    "You are a research assistant. Read the notes a person worked on most recently and suggest what they "
    "should read, investigate or try next. Each suggestion needs a short title and a one or two sentence "
    "rationale tied to the notes.\n\n"
    "Reply with one JSON object: {\"suggestions\": [{\"title\": string, \"rationale\": string}]}";

bool IsGenerated(const db::model::PageRecord& page) {
  return std::find(page.tags.begin(), page.tags.end(), "auto-generated") != page.tags.end();
}

std::string Field(const google::protobuf::Value& item, const std::string& key) {
  if (item.kind_case() != google::protobuf::Value::kStructValue) return {};
  const auto& fields = item.struct_value().fields();
  auto        it     = fields.find(key);
  if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kStringValue) return {};
  return it->second.string_value();
}

} // namespace

std::vector<std::string> SuggestionBlocks(const std::string& text) {
  std::vector<std::string> blocks;

  if (auto parsed = learning::ParseEmbeddedObject(text)) {
    auto it = parsed->fields().find("suggestions");
    if (it != parsed->fields().end() && it->second.kind_case() == google::protobuf::Value::kListValue) {
      for (const auto& item : it->second.list_value().values()) {
        const std::string title = Field(item, "title");
        if (title.empty()) continue;
        const std::string rationale = Field(item, "rationale");
        blocks.push_back("**" + title + "**" + (rationale.empty() ? "" : "\n" + rationale));
      }
      if (!blocks.empty()) return blocks;
    }
  }

  return learning::TolerantResultExtractor::HeuristicLines(text);
}

std::string ResearchAssistant::Run(runtime::Context& ctx) {
  const auto vault_id = ctx.ActiveVaultId();
  if (!vault_id) return "No active vault";

  std::vector<db::model::PageRecord> pages;
  for (auto& page : ctx.notes->ListPages(*vault_id)) {
    if (!IsGenerated(page)) pages.push_back(std::move(page));
  }
  if (pages.empty()) return "No pages to research";

  std::stable_sort(pages.begin(), pages.end(), [](const auto& a, const auto& b) { return a.updated_at_ms > b.updated_at_ms; });
  if (pages.size() > kRecentPages) pages.resize(kRecentPages);

  const auto        blocks = ctx.notes->ListBlocks(*vault_id);
  const std::string corpus = BuildCorpus(pages, blocks);

  ctx.log->Task(Name(), "Looking for research directions in " + std::to_string(pages.size()) + " recent pages");

  auto              model = ctx.resolve_model();
  const std::string text  = model->Generate(llm::GenerateRequest{kSystemPrompt, "<notes>\n" + corpus + "\n</notes>", 1536, 0.6});

  auto suggestions = SuggestionBlocks(text);
  if (suggestions.empty()) return "No research suggestions produced";

  const size_t count = suggestions.size();

  db::GeneratedPage page;
  page.vault_id         = *vault_id;
  page.title            = "Research Suggestions " + util::LocalDate(util::Now());
  page.source           = Name();
  page.blocks           = std::move(suggestions);
  page.replace_existing = true;
  ctx.notes->SaveGeneratedPage(page);

  return "Wrote " + std::to_string(count) + " research suggestion(s)";
}

} // namespace vaultd::tasks
