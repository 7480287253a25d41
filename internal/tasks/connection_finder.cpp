#include "internal/tasks/connection_finder.hpp"

#include <set>
#include <unordered_map>
#include <utility>

#include "internal/config/config_store.hpp"
#include "internal/db/notes_store.hpp"
#include "internal/fs/markdown_sync.hpp"
#include "internal/learning/prompt_library.hpp"
#include "internal/learning/result_extractor.hpp"
#include "internal/llm/language_model.hpp"
#include "internal/observability/event_log.hpp"
#include "internal/tasks/notes_corpus.hpp"

namespace vaultd::tasks {

namespace {

constexpr const char* kSourceBlockId   = "daemon-connection-finder";
constexpr size_t      kMaxContextChars = 200;

std::string Field(const google::protobuf::Value& item, const std::string& key) {
  if (item.kind_case() != google::protobuf::Value::kStructValue) return {};
  const auto& fields = item.struct_value().fields();
  auto        it     = fields.find(key);
  if (it == fields.end() || it->second.kind_case() != google::protobuf::Value::kStringValue) return {};
  return it->second.string_value();
}

} // namespace

std::string ConnectionFinder::Run(runtime::Context& ctx) {
  const auto vault_id = ctx.ActiveVaultId();
  if (!vault_id) return "No active vault";

  const auto pages  = ctx.notes->ListPages(*vault_id);
  const auto blocks = ctx.notes->ListBlocks(*vault_id);
  if (pages.size() < 2) return "Need at least 2 pages to find connections";

  const std::string corpus = BuildCorpus(pages, blocks);

  auto model = ctx.resolve_model();

  learning::DefaultPromptLibrary prompts;
  learning::StepOutputs          none;
  const auto prompt = prompts.Build(learning::StepType::kCrossReference, learning::PromptInputs{corpus, none, learning::Depth::kModerate});

  ctx.log->Task(Name(), "Analyzing " + std::to_string(pages.size()) + " pages for connections...");

  const std::string text = model->Generate(llm::GenerateRequest{prompt.system, prompt.user, 2048, 0.4});

  auto parsed = learning::ParseEmbeddedObject(text);
  if (!parsed) return "Model response did not contain valid JSON";

  auto list = parsed->fields().find("connections");
  if (list == parsed->fields().end() || list->second.kind_case() != google::protobuf::Value::kListValue ||
      list->second.list_value().values_size() == 0) {
    return "No new connections found";
  }
  const auto& connections = list->second.list_value().values();

  std::unordered_map<std::string, std::string> by_title;
  std::unordered_map<std::string, std::string> by_name;
  for (const auto& page : pages) {
    by_title.emplace(fs::PageName(page.title), page.id);
    by_name.emplace(fs::PageName(page.name), page.id);
  }

  auto lookup = [&](const std::string& title) -> std::string {
    const std::string key = fs::PageName(title);
    if (auto it = by_title.find(key); it != by_title.end()) return it->second;
    if (auto it = by_name.find(key); it != by_name.end()) return it->second;
    return {};
  };

  std::set<std::pair<std::string, std::string>> seen;
  for (const auto& link : ctx.notes->ListPageLinks(*vault_id)) {
    seen.emplace(link.source_page_id, link.target_page_id);
  }

  size_t                                resolved = 0;
  std::vector<db::model::PageLinkRecord> fresh;
  for (const auto& connection : connections) {
    const std::string source = lookup(Field(connection, "sourcePageTitle"));
    const std::string target = lookup(Field(connection, "targetPageTitle"));
    if (source.empty() || target.empty() || source == target) continue;
    ++resolved;

    if (!seen.emplace(source, target).second) continue;

    db::model::PageLinkRecord link;
    link.source_page_id  = source;
    link.target_page_id  = target;
    link.source_block_id = kSourceBlockId;
    link.context         = Truncate(Field(connection, "relationship"), kMaxContextChars);
    fresh.push_back(std::move(link));
  }

  if (!fresh.empty()) {
    ctx.notes->AppendPageLinks(fresh);
  }

  return "Found " + std::to_string(connections.size()) + " connections, " + std::to_string(resolved) + " resolved, " +
         std::to_string(fresh.size()) + " new links created";
}

} // namespace vaultd::tasks
