#include "internal/tasks/auto_organizer.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>

#include "internal/db/notes_store.hpp"
#include "internal/llm/language_model.hpp"
#include "internal/observability/event_log.hpp"
#include "internal/tasks/notes_corpus.hpp"

namespace vaultd::tasks {

namespace {

constexpr size_t kBatchSize       = 10;
constexpr size_t kMinContentChars = 50;
constexpr size_t kMaxPromptChars  = 2000;
constexpr size_t kMaxTags         = 5;
constexpr size_t kMaxTagChars     = 29;

constexpr const char* kSystemPrompt =
    "You organise a personal knowledge base. Given a page title and its content, suggest 3 to 5 short tags "
    "for its topic. Tags are lowercase, one word or hyphenated, for example \"machine-learning\" or \"philosophy\".\n\n"
    "Reply with a JSON array of strings only.";

// "  Machine   Learning " -> "machine-learning"
std::string CleanTag(const std::string& raw) {
  std::string out;
  bool        pending_dash = false;
  for (unsigned char c : raw) {
    if (std::isspace(c)) {
      pending_dash = !out.empty();
      continue;
    }
    if (pending_dash) {
      out += '-';
      pending_dash = false;
    }
    out += static_cast<char>(std::tolower(c));
  }
  return out;
}

} // namespace

std::vector<std::string> ParseTagList(const std::string& text) {
  std::vector<std::string> tags;

  const size_t open = text.find('[');
  if (open == std::string::npos) return tags;
  const size_t close = text.find(']', open);
  if (close == std::string::npos) return tags;

  google::protobuf::ListValue list;
  auto status = google::protobuf::util::JsonStringToMessage(text.substr(open, close - open + 1), &list);
  if (!status.ok()) return tags;

  for (const auto& value : list.values()) {
    if (value.kind_case() != google::protobuf::Value::kStringValue) continue;
    std::string tag = CleanTag(value.string_value());
    if (tag.empty() || tag.size() > kMaxTagChars) continue;
    tags.push_back(std::move(tag));
    if (tags.size() == kMaxTags) break;
  }
  return tags;
}

std::string AutoOrganizer::Run(runtime::Context& ctx) {
  const auto vault_id = ctx.ActiveVaultId();
  if (!vault_id) return "No active vault";

  const auto pages  = ctx.notes->ListPages(*vault_id);
  const auto blocks = ctx.notes->ListBlocks(*vault_id);

  std::vector<std::pair<const db::model::PageRecord*, std::string>> untagged;
  for (const auto& page : pages) {
    if (!page.tags.empty()) continue;
    std::string text = PageText(page.id, blocks);
    if (text.size() <= kMinContentChars) continue;
    untagged.emplace_back(&page, std::move(text));
  }

  if (untagged.empty()) return "All pages are already tagged";

  const size_t batch = std::min(untagged.size(), kBatchSize);
  auto         model = ctx.resolve_model();

  ctx.log->Task(Name(), "Tagging " + std::to_string(batch) + " untagged pages (" + std::to_string(untagged.size()) + " total)");

  size_t tagged = 0;
  for (size_t i = 0; i < batch; ++i) {
    if (ctx.CancelRequested()) break;

    const auto& [page, text] = untagged[i];
    try {
      const std::string reply =
          model->Generate(llm::GenerateRequest{kSystemPrompt, "Title: " + page->title + "\n\nContent:\n" + Truncate(text, kMaxPromptChars), 128, 0.3});

      const auto tags = ParseTagList(reply);
      if (tags.empty()) continue;

      ctx.notes->UpdatePageTags(page->id, tags);
      ++tagged;

      std::string joined;
      for (const auto& tag : tags) {
        if (!joined.empty()) joined += ", ";
        joined += tag;
      }
      ctx.log->Task(Name(), "Tagged \"" + page->title + "\": " + joined);
    } catch (const std::exception& e) {
      ctx.log->Error("Failed to tag page \"" + page->title + "\": " + e.what());
    }
  }

  return "Tagged " + std::to_string(tagged) + "/" + std::to_string(batch) + " pages";
}

} // namespace vaultd::tasks
