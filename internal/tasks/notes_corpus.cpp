#include "internal/tasks/notes_corpus.hpp"

#include <algorithm>

#include "internal/fs/markdown_sync.hpp"

namespace vaultd::tasks {

std::string PageText(const std::string& page_id, const std::vector<db::model::BlockRecord>& blocks) {
  std::vector<const db::model::BlockRecord*> own;
  for (const auto& block : blocks) {
    if (block.page_id == page_id) own.push_back(&block);
  }
  std::stable_sort(own.begin(), own.end(), [](const auto* a, const auto* b) { return a->order < b->order; });

  std::string out;
  for (const auto* block : own) {
    std::string text = fs::StripHtml(block->content);
    if (text.empty()) continue;
    if (!out.empty()) out += '\n';
    out += text;
  }
  return out;
}

std::string BuildCorpus(const std::vector<db::model::PageRecord>& pages, const std::vector<db::model::BlockRecord>& blocks, size_t limit) {
  std::string corpus;
  for (const auto& page : pages) {
    if (!corpus.empty()) corpus += "\n\n---\n\n";
    corpus += "## " + page.title + "\n" + PageText(page.id, blocks);
    if (corpus.size() > limit) break;
  }
  return Truncate(corpus, limit);
}

std::string Truncate(const std::string& text, size_t limit) {
  if (text.size() <= limit) return text;

  size_t cut = limit;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return text.substr(0, cut);
}

} // namespace vaultd::tasks
