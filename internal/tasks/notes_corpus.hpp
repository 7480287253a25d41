#pragma once

#include <string>
#include <vector>

#include "internal/db/model/note_records.hpp"

namespace vaultd::tasks {

// Upper bound on note text sent in a single prompt.
inline constexpr size_t kCorpusLimitChars = 32000;

// Plain text of one page: HTML-stripped, non-empty blocks in order, one per line.
std::string PageText(const std::string& page_id, const std::vector<db::model::BlockRecord>& blocks);

// "## <title>\n<text>" per page joined by "\n\n---\n\n", cut at limit
// without splitting a UTF-8 sequence.
std::string BuildCorpus(const std::vector<db::model::PageRecord>& pages, const std::vector<db::model::BlockRecord>& blocks,
                        size_t limit = kCorpusLimitChars);

std::string Truncate(const std::string& text, size_t limit);

} // namespace vaultd::tasks
