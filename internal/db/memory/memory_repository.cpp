#include "memory_repository.hpp"

#include <algorithm>
#include <unordered_set>

#include "memory_tx.hpp"

namespace vaultd::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Daemon configuration
// ------------------------------------------------------------------

std::optional<std::string> MemoryRepository::GetConfigValue(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.config.find(key);
  if (it == s.config.end()) return std::nullopt;
  return it->second.value;
}

std::vector<model::ConfigEntryRecord> MemoryRepository::ListConfig(Transaction& t) {
  std::vector<model::ConfigEntryRecord> out;
  for (const auto& [_, entry] : TX(t).View().config) {
    out.push_back(entry);
  }
  return out;
}

Result MemoryRepository::UpsertConfig(Transaction& t, const model::ConfigEntryRecord& r) {
  TX(t).Mutable().config[r.key] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Daemon status
// ------------------------------------------------------------------

Result MemoryRepository::UpsertStatus(Transaction& t, const model::StatusRecord& r) {
  TX(t).Mutable().status = r;
  return Result::Ok();
}

std::optional<model::StatusRecord> MemoryRepository::GetStatus(Transaction& t) {
  return TX(t).View().status;
}

// ------------------------------------------------------------------
// Event log
// ------------------------------------------------------------------

Result MemoryRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_event_id++;
  s.events.push_back(r);
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ListRecentEvents(Transaction& t, uint32_t limit) {
  std::vector<model::EventRecord> out = TX(t).View().events;
  std::stable_sort(out.begin(), out.end(), [](const model::EventRecord& a, const model::EventRecord& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id > b.id;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

// ------------------------------------------------------------------
// Vaults
// ------------------------------------------------------------------

Result MemoryRepository::UpsertVault(Transaction& t, const model::VaultRecord& r) {
  auto& vaults = TX(t).Mutable().vaults;
  auto  it     = std::find_if(vaults.begin(), vaults.end(), [&](const model::VaultRecord& v) { return v.id == r.id; });
  if (it == vaults.end()) {
    vaults.push_back(r);
  } else {
    const int64_t created = it->created_at_ms;
    *it                   = r;
    it->created_at_ms     = created;
  }
  return Result::Ok();
}

std::vector<model::VaultRecord> MemoryRepository::ListVaults(Transaction& t) {
  return TX(t).View().vaults;
}

// ------------------------------------------------------------------
// Pages
// ------------------------------------------------------------------

std::vector<model::PageRecord> MemoryRepository::ListPages(Transaction& t, const std::string& vault_id) {
  std::vector<model::PageRecord> out;
  for (const auto& page : TX(t).View().pages) {
    if (page.vault_id == vault_id) out.push_back(page);
  }
  std::stable_sort(out.begin(), out.end(), [](const model::PageRecord& a, const model::PageRecord& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  });
  return out;
}

std::optional<model::PageRecord> MemoryRepository::GetPage(Transaction& t, const std::string& page_id) {
  for (const auto& page : TX(t).View().pages) {
    if (page.id == page_id) return page;
  }
  return std::nullopt;
}

Result MemoryRepository::UpsertPage(Transaction& t, const model::PageRecord& r) {
  auto& pages = TX(t).Mutable().pages;
  auto  it    = std::find_if(pages.begin(), pages.end(), [&](const model::PageRecord& p) { return p.id == r.id; });
  if (it == pages.end()) {
    pages.push_back(r);
  } else {
    // created_at is immutable once inserted, as in the sqlite upsert
    const int64_t created = it->created_at_ms;
    *it                   = r;
    it->created_at_ms     = created;
  }
  return Result::Ok();
}

Result MemoryRepository::UpdatePageTags(Transaction& t, const std::string& page_id, const std::vector<std::string>& tags, int64_t updated_at_ms) {
  for (auto& page : TX(t).Mutable().pages) {
    if (page.id == page_id) {
      page.tags          = tags;
      page.updated_at_ms = updated_at_ms;
      return Result::Ok();
    }
  }
  return Result::Err(ErrorCode::NotFound, "page not found: " + page_id);
}

// ------------------------------------------------------------------
// Blocks
// ------------------------------------------------------------------

namespace {

void SortBlocks(std::vector<model::BlockRecord>& blocks) {
  std::sort(blocks.begin(), blocks.end(), [](const model::BlockRecord& a, const model::BlockRecord& b) {
    if (a.page_id != b.page_id) return a.page_id < b.page_id;
    if (a.order != b.order) return a.order < b.order;
    return a.id < b.id;
  });
}

} // namespace

std::vector<model::BlockRecord> MemoryRepository::ListBlocks(Transaction& t, const std::string& vault_id) {
  const auto&                     s = TX(t).View();
  std::unordered_set<std::string> page_ids;
  for (const auto& page : s.pages) {
    if (page.vault_id == vault_id) page_ids.insert(page.id);
  }

  std::vector<model::BlockRecord> out;
  for (const auto& [_, block] : s.blocks) {
    if (page_ids.contains(block.page_id)) out.push_back(block);
  }
  SortBlocks(out);
  return out;
}

std::vector<model::BlockRecord> MemoryRepository::ListPageBlocks(Transaction& t, const std::string& page_id) {
  std::vector<model::BlockRecord> out;
  for (const auto& [_, block] : TX(t).View().blocks) {
    if (block.page_id == page_id) out.push_back(block);
  }
  SortBlocks(out);
  return out;
}

Result MemoryRepository::UpsertBlock(Transaction& t, const model::BlockRecord& r) {
  auto& blocks = TX(t).Mutable().blocks;
  auto  it     = blocks.find(r.id);
  if (it == blocks.end()) {
    blocks.emplace(r.id, r);
  } else {
    const int64_t created     = it->second.created_at_ms;
    it->second                = r;
    it->second.created_at_ms  = created;
  }
  return Result::Ok();
}

Result MemoryRepository::DeletePageBlocks(Transaction& t, const std::string& page_id) {
  auto& blocks = TX(t).Mutable().blocks;
  for (auto it = blocks.begin(); it != blocks.end();) {
    if (it->second.page_id == page_id) {
      it = blocks.erase(it);
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Links
// ------------------------------------------------------------------

std::vector<model::PageLinkRecord> MemoryRepository::ListPageLinks(Transaction& t, const std::string& vault_id) {
  const auto&                     s = TX(t).View();
  std::unordered_set<std::string> page_ids;
  for (const auto& page : s.pages) {
    if (page.vault_id == vault_id) page_ids.insert(page.id);
  }

  std::vector<model::PageLinkRecord> out;
  for (const auto& link : s.links) {
    if (page_ids.contains(link.source_page_id)) out.push_back(link);
  }
  return out;
}

Result MemoryRepository::InsertPageLink(Transaction& t, const model::PageLinkRecord& r) {
  TX(t).Mutable().links.push_back(r);
  return Result::Ok();
}

} // namespace vaultd::db::memory
