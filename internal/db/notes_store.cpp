#include "internal/db/notes_store.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace vaultd::db {

namespace {

std::string Lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace

NotesStore::NotesStore(std::shared_ptr<Repository> repository) : repository_(std::move(repository)) {}

std::vector<model::VaultRecord> NotesStore::ListVaults() {
  auto tx  = repository_->Begin();
  auto out = repository_->ListVaults(*tx);
  tx->Commit();
  return out;
}

std::vector<model::PageRecord> NotesStore::ListPages(const std::string& vault_id) {
  auto tx  = repository_->Begin();
  auto out = repository_->ListPages(*tx, vault_id);
  tx->Commit();
  return out;
}

std::optional<model::PageRecord> NotesStore::GetPage(const std::string& page_id) {
  auto tx  = repository_->Begin();
  auto out = repository_->GetPage(*tx, page_id);
  tx->Commit();
  return out;
}

std::vector<model::BlockRecord> NotesStore::ListBlocks(const std::string& vault_id) {
  auto tx  = repository_->Begin();
  auto out = repository_->ListBlocks(*tx, vault_id);
  tx->Commit();
  return out;
}

std::vector<model::BlockRecord> NotesStore::ListPageBlocks(const std::string& page_id) {
  auto tx  = repository_->Begin();
  auto out = repository_->ListPageBlocks(*tx, page_id);
  tx->Commit();
  return out;
}

std::vector<model::PageLinkRecord> NotesStore::ListPageLinks(const std::string& vault_id) {
  auto tx  = repository_->Begin();
  auto out = repository_->ListPageLinks(*tx, vault_id);
  tx->Commit();
  return out;
}

void NotesStore::UpsertVault(const model::VaultRecord& vault) {
  auto tx = repository_->Begin();
  ThrowIfError(repository_->UpsertVault(*tx, vault), "upsert vault " + vault.id);
  tx->Commit();
}

void NotesStore::UpsertPage(const model::PageRecord& page) {
  auto tx = repository_->Begin();
  ThrowIfError(repository_->UpsertPage(*tx, page), "upsert page " + page.id);
  tx->Commit();
}

void NotesStore::SavePage(const model::PageRecord& page, const std::vector<model::BlockRecord>& blocks) {
  auto tx = repository_->Begin();
  ThrowIfError(repository_->UpsertPage(*tx, page), "upsert page " + page.id);
  ThrowIfError(repository_->DeletePageBlocks(*tx, page.id), "delete blocks of " + page.id);
  for (const auto& block : blocks) {
    ThrowIfError(repository_->UpsertBlock(*tx, block), "upsert block " + block.id);
  }
  tx->Commit();
}

std::string NotesStore::SaveGeneratedPage(const GeneratedPage& generated) {
  const int64_t now = util::ToUnixMillis(util::Now());

  model::PageRecord page;
  page.id            = util::NewId();
  page.vault_id      = generated.vault_id;
  page.title         = generated.title;
  page.name          = Lowercase(generated.title);
  page.is_journal    = generated.journal_date.has_value();
  page.journal_date  = generated.journal_date;
  page.properties    = {{"autoGenerated", "true"}, {"source", "daemon-" + generated.source}};
  page.tags          = {"auto-generated", generated.source};
  page.created_at_ms = now;
  page.updated_at_ms = now;

  auto tx = repository_->Begin();

  if (generated.replace_existing) {
    for (const auto& existing : repository_->ListPages(*tx, generated.vault_id)) {
      if (existing.name == page.name) {
        page.id            = existing.id;
        page.created_at_ms = existing.created_at_ms;
        break;
      }
    }
  }

  ThrowIfError(repository_->UpsertPage(*tx, page), "upsert page " + page.id);
  ThrowIfError(repository_->DeletePageBlocks(*tx, page.id), "delete blocks of " + page.id);

  for (size_t i = 0; i < generated.blocks.size(); ++i) {
    char order[32];
    std::snprintf(order, sizeof(order), "a%04zu", i);

    model::BlockRecord block;
    block.id            = util::NewId();
    block.page_id       = page.id;
    block.content       = generated.blocks[i];
    block.order         = order;
    block.properties    = {{"autoGenerated", "true"}};
    block.created_at_ms = now;
    block.updated_at_ms = now;
    ThrowIfError(repository_->UpsertBlock(*tx, block), "upsert block " + block.id);
  }

  tx->Commit();
  return page.id;
}

void NotesStore::UpdatePageTags(const std::string& page_id, const std::vector<std::string>& tags) {
  auto tx = repository_->Begin();
  ThrowIfError(repository_->UpdatePageTags(*tx, page_id, tags, util::ToUnixMillis(util::Now())), "update tags of " + page_id);
  tx->Commit();
}

void NotesStore::AppendPageLinks(const std::vector<model::PageLinkRecord>& links) {
  auto tx = repository_->Begin();
  for (const auto& link : links) {
    ThrowIfError(repository_->InsertPageLink(*tx, link), "insert page link");
  }
  tx->Commit();
}

} // namespace vaultd::db
