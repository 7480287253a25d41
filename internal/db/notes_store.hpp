#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace vaultd::db {

/*
  A page written by the daemon. Tagged "auto-generated" plus source, with
  properties autoGenerated=true and source=daemon-<source>; every block
  carries autoGenerated=true.
*/
struct GeneratedPage {
  std::string vault_id;
  std::string title;
  std::string source; // learning step or task name

  std::vector<std::string> blocks;

  std::optional<std::string> journal_date; // YYYY-MM-DD, marks a journal page

  // Reuse the id of a vault page with the same name instead of adding one.
  bool replace_existing = false;
};

/*
  NotesStore

  Task-facing view of the notes tables. Each call runs in its own
  transaction; SavePage writes a page and its blocks atomically.
  Repository errors surface as std::runtime_error.
*/
class NotesStore {
 public:
  explicit NotesStore(std::shared_ptr<Repository> repository);

  std::vector<model::VaultRecord> ListVaults();

  std::vector<model::PageRecord>   ListPages(const std::string& vault_id);
  std::optional<model::PageRecord> GetPage(const std::string& page_id);

  // Blocks of every page in the vault, grouped by page and ordered.
  std::vector<model::BlockRecord> ListBlocks(const std::string& vault_id);
  std::vector<model::BlockRecord> ListPageBlocks(const std::string& page_id);

  std::vector<model::PageLinkRecord> ListPageLinks(const std::string& vault_id);

  void UpsertVault(const model::VaultRecord& vault);

  void UpsertPage(const model::PageRecord& page);

  // Upserts the page and replaces all of its blocks.
  void SavePage(const model::PageRecord& page, const std::vector<model::BlockRecord>& blocks);

  // Returns the page id.
  std::string SaveGeneratedPage(const GeneratedPage& generated);

  void UpdatePageTags(const std::string& page_id, const std::vector<std::string>& tags);

  void AppendPageLinks(const std::vector<model::PageLinkRecord>& links);

 private:
  std::shared_ptr<Repository> repository_;
};

} // namespace vaultd::db
