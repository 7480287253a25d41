#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/daemon_records.hpp"
#include "internal/db/model/note_records.hpp"

namespace vaultd::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - The event log is append-only
  - Transactions must not nest (one open transaction per thread of control)

  The DB is the source of truth for:
    daemon configuration
    daemon status
    event log
    notes (vaults, pages, blocks, links)
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Daemon configuration
  // ---------------------------------------------------------------------

  virtual std::optional<std::string> GetConfigValue(Transaction&, const std::string& key) = 0;

  virtual std::vector<model::ConfigEntryRecord> ListConfig(Transaction&) = 0;

  virtual Result UpsertConfig(Transaction&, const model::ConfigEntryRecord&) = 0;

  // ---------------------------------------------------------------------
  // Daemon status (single row)
  // ---------------------------------------------------------------------

  virtual Result UpsertStatus(Transaction&, const model::StatusRecord&) = 0;

  virtual std::optional<model::StatusRecord> GetStatus(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Event log
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result AppendEvent(Transaction&, model::EventRecord& record) = 0;

  // Newest first.
  virtual std::vector<model::EventRecord> ListRecentEvents(Transaction&, uint32_t limit) = 0;

  // ---------------------------------------------------------------------
  // Notes
  // ---------------------------------------------------------------------

  virtual Result UpsertVault(Transaction&, const model::VaultRecord&) = 0;

  virtual std::vector<model::VaultRecord> ListVaults(Transaction&) = 0;

  virtual std::vector<model::PageRecord> ListPages(Transaction&, const std::string& vault_id) = 0;

  virtual std::optional<model::PageRecord> GetPage(Transaction&, const std::string& page_id) = 0;

  virtual Result UpsertPage(Transaction&, const model::PageRecord&) = 0;

  virtual Result UpdatePageTags(Transaction&, const std::string& page_id, const std::vector<std::string>& tags, int64_t updated_at_ms) = 0;

  // All blocks of all pages in the vault.
  virtual std::vector<model::BlockRecord> ListBlocks(Transaction&, const std::string& vault_id) = 0;

  virtual std::vector<model::BlockRecord> ListPageBlocks(Transaction&, const std::string& page_id) = 0;

  virtual Result UpsertBlock(Transaction&, const model::BlockRecord&) = 0;

  virtual Result DeletePageBlocks(Transaction&, const std::string& page_id) = 0;

  // Links whose source page belongs to the vault.
  virtual std::vector<model::PageLinkRecord> ListPageLinks(Transaction&, const std::string& vault_id) = 0;

  virtual Result InsertPageLink(Transaction&, const model::PageLinkRecord&) = 0;
};

} // namespace vaultd::db
