#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace vaultd::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  std::optional<std::string> GetConfigValue(Transaction&, const std::string& key) override;
  std::vector<model::ConfigEntryRecord> ListConfig(Transaction&) override;
  Result UpsertConfig(Transaction&, const model::ConfigEntryRecord&) override;

  Result UpsertStatus(Transaction&, const model::StatusRecord&) override;
  std::optional<model::StatusRecord> GetStatus(Transaction&) override;

  Result AppendEvent(Transaction&, model::EventRecord& record) override;
  std::vector<model::EventRecord> ListRecentEvents(Transaction&, uint32_t limit) override;

  Result UpsertVault(Transaction&, const model::VaultRecord&) override;
  std::vector<model::VaultRecord> ListVaults(Transaction&) override;

  std::vector<model::PageRecord> ListPages(Transaction&, const std::string& vault_id) override;
  std::optional<model::PageRecord> GetPage(Transaction&, const std::string& page_id) override;
  Result UpsertPage(Transaction&, const model::PageRecord&) override;
  Result UpdatePageTags(Transaction&, const std::string& page_id, const std::vector<std::string>& tags, int64_t updated_at_ms) override;

  std::vector<model::BlockRecord> ListBlocks(Transaction&, const std::string& vault_id) override;
  std::vector<model::BlockRecord> ListPageBlocks(Transaction&, const std::string& page_id) override;
  Result UpsertBlock(Transaction&, const model::BlockRecord&) override;
  Result DeletePageBlocks(Transaction&, const std::string& page_id) override;

  std::vector<model::PageLinkRecord> ListPageLinks(Transaction&, const std::string& vault_id) override;
  Result InsertPageLink(Transaction&, const model::PageLinkRecord&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
