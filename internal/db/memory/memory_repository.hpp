#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace vaultd::db::memory {

class MemoryTransaction;

/*
  In-process backend used by tests and when no database path is configured.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::ConfigEntryRecord> config;
    std::optional<model::StatusRecord>               status;

    std::vector<model::EventRecord> events;
    int64_t                         next_event_id = 1;

    std::vector<model::VaultRecord>                        vaults;
    std::vector<model::PageRecord>                         pages; // insertion order
    std::unordered_map<std::string, model::BlockRecord>    blocks;
    std::vector<model::PageLinkRecord>                     links;
  };

  // held by the open transaction for its whole lifetime
  std::mutex tx_mutex_;

  std::mutex mutex_;
  State      committed_;
};

}
