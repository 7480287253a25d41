#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vaultd::db::model {

/*
  Notes domain rows.

  The web application owns this schema; the daemon only reads and writes
  the columns below. properties/tags/refs are JSON text on disk.
*/

struct VaultRecord {
  std::string id;
  std::string name;
  std::string description;

  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;
};

struct PageRecord {
  std::string id;
  std::string vault_id;
  std::string title;
  std::string name; // lowercase title, used for link resolution

  bool                       is_journal = false;
  std::optional<std::string> journal_date;

  std::map<std::string, std::string> properties;
  std::vector<std::string>           tags;

  bool favorite = false;
  bool pinned   = false;

  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;
};

struct BlockRecord {
  std::string id;
  std::string page_id;
  std::string type = "paragraph";
  std::string content;

  std::optional<std::string> parent_id;

  // Lexicographically sortable position within the page.
  std::string order = "a0";

  bool collapsed = false;
  int  indent    = 0;

  std::map<std::string, std::string> properties;
  std::vector<std::string>           refs;

  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;
};

struct PageLinkRecord {
  std::string source_page_id;
  std::string target_page_id;
  std::string source_block_id;
  std::string context;
};

} // namespace vaultd::db::model
