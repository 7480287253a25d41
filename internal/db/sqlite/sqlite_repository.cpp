#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/json_columns.hpp"

namespace vaultd::db::sqlite {

using vaultd::db::ErrorCode;
using vaultd::db::Result;

namespace {

constexpr const char* kStatusRowId = "singleton";

constexpr const char* kPageColumns =
    "p.id,p.vault_id,p.title,p.name,p.is_journal,p.journal_date,p.properties,p.tags,p.favorite,p.pinned,p.created_at,p.updated_at";

constexpr const char* kBlockColumns =
    "b.id,b.page_id,b.type,b.content,b.parent_id,b.block_order,b.collapsed,b.indent,b.properties,b.refs,b.created_at,b.updated_at";

model::PageRecord ReadPage(const Statement& st) {
  model::PageRecord r;
  r.id            = st.ColText(0);
  r.vault_id      = st.ColText(1);
  r.title         = st.ColText(2);
  r.name          = st.ColText(3);
  r.is_journal    = st.ColBool(4);
  r.journal_date  = st.ColOptionalText(5);
  r.properties    = sql::DecodeStringMap(st.ColText(6));
  r.tags          = sql::DecodeStringList(st.ColText(7));
  r.favorite      = st.ColBool(8);
  r.pinned        = st.ColBool(9);
  r.created_at_ms = st.ColInt64(10);
  r.updated_at_ms = st.ColInt64(11);
  return r;
}

model::BlockRecord ReadBlock(const Statement& st) {
  model::BlockRecord r;
  r.id            = st.ColText(0);
  r.page_id       = st.ColText(1);
  r.type          = st.ColText(2);
  r.content       = st.ColText(3);
  r.parent_id     = st.ColOptionalText(4);
  r.order         = st.ColText(5);
  r.collapsed     = st.ColBool(6);
  r.indent        = static_cast<int>(st.ColInt64(7));
  r.properties    = sql::DecodeStringMap(st.ColText(8));
  r.refs          = sql::DecodeStringList(st.ColText(9));
  r.created_at_ms = st.ColInt64(10);
  r.updated_at_ms = st.ColInt64(11);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Daemon configuration
// ------------------------------------------------------------------

std::optional<std::string> SqliteRepository::GetConfigValue(Transaction& t, const std::string& key) {
  Statement st(TX(t).Handle(), "SELECT value FROM daemon_config WHERE key=?;");
  if (!st.Ok()) return std::nullopt;

  st.BindText(1, key);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return st.ColText(0);
}

std::vector<model::ConfigEntryRecord> SqliteRepository::ListConfig(Transaction& t) {
  std::vector<model::ConfigEntryRecord> out;

  Statement st(TX(t).Handle(), "SELECT key,value,updated_at FROM daemon_config ORDER BY key;");
  if (!st.Ok()) return out;

  while (st.Step() == SQLITE_ROW) {
    out.push_back({st.ColText(0), st.ColText(1), st.ColInt64(2)});
  }
  return out;
}

Result SqliteRepository::UpsertConfig(Transaction& t, const model::ConfigEntryRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO daemon_config(key,value,updated_at) VALUES(?,?,?) "
               "ON CONFLICT(key) DO UPDATE SET value=excluded.value, updated_at=excluded.updated_at;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  st.BindText(1, r.key);
  st.BindText(2, r.value);
  st.BindInt64(3, r.updated_at_ms);
  return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Daemon status
// ------------------------------------------------------------------

Result SqliteRepository::UpsertStatus(Transaction& t, const model::StatusRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO daemon_status(id,pid,state,current_task,started_at,updated_at) VALUES(?,?,?,?,?,?) "
               "ON CONFLICT(id) DO UPDATE SET pid=excluded.pid, state=excluded.state, current_task=excluded.current_task, "
               "started_at=excluded.started_at, updated_at=excluded.updated_at;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  st.BindText(1, kStatusRowId);
  st.BindInt64(2, r.pid);
  st.BindText(3, r.state);
  st.BindOptionalText(4, r.current_task);
  st.BindOptionalInt64(5, r.started_at_ms);
  st.BindInt64(6, r.updated_at_ms);
  return Translate(db, st.Step());
}

std::optional<model::StatusRecord> SqliteRepository::GetStatus(Transaction& t) {
  Statement st(TX(t).Handle(), "SELECT pid,state,current_task,started_at,updated_at FROM daemon_status WHERE id=?;");
  if (!st.Ok()) return std::nullopt;

  st.BindText(1, kStatusRowId);
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  model::StatusRecord r;
  r.pid           = st.ColInt64(0);
  r.state         = st.ColText(1);
  r.current_task  = st.ColOptionalText(2);
  r.started_at_ms = st.ColOptionalInt64(3);
  r.updated_at_ms = st.ColInt64(4);
  return r;
}

// ------------------------------------------------------------------
// Event log
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO daemon_event_log(event_type,task_name,payload,created_at) VALUES(?,?,?,?);");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  st.BindText(1, r.event_type);
  st.BindOptionalText(2, r.task_name);
  st.BindText(3, r.payload_json);
  st.BindInt64(4, r.created_at_ms);

  int rc = st.Step();
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

std::vector<model::EventRecord> SqliteRepository::ListRecentEvents(Transaction& t, uint32_t limit) {
  std::vector<model::EventRecord> out;

  Statement st(TX(t).Handle(),
               "SELECT id,event_type,task_name,payload,created_at FROM daemon_event_log "
               "ORDER BY created_at DESC, id DESC LIMIT ?;");
  if (!st.Ok()) return out;

  st.BindInt64(1, limit);
  while (st.Step() == SQLITE_ROW) {
    model::EventRecord r;
    r.id            = st.ColInt64(0);
    r.event_type    = st.ColText(1);
    r.task_name     = st.ColOptionalText(2);
    r.payload_json  = st.ColText(3);
    r.created_at_ms = st.ColInt64(4);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Vaults
// ------------------------------------------------------------------

Result SqliteRepository::UpsertVault(Transaction& t, const model::VaultRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO note_vault(id,name,description,created_at,updated_at) VALUES(?,?,?,?,?) "
               "ON CONFLICT(id) DO UPDATE SET name=excluded.name, description=excluded.description, updated_at=excluded.updated_at;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  st.BindText(1, r.id);
  st.BindText(2, r.name);
  st.BindText(3, r.description);
  st.BindInt64(4, r.created_at_ms);
  st.BindInt64(5, r.updated_at_ms);
  return Translate(db, st.Step());
}

std::vector<model::VaultRecord> SqliteRepository::ListVaults(Transaction& t) {
  std::vector<model::VaultRecord> out;

  Statement st(TX(t).Handle(), "SELECT id,name,description,created_at,updated_at FROM note_vault ORDER BY created_at;");
  if (!st.Ok()) return out;

  while (st.Step() == SQLITE_ROW) {
    out.push_back({st.ColText(0), st.ColText(1), st.ColText(2), st.ColInt64(3), st.ColInt64(4)});
  }
  return out;
}

// ------------------------------------------------------------------
// Pages
// ------------------------------------------------------------------

std::vector<model::PageRecord> SqliteRepository::ListPages(Transaction& t, const std::string& vault_id) {
  std::vector<model::PageRecord> out;

  const std::string sql = std::string("SELECT ") + kPageColumns + " FROM note_page p WHERE p.vault_id=? ORDER BY p.created_at, p.id;";
  Statement         st(TX(t).Handle(), sql.c_str());
  if (!st.Ok()) return out;

  st.BindText(1, vault_id);
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadPage(st));
  }
  return out;
}

std::optional<model::PageRecord> SqliteRepository::GetPage(Transaction& t, const std::string& page_id) {
  const std::string sql = std::string("SELECT ") + kPageColumns + " FROM note_page p WHERE p.id=?;";
  Statement         st(TX(t).Handle(), sql.c_str());
  if (!st.Ok()) return std::nullopt;

  st.BindText(1, page_id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadPage(st);
}

Result SqliteRepository::UpsertPage(Transaction& t, const model::PageRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO note_page(id,vault_id,title,name,is_journal,journal_date,properties,tags,favorite,pinned,created_at,updated_at) "
               "VALUES(?,?,?,?,?,?,?,?,?,?,?,?) "
               "ON CONFLICT(id) DO UPDATE SET vault_id=excluded.vault_id, title=excluded.title, name=excluded.name, "
               "is_journal=excluded.is_journal, journal_date=excluded.journal_date, properties=excluded.properties, "
               "tags=excluded.tags, favorite=excluded.favorite, pinned=excluded.pinned, updated_at=excluded.updated_at;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  st.BindText(1, r.id);
  st.BindText(2, r.vault_id);
  st.BindText(3, r.title);
  st.BindText(4, r.name);
  st.BindBool(5, r.is_journal);
  st.BindOptionalText(6, r.journal_date);
  st.BindText(7, sql::EncodeStringMap(r.properties));
  st.BindText(8, sql::EncodeStringList(r.tags));
  st.BindBool(9, r.favorite);
  st.BindBool(10, r.pinned);
  st.BindInt64(11, r.created_at_ms);
  st.BindInt64(12, r.updated_at_ms);
  return Translate(db, st.Step());
}

Result SqliteRepository::UpdatePageTags(Transaction& t, const std::string& page_id, const std::vector<std::string>& tags, int64_t updated_at_ms) {
  auto* db = TX(t).Handle();

  Statement st(db, "UPDATE note_page SET tags=?, updated_at=? WHERE id=?;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  st.BindText(1, sql::EncodeStringList(tags));
  st.BindInt64(2, updated_at_ms);
  st.BindText(3, page_id);

  int rc = st.Step();
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "page not found: " + page_id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Blocks
// ------------------------------------------------------------------

std::vector<model::BlockRecord> SqliteRepository::ListBlocks(Transaction& t, const std::string& vault_id) {
  std::vector<model::BlockRecord> out;

  const std::string sql = std::string("SELECT ") + kBlockColumns +
                          " FROM note_block b INNER JOIN note_page p ON b.page_id = p.id"
                          " WHERE p.vault_id=? ORDER BY b.page_id, b.block_order;";
  Statement st(TX(t).Handle(), sql.c_str());
  if (!st.Ok()) return out;

  st.BindText(1, vault_id);
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadBlock(st));
  }
  return out;
}

std::vector<model::BlockRecord> SqliteRepository::ListPageBlocks(Transaction& t, const std::string& page_id) {
  std::vector<model::BlockRecord> out;

  const std::string sql = std::string("SELECT ") + kBlockColumns + " FROM note_block b WHERE b.page_id=? ORDER BY b.block_order;";
  Statement         st(TX(t).Handle(), sql.c_str());
  if (!st.Ok()) return out;

  st.BindText(1, page_id);
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadBlock(st));
  }
  return out;
}

Result SqliteRepository::UpsertBlock(Transaction& t, const model::BlockRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO note_block(id,page_id,type,content,parent_id,block_order,collapsed,indent,properties,refs,created_at,updated_at) "
               "VALUES(?,?,?,?,?,?,?,?,?,?,?,?) "
               "ON CONFLICT(id) DO UPDATE SET page_id=excluded.page_id, type=excluded.type, content=excluded.content, "
               "parent_id=excluded.parent_id, block_order=excluded.block_order, collapsed=excluded.collapsed, "
               "indent=excluded.indent, properties=excluded.properties, refs=excluded.refs, updated_at=excluded.updated_at;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  st.BindText(1, r.id);
  st.BindText(2, r.page_id);
  st.BindText(3, r.type);
  st.BindText(4, r.content);
  st.BindOptionalText(5, r.parent_id);
  st.BindText(6, r.order);
  st.BindBool(7, r.collapsed);
  st.BindInt64(8, r.indent);
  st.BindText(9, sql::EncodeStringMap(r.properties));
  st.BindText(10, sql::EncodeStringList(r.refs));
  st.BindInt64(11, r.created_at_ms);
  st.BindInt64(12, r.updated_at_ms);
  return Translate(db, st.Step());
}

Result SqliteRepository::DeletePageBlocks(Transaction& t, const std::string& page_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM note_block WHERE page_id=?;");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  st.BindText(1, page_id);
  return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Links
// ------------------------------------------------------------------

std::vector<model::PageLinkRecord> SqliteRepository::ListPageLinks(Transaction& t, const std::string& vault_id) {
  std::vector<model::PageLinkRecord> out;

  Statement st(TX(t).Handle(),
               "SELECT l.source_page_id,l.target_page_id,l.source_block_id,l.context FROM note_page_link l "
               "INNER JOIN note_page p ON l.source_page_id = p.id WHERE p.vault_id=?;");
  if (!st.Ok()) return out;

  st.BindText(1, vault_id);
  while (st.Step() == SQLITE_ROW) {
    out.push_back({st.ColText(0), st.ColText(1), st.ColText(2), st.ColText(3)});
  }
  return out;
}

Result SqliteRepository::InsertPageLink(Transaction& t, const model::PageLinkRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO note_page_link(source_page_id,target_page_id,source_block_id,context) VALUES(?,?,?,?);");
  if (!st.Ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  st.BindText(1, r.source_page_id);
  st.BindText(2, r.target_page_id);
  st.BindText(3, r.source_block_id);
  st.BindText(4, r.context);
  return Translate(db, st.Step());
}

} // namespace vaultd::db::sqlite
