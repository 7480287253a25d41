#include "schema.hpp"

#include <string>
#include <vector>

namespace vaultd::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS daemon_config (key TEXT PRIMARY KEY, value TEXT NOT NULL, updated_at INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS daemon_status (id TEXT PRIMARY KEY, pid INTEGER NOT NULL, state TEXT NOT NULL, current_task TEXT, started_at INTEGER, updated_at INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS daemon_event_log (id INTEGER PRIMARY KEY AUTOINCREMENT, event_type TEXT NOT NULL, task_name TEXT, payload TEXT NOT NULL, created_at INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS daemon_event_log_created_idx ON daemon_event_log(created_at);",

      "CREATE TABLE IF NOT EXISTS note_vault (id TEXT PRIMARY KEY, name TEXT NOT NULL, description TEXT, created_at INTEGER NOT NULL, updated_at INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS note_page (id TEXT PRIMARY KEY, vault_id TEXT NOT NULL, title TEXT NOT NULL, name TEXT NOT NULL, is_journal INTEGER NOT NULL DEFAULT 0, journal_date TEXT, icon TEXT, cover_image TEXT, properties TEXT NOT NULL DEFAULT '{}', tags TEXT NOT NULL DEFAULT '[]', favorite INTEGER NOT NULL DEFAULT 0, pinned INTEGER NOT NULL DEFAULT 0, created_at INTEGER NOT NULL, updated_at INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS note_block (id TEXT PRIMARY KEY, page_id TEXT NOT NULL, type TEXT NOT NULL, content TEXT NOT NULL, parent_id TEXT, block_order TEXT NOT NULL, collapsed INTEGER NOT NULL DEFAULT 0, indent INTEGER NOT NULL DEFAULT 0, properties TEXT NOT NULL DEFAULT '{}', refs TEXT NOT NULL DEFAULT '[]', created_at INTEGER NOT NULL, updated_at INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS note_page_link (source_page_id TEXT NOT NULL, target_page_id TEXT NOT NULL, source_block_id TEXT NOT NULL, context TEXT);",
      "CREATE INDEX IF NOT EXISTS note_page_vault_idx ON note_page(vault_id);",
      "CREATE INDEX IF NOT EXISTS note_block_page_idx ON note_block(page_id);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  // fail fast if a pre-existing table lacks a column the daemon relies on
  db.Exec("SELECT key,value,updated_at FROM daemon_config LIMIT 1;");
  db.Exec("SELECT id,pid,state,current_task,started_at,updated_at FROM daemon_status LIMIT 1;");
  db.Exec("SELECT id,event_type,task_name,payload,created_at FROM daemon_event_log LIMIT 1;");
  db.Exec("SELECT id,vault_id,title,name,is_journal,journal_date,properties,tags,favorite,pinned,created_at,updated_at FROM note_page LIMIT 1;");
  db.Exec("SELECT id,page_id,type,content,parent_id,block_order,collapsed,indent,properties,refs,created_at,updated_at FROM note_block LIMIT 1;");
  db.Exec("SELECT source_page_id,target_page_id,source_block_id,context FROM note_page_link LIMIT 1;");
}

} // namespace vaultd::db::sqlite
