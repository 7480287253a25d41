#include "sqlite_db.hpp"

#include <stdexcept>

namespace vaultd::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure() {
  // WAL lets the web application read while the daemon writes
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // the web application holds the same file open
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
}

// ------------------------------------------------------------------
// Statement
// ------------------------------------------------------------------

Statement::Statement(sqlite3* db, const char* sql) {
  if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::BindText(int idx, const std::string& value) {
  sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT);
}

void Statement::BindOptionalText(int idx, const std::optional<std::string>& value) {
  if (value) {
    BindText(idx, *value);
  } else {
    sqlite3_bind_null(stmt_, idx);
  }
}

void Statement::BindInt64(int idx, int64_t value) {
  sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value));
}

void Statement::BindOptionalInt64(int idx, const std::optional<int64_t>& value) {
  if (value) {
    BindInt64(idx, *value);
  } else {
    sqlite3_bind_null(stmt_, idx);
  }
}

void Statement::BindBool(int idx, bool value) {
  sqlite3_bind_int(stmt_, idx, value ? 1 : 0);
}

int Statement::Step() {
  return sqlite3_step(stmt_);
}

std::string Statement::ColText(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> Statement::ColOptionalText(int col) const {
  if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
  return ColText(col);
}

int64_t Statement::ColInt64(int col) const {
  return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

std::optional<int64_t> Statement::ColOptionalInt64(int col) const {
  if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
  return ColInt64(col);
}

bool Statement::ColBool(int col) const {
  return sqlite3_column_int(stmt_, col) != 0;
}

} // namespace vaultd::db::sqlite
