#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace vaultd::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by the scheduler worker and the gRPC threads.
  SQLITE_OPEN_FULLMUTEX serializes individual calls; TxMutex() serializes
  whole transactions on the connection.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/bootstrap)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

/*
  Prepared statement, finalized on destruction.

  Bind indexes are 1-based, column indexes 0-based (sqlite convention).
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  void BindText(int idx, const std::string& value);
  void BindOptionalText(int idx, const std::optional<std::string>& value);
  void BindInt64(int idx, int64_t value);
  void BindOptionalInt64(int idx, const std::optional<int64_t>& value);
  void BindBool(int idx, bool value);

  // sqlite3_step result code
  int Step();

  std::string                ColText(int col) const;
  std::optional<std::string> ColOptionalText(int col) const;
  int64_t                    ColInt64(int col) const;
  std::optional<int64_t>     ColOptionalInt64(int col) const;
  bool                       ColBool(int col) const;

  bool Ok() const {
    return stmt_ != nullptr;
  }

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace vaultd::db::sqlite
