#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>

namespace tables::db::sqlite {

inline constexpr int kDefaultBusyTimeoutMs = 5000;

/*
  One sqlite3 connection to a tournament database.

  A connection carries at most one transaction at a time. Concurrent edits
  use separate connections to the same file and queue on the write lock
  for up to the busy timeout; a lock that cannot be taken in time surfaces
  as util::TableConflict, the same way a stale memory snapshot does.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, bool wal_mode = true, int busy_timeout_ms = kDefaultBusyTimeoutMs);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Runs pragmas, schema and transaction control statements.
  void Exec(const std::string& sql);

  // Caller finalizes the statement.
  sqlite3_stmt* Prepare(const std::string& sql);

  bool InTransaction() const {
    return sqlite3_get_autocommit(db_) == 0;
  }

  int64_t LastInsertId() const {
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
  }

  // Rows touched by the last INSERT, UPDATE or DELETE.
  int Changes() const {
    return sqlite3_changes(db_);
  }

 private:
  void Configure(bool wal_mode, int busy_timeout_ms);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace tables::db::sqlite
