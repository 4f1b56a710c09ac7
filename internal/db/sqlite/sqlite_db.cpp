#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace tables::db::sqlite {
namespace {

[[noreturn]] void Fail(int rc, const std::string& path, const std::string& what, const std::string& detail) {
  const auto message = "sqlite " + what + " on " + path + ": " + detail;
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    throw util::TableConflict(message);
  }
  throw util::Error("storage", message);
}

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode, int busy_timeout_ms) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string detail = db_ ? sqlite3_errmsg(db_) : "out of memory";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    Fail(rc, path_, "open", detail);
  }

  Configure(wal_mode, busy_timeout_ms);
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string detail = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    Fail(rc, path_, "'" + sql.substr(0, 40) + "'", detail);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    Fail(rc, path_, "prepare", sqlite3_errmsg(db_));
  }
  return stmt;
}

void SqliteDB::Configure(bool wal_mode, int busy_timeout_ms) {
  // WAL lets a LoadRound read while an edit holds the write lock
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  Exec("PRAGMA synchronous=NORMAL;");

  // audit log and table rows cascade with their owners
  Exec("PRAGMA foreign_keys=ON;");

  int rc = sqlite3_busy_timeout(db_, busy_timeout_ms);
  if (rc != SQLITE_OK) {
    Fail(rc, path_, "busy_timeout", sqlite3_errmsg(db_));
  }
}

} // namespace tables::db::sqlite
