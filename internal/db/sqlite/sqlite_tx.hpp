#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace tables::db::sqlite {

/*
  BEGIN IMMEDIATE transaction on one connection.

  The write lock is taken at Begin, so a Reassign or Swap reads the round
  with no other writer in between. A second Begin on a connection that
  already has an open transaction is refused with util::InvalidState.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteDB& DB() const { return *db_; }
  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
  bool finished_  = false;
};

}
