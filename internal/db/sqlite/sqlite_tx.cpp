#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tables::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  if (db_->InTransaction()) {
    throw util::InvalidState("sqlite connection to " + db_->Path() + " already has an open transaction");
  }
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_ || !db_->InTransaction()) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& ex) {
    TABLES_LOG_WARN("sqlite rollback failed", {tables::observability::StringField("path", db_->Path()),
                                               tables::observability::StringField("error", ex.what())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  finished_ = true;
}

} // namespace tables::db::sqlite
