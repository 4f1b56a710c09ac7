#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <string>
#include <vector>

namespace tables::db::sqlite {

using tables::db::ErrorCode;
using tables::db::Result;

namespace {

const std::vector<std::string> kBootstrapSql = {
    "CREATE TABLE IF NOT EXISTS tournaments (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS terrain_types (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL UNIQUE, description TEXT NOT NULL DEFAULT '');",
    "CREATE TABLE IF NOT EXISTS tournament_tables (tournament_id INTEGER NOT NULL REFERENCES tournaments(id) ON DELETE CASCADE, table_number INTEGER NOT NULL, terrain_type_id INTEGER REFERENCES terrain_types(id), hidden INTEGER NOT NULL DEFAULT 0, PRIMARY KEY (tournament_id, table_number));",
    "CREATE TABLE IF NOT EXISTS allocations (id INTEGER PRIMARY KEY AUTOINCREMENT, tournament_id INTEGER NOT NULL REFERENCES tournaments(id) ON DELETE CASCADE, round_number INTEGER NOT NULL, table_number INTEGER, competitor_a_id TEXT NOT NULL, competitor_a_name TEXT NOT NULL, competitor_a_score INTEGER NOT NULL, competitor_b_id TEXT, competitor_b_name TEXT NOT NULL DEFAULT '', competitor_b_score INTEGER NOT NULL DEFAULT 0, suggested_table INTEGER, audit_json TEXT NOT NULL, version INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
    "CREATE INDEX IF NOT EXISTS allocations_round_idx ON allocations(tournament_id, round_number);",
    "CREATE TABLE IF NOT EXISTS allocation_audit_log (id INTEGER PRIMARY KEY AUTOINCREMENT, allocation_id INTEGER NOT NULL REFERENCES allocations(id) ON DELETE CASCADE, json TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
    "CREATE INDEX IF NOT EXISTS allocation_audit_log_allocation_idx ON allocation_audit_log(allocation_id);"};

constexpr const char* kAllocationColumns =
    "id,tournament_id,round_number,table_number,competitor_a_id,competitor_a_name,competitor_a_score,"
    "competitor_b_id,competitor_b_name,competitor_b_score,suggested_table,audit_json,version,updated_at_ms";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindOptI32(sqlite3_stmt* st, int idx, const std::optional<int>& v) {
  if (v) {
    sqlite3_bind_int(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
  if (v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(*v));
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& v) {
  if (v) {
    BindText(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

bool ColIsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

std::optional<int> ColOptI32(sqlite3_stmt* st, int col) {
  if (ColIsNull(st, col)) return std::nullopt;
  return ColI32(st, col);
}

std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
  if (ColIsNull(st, col)) return std::nullopt;
  return ColI64(st, col);
}

model::AllocationRecord ReadAllocation(sqlite3_stmt* st) {
  model::AllocationRecord r;
  r.id                 = ColI64(st, 0);
  r.tournament_id      = ColI64(st, 1);
  r.round_number       = ColI32(st, 2);
  r.table_number       = ColOptI32(st, 3);
  r.competitor_a_id    = ColText(st, 4);
  r.competitor_a_name  = ColText(st, 5);
  r.competitor_a_score = ColI64(st, 6);
  if (!ColIsNull(st, 7)) {
    r.competitor_b_id = ColText(st, 7);
  }
  r.competitor_b_name  = ColText(st, 8);
  r.competitor_b_score = ColI64(st, 9);
  r.suggested_table    = ColOptI32(st, 10);
  r.audit_json         = ColText(st, 11);
  r.version            = ColU64(st, 12);
  r.updated_at_ms      = ColU64(st, 13);
  return r;
}

std::vector<model::AllocationRecord> ReadAllocations(sqlite3_stmt* st) {
  std::vector<model::AllocationRecord> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(ReadAllocation(st));
  }
  sqlite3_finalize(st);
  return out;
}

model::TableRecord ReadTable(sqlite3_stmt* st) {
  model::TableRecord r;
  r.tournament_id   = ColI64(st, 0);
  r.table_number    = ColI32(st, 1);
  r.terrain_type_id = ColOptI64(st, 2);
  r.hidden          = ColI32(st, 3) != 0;
  return r;
}

bool HasColumn(SqliteDB& db, const std::string& table, const std::string& column) {
  sqlite3_stmt* st    = db.Prepare("PRAGMA table_info(" + table + ");");
  bool          found = false;
  while (!found && sqlite3_step(st) == SQLITE_ROW) {
    found = ColText(st, 1) == column;
  }
  sqlite3_finalize(st);
  return found;
}

model::TerrainTypeRecord ReadTerrainType(sqlite3_stmt* st) {
  model::TerrainTypeRecord r;
  r.id          = ColI64(st, 0);
  r.name        = ColText(st, 1);
  r.description = ColText(st, 2);
  return r;
}

} // namespace

void BootstrapSchema(SqliteDB& db) {
  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  // databases created before tables could be hidden
  if (!HasColumn(db, "tournament_tables", "hidden")) {
    db.Exec("ALTER TABLE tournament_tables ADD COLUMN hidden INTEGER NOT NULL DEFAULT 0;");
  }
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

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
// Tournaments
// ------------------------------------------------------------------

Result SqliteRepository::InsertTournament(Transaction& t, model::TournamentRecord& r) {
  auto* db = TX(t).Handle();

  const char*   sql = "INSERT INTO tournaments(name,created_at_ms) VALUES(?,?);";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.name);
  BindU64(st, 2, r.created_at_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (rc == SQLITE_DONE) r.id = TX(t).DB().LastInsertId();

  return Translate(db, rc);
}

std::optional<model::TournamentRecord> SqliteRepository::GetTournament(Transaction& t, int64_t tournament_id) {
  auto* db = TX(t).Handle();

  const char*   sql = "SELECT id,name,created_at_ms FROM tournaments WHERE id=?;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return std::nullopt;

  BindI64(st, 1, tournament_id);

  if (sqlite3_step(st) != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  model::TournamentRecord r;
  r.id            = ColI64(st, 0);
  r.name          = ColText(st, 1);
  r.created_at_ms = ColU64(st, 2);

  sqlite3_finalize(st);
  return r;
}

Result SqliteRepository::DeleteTournament(Transaction& t, int64_t tournament_id) {
  auto* db = TX(t).Handle();

  // tables, allocations and audit entries follow through ON DELETE CASCADE
  const char*   sql = "DELETE FROM tournaments WHERE id=?;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st, 1, tournament_id);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto result = Translate(db, rc);
  if (!result) return result;

  if (TX(t).DB().Changes() == 0) return Result::Err(ErrorCode::NotFound, "tournament " + std::to_string(tournament_id));
  return Result::Ok();
}

// ------------------------------------------------------------------
// Terrain types
// ------------------------------------------------------------------

Result SqliteRepository::InsertTerrainType(Transaction& t, model::TerrainTypeRecord& r) {
  auto* db = TX(t).Handle();

  const char*   sql = "INSERT INTO terrain_types(name,description) VALUES(?,?);";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.name);
  BindText(st, 2, r.description);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (rc == SQLITE_DONE) r.id = TX(t).DB().LastInsertId();

  // UNIQUE(name) is the only constraint on this table
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "terrain type " + r.name);

  return Translate(db, rc);
}

std::optional<model::TerrainTypeRecord> SqliteRepository::GetTerrainType(Transaction& t, int64_t terrain_type_id) {
  auto* db = TX(t).Handle();

  const char*   sql = "SELECT id,name,description FROM terrain_types WHERE id=?;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return std::nullopt;

  BindI64(st, 1, terrain_type_id);

  if (sqlite3_step(st) != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  auto r = ReadTerrainType(st);
  sqlite3_finalize(st);
  return r;
}

std::optional<model::TerrainTypeRecord> SqliteRepository::GetTerrainTypeByName(Transaction& t, const std::string& name) {
  auto* db = TX(t).Handle();

  const char*   sql = "SELECT id,name,description FROM terrain_types WHERE name=?;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return std::nullopt;

  BindText(st, 1, name);

  if (sqlite3_step(st) != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  auto r = ReadTerrainType(st);
  sqlite3_finalize(st);
  return r;
}

std::vector<model::TerrainTypeRecord> SqliteRepository::ListTerrainTypes(Transaction& t) {
  auto* db = TX(t).Handle();

  const char*   sql = "SELECT id,name,description FROM terrain_types ORDER BY id;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return {};

  std::vector<model::TerrainTypeRecord> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(ReadTerrainType(st));
  }

  sqlite3_finalize(st);
  return out;
}

// ------------------------------------------------------------------
// Tables
// ------------------------------------------------------------------

Result SqliteRepository::InsertTable(Transaction& t, const model::TableRecord& r) {
  auto* db = TX(t).Handle();

  const char*   sql = "INSERT INTO tournament_tables(tournament_id,table_number,terrain_type_id,hidden) VALUES(?,?,?,?);";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st, 1, r.tournament_id);
  BindI32(st, 2, r.table_number);
  BindOptI64(st, 3, r.terrain_type_id);
  BindI32(st, 4, r.hidden ? 1 : 0);

  int rc       = sqlite3_step(st);
  int extended = rc == SQLITE_DONE ? SQLITE_OK : sqlite3_extended_errcode(db);
  sqlite3_finalize(st);

  if (extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
    return Result::Err(ErrorCode::AlreadyExists, "table " + std::to_string(r.table_number));
  }

  return Translate(db, rc);
}

std::vector<model::TableRecord> SqliteRepository::ListTables(Transaction& t, int64_t tournament_id) {
  auto* db = TX(t).Handle();

  const char* sql =
      "SELECT tournament_id,table_number,terrain_type_id,hidden FROM tournament_tables "
      "WHERE tournament_id=? ORDER BY table_number;";
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return {};

  BindI64(st, 1, tournament_id);

  std::vector<model::TableRecord> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(ReadTable(st));
  }

  sqlite3_finalize(st);
  return out;
}

std::optional<model::TableRecord> SqliteRepository::GetTable(Transaction& t, int64_t tournament_id, int table_number) {
  auto* db = TX(t).Handle();

  const char* sql =
      "SELECT tournament_id,table_number,terrain_type_id,hidden FROM tournament_tables "
      "WHERE tournament_id=? AND table_number=?;";
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return std::nullopt;

  BindI64(st, 1, tournament_id);
  BindI32(st, 2, table_number);

  if (sqlite3_step(st) != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  auto r = ReadTable(st);
  sqlite3_finalize(st);
  return r;
}

Result SqliteRepository::UpdateTable(Transaction& t, const model::TableRecord& r) {
  auto* db = TX(t).Handle();

  const char*   sql = "UPDATE tournament_tables SET terrain_type_id=?,hidden=? WHERE tournament_id=? AND table_number=?;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindOptI64(st, 1, r.terrain_type_id);
  BindI32(st, 2, r.hidden ? 1 : 0);
  BindI64(st, 3, r.tournament_id);
  BindI32(st, 4, r.table_number);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto result = Translate(db, rc);
  if (!result) return result;

  if (TX(t).DB().Changes() == 0) return Result::Err(ErrorCode::NotFound, "table " + std::to_string(r.table_number));
  return Result::Ok();
}

// ------------------------------------------------------------------
// Allocations
// ------------------------------------------------------------------

Result SqliteRepository::InsertAllocation(Transaction& t, model::AllocationRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO allocations(tournament_id,round_number,table_number,competitor_a_id,competitor_a_name,competitor_a_score,"
      "competitor_b_id,competitor_b_name,competitor_b_score,suggested_table,audit_json,version,updated_at_ms) "
      "VALUES(?,?,?,?,?,?,?,?,?,?,?,1,?);";
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st, 1, r.tournament_id);
  BindI32(st, 2, r.round_number);
  BindOptI32(st, 3, r.table_number);
  BindText(st, 4, r.competitor_a_id);
  BindText(st, 5, r.competitor_a_name);
  BindI64(st, 6, r.competitor_a_score);
  BindOptText(st, 7, r.competitor_b_id);
  BindText(st, 8, r.competitor_b_name);
  BindI64(st, 9, r.competitor_b_score);
  BindOptI32(st, 10, r.suggested_table);
  BindText(st, 11, r.audit_json);
  BindU64(st, 12, r.updated_at_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (rc == SQLITE_DONE) {
    r.id      = TX(t).DB().LastInsertId();
    r.version = 1;
  }

  return Translate(db, rc);
}

std::optional<model::AllocationRecord> SqliteRepository::GetAllocation(Transaction& t, int64_t allocation_id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kAllocationColumns + " FROM allocations WHERE id=?;";
  sqlite3_stmt*     st  = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return std::nullopt;

  BindI64(st, 1, allocation_id);

  if (sqlite3_step(st) != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  auto r = ReadAllocation(st);
  sqlite3_finalize(st);
  return r;
}

std::vector<model::AllocationRecord> SqliteRepository::ListAllocations(Transaction& t, int64_t tournament_id, int round_number) {
  auto* db = TX(t).Handle();

  const std::string sql =
      std::string("SELECT ") + kAllocationColumns + " FROM allocations WHERE tournament_id=? AND round_number=? ORDER BY id;";
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return {};

  BindI64(st, 1, tournament_id);
  BindI32(st, 2, round_number);

  return ReadAllocations(st);
}

Result SqliteRepository::DeleteAllocations(Transaction& t, int64_t tournament_id, int round_number) {
  auto* db = TX(t).Handle();

  // audit entries go with their rows through ON DELETE CASCADE
  const char*   sql = "DELETE FROM allocations WHERE tournament_id=? AND round_number=?;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st, 1, tournament_id);
  BindI32(st, 2, round_number);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

Result SqliteRepository::UpdateAllocation(Transaction& t, model::AllocationRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "UPDATE allocations SET table_number=?,audit_json=?,updated_at_ms=?,version=version+1 "
      "WHERE id=? AND version=?;";
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindOptI32(st, 1, r.table_number);
  BindText(st, 2, r.audit_json);
  BindU64(st, 3, r.updated_at_ms);
  BindI64(st, 4, r.id);
  BindU64(st, 5, r.version);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto result = Translate(db, rc);
  if (!result) return result;

  if (TX(t).DB().Changes() == 0) {
    if (!GetAllocation(t, r.id)) return Result::Err(ErrorCode::NotFound, "allocation " + std::to_string(r.id));
    return Result::Err(ErrorCode::Conflict, "allocation " + std::to_string(r.id) + " was modified concurrently");
  }

  r.version += 1;
  return Result::Ok();
}

std::vector<model::AllocationRecord> SqliteRepository::ListCompetitorAllocationsBefore(Transaction& t, int64_t tournament_id,
                                                                                     const std::string& competitor_id, int before_round) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kAllocationColumns +
                          " FROM allocations WHERE tournament_id=? AND (competitor_a_id=? OR competitor_b_id=?) AND round_number<? "
                          "ORDER BY round_number, id;";
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return {};

  BindI64(st, 1, tournament_id);
  BindText(st, 2, competitor_id);
  BindText(st, 3, competitor_id);
  BindI32(st, 4, before_round);

  return ReadAllocations(st);
}

std::vector<std::string> SqliteRepository::ListCompetitorIds(Transaction& t, int64_t tournament_id) {
  auto* db = TX(t).Handle();

  const char* sql =
      "SELECT competitor_a_id AS id FROM allocations WHERE tournament_id=? "
      "UNION SELECT competitor_b_id FROM allocations WHERE tournament_id=? AND competitor_b_id IS NOT NULL "
      "ORDER BY id;";
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return {};

  BindI64(st, 1, tournament_id);
  BindI64(st, 2, tournament_id);

  std::vector<std::string> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(ColText(st, 0));
  }

  sqlite3_finalize(st);
  return out;
}

// ------------------------------------------------------------------
// Audit log
// ------------------------------------------------------------------

Result SqliteRepository::AppendAuditEntry(Transaction& t, model::AuditLogRecord& r) {
  auto* db = TX(t).Handle();

  const char*   sql = "INSERT INTO allocation_audit_log(allocation_id,json,created_at_ms) VALUES(?,?,?);";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st, 1, r.allocation_id);
  BindText(st, 2, r.json);
  BindU64(st, 3, r.created_at_ms);

  int rc       = sqlite3_step(st);
  int extended = rc == SQLITE_DONE ? SQLITE_OK : sqlite3_extended_errcode(db);
  sqlite3_finalize(st);
  if (rc == SQLITE_DONE) r.id = TX(t).DB().LastInsertId();

  if (extended == SQLITE_CONSTRAINT_FOREIGNKEY) {
    return Result::Err(ErrorCode::NotFound, "allocation " + std::to_string(r.allocation_id));
  }

  return Translate(db, rc);
}

std::vector<model::AuditLogRecord> SqliteRepository::ListAuditEntries(Transaction& t, int64_t allocation_id) {
  auto* db = TX(t).Handle();

  const char*   sql = "SELECT id,allocation_id,json,created_at_ms FROM allocation_audit_log WHERE allocation_id=? ORDER BY id;";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return {};

  BindI64(st, 1, allocation_id);

  std::vector<model::AuditLogRecord> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    model::AuditLogRecord r;
    r.id            = ColI64(st, 0);
    r.allocation_id = ColI64(st, 1);
    r.json          = ColText(st, 2);
    r.created_at_ms = ColU64(st, 3);
    out.push_back(std::move(r));
  }

  sqlite3_finalize(st);
  return out;
}

} // namespace tables::db::sqlite
