#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace tables::db::sqlite {

// Creates the schema if it does not exist yet.
void BootstrapSchema(SqliteDB& db);

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertTournament(Transaction&, model::TournamentRecord&) override;
  std::optional<model::TournamentRecord> GetTournament(Transaction&, int64_t tournament_id) override;
  Result DeleteTournament(Transaction&, int64_t tournament_id) override;

  Result InsertTerrainType(Transaction&, model::TerrainTypeRecord&) override;
  std::optional<model::TerrainTypeRecord> GetTerrainType(Transaction&, int64_t terrain_type_id) override;
  std::optional<model::TerrainTypeRecord> GetTerrainTypeByName(Transaction&, const std::string& name) override;
  std::vector<model::TerrainTypeRecord> ListTerrainTypes(Transaction&) override;

  Result InsertTable(Transaction&, const model::TableRecord&) override;
  std::vector<model::TableRecord> ListTables(Transaction&, int64_t tournament_id) override;
  std::optional<model::TableRecord> GetTable(Transaction&, int64_t tournament_id, int table_number) override;
  Result UpdateTable(Transaction&, const model::TableRecord&) override;

  Result InsertAllocation(Transaction&, model::AllocationRecord&) override;
  std::optional<model::AllocationRecord> GetAllocation(Transaction&, int64_t allocation_id) override;
  std::vector<model::AllocationRecord> ListAllocations(Transaction&, int64_t tournament_id, int round_number) override;
  Result DeleteAllocations(Transaction&, int64_t tournament_id, int round_number) override;
  Result UpdateAllocation(Transaction&, model::AllocationRecord&) override;
  std::vector<model::AllocationRecord> ListCompetitorAllocationsBefore(Transaction&, int64_t tournament_id,
                                                                       const std::string& competitor_id, int before_round) override;
  std::vector<std::string> ListCompetitorIds(Transaction&, int64_t tournament_id) override;

  Result AppendAuditEntry(Transaction&, model::AuditLogRecord&) override;
  std::vector<model::AuditLogRecord> ListAuditEntries(Transaction&, int64_t allocation_id) override;

private:
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
