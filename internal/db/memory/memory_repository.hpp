#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace tables::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::map<int64_t, model::TournamentRecord>  tournaments;
    std::map<int64_t, model::TerrainTypeRecord> terrain_types;

    // tournament id -> table number -> table
    std::map<int64_t, std::map<int, model::TableRecord>> tables;

    std::map<int64_t, model::AllocationRecord> allocations;
    std::vector<model::AuditLogRecord>         audit_log;

    int64_t next_tournament_id   = 1;
    int64_t next_terrain_type_id = 1;
    int64_t next_allocation_id   = 1;
    int64_t next_audit_id        = 1;
  };

  std::mutex mutex_;
  State      committed_;

  // bumped by every commit that wrote
  uint64_t generation_ = 0;
};

}
