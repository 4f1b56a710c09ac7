#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/allocation_record.hpp"
#include "internal/db/model/audit_log_record.hpp"
#include "internal/db/model/table_record.hpp"
#include "internal/db/model/terrain_type_record.hpp"
#include "internal/db/model/tournament_record.hpp"

namespace tables::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - UpdateAllocation is a compare-and-swap on the row version
  - The audit log is append-only

  The DB is the source of truth for:
    tournament tables
    allocations of every generated round
    allocation audit history
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Tournaments
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertTournament(Transaction&, model::TournamentRecord&) = 0;

  virtual std::optional<model::TournamentRecord> GetTournament(Transaction&, int64_t tournament_id) = 0;

  // Removes the tournament with its tables, allocations and audit entries.
  // Terrain types are shared and stay.
  virtual Result DeleteTournament(Transaction&, int64_t tournament_id) = 0;

  // ---------------------------------------------------------------------
  // Terrain types
  // ---------------------------------------------------------------------

  // Assigns record.id. Names are unique.
  virtual Result InsertTerrainType(Transaction&, model::TerrainTypeRecord&) = 0;

  virtual std::optional<model::TerrainTypeRecord> GetTerrainType(Transaction&, int64_t terrain_type_id) = 0;

  virtual std::optional<model::TerrainTypeRecord> GetTerrainTypeByName(Transaction&, const std::string& name) = 0;

  virtual std::vector<model::TerrainTypeRecord> ListTerrainTypes(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Tables
  // ---------------------------------------------------------------------

  virtual Result InsertTable(Transaction&, const model::TableRecord&) = 0;

  // Ordered by table number, hidden tables included.
  virtual std::vector<model::TableRecord> ListTables(Transaction&, int64_t tournament_id) = 0;

  virtual std::optional<model::TableRecord> GetTable(Transaction&, int64_t tournament_id, int table_number) = 0;

  // Writes terrain_type_id and hidden. NotFound for an unknown table.
  virtual Result UpdateTable(Transaction&, const model::TableRecord&) = 0;

  // ---------------------------------------------------------------------
  // Allocations
  // ---------------------------------------------------------------------

  // Assigns record.id and sets record.version to 1.
  virtual Result InsertAllocation(Transaction&, model::AllocationRecord&) = 0;

  virtual std::optional<model::AllocationRecord> GetAllocation(Transaction&, int64_t allocation_id) = 0;

  // Ordered by allocation id.
  virtual std::vector<model::AllocationRecord> ListAllocations(Transaction&, int64_t tournament_id, int round_number) = 0;

  // Removes the round's allocations together with their audit entries.
  virtual Result DeleteAllocations(Transaction&, int64_t tournament_id, int round_number) = 0;

  // Writes table_number, audit_json and updated_at_ms when the stored
  // version equals record.version, then bumps record.version.
  // Returns ErrorCode::Conflict on a version mismatch.
  virtual Result UpdateAllocation(Transaction&, model::AllocationRecord&) = 0;

  // Allocations of rounds strictly before before_round in which the
  // competitor played on either side.
  virtual std::vector<model::AllocationRecord> ListCompetitorAllocationsBefore(Transaction&, int64_t tournament_id,
                                                                               const std::string& competitor_id, int before_round) = 0;

  // Distinct competitor ids seen in any round of the tournament, sorted.
  virtual std::vector<std::string> ListCompetitorIds(Transaction&, int64_t tournament_id) = 0;

  // ---------------------------------------------------------------------
  // Audit log
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result AppendAuditEntry(Transaction&, model::AuditLogRecord&) = 0;

  // Insertion order.
  virtual std::vector<model::AuditLogRecord> ListAuditEntries(Transaction&, int64_t allocation_id) = 0;
};

} // namespace tables::db
