#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/allocation_decision.hpp"
#include "internal/model/pairing.hpp"
#include "internal/model/table.hpp"

namespace tables::service {

// Row for a freshly generated decision. id and version are left for the
// repository to assign.
db::model::AllocationRecord ToRecord(const model::AllocationDecision& decision, int64_t tournament_id, int round_number);

// terrain_name is resolved through the tournament's tables.
model::AllocationDecision ToDecision(db::Repository& repo, db::Transaction& tx, const db::model::AllocationRecord& record);

// Pairing view of a stored row, for cost recomputation. Standings are not
// stored, so total scores are 0.
model::Pairing ToPairing(const db::model::AllocationRecord& record);

model::Table ToTable(db::Repository& repo, db::Transaction& tx, const db::model::TableRecord& record);

// Tables open for allocation; hidden tables are left out.
std::vector<model::Table> LoadTables(db::Repository& repo, db::Transaction& tx, int64_t tournament_id);

// Any table of the tournament, hidden or not.
std::optional<model::Table> LoadTable(db::Repository& repo, db::Transaction& tx, int64_t tournament_id, int table_number);

// Id of the named terrain type, inserted on first use.
int64_t ResolveTerrainType(db::Repository& repo, db::Transaction& tx, const std::string& name);

} // namespace tables::service
