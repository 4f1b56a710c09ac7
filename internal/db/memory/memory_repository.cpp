#include "memory_repository.hpp"

#include <algorithm>
#include <set>

#include "memory_tx.hpp"

namespace tables::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Tournaments
// ------------------------------------------------------------------

Result MemoryRepository::InsertTournament(Transaction& t, model::TournamentRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_tournament_id++;
  s.tournaments[r.id] = r;
  return Result::Ok();
}

std::optional<model::TournamentRecord> MemoryRepository::GetTournament(Transaction& t, int64_t tournament_id) {
  const auto& s  = TX(t).View();
  auto        it = s.tournaments.find(tournament_id);
  if (it == s.tournaments.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteTournament(Transaction& t, int64_t tournament_id) {
  auto& s = TX(t).Mutable();
  if (s.tournaments.erase(tournament_id) == 0) return Result::Err(ErrorCode::NotFound, "tournament " + std::to_string(tournament_id));

  s.tables.erase(tournament_id);

  std::set<int64_t> removed;
  for (auto it = s.allocations.begin(); it != s.allocations.end();) {
    if (it->second.tournament_id == tournament_id) {
      removed.insert(it->first);
      it = s.allocations.erase(it);
    } else {
      ++it;
    }
  }
  std::erase_if(s.audit_log, [&removed](const model::AuditLogRecord& e) { return removed.contains(e.allocation_id); });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Terrain types
// ------------------------------------------------------------------

Result MemoryRepository::InsertTerrainType(Transaction& t, model::TerrainTypeRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& [_, existing] : s.terrain_types) {
    if (existing.name == r.name) return Result::Err(ErrorCode::AlreadyExists, "terrain type " + r.name);
  }
  r.id = s.next_terrain_type_id++;
  s.terrain_types[r.id] = r;
  return Result::Ok();
}

std::optional<model::TerrainTypeRecord> MemoryRepository::GetTerrainType(Transaction& t, int64_t terrain_type_id) {
  const auto& s  = TX(t).View();
  auto        it = s.terrain_types.find(terrain_type_id);
  if (it == s.terrain_types.end()) return std::nullopt;
  return it->second;
}

std::optional<model::TerrainTypeRecord> MemoryRepository::GetTerrainTypeByName(Transaction& t, const std::string& name) {
  for (const auto& [_, record] : TX(t).View().terrain_types) {
    if (record.name == name) return record;
  }
  return std::nullopt;
}

std::vector<model::TerrainTypeRecord> MemoryRepository::ListTerrainTypes(Transaction& t) {
  std::vector<model::TerrainTypeRecord> out;
  for (const auto& [_, record] : TX(t).View().terrain_types) out.push_back(record);
  return out;
}

// ------------------------------------------------------------------
// Tables
// ------------------------------------------------------------------

Result MemoryRepository::InsertTable(Transaction& t, const model::TableRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.tournaments.contains(r.tournament_id)) return Result::Err(ErrorCode::NotFound, "tournament");
  if (r.terrain_type_id && !s.terrain_types.contains(*r.terrain_type_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown terrain type");
  }

  auto& by_number = s.tables[r.tournament_id];
  if (by_number.contains(r.table_number)) return Result::Err(ErrorCode::AlreadyExists, "table " + std::to_string(r.table_number));
  by_number[r.table_number] = r;
  return Result::Ok();
}

std::vector<model::TableRecord> MemoryRepository::ListTables(Transaction& t, int64_t tournament_id) {
  const auto& s  = TX(t).View();
  auto        it = s.tables.find(tournament_id);
  if (it == s.tables.end()) return {};

  std::vector<model::TableRecord> out;
  out.reserve(it->second.size());
  for (const auto& [_, record] : it->second) out.push_back(record);
  return out;
}

std::optional<model::TableRecord> MemoryRepository::GetTable(Transaction& t, int64_t tournament_id, int table_number) {
  const auto& s  = TX(t).View();
  auto        it = s.tables.find(tournament_id);
  if (it == s.tables.end()) return std::nullopt;

  auto table = it->second.find(table_number);
  if (table == it->second.end()) return std::nullopt;
  return table->second;
}

Result MemoryRepository::UpdateTable(Transaction& t, const model::TableRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.tables.find(r.tournament_id);
  if (it == s.tables.end() || !it->second.contains(r.table_number)) {
    return Result::Err(ErrorCode::NotFound, "table " + std::to_string(r.table_number));
  }
  if (r.terrain_type_id && !s.terrain_types.contains(*r.terrain_type_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown terrain type");
  }

  it->second[r.table_number] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Allocations
// ------------------------------------------------------------------

Result MemoryRepository::InsertAllocation(Transaction& t, model::AllocationRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.tournaments.contains(r.tournament_id)) return Result::Err(ErrorCode::NotFound, "tournament");

  r.id      = s.next_allocation_id++;
  r.version = 1;
  s.allocations[r.id] = r;
  return Result::Ok();
}

std::optional<model::AllocationRecord> MemoryRepository::GetAllocation(Transaction& t, int64_t allocation_id) {
  const auto& s  = TX(t).View();
  auto        it = s.allocations.find(allocation_id);
  if (it == s.allocations.end()) return std::nullopt;
  return it->second;
}

std::vector<model::AllocationRecord> MemoryRepository::ListAllocations(Transaction& t, int64_t tournament_id, int round_number) {
  std::vector<model::AllocationRecord> out;
  for (const auto& [_, record] : TX(t).View().allocations) {
    if (record.tournament_id == tournament_id && record.round_number == round_number) out.push_back(record);
  }
  return out;
}

Result MemoryRepository::DeleteAllocations(Transaction& t, int64_t tournament_id, int round_number) {
  auto& s = TX(t).Mutable();
  for (auto it = s.allocations.begin(); it != s.allocations.end();) {
    if (it->second.tournament_id != tournament_id || it->second.round_number != round_number) {
      ++it;
      continue;
    }

    const auto allocation_id = it->first;
    std::erase_if(s.audit_log, [allocation_id](const model::AuditLogRecord& e) { return e.allocation_id == allocation_id; });
    it = s.allocations.erase(it);
  }
  return Result::Ok();
}

Result MemoryRepository::UpdateAllocation(Transaction& t, model::AllocationRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.allocations.find(r.id);
  if (it == s.allocations.end()) return Result::Err(ErrorCode::NotFound, "allocation " + std::to_string(r.id));
  if (it->second.version != r.version) {
    return Result::Err(ErrorCode::Conflict, "allocation " + std::to_string(r.id) + " was modified concurrently");
  }

  it->second.table_number  = r.table_number;
  it->second.audit_json    = r.audit_json;
  it->second.updated_at_ms = r.updated_at_ms;
  it->second.version       = r.version + 1;
  r.version                = it->second.version;
  return Result::Ok();
}

std::vector<model::AllocationRecord> MemoryRepository::ListCompetitorAllocationsBefore(Transaction& t, int64_t tournament_id,
                                                                                     const std::string& competitor_id, int before_round) {
  std::vector<model::AllocationRecord> out;
  for (const auto& [_, record] : TX(t).View().allocations) {
    if (record.tournament_id != tournament_id || record.round_number >= before_round) continue;
    if (record.competitor_a_id == competitor_id || record.competitor_b_id == competitor_id) out.push_back(record);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.round_number < b.round_number; });
  return out;
}

std::vector<std::string> MemoryRepository::ListCompetitorIds(Transaction& t, int64_t tournament_id) {
  std::set<std::string> ids;
  for (const auto& [_, record] : TX(t).View().allocations) {
    if (record.tournament_id != tournament_id) continue;
    ids.insert(record.competitor_a_id);
    if (record.competitor_b_id) ids.insert(*record.competitor_b_id);
  }
  return {ids.begin(), ids.end()};
}

// ------------------------------------------------------------------
// Audit log
// ------------------------------------------------------------------

Result MemoryRepository::AppendAuditEntry(Transaction& t, model::AuditLogRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.allocations.contains(r.allocation_id)) return Result::Err(ErrorCode::NotFound, "allocation " + std::to_string(r.allocation_id));

  r.id = s.next_audit_id++;
  s.audit_log.push_back(r);
  return Result::Ok();
}

std::vector<model::AuditLogRecord> MemoryRepository::ListAuditEntries(Transaction& t, int64_t allocation_id) {
  std::vector<model::AuditLogRecord> out;
  for (const auto& entry : TX(t).View().audit_log) {
    if (entry.allocation_id == allocation_id) out.push_back(entry);
  }
  return out;
}

} // namespace tables::db::memory
