#include "internal/service/allocation_mapping.hpp"

#include "internal/audit/audit_codec.hpp"
#include "internal/service/db_errors.hpp"
#include "internal/util/time.hpp"

namespace tables::service {

db::model::AllocationRecord ToRecord(const model::AllocationDecision& decision, int64_t tournament_id, int round_number) {
  db::model::AllocationRecord record;
  record.tournament_id      = tournament_id;
  record.round_number       = round_number;
  record.table_number       = decision.table_number;
  record.competitor_a_id    = decision.competitor_a.id;
  record.competitor_a_name  = decision.competitor_a.name;
  record.competitor_a_score = decision.competitor_a.score;
  if (decision.competitor_b) {
    record.competitor_b_id    = decision.competitor_b->id;
    record.competitor_b_name  = decision.competitor_b->name;
    record.competitor_b_score = decision.competitor_b->score;
  }
  record.suggested_table = decision.suggested_table;
  record.audit_json      = audit::AuditCodec::ToJson(decision.audit);
  record.updated_at_ms   = util::ToUnixMillis(decision.audit.timestamp);
  return record;
}

model::AllocationDecision ToDecision(db::Repository& repo, db::Transaction& tx, const db::model::AllocationRecord& record) {
  model::AllocationDecision decision;
  decision.id           = record.id;
  decision.table_number = record.table_number;
  decision.competitor_a = {record.competitor_a_id, record.competitor_a_name, record.competitor_a_score};
  if (record.competitor_b_id) {
    decision.competitor_b = model::CompetitorSnapshot{*record.competitor_b_id, record.competitor_b_name, record.competitor_b_score};
  }
  decision.suggested_table = record.suggested_table;
  decision.audit           = audit::AuditCodec::FromJson(record.audit_json);

  if (record.table_number && *record.table_number != model::kNoTable) {
    if (auto table = LoadTable(repo, tx, record.tournament_id, *record.table_number); table && table->terrain) {
      decision.terrain_name = table->terrain->name;
    }
  }

  return decision;
}

model::Pairing ToPairing(const db::model::AllocationRecord& record) {
  model::Pairing pairing;
  pairing.competitor_a = {record.competitor_a_id, record.competitor_a_name, record.competitor_a_score, 0};
  if (record.competitor_b_id) {
    pairing.competitor_b = model::CompetitorEntry{*record.competitor_b_id, record.competitor_b_name, record.competitor_b_score, 0};
  }
  pairing.suggested_table = record.suggested_table;
  return pairing;
}

model::Table ToTable(db::Repository& repo, db::Transaction& tx, const db::model::TableRecord& record) {
  model::Table table;
  table.number = record.table_number;
  if (record.terrain_type_id) {
    if (auto terrain = repo.GetTerrainType(tx, *record.terrain_type_id)) {
      table.terrain = model::TerrainType{terrain->id, terrain->name};
    }
  }
  return table;
}

std::vector<model::Table> LoadTables(db::Repository& repo, db::Transaction& tx, int64_t tournament_id) {
  std::vector<model::Table> out;
  for (const auto& record : repo.ListTables(tx, tournament_id)) {
    if (record.hidden) continue;
    out.push_back(ToTable(repo, tx, record));
  }
  return out;
}

std::optional<model::Table> LoadTable(db::Repository& repo, db::Transaction& tx, int64_t tournament_id, int table_number) {
  auto record = repo.GetTable(tx, tournament_id, table_number);
  if (!record) return std::nullopt;
  return ToTable(repo, tx, *record);
}

int64_t ResolveTerrainType(db::Repository& repo, db::Transaction& tx, const std::string& name) {
  if (auto existing = repo.GetTerrainTypeByName(tx, name)) {
    return existing->id;
  }

  db::model::TerrainTypeRecord record;
  record.name = name;
  ThrowIfDbError(repo.InsertTerrainType(tx, record), "create terrain type " + name);
  return record.id;
}

} // namespace tables::service
