#include "generation_service.hpp"

#include "internal/audit/audit_codec.hpp"
#include "internal/core/allocation_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/history/repository_history_provider.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/allocation_mapping.hpp"
#include "internal/service/db_errors.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tables::service {

using tables::observability::IntField;
using tables::observability::StringField;

namespace {

void RequireTournament(db::Repository& repo, db::Transaction& tx, int64_t tournament_id) {
  if (!repo.GetTournament(tx, tournament_id)) {
    throw util::NotFound("tournament " + std::to_string(tournament_id) + " not found");
  }
}

int64_t CountConflicts(const std::vector<model::Conflict>& conflicts, model::ConflictType type) {
  int64_t count = 0;
  for (const auto& conflict : conflicts) {
    if (conflict.type == type) ++count;
  }
  return count;
}

} // namespace

GenerationService::GenerationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

int64_t GenerationService::CreateTournament(const std::string& name, const std::vector<std::optional<std::string>>& table_terrains) {
  if (name.empty()) {
    throw util::InvalidArgument("create tournament: name must not be empty");
  }

  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();

  db::model::TournamentRecord tournament;
  tournament.name          = name;
  tournament.created_at_ms = util::NowMillis();
  ThrowIfDbError(repo.InsertTournament(*tx, tournament), "create tournament");

  for (std::size_t i = 0; i < table_terrains.size(); ++i) {
    db::model::TableRecord table;
    table.tournament_id = tournament.id;
    table.table_number  = static_cast<int>(i + 1);
    if (table_terrains[i] && !table_terrains[i]->empty()) {
      table.terrain_type_id = ResolveTerrainType(repo, *tx, *table_terrains[i]);
    }
    ThrowIfDbError(repo.InsertTable(*tx, table), "create table " + std::to_string(table.table_number));
  }

  tx->Commit();

  TABLES_LOG_INFO("Tournament created", {IntField("tournament_id", tournament.id), StringField("name", name),
                                         IntField("tables", static_cast<int64_t>(table_terrains.size()))});
  return tournament.id;
}

model::RoundAllocation GenerationService::Generate(int64_t tournament_id, int round_number, const std::vector<model::Pairing>& pairings) {
  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();

  RequireTournament(repo, *tx, tournament_id);

  auto                                tables = LoadTables(repo, *tx, tournament_id);
  history::RepositoryHistoryProvider history(repo, *tx, tournament_id, round_number);

  auto result = core::AllocationEngine::Generate(pairings, std::move(tables), round_number, history);

  ThrowIfDbError(repo.DeleteAllocations(*tx, tournament_id, round_number), "clear round " + std::to_string(round_number));

  for (auto& decision : result.decisions) {
    auto record = ToRecord(decision, tournament_id, round_number);
    ThrowIfDbError(repo.InsertAllocation(*tx, record), "insert allocation");
    decision.id = record.id;

    db::model::AuditLogRecord entry;
    entry.allocation_id = record.id;
    entry.json          = record.audit_json;
    entry.created_at_ms = record.updated_at_ms;
    ThrowIfDbError(repo.AppendAuditEntry(*tx, entry), "append audit entry");
  }

  tx->Commit();

  TABLES_LOG_INFO("Round generated",
                  {IntField("tournament_id", tournament_id), IntField("round", round_number),
                   IntField("allocations", static_cast<int64_t>(result.decisions.size())),
                   IntField("table_reuse", CountConflicts(result.conflicts, model::ConflictType::kTableReuse)),
                   IntField("terrain_reuse", CountConflicts(result.conflicts, model::ConflictType::kTerrainReuse)),
                   IntField("no_table", CountConflicts(result.conflicts, model::ConflictType::kNoTableAvailable)),
                   StringField("summary", result.summary)});
  return result;
}

model::RoundAllocation GenerationService::LoadRound(int64_t tournament_id, int round_number) {
  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();

  RequireTournament(repo, *tx, tournament_id);

  model::RoundAllocation result;
  for (const auto& record : repo.ListAllocations(*tx, tournament_id, round_number)) {
    auto decision = ToDecision(repo, *tx, record);
    result.conflicts.insert(result.conflicts.end(), decision.audit.conflicts.begin(), decision.audit.conflicts.end());
    result.decisions.push_back(std::move(decision));
  }
  result.summary = core::AllocationEngine::Summarize(result.conflicts, round_number == 1);

  tx->Rollback();
  return result;
}

} // namespace tables::service
