#include "tournament_service.hpp"

#include <algorithm>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/allocation_mapping.hpp"
#include "internal/service/db_errors.hpp"
#include "internal/util/errors.hpp"

namespace tables::service {

using tables::observability::IntField;

namespace {

void RequireTournament(db::Repository& repo, db::Transaction& tx, int64_t tournament_id) {
  if (!repo.GetTournament(tx, tournament_id)) {
    throw util::NotFound("tournament " + std::to_string(tournament_id) + " not found");
  }
}

TournamentTable ToView(db::Repository& repo, db::Transaction& tx, const db::model::TableRecord& record) {
  TournamentTable view;
  view.number = record.table_number;
  view.hidden = record.hidden;
  if (auto table = ToTable(repo, tx, record); table.terrain) {
    view.terrain = table.terrain->name;
  }
  return view;
}

std::vector<TournamentTable> ToViews(db::Repository& repo, db::Transaction& tx, int64_t tournament_id) {
  std::vector<TournamentTable> out;
  for (const auto& record : repo.ListTables(tx, tournament_id)) {
    out.push_back(ToView(repo, tx, record));
  }
  return out;
}

int CountVisible(const std::vector<db::model::TableRecord>& tables) {
  return static_cast<int>(std::count_if(tables.begin(), tables.end(), [](const auto& t) { return !t.hidden; }));
}

int Minimum(db::Repository& repo, db::Transaction& tx, int64_t tournament_id) {
  return static_cast<int>(repo.ListCompetitorIds(tx, tournament_id).size() / 2);
}

// Unhides the lowest hidden table, or numbers a new one after the highest.
db::model::TableRecord AddOne(db::Repository& repo, db::Transaction& tx, int64_t tournament_id) {
  auto tables = repo.ListTables(tx, tournament_id);
  if (CountVisible(tables) >= kMaxTables) {
    throw util::InvalidArgument("tournament " + std::to_string(tournament_id) + " already has " + std::to_string(kMaxTables) +
                                " tables");
  }

  auto hidden = std::find_if(tables.begin(), tables.end(), [](const auto& t) { return t.hidden; });
  if (hidden != tables.end()) {
    auto record   = *hidden;
    record.hidden = false;
    ThrowIfDbError(repo.UpdateTable(tx, record), "show table " + std::to_string(record.table_number));
    return record;
  }

  db::model::TableRecord record;
  record.tournament_id = tournament_id;
  record.table_number  = tables.empty() ? 1 : tables.back().table_number + 1;
  ThrowIfDbError(repo.InsertTable(tx, record), "create table " + std::to_string(record.table_number));
  return record;
}

db::model::TableRecord RemoveOne(db::Repository& repo, db::Transaction& tx, int64_t tournament_id, int minimum) {
  auto tables  = repo.ListTables(tx, tournament_id);
  auto visible = CountVisible(tables);
  if (visible == 0) {
    throw util::InvalidArgument("tournament " + std::to_string(tournament_id) + " has no visible tables");
  }
  if (visible <= minimum) {
    throw util::InvalidArgument("cannot remove table: minimum " + std::to_string(minimum) + " tables required in tournament " +
                                std::to_string(tournament_id));
  }

  auto highest  = std::find_if(tables.rbegin(), tables.rend(), [](const auto& t) { return !t.hidden; });
  auto record   = *highest;
  record.hidden = true;
  ThrowIfDbError(repo.UpdateTable(tx, record), "hide table " + std::to_string(record.table_number));
  return record;
}

} // namespace

TournamentService::TournamentService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::vector<TournamentTable> TournamentService::ListTables(int64_t tournament_id) {
  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();

  RequireTournament(repo, *tx, tournament_id);
  auto tables = ToViews(repo, *tx, tournament_id);

  tx->Rollback();
  return tables;
}

std::vector<TournamentTable> TournamentService::UpdateTables(int64_t tournament_id, const std::vector<TableTerrain>& changes) {
  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();

  RequireTournament(repo, *tx, tournament_id);

  for (const auto& change : changes) {
    auto record = repo.GetTable(*tx, tournament_id, change.table_number);
    if (!record) {
      throw util::InvalidArgument("table " + std::to_string(change.table_number) + " does not belong to tournament " +
                                  std::to_string(tournament_id));
    }

    record->terrain_type_id.reset();
    if (change.terrain && !change.terrain->empty()) {
      record->terrain_type_id = ResolveTerrainType(repo, *tx, *change.terrain);
    }
    ThrowIfDbError(repo.UpdateTable(*tx, *record), "update table " + std::to_string(change.table_number));
  }

  auto tables = ToViews(repo, *tx, tournament_id);
  tx->Commit();

  TABLES_LOG_INFO("Table terrains updated",
                  {IntField("tournament_id", tournament_id), IntField("changed", static_cast<int64_t>(changes.size()))});
  return tables;
}

int TournamentService::MinimumTableCount(int64_t tournament_id) {
  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();

  RequireTournament(repo, *tx, tournament_id);
  auto minimum = Minimum(repo, *tx, tournament_id);

  tx->Rollback();
  return minimum;
}

TournamentTable TournamentService::AddTable(int64_t tournament_id) {
  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();

  RequireTournament(repo, *tx, tournament_id);
  auto record = AddOne(repo, *tx, tournament_id);
  auto view   = ToView(repo, *tx, record);
  tx->Commit();

  TABLES_LOG_INFO("Table added", {IntField("tournament_id", tournament_id), IntField("table", view.number)});
  return view;
}

TournamentTable TournamentService::RemoveTable(int64_t tournament_id) {
  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();

  RequireTournament(repo, *tx, tournament_id);
  auto record = RemoveOne(repo, *tx, tournament_id, Minimum(repo, *tx, tournament_id));
  auto view   = ToView(repo, *tx, record);
  tx->Commit();

  TABLES_LOG_INFO("Table hidden", {IntField("tournament_id", tournament_id), IntField("table", view.number)});
  return view;
}

TableCountChange TournamentService::SetTableCount(int64_t tournament_id, int target) {
  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();

  RequireTournament(repo, *tx, tournament_id);

  const auto minimum = Minimum(repo, *tx, tournament_id);
  if (target < minimum) {
    throw util::InvalidArgument("target count " + std::to_string(target) + " is below the minimum of " + std::to_string(minimum) +
                                " tables");
  }
  if (target > kMaxTables) {
    throw util::InvalidArgument("target count must not exceed " + std::to_string(kMaxTables));
  }

  TableCountChange change;
  auto             visible = CountVisible(repo.ListTables(*tx, tournament_id));
  for (; visible < target; ++visible, ++change.added) {
    AddOne(repo, *tx, tournament_id);
  }
  for (; visible > target; --visible, ++change.removed) {
    RemoveOne(repo, *tx, tournament_id, minimum);
  }
  change.visible = visible;
  change.tables  = ToViews(repo, *tx, tournament_id);

  tx->Commit();

  TABLES_LOG_INFO("Table count set", {IntField("tournament_id", tournament_id), IntField("target", target),
                                      IntField("added", change.added), IntField("removed", change.removed)});
  return change;
}

TableCountChange TournamentService::EnsureTableCount(int64_t tournament_id, int required) {
  if (required > kMaxTables) {
    throw util::InvalidArgument("required count must not exceed " + std::to_string(kMaxTables));
  }

  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();

  RequireTournament(repo, *tx, tournament_id);

  TableCountChange change;
  auto             visible = CountVisible(repo.ListTables(*tx, tournament_id));
  for (; visible < required; ++visible, ++change.added) {
    AddOne(repo, *tx, tournament_id);
  }
  change.visible = visible;
  change.tables  = ToViews(repo, *tx, tournament_id);

  if (change.added == 0) {
    tx->Rollback();
    return change;
  }

  tx->Commit();

  TABLES_LOG_INFO("Tables ensured", {IntField("tournament_id", tournament_id), IntField("required", required),
                                     IntField("added", change.added)});
  return change;
}

void TournamentService::DeleteTournament(int64_t tournament_id) {
  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();

  ThrowIfDbError(repo.DeleteTournament(*tx, tournament_id), "delete tournament " + std::to_string(tournament_id));
  tx->Commit();

  TABLES_LOG_INFO("Tournament deleted", {IntField("tournament_id", tournament_id)});
}

} // namespace tables::service
