#include "internal/history/repository_history_provider.hpp"

#include "internal/model/table.hpp"

namespace tables::history {

RepositoryHistoryProvider::RepositoryHistoryProvider(db::Repository& repo, db::Transaction& tx, int64_t tournament_id,
                                                     int current_round)
    : repo_(repo), tx_(tx), tournament_id_(tournament_id), current_round_(current_round) {
}

const std::set<int>& RepositoryHistoryProvider::UsedTables(const std::string& competitor_id) {
  return Load(competitor_id).tables;
}

const std::set<int64_t>& RepositoryHistoryProvider::UsedTerrains(const std::string& competitor_id) {
  return Load(competitor_id).terrains;
}

const RepositoryHistoryProvider::Usage& RepositoryHistoryProvider::Load(const std::string& competitor_id) {
  if (auto it = usage_.find(competitor_id); it != usage_.end()) {
    return it->second;
  }

  Usage& usage = usage_[competitor_id];
  if (current_round_ <= 1) {
    return usage;
  }

  for (const auto& allocation : repo_.ListCompetitorAllocationsBefore(tx_, tournament_id_, competitor_id, current_round_)) {
    if (allocation.IsBye() || !allocation.table_number || *allocation.table_number == model::kNoTable) {
      continue;
    }

    usage.tables.insert(*allocation.table_number);
    if (auto terrain = TerrainOf(*allocation.table_number)) {
      usage.terrains.insert(*terrain);
    }
  }

  return usage;
}

std::optional<int64_t> RepositoryHistoryProvider::TerrainOf(int table_number) {
  if (auto it = terrain_by_table_.find(table_number); it != terrain_by_table_.end()) {
    return it->second;
  }

  std::optional<int64_t> terrain;
  if (auto table = repo_.GetTable(tx_, tournament_id_, table_number)) {
    terrain = table->terrain_type_id;
  }
  terrain_by_table_.emplace(table_number, terrain);
  return terrain;
}

} // namespace tables::history
