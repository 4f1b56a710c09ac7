#pragma once

#include <map>
#include <optional>

#include "internal/db/api/repository.hpp"
#include "internal/history/history_provider.hpp"

namespace tables::history {

/*
  History read from persisted allocations of earlier rounds.

  Bound to one open transaction; build a fresh provider per generation run
  or per edit so the caches never outlive the data they were read from.
  Byes and placeholder table 0 contribute nothing.
*/
class RepositoryHistoryProvider final : public HistoryProvider {
 public:
  RepositoryHistoryProvider(db::Repository& repo, db::Transaction& tx, int64_t tournament_id, int current_round);

  const std::set<int>&     UsedTables(const std::string& competitor_id) override;
  const std::set<int64_t>& UsedTerrains(const std::string& competitor_id) override;

 private:
  struct Usage {
    std::set<int>     tables;
    std::set<int64_t> terrains;
  };

  const Usage&           Load(const std::string& competitor_id);
  std::optional<int64_t> TerrainOf(int table_number);

  db::Repository&  repo_;
  db::Transaction& tx_;
  int64_t          tournament_id_;
  int              current_round_;

  std::map<std::string, Usage>           usage_;
  std::map<int, std::optional<int64_t>> terrain_by_table_;
};

} // namespace tables::history
