#pragma once

#include <map>

#include "internal/history/history_provider.hpp"

namespace tables::history {

/*
  History held in memory. Used for what-if evaluation and by callers that
  already know the usage sets.
*/
class StaticHistoryProvider final : public HistoryProvider {
 public:
  void AddTable(const std::string& competitor_id, int table_number);
  void AddTerrain(const std::string& competitor_id, int64_t terrain_type_id);

  const std::set<int>&     UsedTables(const std::string& competitor_id) override;
  const std::set<int64_t>& UsedTerrains(const std::string& competitor_id) override;

 private:
  std::map<std::string, std::set<int>>     tables_;
  std::map<std::string, std::set<int64_t>> terrains_;
};

} // namespace tables::history
