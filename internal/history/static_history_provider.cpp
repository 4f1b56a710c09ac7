#include "internal/history/static_history_provider.hpp"

namespace tables::history {

void StaticHistoryProvider::AddTable(const std::string& competitor_id, int table_number) {
  tables_[competitor_id].insert(table_number);
}

void StaticHistoryProvider::AddTerrain(const std::string& competitor_id, int64_t terrain_type_id) {
  terrains_[competitor_id].insert(terrain_type_id);
}

const std::set<int>& StaticHistoryProvider::UsedTables(const std::string& competitor_id) {
  return tables_[competitor_id];
}

const std::set<int64_t>& StaticHistoryProvider::UsedTerrains(const std::string& competitor_id) {
  return terrains_[competitor_id];
}

} // namespace tables::history
