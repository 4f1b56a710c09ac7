#pragma once

#include <cstdint>
#include <set>
#include <string>

namespace tables::history {

/*
  Prior table and terrain usage of competitors within one tournament.

  Scoped to the rounds strictly before the round being allocated. Both
  queries return empty sets when that round is 1 or lower. Implementations
  may memoize per competitor; returned references stay valid for the
  lifetime of the provider.
*/
class HistoryProvider {
 public:
  virtual ~HistoryProvider() = default;

  virtual const std::set<int>& UsedTables(const std::string& competitor_id) = 0;

  // Terrain type ids.
  virtual const std::set<int64_t>& UsedTerrains(const std::string& competitor_id) = 0;
};

} // namespace tables::history
