#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "service_context.hpp"

namespace tables::service {

// Upper bound for SetTableCount, EnsureTableCount and AddTable.
inline constexpr int kMaxTables = 100;

struct TableTerrain {
  int                        table_number = 0;
  std::optional<std::string> terrain; // unset or empty clears the terrain
};

struct TournamentTable {
  int                        number = 0;
  std::optional<std::string> terrain;
  bool                       hidden = false;
};

struct TableCountChange {
  int added   = 0;
  int removed = 0;
  int visible = 0;

  std::vector<TournamentTable> tables;
};

/*
  Table management for an existing tournament.

  Tables are never deleted once created. RemoveTable hides the highest
  visible table so rounds already played there keep their history, and
  AddTable brings back the lowest hidden table before numbering a new one.

  The floor for the visible count is half the competitors seen in the
  tournament's rounds, rounded down.
*/
class TournamentService {
public:
  explicit TournamentService(ServiceContext ctx);

  // Ordered by number, hidden tables included.
  std::vector<TournamentTable> ListTables(int64_t tournament_id);

  // Sets or clears the terrain of each listed table in one transaction.
  // Terrain types are created on first use. A number the tournament does
  // not have fails the whole update.
  std::vector<TournamentTable> UpdateTables(int64_t tournament_id, const std::vector<TableTerrain>& changes);

  int MinimumTableCount(int64_t tournament_id);

  TournamentTable AddTable(int64_t tournament_id);

  TournamentTable RemoveTable(int64_t tournament_id);

  // Adds or hides tables until exactly target are visible.
  TableCountChange SetTableCount(int64_t tournament_id, int target);

  // Grows the visible count to at least required; never hides.
  TableCountChange EnsureTableCount(int64_t tournament_id, int required);

  // Drops the tournament with its tables, rounds and audit trail.
  void DeleteTournament(int64_t tournament_id);

private:
  ServiceContext ctx_;
};

} // namespace tables::service
