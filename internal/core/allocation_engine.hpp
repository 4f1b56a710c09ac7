#pragma once

#include <string>
#include <vector>

#include "internal/history/history_provider.hpp"
#include "internal/model/allocation_decision.hpp"
#include "internal/model/pairing.hpp"
#include "internal/model/table.hpp"

namespace tables::core {

/*
  Assigns the pairings of one round to tables.

  Round 1 honors the suggested tables, repairing duplicates, gaps and
  unknown numbers with the lowest free table. Later rounds sort pairings by
  standing and let each pick its cheapest free table under CostModel.

  Output holds every regular pairing first, then byes in input order. No
  state is kept between calls.

  Throws util::InvalidArgument on a round number below 1, a table number
  below 1 or duplicate table numbers, and util::ResourceExhausted when a later round has more
  regular pairings than tables.
*/
class AllocationEngine {
 public:
  static model::RoundAllocation Generate(const std::vector<model::Pairing>& pairings, std::vector<model::Table> tables, int round_number,
                                         history::HistoryProvider& history);

  // Combined standing descending, then smaller competitor id, then input
  // position. Byes must already be removed.
  static std::vector<model::Pairing> SortByStanding(const std::vector<model::Pairing>& pairings);

  static std::string Summarize(const std::vector<model::Conflict>& conflicts, bool round1);
};

} // namespace tables::core
