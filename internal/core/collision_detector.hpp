#pragma once

#include <cstdint>
#include <vector>

#include "internal/model/allocation_decision.hpp"

namespace tables::core {

struct TableCollision {
  int                  table_number = 0;
  std::vector<int64_t> allocation_ids;
};

/*
  Finds tables held by more than one allocation of a round.

  Byes and placeholder table 0 are ignored. Generation and the adjustment
  service never produce collisions; this is the post-condition check for
  rows written by anything else.
*/
class TableCollisionDetector {
 public:
  // Ordered by table number; ids in input order.
  static std::vector<TableCollision> Find(const std::vector<model::AllocationDecision>& decisions);

  static bool HasCollisions(const std::vector<model::AllocationDecision>& decisions);

  static std::size_t Count(const std::vector<model::AllocationDecision>& decisions);
};

} // namespace tables::core
