#include "internal/core/collision_detector.hpp"

#include <map>

#include "internal/model/table.hpp"

namespace tables::core {

std::vector<TableCollision> TableCollisionDetector::Find(const std::vector<model::AllocationDecision>& decisions) {
  std::map<int, std::vector<int64_t>> by_table;
  for (const auto& decision : decisions) {
    if (decision.IsBye() || !decision.table_number || *decision.table_number == model::kNoTable) continue;
    by_table[*decision.table_number].push_back(decision.id);
  }

  std::vector<TableCollision> out;
  for (auto& [table_number, ids] : by_table) {
    if (ids.size() > 1) {
      out.push_back({table_number, std::move(ids)});
    }
  }
  return out;
}

bool TableCollisionDetector::HasCollisions(const std::vector<model::AllocationDecision>& decisions) {
  return !Find(decisions).empty();
}

std::size_t TableCollisionDetector::Count(const std::vector<model::AllocationDecision>& decisions) {
  return Find(decisions).size();
}

} // namespace tables::core
