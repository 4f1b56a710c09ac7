#include <cassert>
#include <iostream>
#include <optional>
#include <vector>

#include "internal/core/collision_detector.hpp"
#include "internal/model/table.hpp"

namespace {

using tables::core::TableCollisionDetector;
using tables::model::AllocationDecision;
using tables::model::CompetitorSnapshot;

AllocationDecision Seated(int64_t id, std::optional<int> table) {
  AllocationDecision d;
  d.id           = id;
  d.table_number = table;
  d.competitor_a = CompetitorSnapshot{"a" + std::to_string(id), "A", 0};
  d.competitor_b = CompetitorSnapshot{"b" + std::to_string(id), "B", 0};
  return d;
}

AllocationDecision Bye(int64_t id) {
  AllocationDecision d;
  d.id           = id;
  d.competitor_a = CompetitorSnapshot{"a" + std::to_string(id), "A", 0};
  return d;
}

void TestCleanRoundHasNoCollisions() {
  std::vector<AllocationDecision> round = {Seated(1, 1), Seated(2, 2), Bye(3), Bye(4)};
  assert(!TableCollisionDetector::HasCollisions(round));
  assert(TableCollisionDetector::Count(round) == 0);
}

void TestDuplicateTablesReported() {
  std::vector<AllocationDecision> round = {Seated(1, 3), Seated(2, 1), Seated(3, 3), Seated(4, 1), Seated(5, 2), Seated(6, 3)};

  auto collisions = TableCollisionDetector::Find(round);
  assert(collisions.size() == 2);
  assert(collisions[0].table_number == 1);
  assert((collisions[0].allocation_ids == std::vector<int64_t>{2, 4}));
  assert(collisions[1].table_number == 3);
  assert((collisions[1].allocation_ids == std::vector<int64_t>{1, 3, 6}));
  assert(TableCollisionDetector::HasCollisions(round));
  assert(TableCollisionDetector::Count(round) == 2);
}

void TestPlaceholdersAreNotCollisions() {
  std::vector<AllocationDecision> round = {Seated(1, tables::model::kNoTable), Seated(2, tables::model::kNoTable), Seated(3, 1)};
  assert(!TableCollisionDetector::HasCollisions(round));
}

} // namespace

int main() {
  TestCleanRoundHasNoCollisions();
  TestDuplicateTablesReported();
  TestPlaceholdersAreNotCollisions();

  std::cout << "table_allocator_unit_collision_detector: pass\n";
  return 0;
}
