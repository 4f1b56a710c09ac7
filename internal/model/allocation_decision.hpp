#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/audit_record.hpp"
#include "internal/model/conflict.hpp"

namespace tables::model {

struct CompetitorSnapshot {
  std::string id;
  std::string name;
  int64_t     score = 0;
};

/*
  Engine output for one pairing.

  table_number is empty for byes and kNoTable when round 1 ran out of
  tables. id is 0 until the decision has been persisted.
*/
struct AllocationDecision {
  int64_t id = 0;

  std::optional<int>         table_number;
  std::optional<std::string> terrain_name;

  CompetitorSnapshot                competitor_a;
  std::optional<CompetitorSnapshot> competitor_b;

  std::optional<int> suggested_table;

  AuditRecord audit;

  bool IsBye() const {
    return !competitor_b.has_value();
  }
};

struct RoundAllocation {
  std::vector<AllocationDecision> decisions;
  std::vector<Conflict>           conflicts;
  std::string                     summary;
};

} // namespace tables::model
