#pragma once

#include <string>
#include <vector>

#include "internal/history/history_provider.hpp"
#include "internal/model/audit_record.hpp"
#include "internal/model/conflict.hpp"
#include "internal/model/pairing.hpp"
#include "internal/model/table.hpp"

namespace tables::core {

struct CostResult {
  model::CostBreakdown         breakdown;
  std::vector<std::string>     reasons;
  std::vector<model::Conflict> conflicts;

  int64_t Total() const {
    return breakdown.Total();
  }
};

/*
  Weighted penalty of seating one pairing at one table.

  Tiers in strict priority order:
    1. table reuse    kTableReuseCost per competitor who played the table
    2. terrain reuse  kTerrainReuseCost per competitor who played the
                      terrain, only when the table has one
    3. table number   kTableNumberCost x number

  Every nonzero component carries a reason naming competitor and resource.
  Tier 1 and 2 hits are also returned as Conflicts. No side effects beyond
  the provider's own caching.
*/
class CostModel {
 public:
  static CostResult Evaluate(const model::Pairing& pairing, const model::Table& table, history::HistoryProvider& history);

  // Tiers 1 and 2 only; breakdown.table_number stays empty.
  static CostResult EvaluateReuse(const model::Pairing& pairing, const model::Table& table, history::HistoryProvider& history);
};

} // namespace tables::core
