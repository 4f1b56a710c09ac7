#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/conflict.hpp"
#include "internal/util/time.hpp"

namespace tables::model {

inline constexpr int64_t kTableReuseCost   = 100000;
inline constexpr int64_t kTerrainReuseCost = 10000;
inline constexpr int64_t kTableNumberCost  = 1;

/*
  Cost split by tier.

  Generation fills table_number (tier 3). Edit-time recomputation has no
  alternatives to rank and fills bcp_mismatch instead.
*/
struct CostBreakdown {
  int64_t                table_reuse   = 0;
  int64_t                terrain_reuse = 0;
  std::optional<int64_t> table_number;
  std::optional<int64_t> bcp_mismatch;

  int64_t Total() const {
    return table_reuse + terrain_reuse + table_number.value_or(0) + bcp_mismatch.value_or(0);
  }
};

/*
  Rationale for one allocation decision.

  Never mutated once built: every edit produces a new record and the
  storage layer keeps the previous ones.
*/
struct AuditRecord {
  util::TimePoint          timestamp{};
  int64_t                  total_cost = 0;
  CostBreakdown            cost_breakdown;
  std::vector<std::string> reasons;

  // table number -> total cost, chosen table excluded
  std::map<int, int64_t> alternatives_considered;

  bool                  is_round1 = false;
  bool                  is_bye    = false;
  std::vector<Conflict> conflicts;
};

} // namespace tables::model
