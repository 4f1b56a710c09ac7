#include "internal/core/allocation_engine.hpp"

#include <algorithm>
#include <map>
#include <numeric>
#include <set>

#include "internal/core/cost_model.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tables::core {
namespace {

model::CompetitorSnapshot Snapshot(const model::CompetitorEntry& competitor) {
  return {competitor.id, competitor.name, competitor.round_score};
}

model::AllocationDecision DecisionFor(const model::Pairing& pairing) {
  model::AllocationDecision decision;
  decision.competitor_a = Snapshot(pairing.competitor_a);
  if (pairing.competitor_b) {
    decision.competitor_b = Snapshot(*pairing.competitor_b);
  }
  decision.suggested_table = pairing.suggested_table;
  return decision;
}

model::AllocationDecision ByeDecision(const model::Pairing& pairing, bool round1, util::TimePoint now) {
  auto decision = DecisionFor(pairing);

  auto& audit     = decision.audit;
  audit.timestamp = now;
  audit.is_round1 = round1;
  audit.is_bye    = true;
  audit.reasons.push_back("Bye - no opponent this round");
  return decision;
}

std::string VersusLabel(const model::Pairing& pairing) {
  auto label = pairing.competitor_a.name + " (" + pairing.competitor_a.id + ")";
  if (pairing.competitor_b) {
    label += " vs " + pairing.competitor_b->name + " (" + pairing.competitor_b->id + ")";
  }
  return label;
}

const model::Table* FindTable(const std::vector<model::Table>& tables, int number) {
  auto it = std::lower_bound(tables.begin(), tables.end(), number, [](const model::Table& t, int n) { return t.number < n; });
  if (it == tables.end() || it->number != number) return nullptr;
  return &*it;
}

std::optional<std::string> TerrainName(const model::Table* table) {
  if (!table || !table->terrain) return std::nullopt;
  return table->terrain->name;
}

void SortTables(std::vector<model::Table>& tables) {
  std::sort(tables.begin(), tables.end(), [](const model::Table& a, const model::Table& b) { return a.number < b.number; });

  auto dup = std::adjacent_find(tables.begin(), tables.end(),
                                [](const model::Table& a, const model::Table& b) { return a.number == b.number; });
  if (dup != tables.end()) {
    throw util::InvalidArgument("duplicate table number " + std::to_string(dup->number));
  }

  // 0 is reserved for kNoTable
  if (!tables.empty() && tables.front().number < 1) {
    throw util::InvalidArgument("table numbers start at 1, got " + std::to_string(tables.front().number));
  }
}

void Partition(const std::vector<model::Pairing>& pairings, std::vector<model::Pairing>& regular, std::vector<model::Pairing>& byes) {
  for (const auto& pairing : pairings) {
    if (pairing.IsBye()) {
      byes.push_back(pairing);
    } else {
      regular.push_back(pairing);
    }
  }
}

// ------------------------------------------------------------------
// Round 1
// ------------------------------------------------------------------

model::RoundAllocation AllocateRound1(const std::vector<model::Pairing>& regular, const std::vector<model::Table>& tables,
                                      util::TimePoint now) {
  model::RoundAllocation result;
  std::set<int>          claimed;

  for (const auto& pairing : regular) {
    auto decision = DecisionFor(pairing);
    auto& audit   = decision.audit;

    audit.timestamp                   = now;
    audit.is_round1                   = true;
    audit.cost_breakdown.table_number = 0;

    std::optional<int> chosen;
    std::string        reason;

    if (!pairing.suggested_table) {
      reason = "Round 1 - suggested table missing, assigned next available";
    } else if (!FindTable(tables, *pairing.suggested_table)) {
      reason = "Round 1 - suggested table " + std::to_string(*pairing.suggested_table) + " not in tournament tables, assigned next available";
    } else if (claimed.contains(*pairing.suggested_table)) {
      reason = "Round 1 - suggested table " + std::to_string(*pairing.suggested_table) + " already assigned, assigned next available";
    } else {
      chosen = *pairing.suggested_table;
      reason = "Round 1 - using suggested table " + std::to_string(*chosen);
    }

    if (!chosen) {
      for (const auto& table : tables) {
        if (!claimed.contains(table.number)) {
          chosen = table.number;
          break;
        }
      }
    }

    if (chosen) {
      claimed.insert(*chosen);
      decision.table_number = *chosen;
      decision.terrain_name = TerrainName(FindTable(tables, *chosen));
    } else {
      decision.table_number = model::kNoTable;
      model::Conflict conflict{model::ConflictType::kNoTableAvailable, "No available tables for pairing " + VersusLabel(pairing),
                               pairing.competitor_a.id, std::nullopt, std::nullopt};
      audit.conflicts.push_back(conflict);
      result.conflicts.push_back(std::move(conflict));
    }

    audit.reasons.push_back(std::move(reason));
    result.decisions.push_back(std::move(decision));
  }

  return result;
}

// ------------------------------------------------------------------
// Round N
// ------------------------------------------------------------------

model::RoundAllocation AllocateGreedy(const std::vector<model::Pairing>& regular, const std::vector<model::Table>& tables,
                                      history::HistoryProvider& history, util::TimePoint now) {
  model::RoundAllocation result;
  std::set<int>          claimed;

  for (const auto& pairing : AllocationEngine::SortByStanding(regular)) {
    const model::Table*    best = nullptr;
    std::optional<int64_t> best_cost;
    std::map<int, int64_t> costs;

    // tables are sorted, so an equal cost keeps the lower number unless
    // the later table is the suggested one
    for (const auto& table : tables) {
      if (claimed.contains(table.number)) continue;

      const int64_t cost = CostModel::Evaluate(pairing, table, history).Total();
      costs[table.number] = cost;

      if (!best_cost || cost < *best_cost || (cost == *best_cost && pairing.suggested_table == table.number)) {
        best_cost = cost;
        best      = &table;
      }
    }

    if (!best) {
      throw util::ResourceExhausted("no free table for pairing " + VersusLabel(pairing));
    }

    auto cost = CostModel::Evaluate(pairing, *best, history);
    costs.erase(best->number);
    claimed.insert(best->number);

    auto decision         = DecisionFor(pairing);
    decision.table_number = best->number;
    decision.terrain_name = TerrainName(best);

    auto& audit                   = decision.audit;
    audit.timestamp               = now;
    audit.total_cost              = cost.Total();
    audit.cost_breakdown          = cost.breakdown;
    audit.reasons                 = std::move(cost.reasons);
    audit.alternatives_considered = std::move(costs);
    audit.conflicts               = cost.conflicts;

    result.conflicts.insert(result.conflicts.end(), cost.conflicts.begin(), cost.conflicts.end());
    result.decisions.push_back(std::move(decision));
  }

  return result;
}

} // namespace

std::vector<model::Pairing> AllocationEngine::SortByStanding(const std::vector<model::Pairing>& pairings) {
  std::vector<std::size_t> order(pairings.size());
  std::iota(order.begin(), order.end(), 0);

  std::stable_sort(order.begin(), order.end(), [&](std::size_t lhs, std::size_t rhs) {
    const auto& a = pairings[lhs];
    const auto& b = pairings[rhs];
    if (a.CombinedTotalScore() != b.CombinedTotalScore()) {
      return a.CombinedTotalScore() > b.CombinedTotalScore();
    }
    if (a.MinCompetitorId() != b.MinCompetitorId()) {
      return a.MinCompetitorId() < b.MinCompetitorId();
    }
    return lhs < rhs;
  });

  std::vector<model::Pairing> sorted;
  sorted.reserve(pairings.size());
  for (auto index : order) {
    sorted.push_back(pairings[index]);
  }
  return sorted;
}

std::string AllocationEngine::Summarize(const std::vector<model::Conflict>& conflicts, bool round1) {
  if (round1) {
    if (conflicts.empty()) return "Round 1 allocations use the suggested table assignments.";
    return "Round 1 allocations generated with " + std::to_string(conflicts.size()) + " conflict(s).";
  }

  if (conflicts.empty()) return "All allocations optimal - no constraint violations.";

  std::size_t table_reuse   = 0;
  std::size_t terrain_reuse = 0;
  for (const auto& conflict : conflicts) {
    if (conflict.type == model::ConflictType::kTableReuse) {
      ++table_reuse;
    } else if (conflict.type == model::ConflictType::kTerrainReuse) {
      ++terrain_reuse;
    }
  }

  std::string parts;
  if (table_reuse > 0) {
    parts = std::to_string(table_reuse) + " table reuse conflict(s)";
  }
  if (terrain_reuse > 0) {
    if (!parts.empty()) parts += ", ";
    parts += std::to_string(terrain_reuse) + " terrain reuse conflict(s)";
  }

  return "Best effort allocation with " + parts + ".";
}

model::RoundAllocation AllocationEngine::Generate(const std::vector<model::Pairing>& pairings, std::vector<model::Table> tables,
                                                  int round_number, history::HistoryProvider& history) {
  if (round_number < 1) {
    throw util::InvalidArgument("round number must be at least 1, got " + std::to_string(round_number));
  }

  SortTables(tables);

  std::vector<model::Pairing> regular;
  std::vector<model::Pairing> byes;
  Partition(pairings, regular, byes);

  const bool round1 = round_number == 1;
  const auto now    = util::Now();

  if (!round1 && regular.size() > tables.size()) {
    throw util::ResourceExhausted(std::to_string(regular.size()) + " pairings for " + std::to_string(tables.size()) + " tables in round " +
                                  std::to_string(round_number));
  }

  auto result = round1 ? AllocateRound1(regular, tables, now) : AllocateGreedy(regular, tables, history, now);

  for (const auto& bye : byes) {
    result.decisions.push_back(ByeDecision(bye, round1, now));
  }

  result.summary = Summarize(result.conflicts, round1);

  TABLES_LOG_DEBUG("Allocated round", {observability::IntField("round", round_number),
                                       observability::IntField("pairings", static_cast<int64_t>(regular.size())),
                                       observability::IntField("byes", static_cast<int64_t>(byes.size())),
                                       observability::IntField("conflicts", static_cast<int64_t>(result.conflicts.size()))});

  return result;
}

} // namespace tables::core
