#include "internal/core/cost_model.hpp"

namespace tables::core {
namespace {

std::string Describe(const model::CompetitorEntry& competitor) {
  return competitor.name + " (" + competitor.id + ")";
}

void CheckCompetitor(const model::CompetitorEntry& competitor, const model::Table& table, history::HistoryProvider& history,
                     CostResult& result) {
  if (history.UsedTables(competitor.id).contains(table.number)) {
    result.breakdown.table_reuse += model::kTableReuseCost;

    auto message = Describe(competitor) + " previously played on table " + std::to_string(table.number);
    result.reasons.push_back(message);
    result.conflicts.push_back({model::ConflictType::kTableReuse, std::move(message), competitor.id, table.number, std::nullopt});
  }
}

void CheckTerrain(const model::CompetitorEntry& competitor, const model::Table& table, history::HistoryProvider& history,
                  CostResult& result) {
  if (!table.terrain) return;

  if (history.UsedTerrains(competitor.id).contains(table.terrain->id)) {
    result.breakdown.terrain_reuse += model::kTerrainReuseCost;

    auto message = Describe(competitor) + " previously experienced " + table.terrain->name;
    result.reasons.push_back(message);
    result.conflicts.push_back(
        {model::ConflictType::kTerrainReuse, std::move(message), competitor.id, table.number, table.terrain->name});
  }
}

} // namespace

CostResult CostModel::EvaluateReuse(const model::Pairing& pairing, const model::Table& table, history::HistoryProvider& history) {
  CostResult result;

  CheckCompetitor(pairing.competitor_a, table, history, result);
  if (pairing.competitor_b) {
    CheckCompetitor(*pairing.competitor_b, table, history, result);
  }

  CheckTerrain(pairing.competitor_a, table, history, result);
  if (pairing.competitor_b) {
    CheckTerrain(*pairing.competitor_b, table, history, result);
  }

  return result;
}

CostResult CostModel::Evaluate(const model::Pairing& pairing, const model::Table& table, history::HistoryProvider& history) {
  auto result = EvaluateReuse(pairing, table, history);

  const int64_t number_cost    = static_cast<int64_t>(table.number) * model::kTableNumberCost;
  result.breakdown.table_number = number_cost;
  if (number_cost != 0) {
    result.reasons.push_back("Table " + std::to_string(table.number) + " number preference cost " + std::to_string(number_cost));
  }

  return result;
}

} // namespace tables::core
