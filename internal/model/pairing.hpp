#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>

namespace tables::model {

struct CompetitorEntry {
  std::string id;
  std::string name;

  // Score earned in the round being paired.
  int64_t round_score = 0;

  // Tournament-to-date score, 0 when unknown.
  int64_t total_score = 0;
};

/*
  One matchup for the round being generated.

  A bye has no competitor_b and never receives a table. Pairings are built
  fresh for every run and are never persisted as such.
*/
struct Pairing {
  CompetitorEntry                competitor_a;
  std::optional<CompetitorEntry> competitor_b;

  // Table proposed by the external pairing source, if any.
  std::optional<int> suggested_table;

  bool IsBye() const {
    return !competitor_b.has_value();
  }

  int64_t CombinedTotalScore() const {
    return competitor_a.total_score + (competitor_b ? competitor_b->total_score : 0);
  }

  const std::string& MinCompetitorId() const {
    if (!competitor_b) return competitor_a.id;
    return std::min(competitor_a.id, competitor_b->id);
  }
};

} // namespace tables::model
