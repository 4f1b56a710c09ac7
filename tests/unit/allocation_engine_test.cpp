#include <algorithm>
#include <cassert>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "internal/core/allocation_engine.hpp"
#include "internal/history/static_history_provider.hpp"
#include "internal/util/errors.hpp"

namespace {

using tables::core::AllocationEngine;
using tables::history::StaticHistoryProvider;
using tables::model::AllocationDecision;
using tables::model::CompetitorEntry;
using tables::model::ConflictType;
using tables::model::kNoTable;
using tables::model::Pairing;
using tables::model::RoundAllocation;
using tables::model::Table;
using tables::model::TerrainType;

Pairing Match(const std::string& a, const std::string& b, int64_t total_a, int64_t total_b, std::optional<int> suggested = std::nullopt) {
  Pairing p;
  p.competitor_a    = CompetitorEntry{a, "Name " + a, 0, total_a};
  p.competitor_b    = CompetitorEntry{b, "Name " + b, 0, total_b};
  p.suggested_table = suggested;
  return p;
}

Pairing Bye(const std::string& a) {
  Pairing p;
  p.competitor_a = CompetitorEntry{a, "Name " + a, 0, 0};
  return p;
}

std::vector<Table> PlainTables(int count) {
  std::vector<Table> out;
  for (int i = 1; i <= count; ++i) out.push_back(Table{i, std::nullopt});
  return out;
}

std::map<std::string, int> SeatingByCompetitor(const RoundAllocation& result) {
  std::map<std::string, int> out;
  for (const auto& d : result.decisions) {
    if (d.table_number) out[d.competitor_a.id] = *d.table_number;
  }
  return out;
}

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

// ------------------------------------------------------------------
// Round 1
// ------------------------------------------------------------------

void TestRound1KeepsValidPermutation() {
  StaticHistoryProvider history;
  std::vector<Pairing>  pairings = {Match("a", "b", 0, 0, 3), Match("c", "d", 0, 0, 1), Match("e", "f", 0, 0, 2)};

  auto result = AllocationEngine::Generate(pairings, PlainTables(3), 1, history);

  assert(result.decisions.size() == 3);
  assert(result.decisions[0].table_number == 3);
  assert(result.decisions[1].table_number == 1);
  assert(result.decisions[2].table_number == 2);
  for (const auto& d : result.decisions) {
    assert(d.audit.total_cost == 0);
    assert(d.audit.is_round1);
    assert(d.audit.conflicts.empty());
    assert(Contains(d.audit.reasons.at(0), "using suggested table"));
  }
  assert(result.conflicts.empty());
  assert(result.summary == "Round 1 allocations use the suggested table assignments.");
}

void TestRound1RepairsDuplicateAndMissingSuggestions() {
  StaticHistoryProvider history;
  std::vector<Pairing>  pairings = {Match("a", "b", 0, 0, 2), Match("c", "d", 0, 0, 2), Match("e", "f", 0, 0, std::nullopt)};

  auto result = AllocationEngine::Generate(pairings, PlainTables(3), 1, history);

  assert(result.decisions[0].table_number == 2);
  assert(result.decisions[1].table_number == 1);
  assert(result.decisions[2].table_number == 3);
  assert(Contains(result.decisions[1].audit.reasons.at(0), "already assigned"));
  assert(Contains(result.decisions[2].audit.reasons.at(0), "missing"));
  assert(result.conflicts.empty());
}

void TestRound1UnknownTableFallsBack() {
  StaticHistoryProvider history;
  std::vector<Pairing>  pairings = {Match("a", "b", 0, 0, 9), Match("c", "d", 0, 0, 1)};

  auto result = AllocationEngine::Generate(pairings, PlainTables(2), 1, history);

  assert(result.decisions[0].table_number == 1);
  assert(Contains(result.decisions[0].audit.reasons.at(0), "not in tournament tables"));
  // table 1 was taken by the repair, so the second suggestion is repaired too
  assert(result.decisions[1].table_number == 2);
}

void TestRound1ShortageUsesPlaceholder() {
  StaticHistoryProvider history;
  std::vector<Pairing>  pairings = {Match("a", "b", 0, 0, 1), Match("c", "d", 0, 0, 2), Match("e", "f", 0, 0, 3)};

  auto result = AllocationEngine::Generate(pairings, PlainTables(2), 1, history);

  assert(result.decisions.size() == 3);
  assert(result.decisions[2].table_number == kNoTable);
  assert(result.decisions[2].audit.conflicts.size() == 1);
  assert(result.conflicts.size() == 1);
  assert(result.conflicts[0].type == ConflictType::kNoTableAvailable);
  assert(result.conflicts[0].competitor_id == "e");
  assert(Contains(result.conflicts[0].message, "Name e (e) vs Name f (f)"));
  assert(result.summary == "Round 1 allocations generated with 1 conflict(s).");
}

// ------------------------------------------------------------------
// Round N
// ------------------------------------------------------------------

void TestVolkusExample() {
  std::vector<Table> tables = {{1, std::nullopt}, {2, std::nullopt}, {3, TerrainType{7, "Volkus"}}, {4, std::nullopt}};

  StaticHistoryProvider history;
  history.AddTable("a", 1);
  history.AddTerrain("a", 7);

  auto p1 = Match("a", "b", 4, 2);
  auto p2 = Match("c", "d", 1, 1);

  // lower-ranked pairing listed first
  auto result = AllocationEngine::Generate({p2, p1}, tables, 2, history);

  assert(result.decisions.size() == 2);
  assert(result.decisions[0].competitor_a.id == "a");
  assert(result.decisions[0].table_number == 2);
  assert(result.decisions[0].audit.total_cost == 2);
  assert(result.decisions[0].audit.alternatives_considered.at(1) == 100001);
  assert(result.decisions[0].audit.alternatives_considered.at(3) == 10003);
  assert(result.decisions[0].audit.alternatives_considered.at(4) == 4);
  assert(!result.decisions[0].audit.alternatives_considered.contains(2));

  assert(result.decisions[1].competitor_a.id == "c");
  assert(result.decisions[1].table_number == 1);
  assert(result.summary == "All allocations optimal - no constraint violations.");
}

void TestOrderIndependence() {
  StaticHistoryProvider history;
  history.AddTable("a", 1);
  history.AddTable("c", 2);
  history.AddTable("e", 1);
  history.AddTerrain("g", 5);

  std::vector<Table> tables = {{4, std::nullopt}, {1, TerrainType{5, "Octarius"}}, {3, std::nullopt}, {2, std::nullopt}};

  std::vector<Pairing> pairings = {Match("a", "b", 3, 3), Match("c", "d", 3, 3), Match("e", "f", 6, 0), Match("g", "h", 1, 0)};

  auto baseline = AllocationEngine::Generate(pairings, tables, 3, history);

  std::sort(pairings.begin(), pairings.end(), [](const Pairing& x, const Pairing& y) { return x.competitor_a.id > y.competitor_a.id; });
  auto reversed = AllocationEngine::Generate(pairings, tables, 3, history);

  std::rotate(pairings.begin(), pairings.begin() + 1, pairings.end());
  auto rotated = AllocationEngine::Generate(pairings, tables, 3, history);

  assert(SeatingByCompetitor(baseline) == SeatingByCompetitor(reversed));
  assert(SeatingByCompetitor(baseline) == SeatingByCompetitor(rotated));
  for (std::size_t i = 0; i < baseline.decisions.size(); ++i) {
    assert(baseline.decisions[i].competitor_a.id == reversed.decisions[i].competitor_a.id);
    assert(baseline.decisions[i].competitor_a.id == rotated.decisions[i].competitor_a.id);
  }
}

void TestSortByStandingTieBreaks() {
  std::vector<Pairing> pairings = {Match("m", "z", 2, 2), Match("x", "b", 3, 1), Match("c", "y", 5, 0)};

  auto sorted = AllocationEngine::SortByStanding(pairings);

  // 5 first; 4 and 4 tie and resolve by smaller id: "b" < "m"
  assert(sorted[0].competitor_a.id == "c");
  assert(sorted[1].competitor_a.id == "x");
  assert(sorted[2].competitor_a.id == "m");
}

void TestNoTableSharedAndAvoidableReuseNeverChosen() {
  StaticHistoryProvider history;
  for (int i = 0; i < 6; ++i) {
    history.AddTable("a" + std::to_string(i), i + 1);
    history.AddTable("b" + std::to_string(i), (i + 2) % 6 + 1);
  }

  std::vector<Pairing> pairings;
  for (int i = 0; i < 6; ++i) {
    pairings.push_back(Match("a" + std::to_string(i), "b" + std::to_string(i), 6 - i, 0));
  }

  auto result = AllocationEngine::Generate(pairings, PlainTables(6), 2, history);

  std::set<int> seen;
  for (const auto& d : result.decisions) {
    assert(d.table_number.has_value());
    assert(seen.insert(*d.table_number).second);

    if (d.audit.cost_breakdown.table_reuse > 0) {
      for (const auto& [table, cost] : d.audit.alternatives_considered) {
        assert(cost >= 100000);
      }
    }
  }
}

void TestTieResolvesToSuggestedThenLowest() {
  std::vector<Table> tables = {{10001, std::nullopt}, {1, TerrainType{3, "Tomb World"}}};

  StaticHistoryProvider history;
  history.AddTerrain("a", 3);

  // table 1 costs 10000 + 1, table 10001 costs 10001
  auto plain = AllocationEngine::Generate({Match("a", "b", 0, 0)}, tables, 2, history);
  assert(plain.decisions[0].table_number == 1);

  auto suggested = AllocationEngine::Generate({Match("a", "b", 0, 0, 10001)}, tables, 2, history);
  assert(suggested.decisions[0].table_number == 10001);
  assert(suggested.decisions[0].audit.alternatives_considered.at(1) == 10001);
}

void TestUnavoidableReuseIsReported() {
  StaticHistoryProvider history;
  history.AddTable("a", 1);
  history.AddTerrain("b", 9);

  std::vector<Table> tables = {{1, TerrainType{9, "Bheta-Decima"}}};

  auto result = AllocationEngine::Generate({Match("a", "b", 0, 0)}, tables, 2, history);

  const auto& d = result.decisions[0];
  assert(d.table_number == 1);
  assert(d.terrain_name == std::string("Bheta-Decima"));
  assert(d.audit.total_cost == 110001);
  assert(d.audit.cost_breakdown.table_number == 1);
  assert(d.audit.conflicts.size() == 2);
  assert(result.conflicts.size() == 2);
  assert(result.summary == "Best effort allocation with 1 table reuse conflict(s), 1 terrain reuse conflict(s).");
}

void TestMorePairingsThanTablesThrows() {
  StaticHistoryProvider history;
  bool                  threw = false;
  try {
    (void)AllocationEngine::Generate({Match("a", "b", 0, 0), Match("c", "d", 0, 0)}, PlainTables(1), 2, history);
  } catch (const tables::util::ResourceExhausted&) {
    threw = true;
  }
  assert(threw);
}

void TestByesAppendedWithoutTable() {
  StaticHistoryProvider history;
  std::vector<Pairing>  pairings = {Bye("x"), Match("a", "b", 0, 0), Bye("y")};

  for (int round : {1, 2}) {
    auto result = AllocationEngine::Generate(pairings, PlainTables(1), round, history);
    assert(result.decisions.size() == 3);
    assert(!result.decisions[0].IsBye());

    const auto& first_bye  = result.decisions[1];
    const auto& second_bye = result.decisions[2];
    assert(first_bye.competitor_a.id == "x");
    assert(second_bye.competitor_a.id == "y");
    for (const auto* bye : {&first_bye, &second_bye}) {
      assert(bye->IsBye());
      assert(!bye->table_number.has_value());
      assert(bye->audit.is_bye);
      assert(bye->audit.total_cost == 0);
      assert(bye->audit.is_round1 == (round == 1));
      assert(bye->audit.reasons.at(0) == "Bye - no opponent this round");
    }
  }
}

void TestInvalidInputRejected() {
  StaticHistoryProvider history;

  bool bad_round = false;
  try {
    (void)AllocationEngine::Generate({}, PlainTables(1), 0, history);
  } catch (const tables::util::InvalidArgument&) {
    bad_round = true;
  }
  assert(bad_round);

  bool duplicate = false;
  try {
    (void)AllocationEngine::Generate({}, {{1, std::nullopt}, {1, std::nullopt}}, 2, history);
  } catch (const tables::util::InvalidArgument&) {
    duplicate = true;
  }
  assert(duplicate);

  // 0 would be indistinguishable from the round-1 placeholder
  for (int number : {0, -3}) {
    for (int round : {1, 2}) {
      bool rejected = false;
      try {
        (void)AllocationEngine::Generate({Match("a", "b", 0, 0)}, {{number, std::nullopt}, {2, std::nullopt}}, round, history);
      } catch (const tables::util::InvalidArgument&) {
        rejected = true;
      }
      assert(rejected);
    }
  }
}

} // namespace

int main() {
  TestRound1KeepsValidPermutation();
  TestRound1RepairsDuplicateAndMissingSuggestions();
  TestRound1UnknownTableFallsBack();
  TestRound1ShortageUsesPlaceholder();
  TestVolkusExample();
  TestOrderIndependence();
  TestSortByStandingTieBreaks();
  TestNoTableSharedAndAvoidableReuseNeverChosen();
  TestTieResolvesToSuggestedThenLowest();
  TestUnavoidableReuseIsReported();
  TestMorePairingsThanTablesThrows();
  TestByesAppendedWithoutTable();
  TestInvalidInputRejected();

  std::cout << "table_allocator_unit_allocation_engine: pass\n";
  return 0;
}
