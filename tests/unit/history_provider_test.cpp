#include <cassert>
#include <iostream>
#include <optional>
#include <set>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/history/repository_history_provider.hpp"
#include "internal/model/table.hpp"

namespace {

using tables::db::memory::MemoryRepository;
using tables::db::model::AllocationRecord;
using tables::db::model::TableRecord;
using tables::db::model::TerrainTypeRecord;
using tables::db::model::TournamentRecord;
using tables::history::RepositoryHistoryProvider;

struct Fixture {
  MemoryRepository repo;
  int64_t          tournament_id = 0;
  int64_t          other_id      = 0;
  int64_t          volkus_id     = 0;
};

void InsertAllocation(MemoryRepository& repo, tables::db::Transaction& tx, int64_t tournament_id, int round, std::optional<int> table,
                      const std::string& a, std::optional<std::string> b) {
  AllocationRecord r;
  r.tournament_id   = tournament_id;
  r.round_number    = round;
  r.table_number    = table;
  r.competitor_a_id = a;
  r.competitor_b_id = std::move(b);
  r.audit_json      = "{}";
  assert(repo.InsertAllocation(tx, r));
}

void Seed(Fixture& f) {
  auto tx = f.repo.Begin();

  TournamentRecord t{0, "Spring GT", 0};
  assert(f.repo.InsertTournament(*tx, t));
  f.tournament_id = t.id;

  TournamentRecord other{0, "Autumn GT", 0};
  assert(f.repo.InsertTournament(*tx, other));
  f.other_id = other.id;

  TerrainTypeRecord volkus{0, "Volkus", ""};
  assert(f.repo.InsertTerrainType(*tx, volkus));
  f.volkus_id = volkus.id;

  for (int n = 1; n <= 4; ++n) {
    TableRecord table{f.tournament_id, n, n == 3 ? std::optional<int64_t>(volkus.id) : std::nullopt};
    assert(f.repo.InsertTable(*tx, table));
  }
  assert(f.repo.InsertTable(*tx, TableRecord{f.other_id, 2, std::nullopt}));

  InsertAllocation(f.repo, *tx, f.tournament_id, 1, 1, "p1", "p2");
  InsertAllocation(f.repo, *tx, f.tournament_id, 1, std::nullopt, "p3", std::nullopt);
  InsertAllocation(f.repo, *tx, f.tournament_id, 2, 3, "p3", "p1");
  InsertAllocation(f.repo, *tx, f.tournament_id, 2, tables::model::kNoTable, "p4", "p5");
  InsertAllocation(f.repo, *tx, f.tournament_id, 3, 4, "p1", "p4");
  InsertAllocation(f.repo, *tx, f.other_id, 1, 2, "p1", "p9");

  tx->Commit();
}

void TestRoundOneHasNoHistory() {
  Fixture f;
  Seed(f);

  auto                      tx = f.repo.Begin();
  RepositoryHistoryProvider history(f.repo, *tx, f.tournament_id, 1);
  assert(history.UsedTables("p1").empty());
  assert(history.UsedTerrains("p1").empty());
}

void TestOnlyEarlierRoundsOfSameTournament() {
  Fixture f;
  Seed(f);

  auto                      tx = f.repo.Begin();
  RepositoryHistoryProvider history(f.repo, *tx, f.tournament_id, 3);

  // round 3 and the other tournament are excluded
  assert((history.UsedTables("p1") == std::set<int>{1, 3}));
  assert((history.UsedTerrains("p1") == std::set<int64_t>{f.volkus_id}));

  // played as competitor_b in round 1
  assert((history.UsedTables("p2") == std::set<int>{1}));
  assert(history.UsedTerrains("p2").empty());
}

void TestByesAndPlaceholdersContributeNothing() {
  Fixture f;
  Seed(f);

  auto                      tx = f.repo.Begin();
  RepositoryHistoryProvider history(f.repo, *tx, f.tournament_id, 3);

  // bye in round 1, table 3 in round 2
  assert((history.UsedTables("p3") == std::set<int>{3}));
  // placeholder table in round 2
  assert(history.UsedTables("p5").empty());
  assert(history.UsedTables("unknown").empty());
}

void TestResultsCachedPerInstance() {
  Fixture f;
  Seed(f);

  auto                      tx = f.repo.Begin();
  RepositoryHistoryProvider history(f.repo, *tx, f.tournament_id, 3);
  assert((history.UsedTables("p2") == std::set<int>{1}));

  InsertAllocation(f.repo, *tx, f.tournament_id, 2, 2, "p2", "p6");
  assert((history.UsedTables("p2") == std::set<int>{1}));

  RepositoryHistoryProvider fresh(f.repo, *tx, f.tournament_id, 3);
  assert((fresh.UsedTables("p2") == std::set<int>{1, 2}));
}

} // namespace

int main() {
  TestRoundOneHasNoHistory();
  TestOnlyEarlierRoundsOfSameTournament();
  TestByesAndPlaceholdersContributeNothing();
  TestResultsCachedPerInstance();

  std::cout << "table_allocator_unit_history_provider: pass\n";
  return 0;
}
