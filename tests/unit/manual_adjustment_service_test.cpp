#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/audit/audit_codec.hpp"
#include "internal/core/collision_detector.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/model/table.hpp"
#include "internal/service/generation_service.hpp"
#include "internal/service/manual_adjustment_service.hpp"
#include "internal/util/errors.hpp"

namespace {

using tables::audit::AuditCodec;
using tables::db::ErrorCode;
using tables::db::memory::MemoryRepository;
using tables::model::AllocationDecision;
using tables::model::CompetitorEntry;
using tables::model::ConflictType;
using tables::model::Pairing;
using tables::service::GenerationService;
using tables::service::ManualAdjustmentService;
using tables::service::ServiceContext;

Pairing Match(const std::string& a, const std::string& b, int64_t total, std::optional<int> suggested) {
  Pairing p;
  p.competitor_a    = CompetitorEntry{a, "Name " + a, 0, total};
  p.competitor_b    = CompetitorEntry{b, "Name " + b, 0, total};
  p.suggested_table = suggested;
  return p;
}

Pairing Bye(const std::string& a) {
  Pairing p;
  p.competitor_a = CompetitorEntry{a, "Name " + a, 0, 0};
  return p;
}

/*
  Tables 1..4, table 3 is Volkus.
  Round 1: a-b on 1, c-d on 3, e has a bye.
  Round 2: a-d on 2 (suggested 2), c-b on 4, e has a bye.
*/
struct Harness {
  std::shared_ptr<MemoryRepository> repo = std::make_shared<MemoryRepository>();
  GenerationService                 generation{ServiceContext{repo}};
  ManualAdjustmentService           adjustments{ServiceContext{repo}};

  int64_t tournament_id = 0;
  int64_t round1_ab     = 0;
  int64_t round2_ad     = 0;
  int64_t round2_cb     = 0;
  int64_t round2_bye    = 0;

  Harness() {
    tournament_id = generation.CreateTournament("Spring GT", {std::nullopt, std::nullopt, std::string("Volkus"), std::nullopt});

    auto round1 = generation.Generate(tournament_id, 1, {Match("a", "b", 0, 1), Match("c", "d", 0, 3), Bye("e")});
    round1_ab   = round1.decisions[0].id;

    auto round2 = generation.Generate(tournament_id, 2, {Match("a", "d", 2, 2), Match("c", "b", 1, std::nullopt), Bye("e")});
    assert(round2.decisions[0].table_number == 2);
    assert(round2.decisions[1].table_number == 4);
    round2_ad  = round2.decisions[0].id;
    round2_cb  = round2.decisions[1].id;
    round2_bye = round2.decisions[2].id;
  }

  tables::db::model::AllocationRecord Row(int64_t id) {
    auto tx = repo->Begin();
    return *repo->GetAllocation(*tx, id);
  }

  std::size_t AuditEntries(int64_t id) {
    auto tx = repo->Begin();
    return repo->ListAuditEntries(*tx, id).size();
  }
};

template <typename Ex, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Ex&) {
    return true;
  }
  return false;
}

void TestReassignRecomputesConflicts() {
  Harness h;
  auto    original_json = h.Row(h.round2_ad).audit_json;

  auto result = h.adjustments.Reassign(h.round2_ad, 1);

  assert(result.success);
  assert(result.error == ErrorCode::OK);
  assert(result.allocations.size() == 1);
  assert(result.allocations[0].id == h.round2_ad);
  assert(result.allocations[0].table_number == 1);
  assert(result.allocations[0].conflicts.size() == 1);
  assert(result.allocations[0].conflicts[0].type == ConflictType::kTableReuse);
  assert(result.allocations[0].conflicts[0].competitor_id == "a");

  auto row = h.Row(h.round2_ad);
  assert(row.table_number == 1);
  assert(row.version == 2);
  assert(row.competitor_a_id == "a");
  assert(row.suggested_table == 2);

  auto audit = AuditCodec::FromJson(row.audit_json);
  assert(audit.cost_breakdown.table_reuse == 100000);
  assert(audit.cost_breakdown.bcp_mismatch == 1);
  assert(!audit.cost_breakdown.table_number.has_value());
  assert(audit.total_cost == 100001);
  assert(audit.reasons.at(0) == "Manually reassigned from table 2 to table 1");

  // previous record kept, new one appended
  auto tx      = h.repo->Begin();
  auto entries = h.repo->ListAuditEntries(*tx, h.round2_ad);
  assert(entries.size() == 2);
  assert(entries[0].json == original_json);
  assert(entries[1].json == row.audit_json);
}

void TestReassignToTerrainTableReportsBothTiers() {
  Harness h;

  auto result = h.adjustments.Reassign(h.round2_ad, 3);

  assert(result.success);
  const auto& conflicts = result.allocations[0].conflicts;
  assert(conflicts.size() == 2);
  assert(conflicts[0].type == ConflictType::kTableReuse);
  assert(conflicts[0].competitor_id == "d");
  assert(conflicts[1].type == ConflictType::kTerrainReuse);
  assert(conflicts[1].terrain == std::string("Volkus"));
}

void TestReassignToOccupiedTableRejected() {
  Harness h;

  auto result = h.adjustments.Reassign(h.round2_ad, 4);

  assert(!result.success);
  assert(result.error == ErrorCode::Conflict);
  assert(result.error_message.find("Table 4") != std::string::npos);
  assert(result.allocations.empty());
  assert(h.Row(h.round2_ad).table_number == 2);
  assert(h.Row(h.round2_ad).version == 1);
  assert(h.AuditEntries(h.round2_ad) == 1);
}

void TestReassignToSameTableAllowed() {
  Harness h;

  auto result = h.adjustments.Reassign(h.round2_ad, 2);
  assert(result.success);
  assert(h.Row(h.round2_ad).table_number == 2);
  assert(AuditCodec::FromJson(h.Row(h.round2_ad).audit_json).cost_breakdown.bcp_mismatch == 0);
}

void TestReassignValidation() {
  Harness h;

  assert(Throws<tables::util::InvalidArgument>([&] { (void)h.adjustments.Reassign(h.round2_ad, 9); }));
  assert(Throws<tables::util::InvalidArgument>([&] { (void)h.adjustments.Reassign(h.round2_bye, 1); }));
  assert(Throws<tables::util::NotFound>([&] { (void)h.adjustments.Reassign(999, 1); }));

  assert(h.Row(h.round2_ad).version == 1);
}

void TestSwapExchangesTables() {
  Harness h;

  auto result = h.adjustments.Swap(h.round2_ad, h.round2_cb);

  assert(result.success);
  assert(result.allocations.size() == 2);
  assert(result.allocations[0].id == h.round2_ad);
  assert(result.allocations[0].table_number == 4);
  assert(result.allocations[1].id == h.round2_cb);
  assert(result.allocations[1].table_number == 2);
  assert(result.allocations[0].conflicts.empty());
  assert(result.allocations[1].conflicts.empty());

  auto round = h.generation.LoadRound(h.tournament_id, 2);
  std::vector<int> seats;
  for (const auto& d : round.decisions) {
    if (d.table_number) seats.push_back(*d.table_number);
  }
  std::sort(seats.begin(), seats.end());
  assert((seats == std::vector<int>{2, 4}));
  assert(!tables::core::TableCollisionDetector::HasCollisions(round.decisions));

  assert(h.AuditEntries(h.round2_ad) == 2);
  assert(h.AuditEntries(h.round2_cb) == 2);
  assert(AuditCodec::FromJson(h.Row(h.round2_cb).audit_json).reasons.at(0) == "Swapped from table 4 to table 2");
}

void TestSwapWithUnseatedPairingNamesNoTable() {
  std::shared_ptr<MemoryRepository> repo = std::make_shared<MemoryRepository>();
  GenerationService                 generation{ServiceContext{repo}};
  ManualAdjustmentService           adjustments{ServiceContext{repo}};

  auto id     = generation.CreateTournament("Small GT", {std::nullopt});
  auto round1 = generation.Generate(id, 1, {Match("a", "b", 0, 1), Match("c", "d", 0, 1)});
  assert(round1.decisions[0].table_number == 1);
  assert(round1.decisions[1].table_number == tables::model::kNoTable);

  auto result = adjustments.Swap(round1.decisions[0].id, round1.decisions[1].id);
  assert(result.success);
  assert(result.allocations[0].table_number == tables::model::kNoTable);
  assert(result.allocations[1].table_number == 1);

  auto tx     = repo->Begin();
  auto seated = AuditCodec::FromJson(repo->GetAllocation(*tx, round1.decisions[0].id)->audit_json);
  auto moved  = AuditCodec::FromJson(repo->GetAllocation(*tx, round1.decisions[1].id)->audit_json);
  assert(seated.reasons.at(0) == "Swapped from table 1 to no table");
  assert(moved.reasons.at(0) == "Swapped from no table to table 1");
}

void TestSwapValidation() {
  Harness h;

  assert(Throws<tables::util::InvalidArgument>([&] { (void)h.adjustments.Swap(h.round2_ad, h.round2_ad); }));
  assert(Throws<tables::util::InvalidArgument>([&] { (void)h.adjustments.Swap(h.round1_ab, h.round2_cb); }));
  assert(Throws<tables::util::InvalidArgument>([&] { (void)h.adjustments.Swap(h.round2_ad, h.round2_bye); }));
  assert(Throws<tables::util::NotFound>([&] { (void)h.adjustments.Swap(h.round2_ad, 999); }));

  assert(h.Row(h.round2_ad).table_number == 2);
  assert(h.Row(h.round2_cb).table_number == 4);
  assert(h.AuditEntries(h.round2_ad) == 1);
}

void TestEditsLeaveOtherRoundsUntouched() {
  Harness h;
  auto    before = h.Row(h.round1_ab);

  (void)h.adjustments.Swap(h.round2_ad, h.round2_cb);
  (void)h.adjustments.Reassign(h.round2_ad, 1);

  auto after = h.Row(h.round1_ab);
  assert(after.table_number == before.table_number);
  assert(after.version == before.version);
  assert(after.audit_json == before.audit_json);
}

} // namespace

int main() {
  TestReassignRecomputesConflicts();
  TestReassignToTerrainTableReportsBothTiers();
  TestReassignToOccupiedTableRejected();
  TestReassignToSameTableAllowed();
  TestReassignValidation();
  TestSwapExchangesTables();
  TestSwapWithUnseatedPairingNamesNoTable();
  TestSwapValidation();
  TestEditsLeaveOtherRoundsUntouched();

  std::cout << "table_allocator_unit_manual_adjustment_service: pass\n";
  return 0;
}
