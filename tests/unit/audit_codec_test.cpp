#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/audit/audit_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using tables::audit::AuditCodec;
using tables::model::AuditRecord;
using tables::model::Conflict;
using tables::model::ConflictType;

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

AuditRecord GenerationRecord() {
  AuditRecord r;
  r.timestamp                    = tables::util::FromUnixMillis(1760000000123);
  r.cost_breakdown.table_reuse   = 100000;
  r.cost_breakdown.terrain_reuse = 10000;
  r.cost_breakdown.table_number  = 2;
  r.total_cost                   = r.cost_breakdown.Total();
  r.reasons                      = {"Alice (p1) previously played on table 2", "Bob (p2) previously experienced Volkus"};
  r.alternatives_considered      = {{1, 1}, {4, 4}};
  r.conflicts.push_back(Conflict{ConflictType::kTableReuse, r.reasons[0], "p1", 2, std::nullopt});
  r.conflicts.push_back(Conflict{ConflictType::kTerrainReuse, r.reasons[1], "p2", 2, std::string("Volkus")});
  return r;
}

void TestJsonUsesCamelCaseKeys() {
  auto json = AuditCodec::ToJson(GenerationRecord());

  assert(Contains(json, "\"totalCost\""));
  assert(Contains(json, "\"tableReuse\""));
  assert(Contains(json, "\"terrainReuse\""));
  assert(Contains(json, "\"tableNumber\""));
  assert(!Contains(json, "\"bcpMismatch\""));
  assert(Contains(json, "\"alternativesConsidered\""));
  assert(Contains(json, "\"isRound1\""));
  assert(Contains(json, "TERRAIN_REUSE"));
}

void TestDecodeRestoresRecord() {
  auto original = GenerationRecord();
  auto decoded  = AuditCodec::FromJson(AuditCodec::ToJson(original));

  assert(decoded.timestamp == original.timestamp);
  assert(decoded.total_cost == 110002);
  assert(decoded.cost_breakdown.table_number == 2);
  assert(!decoded.cost_breakdown.bcp_mismatch.has_value());
  assert(decoded.reasons == original.reasons);
  assert(decoded.alternatives_considered == original.alternatives_considered);
  assert(decoded.conflicts.size() == 2);
  assert(decoded.conflicts[0].type == ConflictType::kTableReuse);
  assert(!decoded.conflicts[0].terrain.has_value());
  assert(decoded.conflicts[1].terrain == std::string("Volkus"));
  assert(decoded.conflicts[1].table_number == 2);
}

void TestEditBreakdownKeepsMismatchFlag() {
  AuditRecord r;
  r.cost_breakdown.bcp_mismatch = 1;
  r.total_cost                  = 1;

  auto json = AuditCodec::ToJson(r);
  assert(Contains(json, "\"bcpMismatch\""));
  assert(!Contains(json, "\"tableNumber\""));

  auto decoded = AuditCodec::FromJson(json);
  assert(decoded.cost_breakdown.bcp_mismatch == 1);
  assert(!decoded.cost_breakdown.table_number.has_value());
}

void TestMalformedJsonRejected() {
  bool threw = false;
  try {
    (void)AuditCodec::FromJson("{\"totalCost\": \"x\", \"unknown\": 1}");
  } catch (const tables::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestJsonUsesCamelCaseKeys();
  TestDecodeRestoresRecord();
  TestEditBreakdownKeepsMismatchFlag();
  TestMalformedJsonRejected();

  std::cout << "table_allocator_unit_audit_codec: pass\n";
  return 0;
}
