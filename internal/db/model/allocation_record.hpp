#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tables::db::model {

/*
  Persistent allocation row (one per pairing of a generated round).

  IMPORTANT:
  - table_number is NULL for byes and 0 for an unplaced round-1 pairing.
  - audit_json is the current audit record; older ones live in the audit
    log.
  - version is used for optimistic concurrency on manual edits.
*/

struct AllocationRecord {
  int64_t id            = 0;
  int64_t tournament_id = 0;
  int     round_number  = 0;

  std::optional<int> table_number;

  std::string competitor_a_id;
  std::string competitor_a_name;
  int64_t     competitor_a_score = 0;

  // empty for a bye
  std::optional<std::string> competitor_b_id;
  std::string                competitor_b_name;
  int64_t                    competitor_b_score = 0;

  std::optional<int> suggested_table;

  std::string audit_json;

  uint64_t version       = 0;
  uint64_t updated_at_ms = 0;

  bool IsBye() const {
    return !competitor_b_id.has_value();
  }
};

} // namespace tables::db::model
