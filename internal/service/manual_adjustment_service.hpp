#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/model/conflict.hpp"
#include "service_context.hpp"

namespace tables::service {

struct AdjustedAllocation {
  int64_t                      id           = 0;
  int                          table_number = 0;
  std::vector<model::Conflict> conflicts;
};

/*
  Outcome of a manual edit.

  A table already held by another allocation of the round is a reported
  rejection (success false, error Conflict) rather than an exception;
  nothing is written in that case.
*/
struct AdjustmentResult {
  bool                            success = false;
  db::ErrorCode                   error   = db::ErrorCode::OK;
  std::string                     error_message;
  std::vector<AdjustedAllocation> allocations;
};

/*
  Operator edits to a generated round.

  Each call is one transaction: read, validate, recompute table and terrain
  reuse for the new seating, write the new table with a fresh audit record,
  append that record to the audit log, commit. Earlier audit records are
  never rewritten.

  Throws util::NotFound for unknown allocations, util::InvalidArgument for
  byes, foreign tables, self swaps and cross-round swaps, and
  util::TableConflict when a concurrent writer got there first.
*/
class ManualAdjustmentService {
public:
  explicit ManualAdjustmentService(ServiceContext ctx);

  AdjustmentResult Reassign(int64_t allocation_id, int new_table_number);

  AdjustmentResult Swap(int64_t allocation_id_1, int64_t allocation_id_2);

private:
  ServiceContext ctx_;
};

}
