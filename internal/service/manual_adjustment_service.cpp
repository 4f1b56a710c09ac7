#include "manual_adjustment_service.hpp"

#include "internal/audit/audit_codec.hpp"
#include "internal/core/cost_model.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/history/repository_history_provider.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/allocation_mapping.hpp"
#include "internal/service/db_errors.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tables::service {

using tables::observability::IntField;
using tables::observability::StringField;

namespace {

std::string TableLabel(const std::optional<int>& table_number) {
  if (!table_number || *table_number == model::kNoTable) return "no table";
  return "table " + std::to_string(*table_number);
}

db::model::AllocationRecord LoadAllocation(db::Repository& repo, db::Transaction& tx, int64_t allocation_id) {
  auto record = repo.GetAllocation(tx, allocation_id);
  if (!record) {
    throw util::NotFound("allocation " + std::to_string(allocation_id) + " not found");
  }
  return *record;
}

void RequireSeated(const db::model::AllocationRecord& record) {
  if (record.IsBye()) {
    throw util::InvalidArgument("allocation " + std::to_string(record.id) + " is a bye and cannot be seated");
  }
}

/*
  Builds the audit record for a manual seating change. Only table and
  terrain reuse are scored; bcp_mismatch is 1 when the new table differs
  from the suggested one.
*/
model::AuditRecord EditAudit(const db::model::AllocationRecord& record, const model::Table& table, history::HistoryProvider& history,
                             const std::string& action) {
  auto cost = core::CostModel::EvaluateReuse(ToPairing(record), table, history);

  model::AuditRecord audit;
  audit.timestamp                   = util::Now();
  audit.cost_breakdown              = cost.breakdown;
  audit.cost_breakdown.bcp_mismatch = (record.suggested_table && *record.suggested_table != table.number) ? 1 : 0;
  audit.total_cost                  = audit.cost_breakdown.Total();
  audit.is_round1                   = record.round_number == 1;
  audit.conflicts                   = std::move(cost.conflicts);

  audit.reasons.push_back(action + " from " + TableLabel(record.table_number) + " to " + TableLabel(table.number));
  for (auto& reason : cost.reasons) {
    audit.reasons.push_back(std::move(reason));
  }
  return audit;
}

AdjustedAllocation WriteSeating(db::Repository& repo, db::Transaction& tx, db::model::AllocationRecord record, const model::Table& table,
                                history::HistoryProvider& history, const std::string& action) {
  auto audit = EditAudit(record, table, history, action);

  record.table_number  = table.number;
  record.audit_json    = audit::AuditCodec::ToJson(audit);
  record.updated_at_ms = util::ToUnixMillis(audit.timestamp);
  ThrowIfDbError(repo.UpdateAllocation(tx, record), "update allocation " + std::to_string(record.id));

  db::model::AuditLogRecord entry;
  entry.allocation_id = record.id;
  entry.json          = record.audit_json;
  entry.created_at_ms = record.updated_at_ms;
  ThrowIfDbError(repo.AppendAuditEntry(tx, entry), "append audit entry");

  return {record.id, table.number, std::move(audit.conflicts)};
}

model::Table SeatTable(db::Repository& repo, db::Transaction& tx, const db::model::AllocationRecord& record) {
  const int number = record.table_number.value_or(model::kNoTable);
  if (number == model::kNoTable) {
    return model::Table{model::kNoTable, std::nullopt};
  }
  if (auto table = LoadTable(repo, tx, record.tournament_id, number)) {
    return *table;
  }
  return model::Table{number, std::nullopt};
}

} // namespace

ManualAdjustmentService::ManualAdjustmentService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

AdjustmentResult ManualAdjustmentService::Reassign(int64_t allocation_id, int new_table_number) {
  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();

  auto record = LoadAllocation(repo, *tx, allocation_id);
  RequireSeated(record);

  auto table_record = repo.GetTable(*tx, record.tournament_id, new_table_number);
  if (!table_record) {
    throw util::InvalidArgument("table " + std::to_string(new_table_number) + " does not belong to tournament " +
                                std::to_string(record.tournament_id));
  }
  if (table_record->hidden) {
    throw util::InvalidArgument("table " + std::to_string(new_table_number) + " is hidden in tournament " +
                                std::to_string(record.tournament_id));
  }
  auto table = ToTable(repo, *tx, *table_record);

  for (const auto& other : repo.ListAllocations(*tx, record.tournament_id, record.round_number)) {
    if (other.id != record.id && !other.IsBye() && other.table_number == new_table_number) {
      AdjustmentResult rejected;
      rejected.error         = db::ErrorCode::Conflict;
      rejected.error_message = "Table " + std::to_string(new_table_number) + " is already assigned in round " +
                               std::to_string(record.round_number) + " to allocation " + std::to_string(other.id);

      TABLES_LOG_WARN("Reassign rejected", {IntField("allocation_id", allocation_id), IntField("table", new_table_number),
                                            IntField("holder", other.id)});
      return rejected;
    }
  }

  history::RepositoryHistoryProvider history(repo, *tx, record.tournament_id, record.round_number);

  AdjustmentResult result;
  result.allocations.push_back(WriteSeating(repo, *tx, record, table, history, "Manually reassigned"));

  tx->Commit();
  result.success = true;

  TABLES_LOG_INFO("Allocation reassigned",
                  {IntField("allocation_id", allocation_id), StringField("from", TableLabel(record.table_number)),
                   IntField("to", new_table_number),
                   IntField("conflicts", static_cast<int64_t>(result.allocations.front().conflicts.size()))});
  return result;
}

AdjustmentResult ManualAdjustmentService::Swap(int64_t allocation_id_1, int64_t allocation_id_2) {
  if (allocation_id_1 == allocation_id_2) {
    throw util::InvalidArgument("cannot swap allocation " + std::to_string(allocation_id_1) + " with itself");
  }

  auto& repo = *ctx_.repository;
  auto  tx   = repo.Begin();

  auto first  = LoadAllocation(repo, *tx, allocation_id_1);
  auto second = LoadAllocation(repo, *tx, allocation_id_2);

  if (first.tournament_id != second.tournament_id || first.round_number != second.round_number) {
    throw util::InvalidArgument("allocations " + std::to_string(allocation_id_1) + " and " + std::to_string(allocation_id_2) +
                                " are not in the same round");
  }
  RequireSeated(first);
  RequireSeated(second);

  auto first_table  = SeatTable(repo, *tx, first);
  auto second_table = SeatTable(repo, *tx, second);

  history::RepositoryHistoryProvider history(repo, *tx, first.tournament_id, first.round_number);

  AdjustmentResult result;
  result.allocations.push_back(WriteSeating(repo, *tx, first, second_table, history, "Swapped"));
  result.allocations.push_back(WriteSeating(repo, *tx, second, first_table, history, "Swapped"));

  tx->Commit();
  result.success = true;

  TABLES_LOG_INFO("Allocations swapped", {IntField("allocation_1", allocation_id_1), IntField("table_1", second_table.number),
                                          IntField("allocation_2", allocation_id_2), IntField("table_2", first_table.number)});
  return result;
}

} // namespace tables::service
