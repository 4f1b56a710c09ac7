#include "internal/audit/audit_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tables::audit {
namespace {

v1::ConflictType ToProto(model::ConflictType type) {
  switch (type) {
    case model::ConflictType::kTableReuse:
      return v1::TABLE_REUSE;
    case model::ConflictType::kTerrainReuse:
      return v1::TERRAIN_REUSE;
    case model::ConflictType::kNoTableAvailable:
      return v1::NO_TABLE_AVAILABLE;
  }
  return v1::CONFLICT_TYPE_UNSPECIFIED;
}

model::ConflictType FromProto(v1::ConflictType type) {
  switch (type) {
    case v1::TABLE_REUSE:
      return model::ConflictType::kTableReuse;
    case v1::TERRAIN_REUSE:
      return model::ConflictType::kTerrainReuse;
    case v1::NO_TABLE_AVAILABLE:
      return model::ConflictType::kNoTableAvailable;
    default:
      throw util::InvalidState("unknown conflict type " + std::to_string(static_cast<int>(type)));
  }
}

} // namespace

v1::AuditRecord AuditCodec::ToProto(const model::AuditRecord& record) {
  v1::AuditRecord out;
  *out.mutable_timestamp() = util::ToProto(record.timestamp);
  out.set_total_cost(record.total_cost);

  auto* breakdown = out.mutable_cost_breakdown();
  breakdown->set_table_reuse(record.cost_breakdown.table_reuse);
  breakdown->set_terrain_reuse(record.cost_breakdown.terrain_reuse);
  if (record.cost_breakdown.table_number) breakdown->set_table_number(*record.cost_breakdown.table_number);
  if (record.cost_breakdown.bcp_mismatch) breakdown->set_bcp_mismatch(*record.cost_breakdown.bcp_mismatch);

  for (const auto& reason : record.reasons) {
    out.add_reasons(reason);
  }
  for (const auto& [table_number, cost] : record.alternatives_considered) {
    (*out.mutable_alternatives_considered())[table_number] = cost;
  }

  out.set_is_round1(record.is_round1);
  out.set_is_bye(record.is_bye);

  for (const auto& conflict : record.conflicts) {
    auto* c = out.add_conflicts();
    c->set_type(audit::ToProto(conflict.type));
    c->set_message(conflict.message);
    c->set_competitor_id(conflict.competitor_id);
    if (conflict.table_number) c->set_table_number(*conflict.table_number);
    if (conflict.terrain) c->set_terrain(*conflict.terrain);
  }

  return out;
}

model::AuditRecord AuditCodec::FromProto(const v1::AuditRecord& proto) {
  model::AuditRecord out;
  out.timestamp  = util::FromProto(proto.timestamp());
  out.total_cost = proto.total_cost();

  const auto& breakdown            = proto.cost_breakdown();
  out.cost_breakdown.table_reuse   = breakdown.table_reuse();
  out.cost_breakdown.terrain_reuse = breakdown.terrain_reuse();
  if (breakdown.has_table_number()) out.cost_breakdown.table_number = breakdown.table_number();
  if (breakdown.has_bcp_mismatch()) out.cost_breakdown.bcp_mismatch = breakdown.bcp_mismatch();

  out.reasons.assign(proto.reasons().begin(), proto.reasons().end());
  for (const auto& [table_number, cost] : proto.alternatives_considered()) {
    out.alternatives_considered[table_number] = cost;
  }

  out.is_round1 = proto.is_round1();
  out.is_bye    = proto.is_bye();

  for (const auto& c : proto.conflicts()) {
    model::Conflict conflict;
    conflict.type          = audit::FromProto(c.type());
    conflict.message       = c.message();
    conflict.competitor_id = c.competitor_id();
    if (c.has_table_number()) conflict.table_number = c.table_number();
    if (c.has_terrain()) conflict.terrain = c.terrain();
    out.conflicts.push_back(std::move(conflict));
  }

  return out;
}

std::string AuditCodec::ToJson(const model::AuditRecord& record) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToProto(record), &json, options);
  if (!status.ok()) {
    throw util::InvalidState("failed to serialize audit record: " + std::string(status.message()));
  }
  return json;
}

model::AuditRecord AuditCodec::FromJson(const std::string& json) {
  v1::AuditRecord proto;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &proto, options);
  if (!status.ok()) {
    throw util::InvalidState("invalid audit record: " + std::string(status.message()));
  }
  return FromProto(proto);
}

} // namespace tables::audit
