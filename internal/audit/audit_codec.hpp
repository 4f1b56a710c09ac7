#pragma once

#include <string>

#include "internal/model/audit_record.hpp"
#include "tables/audit/v1/audit.pb.h"

namespace tables::audit {

/*
  AuditRecord <-> stored JSON.

  The JSON is the proto3 JSON mapping of tables.audit.v1.AuditRecord, so
  keys are lowerCamelCase (tableReuse, bcpMismatch, isRound1, ...).
*/
class AuditCodec {
 public:
  static tables::audit::v1::AuditRecord ToProto(const model::AuditRecord& record);
  static model::AuditRecord             FromProto(const tables::audit::v1::AuditRecord& proto);

  static std::string ToJson(const model::AuditRecord& record);

  // Throws util::InvalidState when the stored text is not a valid record.
  static model::AuditRecord FromJson(const std::string& json);
};

} // namespace tables::audit
