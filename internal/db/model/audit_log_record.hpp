#pragma once

#include <cstdint>
#include <string>

namespace tables::db::model {

/*
  Append-only history of audit records for an allocation.
*/
struct AuditLogRecord {
  int64_t     id            = 0;
  int64_t     allocation_id = 0;
  std::string json;

  // epoch ms
  uint64_t created_at_ms = 0;
};

} // namespace tables::db::model
