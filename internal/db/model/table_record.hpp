#pragma once

#include <cstdint>
#include <optional>

namespace tables::db::model {

struct TableRecord {
  int64_t tournament_id = 0;
  int     table_number  = 0;

  std::optional<int64_t> terrain_type_id;

  // Hidden tables keep their number and terrain but take no new
  // allocations; earlier rounds played on them still count as history.
  bool hidden = false;
};

} // namespace tables::db::model
