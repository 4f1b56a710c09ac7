#pragma once

#include <cstdint>
#include <string>

namespace tables::db::model {

struct TournamentRecord {
  int64_t     id = 0;
  std::string name;

  // epoch ms
  uint64_t created_at_ms = 0;
};

} // namespace tables::db::model
