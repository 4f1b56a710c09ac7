#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tables::model {

struct TerrainType {
  int64_t     id = 0;
  std::string name;
};

/*
  Physical table. Numbers are unique within a tournament and stable across
  rounds.
*/
struct Table {
  int                        number = 0;
  std::optional<TerrainType> terrain;
};

// Placeholder table number for a round-1 pairing that found no free table.
inline constexpr int kNoTable = 0;

} // namespace tables::model
