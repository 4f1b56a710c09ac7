#pragma once

#include <cstdint>
#include <string>

namespace tables::db::model {

/*
  Terrain layout shared across tournaments (Volkus, Tomb World, ...).
*/
struct TerrainTypeRecord {
  int64_t     id = 0;
  std::string name;
  std::string description;
};

} // namespace tables::db::model
