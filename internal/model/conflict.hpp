#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tables::model {

enum class ConflictType : std::uint8_t {
  kTableReuse       = 1,
  kTerrainReuse     = 2,
  kNoTableAvailable = 3,
};

constexpr std::string_view ToString(ConflictType type) {
  switch (type) {
    case ConflictType::kTableReuse:
      return "TABLE_REUSE";
    case ConflictType::kTerrainReuse:
      return "TERRAIN_REUSE";
    case ConflictType::kNoTableAvailable:
    default:
      return "NO_TABLE_AVAILABLE";
  }
}

/*
  Soft, reported violation of a seating preference.

  message always names the competitor(s) and the resource involved;
  competitor_id / table_number / terrain carry the same facts in structured
  form for UI highlighting.
*/
struct Conflict {
  ConflictType               type = ConflictType::kTableReuse;
  std::string                message;
  std::string                competitor_id;
  std::optional<int>         table_number;
  std::optional<std::string> terrain;
};

} // namespace tables::model
