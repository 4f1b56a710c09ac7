#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/pairing.hpp"

namespace tables::ingest {

struct TournamentSetup {
  std::string name;

  // Index i describes table i + 1.
  std::vector<std::optional<std::string>> table_terrains;
};

/*
  Readers for the operator-supplied YAML files.

    # tournament
    name: Spring GT
    tables:
      - terrain: Volkus
      - terrain: Tomb World
      - {}                  # no terrain

    # pairings
    pairings:
      - competitor_a: {id: p1, name: Alice, round_score: 3, total_score: 6}
        competitor_b: {id: p2, name: Bob, round_score: 1, total_score: 4}
        suggested_table: 2
      - competitor_a: {id: p3, name: Carol}   # bye

  All readers throw util::InvalidArgument on malformed input.
*/
TournamentSetup LoadTournamentSetup(const std::string& path);
TournamentSetup ParseTournamentSetup(const std::string& text);

std::vector<model::Pairing> LoadPairings(const std::string& path);
std::vector<model::Pairing> ParsePairings(const std::string& text);

} // namespace tables::ingest
