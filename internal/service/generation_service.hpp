#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/allocation_decision.hpp"
#include "internal/model/pairing.hpp"
#include "service_context.hpp"

namespace tables::service {

/*
  Runs the allocation engine against persisted tournament state.

  Generate loads tables and history, allocates, and replaces the round's
  rows in one transaction. Regenerating a round discards its previous rows
  and their audit trail.
*/
class GenerationService {
public:
  explicit GenerationService(ServiceContext ctx);

  // Tables are numbered 1..N in the order given; a set name attaches that
  // terrain type, created on first use.
  int64_t CreateTournament(const std::string& name, const std::vector<std::optional<std::string>>& table_terrains);

  model::RoundAllocation Generate(int64_t tournament_id, int round_number, const std::vector<model::Pairing>& pairings);

  model::RoundAllocation LoadRound(int64_t tournament_id, int round_number);

private:
  ServiceContext ctx_;
};

}
