#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/collision_detector.hpp"
#include "internal/factory.hpp"
#include "internal/ingest/yaml_ingest.hpp"
#include "internal/model/table.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/parse.hpp"

using tables::factory::Application;
using tables::model::AllocationDecision;
using tables::model::RoundAllocation;
using tables::service::AdjustmentResult;
using tables::service::TableCountChange;
using tables::service::TournamentTable;
using tables::util::ParseId;
using tables::util::ParseInt;

static void Usage() {
  std::cout << "Usage:\n"
            << "  tables-admin <config.yaml> setup <tournament.yaml>\n"
            << "  tables-admin <config.yaml> generate <tournament_id> <round> <pairings.yaml>\n"
            << "  tables-admin <config.yaml> show <tournament_id> <round>\n"
            << "  tables-admin <config.yaml> reassign <allocation_id> <table>\n"
            << "  tables-admin <config.yaml> swap <allocation_id> <allocation_id>\n"
            << "  tables-admin <config.yaml> tables <tournament_id>\n"
            << "  tables-admin <config.yaml> set-terrain <tournament_id> <table> [terrain]\n"
            << "  tables-admin <config.yaml> add-table <tournament_id>\n"
            << "  tables-admin <config.yaml> remove-table <tournament_id>\n"
            << "  tables-admin <config.yaml> set-tables <tournament_id> <count>\n"
            << "  tables-admin <config.yaml> ensure-tables <tournament_id> <count>\n"
            << "  tables-admin <config.yaml> delete <tournament_id>\n";
}

static std::string Seat(const AllocationDecision& d) {
  if (d.IsBye()) return "bye";
  if (!d.table_number || *d.table_number == tables::model::kNoTable) return "no table";
  auto out = "table " + std::to_string(*d.table_number);
  if (d.terrain_name) out += " (" + *d.terrain_name + ")";
  return out;
}

static void PrintConflicts(const std::vector<tables::model::Conflict>& conflicts) {
  for (const auto& c : conflicts) {
    std::cout << "      ! " << tables::model::ToString(c.type) << " " << c.message << "\n";
  }
}

static void PrintRound(const RoundAllocation& round) {
  for (const auto& d : round.decisions) {
    std::cout << "  #" << d.id << " " << Seat(d) << "  " << d.competitor_a.name << " (" << d.competitor_a.id << ")";
    if (d.competitor_b) {
      std::cout << " vs " << d.competitor_b->name << " (" << d.competitor_b->id << ")";
    }
    std::cout << "  cost=" << d.audit.total_cost << "\n";
    for (const auto& reason : d.audit.reasons) {
      std::cout << "      - " << reason << "\n";
    }
    PrintConflicts(d.audit.conflicts);
  }
  std::cout << round.summary << "\n";
}

static int PrintAdjustment(const AdjustmentResult& result) {
  if (!result.success) {
    std::cerr << "rejected: " << result.error_message << "\n";
    return 3;
  }
  for (const auto& a : result.allocations) {
    std::cout << "  #" << a.id << " -> table " << a.table_number << "\n";
    PrintConflicts(a.conflicts);
  }
  return 0;
}

static void PrintTable(const TournamentTable& t) {
  std::cout << "  table " << t.number;
  if (t.terrain) std::cout << " (" << *t.terrain << ")";
  if (t.hidden) std::cout << " hidden";
  std::cout << "\n";
}

static void PrintTables(const std::vector<TournamentTable>& tables) {
  for (const auto& t : tables) PrintTable(t);
}

static void PrintCountChange(const TableCountChange& change) {
  std::cout << "added=" << change.added << " removed=" << change.removed << " visible=" << change.visible << "\n";
  PrintTables(change.tables);
}

static int Run(Application& app, const std::string& cmd, int argc, char** argv) {
  if (cmd == "setup" && argc == 4) {
    auto setup = tables::ingest::LoadTournamentSetup(argv[3]);
    auto id    = app.generation_service->CreateTournament(setup.name, setup.table_terrains);
    std::cout << "tournament_id=" << id << " tables=" << setup.table_terrains.size() << "\n";
    return 0;
  }

  if (cmd == "generate" && argc == 6) {
    auto tournament_id = ParseId(argv[3], "tournament id");
    auto round         = ParseInt(argv[4], "round", 1);
    auto pairings      = tables::ingest::LoadPairings(argv[5]);
    PrintRound(app.generation_service->Generate(tournament_id, round, pairings));
    return 0;
  }

  if (cmd == "show" && argc == 5) {
    auto tournament_id = ParseId(argv[3], "tournament id");
    auto round         = ParseInt(argv[4], "round", 1);
    auto allocation    = app.generation_service->LoadRound(tournament_id, round);
    PrintRound(allocation);

    auto collisions = tables::core::TableCollisionDetector::Find(allocation.decisions);
    if (collisions.empty()) {
      std::cout << "collisions: none\n";
    }
    for (const auto& c : collisions) {
      std::cout << "collision: table " << c.table_number << " held by";
      for (auto id : c.allocation_ids) std::cout << " #" << id;
      std::cout << "\n";
    }
    return 0;
  }

  if (cmd == "reassign" && argc == 5) {
    auto allocation_id = ParseId(argv[3], "allocation id");
    auto table         = ParseInt(argv[4], "table", 1);
    return PrintAdjustment(app.adjustment_service->Reassign(allocation_id, table));
  }

  if (cmd == "swap" && argc == 5) {
    auto first  = ParseId(argv[3], "allocation id");
    auto second = ParseId(argv[4], "allocation id");
    return PrintAdjustment(app.adjustment_service->Swap(first, second));
  }

  auto& tournaments = *app.tournament_service;

  if (cmd == "tables" && argc == 4) {
    auto tournament_id = ParseId(argv[3], "tournament id");
    PrintTables(tournaments.ListTables(tournament_id));
    std::cout << "minimum=" << tournaments.MinimumTableCount(tournament_id) << "\n";
    return 0;
  }

  if (cmd == "set-terrain" && (argc == 5 || argc == 6)) {
    tables::service::TableTerrain change;
    change.table_number = ParseInt(argv[4], "table", 1);
    if (argc == 6) change.terrain = argv[5];
    PrintTables(tournaments.UpdateTables(ParseId(argv[3], "tournament id"), {change}));
    return 0;
  }

  if (cmd == "add-table" && argc == 4) {
    PrintTable(tournaments.AddTable(ParseId(argv[3], "tournament id")));
    return 0;
  }

  if (cmd == "remove-table" && argc == 4) {
    PrintTable(tournaments.RemoveTable(ParseId(argv[3], "tournament id")));
    return 0;
  }

  if (cmd == "set-tables" && argc == 5) {
    auto tournament_id = ParseId(argv[3], "tournament id");
    PrintCountChange(tournaments.SetTableCount(tournament_id, ParseInt(argv[4], "table count")));
    return 0;
  }

  if (cmd == "ensure-tables" && argc == 5) {
    auto tournament_id = ParseId(argv[3], "tournament id");
    PrintCountChange(tournaments.EnsureTableCount(tournament_id, ParseInt(argv[4], "table count")));
    return 0;
  }

  if (cmd == "delete" && argc == 4) {
    auto tournament_id = ParseId(argv[3], "tournament id");
    tournaments.DeleteTournament(tournament_id);
    std::cout << "deleted tournament_id=" << tournament_id << "\n";
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  try {
    auto config = tables::config::ConfigLoader::LoadFromYaml(argv[1]);
    tables::observability::InitializeLogging(config);

    auto app  = tables::factory::Build(config);
    int  code = Run(app, argv[2], argc, argv);

    tables::observability::ShutdownLogging();
    return code;
  } catch (const tables::util::Error& e) {
    TABLES_LOG_ERROR("Command failed", {tables::observability::StringField("kind", e.Kind()),
                                        tables::observability::StringField("error", e.what())});
    tables::observability::ShutdownLogging();
    return 2;
  } catch (const std::exception& e) {
    TABLES_LOG_ERROR("Fatal error", {tables::observability::StringField("error", e.what())});
    tables::observability::ShutdownLogging();
    return 2;
  }
}
