#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/ingest/yaml_ingest.hpp"
#include "internal/util/errors.hpp"

namespace {

using tables::ingest::LoadPairings;
using tables::ingest::LoadTournamentSetup;
using tables::ingest::ParsePairings;
using tables::ingest::ParseTournamentSetup;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "table_allocator_ingest_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool ThrowsInvalidArgument(Fn&& fn) {
  try {
    fn();
  } catch (const tables::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestTournamentFile() {
  const auto path = WriteYaml("tournament", R"(name: Spring GT
tables:
  - terrain: Volkus
  - {}
  - terrain: Tomb World
  -
)");

  auto setup = LoadTournamentSetup(path.string());
  assert(setup.name == "Spring GT");
  assert(setup.table_terrains.size() == 4);
  assert(setup.table_terrains[0] == std::string("Volkus"));
  assert(!setup.table_terrains[1].has_value());
  assert(setup.table_terrains[2] == std::string("Tomb World"));
  assert(!setup.table_terrains[3].has_value());
}

void TestPairingsFile() {
  const auto path = WriteYaml("pairings", R"(pairings:
  - competitor_a: {id: p1, name: Alice, round_score: 3, total_score: 6}
    competitor_b: {id: p2, name: Bob, round_score: 1, total_score: 4}
    suggested_table: 2
  - competitor_a: {id: p3}
)");

  auto pairings = LoadPairings(path.string());
  assert(pairings.size() == 2);

  assert(pairings[0].competitor_a.id == "p1");
  assert(pairings[0].competitor_a.name == "Alice");
  assert(pairings[0].competitor_a.round_score == 3);
  assert(pairings[0].competitor_a.total_score == 6);
  assert(pairings[0].competitor_b->id == "p2");
  assert(pairings[0].CombinedTotalScore() == 10);
  assert(pairings[0].suggested_table == 2);

  assert(pairings[1].IsBye());
  assert(pairings[1].competitor_a.name == "p3");
  assert(!pairings[1].suggested_table.has_value());
}

void TestMalformedInputRejected() {
  assert(ThrowsInvalidArgument([] { (void)ParseTournamentSetup("tables: []"); }));
  assert(ThrowsInvalidArgument([] { (void)ParseTournamentSetup("name: x\ntables: 3"); }));
  assert(ThrowsInvalidArgument([] { (void)ParsePairings("pairings:\n  - competitor_b: {id: p2}"); }));
  assert(ThrowsInvalidArgument([] { (void)ParsePairings("pairings:\n  - competitor_a: {name: Nobody}"); }));
  assert(ThrowsInvalidArgument([] { (void)ParsePairings("pairings:\n  - competitor_a: {id: p1}\n    suggested_table: abc"); }));
  assert(ThrowsInvalidArgument([] { (void)ParsePairings("[unclosed"); }));
  assert(ThrowsInvalidArgument([] { (void)LoadPairings("/nonexistent/table_allocator/pairings.yaml"); }));
}

} // namespace

int main() {
  TestTournamentFile();
  TestPairingsFile();
  TestMalformedInputRejected();

  std::cout << "table_allocator_unit_yaml_ingest: pass\n";
  return 0;
}
