#include "internal/ingest/yaml_ingest.hpp"

#include <yaml-cpp/yaml.h>

#include "internal/util/errors.hpp"

namespace tables::ingest {
namespace {

YAML::Node LoadFile(const std::string& path) {
  try {
    return YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw util::InvalidArgument("failed to load " + path + ": " + e.what());
  }
}

YAML::Node LoadText(const std::string& text) {
  try {
    return YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw util::InvalidArgument(std::string("failed to parse YAML: ") + e.what());
  }
}

template <typename T>
T Scalar(const YAML::Node& node, const std::string& where) {
  try {
    return node.as<T>();
  } catch (const YAML::Exception& e) {
    throw util::InvalidArgument(where + ": " + e.what());
  }
}

model::CompetitorEntry ParseCompetitor(const YAML::Node& node, const std::string& where) {
  if (!node.IsMap()) {
    throw util::InvalidArgument(where + " must be a map");
  }
  if (!node["id"]) {
    throw util::InvalidArgument(where + ".id is required");
  }

  model::CompetitorEntry entry;
  entry.id = Scalar<std::string>(node["id"], where + ".id");
  if (entry.id.empty()) {
    throw util::InvalidArgument(where + ".id must not be empty");
  }
  entry.name = node["name"] ? Scalar<std::string>(node["name"], where + ".name") : entry.id;
  if (node["round_score"]) entry.round_score = Scalar<int64_t>(node["round_score"], where + ".round_score");
  if (node["total_score"]) entry.total_score = Scalar<int64_t>(node["total_score"], where + ".total_score");
  return entry;
}

TournamentSetup ParseTournament(const YAML::Node& root) {
  if (!root.IsMap() || !root["name"]) {
    throw util::InvalidArgument("tournament file needs a name");
  }

  TournamentSetup setup;
  setup.name = Scalar<std::string>(root["name"], "name");

  const auto tables = root["tables"];
  if (!tables || !tables.IsSequence()) {
    throw util::InvalidArgument("tournament file needs a tables list");
  }

  for (std::size_t i = 0; i < tables.size(); ++i) {
    const auto entry = tables[i];
    const auto where = "tables[" + std::to_string(i) + "]";
    if (entry.IsNull()) {
      setup.table_terrains.emplace_back();
    } else if (entry.IsMap()) {
      if (entry["terrain"] && !entry["terrain"].IsNull()) {
        setup.table_terrains.emplace_back(Scalar<std::string>(entry["terrain"], where + ".terrain"));
      } else {
        setup.table_terrains.emplace_back();
      }
    } else {
      throw util::InvalidArgument(where + " must be a map");
    }
  }

  return setup;
}

std::vector<model::Pairing> ParsePairingList(const YAML::Node& root) {
  const auto list = root.IsMap() ? root["pairings"] : YAML::Node();
  if (!list || !list.IsSequence()) {
    throw util::InvalidArgument("pairings file needs a pairings list");
  }

  std::vector<model::Pairing> out;
  for (std::size_t i = 0; i < list.size(); ++i) {
    const auto entry = list[i];
    const auto where = "pairings[" + std::to_string(i) + "]";
    if (!entry.IsMap() || !entry["competitor_a"]) {
      throw util::InvalidArgument(where + " needs competitor_a");
    }

    model::Pairing pairing;
    pairing.competitor_a = ParseCompetitor(entry["competitor_a"], where + ".competitor_a");
    if (entry["competitor_b"] && !entry["competitor_b"].IsNull()) {
      pairing.competitor_b = ParseCompetitor(entry["competitor_b"], where + ".competitor_b");
    }
    if (entry["suggested_table"] && !entry["suggested_table"].IsNull()) {
      pairing.suggested_table = Scalar<int>(entry["suggested_table"], where + ".suggested_table");
    }
    out.push_back(std::move(pairing));
  }
  return out;
}

} // namespace

TournamentSetup LoadTournamentSetup(const std::string& path) {
  return ParseTournament(LoadFile(path));
}

TournamentSetup ParseTournamentSetup(const std::string& text) {
  return ParseTournament(LoadText(text));
}

std::vector<model::Pairing> LoadPairings(const std::string& path) {
  return ParsePairingList(LoadFile(path));
}

std::vector<model::Pairing> ParsePairings(const std::string& text) {
  return ParsePairingList(LoadText(text));
}

} // namespace tables::ingest
