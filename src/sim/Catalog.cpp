#include "aquarium/sim/Catalog.hpp"

#include "aquarium/sim/Errors.hpp"

#include <algorithm>
#include <fstream>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace aquarium::sim {

namespace {

using json = nlohmann::json;

[[nodiscard]] CatalogEntry entry(std::string name, PieceCategory category, std::vector<Position> shape, int attack,
                                 int health, int speed, std::set<std::string> tags, int cost,
                                 std::vector<std::string> abilities = {}, BonusDelta bonus = {}) {
  CatalogEntry e{};
  e.name = std::move(name);
  e.category = category;
  e.shape = std::move(shape);
  e.stats = Stats{attack, health, speed, health};
  e.tags = std::move(tags);
  e.cost = cost;
  e.abilities = std::move(abilities);
  e.bonus = bonus;
  return e;
}

[[nodiscard]] std::vector<CatalogEntry> builtin_entries() {
  using C = PieceCategory;
  const std::vector<Position> single{{0, 0}};
  const std::vector<Position> wide{{0, 0}, {1, 0}};
  const std::vector<Position> tall{{0, 0}, {0, 1}};
  const std::vector<Position> square{{0, 0}, {1, 0}, {0, 1}, {1, 1}};

  return {
      // Fish
      entry("Neon Tetra", C::Fish, single, 2, 3, 3, {"fish", "schooling", "small"}, 2),
      entry("Cardinal Tetra", C::Fish, single, 2, 4, 3, {"fish", "schooling", "small"}, 3),
      entry("Zebra Danio", C::Fish, single, 2, 4, 4, {"fish", "schooling", "small"}, 2),
      entry("Guppy", C::Fish, single, 1, 4, 2, {"fish", "small"}, 1),
      entry("Betta", C::Fish, wide, 4, 6, 3, {"fish", "aggressive"}, 3, {"Fin Flare"}),
      entry("Angelfish", C::Fish, tall, 3, 8, 2, {"fish"}, 4),
      entry("Bristlenose Pleco", C::Fish, wide, 2, 12, 1, {"fish", "bottom"}, 4, {"Armored"}),
      entry("Oscar", C::Fish, square, 7, 14, 2, {"fish", "aggressive", "large"}, 6, {"Crush"}),
      // Plants
      entry("Java Fern", C::Plant, single, 0, 3, 0, {"plant"}, 2, {}, BonusDelta{1, 1, 0}),
      entry("Anubias", C::Plant, single, 0, 4, 0, {"plant"}, 2, {}, BonusDelta{0, 2, 0}),
      entry("Hornwort", C::Plant, single, 0, 2, 0, {"plant"}, 1, {}, BonusDelta{0, 0, 1}),
      entry("Amazon Sword", C::Plant, tall, 0, 6, 0, {"plant", "large"}, 4, {}, BonusDelta{1, 2, 0}),
      // Equipment
      entry("Sponge Filter", C::Equipment, single, 0, 5, 0, {"equipment", "filter"}, 3),
      entry("Canister Filter", C::Equipment, wide, 0, 8, 0, {"equipment", "filter"}, 5, {"Deep Clean"}),
      entry("Heater", C::Equipment, single, 0, 4, 0, {"equipment"}, 2),
      // Consumables
      entry("Bloodworms", C::Consumable, single, 0, 1, 0, {"food"}, 1, {}, BonusDelta{1, 0, 0}),
      entry("Spirulina Flakes", C::Consumable, single, 0, 1, 0, {"food"}, 1, {}, BonusDelta{0, 2, 0}),
      entry("Brine Shrimp", C::Consumable, single, 0, 1, 0, {"food"}, 2, {}, BonusDelta{1, 0, 1}),
  };
}

[[nodiscard]] int require_int(const json& j, const char* key, const std::string& context) {
  if (!j.contains(key) || !j.at(key).is_number_integer()) {
    throw CatalogError(context + ": missing integer field '" + key + "'");
  }
  return j.at(key).get<int>();
}

} // namespace

PieceCatalog::PieceCatalog(std::vector<CatalogEntry> entries) : entries_(std::move(entries)) {}

const CatalogEntry* PieceCatalog::find(std::string_view name) const noexcept {
  const auto it = std::find_if(entries_.begin(), entries_.end(), [&](const CatalogEntry& e) { return e.name == name; });
  return it == entries_.end() ? nullptr : &*it;
}

const CatalogEntry& PieceCatalog::at(std::string_view name) const {
  const CatalogEntry* e = find(name);
  if (!e) throw CatalogError("unknown piece '" + std::string(name) + "'");
  return *e;
}

void to_json(nlohmann::json& j, const CatalogEntry& e) {
  json shape = json::array();
  for (const Position& p : e.shape) shape.push_back({p.x, p.y});

  j = json{
      {"name", e.name},
      {"category", std::string(to_string(e.category))},
      {"shape", shape},
      {"stats",
       {{"attack", e.stats.attack},
        {"health", e.stats.health},
        {"speed", e.stats.speed},
        {"maxHealth", e.stats.max_health}}},
      {"tags", e.tags},
      {"cost", e.cost},
      {"abilities", e.abilities},
      {"attackBonus", e.bonus.attack},
      {"healthBonus", e.bonus.health},
      {"speedBonus", e.bonus.speed},
  };
}

CatalogEntry catalog_entry_from_json(const nlohmann::json& j) {
  if (!j.is_object()) throw CatalogError("catalog entry is not an object");
  if (!j.contains("name") || !j.at("name").is_string()) throw CatalogError("catalog entry without a name");

  CatalogEntry e{};
  e.name = j.at("name").get<std::string>();

  const auto category = category_from_string(j.value("category", std::string{}));
  if (!category) throw CatalogError(e.name + ": unknown category");
  e.category = *category;

  e.shape.clear();
  if (j.contains("shape")) {
    for (const json& cell : j.at("shape")) {
      if (!cell.is_array() || cell.size() != 2) throw CatalogError(e.name + ": shape cells must be [x, y]");
      const Position offset{cell.at(0).get<int>(), cell.at(1).get<int>()};
      if (offset.x <= -kTankWidth || offset.x >= kTankWidth || offset.y <= -kTankHeight || offset.y >= kTankHeight) {
        throw CatalogError(e.name + ": shape offset (" + std::to_string(offset.x) + "," + std::to_string(offset.y) +
                           ") does not fit in a tank");
      }
      e.shape.push_back(offset);
    }
  }
  // Anchor is always part of the shape.
  if (std::find(e.shape.begin(), e.shape.end(), Position{0, 0}) == e.shape.end()) {
    e.shape.insert(e.shape.begin(), Position{0, 0});
  }

  if (!j.contains("stats") || !j.at("stats").is_object()) throw CatalogError(e.name + ": missing stats");
  const json& st = j.at("stats");
  e.stats.attack = require_int(st, "attack", e.name);
  e.stats.health = require_int(st, "health", e.name);
  e.stats.speed = require_int(st, "speed", e.name);
  e.stats.max_health = st.value("maxHealth", e.stats.health);
  if (e.stats.health <= 0 || e.stats.max_health <= 0) throw CatalogError(e.name + ": health must be positive");

  e.tags = j.value("tags", std::set<std::string>{});
  e.cost = require_int(j, "cost", e.name);
  if (e.cost < 0) throw CatalogError(e.name + ": negative cost");
  e.abilities = j.value("abilities", std::vector<std::string>{});
  e.bonus.attack = j.value("attackBonus", 0);
  e.bonus.health = j.value("healthBonus", 0);
  e.bonus.speed = j.value("speedBonus", 0);
  return e;
}

PieceCatalog parse_catalog(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("pieces") || !j.at("pieces").is_array()) {
    throw CatalogError("catalog must be an object with a 'pieces' array");
  }

  std::vector<CatalogEntry> entries;
  try {
    for (const json& item : j.at("pieces")) {
      CatalogEntry e = catalog_entry_from_json(item);
      const bool duplicate = std::any_of(entries.begin(), entries.end(),
                                         [&](const CatalogEntry& other) { return other.name == e.name; });
      if (duplicate) throw CatalogError("duplicate catalog entry '" + e.name + "'");
      entries.push_back(std::move(e));
    }
  } catch (const json::exception& ex) {
    // Wrong value types inside an otherwise well-formed entry.
    throw CatalogError(std::string("malformed catalog entry: ") + ex.what());
  }

  if (entries.empty()) throw CatalogError("catalog contains no pieces");
  return PieceCatalog(std::move(entries));
}

PieceCatalog load_catalog(const std::filesystem::path& path) {
  std::ifstream f(path);
  if (!f.is_open()) throw CatalogError("Could not open " + path.string());

  json j;
  try {
    f >> j;
  } catch (const json::exception& ex) {
    throw CatalogError("Could not parse " + path.string() + ": " + ex.what());
  }

  PieceCatalog catalog = parse_catalog(j);

  spdlog::info("Loaded {} catalog pieces from {}", catalog.size(), path.string());
  return catalog;
}

const PieceCatalog& default_catalog() {
  static const PieceCatalog catalog(builtin_entries());
  return catalog;
}

} // namespace aquarium::sim
