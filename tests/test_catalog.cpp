#include <doctest/doctest.h>

#include "aquarium/sim/Catalog.hpp"
#include "aquarium/sim/Errors.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

using namespace aquarium;
using namespace aquarium::sim;
using nlohmann::json;

namespace fs = std::filesystem;

namespace {

fs::path make_unique_temp_dir()
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / ("aquarium_catalog_tests_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    if (ec)
        return base;

    return dir;
}

json java_fern()
{
    return json::parse(R"({
        "name": "Java Fern",
        "category": "plant",
        "shape": [[0, 0]],
        "stats": { "attack": 0, "health": 3, "speed": 0, "maxHealth": 3 },
        "tags": ["plant"],
        "cost": 2,
        "abilities": [],
        "attackBonus": 1,
        "healthBonus": 1,
        "speedBonus": 0
    })");
}

} // namespace

TEST_CASE("Catalog/DefaultCatalogIsUsable")
{
    const PieceCatalog& c = default_catalog();
    REQUIRE_FALSE(c.empty());

    for (const char* name : {"Neon Tetra", "Cardinal Tetra", "Java Fern", "Anubias", "Sponge Filter"})
        CHECK(c.find(name) != nullptr);

    const CatalogEntry& filter = c.at("Sponge Filter");
    CHECK(filter.category == PieceCategory::Equipment);
    CHECK(filter.tags.count("filter") == 1);

    const CatalogEntry& fern = c.at("Java Fern");
    CHECK(fern.bonus.attack == 1);
    CHECK(fern.bonus.health == 1);

    for (const CatalogEntry& e : c.entries()) {
        CAPTURE(e.name);
        CHECK(e.cost > 0);
        CHECK(std::find(e.shape.begin(), e.shape.end(), Position{0, 0}) != e.shape.end());
    }

    CHECK(c.find("Megalodon") == nullptr);
    CHECK_THROWS_AS((void)c.at("Megalodon"), CatalogError);
}

TEST_CASE("Catalog/ParseEntry")
{
    const CatalogEntry e = catalog_entry_from_json(java_fern());
    CHECK(e.name == "Java Fern");
    CHECK(e.category == PieceCategory::Plant);
    CHECK(e.stats.health == 3);
    CHECK(e.cost == 2);
    CHECK(e.bonus.attack == 1);
    CHECK(e.tags.count("plant") == 1);
}

TEST_CASE("Catalog/EntrySurvivesJsonRoundTrip")
{
    const CatalogEntry& oscar = default_catalog().at("Oscar");
    const json j = oscar;
    const CatalogEntry back = catalog_entry_from_json(j);

    CHECK(back.name == oscar.name);
    CHECK(back.category == oscar.category);
    CHECK(back.shape.size() == oscar.shape.size());
    CHECK(back.stats.attack == oscar.stats.attack);
    CHECK(back.stats.max_health == oscar.stats.max_health);
    CHECK(back.tags == oscar.tags);
    CHECK(back.abilities == oscar.abilities);
}

TEST_CASE("Catalog/MissingFieldsDefaultOrFail")
{
    json minimal = {{"name", "Pebble"}, {"category", "equipment"},
                    {"stats", {{"attack", 0}, {"health", 2}, {"speed", 0}}}, {"cost", 1}};
    const CatalogEntry e = catalog_entry_from_json(minimal);
    CHECK(e.stats.max_health == 2);
    REQUIRE(e.shape.size() == 1);
    CHECK(e.shape[0] == Position(0, 0));
    CHECK(e.bonus.is_zero());

    json no_cost = minimal;
    no_cost.erase("cost");
    CHECK_THROWS_AS((void)catalog_entry_from_json(no_cost), CatalogError);

    json bad_category = minimal;
    bad_category["category"] = "rock";
    CHECK_THROWS_AS((void)catalog_entry_from_json(bad_category), CatalogError);

    json bad_shape = minimal;
    bad_shape["shape"] = json::array({json::array({1})});
    CHECK_THROWS_AS((void)catalog_entry_from_json(bad_shape), CatalogError);
}

TEST_CASE("Catalog/RejectsUnplayableStatsAndShapes")
{
    const json ghost = {{"name", "Ghost"}, {"category", "fish"},
                        {"stats", {{"attack", 3}, {"health", 0}, {"speed", 5}}}, {"cost", 1}};
    CHECK_THROWS_AS((void)catalog_entry_from_json(ghost), CatalogError);
    CHECK_THROWS_AS((void)parse_catalog(json{{"pieces", json::array({java_fern(), ghost})}}), CatalogError);

    json negative_health = java_fern();
    negative_health["stats"]["health"] = -4;
    CHECK_THROWS_AS((void)catalog_entry_from_json(negative_health), CatalogError);

    json zero_max = java_fern();
    zero_max["stats"]["maxHealth"] = 0;
    CHECK_THROWS_AS((void)catalog_entry_from_json(zero_max), CatalogError);

    json negative_cost = java_fern();
    negative_cost["cost"] = -1;
    CHECK_THROWS_AS((void)catalog_entry_from_json(negative_cost), CatalogError);

    json free_item = java_fern();
    free_item["cost"] = 0;
    CHECK(catalog_entry_from_json(free_item).cost == 0);

    json huge_offset = java_fern();
    huge_offset["shape"] = json::array({json::array({0, 0}), json::array({2147483647, 0})});
    CHECK_THROWS_AS((void)catalog_entry_from_json(huge_offset), CatalogError);

    json below_left = java_fern();
    below_left["shape"] = json::array({json::array({0, -6})});
    CHECK_THROWS_AS((void)catalog_entry_from_json(below_left), CatalogError);

    // Widest and tallest offsets that can still fit.
    json edge = java_fern();
    edge["shape"] = json::array({json::array({0, 0}), json::array({7, 0}), json::array({0, -5})});
    CHECK(catalog_entry_from_json(edge).shape.size() == 3);
}

TEST_CASE("Catalog/ParseRejectsBadDocuments")
{
    CHECK_THROWS_AS((void)parse_catalog(json::array()), CatalogError);
    CHECK_THROWS_AS((void)parse_catalog(json{{"pieces", json::array()}}), CatalogError);
    CHECK_THROWS_AS((void)parse_catalog(json{{"pieces", json::array({java_fern(), java_fern()})}}), CatalogError);

    const PieceCatalog c = parse_catalog(json{{"pieces", json::array({java_fern()})}});
    CHECK(c.size() == 1);
}

TEST_CASE("Catalog/LoadFromFile")
{
    const fs::path dir = make_unique_temp_dir();
    const fs::path good = dir / "pieces.json";
    {
        std::ofstream f(good, std::ios::binary | std::ios::trunc);
        REQUIRE(f.good());
        f << json{{"pieces", json::array({java_fern()})}}.dump(2);
    }

    const PieceCatalog c = load_catalog(good);
    REQUIRE(c.size() == 1);
    CHECK(c.entries()[0].name == "Java Fern");

    const fs::path broken = dir / "broken.json";
    {
        std::ofstream f(broken, std::ios::binary | std::ios::trunc);
        f << "{ \"pieces\": [ ";
    }
    CHECK_THROWS_AS((void)load_catalog(broken), CatalogError);
    CHECK_THROWS_AS((void)load_catalog(dir / "missing.json"), CatalogError);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

#ifdef AQUARIUM_DATA_DIR
TEST_CASE("Catalog/ShippedDataMatchesBuiltin")
{
    const PieceCatalog shipped = load_catalog(fs::path(AQUARIUM_DATA_DIR) / "pieces.json");
    const PieceCatalog& builtin = default_catalog();
    REQUIRE(shipped.size() == builtin.size());

    for (const CatalogEntry& e : builtin.entries())
    {
        CAPTURE(e.name);
        const CatalogEntry* s = shipped.find(e.name);
        REQUIRE(s != nullptr);
        CHECK(s->category == e.category);
        CHECK(s->cost == e.cost);
        CHECK(s->stats.attack == e.stats.attack);
        CHECK(s->stats.health == e.stats.health);
        CHECK(s->stats.speed == e.stats.speed);
        CHECK(s->shape.size() == e.shape.size());
        CHECK(s->tags == e.tags);
        CHECK(s->abilities == e.abilities);
        CHECK(s->bonus.attack == e.bonus.attack);
        CHECK(s->bonus.health == e.bonus.health);
        CHECK(s->bonus.speed == e.bonus.speed);
    }
}
#endif
