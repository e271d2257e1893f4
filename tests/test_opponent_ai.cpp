// tests/test_opponent_ai.cpp
//
// Opponent shopping: budget tiers, biased selection, placement and replacement.

#include <doctest/doctest.h>

#include "aquarium/sim/Catalog.hpp"
#include "aquarium/sim/Grid.hpp"
#include "aquarium/sim/OpponentAI.hpp"
#include "aquarium/sim/WaterQuality.hpp"
#include "test_support/SimFixtures.h"

#include <algorithm>

using namespace aquarium::sim;
using aquarium::test::consumable;
using aquarium::test::equipment;
using aquarium::test::fish;
using aquarium::test::plant;
using aquarium::test::put;
using aquarium::test::ScriptedRandom;

namespace {

std::size_t count_where(const PieceCatalog& c, int budget, bool (*pred)(const CatalogEntry&))
{
    return static_cast<std::size_t>(std::count_if(c.entries().begin(), c.entries().end(), [&](const CatalogEntry& e) {
        return e.cost <= budget && pred(e);
    }));
}

bool any_entry(const CatalogEntry&) { return true; }
bool water_helper(const CatalogEntry& e)
{
    return e.category == PieceCategory::Plant ||
           (e.category == PieceCategory::Equipment && e.tags.count("filter") > 0);
}
bool is_fish_entry(const CatalogEntry& e) { return e.category == PieceCategory::Fish; }
bool cost_3_plus(const CatalogEntry& e) { return e.cost >= 3; }
bool cost_4_plus(const CatalogEntry& e) { return e.cost >= 4; }

} // namespace

TEST_CASE("OpponentAI/SpendingBudgetTiers")
{
    // Rounds 1-3: keep one gold.
    CHECK(spending_budget(10, 1, 0, 0) == 9);
    CHECK(spending_budget(0, 2, 0, 0) == 0);
    CHECK(spending_budget(10, 3, 5, 0) == 9);

    // Rounds 4-5.
    CHECK(spending_budget(12, 4, 2, 0) == 12);
    CHECK(spending_budget(25, 5, 0, 2) == 15);
    CHECK(spending_budget(19, 5, 0, 2) == 17);
    CHECK(spending_budget(1, 4, 0, 0) == 0);

    // Rounds 6-10.
    CHECK(spending_budget(30, 6, 3, 0) == 30);
    CHECK(spending_budget(30, 8, 0, 3) == 10);
    CHECK(spending_budget(15, 10, 0, 3) == 0);
    CHECK(spending_budget(25, 7, 2, 0) == 15);
    CHECK(spending_budget(5, 9, 0, 0) == 0);

    // Rounds 11+.
    CHECK(spending_budget(20, 11, 2, 0) == 20);
    CHECK(spending_budget(20, 15, 1, 4) == 15);
    CHECK(spending_budget(3, 12, 0, 0) == 0);
}

TEST_CASE("OpponentAI/EarlyRoundFairWaterDrawsUniformly")
{
    const PieceCatalog& catalog = default_catalog();
    ScriptedRandom rng({}, {4});

    const auto pick = select_piece(catalog, 1, 10, 5, 0, rng);
    REQUIRE(pick.has_value());
    CHECK(rng.unit_calls == 0);
    REQUIRE(rng.index_requests.size() == 1);
    CHECK(rng.index_requests[0] == count_where(catalog, 10, any_entry));
    CHECK(pick->name == catalog.entries()[4].name);
}

TEST_CASE("OpponentAI/NothingAffordable")
{
    ScriptedRandom rng;
    CHECK_FALSE(select_piece(default_catalog(), 3, 0, 5, 0, rng).has_value());
    CHECK(rng.unit_calls == 0);
    CHECK(rng.index_requests.empty());
}

TEST_CASE("OpponentAI/BadWaterFavoursPlantsAndFilters")
{
    const PieceCatalog& catalog = default_catalog();

    SUBCASE("toxic water, roll succeeds")
    {
        ScriptedRandom rng({0.5}, {0});
        const auto pick = select_piece(catalog, 1, 10, 2, 0, rng);
        REQUIRE(pick.has_value());
        CHECK(water_helper(*pick));
        CHECK(rng.index_requests[0] == count_where(catalog, 10, water_helper));
    }

    SUBCASE("losing with mediocre water")
    {
        ScriptedRandom rng({0.79}, {0});
        const auto pick = select_piece(catalog, 1, 10, 6, 2, rng);
        REQUIRE(pick.has_value());
        CHECK(water_helper(*pick));
    }

    SUBCASE("roll fails, falls through to the round tier")
    {
        ScriptedRandom rng({0.8}, {0});
        (void)select_piece(catalog, 1, 10, 2, 0, rng);
        CHECK(rng.index_requests[0] == count_where(catalog, 10, any_entry));
    }
}

TEST_CASE("OpponentAI/ExcellentWaterFavoursFish")
{
    const PieceCatalog& catalog = default_catalog();
    ScriptedRandom rng({0.3}, {0});
    const auto pick = select_piece(catalog, 1, 10, 9, 0, rng);
    REQUIRE(pick.has_value());
    CHECK(pick->category == PieceCategory::Fish);
    CHECK(rng.index_requests[0] == count_where(catalog, 10, is_fish_entry));
}

TEST_CASE("OpponentAI/RoundTiersPreferExpensivePieces")
{
    const PieceCatalog& catalog = default_catalog();

    SUBCASE("mid game hits the cost>=3 pool")
    {
        ScriptedRandom rng({0.5}, {0});
        const auto pick = select_piece(catalog, 5, 10, 5, 0, rng);
        REQUIRE(pick.has_value());
        CHECK(pick->cost >= 3);
        CHECK(rng.index_requests[0] == count_where(catalog, 10, cost_3_plus));
    }

    SUBCASE("mid game roll fails")
    {
        ScriptedRandom rng({0.75}, {0});
        (void)select_piece(catalog, 6, 10, 5, 0, rng);
        CHECK(rng.index_requests[0] == count_where(catalog, 10, any_entry));
    }

    SUBCASE("late game hits the cost>=4 pool")
    {
        ScriptedRandom rng({0.84}, {0});
        const auto pick = select_piece(catalog, 9, 10, 5, 0, rng);
        REQUIRE(pick.has_value());
        CHECK(pick->cost >= 4);
        CHECK(rng.index_requests[0] == count_where(catalog, 10, cost_4_plus));
    }

    SUBCASE("empty preferred pool skips the roll")
    {
        ScriptedRandom rng;
        (void)select_piece(catalog, 5, 2, 5, 0, rng);
        CHECK(rng.unit_calls == 0);
        CHECK(rng.index_requests[0] == count_where(catalog, 2, any_entry));
    }
}

TEST_CASE("OpponentAI/PiecePowerWeights")
{
    CHECK(piece_power(fish("Guppy", 1, 4, 2)) == doctest::Approx(1.2 + 4.0 + 0.6));
    CHECK(piece_power(plant("Java Fern", {1, 1, 0}, 3)) == doctest::Approx(3.0 + 5.0));
    CHECK(piece_power(equipment("Heater", {"equipment"}, 4)) == doctest::Approx(4.0 + 3.0));

    CatalogEntry betta = fish("Betta", 4, 6, 3);
    betta.abilities = {"Fin Flare"};
    CHECK(piece_power(betta) == doctest::Approx(4.8 + 6.0 + 0.9 + 2.0));
    CHECK(piece_power(make_piece(betta, 3)) == doctest::Approx(piece_power(betta)));
}

TEST_CASE("OpponentAI/SupportPiecesGoNextToMostFish")
{
    Tank tank("t");
    put(tank, fish("Guppy", 1, 4, 2), {5, 4});
    put(tank, fish("Guppy", 1, 4, 2), {7, 4});

    const Piece fern = make_piece(plant("Java Fern", {1, 1, 0}), kEmptyCell);
    const auto pos = find_support_position(tank, fern);
    REQUIRE(pos.has_value());
    CHECK(*pos == Position(6, 3));
    CHECK(choose_position(tank, fern) == pos);

    const Piece food = make_piece(consumable("Bloodworms", {1, 0, 0}), kEmptyCell);
    CHECK(choose_position(tank, food) == pos);

    const Piece guppy = make_piece(fish("Guppy", 1, 4, 2), kEmptyCell);
    CHECK(choose_position(tank, guppy) == Position(0, 0));
}

TEST_CASE("OpponentAI/SupportPiecesInEmptyTankTakeFirstFreeCell")
{
    Tank tank("t");
    put(tank, plant("Anubias", {0, 2, 0}), {0, 0});
    const Piece filter = make_piece(equipment("Sponge Filter", {"equipment", "filter"}), kEmptyCell);
    CHECK(find_support_position(tank, filter) == Position(1, 0));
}

TEST_CASE("OpponentAI/ReplacementNeedsFivePieces")
{
    Tank tank("t");
    for (int x = 0; x < 4; ++x) put(tank, fish("Guppy", 1, 4, 2), {x, 0});
    CHECK_FALSE(try_replace_weaker(tank, fish("Shark", 10, 10, 3), 5).has_value());
    CHECK(tank.pieces.size() == 4);
}

TEST_CASE("OpponentAI/ReplacementSwapsWeakestAndRestoresWhenNoRoom")
{
    Tank tank("t");
    for (int y = 0; y < kTankHeight; ++y)
        for (int x = 0; x < kTankWidth; ++x)
            put(tank, fish(x == 3 && y == 2 ? "Minnow" : "Guppy", 1, x == 3 && y == 2 ? 2 : 4, 2), {x, y});

    SUBCASE("candidate does not fit the freed cell")
    {
        const auto grid_before = tank.grid;
        const auto big = fish("Oscar", 7, 14, 2, {"fish"}, {{0, 0}, {1, 0}, {0, 1}, {1, 1}});
        CHECK_FALSE(try_replace_weaker(tank, big, 5).has_value());
        CHECK(tank.grid == grid_before);
        CHECK(tank.pieces.size() == static_cast<std::size_t>(kTankWidth * kTankHeight));
        CHECK(validate_tank(tank).empty());
    }

    SUBCASE("candidate takes the weakest slot")
    {
        const auto replaced = try_replace_weaker(tank, fish("Shark", 10, 10, 3), 5);
        REQUIRE(replaced.has_value());
        CHECK(*replaced == "Minnow");
        const Piece* shark = tank.find_piece(tank.cell({3, 2}));
        REQUIRE(shark != nullptr);
        CHECK(shark->name == "Shark");
        CHECK(validate_tank(tank).empty());
    }

    SUBCASE("candidate not strong enough")
    {
        CHECK_FALSE(try_replace_weaker(tank, fish("Tiny", 1, 2, 0), 12).has_value());
    }
}

TEST_CASE("OpponentAI/EquipmentProtectedInSmallTanks")
{
    Tank tank("t");
    const PieceId heater = put(tank, equipment("Heater", {"equipment"}, 4), {0, 0});
    for (int x = 1; x < 5; ++x) put(tank, fish("Brute", 20, 40, 2), {x, 0});

    const auto candidate = fish("Shark", 10, 10, 0);
    CHECK_FALSE(try_replace_weaker(tank, candidate, 5).has_value());
    CHECK(tank.find_piece(heater) != nullptr);

    for (int x = 5; x < 8; ++x) put(tank, fish("Brute", 20, 40, 2), {x, 0});
    REQUIRE(tank.pieces.size() == 8);

    const auto replaced = try_replace_weaker(tank, candidate, 5);
    REQUIRE(replaced.has_value());
    CHECK(*replaced == "Heater");
    CHECK(tank.find_piece(heater) == nullptr);
}

TEST_CASE("OpponentAI/ShopSpendsWithinBudgetAndKeepsTankValid")
{
    const PieceCatalog& catalog = default_catalog();

    for (std::uint64_t seed = 1; seed <= 20; ++seed) {
        CAPTURE(seed);
        PcgRandomSource rng(seed);
        Tank tank("ai");

        int gold = 10;
        for (int round = 1; round <= 12; ++round) {
            const AcquisitionReport report = run_opponent_shop(tank, gold, round, 0, 0, catalog, rng);
            CHECK(report.budget == spending_budget(gold, round, 0, 0));
            CHECK(report.spent <= report.budget);
            CHECK(report.remaining_gold == gold - report.spent);
            CHECK(validate_tank(tank).empty());
            CHECK(tank.water_quality == compute_water_quality(tank));
            gold = report.remaining_gold + 8;
        }
    }
}

TEST_CASE("OpponentAI/ShopReplacesWeakestWhenTankIsFull")
{
    Tank tank("ai");
    for (int y = 0; y < kTankHeight; ++y)
        for (int x = 0; x < kTankWidth; ++x)
            put(tank, fish("Minnow", 1, 2, 1), {x, y});

    const PieceCatalog only_shark({fish("Shark", 8, 20, 3, {"fish"}, {{0, 0}}, 4)});
    PcgRandomSource rng(5);
    const AcquisitionReport report = run_opponent_shop(tank, 9, 12, 0, 0, only_shark, rng);

    CHECK(report.budget == 4);
    CHECK(report.spent == 4);
    CHECK(report.remaining_gold == 5);
    REQUIRE(report.bought.size() == 1);
    CHECK(report.bought[0] == "Shark");
    REQUIRE(report.replaced.size() == 1);
    CHECK(report.replaced[0] == "Minnow");

    CHECK(tank.pieces.size() == static_cast<std::size_t>(kTankWidth * kTankHeight));
    CHECK(std::count_if(tank.pieces.begin(), tank.pieces.end(), [](const Piece& p) { return p.name == "Shark"; }) == 1);
    CHECK(validate_tank(tank).empty());
    CHECK(tank.water_quality == compute_water_quality(tank));
}

TEST_CASE("OpponentAI/SameSeedSameTank")
{
    const PieceCatalog& catalog = default_catalog();
    Tank a("a");
    Tank b("b");
    PcgRandomSource ra(99);
    PcgRandomSource rb(99);

    CHECK(generate_opponent_acquisitions(a, 30, 7, 1, 0, catalog, ra) ==
          generate_opponent_acquisitions(b, 30, 7, 1, 0, catalog, rb));
    CHECK(a.grid == b.grid);
}

TEST_CASE("OpponentAI/GivesUpWhenNothingFits")
{
    Tank tank("t");
    for (int y = 0; y < kTankHeight; ++y)
        for (int x = 0; x < kTankWidth; ++x)
            put(tank, fish("Brute", 20, 40, 2), {x, y});

    const PieceCatalog only_big({fish("Oscar", 7, 14, 2, {"fish"}, {{0, 0}, {1, 0}}, 3)});
    PcgRandomSource rng(1);
    CHECK(generate_opponent_acquisitions(tank, 20, 12, 0, 0, only_big, rng) == 20);
}

TEST_CASE("OpponentAI/EatsItsOwnConsumables")
{
    auto guppy = fish("Guppy", 1, 4, 2);
    guppy.cost = 5;
    const PieceCatalog catalog({guppy, consumable("Bloodworms", {1, 0, 0}, 1)});

    Tank tank("t");
    ScriptedRandom rng({}, {0, 0});
    const AcquisitionReport report = run_opponent_shop(tank, 7, 1, 0, 0, catalog, rng);

    CHECK(report.budget == 6);
    CHECK(report.spent == 6);
    CHECK(report.remaining_gold == 1);
    REQUIRE(report.bought.size() == 2);
    REQUIRE(report.consumed.size() == 1);

    REQUIRE(tank.pieces.size() == 1);
    REQUIRE(tank.pieces[0].permanent.has_value());
    CHECK(tank.pieces[0].permanent->attack == 1);
}

TEST_CASE("OpponentAI/ZeroBudgetBuysNothing")
{
    Tank tank("t");
    PcgRandomSource rng(3);
    CHECK(generate_opponent_acquisitions(tank, 1, 1, 0, 0, default_catalog(), rng) == 1);
    CHECK(tank.pieces.empty());
}
