// aquarium_duel: plays a full AI-vs-AI match through a GameSession.
// The "player" tank is bought and placed by the same heuristics the opponent uses,
// but through the session's shop API, so every phase rule is exercised.

#include "app/CommandLineArgs.h"
#include "core/Config.h"
#include "core/Log.h"

#include "aquarium/session/GameSession.hpp"
#include "aquarium/sim/BattleJson.hpp"
#include "aquarium/sim/Catalog.hpp"
#include "aquarium/sim/Errors.hpp"
#include "aquarium/sim/OpponentAI.hpp"
#include "aquarium/sim/Random.hpp"

#include <cstdio>
#include <exception>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

using namespace aquarium;

constexpr int kWinBonusGold = 3;

// Shop turn for the player side. Only buys what fits; never replaces.
int shop_for_player(session::GameSession& game, int gold, const sim::PieceCatalog& catalog, sim::RandomSource& rng)
{
    const session::MatchRecord& rec = game.player_record();
    int budget = sim::spending_budget(gold, game.round(), rec.loss_streak, rec.win_streak);
    int spent = 0;
    int failures = 0;

    while (budget > 0 && failures < sim::kMaxConsecutiveFailures)
    {
        const auto choice = sim::select_piece(catalog, game.round(), budget, game.player_tank().water_quality,
                                              rec.loss_streak, rng);
        if (!choice)
        {
            ++failures;
            continue;
        }

        const auto pos = sim::choose_position(game.player_tank(), sim::make_piece(*choice, sim::kEmptyCell));
        if (!pos)
        {
            ++failures;
            continue;
        }

        const sim::PieceId id = game.acquire(choice->name);
        game.place(id, *pos);
        budget -= choice->cost;
        spent += choice->cost;
        failures = 0;
    }

    for (const sim::ConsumedItem& item : game.confirm_placement())
        spdlog::debug("player fed {} to {} fish", item.name, item.fed_fish.size());

    return gold - spent;
}

int run(const app::CommandLineArgs& args)
{
    core::Config cfg;
    if (args.configPath && !core::LoadConfig(cfg, *args.configPath))
    {
        spdlog::error("Config file {} not found", *args.configPath);
        return 1;
    }

    if (args.seed)        cfg.seed = *args.seed;
    if (args.rounds)      cfg.rounds = *args.rounds;
    if (args.catalogPath) cfg.catalogPath = *args.catalogPath;
    if (args.logLevel)    cfg.logLevel = *args.logLevel;
    if (args.logFile)     cfg.logFile = *args.logFile;
    if (args.jsonOut)     cfg.battleLogJson = *args.jsonOut;

    core::LogOptions logOpts;
    const bool levelOk = core::ParseLogLevel(cfg.logLevel, logOpts.level);
    logOpts.file = cfg.logFile;
    core::InitLogging(logOpts);
    if (!levelOk)
        spdlog::warn("Unknown log level '{}', using info", cfg.logLevel);

    const sim::PieceCatalog loaded = cfg.catalogPath.empty() ? sim::PieceCatalog{} : sim::load_catalog(cfg.catalogPath);
    const sim::PieceCatalog& catalog = cfg.catalogPath.empty() ? sim::default_catalog() : loaded;

    spdlog::info("aquarium_duel: seed={} rounds={} catalog={} ({} pieces)", cfg.seed, cfg.rounds,
                 cfg.catalogPath.empty() ? std::string("built-in") : cfg.catalogPath, catalog.size());

    sim::PcgRandomSource rng(cfg.seed);
    session::GameSession game("duel", catalog, cfg.baseWaterQuality, cfg.rounds);

    int playerGold = cfg.startingGold;
    int opponentGold = cfg.startingGold;
    nlohmann::json battles = nlohmann::json::array();

    while (!game.is_complete())
    {
        playerGold = shop_for_player(game, playerGold, catalog, rng);
        game.start_battle(opponentGold, rng);

        while (game.phase() == session::GamePhase::Battle)
        {
            for (const sim::BattleEvent& e : game.advance_battle(rng))
                spdlog::debug("  {}", e.description);
        }

        const sim::BattleState& state = *game.battle();
        spdlog::info("Round {}: {} turns, player {} / opponent {} hp left", game.round(), state.current_turn,
                     state.player_health, state.opponent_health);
        if (!cfg.battleLogJson.empty())
            battles.push_back(nlohmann::json(state));

        const sim::BattleOutcome outcome = game.finalize_battle();

        playerGold += cfg.goldPerRound + (outcome == sim::BattleOutcome::Player ? kWinBonusGold : 0);
        opponentGold = game.opponent_gold() + cfg.goldPerRound +
                       (outcome == sim::BattleOutcome::Opponent ? kWinBonusGold : 0);
    }

    const session::MatchRecord& rec = game.player_record();
    spdlog::info("Match over: player {}W / {}L / {}D", rec.wins, rec.losses, rec.draws);

    if (!cfg.battleLogJson.empty() && !sim::write_json_file(battles, cfg.battleLogJson))
        return 1;

    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    const aquarium::app::CommandLineArgs args = aquarium::app::ParseCommandLineArgs(argc, argv);

    if (args.showHelp)
    {
        std::fputs(aquarium::app::BuildCommandLineHelpText().c_str(), stdout);
        return 0;
    }

    if (!args.unknown.empty())
    {
        for (const std::string& u : args.unknown)
            std::fprintf(stderr, "Unknown or malformed option: %s\n", u.c_str());
        std::fputs(aquarium::app::BuildCommandLineHelpText().c_str(), stderr);
        return 2;
    }

    int rc = 1;
    try
    {
        rc = run(args);
    }
    catch (const aquarium::SimError& ex)
    {
        spdlog::critical("aquarium_duel failed: {}", ex.what());
    }
    catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
    }

    aquarium::core::ShutdownLogging();
    return rc;
}
