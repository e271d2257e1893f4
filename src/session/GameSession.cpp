#include "aquarium/session/GameSession.hpp"

#include "aquarium/sim/Errors.hpp"
#include "aquarium/sim/Grid.hpp"
#include "aquarium/sim/OpponentAI.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace aquarium::session {

void MatchRecord::record(bool won, bool lost) noexcept {
  if (won) {
    ++wins;
    ++win_streak;
    loss_streak = 0;
  } else if (lost) {
    ++losses;
    ++loss_streak;
    win_streak = 0;
  } else {
    // Draws leave both streaks alone.
    ++draws;
  }
}

GameSession::GameSession(std::string id, const sim::PieceCatalog& catalog, int base_water_quality, int max_rounds)
    : id_(std::move(id)),
      catalog_(&catalog),
      max_rounds_(std::max(1, max_rounds)),
      player_(id_ + "/player", base_water_quality),
      opponent_(id_ + "/opponent", base_water_quality) {}

void GameSession::require_phase(GamePhase expected, std::string_view action) const {
  if (phase_ != expected) {
    throw PhaseViolation(std::string(action) + " requires the " + std::string(to_string(expected)) +
                         " phase (session '" + id_ + "' is in " + std::string(to_string(phase_)) + ")");
  }
}

sim::PieceId GameSession::acquire(std::string_view piece_name) {
  require_phase(GamePhase::Shop, "acquire");
  return sim::acquire_piece(player_, catalog_->at(piece_name));
}

void GameSession::place(sim::PieceId id, sim::Position pos) {
  require_phase(GamePhase::Shop, "place");
  sim::place_piece(player_, id, pos);
}

void GameSession::move(sim::PieceId id, sim::Position pos) {
  require_phase(GamePhase::Shop, "move");
  sim::move_piece(player_, id, pos);
}

void GameSession::remove(sim::PieceId id) {
  require_phase(GamePhase::Shop, "remove");
  sim::remove_piece(player_, id);
}

sim::Piece GameSession::discard(sim::PieceId id) {
  require_phase(GamePhase::Shop, "discard");
  return sim::discard_piece(player_, id);
}

std::vector<sim::ConsumedItem> GameSession::confirm_placement() {
  require_phase(GamePhase::Shop, "confirm_placement");
  return sim::process_consumables(player_);
}

const sim::BattleState& GameSession::start_battle(int opponent_gold, sim::RandomSource& rng) {
  require_phase(GamePhase::Shop, "start_battle");

  opponent_gold_ = sim::generate_opponent_acquisitions(opponent_, opponent_gold, round_,
                                                       opponent_record_.loss_streak, opponent_record_.win_streak,
                                                       *catalog_, rng);
  sim::process_consumables(player_);

  battle_ = sim::initialize_battle(player_, opponent_, round_);
  phase_ = GamePhase::Battle;

  spdlog::info("[{}] round {} battle: player {} hp (water {}) vs opponent {} hp (water {})", id_, round_,
               battle_->player_health, battle_->player_water_quality, battle_->opponent_health,
               battle_->opponent_water_quality);
  return *battle_;
}

std::vector<sim::BattleEvent> GameSession::advance_battle(sim::RandomSource& rng) {
  require_phase(GamePhase::Battle, "advance_battle");

  std::vector<sim::BattleEvent> events = sim::advance_turn(*battle_, rng);
  if (!battle_->active) phase_ = GamePhase::Results;
  return events;
}

sim::BattleOutcome GameSession::finalize_battle() {
  require_phase(GamePhase::Results, "finalize_battle");

  const sim::BattleOutcome outcome = battle_->winner.value_or(sim::BattleOutcome::Draw);
  player_record_.record(outcome == sim::BattleOutcome::Player, outcome == sim::BattleOutcome::Opponent);
  opponent_record_.record(outcome == sim::BattleOutcome::Opponent, outcome == sim::BattleOutcome::Player);

  spdlog::info("[{}] round {} result: {} (player {}W/{}L/{}D)", id_, round_, sim::to_string(outcome),
               player_record_.wins, player_record_.losses, player_record_.draws);

  battle_.reset();
  if (is_final_round()) {
    phase_ = GamePhase::Complete;
    spdlog::info("[{}] match complete after {} rounds", id_, round_);
  } else {
    ++round_;
    phase_ = GamePhase::Shop;
  }
  return outcome;
}

std::vector<PieceStatsView> GameSession::computed_stats() const {
  std::vector<PieceStatsView> out;
  for (const sim::Piece& p : player_.pieces) {
    if (!p.is_placed()) continue;

    PieceStatsView view{};
    view.id = p.id;
    view.name = p.name;
    view.buffed = sim::compute_buffed_stats(p, player_.pieces);
    view.adjacency = sim::compute_adjacency_bonus(p, player_.pieces);
    out.push_back(std::move(view));
  }
  return out;
}

} // namespace aquarium::session
