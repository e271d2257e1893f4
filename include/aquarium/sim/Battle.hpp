#pragma once

#include "Adjacency.hpp"
#include "BattleEvents.hpp"
#include "Random.hpp"
#include "Types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace aquarium::sim {

inline constexpr int kMaxBattleTurns{20};

enum class BattlePhase : std::uint8_t {
  Init        = 0,
  Active      = 1,
  PlayerWin   = 2,
  OpponentWin = 3,
  Draw        = 4
};

struct BattlePiece {
  Piece piece{};     // snapshot taken at battle start; piece.stats stays the catalog value
  BattleSide side{BattleSide::Player};
  BuffedStats buffed{};
  int max_health{0};
  int current_health{0};
  bool dead{false};

  // Reserved for future status effects; nothing populates them yet.
  std::vector<std::string> status_effects{};
  int next_action_time{0};

  [[nodiscard]] bool alive() const noexcept { return !dead; }
  [[nodiscard]] bool can_attack() const noexcept { return !dead && piece.is_fish(); }
};

struct BattleState {
  bool active{false};
  bool initialized{false};
  int current_round{1};
  int current_turn{1};

  int player_health{0};
  int opponent_health{0};
  int player_max_health{0};
  int opponent_max_health{0};

  int player_water_quality{5};
  int opponent_water_quality{5};

  std::optional<BattleOutcome> winner{};
  std::vector<BattleEvent> events{};

  std::vector<BattlePiece> player_pieces{};
  std::vector<BattlePiece> opponent_pieces{};

  [[nodiscard]] BattlePhase phase() const noexcept;

  [[nodiscard]] std::vector<BattlePiece>& side_pieces(BattleSide s) noexcept {
    return s == BattleSide::Player ? player_pieces : opponent_pieces;
  }
  [[nodiscard]] const std::vector<BattlePiece>& side_pieces(BattleSide s) const noexcept {
    return s == BattleSide::Player ? player_pieces : opponent_pieces;
  }
  [[nodiscard]] int water_quality(BattleSide s) const noexcept {
    return s == BattleSide::Player ? player_water_quality : opponent_water_quality;
  }

  [[nodiscard]] BattlePiece* find(BattleSide s, PieceId id) noexcept;
};

// Snapshot the placed pieces of a tank with buffed stats.
[[nodiscard]] std::vector<BattlePiece> make_battle_pieces(const Tank& tank, BattleSide side);

// Sum of current health over non-dead pieces.
[[nodiscard]] int side_health(std::span<const BattlePiece> pieces) noexcept;

// INIT -> ACTIVE. Tanks are only read.
[[nodiscard]] BattleState initialize_battle(const Tank& player, const Tank& opponent, int round = 1);

// End-of-turn check, in order: player wiped out, opponent wiped out, turn cap.
[[nodiscard]] std::optional<BattleOutcome> resolve_outcome(int player_health, int opponent_health, int turn) noexcept;

// Resolves exactly one turn and returns the events it produced (also appended to
// state.events). Throws BattleNotActive when the battle is not running.
std::vector<BattleEvent> advance_turn(BattleState& state, RandomSource& rng);

// Advances until a terminal phase. Always finishes within kMaxBattleTurns turns.
BattleOutcome run_battle(BattleState& state, RandomSource& rng);

} // namespace aquarium::sim
