#pragma once

#include "aquarium/sim/Adjacency.hpp"
#include "aquarium/sim/Battle.hpp"
#include "aquarium/sim/Catalog.hpp"
#include "aquarium/sim/Consumables.hpp"
#include "aquarium/sim/Random.hpp"
#include "aquarium/sim/Types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aquarium::session {

enum class GamePhase : std::uint8_t {
  Shop     = 0,
  Battle   = 1,
  Results  = 2,
  Complete = 3
};

// Battles in a full match.
inline constexpr int kDefaultMaxRounds{15};

[[nodiscard]] constexpr std::string_view to_string(GamePhase p) noexcept {
  switch (p) {
    case GamePhase::Shop:     return "Shop";
    case GamePhase::Battle:   return "Battle";
    case GamePhase::Results:  return "Results";
    case GamePhase::Complete: return "Complete";
    default:                  return "Unknown";
  }
}

struct MatchRecord {
  int wins{0};
  int losses{0};
  int draws{0};
  int win_streak{0};
  int loss_streak{0};

  void record(bool won, bool lost) noexcept;
};

// Stat preview row for one placed player piece.
struct PieceStatsView {
  sim::PieceId id{sim::kEmptyCell};
  std::string name;
  sim::BuffedStats buffed{};
  sim::AdjacencyBonus adjacency{};
};

// One player's run against the AI opponent. Owns both tanks and the live battle.
// Shop -> Battle -> Results -> Shop, until the last round's result moves it to Complete.
// Not thread-safe; one writer at a time.
class GameSession {
public:
  GameSession(std::string id, const sim::PieceCatalog& catalog, int base_water_quality = 5,
              int max_rounds = kDefaultMaxRounds);

  [[nodiscard]] const std::string& id() const noexcept { return id_; }
  [[nodiscard]] GamePhase phase() const noexcept { return phase_; }
  [[nodiscard]] int round() const noexcept { return round_; }
  [[nodiscard]] int max_rounds() const noexcept { return max_rounds_; }
  [[nodiscard]] bool is_final_round() const noexcept { return round_ >= max_rounds_; }
  [[nodiscard]] bool is_complete() const noexcept { return phase_ == GamePhase::Complete; }
  [[nodiscard]] int opponent_gold() const noexcept { return opponent_gold_; }

  [[nodiscard]] const sim::Tank& player_tank() const noexcept { return player_; }
  [[nodiscard]] const sim::Tank& opponent_tank() const noexcept { return opponent_; }
  [[nodiscard]] const MatchRecord& player_record() const noexcept { return player_record_; }
  [[nodiscard]] const MatchRecord& opponent_record() const noexcept { return opponent_record_; }

  // Live battle, null outside the Battle/Results phases.
  [[nodiscard]] const sim::BattleState* battle() const noexcept { return battle_ ? &*battle_ : nullptr; }

  // ---- Shop phase (PhaseViolation otherwise) ----
  sim::PieceId acquire(std::string_view piece_name);
  void place(sim::PieceId id, sim::Position pos);
  void move(sim::PieceId id, sim::Position pos);
  void remove(sim::PieceId id);
  sim::Piece discard(sim::PieceId id);
  std::vector<sim::ConsumedItem> confirm_placement();

  // Builds the opponent's tank, feeds the player's consumables and enters Battle.
  const sim::BattleState& start_battle(int opponent_gold, sim::RandomSource& rng);

  // ---- Battle phase ----
  std::vector<sim::BattleEvent> advance_battle(sim::RandomSource& rng);

  // ---- Results phase ----
  // Records the result; after the final round the session is Complete instead of back in Shop.
  sim::BattleOutcome finalize_battle();

  // Same numbers the combat snapshot would use.
  [[nodiscard]] std::vector<PieceStatsView> computed_stats() const;

private:
  void require_phase(GamePhase expected, std::string_view action) const;

  std::string id_;
  const sim::PieceCatalog* catalog_{nullptr};
  GamePhase phase_{GamePhase::Shop};
  int round_{1};
  int max_rounds_{kDefaultMaxRounds};
  int opponent_gold_{0};

  sim::Tank player_;
  sim::Tank opponent_;
  MatchRecord player_record_{};
  MatchRecord opponent_record_{};

  std::optional<sim::BattleState> battle_{};
};

} // namespace aquarium::session
