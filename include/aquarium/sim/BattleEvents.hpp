#pragma once

#include "Types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace aquarium::sim {

enum class BattleSide : std::uint8_t {
  Player   = 0,
  Opponent = 1
};

[[nodiscard]] constexpr BattleSide other_side(BattleSide s) noexcept {
  return s == BattleSide::Player ? BattleSide::Opponent : BattleSide::Player;
}

[[nodiscard]] constexpr std::string_view to_string(BattleSide s) noexcept {
  return s == BattleSide::Player ? "player" : "opponent";
}

enum class BattleOutcome : std::uint8_t {
  Player   = 0,
  Opponent = 1,
  Draw     = 2
};

[[nodiscard]] constexpr std::string_view to_string(BattleOutcome o) noexcept {
  switch (o) {
    case BattleOutcome::Player:   return "player";
    case BattleOutcome::Opponent: return "opponent";
    case BattleOutcome::Draw:     return "draw";
    default:                      return "unknown";
  }
}

enum class BattleEventType : std::uint8_t {
  TurnStart  = 0,
  Poison     = 1,
  Attack     = 2,
  Death      = 3,
  DoubleLoss = 4
};

[[nodiscard]] constexpr std::string_view to_string(BattleEventType t) noexcept {
  switch (t) {
    case BattleEventType::TurnStart:  return "TurnStart";
    case BattleEventType::Poison:     return "Poison";
    case BattleEventType::Attack:     return "Attack";
    case BattleEventType::Death:      return "Death";
    case BattleEventType::DoubleLoss: return "DoubleLoss";
    default:                          return "Unknown";
  }
}

struct DamageBreakdown {
  int base_attack{0};    // catalog attack
  int bonus_attack{0};   // adjacency + permanent bonuses
  int water_modifier{0}; // final - buffed attack (negative in toxic water)
  int final_damage{0};
};

struct BattleEvent {
  BattleEventType type{BattleEventType::TurnStart};
  int round{1};
  int turn{1};

  std::optional<BattleSide> source_side{};
  PieceId source{kEmptyCell};
  std::string source_name;

  std::optional<BattleSide> target_side{};
  PieceId target{kEmptyCell};
  std::string target_name;

  // Damage actually removed from the target (poison or attack).
  int value{0};
  DamageBreakdown damage{};

  int target_health_after{0};
  int target_max_health{0};
  bool target_died{false};

  // Side totals right after the event.
  int player_health{0};
  int opponent_health{0};

  std::string description;
};

// Compact human-readable summary (for logs and text front ends).
[[nodiscard]] std::string describe_event(const BattleEvent& e);

} // namespace aquarium::sim
