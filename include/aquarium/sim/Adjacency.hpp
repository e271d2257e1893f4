#pragma once

#include "Types.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace aquarium::sim {

inline constexpr int kFrenzyThreshold{3};

enum class BonusKind : std::uint8_t {
  Plant      = 0,
  Consumable = 1,
  Filter     = 2, // amplification share of a plant's bonus
  Schooling  = 3,
  Frenzy     = 4,
  Permanent  = 5
};

[[nodiscard]] constexpr std::string_view to_string(BonusKind k) noexcept {
  switch (k) {
    case BonusKind::Plant:      return "Plant";
    case BonusKind::Consumable: return "Consumable";
    case BonusKind::Filter:     return "Filter";
    case BonusKind::Schooling:  return "Schooling";
    case BonusKind::Frenzy:     return "Frenzy";
    case BonusKind::Permanent:  return "Permanent";
    default:                    return "Unknown";
  }
}

// One line of the bonus breakdown shown by presentation layers.
struct BonusContribution {
  std::string source;
  BonusKind kind{BonusKind::Plant};
  int attack{0};
  int health{0};
  int speed{0};
};

struct AdjacencyBonus {
  int attack_bonus{0};
  int health_bonus{0};
  int speed_bonus{0};
  std::vector<BonusContribution> sources{};
};

struct BuffedStats {
  int attack{0};
  int health{0};
  int speed{0};
};

// 8-directional, shape-aware. Symmetric and irreflexive; inventory pieces are never adjacent.
[[nodiscard]] bool are_adjacent(const Piece& a, const Piece& b);

// Every placed piece adjacent to `target`, each listed once.
[[nodiscard]] std::vector<const Piece*> adjacent_pieces(const Piece& target, std::span<const Piece> pieces);

// Extra attack per adjacent schooling piece for named schooling fish (0 for everyone else).
[[nodiscard]] int schooling_attack_per_neighbor(std::string_view name) noexcept;

// ceil(max(attack, health, speed) * 0.2); 0 when nothing is positive.
[[nodiscard]] int filter_boost(const BonusDelta& delta) noexcept;

// Bonus from neighbours only (plants, consumables, filters, schooling, frenzy).
// `pieces` may contain the target itself and inventory pieces; both are ignored.
[[nodiscard]] AdjacencyBonus compute_adjacency_bonus(const Piece& target, std::span<const Piece> pieces);

// base + adjacency + permanent bonuses. Inventory pieces get base + permanent only.
[[nodiscard]] BuffedStats compute_buffed_stats(const Piece& piece, std::span<const Piece> pieces);

// Number of distinct placed fish a piece anchored at `anchor` would touch.
[[nodiscard]] int count_adjacent_fish(const Tank& tank, const Piece& piece, Position anchor);

} // namespace aquarium::sim
