#pragma once

#include "Types.hpp"

#include <string_view>

namespace aquarium::sim {

inline constexpr int kPoisonThreshold{3};      // quality <= this poisons fish and weakens attacks
inline constexpr int kExcellentThreshold{8};   // quality >= this strengthens attacks
inline constexpr int kPoisonDamage{1};

// Contribution of a single placed piece: fish -1, plant +1, filters +1, else 0.
[[nodiscard]] int water_effect(const Piece& piece);

// clamp(base + sum of effects over placed pieces, 1, 10)
[[nodiscard]] int compute_water_quality(const Tank& tank);

// Recomputes and stores tank.water_quality. Returns the new value.
int refresh_water_quality(Tank& tank);

[[nodiscard]] constexpr bool is_poisoned(int quality) noexcept { return quality <= kPoisonThreshold; }

// Outgoing damage multiplier expressed in percent (70 / 100 / 130).
[[nodiscard]] constexpr int damage_percent(int quality) noexcept {
  if (quality >= kExcellentThreshold) return 130;
  if (quality <= kPoisonThreshold) return 70;
  return 100;
}

[[nodiscard]] constexpr double damage_multiplier(int quality) noexcept {
  return static_cast<double>(damage_percent(quality)) / 100.0;
}

// floor(attack * multiplier) using exact integer arithmetic.
[[nodiscard]] constexpr int damage_after_water(int attack, int quality) noexcept {
  if (attack <= 0) return 0;
  return (attack * damage_percent(quality)) / 100;
}

[[nodiscard]] constexpr std::string_view describe_water_quality(int quality) noexcept {
  if (quality <= kPoisonThreshold) return "Toxic";
  if (quality >= kExcellentThreshold) return "Excellent";
  return "Fair";
}

} // namespace aquarium::sim
