#include "aquarium/sim/WaterQuality.hpp"

#include <algorithm>

namespace aquarium::sim {

int water_effect(const Piece& piece) {
  switch (piece.category) {
    case PieceCategory::Fish:      return -1;
    case PieceCategory::Plant:     return 1;
    case PieceCategory::Equipment: return piece.is_filter() ? 1 : 0;
    default:                       return 0;
  }
}

int compute_water_quality(const Tank& tank) {
  int total = 0;
  for (const Piece& p : tank.pieces) {
    if (!p.is_placed()) continue;
    total += water_effect(p);
  }
  return std::clamp(tank.base_water_quality + total, kMinWaterQuality, kMaxWaterQuality);
}

int refresh_water_quality(Tank& tank) {
  tank.water_quality = compute_water_quality(tank);
  return tank.water_quality;
}

} // namespace aquarium::sim
