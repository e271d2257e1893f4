#pragma once

#include "Types.hpp"

#include <string>
#include <vector>

namespace aquarium::sim {

struct ConsumedItem {
  PieceId consumable{kEmptyCell};
  std::string name;
  std::vector<PieceId> fed_fish{};
};

// Folds every placed consumable that touches at least one fish into the permanent
// bonuses of each touching fish, then deletes the consumable from grid and list.
// Consumables touching no fish stay where they are.
std::vector<ConsumedItem> process_consumables(Tank& tank);

// Adds one application of `delta` from `source` to the fish's permanent bonuses.
void apply_permanent_bonus(Piece& fish, const std::string& source, const BonusDelta& delta);

} // namespace aquarium::sim
