#include "aquarium/sim/Consumables.hpp"

#include "aquarium/sim/Adjacency.hpp"
#include "aquarium/sim/Grid.hpp"
#include "aquarium/sim/WaterQuality.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace aquarium::sim {

void apply_permanent_bonus(Piece& fish, const std::string& source, const BonusDelta& delta) {
  if (!fish.permanent) fish.permanent.emplace();

  PermanentBonuses& pb = *fish.permanent;
  pb.attack += delta.attack;
  pb.health += delta.health;
  pb.speed += delta.speed;

  const auto it = std::find_if(pb.sources.begin(), pb.sources.end(),
                               [&](const BonusSource& s) { return s.name == source; });
  if (it != pb.sources.end()) {
    ++it->count;
  } else {
    pb.sources.push_back(BonusSource{source, 1, delta.attack, delta.health, delta.speed});
  }
}

std::vector<ConsumedItem> process_consumables(Tank& tank) {
  std::vector<ConsumedItem> consumed;

  // Resolve against a snapshot so one consumable's removal never changes another's neighbours.
  std::vector<PieceId> ids;
  for (const Piece& p : tank.pieces) {
    if (p.category == PieceCategory::Consumable && p.is_placed()) ids.push_back(p.id);
  }

  for (const PieceId id : ids) {
    const Piece* consumable = tank.find_piece(id);
    if (!consumable) continue;

    std::vector<PieceId> fish_ids;
    for (const Piece& p : tank.pieces) {
      if (p.is_fish() && are_adjacent(*consumable, p)) fish_ids.push_back(p.id);
    }
    if (fish_ids.empty()) continue;

    const std::string name = consumable->name;
    const BonusDelta delta = consumable->bonus;

    for (const PieceId fid : fish_ids) {
      Piece* fish = tank.find_piece(fid);
      if (!fish) continue;
      apply_permanent_bonus(*fish, name, delta);
      spdlog::debug("{} fed {}: +{} ATK, +{} HP, +{} SPD", name, fish->name, delta.attack, delta.health,
                    delta.speed);
    }

    consumed.push_back(ConsumedItem{id, name, std::move(fish_ids)});
  }

  for (const ConsumedItem& c : consumed) {
    const auto it = std::find_if(tank.pieces.begin(), tank.pieces.end(),
                                 [&](const Piece& p) { return p.id == c.consumable; });
    if (it == tank.pieces.end()) continue;
    remove_from_grid(tank, *it);
    tank.pieces.erase(it);
  }

  if (!consumed.empty()) refresh_water_quality(tank);
  return consumed;
}

} // namespace aquarium::sim
