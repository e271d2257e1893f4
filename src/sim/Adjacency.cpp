#include "aquarium/sim/Adjacency.hpp"

#include "aquarium/sim/Grid.hpp"

#include <algorithm>
#include <cstdlib>
#include <utility>

namespace aquarium::sim {

namespace {

[[nodiscard]] bool cells_touch(const std::vector<Position>& a, const std::vector<Position>& b) {
  for (const Position& ca : a) {
    for (const Position& cb : b) {
      const int dx = std::abs(ca.x - cb.x);
      const int dy = std::abs(ca.y - cb.y);
      if (dx <= 1 && dy <= 1 && !(dx == 0 && dy == 0)) return true;
    }
  }
  return false;
}

[[nodiscard]] bool touches_filter(const Piece& plant, std::span<const Piece> pieces) {
  for (const Piece& p : pieces) {
    if (p.id == plant.id || !p.is_filter()) continue;
    if (are_adjacent(plant, p)) return true;
  }
  return false;
}

void add(AdjacencyBonus& out, BonusContribution c) {
  out.attack_bonus += c.attack;
  out.health_bonus += c.health;
  out.speed_bonus += c.speed;
  out.sources.push_back(std::move(c));
}

} // namespace

bool are_adjacent(const Piece& a, const Piece& b) {
  if (!a.position || !b.position || a.id == b.id) return false;
  return cells_touch(occupied_cells(a), occupied_cells(b));
}

std::vector<const Piece*> adjacent_pieces(const Piece& target, std::span<const Piece> pieces) {
  std::vector<const Piece*> out;
  if (!target.position) return out;

  const std::vector<Position> target_cells = occupied_cells(target);
  for (const Piece& p : pieces) {
    if (!p.position || p.id == target.id) continue;
    if (cells_touch(target_cells, occupied_cells(p))) out.push_back(&p);
  }
  return out;
}

int schooling_attack_per_neighbor(std::string_view name) noexcept {
  if (name == "Neon Tetra") return 1;
  if (name == "Cardinal Tetra") return 2;
  return 0;
}

int filter_boost(const BonusDelta& delta) noexcept {
  const int peak = std::max({delta.attack, delta.health, delta.speed});
  if (peak <= 0) return 0;
  return (peak * 2 + 9) / 10;
}

AdjacencyBonus compute_adjacency_bonus(const Piece& target, std::span<const Piece> pieces) {
  AdjacencyBonus out{};
  if (!target.position) return out;

  const std::vector<const Piece*> neighbours = adjacent_pieces(target, pieces);

  if (target.is_fish()) {
    for (const Piece* n : neighbours) {
      if (n->category != PieceCategory::Plant && n->category != PieceCategory::Consumable) continue;
      if (n->bonus.is_zero()) continue;

      add(out, BonusContribution{n->name,
                                 n->category == PieceCategory::Plant ? BonusKind::Plant : BonusKind::Consumable,
                                 n->bonus.attack, n->bonus.health, n->bonus.speed});

      if (n->category == PieceCategory::Plant && touches_filter(*n, pieces)) {
        const int boost = filter_boost(n->bonus);
        if (boost > 0) {
          add(out, BonusContribution{n->name, BonusKind::Filter,
                                     n->bonus.attack > 0 ? boost : 0,
                                     n->bonus.health > 0 ? boost : 0,
                                     n->bonus.speed > 0 ? boost : 0});
        }
      }
    }
  }

  if (target.has_tag("schooling")) {
    const int school = static_cast<int>(std::count_if(
        neighbours.begin(), neighbours.end(), [](const Piece* n) { return n->has_tag("schooling"); }));

    const int per_neighbor = schooling_attack_per_neighbor(target.name);
    if (per_neighbor > 0 && school > 0) {
      add(out, BonusContribution{"Schooling", BonusKind::Schooling, per_neighbor * school, 0, 0});
    }

    if (school >= kFrenzyThreshold) {
      add(out, BonusContribution{"School Frenzy", BonusKind::Frenzy, 0, 0, target.stats.speed});
    }
  }

  return out;
}

BuffedStats compute_buffed_stats(const Piece& piece, std::span<const Piece> pieces) {
  BuffedStats s{piece.stats.attack, piece.stats.health, piece.stats.speed};

  if (piece.position) {
    const AdjacencyBonus b = compute_adjacency_bonus(piece, pieces);
    s.attack += b.attack_bonus;
    s.health += b.health_bonus;
    s.speed += b.speed_bonus;
  }

  if (piece.permanent) {
    s.attack += piece.permanent->attack;
    s.health += piece.permanent->health;
    s.speed += piece.permanent->speed;
  }

  return s;
}

int count_adjacent_fish(const Tank& tank, const Piece& piece, Position anchor) {
  Piece moved = piece;
  moved.position = anchor;

  int count = 0;
  for (const Piece& p : tank.pieces) {
    if (!p.is_fish() || p.id == moved.id) continue;
    if (are_adjacent(moved, p)) ++count;
  }
  return count;
}

} // namespace aquarium::sim
