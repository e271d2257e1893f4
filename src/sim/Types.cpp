#include "aquarium/sim/Types.hpp"

#include <algorithm>

namespace aquarium::sim {

std::optional<PieceCategory> category_from_string(std::string_view s) noexcept {
  if (s == "fish")       return PieceCategory::Fish;
  if (s == "plant")      return PieceCategory::Plant;
  if (s == "equipment")  return PieceCategory::Equipment;
  if (s == "consumable") return PieceCategory::Consumable;
  return std::nullopt;
}

Piece make_piece(const CatalogEntry& entry, PieceId id) {
  Piece p{};
  p.id = id;
  p.name = entry.name;
  p.category = entry.category;
  p.shape = entry.shape;
  p.stats = entry.stats;
  p.tags = entry.tags;
  p.cost = entry.cost;
  p.abilities = entry.abilities;
  p.bonus = entry.bonus;
  return p;
}

Piece* Tank::find_piece(PieceId id) {
  const auto it = std::find_if(pieces.begin(), pieces.end(), [id](const Piece& p) { return p.id == id; });
  return it == pieces.end() ? nullptr : &*it;
}

const Piece* Tank::find_piece(PieceId id) const {
  const auto it = std::find_if(pieces.begin(), pieces.end(), [id](const Piece& p) { return p.id == id; });
  return it == pieces.end() ? nullptr : &*it;
}

std::vector<Piece> Tank::placed_pieces() const {
  std::vector<Piece> out;
  out.reserve(pieces.size());
  for (const Piece& p : pieces) {
    if (p.is_placed()) out.push_back(p);
  }
  return out;
}

std::size_t Tank::placed_count() const noexcept {
  return static_cast<std::size_t>(
      std::count_if(pieces.begin(), pieces.end(), [](const Piece& p) { return p.is_placed(); }));
}

} // namespace aquarium::sim
