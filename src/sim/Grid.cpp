#include "aquarium/sim/Grid.hpp"

#include "aquarium/sim/Errors.hpp"
#include "aquarium/sim/WaterQuality.hpp"

#include <algorithm>
#include <unordered_map>
#include <utility>

#include <spdlog/spdlog.h>

namespace aquarium::sim {

std::vector<Position> occupied_cells(const Piece& piece, Position anchor) {
  std::vector<Position> cells;
  cells.reserve(piece.shape.size());
  for (const Position& offset : piece.shape) cells.push_back(anchor + offset);
  return cells;
}

std::vector<Position> occupied_cells(const Piece& piece) {
  if (!piece.position) return {};
  return occupied_cells(piece, *piece.position);
}

bool is_valid_position(const Tank& tank, const Piece& piece, Position pos) {
  for (const Position& offset : piece.shape) {
    const Position c = pos + offset;
    if (!in_tank_bounds(c)) return false;

    const PieceId owner = tank.cell(c);
    if (owner != kEmptyCell && owner != piece.id) return false;
  }
  return true;
}

bool is_free_position(const Tank& tank, const Piece& piece, Position pos) {
  for (const Position& offset : piece.shape) {
    const Position c = pos + offset;
    if (!in_tank_bounds(c)) return false;
    if (tank.cell(c) != kEmptyCell) return false;
  }
  return true;
}

void place_on_grid(Tank& tank, const Piece& piece) {
  for (const Position& c : occupied_cells(piece)) {
    if (in_tank_bounds(c)) tank.set_cell(c, piece.id);
  }
}

void remove_from_grid(Tank& tank, const Piece& piece) {
  for (const Position& c : occupied_cells(piece)) {
    // Only clear cells we actually own.
    if (in_tank_bounds(c) && tank.cell(c) == piece.id) tank.set_cell(c, kEmptyCell);
  }
}

std::optional<Position> find_first_free_position(const Tank& tank, const Piece& piece) {
  for (int y = 0; y < kTankHeight; ++y) {
    for (int x = 0; x < kTankWidth; ++x) {
      if (is_free_position(tank, piece, {x, y})) return Position{x, y};
    }
  }
  return std::nullopt;
}

namespace {

[[nodiscard]] Piece& require_piece(Tank& tank, PieceId id) {
  Piece* p = tank.find_piece(id);
  if (!p) throw PieceNotFound("piece " + std::to_string(id) + " not found in tank '" + tank.id + "'");
  return *p;
}

void relocate(Tank& tank, Piece& piece, Position pos) {
  if (!is_valid_position(tank, piece, pos)) {
    throw InvalidPlacement("cannot place '" + piece.name + "' at (" + std::to_string(pos.x) + "," +
                           std::to_string(pos.y) + ")");
  }

  if (piece.position) remove_from_grid(tank, piece);
  piece.position = pos;
  place_on_grid(tank, piece);
  refresh_water_quality(tank);
}

} // namespace

PieceId acquire_piece(Tank& tank, const CatalogEntry& entry) {
  const PieceId id = tank.next_piece_id++;
  tank.pieces.push_back(make_piece(entry, id));
  spdlog::trace("tank '{}' acquired {} (id {})", tank.id, entry.name, id);
  return id;
}

void place_piece(Tank& tank, PieceId id, Position pos) {
  relocate(tank, require_piece(tank, id), pos);
}

void move_piece(Tank& tank, PieceId id, Position pos) {
  relocate(tank, require_piece(tank, id), pos);
}

void remove_piece(Tank& tank, PieceId id) {
  Piece& piece = require_piece(tank, id);
  remove_from_grid(tank, piece);
  piece.position.reset();
  refresh_water_quality(tank);
}

Piece discard_piece(Tank& tank, PieceId id) {
  const auto it = std::find_if(tank.pieces.begin(), tank.pieces.end(),
                               [id](const Piece& p) { return p.id == id; });
  if (it == tank.pieces.end()) {
    throw PieceNotFound("piece " + std::to_string(id) + " not found in tank '" + tank.id + "'");
  }

  Piece removed = std::move(*it);
  tank.pieces.erase(it);
  remove_from_grid(tank, removed);
  refresh_water_quality(tank);
  return removed;
}

std::vector<std::string> validate_tank(const Tank& tank) {
  std::vector<std::string> problems;

  std::unordered_map<PieceId, const Piece*> by_id;
  for (const Piece& p : tank.pieces) {
    if (!by_id.emplace(p.id, &p).second) problems.push_back("duplicate piece id " + std::to_string(p.id));
  }

  // Every expected cell must carry the owner's id.
  std::vector<std::vector<PieceId>> expected(
      static_cast<std::size_t>(kTankHeight),
      std::vector<PieceId>(static_cast<std::size_t>(kTankWidth), kEmptyCell));
  for (const Piece& p : tank.pieces) {
    for (const Position& c : occupied_cells(p)) {
      if (!in_tank_bounds(c)) {
        problems.push_back("'" + p.name + "' extends out of bounds");
        continue;
      }
      PieceId& slot = expected[static_cast<std::size_t>(c.y)][static_cast<std::size_t>(c.x)];
      if (slot != kEmptyCell) {
        problems.push_back("cell (" + std::to_string(c.x) + "," + std::to_string(c.y) + ") shared by " +
                           std::to_string(slot) + " and " + std::to_string(p.id));
      }
      slot = p.id;
    }
  }

  for (int y = 0; y < kTankHeight; ++y) {
    for (int x = 0; x < kTankWidth; ++x) {
      const PieceId actual = tank.cell({x, y});
      if (actual != kEmptyCell && by_id.find(actual) == by_id.end()) {
        problems.push_back("cell (" + std::to_string(x) + "," + std::to_string(y) + ") references unknown id " +
                           std::to_string(actual));
      } else if (actual != expected[static_cast<std::size_t>(y)][static_cast<std::size_t>(x)]) {
        problems.push_back("cell (" + std::to_string(x) + "," + std::to_string(y) + ") out of sync");
      }
    }
  }

  if (tank.water_quality < kMinWaterQuality || tank.water_quality > kMaxWaterQuality) {
    problems.push_back("water quality " + std::to_string(tank.water_quality) + " outside [1,10]");
  }

  return problems;
}

} // namespace aquarium::sim
