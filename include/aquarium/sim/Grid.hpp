#pragma once

#include "Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace aquarium::sim {

// ----------------------------------------------------------------------------
// Grid primitives (no validation, no water-quality bookkeeping)
// ----------------------------------------------------------------------------

// Cells covered by `piece` if its anchor were at `anchor`.
[[nodiscard]] std::vector<Position> occupied_cells(const Piece& piece, Position anchor);

// Cells covered by a placed piece; empty for inventory pieces.
[[nodiscard]] std::vector<Position> occupied_cells(const Piece& piece);

// Every shape cell must be in bounds and either empty or already owned by `piece`.
[[nodiscard]] bool is_valid_position(const Tank& tank, const Piece& piece, Position pos);

// Like is_valid_position, but any occupied cell rejects the position.
[[nodiscard]] bool is_free_position(const Tank& tank, const Piece& piece, Position pos);

void place_on_grid(Tank& tank, const Piece& piece);
void remove_from_grid(Tank& tank, const Piece& piece);

// Row-major scan (y outer, x inner) for the first fully free anchor.
[[nodiscard]] std::optional<Position> find_first_free_position(const Tank& tank, const Piece& piece);

// ----------------------------------------------------------------------------
// Tank operations (validated; throw before mutating)
// ----------------------------------------------------------------------------

// Appends an inventory piece with a fresh id. Returns the new id.
PieceId acquire_piece(Tank& tank, const CatalogEntry& entry);

// Places an inventory piece or moves a placed one. Throws PieceNotFound / InvalidPlacement.
void place_piece(Tank& tank, PieceId id, Position pos);
void move_piece(Tank& tank, PieceId id, Position pos);

// Returns a placed piece to inventory. Throws PieceNotFound.
void remove_piece(Tank& tank, PieceId id);

// Deletes a piece from grid and pieces list. Throws PieceNotFound.
Piece discard_piece(Tank& tank, PieceId id);

// Human-readable descriptions of every broken grid/pieces invariant; empty when consistent.
[[nodiscard]] std::vector<std::string> validate_tank(const Tank& tank);

} // namespace aquarium::sim
