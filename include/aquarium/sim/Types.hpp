#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace aquarium::sim {

// ----------------------------------------------------------------------------
// Basic identifiers
// ----------------------------------------------------------------------------
using PieceId = std::uint32_t;
inline constexpr PieceId kEmptyCell{0};

inline constexpr int kTankWidth{8};
inline constexpr int kTankHeight{6};

inline constexpr int kMinWaterQuality{1};
inline constexpr int kMaxWaterQuality{10};

struct Position {
  int x{0};
  int y{0};

  constexpr Position() = default;
  constexpr Position(int x_, int y_) : x(x_), y(y_) {}
};

[[nodiscard]] constexpr bool operator==(Position a, Position b) noexcept { return a.x == b.x && a.y == b.y; }
[[nodiscard]] constexpr bool operator!=(Position a, Position b) noexcept { return !(a == b); }
[[nodiscard]] constexpr Position operator+(Position a, Position b) noexcept { return {a.x + b.x, a.y + b.y}; }

[[nodiscard]] constexpr bool in_tank_bounds(Position p) noexcept {
  return p.x >= 0 && p.x < kTankWidth && p.y >= 0 && p.y < kTankHeight;
}

// ----------------------------------------------------------------------------
// Pieces
// ----------------------------------------------------------------------------
enum class PieceCategory : std::uint8_t {
  Fish       = 0,
  Plant      = 1,
  Equipment  = 2,
  Consumable = 3
};

[[nodiscard]] constexpr std::string_view to_string(PieceCategory c) noexcept {
  switch (c) {
    case PieceCategory::Fish:       return "fish";
    case PieceCategory::Plant:      return "plant";
    case PieceCategory::Equipment:  return "equipment";
    case PieceCategory::Consumable: return "consumable";
    default:                        return "unknown";
  }
}

[[nodiscard]] std::optional<PieceCategory> category_from_string(std::string_view s) noexcept;

struct Stats {
  int attack{0};
  int health{0};
  int speed{0};
  int max_health{0};
};

// Deltas a plant or consumable hands to adjacent fish.
struct BonusDelta {
  int attack{0};
  int health{0};
  int speed{0};

  [[nodiscard]] bool is_zero() const noexcept { return attack == 0 && health == 0 && speed == 0; }
};

struct BonusSource {
  std::string name;
  int count{0};
  int attack_bonus{0};
  int health_bonus{0};
  int speed_bonus{0};
};

// Folded in from consumed consumables; survives across rounds.
struct PermanentBonuses {
  int attack{0};
  int health{0};
  int speed{0};
  std::vector<BonusSource> sources{};
};

// Read-only template a Piece is created from.
struct CatalogEntry {
  std::string name;
  PieceCategory category{PieceCategory::Fish};
  std::vector<Position> shape{Position{0, 0}};
  Stats stats{};
  std::set<std::string> tags{};
  int cost{1};
  std::vector<std::string> abilities{};
  BonusDelta bonus{};
};

struct Piece {
  PieceId id{kEmptyCell};
  std::string name;
  PieceCategory category{PieceCategory::Fish};
  std::vector<Position> shape{Position{0, 0}};
  Stats stats{};
  std::set<std::string> tags{};
  int cost{1};
  std::vector<std::string> abilities{};
  BonusDelta bonus{};

  // Unset while the piece sits in inventory.
  std::optional<Position> position{};
  std::optional<PermanentBonuses> permanent{};

  [[nodiscard]] bool is_placed() const noexcept { return position.has_value(); }
  [[nodiscard]] bool has_tag(std::string_view tag) const {
    return tags.find(std::string(tag)) != tags.end();
  }
  [[nodiscard]] bool is_fish() const noexcept { return category == PieceCategory::Fish; }
  [[nodiscard]] bool is_filter() const {
    return category == PieceCategory::Equipment && (has_tag("filter") || name == "Sponge Filter");
  }
};

[[nodiscard]] Piece make_piece(const CatalogEntry& entry, PieceId id);

// ----------------------------------------------------------------------------
// Tank
// ----------------------------------------------------------------------------
struct Tank {
  std::string id;
  // grid[y][x]
  std::vector<std::vector<PieceId>> grid{
      static_cast<std::size_t>(kTankHeight),
      std::vector<PieceId>(static_cast<std::size_t>(kTankWidth), kEmptyCell)};
  std::vector<Piece> pieces{};
  int water_quality{5};
  int base_water_quality{5};
  PieceId next_piece_id{1};

  Tank() = default;
  explicit Tank(std::string tank_id, int base_quality = 5)
      : id(std::move(tank_id)), water_quality(base_quality), base_water_quality(base_quality) {}

  [[nodiscard]] PieceId cell(Position p) const {
    return grid[static_cast<std::size_t>(p.y)][static_cast<std::size_t>(p.x)];
  }
  void set_cell(Position p, PieceId id) {
    grid[static_cast<std::size_t>(p.y)][static_cast<std::size_t>(p.x)] = id;
  }

  [[nodiscard]] Piece* find_piece(PieceId id);
  [[nodiscard]] const Piece* find_piece(PieceId id) const;

  [[nodiscard]] std::vector<Piece> placed_pieces() const;
  [[nodiscard]] std::size_t placed_count() const noexcept;
};

} // namespace aquarium::sim
