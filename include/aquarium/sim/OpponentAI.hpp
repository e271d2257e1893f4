#pragma once

#include "Catalog.hpp"
#include "Consumables.hpp"
#include "Random.hpp"
#include "Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace aquarium::sim {

inline constexpr int kMaxConsecutiveFailures{25};
inline constexpr std::size_t kReplacementMinPieces{5};
inline constexpr std::size_t kEquipmentProtectionLimit{8};

// Picks the next piece the opponent wants to buy, or nullopt when nothing is affordable.
// Water trouble favours plants/filters, excellent water favours fish, otherwise the round
// tier decides how strongly expensive pieces are preferred.
[[nodiscard]] std::optional<CatalogEntry> select_piece(const PieceCatalog& catalog, int round, int budget,
                                                       int water_quality, int loss_streak, RandomSource& rng);

// How much of `gold` the opponent may spend this round.
[[nodiscard]] int spending_budget(int gold, int round, int loss_streak, int win_streak) noexcept;

[[nodiscard]] double piece_power(const Piece& piece) noexcept;
[[nodiscard]] double piece_power(const CatalogEntry& entry) noexcept;

// Free anchor touching the most placed fish (row-major, first found wins).
// Falls back to the first free cell when no fish can be reached.
[[nodiscard]] std::optional<Position> find_support_position(const Tank& tank, const Piece& piece);

// Anchor the AI would use for a freshly bought piece of this category.
[[nodiscard]] std::optional<Position> choose_position(const Tank& tank, const Piece& piece);

// Swaps the weakest replaceable piece for `candidate` when the candidate is clearly stronger.
// Returns the removed piece's name on success. On failure the tank is unchanged.
std::optional<std::string> try_replace_weaker(Tank& tank, const CatalogEntry& candidate, int round);

struct AcquisitionReport {
  int budget{0};
  int spent{0};
  int remaining_gold{0};
  std::vector<std::string> bought{};
  std::vector<std::string> replaced{};
  std::vector<ConsumedItem> consumed{};
};

// Full shop turn for the opponent: select, place or replace, then eat its own consumables.
AcquisitionReport run_opponent_shop(Tank& tank, int gold, int round, int loss_streak, int win_streak,
                                    const PieceCatalog& catalog, RandomSource& rng);

// Same as run_opponent_shop, returning only the gold left over.
int generate_opponent_acquisitions(Tank& tank, int gold, int round, int loss_streak, int win_streak,
                                   const PieceCatalog& catalog, RandomSource& rng);

} // namespace aquarium::sim
